#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <random>
#include "lifemesh/board.hpp"
#include "lifemesh/ca_stepper.hpp"
#include "lifemesh/errors.hpp"
#include "lifemesh/metrics.hpp"
#include "lifemesh/render.hpp"

namespace py = pybind11;
using namespace lifemesh;

using StateArray = py::array_t<std::uint8_t, py::array::c_style | py::array::forcecast>;

static std::vector<std::uint8_t> to_states(StateArray array, std::size_t& width, std::size_t& height) {
    auto buf = array.request();
    if (buf.ndim != 2) {
        throw std::runtime_error("state must be 2D");
    }
    height = static_cast<std::size_t>(buf.shape[0]);
    width = static_cast<std::size_t>(buf.shape[1]);
    const std::uint8_t* ptr = static_cast<std::uint8_t*>(buf.ptr);
    return std::vector<std::uint8_t>(ptr, ptr + width * height);
}

static py::array_t<std::uint8_t> to_array(const std::vector<std::uint8_t>& states, std::size_t width, std::size_t height) {
    return py::array_t<std::uint8_t>({static_cast<long>(height), static_cast<long>(width)}, states.data());
}

static Board py_generate(int width, int height, std::uint64_t seed, std::size_t workers) {
    std::mt19937 rng(seed == 0 ? std::random_device{}() : static_cast<std::mt19937::result_type>(seed));
    RuntimeConfig config;
    config.workers = workers;
    return Board::generate(width, height, rng, config);
}

static Board py_from_numpy(StateArray state, std::size_t workers) {
    std::size_t width = 0, height = 0;
    auto states = to_states(state, width, height);
    RuntimeConfig config;
    config.workers = workers;
    return Board::from_states(static_cast<int>(width), static_cast<int>(height), states, config);
}

static py::array_t<std::uint8_t> py_reference_step(StateArray state) {
    std::size_t width = 0, height = 0;
    auto input = to_states(state, width, height);
    auto out = reference_step(input, width, height);
    return to_array(out, width, height);
}

PYBIND11_MODULE(lifemesh_native, m) {
    auto error = py::register_exception<Error>(m, "Error");
    py::register_exception<InvalidDimensions>(m, "InvalidDimensions", error.ptr());
    py::register_exception<ProtocolViolation>(m, "ProtocolViolation", error.ptr());
    auto timeout = py::register_exception<Timeout>(m, "Timeout", error.ptr());
    py::register_exception<StepTimeout>(m, "StepTimeout", timeout.ptr());
    py::register_exception<StaleBoard>(m, "StaleBoard", error.ptr());

    py::class_<Board>(m, "Board")
        .def_static("generate", &py_generate, py::arg("width"), py::arg("height"),
                    py::arg("seed") = 0, py::arg("workers") = 0)
        .def_static("from_numpy", &py_from_numpy, py::arg("state"), py::arg("workers") = 0)
        .def("step", py::overload_cast<>(&Board::step, py::const_), py::call_guard<py::gil_scoped_release>(),
             "Advance one generation")
        .def("render", [](const Board& b) { return render(b); }, py::call_guard<py::gil_scoped_release>())
        .def("numpy", [](const Board& b) {
            std::vector<std::uint8_t> states;
            {
                py::gil_scoped_release release;
                states = b.states();
            }
            return to_array(states, b.width(), b.height());
        })
        .def_property_readonly("generation", &Board::generation)
        .def("shape", [](const Board& b) { return py::make_tuple(b.height(), b.width()); });

    m.def("reference_step", &py_reference_step, "Sequential Life step of a 2D 0/1 grid");
    m.def("population", [](StateArray s) {
        std::size_t w = 0, h = 0;
        return population(to_states(s, w, h));
    });
    m.def("entropy", [](StateArray s) {
        std::size_t w = 0, h = 0;
        return entropy(to_states(s, w, h));
    }, "Live/dead entropy in bits");
}
