#include "lifemesh/config.hpp"
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <limits>

namespace lifemesh {

static bool parse_number(const char* text, unsigned long long max, unsigned long long& out) {
    if (text == nullptr || !std::isdigit(static_cast<unsigned char>(text[0]))) return false;
    char* end = nullptr;
    errno = 0;
    const unsigned long long value = std::strtoull(text, &end, 10);
    if (errno == ERANGE || *end != '\0' || value > max) return false;
    out = value;
    return true;
}

bool parse_arguments(int argc, const char* const* argv, SimulationConfig& config) {
    static const unsigned long long limits[5] = {
        static_cast<unsigned long long>(std::numeric_limits<int>::max()),
        static_cast<unsigned long long>(std::numeric_limits<int>::max()),
        std::numeric_limits<std::uint64_t>::max(),
        static_cast<unsigned long long>(std::numeric_limits<std::chrono::milliseconds::rep>::max()),
        std::numeric_limits<std::uint32_t>::max(),
    };
    unsigned long long values[5] = {
        static_cast<unsigned long long>(config.width),
        static_cast<unsigned long long>(config.height),
        config.generations,
        static_cast<unsigned long long>(config.delay.count()),
        config.seed,
    };
    if (argc > 6) return false;
    for (int i = 1; i < argc; ++i) {
        if (!parse_number(argv[i], limits[i - 1], values[i - 1])) return false;
    }
    config.width = static_cast<int>(values[0]);
    config.height = static_cast<int>(values[1]);
    config.generations = values[2];
    config.delay = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(values[3]));
    config.seed = values[4];
    return true;
}

}
