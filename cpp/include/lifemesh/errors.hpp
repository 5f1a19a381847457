#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace lifemesh {

class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

class InvalidDimensions : public Error {
public:
    InvalidDimensions(long long width, long long height);
    explicit InvalidDimensions(const std::string& what) : Error(what) {}
};

// An actor received a message its protocol does not allow. Fatal to the
// simulation that raised it.
class ProtocolViolation : public Error {
public:
    ProtocolViolation(const std::string& actor, const std::string& message);

    const std::string& actor() const noexcept { return actor_; }
    const std::string& message() const noexcept { return message_; }

private:
    std::string actor_;
    std::string message_;
};

class Timeout : public Error {
public:
    explicit Timeout(const std::string& what) : Error(what) {}
};

class StepTimeout : public Timeout {
public:
    StepTimeout(std::uint64_t generation, std::chrono::milliseconds waited);

    std::uint64_t generation() const noexcept { return generation_; }

private:
    std::uint64_t generation_;
};

class StaleBoard : public Error {
public:
    StaleBoard(std::uint64_t board_generation, std::uint64_t current_generation);
};
}
