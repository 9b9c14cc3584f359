#pragma once
#include <stdexcept>
#include <string>

namespace bj {

    // Rejected before a session is created; nothing is simulated.
    class InvalidConfiguration : public std::invalid_argument {
    public:
        explicit InvalidConfiguration(const std::string& what)
            : std::invalid_argument("invalid configuration: " + what) {}
    };

    // Thrown by Shoe::draw(); the round engine reshuffles and retries.
    class ShoeEmpty : public std::runtime_error {
    public:
        ShoeEmpty() : std::runtime_error("shoe is empty") {}
    };

    // A seeded generator was advanced or shared before the session claimed it.
    class GeneratorMisuse : public std::logic_error {
    public:
        explicit GeneratorMisuse(const std::string& what)
            : std::logic_error("generator misuse: " + what) {}
    };
}
