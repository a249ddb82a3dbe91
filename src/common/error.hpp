#ifndef STRATA_COMMON_ERROR_HPP
#define STRATA_COMMON_ERROR_HPP

#include <stdexcept>
#include <string>

namespace Strata::Error {
    // Two lookups of one Parameter disagree on a known dimension, or a fixed
    // shape is asked to accept a different one.
    class ShapeConflict : public std::invalid_argument {
    public:
        explicit ShapeConflict(const std::string& message) : std::invalid_argument(message) {}
    };

    // A deferred dimension cannot be derived from the observed input.
    class InferenceError : public std::runtime_error {
    public:
        explicit InferenceError(const std::string& message) : std::runtime_error(message) {}
    };

    class NotDeferrable : public std::logic_error {
    public:
        explicit NotDeferrable(const std::string& message) : std::logic_error(message) {}
    };

    class DuplicateName : public std::invalid_argument {
    public:
        explicit DuplicateName(const std::string& message) : std::invalid_argument(message) {}
    };

    class RankError : public std::invalid_argument {
    public:
        explicit RankError(const std::string& message) : std::invalid_argument(message) {}
    };

    class TypeError : public std::invalid_argument {
    public:
        explicit TypeError(const std::string& message) : std::invalid_argument(message) {}
    };

    // The traced body asked for something only a concrete tensor can answer.
    class TraceError : public std::runtime_error {
    public:
        explicit TraceError(const std::string& message) : std::runtime_error(message) {}
    };

    class Uninitialized : public std::runtime_error {
    public:
        explicit Uninitialized(const std::string& message) : std::runtime_error(message) {}
    };
}

#endif // STRATA_COMMON_ERROR_HPP
