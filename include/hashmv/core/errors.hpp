#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace hashmv {

// ============================================================================
// Error Taxonomy
// ============================================================================

/// Feature dimension or projection shape inconsistent with the kernel.
class ShapeMismatchError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Zero-norm vector presented for normalization (or a zero projection row).
class DegenerateVectorError : public std::domain_error {
public:
    using std::domain_error::domain_error;
};

/// k <= 0, a selector that matched nothing, or other invalid settings.
class InvalidConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Kernel used before its weight/projection state was initialized.
class UntrainedStateError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

/// Checkpoint I/O, format, missing-key or shape failures.
class CheckpointError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace detail {

inline std::string shape_str(size_t rows, size_t cols) {
    return "(" + std::to_string(rows) + ", " + std::to_string(cols) + ")";
}

}  // namespace detail

}  // namespace hashmv
