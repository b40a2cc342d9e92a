#pragma once

/// @file error.hpp
/// @brief Exception type of the flowsim I/O library.
/// @ingroup io

#include <stdexcept>
#include <string>

namespace flowsim::io {

/// @brief Exception for I/O errors (loading, parsing, validation).
///
/// Thrown when a line description or trace file is malformed, a required
/// field is missing, or a value fails validation (e.g. a negative cycle
/// time or an upstream name that does not exist).
///
/// @ingroup io
/// @see load_line, load_line_from_string
class LoaderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;

    /// @brief Construct a LoaderError formatted as `"context: message"`.
    LoaderError(const std::string& message, const std::string& context)
        : std::runtime_error(context + ": " + message) {}
};

} // namespace flowsim::io
