/// @file error.hpp
/// @brief Error types for the fieldpath-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace fieldpath_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_argument,       ///< A caller argument is unusable (blank path, empty field name).
    malformed_input,        ///< Stored field content is not valid JSON text.
    path_syntax,            ///< A path expression failed to compile.
    unsupported_operation,  ///< Missing structure cannot be created for this path.
    unsupported_pattern,    ///< A no-match wildcard update has an unsupported shape.
    invalid_field_type,     ///< Field content is neither text nor a JSON container.
    execution_error,        ///< An unexpected failure while evaluating or mutating.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_argument:      return "invalid_argument";
        case ErrorKind::malformed_input:       return "malformed_input";
        case ErrorKind::path_syntax:           return "path_syntax";
        case ErrorKind::unsupported_operation: return "unsupported_operation";
        case ErrorKind::unsupported_pattern:   return "unsupported_pattern";
        case ErrorKind::invalid_field_type:    return "invalid_field_type";
        case ErrorKind::execution_error:       return "execution_error";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Base exception thrown by every fieldpath-cpp operation.
///
/// Catch Exception to handle the whole family, or one of the
/// kind-specific subclasses below to handle a single category.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    /// The structured error carried by this exception.
    auto error() const noexcept -> const Error& { return error_; }

    /// Shorthand for error().kind.
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

namespace detail {

template <ErrorKind K>
class KindError : public Exception {
public:
    static constexpr ErrorKind error_kind = K;

    explicit KindError(std::string message)
        : Exception{Error{K, std::move(message)}} {}
};

}  // namespace detail

/// The path is blank or the field name is empty.
using InvalidArgumentError = detail::KindError<ErrorKind::invalid_argument>;
/// The stored field text is not valid JSON.
using MalformedInputError = detail::KindError<ErrorKind::malformed_input>;
/// The path expression could not be compiled.
using PathSyntaxError = detail::KindError<ErrorKind::path_syntax>;
/// Structure cannot be synthesized (negative index, non-container in the way).
using UnsupportedOperationError = detail::KindError<ErrorKind::unsupported_operation>;
/// A zero-match wildcard or recursive-descent update has an unsupported shape.
using UnsupportedPatternError = detail::KindError<ErrorKind::unsupported_pattern>;
/// The field holds neither text nor an object/array.
using InvalidFieldTypeError = detail::KindError<ErrorKind::invalid_field_type>;
/// Any other failure surfaced from evaluation or mutation.
using ExecutionError = detail::KindError<ErrorKind::execution_error>;

}  // namespace fieldpath_cpp
