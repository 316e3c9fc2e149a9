/// @file error.hpp
/// @brief Error types for the docdelta-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace docdelta_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    structural_violation,  ///< A change cannot be expressed without breaking segment structure.
    input_malformation,    ///< The supplied document tree is inconsistent.
    unsupported_content,   ///< The content cannot be synthesised by any operation.
    invalid_operation,     ///< An operation is invalid against the current document state.
    unknown_operation,     ///< An operation of unrecognised kind reached the serializer.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::structural_violation: return "structural_violation";
        case ErrorKind::input_malformation:   return "input_malformation";
        case ErrorKind::unsupported_content:  return "unsupported_content";
        case ErrorKind::invalid_operation:    return "invalid_operation";
        case ErrorKind::unknown_operation:    return "unknown_operation";
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

/// Exception thrown by the diff engine, the serializer and the replayer.
///
/// There is no partial result: a diff either returns a complete operation
/// list or throws.
class DiffError : public std::runtime_error {
public:
    explicit DiffError(Error error)
        : std::runtime_error{std::string{to_string_view(error.kind)} + ": " + error.message},
          error_{std::move(error)} {}

    DiffError(ErrorKind kind, std::string message)
        : DiffError{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace docdelta_cpp
