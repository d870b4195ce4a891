/// @file error.hpp
/// @brief Error types for the docupdate-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace docupdate_cpp {

/// Categories of errors that can occur while applying an update.
enum class ErrorKind : std::uint8_t {
    bad_value,                    ///< An operand or a result value is not acceptable.
    failed_to_parse,              ///< The update specification is malformed.
    type_mismatch,                ///< An operator met a value of the wrong type.
    path_not_viable,              ///< A path cannot be traversed through the document.
    conflicting_update_operators, ///< Two modifications address overlapping paths.
    dollar_prefixed_field_name,   ///< A path component starts with '$'.
    empty_field_name,             ///< A path is empty or has an empty component.
    immutable_field,              ///< The update would change '_id'.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::bad_value:                    return "bad_value";
        case ErrorKind::failed_to_parse:              return "failed_to_parse";
        case ErrorKind::type_mismatch:                return "type_mismatch";
        case ErrorKind::path_not_viable:              return "path_not_viable";
        case ErrorKind::conflicting_update_operators: return "conflicting_update_operators";
        case ErrorKind::dollar_prefixed_field_name:   return "dollar_prefixed_field_name";
        case ErrorKind::empty_field_name:             return "empty_field_name";
        case ErrorKind::immutable_field:              return "immutable_field";
    }
    return "unknown";
}

/// The MongoDB server error code reported for an ErrorKind.
///
/// Callers that speak the MongoDB wire protocol put this number into the
/// write error they return to the client.
constexpr auto error_code(ErrorKind kind) noexcept -> std::int32_t {
    switch (kind) {
        case ErrorKind::bad_value:                    return 2;
        case ErrorKind::failed_to_parse:              return 9;
        case ErrorKind::type_mismatch:                return 14;
        case ErrorKind::path_not_viable:              return 28;
        case ErrorKind::conflicting_update_operators: return 40;
        case ErrorKind::dollar_prefixed_field_name:   return 52;
        case ErrorKind::empty_field_name:             return 56;
        case ErrorKind::immutable_field:              return 66;
    }
    return 1;
}

/// A structured error with a category and a human-readable message.
///
/// Thrown by every operation that rejects a path, an operand or an update
/// document. what() returns the message.
class Error : public std::runtime_error {
public:
    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : std::runtime_error{msg}, kind{k}, message{std::move(msg)} {}

    /// The MongoDB numeric code for this error.
    auto code() const noexcept -> std::int32_t { return error_code(kind); }

    auto operator==(const Error& other) const -> bool {
        return kind == other.kind && message == other.message;
    }

    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.
};

}  // namespace docupdate_cpp
