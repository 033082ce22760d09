//! # JSON Error Types
//!
//! Error type for JSON parsing. Errors carry the source location of the
//! offending token so that `loads()` can report where malformed input broke.
//!
//! ## Example
//!
//! ```cpp
//! auto error = JsonError::make("Unexpected token", 5, 12);
//! std::cerr << error.to_string() << std::endl;
//! // Output: "line 5, column 12: Unexpected token"
//! ```

#pragma once

#include <cstddef>
#include <string>

namespace unijson::json {

/// An error encountered during JSON parsing.
///
/// # Fields
///
/// - `message`: Description of what went wrong
/// - `line`: 1-based line number (0 if unknown)
/// - `column`: 1-based column number (0 if unknown)
/// - `offset`: Byte offset from start of input (0 if unknown)
struct JsonError {
    std::string message;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;

    /// Creates an error with message only.
    static auto make(std::string msg) -> JsonError {
        return JsonError{std::move(msg), 0, 0, 0};
    }

    /// Creates an error with location information.
    ///
    /// # Arguments
    ///
    /// * `msg` - The error message
    /// * `line` - 1-based line number
    /// * `column` - 1-based column number
    /// * `offset` - Byte offset (optional, defaults to 0)
    static auto make(std::string msg, size_t line, size_t column, size_t offset = 0) -> JsonError {
        return JsonError{std::move(msg), line, column, offset};
    }

    /// Formats the error as `"line X, column Y: message"`, dropping the
    /// location parts that are unknown.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        if (line > 0) {
            return "line " + std::to_string(line) + ": " + message;
        }
        return message;
    }
};

} // namespace unijson::json
