//! # JSON Parser
//!
//! A zero-copy lexer and recursive descent parser building `JsonValue`
//! trees from text.
//!
//! ## Features
//!
//! - **Zero-copy lexing**: Uses `std::string_view` to avoid allocations
//! - **Integer detection**: Numbers without decimals/exponents are parsed as integers
//! - **Precise errors**: Reports errors with line/column information
//! - **Depth limiting**: Nesting depth is bounded by `ParseOptions::max_depth`
//! - **Unicode escapes**: `\uXXXX` escapes, surrogate pairs included, are decoded to UTF-8
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"name": "Alice", "age": 30})");
//! if (is_ok(result)) {
//!     auto& json = unwrap(result);
//!     std::cout << json.get("name")->as_string() << std::endl;
//! } else {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"
#include "json/json_value.hpp"

#include <string_view>
#include <vector>

namespace unijson::json {

/// Default bound on array/object nesting.
constexpr size_t DEFAULT_MAX_DEPTH = 1000;

/// Parser configuration.
struct ParseOptions {
    /// Maximum array/object nesting accepted before failing.
    size_t max_depth = DEFAULT_MAX_DEPTH;
};

// ============================================================================
// Token Types
// ============================================================================

/// Token types for the JSON lexer (RFC 8259).
enum class JsonTokenKind : uint8_t {
    LBrace,      ///< `{`
    RBrace,      ///< `}`
    LBracket,    ///< `[`
    RBracket,    ///< `]`
    Colon,       ///< `:`
    Comma,       ///< `,`
    String,      ///< `"..."`
    IntNumber,   ///< `123`, `-456`
    FloatNumber, ///< `1.5`, `1e10`
    True,        ///< `true`
    False,       ///< `false`
    Null,        ///< `null`
    Eof,         ///< End of input
    Error        ///< Lexer error (check error message)
};

/// A token produced by the JSON lexer.
///
/// For `String` tokens, `string_value` contains the unescaped content.
/// For number tokens, `number_value` contains the parsed number.
struct JsonToken {
    JsonTokenKind kind = JsonTokenKind::Eof;
    std::string_view lexeme;
    size_t line = 0;
    size_t column = 0;
    size_t offset = 0;
    std::string string_value;
    JsonNumber number_value;
};

// ============================================================================
// Lexer
// ============================================================================

/// Zero-copy JSON lexer producing one token at a time.
class JsonLexer {
public:
    explicit JsonLexer(std::string_view input);

    /// Returns the next token, `Eof` at end of input and `Error` on failure.
    auto next_token() -> JsonToken;

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

    [[nodiscard]] auto errors() const -> const std::vector<JsonError>& {
        return errors_;
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    std::vector<JsonError> errors_;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    auto make_token(JsonTokenKind kind, size_t start_pos, size_t start_line, size_t start_col)
        -> JsonToken;
    auto scan_string() -> JsonToken;
    auto scan_unicode_escape(std::string& out) -> bool;
    auto read_hex4(unsigned int& codepoint) -> bool;
    auto scan_number() -> JsonToken;
    auto scan_keyword() -> JsonToken;
    void add_error(const std::string& msg);
    void add_error(const std::string& msg, size_t line, size_t col);
};

// ============================================================================
// Parser
// ============================================================================

/// Recursive descent JSON parser.
///
/// Duplicate object keys keep the position of the first occurrence and the
/// value of the last one.
class JsonParser {
public:
    explicit JsonParser(std::string_view input, ParseOptions options = {});

    /// Parses the input, which must hold exactly one JSON value.
    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    JsonLexer lexer_;
    JsonToken current_;
    ParseOptions options_;
    size_t depth_ = 0;

    void advance();
    [[nodiscard]] auto check(JsonTokenKind kind) const -> bool;
    auto match(JsonTokenKind kind) -> bool;
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;
    [[nodiscard]] auto lexer_error() const -> JsonError;
    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Parses a JSON string and returns a `JsonValue`.
///
/// # Returns
///
/// `Ok(JsonValue)` on success, `Err(JsonError)` on failure.
[[nodiscard]] auto parse_json(std::string_view input, ParseOptions options = {})
    -> Result<JsonValue, JsonError>;

} // namespace unijson::json
