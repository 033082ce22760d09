//! # JSON Parser Implementation
//!
//! The lexer tokenizes input using `std::string_view`; the parser builds a
//! `JsonValue` tree from the token stream.
//!
//! ## Parser Details
//!
//! - Depth limiting through `ParseOptions::max_depth`
//! - Lexer errors surface with their own message and location
//! - Integer detection for numbers without decimal/exponent; integers that
//!   overflow 64 bits fall back to doubles

#include "json/json_parser.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>

namespace unijson::json {

namespace {

/// Appends `codepoint` to `out` as UTF-8.
void append_utf8(std::string& out, unsigned int codepoint) {
    if (codepoint < 0x80) {
        out += static_cast<char>(codepoint);
    } else if (codepoint < 0x800) {
        out += static_cast<char>(0xC0 | (codepoint >> 6));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else if (codepoint < 0x10000) {
        out += static_cast<char>(0xE0 | (codepoint >> 12));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codepoint >> 18));
        out += static_cast<char>(0x80 | ((codepoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codepoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codepoint & 0x3F));
    }
}

auto is_digit(char c) -> bool {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // anonymous namespace

// ============================================================================
// JsonLexer Implementation
// ============================================================================

JsonLexer::JsonLexer(std::string_view input) : input_(input) {}

auto JsonLexer::peek() const -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    return input_[pos_];
}

/// Advances and returns the consumed character, tracking line and column.
auto JsonLexer::advance() -> char {
    if (pos_ >= input_.size()) {
        return '\0';
    }
    char c = input_[pos_++];
    if (c == '\n') {
        ++line_;
        column_ = 1;
    } else {
        ++column_;
    }
    return c;
}

void JsonLexer::skip_whitespace() {
    while (pos_ < input_.size()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            advance();
        } else {
            break;
        }
    }
}

auto JsonLexer::make_token(JsonTokenKind kind, size_t start_pos, size_t start_line,
                           size_t start_col) -> JsonToken {
    JsonToken tok;
    tok.kind = kind;
    tok.lexeme = input_.substr(start_pos, pos_ - start_pos);
    tok.line = start_line;
    tok.column = start_col;
    tok.offset = start_pos;
    return tok;
}

void JsonLexer::add_error(const std::string& msg) {
    errors_.push_back(JsonError::make(msg, line_, column_, pos_));
}

void JsonLexer::add_error(const std::string& msg, size_t line, size_t col) {
    errors_.push_back(JsonError::make(msg, line, col, pos_));
}

auto JsonLexer::read_hex4(unsigned int& codepoint) -> bool {
    if (pos_ + 4 > input_.size()) {
        add_error("Incomplete unicode escape sequence");
        return false;
    }
    std::string_view hex = input_.substr(pos_, 4);
    auto [ptr, ec] = std::from_chars(hex.data(), hex.data() + 4, codepoint, 16);
    if (ec != std::errc{} || ptr != hex.data() + 4) {
        add_error("Invalid unicode escape sequence");
        return false;
    }
    pos_ += 4;
    column_ += 4;
    return true;
}

/// Decodes the `XXXX` of a `\uXXXX` escape (the `\u` is already consumed),
/// combining a following low surrogate escape when present.
auto JsonLexer::scan_unicode_escape(std::string& out) -> bool {
    unsigned int codepoint = 0;
    if (!read_hex4(codepoint)) {
        return false;
    }

    if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        if (pos_ + 1 < input_.size() && input_[pos_] == '\\' && input_[pos_ + 1] == 'u') {
            advance();
            advance();
            unsigned int low = 0;
            if (!read_hex4(low)) {
                return false;
            }
            if (low < 0xDC00 || low > 0xDFFF) {
                add_error("Invalid low surrogate in unicode escape");
                return false;
            }
            codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
        } else {
            // Lone high surrogate, kept as U+FFFD
            codepoint = 0xFFFD;
        }
    } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
        codepoint = 0xFFFD;
    }

    append_utf8(out, codepoint);
    return true;
}

auto JsonLexer::scan_string() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    advance(); // opening quote

    std::string value;
    while (pos_ < input_.size()) {
        char c = peek();

        if (c == '"') {
            advance();
            JsonToken tok = make_token(JsonTokenKind::String, start_pos, start_line, start_col);
            tok.string_value = std::move(value);
            return tok;
        }

        if (c == '\\') {
            advance();
            char escaped = advance();
            switch (escaped) {
            case '"':
                value += '"';
                break;
            case '\\':
                value += '\\';
                break;
            case '/':
                value += '/';
                break;
            case 'b':
                value += '\b';
                break;
            case 'f':
                value += '\f';
                break;
            case 'n':
                value += '\n';
                break;
            case 'r':
                value += '\r';
                break;
            case 't':
                value += '\t';
                break;
            case 'u':
                if (!scan_unicode_escape(value)) {
                    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
                }
                break;
            default:
                add_error("Invalid escape sequence: \\" + std::string(1, escaped));
                return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
            }
        } else if (static_cast<unsigned char>(c) < 0x20) {
            add_error("Control character in string");
            return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
        } else {
            value += c;
            advance();
        }
    }

    add_error("Unterminated string", start_line, start_col);
    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
}

/// Scans a number per RFC 8259. Numbers without fraction or exponent become
/// integers when they fit in 64 bits.
auto JsonLexer::scan_number() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    bool is_float = false;

    if (peek() == '-') {
        advance();
    }

    if (peek() == '0') {
        advance();
    } else if (is_digit(peek())) {
        while (is_digit(peek())) {
            advance();
        }
    } else {
        add_error("Invalid number");
        return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
    }

    if (peek() == '.') {
        is_float = true;
        advance();
        if (!is_digit(peek())) {
            add_error("Expected digit after decimal point");
            return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        advance();
        if (peek() == '+' || peek() == '-') {
            advance();
        }
        if (!is_digit(peek())) {
            add_error("Expected digit in exponent");
            return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
        }
        while (is_digit(peek())) {
            advance();
        }
    }

    std::string_view num_str = input_.substr(start_pos, pos_ - start_pos);
    JsonToken tok = make_token(is_float ? JsonTokenKind::FloatNumber : JsonTokenKind::IntNumber,
                               start_pos, start_line, start_col);

    auto as_double = [&]() { return std::strtod(std::string(num_str).c_str(), nullptr); };

    if (is_float) {
        tok.number_value = JsonNumber(as_double());
        return tok;
    }

    if (num_str[0] == '-') {
        int64_t value = 0;
        auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), value);
        if (ec != std::errc{}) {
            tok.kind = JsonTokenKind::FloatNumber;
            tok.number_value = JsonNumber(as_double());
        } else {
            tok.number_value = JsonNumber(value);
        }
    } else {
        uint64_t value = 0;
        auto [ptr, ec] = std::from_chars(num_str.data(), num_str.data() + num_str.size(), value);
        if (ec != std::errc{}) {
            tok.kind = JsonTokenKind::FloatNumber;
            tok.number_value = JsonNumber(as_double());
        } else if (value <= static_cast<uint64_t>(INT64_MAX)) {
            tok.number_value = JsonNumber(static_cast<int64_t>(value));
        } else {
            tok.number_value = JsonNumber(value);
        }
    }

    return tok;
}

auto JsonLexer::scan_keyword() -> JsonToken {
    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;

    while (std::isalpha(static_cast<unsigned char>(peek())) != 0) {
        advance();
    }

    std::string_view word = input_.substr(start_pos, pos_ - start_pos);

    if (word == "true") {
        return make_token(JsonTokenKind::True, start_pos, start_line, start_col);
    }
    if (word == "false") {
        return make_token(JsonTokenKind::False, start_pos, start_line, start_col);
    }
    if (word == "null") {
        return make_token(JsonTokenKind::Null, start_pos, start_line, start_col);
    }

    add_error("Unknown keyword: " + std::string(word), start_line, start_col);
    return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
}

auto JsonLexer::next_token() -> JsonToken {
    skip_whitespace();

    if (pos_ >= input_.size()) {
        JsonToken tok;
        tok.kind = JsonTokenKind::Eof;
        tok.line = line_;
        tok.column = column_;
        tok.offset = pos_;
        return tok;
    }

    size_t start_pos = pos_;
    size_t start_line = line_;
    size_t start_col = column_;
    char c = peek();

    switch (c) {
    case '{':
        advance();
        return make_token(JsonTokenKind::LBrace, start_pos, start_line, start_col);
    case '}':
        advance();
        return make_token(JsonTokenKind::RBrace, start_pos, start_line, start_col);
    case '[':
        advance();
        return make_token(JsonTokenKind::LBracket, start_pos, start_line, start_col);
    case ']':
        advance();
        return make_token(JsonTokenKind::RBracket, start_pos, start_line, start_col);
    case ':':
        advance();
        return make_token(JsonTokenKind::Colon, start_pos, start_line, start_col);
    case ',':
        advance();
        return make_token(JsonTokenKind::Comma, start_pos, start_line, start_col);
    case '"':
        return scan_string();
    case 't':
    case 'f':
    case 'n':
        return scan_keyword();
    default:
        if (c == '-' || is_digit(c)) {
            return scan_number();
        }
        advance();
        add_error("Unexpected character: " + std::string(1, c), start_line, start_col);
        return make_token(JsonTokenKind::Error, start_pos, start_line, start_col);
    }
}

// ============================================================================
// JsonParser Implementation
// ============================================================================

JsonParser::JsonParser(std::string_view input, ParseOptions options)
    : lexer_(input), options_(options) {
    advance();
}

void JsonParser::advance() {
    current_ = lexer_.next_token();
}

auto JsonParser::check(JsonTokenKind kind) const -> bool {
    return current_.kind == kind;
}

auto JsonParser::match(JsonTokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto JsonParser::make_error(const std::string& msg) const -> JsonError {
    return JsonError::make(msg, current_.line, current_.column, current_.offset);
}

auto JsonParser::lexer_error() const -> JsonError {
    if (lexer_.has_errors()) {
        return lexer_.errors().back();
    }
    return make_error("Invalid token: " + std::string(current_.lexeme));
}

auto JsonParser::parse() -> Result<JsonValue, JsonError> {
    auto result = parse_value();
    if (is_err(result)) {
        return result;
    }

    if (check(JsonTokenKind::Error)) {
        return lexer_error();
    }
    if (!check(JsonTokenKind::Eof)) {
        return make_error("Unexpected content after JSON value");
    }

    return result;
}

auto JsonParser::parse_value() -> Result<JsonValue, JsonError> {
    switch (current_.kind) {
    case JsonTokenKind::Null:
        advance();
        return JsonValue();

    case JsonTokenKind::True:
        advance();
        return JsonValue(true);

    case JsonTokenKind::False:
        advance();
        return JsonValue(false);

    case JsonTokenKind::IntNumber:
    case JsonTokenKind::FloatNumber: {
        JsonNumber num = current_.number_value;
        advance();
        return JsonValue(num);
    }

    case JsonTokenKind::String: {
        std::string str = std::move(current_.string_value);
        advance();
        return JsonValue(std::move(str));
    }

    case JsonTokenKind::LBrace:
    case JsonTokenKind::LBracket: {
        if (depth_ >= options_.max_depth) {
            return make_error("Maximum nesting depth exceeded (" +
                              std::to_string(options_.max_depth) + ")");
        }
        ++depth_;
        auto result = check(JsonTokenKind::LBrace) ? parse_object() : parse_array();
        --depth_;
        return result;
    }

    case JsonTokenKind::Error:
        return lexer_error();

    case JsonTokenKind::Eof:
        return make_error("Unexpected end of input");

    default:
        return make_error("Unexpected token '" + std::string(current_.lexeme) + "'");
    }
}

auto JsonParser::parse_object() -> Result<JsonValue, JsonError> {
    advance(); // '{'

    JsonObject obj;

    if (match(JsonTokenKind::RBrace)) {
        return JsonValue(std::move(obj));
    }

    while (true) {
        if (check(JsonTokenKind::Error)) {
            return lexer_error();
        }
        if (!check(JsonTokenKind::String)) {
            return make_error("Expected string key in object");
        }
        std::string key = std::move(current_.string_value);
        advance();

        if (!match(JsonTokenKind::Colon)) {
            return make_error("Expected ':' after object key");
        }

        auto value_result = parse_value();
        if (is_err(value_result)) {
            return value_result;
        }

        obj.insert_or_assign(key, std::move(unwrap(value_result)));

        if (match(JsonTokenKind::Comma)) {
            if (check(JsonTokenKind::RBrace)) {
                return make_error("Trailing comma in object");
            }
        } else if (match(JsonTokenKind::RBrace)) {
            return JsonValue(std::move(obj));
        } else if (check(JsonTokenKind::Error)) {
            return lexer_error();
        } else {
            return make_error("Expected ',' or '}' in object");
        }
    }
}

auto JsonParser::parse_array() -> Result<JsonValue, JsonError> {
    advance(); // '['

    JsonArray arr;

    if (match(JsonTokenKind::RBracket)) {
        return JsonValue(std::move(arr));
    }

    while (true) {
        auto value_result = parse_value();
        if (is_err(value_result)) {
            return value_result;
        }

        arr.push_back(std::move(unwrap(value_result)));

        if (match(JsonTokenKind::Comma)) {
            if (check(JsonTokenKind::RBracket)) {
                return make_error("Trailing comma in array");
            }
        } else if (match(JsonTokenKind::RBracket)) {
            return JsonValue(std::move(arr));
        } else if (check(JsonTokenKind::Error)) {
            return lexer_error();
        } else {
            return make_error("Expected ',' or ']' in array");
        }
    }
}

// ============================================================================
// Convenience Functions
// ============================================================================

auto parse_json(std::string_view input, ParseOptions options) -> Result<JsonValue, JsonError> {
    JsonParser parser(input, options);
    return parser.parse();
}

} // namespace unijson::json
