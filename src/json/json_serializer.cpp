//! # JSON Serializer
//!
//! Converts `JsonValue` trees to text. One writer handles every output
//! shape; `WriteOptions` selects compact or indented layout, key order and
//! ASCII escaping.
//!
//! ## String Escaping
//!
//! | Character | Escape Sequence |
//! |-----------|-----------------|
//! | `"` | `\"` |
//! | `\` | `\\` |
//! | Backspace | `\b` |
//! | Form feed | `\f` |
//! | Line feed | `\n` |
//! | Carriage return | `\r` |
//! | Tab | `\t` |
//! | Control (0x00-0x1F) | `\uXXXX` |
//! | Non-ASCII with `ensure_ascii` | `\uXXXX`, surrogate pair above U+FFFF |
//!
//! ## Example
//!
//! ```cpp
//! JsonValue obj = unwrap(parse_json(R"({"name": "Alice", "age": 30})"));
//!
//! obj.to_string();          // {"name":"Alice","age":30}
//! obj.to_string(WriteOptions{.indent = 2});
//! // {
//! //   "name": "Alice",
//! //   "age": 30
//! // }
//! ```

#include "json/json_value.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <ostream>

namespace unijson::json {

namespace {

void append_hex4(std::string& out, unsigned int unit) {
    static constexpr char digits[] = "0123456789abcdef";
    out += "\\u";
    out += digits[(unit >> 12) & 0xF];
    out += digits[(unit >> 8) & 0xF];
    out += digits[(unit >> 4) & 0xF];
    out += digits[unit & 0xF];
}

/// Decodes one UTF-8 sequence starting at `s[i]` and advances `i` past it.
/// Malformed bytes decode to U+FFFD and consume a single byte.
auto decode_utf8(const std::string& s, size_t& i) -> unsigned int {
    auto byte = [&](size_t k) { return static_cast<unsigned char>(s[k]); };
    unsigned char lead = byte(i);
    size_t len = 0;
    unsigned int cp = 0;

    if ((lead & 0xE0) == 0xC0) {
        len = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        len = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        len = 4;
        cp = lead & 0x07;
    } else {
        ++i;
        return 0xFFFD;
    }

    if (i + len > s.size()) {
        ++i;
        return 0xFFFD;
    }
    for (size_t k = 1; k < len; ++k) {
        if ((byte(i + k) & 0xC0) != 0x80) {
            ++i;
            return 0xFFFD;
        }
        cp = (cp << 6) | (byte(i + k) & 0x3F);
    }
    i += len;
    return cp;
}

/// Appends `s` quoted and escaped per RFC 8259.
void write_string(std::string& out, const std::string& s, bool ensure_ascii) {
    out += '"';
    size_t i = 0;
    while (i < s.size()) {
        char c = s[i];
        switch (c) {
        case '"':
            out += "\\\"";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\f':
            out += "\\f";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\t':
            out += "\\t";
            break;
        default: {
            auto uc = static_cast<unsigned char>(c);
            if (uc < 0x20) {
                append_hex4(out, uc);
            } else if (uc >= 0x80 && ensure_ascii) {
                unsigned int cp = decode_utf8(s, i);
                if (cp >= 0x10000) {
                    cp -= 0x10000;
                    append_hex4(out, 0xD800 + (cp >> 10));
                    append_hex4(out, 0xDC00 + (cp & 0x3FF));
                } else {
                    append_hex4(out, cp);
                }
                continue;
            } else {
                out += c;
            }
            break;
        }
        }
        ++i;
    }
    out += '"';
}

/// Formats a JSON number for output.
///
/// Integers are written without a decimal point. Floats use the shortest
/// representation that round-trips and always carry a `.` or exponent.
/// NaN and infinities have no JSON form and are written as `null`.
void write_number(std::string& out, const JsonNumber& num) {
    char buf[32];
    switch (num.kind) {
    case JsonNumber::Kind::Int64: {
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), num.i64);
        out.append(buf, ptr);
        return;
    }
    case JsonNumber::Kind::Uint64: {
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), num.u64);
        out.append(buf, ptr);
        return;
    }
    case JsonNumber::Kind::Double: {
        if (std::isnan(num.f64) || std::isinf(num.f64)) {
            out += "null";
            return;
        }
        auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), num.f64);
        std::string_view text(buf, static_cast<size_t>(ptr - buf));
        out += text;
        if (text.find_first_of(".eE") == std::string_view::npos) {
            out += ".0";
        }
        return;
    }
    }
}

class Writer {
public:
    explicit Writer(const WriteOptions& options) : options_(options) {}

    void write(const JsonValue& value, int depth) {
        if (value.is_null()) {
            out_ += "null";
        } else if (value.is_bool()) {
            out_ += value.as_bool() ? "true" : "false";
        } else if (value.is_number()) {
            write_number(out_, value.as_number());
        } else if (value.is_string()) {
            write_string(out_, value.as_string(), options_.ensure_ascii);
        } else if (value.is_array()) {
            write_array(value.as_array(), depth);
        } else if (value.is_object()) {
            write_object(value.as_object(), depth);
        }
    }

    auto take() -> std::string {
        return std::move(out_);
    }

private:
    const WriteOptions& options_;
    std::string out_;

    [[nodiscard]] auto pretty() const -> bool {
        return options_.indent.has_value();
    }

    void newline(int depth) {
        out_ += '\n';
        out_.append(static_cast<size_t>(depth * std::max(*options_.indent, 0)), ' ');
    }

    void write_array(const JsonArray& arr, int depth) {
        if (arr.empty()) {
            out_ += "[]";
            return;
        }
        out_ += '[';
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out_ += ',';
            }
            if (pretty()) {
                newline(depth + 1);
            }
            write(arr[i], depth + 1);
        }
        if (pretty()) {
            newline(depth);
        }
        out_ += ']';
    }

    void write_object(const JsonObject& obj, int depth) {
        if (obj.empty()) {
            out_ += "{}";
            return;
        }
        out_ += '{';
        bool first = true;
        auto emit = [&](const std::string& key, const JsonValue& val) {
            if (!first) {
                out_ += ',';
            }
            first = false;
            if (pretty()) {
                newline(depth + 1);
            }
            write_string(out_, key, options_.ensure_ascii);
            out_ += pretty() ? ": " : ":";
            write(val, depth + 1);
        };

        if (options_.sort_keys) {
            for (const auto& key : obj.sorted_keys()) {
                emit(key, obj.at(key));
            }
        } else {
            for (const auto& [key, val] : obj) {
                emit(key, val);
            }
        }

        if (pretty()) {
            newline(depth);
        }
        out_ += '}';
    }
};

} // anonymous namespace

// ============================================================================
// JsonValue Serialization Methods
// ============================================================================

auto JsonValue::to_string() const -> std::string {
    return to_string(WriteOptions{});
}

auto JsonValue::to_string(const WriteOptions& options) const -> std::string {
    Writer writer(options);
    writer.write(*this, 0);
    return writer.take();
}

auto JsonValue::write_to(std::ostream& os, const WriteOptions& options) const -> size_t {
    std::string text = to_string(options);
    os.write(text.data(), static_cast<std::streamsize>(text.size()));
    return text.size();
}

} // namespace unijson::json
