//! # Runtime Value Implementation
//!
//! Deep copy, equality and debug rendering of `Value`.

#include "runtime/value.hpp"

#include "runtime/class.hpp"
#include "runtime/object.hpp"

#include <charconv>
#include <cmath>

namespace unijson {

namespace {

auto repr_string(const std::string& s) -> std::string {
    std::string out = "'";
    for (char c : s) {
        switch (c) {
        case '\'':
            out += "\\'";
            break;
        case '\\':
            out += "\\\\";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        default:
            out += c;
        }
    }
    out += '\'';
    return out;
}

auto repr_float(double d) -> std::string {
    if (std::isnan(d)) {
        return "nan";
    }
    if (std::isinf(d)) {
        return d > 0 ? "inf" : "-inf";
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), d);
    std::string out(buf, ptr);
    if (out.find_first_of(".eE") == std::string::npos) {
        out += ".0";
    }
    return out;
}

} // anonymous namespace

Value::Value(const Value& other) {
    *this = other;
}

auto Value::operator=(const Value& other) -> Value& {
    if (this == &other) {
        return *this;
    }
    if (other.is_array()) {
        data_ = make_box<Array>(other.as_array());
    } else if (other.is_map()) {
        data_ = make_box<Map>(other.as_map());
    } else {
        std::visit(
            [this](const auto& v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (!std::is_same_v<T, Box<Array>> && !std::is_same_v<T, Box<Map>>) {
                    data_ = v;
                }
            },
            other.data_);
    }
    return *this;
}

auto Value::size() const -> size_t {
    if (is_array()) {
        return as_array().size();
    }
    if (is_map()) {
        return as_map().size();
    }
    return 0;
}

auto Value::type_name() const -> std::string {
    if (is_null()) {
        return "None";
    }
    if (is_bool()) {
        return "bool";
    }
    if (is_int()) {
        return "int";
    }
    if (is_float()) {
        return "float";
    }
    if (is_string()) {
        return "str";
    }
    if (is_array()) {
        return "list";
    }
    if (is_map()) {
        return "dict";
    }
    return as_object()->klass()->name();
}

auto Value::repr() const -> std::string {
    if (is_null()) {
        return "None";
    }
    if (is_bool()) {
        return as_bool() ? "True" : "False";
    }
    if (is_int()) {
        return std::to_string(as_int());
    }
    if (is_float()) {
        return repr_float(std::get<double>(data_));
    }
    if (is_string()) {
        return repr_string(as_string());
    }
    if (is_array()) {
        std::string out = "[";
        bool first = true;
        for (const auto& item : as_array()) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += item.repr();
        }
        return out + "]";
    }
    if (is_map()) {
        std::string out = "{";
        bool first = true;
        for (const auto& [key, item] : as_map()) {
            if (!first) {
                out += ", ";
            }
            first = false;
            out += repr_string(key) + ": " + item.repr();
        }
        return out + "}";
    }
    return as_object()->repr();
}

auto Value::operator==(const Value& other) const -> bool {
    if (data_.index() != other.data_.index()) {
        return false;
    }
    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_int()) {
        return as_int() == other.as_int();
    }
    if (is_float()) {
        return std::get<double>(data_) == std::get<double>(other.data_);
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        return as_array() == other.as_array();
    }
    if (is_map()) {
        return as_map() == other.as_map();
    }
    const auto& a = as_object();
    const auto& b = other.as_object();
    return a == b || a->equals(*b);
}

} // namespace unijson
