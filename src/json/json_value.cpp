//! # JSON Value Comparison
//!
//! Out-of-line members of `JsonValue` that walk the whole tree.
//!
//! ## Equality Semantics
//!
//! | Type | Comparison |
//! |------|------------|
//! | `null` | Always equal to other nulls |
//! | `bool` | Value comparison |
//! | `number` | Numeric comparison (see `JsonNumber::operator==`) |
//! | `string` | Byte-by-byte string comparison |
//! | `array` | Element-by-element in order |
//! | `object` | Key-value pair comparison (order independent) |

#include "json/json_value.hpp"

namespace unijson::json {

auto JsonValue::operator==(const JsonValue& other) const -> bool {
    if (data.index() != other.data.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_number()) {
        return as_number() == other.as_number();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }

    if (is_array()) {
        const auto& arr1 = as_array();
        const auto& arr2 = other.as_array();
        if (arr1.size() != arr2.size()) {
            return false;
        }
        for (size_t i = 0; i < arr1.size(); ++i) {
            if (arr1[i] != arr2[i]) {
                return false;
            }
        }
        return true;
    }

    if (is_object()) {
        return as_object() == other.as_object();
    }

    return false;
}

} // namespace unijson::json
