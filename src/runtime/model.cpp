//! # Structured Record Implementation
//!
//! Strict validation, lax construction and `ValidationError` formatting.
//!
//! ## Error Types
//!
//! | Type | Message |
//! |------|---------|
//! | `missing` | Field required |
//! | `bool_type` | Input should be a valid boolean |
//! | `int_type` | Input should be a valid integer |
//! | `float_type` | Input should be a valid number |
//! | `string_type` | Input should be a valid string |
//! | `list_type` | Input should be a valid list |
//! | `dict_type` | Input should be a valid dictionary |
//! | `model_type` | Input should be a valid dictionary or instance of X |
//! | `is_instance_of` | Input should be an instance of X |
//! | `enum` | Input should be 'a', 'b' or 'c' |
//! | `greater_than` etc. | Input should be greater than N |
//! | `string_too_short` / `too_short` | String should have at least N characters |
//! | `value_error` | Value error, ... |

#include "runtime/model.hpp"

#include "runtime/enum_value.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace unijson {

namespace {

auto join_loc(const std::vector<std::string>& loc) -> std::string {
    std::string out;
    for (size_t i = 0; i < loc.size(); ++i) {
        if (i > 0) {
            out += '.';
        }
        out += loc[i];
    }
    return out;
}

auto plural(size_t n, const char* word) -> std::string {
    return std::to_string(n) + " " + word + (n == 1 ? "" : "s");
}

/// Bounds print as integers when they are whole numbers.
auto format_bound(double bound) -> std::string {
    if (std::trunc(bound) == bound && std::fabs(bound) < 1e15) {
        return std::to_string(static_cast<int64_t>(bound));
    }
    return Value(bound).repr();
}

/// Length in code points for strings, elements for arrays and maps.
auto length_of(const Value& value) -> std::optional<size_t> {
    if (value.is_string()) {
        size_t n = 0;
        for (char c : value.as_string()) {
            if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
                ++n;
            }
        }
        return n;
    }
    if (value.is_array() || value.is_map()) {
        return value.size();
    }
    return std::nullopt;
}

auto find_field(const ModelSchema& schema, std::string_view name) -> const FieldSpec* {
    for (const auto& spec : schema) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

class StrictValidator {
public:
    explicit StrictValidator(std::vector<ValidationIssue>& issues) : issues_(issues) {}

    auto fields(const ModelSchema& schema, const Map& input) -> Map {
        Map out;
        for (const auto& spec : schema) {
            loc_.push_back(spec.name);
            auto it = input.find(spec.name);
            if (it == input.end()) {
                if (spec.default_value) {
                    out.insert_or_assign(spec.name, *spec.default_value);
                } else {
                    fail("Field required", "missing", Value(input));
                }
            } else if (auto v = field(spec.type, &spec.constraints, it->second)) {
                out.insert_or_assign(spec.name, std::move(*v));
            }
            loc_.pop_back();
        }
        return out;
    }

    auto field(const FieldType& type, const FieldConstraints* constraints, const Value& input)
        -> std::optional<Value> {
        auto value = check_type(type, constraints, input);
        if (value && constraints && !value->is_null() &&
            type.kind() != FieldType::Kind::Optional) {
            if (!check_constraints(*constraints, *value)) {
                return std::nullopt;
            }
        }
        return value;
    }

    void push(std::string segment) {
        loc_.push_back(std::move(segment));
    }

    void pop() {
        loc_.pop_back();
    }

private:
    std::vector<ValidationIssue>& issues_;
    std::vector<std::string> loc_;

    void fail(std::string msg, std::string type, const Value& input) {
        issues_.push_back(ValidationIssue{loc_, std::move(msg), std::move(type), input.repr()});
    }

    auto check_type(const FieldType& type, const FieldConstraints* constraints, const Value& input)
        -> std::optional<Value> {
        using Kind = FieldType::Kind;
        switch (type.kind()) {
        case Kind::Any:
            return input;

        case Kind::Boolean:
            if (input.is_bool()) {
                return input;
            }
            fail("Input should be a valid boolean", "bool_type", input);
            return std::nullopt;

        case Kind::Integer:
            if (input.is_int()) {
                return input;
            }
            fail("Input should be a valid integer", "int_type", input);
            return std::nullopt;

        case Kind::Number:
            if (input.is_number()) {
                return Value(input.as_float());
            }
            fail("Input should be a valid number", "float_type", input);
            return std::nullopt;

        case Kind::String:
            if (input.is_string()) {
                return input;
            }
            fail("Input should be a valid string", "string_type", input);
            return std::nullopt;

        case Kind::InstanceOf:
            return instance(type.cls(), input);

        case Kind::EnumOf:
            return enum_member(type.cls(), input);

        case Kind::ListOf: {
            if (!input.is_array()) {
                fail("Input should be a valid list", "list_type", input);
                return std::nullopt;
            }
            Array out;
            bool ok = true;
            const auto& items = input.as_array();
            for (size_t i = 0; i < items.size(); ++i) {
                push(std::to_string(i));
                if (auto v = field(type.item(), nullptr, items[i])) {
                    out.push_back(std::move(*v));
                } else {
                    ok = false;
                }
                pop();
            }
            return ok ? std::optional<Value>(Value(std::move(out))) : std::nullopt;
        }

        case Kind::MapOf: {
            if (!input.is_map()) {
                fail("Input should be a valid dictionary", "dict_type", input);
                return std::nullopt;
            }
            Map out;
            bool ok = true;
            for (const auto& [key, item] : input.as_map()) {
                push(key);
                if (auto v = field(type.item(), nullptr, item)) {
                    out.insert_or_assign(key, std::move(*v));
                } else {
                    ok = false;
                }
                pop();
            }
            return ok ? std::optional<Value>(Value(std::move(out))) : std::nullopt;
        }

        case Kind::Optional:
            if (input.is_null()) {
                return input;
            }
            return field(type.item(), constraints, input);
        }
        return std::nullopt;
    }

    auto instance(const ClassRef& cls, const Value& input) -> std::optional<Value> {
        if (input.is_object() && input.as_object()->klass()->is_subclass_of(*cls)) {
            return input;
        }
        if (cls->is_model() && (input.is_map() || cls->is_root_model())) {
            auto nested = Model::validate(cls, input);
            if (is_ok(nested)) {
                return Value(unwrap(nested));
            }
            for (auto issue : unwrap_err(nested).issues) {
                issue.loc.insert(issue.loc.begin(), loc_.begin(), loc_.end());
                issues_.push_back(std::move(issue));
            }
            return std::nullopt;
        }
        if (cls->is_model()) {
            fail("Input should be a valid dictionary or instance of " + cls->name(), "model_type",
                 input);
        } else {
            fail("Input should be an instance of " + cls->name(), "is_instance_of", input);
        }
        return std::nullopt;
    }

    auto enum_member(const ClassRef& cls, const Value& input) -> std::optional<Value> {
        if (input.is_object() && input.as_object()->klass()->is_subclass_of(*cls) &&
            input.as<EnumValue>()) {
            return input;
        }
        auto member = EnumValue::from_value(cls, input);
        if (is_ok(member)) {
            return Value(unwrap(member));
        }

        const auto& members = cls->enum_members();
        std::string expected;
        for (size_t i = 0; i < members.size(); ++i) {
            if (i > 0) {
                expected += (i + 1 == members.size()) ? " or " : ", ";
            }
            expected += members[i].value.repr();
        }
        fail("Input should be " + expected, "enum", input);
        return std::nullopt;
    }

    auto check_constraints(const FieldConstraints& c, const Value& value) -> bool {
        bool ok = true;
        if (value.is_number()) {
            double d = value.as_float();
            if (c.gt && !(d > *c.gt)) {
                fail("Input should be greater than " + format_bound(*c.gt), "greater_than", value);
                ok = false;
            }
            if (c.ge && !(d >= *c.ge)) {
                fail("Input should be greater than or equal to " + format_bound(*c.ge),
                     "greater_than_equal", value);
                ok = false;
            }
            if (c.lt && !(d < *c.lt)) {
                fail("Input should be less than " + format_bound(*c.lt), "less_than", value);
                ok = false;
            }
            if (c.le && !(d <= *c.le)) {
                fail("Input should be less than or equal to " + format_bound(*c.le),
                     "less_than_equal", value);
                ok = false;
            }
        }

        if (auto len = length_of(value)) {
            bool is_str = value.is_string();
            const char* subject = is_str ? "String" : value.is_map() ? "Dictionary" : "List";
            const char* unit = is_str ? "character" : "item";
            std::string suffix = is_str ? "" : " after validation, not " + std::to_string(*len);
            if (c.min_length && *len < *c.min_length) {
                fail(std::string(subject) + " should have at least " + plural(*c.min_length, unit) +
                         suffix,
                     is_str ? "string_too_short" : "too_short", value);
                ok = false;
            }
            if (c.max_length && *len > *c.max_length) {
                fail(std::string(subject) + " should have at most " + plural(*c.max_length, unit) +
                         suffix,
                     is_str ? "string_too_long" : "too_long", value);
                ok = false;
            }
        }

        if (ok && c.check) {
            if (auto msg = c.check(value)) {
                fail("Value error, " + *msg, "value_error", value);
                ok = false;
            }
        }
        return ok;
    }
};

// ============================================================================
// Lax coercion
// ============================================================================

auto parse_int(const std::string& s) -> std::optional<int64_t> {
    int64_t out = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return out;
}

auto parse_float(const std::string& s) -> std::optional<double> {
    if (s.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    double out = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size()) {
        return std::nullopt;
    }
    return out;
}

auto coerce(const FieldType& type, const Value& input) -> Value {
    using Kind = FieldType::Kind;
    switch (type.kind()) {
    case Kind::Integer:
        if (input.is_string()) {
            if (auto i = parse_int(input.as_string())) {
                return Value(*i);
            }
        } else if (input.is_float()) {
            double d = input.as_float();
            if (std::trunc(d) == d && std::fabs(d) < 9.2e18) {
                return Value(static_cast<int64_t>(d));
            }
        }
        return input;

    case Kind::Number:
        if (input.is_int()) {
            return Value(input.as_float());
        }
        if (input.is_string()) {
            if (auto d = parse_float(input.as_string())) {
                return Value(*d);
            }
        }
        return input;

    case Kind::Boolean:
        if (input.is_string()) {
            const auto& s = input.as_string();
            if (s == "true" || s == "True") {
                return Value(true);
            }
            if (s == "false" || s == "False") {
                return Value(false);
            }
        } else if (input.is_int() && (input.as_int() == 0 || input.as_int() == 1)) {
            return Value(input.as_int() == 1);
        }
        return input;

    case Kind::InstanceOf: {
        const auto& cls = type.cls();
        if (input.is_object() || !cls->is_model()) {
            return input;
        }
        if (cls->is_root_model()) {
            auto built = Model::construct(cls, Map{{"root", input}});
            return is_ok(built) ? Value(unwrap(built)) : input;
        }
        if (input.is_map()) {
            auto built = Model::construct(cls, input.as_map());
            return is_ok(built) ? Value(unwrap(built)) : input;
        }
        return input;
    }

    case Kind::EnumOf:
        if (!input.is_object()) {
            auto member = EnumValue::from_value(type.cls(), input);
            if (is_ok(member)) {
                return Value(unwrap(member));
            }
        }
        return input;

    case Kind::ListOf:
        if (input.is_array()) {
            Array out;
            out.reserve(input.size());
            for (const auto& item : input.as_array()) {
                out.push_back(coerce(type.item(), item));
            }
            return Value(std::move(out));
        }
        return input;

    case Kind::MapOf:
        if (input.is_map()) {
            Map out;
            for (const auto& [key, item] : input.as_map()) {
                out.insert_or_assign(key, coerce(type.item(), item));
            }
            return Value(std::move(out));
        }
        return input;

    case Kind::Optional:
        return input.is_null() ? input : coerce(type.item(), input);

    case Kind::Any:
    case Kind::String:
        return input;
    }
    return input;
}

auto not_a_model(const ClassRef& cls, const Value& input) -> ValidationError {
    return ValidationError{
        cls->name(),
        {ValidationIssue{{}, "Class " + cls->name() + " is not a model", "model_class", input.repr()}}};
}

} // anonymous namespace

// ============================================================================
// ValidationError
// ============================================================================

auto ValidationError::to_string() const -> std::string {
    std::string out = std::to_string(issues.size()) + " validation error" +
                      (issues.size() == 1 ? "" : "s") + " for " + title;
    for (const auto& issue : issues) {
        if (!issue.loc.empty()) {
            out += "\n" + join_loc(issue.loc);
        }
        out += "\n  " + issue.msg + " [type=" + issue.type + ", input_value=" + issue.input + "]";
    }
    return out;
}

// ============================================================================
// Model
// ============================================================================

Model::Model(ClassRef cls, Map fields) : cls_(std::move(cls)), fields_(std::move(fields)) {}

auto Model::get(std::string_view name) const -> const Value* {
    auto it = fields_.find(name);
    return it == fields_.end() ? nullptr : &it->second;
}

auto Model::equals(const Object& other) const -> bool {
    auto* rhs = dynamic_cast<const Model*>(&other);
    return rhs && rhs->cls_ == cls_ && rhs->fields_ == fields_;
}

auto Model::repr() const -> std::string {
    std::string out = cls_->name() + "(";
    bool first = true;
    for (const auto& [key, value] : fields_) {
        if (!first) {
            out += ", ";
        }
        first = false;
        out += key + "=" + value.repr();
    }
    return out + ")";
}

auto Model::validate(const ClassRef& cls, const Value& input) -> Result<Rc<Model>, ValidationError> {
    if (!cls->is_model()) {
        return not_a_model(cls, input);
    }

    if (input.is_object() && input.as_object()->klass()->is_subclass_of(*cls)) {
        if (auto model = input.as<Model>()) {
            return model;
        }
    }

    ValidationError error{cls->name(), {}};
    StrictValidator validator(error.issues);
    auto schema = cls->schema();

    if (cls->is_root_model()) {
        const FieldSpec* root = find_field(schema, "root");
        FieldType any;
        auto value = validator.field(root ? root->type : any, root ? &root->constraints : nullptr,
                                     input);
        if (!value) {
            return error;
        }
        return make_rc<Model>(cls, Map{{"root", std::move(*value)}});
    }

    if (!input.is_map()) {
        error.issues.push_back(ValidationIssue{
            {}, "Input should be a valid dictionary or instance of " + cls->name(), "model_type",
            input.repr()});
        return error;
    }

    Map fields = validator.fields(schema, input.as_map());
    if (!error.issues.empty()) {
        return error;
    }
    return make_rc<Model>(cls, std::move(fields));
}

auto Model::construct(const ClassRef& cls, const Map& kwargs) -> Result<Rc<Model>, ValidationError> {
    if (!cls->is_model()) {
        return not_a_model(cls, Value(kwargs));
    }

    Map fields;
    for (const auto& spec : cls->schema()) {
        auto it = kwargs.find(spec.name);
        if (it != kwargs.end()) {
            fields.insert_or_assign(spec.name, coerce(spec.type, it->second));
        } else if (spec.default_value) {
            fields.insert_or_assign(spec.name, *spec.default_value);
        }
    }
    return make_rc<Model>(cls, std::move(fields));
}

auto Model::validate_instance(const Model& instance) -> Result<bool, ValidationError> {
    const auto& cls = instance.klass();
    ValidationError error{cls->name(), {}};
    StrictValidator validator(error.issues);
    validator.fields(cls->schema(), instance.fields());
    if (!error.issues.empty()) {
        return error;
    }
    return true;
}

} // namespace unijson
