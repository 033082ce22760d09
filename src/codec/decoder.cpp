//! # Decoder Implementation

#include "codec/decoder.hpp"

#include "log/log.hpp"
#include "runtime/enum_value.hpp"
#include "runtime/model.hpp"

#include <exception>

namespace unijson {

namespace {

constexpr const char* CLASS_KEY = "__class__";
constexpr const char* MODULE_KEY = "__module__";

auto call_decoder(const DecodeFn& fn, const Map& content) -> Result<Value, std::string> {
    try {
        return fn(content);
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
}

auto call_hook(const DecodeHookFn& hook, const ClassRef& cls, const Map& content)
    -> Result<Value, std::string> {
    try {
        return hook(cls, content);
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
}

auto call_constructor(const ConstructFn& ctor, const ClassRef& cls, const Map& content)
    -> Result<ObjectRef, std::string> {
    try {
        return ctor(cls, content);
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
}

auto call_default_constructor(const DefaultConstructFn& ctor, const ClassRef& cls)
    -> Result<ObjectRef, std::string> {
    try {
        return ctor(cls);
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
}

auto with_causes(CodecError error, std::vector<std::string> causes) -> CodecError {
    causes.insert(causes.end(), error.causes.begin(), error.causes.end());
    error.causes = std::move(causes);
    return error;
}

} // anonymous namespace

// ============================================================================
// Tree Walk
// ============================================================================

auto Decoder::decode(const json::JsonValue& node) -> Result<Value, CodecError> {
    using namespace json;

    if (node.is_null()) {
        return Value();
    }
    if (node.is_bool()) {
        return Value(node.as_bool());
    }
    if (node.is_number()) {
        const JsonNumber& num = node.as_number();
        if (auto i = num.try_as_i64()) {
            return Value(*i);
        }
        return Value(num.as_f64());
    }
    if (node.is_string()) {
        return Value(node.as_string());
    }
    if (node.is_array()) {
        Array out;
        out.reserve(node.size());
        for (const auto& item : node.as_array()) {
            auto decoded = decode(item);
            if (is_err(decoded)) {
                return decoded;
            }
            out.push_back(std::move(unwrap(decoded)));
        }
        return Value(std::move(out));
    }

    Map content;
    content.reserve(node.size());
    for (const auto& [key, item] : node.as_object()) {
        auto decoded = decode(item);
        if (is_err(decoded)) {
            return decoded;
        }
        content.insert_or_assign(key, std::move(unwrap(decoded)));
    }
    return decode_object(std::move(content));
}

auto Decoder::decode_object(Map content) -> Result<Value, CodecError> {
    auto class_it = content.find(CLASS_KEY);
    auto module_it = content.find(MODULE_KEY);
    bool has_class = class_it != content.end();
    bool has_module = module_it != content.end();

    if (!has_class && !has_module) {
        return Value(std::move(content));
    }
    if (!has_class || !has_module) {
        return CodecError::make(CodecErrorKind::MalformedNode,
                                std::string("Tagged node has ") +
                                    (has_class ? CLASS_KEY : MODULE_KEY) + " but no " +
                                    (has_class ? MODULE_KEY : CLASS_KEY));
    }
    if (!class_it->second.is_string() || !module_it->second.is_string()) {
        return CodecError::make(CodecErrorKind::MalformedNode,
                                std::string("Tag values ") + CLASS_KEY + " and " + MODULE_KEY +
                                    " must be strings");
    }

    std::string class_name = class_it->second.as_string();
    std::string module_name = module_it->second.as_string();
    content.erase(CLASS_KEY);
    content.erase(MODULE_KEY);

    auto cls = resolve_class(module_name, class_name);
    if (is_err(cls)) {
        return unwrap_err(cls);
    }
    return reconstruct(unwrap(cls), std::move(content));
}

auto Decoder::resolve_class(const std::string& module, const std::string& name)
    -> Result<ClassRef, CodecError> {
    if (auto cls = context_.type_modules().find(module, name)) {
        return cls;
    }

    auto registry = context_.registry();
    if (auto cls = registry->get_class(name)) {
        UNIJSON_LOG_DEBUG("decoder", "Found class '" << name << "' in registry");
        return cls;
    }

    UNIJSON_LOG_DEBUG("decoder", "Module '" << module
                                            << "' not found either in imported modules or "
                                               "registry, now importing");
    auto imported = context_.loader().import_module(module, context_.type_modules());
    if (is_err(imported)) {
        std::string msg =
            "Error while trying to import module " + module + ": " + unwrap_err(imported);
        UNIJSON_LOG_DEBUG("decoder", msg);
        return CodecError::make(CodecErrorKind::DecodeImportFailed, msg);
    }
    UNIJSON_LOG_DEBUG("decoder", "Module '" << module << "' imported");

    if (auto cls = context_.type_modules().find(module, name)) {
        return cls;
    }
    return CodecError::make(CodecErrorKind::DecodeImportFailed,
                            "Module '" + module + "' has no class '" + name + "'");
}

// ============================================================================
// Reconstruction
// ============================================================================

auto Decoder::reconstruct(const ClassRef& cls, Map content) -> Result<Value, CodecError> {
    static constexpr Strategy strategies[] = {
        &Decoder::try_registered_decoder, &Decoder::try_decode_hook, &Decoder::try_enum,
        &Decoder::try_root_model,         &Decoder::try_model,       &Decoder::try_constructor,
        &Decoder::try_default_construct,
    };

    Causes causes;
    for (Strategy strategy : strategies) {
        auto attempt = (this->*strategy)(cls, content, causes);
        if (is_err(attempt)) {
            return with_causes(std::move(unwrap_err(attempt)), std::move(causes));
        }
        if (auto& value = unwrap(attempt)) {
            return std::move(*value);
        }
    }

    UNIJSON_LOG_DEBUG("decoder", "No way to rebuild '" << cls->qualified_name()
                                                       << "', returning its content mapping");
    for (const auto& cause : causes) {
        UNIJSON_LOG_DEBUG("decoder", "  " << cause);
    }
    return Value(std::move(content));
}

auto Decoder::try_registered_decoder(const ClassRef& cls, const Map& content, Causes& causes)
    -> Attempt {
    const auto* entry = context_.decoders().resolve(*cls);
    if (!entry) {
        return std::optional<Value>();
    }
    auto decoded = call_decoder(entry->fn, content);
    if (is_ok(decoded)) {
        return std::optional<Value>(std::move(unwrap(decoded)));
    }

    std::string msg = "Could not decode '" + cls->qualified_name() +
                      "' from json because function '" + entry->name +
                      "' failed: " + unwrap_err(decoded);
    if (!context_.config().decoder_fallback_enabled) {
        return CodecError::make(CodecErrorKind::DecodeFunctionFailed, msg);
    }
    UNIJSON_LOG_WARN("decoder", msg << ". Trying the next decoding method.");
    causes.push_back(std::move(msg));
    return std::optional<Value>();
}

auto Decoder::try_decode_hook(const ClassRef& cls, const Map& content, Causes& causes)
    -> Attempt {
    const DecodeHookFn* hook = cls->decode_hook();
    if (!hook) {
        return std::optional<Value>();
    }
    auto decoded = call_hook(*hook, cls, content);
    if (is_ok(decoded)) {
        return std::optional<Value>(std::move(unwrap(decoded)));
    }

    std::string msg = "Could not decode '" + cls->qualified_name() +
                      "' from json because decode hook failed: " + unwrap_err(decoded);
    if (!context_.config().decoder_fallback_enabled) {
        return CodecError::make(CodecErrorKind::DecodeHookFailed, msg);
    }
    UNIJSON_LOG_WARN("decoder", msg << ". Trying the next decoding method.");
    causes.push_back(std::move(msg));
    return std::optional<Value>();
}

auto Decoder::try_enum(const ClassRef& cls, const Map& content, Causes& /*causes*/) -> Attempt {
    if (!cls->is_enum()) {
        return std::optional<Value>();
    }
    auto name_it = content.find("_name_");
    if (name_it == content.end() || !name_it->second.is_string()) {
        return CodecError::make(CodecErrorKind::MalformedNode,
                                "Enum node for '" + cls->qualified_name() + "' has no '_name_'");
    }

    auto member = EnumValue::member(cls, name_it->second.as_string());
    if (is_err(member)) {
        return CodecError::make(CodecErrorKind::ValidationFailed,
                                "Could not decode enum '" + cls->qualified_name() +
                                    "': " + unwrap_err(member));
    }
    auto& found = unwrap(member);
    auto value_it = content.find("_value_");
    if (value_it != content.end() && value_it->second != found->value()) {
        return CodecError::make(CodecErrorKind::ValidationFailed,
                                "Could not decode enum '" + cls->qualified_name() + "': member " +
                                    found->name() + " has value " + found->value().repr() +
                                    ", not " + value_it->second.repr());
    }
    return std::optional<Value>(Value(found));
}

auto Decoder::try_root_model(const ClassRef& cls, const Map& content, Causes& /*causes*/)
    -> Attempt {
    if (!cls->is_root_model()) {
        return std::optional<Value>();
    }
    UNIJSON_LOG_DEBUG("decoder", "Creating root model '" << cls->qualified_name() << "'");
    auto built = Model::construct(cls, content);
    if (is_err(built)) {
        return CodecError::make(CodecErrorKind::ValidationFailed,
                                "Could not decode '" + cls->qualified_name() +
                                    "' root model from json: " + unwrap_err(built).to_string());
    }
    auto& model = unwrap(built);
    auto checked = Model::validate_instance(*model);
    if (is_err(checked)) {
        return CodecError::make(CodecErrorKind::ValidationFailed,
                                "Could not post validate root model '" + cls->qualified_name() +
                                    "': " + unwrap_err(checked).to_string());
    }
    return std::optional<Value>(Value(model));
}

auto Decoder::try_model(const ClassRef& cls, const Map& content, Causes& /*causes*/) -> Attempt {
    if (!cls->is_model()) {
        return std::optional<Value>();
    }
    UNIJSON_LOG_DEBUG("decoder", "Validating model '" << cls->qualified_name() << "'");
    auto validated = Model::validate(cls, Value(content));
    if (is_ok(validated)) {
        return std::optional<Value>(Value(unwrap(validated)));
    }
    UNIJSON_LOG_DEBUG("decoder", "Validation of '" << cls->qualified_name() << "' failed, "
                                                   << "retrying with keyword construction: "
                                                   << unwrap_err(validated).to_string());

    auto built = Model::construct(cls, content);
    if (is_err(built)) {
        return CodecError::make(CodecErrorKind::ValidationFailed,
                                "Could not instantiate model '" + cls->qualified_name() +
                                    "' from json: " + unwrap_err(built).to_string());
    }
    auto& model = unwrap(built);
    auto checked = Model::validate_instance(*model);
    if (is_err(checked)) {
        return CodecError::make(CodecErrorKind::ValidationFailed,
                                "Could not post validate model '" + cls->qualified_name() +
                                    "': " + unwrap_err(checked).to_string());
    }
    return std::optional<Value>(Value(model));
}

auto Decoder::try_constructor(const ClassRef& cls, const Map& content, Causes& causes)
    -> Attempt {
    const ConstructFn* ctor = cls->constructor();
    if (!ctor) {
        return std::optional<Value>();
    }
    auto built = call_constructor(*ctor, cls, content);
    if (is_err(built)) {
        causes.push_back("Constructor of '" + cls->qualified_name() +
                         "' failed: " + unwrap_err(built));
        return std::optional<Value>();
    }
    return std::optional<Value>(Value(unwrap(built)));
}

auto Decoder::try_default_construct(const ClassRef& cls, const Map& content, Causes& causes)
    -> Attempt {
    const DefaultConstructFn* ctor = cls->default_constructor();
    if (!ctor) {
        return std::optional<Value>();
    }
    auto built = call_default_constructor(*ctor, cls);
    if (is_err(built)) {
        causes.push_back("Default constructor of '" + cls->qualified_name() +
                         "' failed: " + unwrap_err(built));
        return std::optional<Value>();
    }
    ObjectRef object = unwrap(built);
    auto* holder = dynamic_cast<AttributeHolder*>(object.get());
    if (!holder) {
        causes.push_back("Instances of '" + cls->qualified_name() + "' have no attributes to set");
        return std::optional<Value>();
    }
    auto replaced = holder->replace_attributes(content);
    if (is_err(replaced)) {
        causes.push_back("Could not set attributes of '" + cls->qualified_name() +
                         "': " + unwrap_err(replaced));
        return std::optional<Value>();
    }
    return std::optional<Value>(Value(std::move(object)));
}

} // namespace unijson
