//! # Encoder Implementation

#include "codec/encoder.hpp"

#include "log/log.hpp"
#include "runtime/class.hpp"

#include <algorithm>
#include <exception>

namespace unijson {

namespace {

constexpr const char* CLASS_KEY = "__class__";
constexpr const char* MODULE_KEY = "__module__";

auto call_encoder(const EncodeFn& fn, const Object& object) -> Result<Map, std::string> {
    try {
        return fn(object);
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
}

auto call_hook(const JsonEncodable& encodable) -> Result<Map, std::string> {
    try {
        return encodable.json_encode();
    } catch (const std::exception& e) {
        return std::string(e.what());
    }
}

} // anonymous namespace

auto Encoder::encode(const Value& value) -> Result<json::JsonValue, CodecError> {
    using namespace json;

    if (value.is_null()) {
        return JsonValue();
    }
    if (value.is_bool()) {
        return JsonValue(value.as_bool());
    }
    if (value.is_int()) {
        return JsonValue(value.as_int());
    }
    if (value.is_float()) {
        return JsonValue(value.as_float());
    }
    if (value.is_string()) {
        return JsonValue(value.as_string());
    }
    if (value.is_array()) {
        JsonArray out;
        out.reserve(value.as_array().size());
        for (const auto& item : value.as_array()) {
            auto encoded = encode(item);
            if (is_err(encoded)) {
                return encoded;
            }
            out.push_back(std::move(unwrap(encoded)));
        }
        return JsonValue(std::move(out));
    }
    if (value.is_map()) {
        JsonObject out;
        out.reserve(value.as_map().size());
        for (const auto& [key, item] : value.as_map()) {
            auto encoded = encode(item);
            if (is_err(encoded)) {
                return encoded;
            }
            out.insert_or_assign(key, std::move(unwrap(encoded)));
        }
        return JsonValue(std::move(out));
    }
    return encode_object(*value.as_object());
}

auto Encoder::encode_object(const Object& object) -> Result<json::JsonValue, CodecError> {
    const Class& cls = *object.klass();
    if (std::find(visiting_.begin(), visiting_.end(), &object) != visiting_.end()) {
        return CodecError::make(CodecErrorKind::CircularReference,
                                "Circular reference detected while encoding type '" +
                                    cls.qualified_name() + "'");
    }

    visiting_.push_back(&object);
    auto content = object_content(object);
    Result<json::JsonValue, CodecError> result =
        is_ok(content) ? tag_content(std::move(unwrap(content)), cls)
                       : Result<json::JsonValue, CodecError>(std::move(unwrap_err(content)));
    visiting_.pop_back();
    return result;
}

auto Encoder::object_content(const Object& object) -> Result<Map, CodecError> {
    const Class& cls = *object.klass();
    bool fallback = context_.config().encoder_fallback_enabled;
    std::vector<std::string> causes;

    // 1. Registered function
    if (const auto* entry = context_.encoders().resolve(cls)) {
        auto content = call_encoder(entry->fn, object);
        if (is_ok(content)) {
            return std::move(unwrap(content));
        }
        std::string msg = "Encoding function " + entry->name + " used for type '" +
                          cls.qualified_name() + "' raised an exception: " + unwrap_err(content);
        if (!fallback) {
            return CodecError::make(CodecErrorKind::EncodeFunctionFailed, msg);
        }
        UNIJSON_LOG_WARN("encoder", msg << ". Trying the next encoding method.");
        causes.push_back(std::move(msg));
    }

    // 2. Self-encoding hook
    if (const auto* encodable = dynamic_cast<const JsonEncodable*>(&object)) {
        auto content = call_hook(*encodable);
        if (is_ok(content)) {
            return std::move(unwrap(content));
        }
        std::string msg = "Method json_encode() used for type '" + cls.qualified_name() +
                          "' raised an exception: " + unwrap_err(content);
        if (!fallback) {
            auto error = CodecError::make(CodecErrorKind::EncodeHookFailed, msg);
            error.causes = std::move(causes);
            return error;
        }
        UNIJSON_LOG_WARN("encoder", msg << ". Trying the next encoding method.");
        causes.push_back(std::move(msg));
    }

    // 3. Attribute dump
    if (const auto* holder = dynamic_cast<const AttributeHolder*>(&object)) {
        return holder->attributes();
    }

    auto error = CodecError::make(CodecErrorKind::NotSerializable,
                                  "Type '" + cls.qualified_name() + "' is not JSON serializable");
    error.causes = std::move(causes);
    return error;
}

auto Encoder::tag_content(Map content, const Class& cls) -> Result<json::JsonValue, CodecError> {
    bool has_class = content.contains(CLASS_KEY);
    bool has_module = content.contains(MODULE_KEY);
    if (has_class != has_module) {
        return CodecError::make(CodecErrorKind::MalformedNode,
                                "Content encoded for type '" + cls.qualified_name() +
                                    "' carries only one of " + CLASS_KEY + " and " + MODULE_KEY);
    }

    json::JsonObject node;
    node.reserve(content.size() + 2);
    for (const auto& [key, item] : content) {
        auto encoded = encode(item);
        if (is_err(encoded)) {
            return encoded;
        }
        node.insert_or_assign(key, std::move(unwrap(encoded)));
    }
    if (!has_class) {
        node.insert_or_assign(CLASS_KEY, json::JsonValue(cls.name()));
        node.insert_or_assign(MODULE_KEY, json::JsonValue(cls.module()));
    }
    return json::JsonValue(std::move(node));
}

} // namespace unijson
