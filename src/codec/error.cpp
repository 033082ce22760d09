#include "codec/error.hpp"

namespace unijson {

auto kind_name(CodecErrorKind kind) -> const char* {
    switch (kind) {
    case CodecErrorKind::NotSerializable:
        return "NotSerializable";
    case CodecErrorKind::CircularReference:
        return "CircularReference";
    case CodecErrorKind::EncodeFunctionFailed:
        return "EncodeFunctionFailed";
    case CodecErrorKind::EncodeHookFailed:
        return "EncodeHookFailed";
    case CodecErrorKind::DecodeImportFailed:
        return "DecodeImportFailed";
    case CodecErrorKind::DecodeFunctionFailed:
        return "DecodeFunctionFailed";
    case CodecErrorKind::DecodeHookFailed:
        return "DecodeHookFailed";
    case CodecErrorKind::ValidationFailed:
        return "ValidationFailed";
    case CodecErrorKind::RegistryNotFound:
        return "RegistryNotFound";
    case CodecErrorKind::RegistryInheritanceMismatch:
        return "RegistryInheritanceMismatch";
    case CodecErrorKind::MalformedNode:
        return "MalformedNode";
    case CodecErrorKind::Syntax:
        return "Syntax";
    case CodecErrorKind::Io:
        return "Io";
    }
    return "Unknown";
}

auto CodecError::from(const RegistryError& error) -> CodecError {
    auto kind = error.kind == RegistryError::Kind::NotFound
                    ? CodecErrorKind::RegistryNotFound
                    : CodecErrorKind::RegistryInheritanceMismatch;
    return make(kind, error.message);
}

auto CodecError::to_string() const -> std::string {
    std::string out = std::string(kind_name(kind)) + ": " + message;
    for (const auto& cause : causes) {
        out += "\n  caused by: " + cause;
    }
    return out;
}

} // namespace unijson
