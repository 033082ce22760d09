//! # Codec Errors
//!
//! `CodecError` is the single error type of the encoder, the decoder and
//! the `dumps`/`loads` surface. Failures further down an ordered chain of
//! strategies are attached as `causes`.
//!
//! ## Error Kinds
//!
//! | Kind | Raised when |
//! |------|-------------|
//! | `NotSerializable` | No encoding strategy applies to an object |
//! | `CircularReference` | An array, map or object contains itself |
//! | `EncodeFunctionFailed` | A registered encoder failed |
//! | `EncodeHookFailed` | `json_encode()` failed |
//! | `DecodeImportFailed` | The declared module could not be imported or lacks the class |
//! | `DecodeFunctionFailed` | A registered decoder failed |
//! | `DecodeHookFailed` | A class decode hook failed |
//! | `ValidationFailed` | A model rejected its content |
//! | `RegistryNotFound` | A required registry lookup missed |
//! | `RegistryInheritanceMismatch` | A registry class had the wrong kind |
//! | `MalformedNode` | A tagged node broke the tag rules |
//! | `Syntax` | The input text is not JSON |
//! | `Io` | Reading or writing a stream failed |

#pragma once

#include "common.hpp"
#include "registry/class_registry.hpp"

#include <string>
#include <vector>

namespace unijson {

enum class CodecErrorKind : uint8_t {
    NotSerializable,
    CircularReference,
    EncodeFunctionFailed,
    EncodeHookFailed,
    DecodeImportFailed,
    DecodeFunctionFailed,
    DecodeHookFailed,
    ValidationFailed,
    RegistryNotFound,
    RegistryInheritanceMismatch,
    MalformedNode,
    Syntax,
    Io
};

/// Stable name of an error kind, e.g. `"ValidationFailed"`.
[[nodiscard]] auto kind_name(CodecErrorKind kind) -> const char*;

struct CodecError {
    CodecErrorKind kind;
    std::string message;
    std::vector<std::string> causes;

    static auto make(CodecErrorKind kind, std::string message) -> CodecError {
        return CodecError{kind, std::move(message), {}};
    }

    static auto from(const RegistryError& error) -> CodecError;

    /// `Kind: message`, followed by one indented line per cause.
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace unijson
