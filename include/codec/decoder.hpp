//! # Decoder
//!
//! Turns a JSON tree into a `Value`, bottom-up: children of an object node
//! are decoded before the node itself, so a tagged node's content already
//! holds reconstructed objects.
//!
//! ## Class Resolution
//!
//! ```text
//! 1. TypeModules: class name in the declared module
//! 2. Class registry: class name alone
//! 3. Import the declared module through the module loader, then retry 1
//! ```
//!
//! ## Reconstruction
//!
//! Strategies run in order until one produces a value:
//!
//! | Strategy | Applies to | On failure |
//! |----------|------------|------------|
//! | Registered decode function | Exact class or `include_subclasses` ancestor | Error, or warning with fallback on |
//! | Class decode hook | Classes with a hook | Error, or warning with fallback on |
//! | Enum member lookup | `Enum` classes | Error |
//! | Construct then validate | `RootModel` classes | `ValidationFailed` |
//! | Validate, else construct then validate | `Model` classes | `ValidationFailed` |
//! | Keyword constructor | Classes with one | Next strategy |
//! | Default constructor then attribute replacement | Attribute holders | Next strategy |
//!
//! When nothing applies the content mapping is returned with the tag keys
//! removed.

#pragma once

#include "codec/context.hpp"
#include "codec/error.hpp"
#include "common.hpp"
#include "json/json_value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace unijson {

class Decoder {
public:
    explicit Decoder(CodecContext& context) : context_(context) {}

    /// Decodes a JSON tree into a value.
    auto decode(const json::JsonValue& node) -> Result<Value, CodecError>;

private:
    using Causes = std::vector<std::string>;
    using Attempt = Result<std::optional<Value>, CodecError>;
    using Strategy = Attempt (Decoder::*)(const ClassRef&, const Map&, Causes&);

    CodecContext& context_;

    auto decode_object(Map content) -> Result<Value, CodecError>;
    auto resolve_class(const std::string& module, const std::string& name)
        -> Result<ClassRef, CodecError>;
    auto reconstruct(const ClassRef& cls, Map content) -> Result<Value, CodecError>;

    auto try_registered_decoder(const ClassRef& cls, const Map& content, Causes& causes) -> Attempt;
    auto try_decode_hook(const ClassRef& cls, const Map& content, Causes& causes) -> Attempt;
    auto try_enum(const ClassRef& cls, const Map& content, Causes& causes) -> Attempt;
    auto try_root_model(const ClassRef& cls, const Map& content, Causes& causes) -> Attempt;
    auto try_model(const ClassRef& cls, const Map& content, Causes& causes) -> Attempt;
    auto try_constructor(const ClassRef& cls, const Map& content, Causes& causes) -> Attempt;
    auto try_default_construct(const ClassRef& cls, const Map& content, Causes& causes)
        -> Attempt;
};

} // namespace unijson
