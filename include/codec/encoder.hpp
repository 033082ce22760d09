//! # Encoder
//!
//! Turns a `Value` into a JSON tree. JSON-native values map one to one.
//! Every object becomes a tagged node: its content mapping followed by
//! `__class__` and `__module__`.
//!
//! ## Content Resolution
//!
//! ```text
//! 1. Registered encode function (exact class, else nearest ancestor
//!    registered with include_subclasses)
//! 2. JsonEncodable::json_encode()
//! 3. AttributeHolder::attributes()
//! 4. NotSerializable
//! ```
//!
//! A failing step 1 or 2 is an error unless the encoder fallback flag is
//! on, in which case a warning is logged on the `encoder` channel and the
//! next step is tried.
//!
//! Content that already carries both tag keys keeps them: a function may
//! declare a different wire type for the object it encodes.

#pragma once

#include "codec/context.hpp"
#include "codec/error.hpp"
#include "common.hpp"
#include "json/json_value.hpp"

#include <vector>

namespace unijson {

class Encoder {
public:
    explicit Encoder(const CodecContext& context) : context_(context) {}

    /// Encodes `value` into a JSON tree.
    auto encode(const Value& value) -> Result<json::JsonValue, CodecError>;

private:
    const CodecContext& context_;
    std::vector<const Object*> visiting_;

    auto encode_object(const Object& object) -> Result<json::JsonValue, CodecError>;
    auto object_content(const Object& object) -> Result<Map, CodecError>;
    auto tag_content(Map content, const Class& cls) -> Result<json::JsonValue, CodecError>;
};

} // namespace unijson
