//! # Codec API
//!
//! The caller-facing surface: text and stream conversion between `Value`
//! and JSON, and function registration against a context. Every function
//! takes a `CodecContext`, the process-wide default when omitted.
//!
//! ## Example
//!
//! ```cpp
//! auto text = unijson::dumps(Value(make_rc<DateTime>(2024, 1, 15, 14, 30)));
//! // {"datetime": "2024-01-15 14:30:00.000000", "tzinfo": null,
//! //  "__class__": "datetime", "__module__": "datetime"}
//!
//! auto back = unijson::loads(unwrap(text));
//! unwrap(back).as<DateTime>()->time().hour();   // 14
//! ```

#pragma once

#include "codec/context.hpp"
#include "codec/error.hpp"
#include "common.hpp"
#include "json/json_parser.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace unijson {

struct DumpOptions {
    /// Spaces per level; compact output when unset.
    std::optional<int> indent;

    bool sort_keys = false;

    /// Escape non-ASCII characters as `\uXXXX`.
    bool ensure_ascii = true;
};

struct LoadOptions {
    size_t max_depth = json::DEFAULT_MAX_DEPTH;
};

/// Encodes `value` to JSON text.
auto dumps(const Value& value, const DumpOptions& options = {},
           const CodecContext& context = CodecContext::default_context())
    -> Result<std::string, CodecError>;

/// Encodes `value` to `os`.
///
/// # Returns
///
/// The number of bytes written, or an `Io` error if the stream failed.
auto dump(const Value& value, std::ostream& os, const DumpOptions& options = {},
          const CodecContext& context = CodecContext::default_context())
    -> Result<size_t, CodecError>;

/// Decodes JSON text.
auto loads(std::string_view text, const LoadOptions& options = {},
           CodecContext& context = CodecContext::default_context())
    -> Result<Value, CodecError>;

/// Decodes UTF-8 bytes. A leading byte order mark is skipped.
auto loads(std::span<const uint8_t> bytes, const LoadOptions& options = {},
           CodecContext& context = CodecContext::default_context())
    -> Result<Value, CodecError>;

/// Decodes the whole remaining content of `is`.
auto load(std::istream& is, const LoadOptions& options = {},
          CodecContext& context = CodecContext::default_context())
    -> Result<Value, CodecError>;

/// Registers an encoder on `context`. See `CodecContext::register_encoder`.
auto register_encoder(const ClassRef& cls, EncodeFn fn, CodecRegisterOptions options = {},
                      CodecContext& context = CodecContext::default_context())
    -> Result<bool, std::string>;

/// Registers a decoder on `context`. See `CodecContext::register_decoder`.
auto register_decoder(const ClassRef& cls, DecodeFn fn, CodecRegisterOptions options = {},
                      CodecContext& context = CodecContext::default_context())
    -> Result<bool, std::string>;

/// Looks `name` up in the context's class registry.
auto require_class(std::string_view name,
                   const CodecContext& context = CodecContext::default_context())
    -> Result<ClassRef, CodecError>;

} // namespace unijson
