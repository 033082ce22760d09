//! # Built-in Codecs
//!
//! Encoders and decoders for the calendar types:
//!
//! | Class | Content | Decoded by |
//! |-------|---------|------------|
//! | `date` | `{"date": "2024-01-15"}` | decoder |
//! | `time` | `{"time": "14:30:00.000000", "tzinfo": ZoneInfo or null}` | decoder |
//! | `datetime` | `{"datetime": "2024-01-15 14:30:45.123456", "tzinfo": "Europe/Paris" or null}` | decoder |
//! | `timedelta` | `{"seconds": 3600.0}` | keyword constructor |
//! | `ZoneInfo` | `{"zone": "Europe/Paris"}` | keyword constructor |
//!
//! A `datetime` whose zone name is not known on this system decodes as a
//! naive value.

#pragma once

#include "codec/context.hpp"
#include "common.hpp"

#include <string>

namespace unijson {

/// Adds the calendar classes to the context's type modules and registers
/// their codec functions.
auto register_builtin_codecs(CodecContext& context) -> Result<bool, std::string>;

auto json_encode_date(const Object& object) -> Result<Map, std::string>;
auto json_decode_date(const Map& content) -> Result<Value, std::string>;

auto json_encode_time(const Object& object) -> Result<Map, std::string>;
auto json_decode_time(const Map& content) -> Result<Value, std::string>;

auto json_encode_datetime(const Object& object) -> Result<Map, std::string>;
auto json_decode_datetime(const Map& content) -> Result<Value, std::string>;

auto json_encode_timedelta(const Object& object) -> Result<Map, std::string>;

auto json_encode_zoneinfo(const Object& object) -> Result<Map, std::string>;

} // namespace unijson
