//! # unijson JSON Layer
//!
//! Public header for the JSON text layer underneath the codec: an ordered
//! value tree, a parser and a configurable writer. The codec builds tagged
//! `JsonValue` trees on encode and walks parsed ones on decode.
//!
//! ## Modules
//!
//! | Header | Description |
//! |--------|-------------|
//! | `json_error.hpp` | Error type with location information |
//! | `json_value.hpp` | Core JSON types (`JsonValue`, `JsonNumber`, `WriteOptions`) |
//! | `json_parser.hpp` | Lexer and parser for JSON input |
//!
//! ## Error Handling
//!
//! All fallible operations return `Result<T, E>`:
//!
//! ```cpp
//! auto result = parse_json(input);
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result).to_string() << std::endl;
//! }
//! ```

#pragma once

#include "json/json_error.hpp"
#include "json/json_parser.hpp"
#include "json/json_value.hpp"
