//! # unijson
//!
//! Universal type-tagged JSON codec. Objects are written as JSON objects
//! carrying `__class__` and `__module__`, and rebuilt from them.
//!
//! ## Layers
//!
//! | Layer | Headers |
//! |-------|---------|
//! | JSON text | `json/json.hpp` |
//! | Runtime types | `runtime/value.hpp`, `runtime/class.hpp`, `runtime/model.hpp`, `runtime/calendar.hpp` |
//! | Type modules | `runtime/type_modules.hpp`, `runtime/module_loader.hpp` |
//! | Registry | `registry/class_registry.hpp`, `registry/manager.hpp`, `registry/discovery.hpp` |
//! | Codec | `codec/encoder.hpp`, `codec/decoder.hpp`, `codec/api.hpp` |
//! | Logging | `log/log.hpp` |

#pragma once

#include "codec/api.hpp"
#include "codec/builtin_codecs.hpp"
#include "codec/config.hpp"
#include "codec/context.hpp"
#include "codec/decoder.hpp"
#include "codec/encoder.hpp"
#include "codec/error.hpp"
#include "common.hpp"
#include "json/json.hpp"
#include "log/log.hpp"
#include "registry/class_registry.hpp"
#include "registry/discovery.hpp"
#include "registry/manager.hpp"
#include "runtime/calendar.hpp"
#include "runtime/class.hpp"
#include "runtime/enum_value.hpp"
#include "runtime/model.hpp"
#include "runtime/module_loader.hpp"
#include "runtime/object.hpp"
#include "runtime/type_modules.hpp"
#include "runtime/value.hpp"
