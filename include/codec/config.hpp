//! # Codec Configuration
//!
//! | Field | Environment | Default |
//! |-------|-------------|---------|
//! | `encoder_fallback_enabled` | `UNIJSON_ENCODER_FALLBACK` | `false` |
//! | `decoder_fallback_enabled` | `UNIJSON_DECODER_FALLBACK` | `false` |
//! | `module_search_paths` | `UNIJSON_MODULE_PATH` (`:`-separated) | empty |
//!
//! Flag variables accept `1`, `true` and `on`, case-insensitively.
//! With a fallback flag on, a failing registered function or hook is logged
//! as a warning and the next strategy is tried instead of failing.

#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

namespace unijson {

struct CodecConfig {
    bool encoder_fallback_enabled = false;
    bool decoder_fallback_enabled = false;
    std::vector<std::filesystem::path> module_search_paths;

    /// Reads the configuration from the environment.
    static auto from_env() -> CodecConfig;
};

/// `true` for `1`, `true` and `on` in any case.
[[nodiscard]] auto parse_flag(std::string_view text) -> bool;

} // namespace unijson
