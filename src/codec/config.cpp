#include "codec/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace unijson {

namespace {

auto env_flag(const char* name) -> bool {
    const char* value = std::getenv(name);
    return value && parse_flag(value);
}

} // anonymous namespace

auto parse_flag(std::string_view text) -> bool {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower == "1" || lower == "true" || lower == "on";
}

auto CodecConfig::from_env() -> CodecConfig {
    CodecConfig config;
    config.encoder_fallback_enabled = env_flag("UNIJSON_ENCODER_FALLBACK");
    config.decoder_fallback_enabled = env_flag("UNIJSON_DECODER_FALLBACK");

    if (const char* env = std::getenv("UNIJSON_MODULE_PATH"); env && *env) {
        std::string_view spec(env);
        size_t pos = 0;
        while (pos <= spec.size()) {
            size_t colon = spec.find(':', pos);
            if (colon == std::string_view::npos) {
                colon = spec.size();
            }
            auto entry = spec.substr(pos, colon - pos);
            if (!entry.empty()) {
                config.module_search_paths.emplace_back(entry);
            }
            pos = colon + 1;
        }
    }
    return config;
}

} // namespace unijson
