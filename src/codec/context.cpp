#include "codec/context.hpp"

#include "codec/builtin_codecs.hpp"
#include "log/log.hpp"
#include "registry/manager.hpp"

namespace unijson {

CodecContext::CodecContext(CodecConfig config)
    : config_(std::move(config)), type_modules_(make_rc<TypeModules>()),
      loader_(make_box<SharedLibraryLoader>(config_.module_search_paths)) {}

CodecContext::CodecContext(CodecConfig config, Box<ModuleLoader> loader)
    : config_(std::move(config)), type_modules_(make_rc<TypeModules>()),
      loader_(std::move(loader)) {}

auto CodecContext::default_context() -> CodecContext& {
    static CodecContext context(CodecConfig::from_env());
    static const bool builtins_registered = [] {
        auto registered = register_builtin_codecs(context);
        if (is_err(registered)) {
            UNIJSON_LOG_ERROR("encoder", "Failed to register built-in codecs: "
                                             << unwrap_err(registered));
            return false;
        }
        return true;
    }();
    (void)builtins_registered;
    return context;
}

auto CodecContext::registry() const -> Rc<ClassRegistry> {
    if (registry_) {
        return registry_;
    }
    return RegistryManager::get_class_registry();
}

auto CodecContext::register_encoder(const ClassRef& cls, EncodeFn fn, CodecRegisterOptions options)
    -> Result<bool, std::string> {
    if (!cls) {
        return std::string("Expected a class, got a null class reference");
    }
    if (!fn) {
        return std::string("Expected a function, got an empty one for type '" +
                           cls->qualified_name() + "'");
    }
    bool stored = encoders_.add(cls, std::move(fn), options);
    if (!stored) {
        UNIJSON_LOG_DEBUG("encoder", "Keeping existing encoder for type '" << cls->qualified_name()
                                                                           << "'");
    }
    return stored;
}

auto CodecContext::register_decoder(const ClassRef& cls, DecodeFn fn, CodecRegisterOptions options)
    -> Result<bool, std::string> {
    if (!cls) {
        return std::string("Expected a class, got a null class reference");
    }
    if (!fn) {
        return std::string("Expected a function, got an empty one for type '" +
                           cls->qualified_name() + "'");
    }
    bool stored = decoders_.add(cls, std::move(fn), options);
    if (!stored) {
        UNIJSON_LOG_DEBUG("decoder", "Keeping existing decoder for type '" << cls->qualified_name()
                                                                           << "'");
    }
    return stored;
}

auto CodecContext::get_encoder(const ClassRef& cls) const -> const EncodeFn* {
    const auto* entry = encoders_.find_exact(*cls);
    return entry ? &entry->fn : nullptr;
}

auto CodecContext::get_decoder(const ClassRef& cls) const -> const DecodeFn* {
    const auto* entry = decoders_.find_exact(*cls);
    return entry ? &entry->fn : nullptr;
}

} // namespace unijson
