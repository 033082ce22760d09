//! # Codec Context
//!
//! The state an encoder or decoder runs against:
//!
//! | Member | Role |
//! |--------|------|
//! | Encoder table | Registered encode functions, keyed by class |
//! | Decoder table | Registered decode functions, keyed by class |
//! | `TypeModules` | Loaded type modules, searched first when decoding |
//! | `ModuleLoader` | Imports modules the table does not have yet |
//! | `ClassRegistry` | Name-keyed fallback; the manager's registry when unset |
//! | `CodecConfig` | Fallback flags and module search paths |
//!
//! `CodecContext::default_context()` is the process-wide context used by
//! the `dumps`/`loads` surface when none is passed. It carries the built-in
//! calendar codecs and reads its configuration from the environment.
//!
//! Tables do not lock: register from one thread, or synchronize.
//!
//! ## Function Matching
//!
//! A function registered for class `C` applies to instances of `C`. With
//! `include_subclasses`, it also applies to instances of classes deriving
//! from `C` that have no closer registration: the nearest registered
//! ancestor wins.

#pragma once

#include "codec/config.hpp"
#include "common.hpp"
#include "registry/class_registry.hpp"
#include "runtime/class.hpp"
#include "runtime/module_loader.hpp"
#include "runtime/object.hpp"
#include "runtime/type_modules.hpp"

#include <functional>
#include <string>
#include <unordered_map>

namespace unijson {

/// Produces the content mapping of an object.
using EncodeFn = std::function<Result<Map, std::string>(const Object&)>;

/// Rebuilds a value from a content mapping with the tag keys removed.
using DecodeFn = std::function<Result<Value, std::string>(const Map&)>;

struct CodecRegisterOptions {
    /// Name used in diagnostics.
    std::string name = "<anonymous>";

    /// Also apply to subclasses without a closer registration.
    bool include_subclasses = false;

    /// Replace an existing registration for the same class.
    bool overwrite = true;
};

// ============================================================================
// Function Table
// ============================================================================

/// Functions keyed by class.
template <typename Fn> class FunctionTable {
public:
    struct Entry {
        ClassRef cls;
        Fn fn;
        std::string name;
        bool include_subclasses = false;
    };

    /// Stores `fn` for `cls`.
    ///
    /// # Returns
    ///
    /// `false` if an entry existed and `overwrite` was off; the old entry
    /// is kept.
    auto add(const ClassRef& cls, Fn fn, const CodecRegisterOptions& options) -> bool {
        auto it = entries_.find(cls.get());
        if (it != entries_.end() && !options.overwrite) {
            return false;
        }
        entries_.insert_or_assign(cls.get(),
                                  Entry{cls, std::move(fn), options.name, options.include_subclasses});
        return true;
    }

    [[nodiscard]] auto find_exact(const Class& cls) const -> const Entry* {
        auto it = entries_.find(&cls);
        return it == entries_.end() ? nullptr : &it->second;
    }

    /// The exact entry for `cls`, else the nearest ancestor entry that
    /// includes subclasses.
    [[nodiscard]] auto resolve(const Class& cls) const -> const Entry* {
        if (const Entry* exact = find_exact(cls)) {
            return exact;
        }
        for (const Class* c = cls.base().get(); c; c = c->base().get()) {
            const Entry* entry = find_exact(*c);
            if (entry && entry->include_subclasses) {
                return entry;
            }
        }
        return nullptr;
    }

    auto remove(const Class& cls) -> bool {
        return entries_.erase(&cls) > 0;
    }

    [[nodiscard]] auto has(const Class& cls) const -> bool {
        return entries_.count(&cls) > 0;
    }

    void clear() {
        entries_.clear();
    }

    [[nodiscard]] auto size() const -> size_t {
        return entries_.size();
    }

private:
    // Entries hold the class, so the key stays valid.
    std::unordered_map<const Class*, Entry> entries_;
};

// ============================================================================
// Codec Context
// ============================================================================

class CodecContext {
public:
    /// A context with empty tables and a shared-library loader over
    /// `config.module_search_paths`.
    explicit CodecContext(CodecConfig config = {});

    CodecContext(CodecConfig config, Box<ModuleLoader> loader);

    // Non-copyable
    CodecContext(const CodecContext&) = delete;
    CodecContext& operator=(const CodecContext&) = delete;

    /// The process-wide context.
    static auto default_context() -> CodecContext&;

    [[nodiscard]] auto config() const -> const CodecConfig& {
        return config_;
    }

    void set_encoder_fallback(bool enabled) {
        config_.encoder_fallback_enabled = enabled;
    }

    void set_decoder_fallback(bool enabled) {
        config_.decoder_fallback_enabled = enabled;
    }

    [[nodiscard]] auto type_modules() -> TypeModules& {
        return *type_modules_;
    }

    [[nodiscard]] auto type_modules() const -> const TypeModules& {
        return *type_modules_;
    }

    /// Shares `modules` with this context, e.g. between several contexts.
    void set_type_modules(Rc<TypeModules> modules) {
        type_modules_ = std::move(modules);
    }

    /// Adds `cls` to the loaded type modules under its own module.
    void add_class(const ClassRef& cls) {
        type_modules_->add(cls);
    }

    [[nodiscard]] auto loader() -> ModuleLoader& {
        return *loader_;
    }

    void set_loader(Box<ModuleLoader> loader) {
        loader_ = std::move(loader);
    }

    /// The context's own registry, or the registry manager's.
    [[nodiscard]] auto registry() const -> Rc<ClassRegistry>;

    /// Pins a registry to this context. `nullptr` reverts to the manager's.
    void set_registry(Rc<ClassRegistry> registry) {
        registry_ = std::move(registry);
    }

    // ========================================================================
    // Function Registration
    // ========================================================================

    /// Registers `fn` as the encoder of `cls`.
    ///
    /// # Returns
    ///
    /// `true` if stored, `false` if an existing encoder was kept because
    /// `options.overwrite` was off. An error for a null class or function.
    auto register_encoder(const ClassRef& cls, EncodeFn fn, CodecRegisterOptions options = {})
        -> Result<bool, std::string>;

    /// Registers `fn` as the decoder of `cls`. Same contract as
    /// `register_encoder`.
    auto register_decoder(const ClassRef& cls, DecodeFn fn, CodecRegisterOptions options = {})
        -> Result<bool, std::string>;

    [[nodiscard]] auto has_encoder(const ClassRef& cls) const -> bool {
        return encoders_.has(*cls);
    }

    [[nodiscard]] auto has_decoder(const ClassRef& cls) const -> bool {
        return decoders_.has(*cls);
    }

    /// The encoder registered exactly for `cls`, or `nullptr`.
    [[nodiscard]] auto get_encoder(const ClassRef& cls) const -> const EncodeFn*;

    /// The decoder registered exactly for `cls`, or `nullptr`.
    [[nodiscard]] auto get_decoder(const ClassRef& cls) const -> const DecodeFn*;

    auto unregister_encoder(const ClassRef& cls) -> bool {
        return encoders_.remove(*cls);
    }

    auto unregister_decoder(const ClassRef& cls) -> bool {
        return decoders_.remove(*cls);
    }

    void clear_encoders() {
        encoders_.clear();
    }

    void clear_decoders() {
        decoders_.clear();
    }

    [[nodiscard]] auto encoders() const -> const FunctionTable<EncodeFn>& {
        return encoders_;
    }

    [[nodiscard]] auto decoders() const -> const FunctionTable<DecodeFn>& {
        return decoders_;
    }

private:
    CodecConfig config_;
    FunctionTable<EncodeFn> encoders_;
    FunctionTable<DecodeFn> decoders_;
    Rc<TypeModules> type_modules_;
    Box<ModuleLoader> loader_;
    Rc<ClassRegistry> registry_;
};

} // namespace unijson
