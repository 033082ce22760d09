/*
 * Type module ABI: the C interface of loadable type modules.
 *
 * A type module is a shared library that contributes classes to the
 * decoder's module table. It exports two functions:
 *   - unijson_module_query() -> module metadata
 *   - unijson_module_init()  -> adds the module's classes to a TypeModules
 *
 * unijson_module_init may be called more than once, each time with a
 * different table. Classes must be created once per process so that every
 * table sees the same class objects.
 *
 * Memory ownership rule: the module owns all pointers it returns.
 */

#ifndef UNIJSON_MODULE_ABI_H
#define UNIJSON_MODULE_ABI_H

#include <stdint.h>

/* ===== Export macro ===== */

#define UNIJSON_MODULE_API __attribute__((visibility("default")))

/* ===== ABI version ===== */

#define UNIJSON_MODULE_ABI_VERSION 1

/* ===== Module metadata ===== */

typedef struct UnijsonModuleInfo {
    uint32_t abi_version; /* Must equal UNIJSON_MODULE_ABI_VERSION */
    const char* name;     /* Module name written as __module__, e.g. "sample_gadgets" */
    const char* version;  /* e.g. "0.1.0" */
} UnijsonModuleInfo;

/* ===== Module entry points =====
 *
 * Each module must export these with extern "C" linkage:
 *
 *   UNIJSON_MODULE_API const UnijsonModuleInfo* unijson_module_query(void);
 *   UNIJSON_MODULE_API int unijson_module_init(void* type_modules);
 *
 * `type_modules` points to a unijson::TypeModules. A non-zero return
 * reports failure.
 */

typedef const UnijsonModuleInfo* (*UnijsonModuleQueryFn)(void);
typedef int (*UnijsonModuleInitFn)(void* type_modules);

#endif /* UNIJSON_MODULE_ABI_H */
