// Header-only logging with compile-time levels per component.
// Disabled levels expand to nothing.
//   CMDTREE_LOG_DISPATCH_DEBUG("'%s' -> '%s'", path.c_str(), token.c_str());
//   CMDTREE_LOG_REGISTRY_INFO("registered %s", type_name.c_str());

#ifndef CMDTREE_LOGGING_HPP
#define CMDTREE_LOGGING_HPP

#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>

#include "cmdtree/timing.hpp"

// Levels: 0=NONE, 1=ERROR, 2=WARN, 3=INFO, 4=DEBUG, 5=TRACE
#ifndef CMDTREE_LOG_DISPATCH_LEVEL
#define CMDTREE_LOG_DISPATCH_LEVEL 0
#endif

#ifndef CMDTREE_LOG_REGISTRY_LEVEL
#define CMDTREE_LOG_REGISTRY_LEVEL 0
#endif

namespace cmdtree::logging {

inline FILE*& sink() {
    static FILE* out = stderr;
    return out;
}

inline FILE* output() {
    return sink();
}

// Null restores stderr. The caller keeps ownership of `file`.
inline void set_output(FILE* file) {
    fflush(sink());
    sink() = file != nullptr ? file : stderr;
}

// One line: `[seconds.micros] [LEVEL] [component] message`.
__attribute__((format(printf, 3, 4)))
inline void write(const char* component, const char* level, const char* fmt, ...) {
    const uint64_t micros = get_timestamp_ns() / 1000;
    FILE* out = output();
    flockfile(out);
    fprintf(out, "[%llu.%06llu] [%s] [%s] ",
            static_cast<unsigned long long>(micros / 1000000ULL),
            static_cast<unsigned long long>(micros % 1000000ULL),
            level, component);
    va_list args;
    va_start(args, fmt);
    vfprintf(out, fmt, args);
    va_end(args);
    fputc('\n', out);
    funlockfile(out);
}

} // namespace cmdtree::logging

// dispatch: option parsing, requirement checks, sub-command selection
#if CMDTREE_LOG_DISPATCH_LEVEL >= 5
#define CMDTREE_LOG_DISPATCH_TRACE(fmt, ...) ::cmdtree::logging::write("dispatch", "TRACE", fmt, ##__VA_ARGS__)
#else
#define CMDTREE_LOG_DISPATCH_TRACE(...) do {} while (0)
#endif

#if CMDTREE_LOG_DISPATCH_LEVEL >= 4
#define CMDTREE_LOG_DISPATCH_DEBUG(fmt, ...) ::cmdtree::logging::write("dispatch", "DEBUG", fmt, ##__VA_ARGS__)
#else
#define CMDTREE_LOG_DISPATCH_DEBUG(...) do {} while (0)
#endif

#if CMDTREE_LOG_DISPATCH_LEVEL >= 3
#define CMDTREE_LOG_DISPATCH_INFO(fmt, ...) ::cmdtree::logging::write("dispatch", "INFO", fmt, ##__VA_ARGS__)
#else
#define CMDTREE_LOG_DISPATCH_INFO(...) do {} while (0)
#endif

#if CMDTREE_LOG_DISPATCH_LEVEL >= 2
#define CMDTREE_LOG_DISPATCH_WARN(fmt, ...) ::cmdtree::logging::write("dispatch", "WARN", fmt, ##__VA_ARGS__)
#else
#define CMDTREE_LOG_DISPATCH_WARN(...) do {} while (0)
#endif

// registry: registration, node construction
#if CMDTREE_LOG_REGISTRY_LEVEL >= 4
#define CMDTREE_LOG_REGISTRY_DEBUG(fmt, ...) ::cmdtree::logging::write("registry", "DEBUG", fmt, ##__VA_ARGS__)
#else
#define CMDTREE_LOG_REGISTRY_DEBUG(...) do {} while (0)
#endif

#if CMDTREE_LOG_REGISTRY_LEVEL >= 3
#define CMDTREE_LOG_REGISTRY_INFO(fmt, ...) ::cmdtree::logging::write("registry", "INFO", fmt, ##__VA_ARGS__)
#else
#define CMDTREE_LOG_REGISTRY_INFO(...) do {} while (0)
#endif

#endif // CMDTREE_LOGGING_HPP
