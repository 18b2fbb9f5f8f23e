#pragma once

/**
 * @file trace_logger.hpp
 * @brief Debug tracing for wordlist loading, detection and codec failures.
 *
 * Only enable SEEDPHRASE_DEBUG_TRACE for development. Tracing prints
 * language names, counts and failure kinds. It never prints entropy,
 * mnemonic words, passphrases or seeds.
 *
 * Enable via CMake: -DSEEDPHRASE_DEBUG_TRACE=ON
 */

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace seedphrase::debug {

// ============================================================================
// Component identifiers - always defined so types are available
// ============================================================================

enum class Component {
    Wordlist,
    Registry,
    Codec,
    Detector,
    Seed,
    Unknown
};

#ifdef SEEDPHRASE_DEBUG_TRACE

inline const char* ComponentToString(Component component) {
    switch (component) {
        case Component::Wordlist: return "WORDLIST";
        case Component::Registry: return "REGISTRY";
        case Component::Codec: return "CODEC";
        case Component::Detector: return "DETECTOR";
        case Component::Seed: return "SEED";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// Core logging macros
// ============================================================================

#define SEEDPHRASE_LOG_MSG(component, operation, message) \
    do { \
        fprintf(stdout, "[SEEDPHRASE-TRACE] %s %s %s\n", \
            ::seedphrase::debug::ComponentToString(component), \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

#define SEEDPHRASE_LOG_VALUE(component, operation, name, value) \
    do { \
        fprintf(stdout, "[SEEDPHRASE-TRACE] %s %s %s: %s\n", \
            ::seedphrase::debug::ComponentToString(component), \
            operation, \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define SEEDPHRASE_LOG_SECTION(component, section_name) \
    do { \
        fprintf(stdout, "[SEEDPHRASE-TRACE] %s ========== %s ==========\n", \
            ::seedphrase::debug::ComponentToString(component), \
            section_name); \
        fflush(stdout); \
    } while(0)

inline void LogWordlistLoaded(std::string_view language, size_t word_count) {
    SEEDPHRASE_LOG_SECTION(Component::Wordlist, "WORDLIST LOADED");
    SEEDPHRASE_LOG_MSG(Component::Wordlist, "LOAD", std::string(language));
    SEEDPHRASE_LOG_VALUE(Component::Wordlist, "LOAD", "word_count", word_count);
}

inline void LogFailure(Component component, const char* operation,
                       std::string_view failure_kind) {
    SEEDPHRASE_LOG_MSG(component, operation, "failed: " + std::string(failure_kind));
}

#else // !SEEDPHRASE_DEBUG_TRACE

#define SEEDPHRASE_LOG_MSG(component, operation, message) ((void)0)
#define SEEDPHRASE_LOG_VALUE(component, operation, name, value) ((void)0)
#define SEEDPHRASE_LOG_SECTION(component, section_name) ((void)0)

inline void LogWordlistLoaded(std::string_view, size_t) {}
inline void LogFailure(Component, const char*, std::string_view) {}

#endif // SEEDPHRASE_DEBUG_TRACE

} // namespace seedphrase::debug
