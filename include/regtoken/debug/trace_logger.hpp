#pragma once

/**
 * @file trace_logger.hpp
 * @brief Debug tracing for the token codec.
 *
 * Traces describe token structure only: splice position, region lengths and
 * base64 padding. Key material and plaintext are never passed to these macros.
 *
 * Enable via CMake: -DREGTOKEN_DEBUG_TRACE=ON
 */

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace regtoken::debug {

enum class Stage {
    Build,
    Parse,
    Collect
};

#ifdef REGTOKEN_DEBUG_TRACE

inline const char* StageToString(Stage stage) {
    switch (stage) {
        case Stage::Build: return "BUILD";
        case Stage::Parse: return "PARSE";
        case Stage::Collect: return "COLLECT";
        default: return "UNKNOWN";
    }
}

#define REGTOKEN_TRACE_VALUE(stage, name, value) \
    do { \
        fprintf(stdout, "[REGTOKEN-TRACE] %s %s: %s\n", \
            ::regtoken::debug::StageToString(stage), \
            name, \
            std::to_string(value).c_str()); \
        fflush(stdout); \
    } while(0)

#define REGTOKEN_TRACE_MSG(stage, message) \
    do { \
        fprintf(stdout, "[REGTOKEN-TRACE] %s %s\n", \
            ::regtoken::debug::StageToString(stage), \
            message); \
        fflush(stdout); \
    } while(0)

inline void LogSplice(
    Stage stage,
    uint32_t position,
    size_t before_length,
    size_t after_length) {

    REGTOKEN_TRACE_VALUE(stage, "splice_position", position);
    REGTOKEN_TRACE_VALUE(stage, "before_length", before_length);
    REGTOKEN_TRACE_VALUE(stage, "after_length", after_length);
}

inline void LogEnvelope(
    Stage stage,
    size_t payload_length,
    size_t envelope_length,
    size_t cipher_text_length) {

    REGTOKEN_TRACE_VALUE(stage, "payload_length", payload_length);
    REGTOKEN_TRACE_VALUE(stage, "envelope_length", envelope_length);
    REGTOKEN_TRACE_VALUE(stage, "cipher_text_length", cipher_text_length);
    REGTOKEN_TRACE_VALUE(stage, "base64_remainder", cipher_text_length % 4);
}

#else // !REGTOKEN_DEBUG_TRACE

#define REGTOKEN_TRACE_VALUE(stage, name, value) ((void)0)
#define REGTOKEN_TRACE_MSG(stage, message) ((void)0)

inline void LogSplice(Stage, uint32_t, size_t, size_t) {}
inline void LogEnvelope(Stage, size_t, size_t, size_t) {}

#endif // REGTOKEN_DEBUG_TRACE

} // namespace regtoken::debug
