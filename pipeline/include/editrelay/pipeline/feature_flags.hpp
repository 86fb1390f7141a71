#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>

namespace editrelay {
namespace pipeline {

/**
 * Runtime feature flags
 *
 * Optional observability features are off by default and switched on
 * through environment variables:
 * - EDITRELAY_METRICS_ENABLED
 * - EDITRELAY_TRACING_ENABLED
 * - EDITRELAY_DEBUG_LOGGING
 */
class FeatureFlags {
public:
    /**
     * Check if Prometheus metrics collection is enabled
     *
     * Gates upload, poll, job and pipeline counters plus the pipeline
     * duration histogram.
     */
    static bool is_metrics_enabled() {
        return get_env_bool("EDITRELAY_METRICS_ENABLED", false);
    }

    /**
     * Check if span export is enabled
     *
     * When off, spans go to the no-op tracer provider.
     */
    static bool is_tracing_enabled() {
        return get_env_bool("EDITRELAY_TRACING_ENABLED", false);
    }

    static bool is_debug_logging_enabled() {
        return get_env_bool("EDITRELAY_DEBUG_LOGGING", false);
    }

private:
    /**
     * Get boolean value from environment variable
     *
     * Returns `true` if environment variable is set to:
     * - "true" (case-insensitive)
     * - "1"
     * - "yes" (case-insensitive)
     *
     * Returns `default_value` if environment variable is not set or has other value.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }
};

} // namespace pipeline
} // namespace editrelay
