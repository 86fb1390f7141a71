#pragma once

#include "editrelay/pipeline/core.hpp"
#include <chrono>
#include <cstdint>

namespace editrelay {
namespace pipeline {

/**
 * Status polling policy
 *
 * Implements:
 * - Fixed interval between status requests
 * - Error classification for a single poll attempt (continue vs. abort)
 * - Poll budget management
 *
 * A failed attempt always consumes one unit of the budget, so a job whose
 * status requests keep failing ends in a timeout after max_polls attempts.
 */
class PollPolicy {
public:
    struct Config {
        int64_t interval_ms = 3000; // Sleep before every status request
        int32_t max_polls = 100;    // Maximum number of status requests
    };

    PollPolicy(const Config& config = Config()) : config_(config) {}

    /**
     * Check if a failed poll attempt should be retried
     *
     * Retryable errors:
     * - Transport failures (network_error)
     * - Any non-2xx status response (transient_poll_error)
     *
     * Non-retryable errors:
     * - Undecodable status bodies (protocol_error)
     * - Everything else
     */
    bool is_retryable(ErrorCode error_code) const {
        switch (error_code) {
            case ErrorCode::network_error:
            case ErrorCode::transient_poll_error:
                return true;

            case ErrorCode::protocol_error:
                return false;

            default:
                return false;
        }
    }

    bool is_budget_exhausted(int32_t polls_used) const {
        return polls_used >= config_.max_polls;
    }

    std::chrono::milliseconds interval() const {
        return std::chrono::milliseconds(config_.interval_ms);
    }

    int32_t max_polls() const {
        return config_.max_polls;
    }

private:
    Config config_;
};

} // namespace pipeline
} // namespace editrelay
