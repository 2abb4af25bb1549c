#pragma once

#include <streamecho/sync/relay_queue.hpp>

#include <chrono>
#include <cstddef>

namespace streamecho::echo {

/// Tuning of the echo handlers
struct service_config {
    size_t queue_capacity = 10;                                         ///< Per direction, async bidi
    std::chrono::milliseconds poll_interval = sync::default_poll_interval;
    size_t fan_out_count = 5;                                           ///< Responses per server-stream request
    std::chrono::milliseconds fan_out_interval{100};
    std::chrono::milliseconds processing_delay{200};                    ///< Simulated work per async message
    std::chrono::milliseconds join_timeout{1000};                       ///< Bound on joining pipeline activities
};

} // namespace streamecho::echo
