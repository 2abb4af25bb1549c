#pragma once

#include "messages.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace streamecho::echo {

/// Per-message work of the asynchronous pipeline. May throw; a throw is a
/// processing fault.
using transform_fn = std::function<EchoResponse(const EchoRequest&)>;

/// "Received N messages: [m1, m2, ...]"
inline std::string aggregate_summary(const std::vector<std::string>& messages) {
    return fmt::format("Received {} messages: [{}]", messages.size(), fmt::join(messages, ", "));
}

/// "Echo #i: <message>", ordinals start at 1
inline std::string fan_out_echo(size_t ordinal, std::string_view message) {
    return fmt::format("Echo #{}: {}", ordinal, message);
}

inline std::string sync_echo(std::string_view message) {
    return fmt::format("Sync Echo: {}", message);
}

inline std::string async_echo(std::string_view message) {
    return fmt::format("Async Echo (processed): {}", message);
}

inline EchoResponse default_async_transform(const EchoRequest& request) {
    return EchoResponse{async_echo(request.message)};
}

} // namespace streamecho::echo
