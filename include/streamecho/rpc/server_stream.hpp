#pragma once

#include "rpc_types.hpp"

#include <streamecho/sync/cancel_token.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

namespace streamecho::rpc {

/// Server side of one streaming call, as seen by a handler.
///
/// read() and write() may be called from different threads, but each by at
/// most one thread at a time.
template<typename Request, typename Response>
class server_stream {
public:
    using request_type = Request;
    using response_type = Response;

    virtual ~server_stream() = default;

    /// Next inbound message.
    /// @return nullopt at end of input or once the call is no longer active
    /// @throws stream_error if the inbound message cannot be decoded
    virtual std::optional<Request> read() = 0;

    /// Send one message to the peer.
    /// @throws stream_error if the call is no longer active or the write fails
    virtual void write(const Response& response) = 0;

    /// False once the call was cancelled, timed out, or lost its peer
    virtual bool is_active() const = 0;

    /// Cancellation signal of the call, raised with the reason it ended
    virtual sync::cancel_token token() const = 0;

    /// End the call with a non-OK status. Later writes fail; the first abort
    /// wins.
    virtual void abort(status_code code, std::string_view detail) = 0;

    virtual method_id_t method() const = 0;

    virtual uint32_t stream_id() const = 0;
};

} // namespace streamecho::rpc
