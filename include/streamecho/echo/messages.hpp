#pragma once

#include <streamecho/rpc/rpc_types.hpp>

#include <string>

namespace streamecho::echo {

struct EchoRequest {
    std::string message;

    STREAMECHO_RPC_FIELDS(EchoRequest, message)
};

struct EchoResponse {
    std::string message;

    STREAMECHO_RPC_FIELDS(EchoResponse, message)
};

/// Many requests, one aggregated response
struct EchoClientStream
    : rpc::method_descriptor<1, EchoRequest, EchoResponse, rpc::call_kind::client_streaming> {
    static constexpr const char* name = "EchoClientStream";
};

/// One request, a fixed number of numbered responses
struct EchoServerStream
    : rpc::method_descriptor<2, EchoRequest, EchoResponse, rpc::call_kind::server_streaming> {
    static constexpr const char* name = "EchoServerStream";
};

/// Each request answered before the next one is read
struct EchoBidirectionalStreamSync
    : rpc::method_descriptor<3, EchoRequest, EchoResponse, rpc::call_kind::bidi_streaming> {
    static constexpr const char* name = "EchoBidirectionalStreamSync";
};

/// Receiving, processing and sending decoupled through bounded queues
struct EchoBidirectionalStreamAsync
    : rpc::method_descriptor<4, EchoRequest, EchoResponse, rpc::call_kind::bidi_streaming> {
    static constexpr const char* name = "EchoBidirectionalStreamAsync";
};

} // namespace streamecho::echo
