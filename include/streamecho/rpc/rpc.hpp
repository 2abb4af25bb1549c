#pragma once

/// @file rpc.hpp
/// @brief Streaming RPC framework
///
/// Framed, multiplexed streaming calls over TCP:
/// - rpc_buffer.hpp: byte buffers for message serialization
/// - rpc_types.hpp: message schema, method descriptors, call status
/// - rpc_protocol.hpp: frame header, frame types, framing over a socket
/// - server_stream.hpp: what a handler sees of its call
/// - server.hpp: accept loop, connections, bounded call workers
/// - client.hpp: connection and typed client calls
///
/// Defining a method:
/// @code
/// struct EchoRequest {
///     std::string message;
///     STREAMECHO_RPC_FIELDS(EchoRequest, message)
/// };
///
/// struct EchoBidi : rpc::method_descriptor<3, EchoRequest, EchoResponse,
///                                          rpc::call_kind::bidi_streaming> {
///     static constexpr const char* name = "EchoBidi";
/// };
/// @endcode

#include "rpc_buffer.hpp"
#include "rpc_types.hpp"
#include "rpc_protocol.hpp"
#include "server_stream.hpp"
#include "server.hpp"
#include "client.hpp"
