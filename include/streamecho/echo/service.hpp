#pragma once

/// @file service.hpp
/// @brief The echo service: four call shapes over one request/response pair
///
/// Usage:
/// @code
///   streamecho::rpc::stream_server server;
///   streamecho::echo::echo_service service;
///   service.register_with(server);
///   server.start(streamecho::net::ipv4_address(8080));
/// @endcode
///
/// Every handler runs one stream_session to exactly one terminal state and
/// reports faults through the call's abort status. Handlers never throw.

#include "config.hpp"
#include "messages.hpp"
#include "pipeline.hpp"
#include "session.hpp"
#include "transform.hpp"

#include <streamecho/log/macros.hpp>
#include <streamecho/rpc/server.hpp>

#include <atomic>
#include <string>
#include <vector>

namespace streamecho::echo {

/// Terminal states reached by the service's sessions
struct service_stats {
    std::atomic<uint64_t> closed{0};
    std::atomic<uint64_t> cancelled{0};
    std::atomic<uint64_t> errored{0};
};

class echo_service {
public:
    explicit echo_service(service_config config = {},
                          transform_fn async_transform = default_async_transform,
                          stage_launcher launcher = launch_thread)
        : config_(config)
        , async_transform_(std::move(async_transform))
        , launcher_(std::move(launcher)) {}

    echo_service(const echo_service&) = delete;
    echo_service& operator=(const echo_service&) = delete;

    /// Register all four methods. The service must outlive the server.
    void register_with(rpc::stream_server& server) {
        server.register_client_streaming<EchoClientStream>(
            [this](echo_stream& stream) { aggregate(stream); });
        server.register_server_streaming<EchoServerStream>(
            [this](const EchoRequest& request, echo_stream& stream) { fan_out(request, stream); });
        server.register_bidi_streaming<EchoBidirectionalStreamSync>(
            [this](echo_stream& stream) { echo_sync(stream); });
        server.register_bidi_streaming<EchoBidirectionalStreamAsync>(
            [this](echo_stream& stream) { echo_async(stream); });
    }

    /// Fold every inbound message into one summary response
    void aggregate(echo_stream& stream) {
        stream_session session(EchoClientStream::name, stream.stream_id(), stream.token());
        session.activate();

        std::vector<std::string> messages;
        if (!read_all(session, stream, [&](EchoRequest&& request) {
                STREAMECHO_LOG_INFO("{}: Received message: {}", session.method(), request.message);
                messages.push_back(std::move(request.message));
                return true;
            })) {
            settle(session);
            return;
        }

        session.begin_draining();
        EchoResponse response{aggregate_summary(messages)};
        if (send(session, stream, response)) {
            STREAMECHO_LOG_INFO("{}: Sending response: {}", session.method(), response.message);
            session.close();
        }
        settle(session);
    }

    /// One request, fan_out_count numbered echoes paced by fan_out_interval
    void fan_out(const EchoRequest& request, echo_stream& stream) {
        stream_session session(EchoServerStream::name, stream.stream_id(), stream.token());
        session.activate();
        session.count_request();
        STREAMECHO_LOG_INFO("{}: Received request: {}", session.method(), request.message);
        session.begin_draining();

        auto token = session.token();
        for (size_t i = 1; i <= config_.fan_out_count; ++i) {
            if (!stream.is_active()) {
                STREAMECHO_LOG_INFO("{}: call inactive after {} responses", session.method(), i - 1);
                observe_cancel(session);
                break;
            }
            EchoResponse response{fan_out_echo(i, request.message)};
            if (!send(session, stream, response)) {
                break;
            }
            STREAMECHO_LOG_INFO("{}: Sending response: {}", session.method(), response.message);
            if (i < config_.fan_out_count && token.wait_for(config_.fan_out_interval)) {
                observe_cancel(session);
                break;
            }
        }
        if (session.state() == session_state::draining) {
            session.close();
        }
        settle(session);
    }

    /// Answer each message before reading the next
    void echo_sync(echo_stream& stream) {
        stream_session session(EchoBidirectionalStreamSync::name, stream.stream_id(), stream.token());
        session.activate();

        bool drained = read_all(session, stream, [&](EchoRequest&& request) {
            STREAMECHO_LOG_INFO("{}: Received message: {}", session.method(), request.message);
            EchoResponse response{sync_echo(request.message)};
            if (!send(session, stream, response)) {
                return false;
            }
            STREAMECHO_LOG_INFO("{}: Sent response: {}", session.method(), response.message);
            return true;
        });
        if (drained) {
            session.begin_draining();
            session.close();
        }
        settle(session);
    }

    /// Receive, process and send through the bounded pipeline
    void echo_async(echo_stream& stream) {
        stream_session session(EchoBidirectionalStreamAsync::name, stream.stream_id(), stream.token());
        session.activate();

        try {
            async_pipeline pipeline(stream, session, async_transform_, config_, launcher_);
            auto report = pipeline.run();

            STREAMECHO_LOG_INFO("{} stream {}: pipeline {} ({} in, {} processed, {} out, {} dropped)",
                                session.method(), session.stream_id(),
                                pipeline_outcome_str(report.outcome), report.requests,
                                report.processed, report.responses, report.dropped);
        } catch (const std::exception& e) {
            STREAMECHO_LOG_ERROR("{} stream {}: pipeline failed: {}",
                                 session.method(), session.stream_id(), e.what());
            if (!is_terminal(session.state())) {
                session.fail(sync::cancel_reason::processing_fault, e.what());
            }
            stream.abort(rpc::status_code::internal, e.what());
        }
        settle(session);
    }

    const service_config& config() const noexcept { return config_; }

    const service_stats& stats() const noexcept { return stats_; }

private:
    /// Read until end of input, feeding each message to on_message.
    /// @return true if the input ended normally and every message was accepted
    template<typename F>
    bool read_all(stream_session& session, echo_stream& stream, F&& on_message) {
        for (;;) {
            std::optional<EchoRequest> request;
            try {
                request = stream.read();
            } catch (const rpc::stream_error& e) {
                STREAMECHO_LOG_ERROR("{}: Error receiving: {}", session.method(), e.what());
                session.fail(sync::cancel_reason::transport_fault, e.what());
                abort_transport(stream, e);
                return false;
            }
            if (!request) {
                if (!stream.is_active() || session.is_cancelled()) {
                    observe_cancel(session);
                    return false;
                }
                return true;
            }
            session.count_request();
            if (!on_message(std::move(*request))) {
                return false;
            }
        }
    }

    /// Write one response. A failure is cancellation when the call went
    /// inactive, otherwise a transport fault.
    bool send(stream_session& session, echo_stream& stream, const EchoResponse& response) {
        if (session.is_cancelled()) {
            observe_cancel(session);
            return false;
        }
        try {
            stream.write(response);
        } catch (const rpc::stream_error& e) {
            if (session.is_cancelled()) {
                STREAMECHO_LOG_INFO("{}: write stopped, {}", session.method(),
                                    sync::cancel_reason_str(session.cancel_reason()));
                observe_cancel(session);
            } else {
                STREAMECHO_LOG_ERROR("{}: Error sending response: {}", session.method(), e.what());
                session.fail(sync::cancel_reason::transport_fault, e.what());
                abort_transport(stream, e);
            }
            return false;
        }
        session.count_response();
        return true;
    }

    /// End the session as cancelled, keeping the reason already raised
    static void observe_cancel(stream_session& session) {
        session.cancel(session.is_cancelled() ? session.cancel_reason()
                                              : sync::cancel_reason::call_inactive);
    }

    static void abort_transport(echo_stream& stream, const rpc::stream_error& e) {
        stream.abort(rpc::error_status(e), e.what());
    }

    void settle(const stream_session& session) {
        switch (session.state()) {
            case session_state::closed:
                stats_.closed.fetch_add(1, std::memory_order_relaxed);
                STREAMECHO_LOG_INFO("{} stream {}: closed after {}ms ({} requests, {} responses)",
                                    session.method(), session.stream_id(), session.elapsed().count(),
                                    session.request_count(), session.response_count());
                break;
            case session_state::cancelled:
                stats_.cancelled.fetch_add(1, std::memory_order_relaxed);
                STREAMECHO_LOG_WARNING("{} stream {}: cancelled ({}) after {} requests, {} responses",
                                       session.method(), session.stream_id(),
                                       sync::cancel_reason_str(session.cancel_reason()),
                                       session.request_count(), session.response_count());
                break;
            case session_state::errored:
                stats_.errored.fetch_add(1, std::memory_order_relaxed);
                STREAMECHO_LOG_ERROR("{} stream {}: errored: {}", session.method(),
                                     session.stream_id(), session.detail());
                break;
            default:
                STREAMECHO_LOG_ERROR("{} stream {}: handler returned in state {}",
                                     session.method(), session.stream_id(),
                                     session_state_str(session.state()));
                break;
        }
    }

    const service_config config_;
    const transform_fn async_transform_;
    const stage_launcher launcher_;
    service_stats stats_;
};

} // namespace streamecho::echo
