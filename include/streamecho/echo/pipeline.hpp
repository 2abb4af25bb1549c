#pragma once

/// @file pipeline.hpp
/// @brief Decoupled receive / process / send for one bidirectional call
///
/// @code
///   peer --read--> [ingestion] --inbound--> [processing] --outbound--> [emission] --write--> peer
///                   activity     queue        activity       queue     handler thread
/// @endcode
///
/// Both queues are bounded, so a slow stage stalls the one before it instead
/// of growing memory. Every stage observes the session's cancellation signal
/// and every stage that produces into a queue closes it exactly once on the
/// way out, whatever the reason it stopped.

#include "config.hpp"
#include "messages.hpp"
#include "session.hpp"
#include "transform.hpp"

#include <streamecho/log/macros.hpp>
#include <streamecho/rpc/server_stream.hpp>
#include <streamecho/runtime/activity.hpp>
#include <streamecho/sync/cancel_token.hpp>
#include <streamecho/sync/relay_queue.hpp>

#include <fmt/format.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace streamecho::echo {

using echo_stream = rpc::server_stream<EchoRequest, EchoResponse>;

enum class pipeline_outcome {
    completed,          ///< Input ended and every result was sent
    cancelled,          ///< Peer cancel, disconnect, deadline or shutdown
    transport_fault,    ///< Reading or writing the stream failed
    processing_fault,   ///< The transform threw
};

constexpr const char* pipeline_outcome_str(pipeline_outcome o) noexcept {
    switch (o) {
        case pipeline_outcome::completed: return "completed";
        case pipeline_outcome::cancelled: return "cancelled";
        case pipeline_outcome::transport_fault: return "transport fault";
        case pipeline_outcome::processing_fault: return "processing fault";
        default: return "unknown";
    }
}

/// What one run of the pipeline did
struct pipeline_report {
    pipeline_outcome outcome = pipeline_outcome::completed;
    sync::cancel_reason reason = sync::cancel_reason::none;
    std::string detail;
    rpc::status_code status = rpc::status_code::ok;   ///< Abort status set on the call, ok if none
    uint64_t requests = 0;            ///< Messages read by ingestion
    uint64_t processed = 0;           ///< Results handed to the outbound queue
    uint64_t responses = 0;           ///< Messages written by emission
    uint64_t dropped = 0;             ///< Results discarded after emission stopped
    size_t inbound_high_water = 0;
    size_t outbound_high_water = 0;
    size_t inbound_producer_waits = 0;
    size_t inbound_end_markers = 0;   ///< End markers taken from the inbound queue
    size_t outbound_end_markers = 0;  ///< End markers taken from the outbound queue
    bool inbound_closed = false;
    bool outbound_closed = false;
    bool activities_joined = false;
};

/// Starts one pipeline stage on its own execution context. May throw when
/// no context can be created.
using stage_launcher = std::function<runtime::activity(std::string name, std::function<void()> body)>;

inline runtime::activity launch_thread(std::string name, std::function<void()> body) {
    return runtime::activity::spawn(std::move(name), std::move(body));
}

namespace detail {

/// Read access to the call that the handler can revoke. Reads hold the lock,
/// so release() returns only once no read is in progress.
class stream_reader {
public:
    explicit stream_reader(echo_stream& stream) : stream_(&stream) {}

    /// nullopt at end of input, on inactivity, or after release()
    std::optional<EchoRequest> read() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stream_) {
            return std::nullopt;
        }
        return stream_->read();
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex_);
        stream_ = nullptr;
    }

private:
    std::mutex mutex_;
    echo_stream* stream_;
};

/// Everything the activities touch. Shared so a detached activity never
/// outlives what it references.
struct pipeline_state {
    pipeline_state(const service_config& cfg, sync::cancel_source source,
                   std::shared_ptr<session_counters> session_counters,
                   transform_fn fn, std::string label)
        : config(cfg)
        , inbound(cfg.queue_capacity, cfg.poll_interval)
        , outbound(cfg.queue_capacity, cfg.poll_interval)
        , cancel(std::move(source))
        , counters(std::move(session_counters))
        , transform(std::move(fn))
        , name(std::move(label)) {}

    const service_config config;
    sync::relay_queue<EchoRequest> inbound;
    sync::relay_queue<EchoResponse> outbound;
    sync::cancel_source cancel;
    std::shared_ptr<session_counters> counters;
    const transform_fn transform;
    const std::string name;

    std::atomic<bool> input_ended{false};
    std::atomic<bool> emission_stopped{false};
    std::atomic<uint64_t> processed{0};
    std::atomic<uint64_t> dropped{0};

    std::mutex fault_mutex;
    std::string fault_detail;
    rpc::status_code fault_status = rpc::status_code::internal;

    /// Raise the signal; the winning raise records its detail
    void raise(sync::cancel_reason why, std::string detail,
               rpc::status_code status = rpc::status_code::internal) {
        std::lock_guard<std::mutex> lock(fault_mutex);
        if (cancel.cancel(why)) {
            fault_detail = std::move(detail);
            fault_status = status;
        }
    }

    /// A read or write on the call failed; the call ends with the error's code
    void raise_transport(const rpc::stream_error& e) {
        raise(sync::cancel_reason::transport_fault, e.what(), rpc::error_status(e));
    }

    rpc::status_code status() {
        std::lock_guard<std::mutex> lock(fault_mutex);
        return fault_status;
    }

    std::string detail() {
        std::lock_guard<std::mutex> lock(fault_mutex);
        return fault_detail;
    }
};

} // namespace detail

/// Runs one asynchronous bidirectional call to completion.
///
/// run() blocks the calling (handler) thread: it spawns ingestion and
/// processing, performs emission itself, then joins both activities within
/// the configured timeout. The session is driven to exactly one terminal
/// state; on a fault the call is aborted with the matching status before the
/// activities are joined.
class async_pipeline {
public:
    async_pipeline(echo_stream& stream, stream_session& session,
                   transform_fn transform, const service_config& config,
                   stage_launcher launcher = launch_thread)
        : stream_(stream)
        , session_(session)
        , launch_(std::move(launcher))
        , reader_(std::make_shared<detail::stream_reader>(stream))
        , state_(std::make_shared<detail::pipeline_state>(
              config, session.source(), session.counters(), std::move(transform),
              fmt::format("{} stream {}", session.method(), session.stream_id()))) {}

    async_pipeline(const async_pipeline&) = delete;
    async_pipeline& operator=(const async_pipeline&) = delete;

    /// A pipeline left before run() settled stops its activities, aborts
    /// the call and ends the session as errored. Activities never read the
    /// stream after this returns.
    ~async_pipeline() {
        if (!settled_) {
            state_->raise(sync::cancel_reason::processing_fault, "pipeline abandoned");
            stream_.abort(rpc::status_code::internal, "pipeline abandoned");
            if (!is_terminal(session_.state())) {
                session_.fail(sync::cancel_reason::processing_fault, "pipeline abandoned");
            }
        }
        reader_->release();
    }

    pipeline_report run() {
        runtime::activity ingestion;
        runtime::activity processing;
        try {
            ingestion = launch_(state_->name + " ingestion",
                                [st = state_, reader = reader_] { ingest(*st, *reader); });
            processing = launch_(state_->name + " processing",
                                 [st = state_] { process(*st); });
        } catch (const std::exception& e) {
            // Whatever did start is stopped by the signal and joined below.
            STREAMECHO_LOG_ERROR("{}: cannot start pipeline stage: {}", state_->name, e.what());
            state_->raise(sync::cancel_reason::processing_fault,
                          fmt::format("cannot start pipeline stage: {}", e.what()));
        }

        bool drained = emit();

        pipeline_report report;
        report.reason = state_->cancel.reason();
        report.detail = state_->detail();
        report.outcome = classify(drained, report.reason);

        // Fault statuses go out before joining so a read blocked on the
        // peer returns.
        if (report.outcome == pipeline_outcome::processing_fault) {
            report.status = rpc::status_code::internal;
            stream_.abort(report.status, report.detail);
        } else if (report.outcome == pipeline_outcome::transport_fault) {
            report.status = state_->status();
            stream_.abort(report.status, report.detail);
        } else if (report.outcome == pipeline_outcome::cancelled && stream_.is_active()) {
            // Stopped on our own signal while the call itself is still live
            report.status = rpc::status_code::cancelled;
            stream_.abort(report.status, sync::cancel_reason_str(report.reason));
        }

        auto timeout = state_->config.join_timeout;
        bool ingestion_joined = ingestion.join_for(timeout);
        bool processing_joined = processing.join_for(timeout);
        if (!ingestion_joined) {
            stream_.abort(rpc::status_code::internal, "ingestion did not stop in time");
            if (report.status == rpc::status_code::ok) {
                report.status = rpc::status_code::internal;
            }
        }
        reader_->release();

        report.requests = state_->counters->requests.load(std::memory_order_relaxed);
        report.processed = state_->processed.load(std::memory_order_relaxed);
        report.responses = state_->counters->responses.load(std::memory_order_relaxed);
        report.dropped = state_->dropped.load(std::memory_order_relaxed);
        report.inbound_high_water = state_->inbound.high_water_mark();
        report.outbound_high_water = state_->outbound.high_water_mark();
        report.inbound_producer_waits = state_->inbound.producer_waits();
        report.inbound_end_markers = state_->inbound.sentinels_observed();
        report.outbound_end_markers = state_->outbound.sentinels_observed();
        report.inbound_closed = state_->inbound.is_closed();
        report.outbound_closed = state_->outbound.is_closed();
        report.activities_joined = ingestion_joined && processing_joined;

        settle_session(report);
        settled_ = true;
        return report;
    }

private:
    static void ingest(detail::pipeline_state& st, detail::stream_reader& reader) {
        auto token = st.cancel.get_token();
        try {
            while (!token.is_cancelled()) {
                auto request = reader.read();
                if (!request) {
                    break;
                }
                st.counters->requests.fetch_add(1, std::memory_order_relaxed);
                STREAMECHO_LOG_INFO("{}: Received message: {}", st.name, request->message);

                auto status = st.inbound.put(std::move(*request), token);
                if (status != sync::queue_status::ok) {
                    STREAMECHO_LOG_DEBUG("{}: ingestion stopping, inbound {}",
                                         st.name, sync::queue_status_str(status));
                    break;
                }
            }
        } catch (const rpc::stream_error& e) {
            STREAMECHO_LOG_ERROR("{}: Error receiving: {}", st.name, e.what());
            st.raise_transport(e);
        }

        st.input_ended.store(true, std::memory_order_release);
        st.inbound.close();
    }

    static void process(detail::pipeline_state& st) {
        auto token = st.cancel.get_token();
        for (;;) {
            auto item = st.inbound.take(token);
            if (!item || sync::is_end_of_stream(*item)) {
                break;
            }
            auto& request = std::get<EchoRequest>(*item);

            if (token.wait_for(st.config.processing_delay)) {
                break;
            }

            EchoResponse response;
            try {
                response = st.transform(request);
            } catch (const std::exception& e) {
                STREAMECHO_LOG_ERROR("{}: Error processing '{}': {}", st.name, request.message, e.what());
                st.raise(sync::cancel_reason::processing_fault,
                         fmt::format("processing '{}' failed: {}", request.message, e.what()));
                break;
            }

            // Once emission is gone nothing will take the result; never wait.
            std::string text = response.message;
            auto status = st.emission_stopped.load(std::memory_order_acquire)
                              ? st.outbound.try_put(std::move(response))
                              : st.outbound.put(std::move(response), token);
            if (status == sync::queue_status::ok) {
                st.processed.fetch_add(1, std::memory_order_relaxed);
                STREAMECHO_LOG_INFO("{}: Processed async response: {}", st.name, text);
            } else {
                st.dropped.fetch_add(1, std::memory_order_relaxed);
                STREAMECHO_LOG_WARNING("{}: result dropped, outbound {}: {}",
                                       st.name, sync::queue_status_str(status), text);
                if (status == sync::queue_status::stopped) {
                    break;
                }
            }
        }
        st.outbound.close();
    }

    /// Runs on the handler thread. Returns true if the end marker was reached.
    bool emit() {
        auto& st = *state_;
        auto token = st.cancel.get_token();
        bool draining = false;
        bool drained = false;

        for (;;) {
            if (!draining && st.input_ended.load(std::memory_order_acquire)) {
                draining = session_.begin_draining();
            }
            if (!stream_.is_active()) {
                st.raise(inactive_reason(), "call no longer active");
                break;
            }

            auto item = st.outbound.take(token);
            if (!item) {
                break;
            }
            if (sync::is_end_of_stream(*item)) {
                drained = true;
                break;
            }
            if (token.is_cancelled()) {
                st.dropped.fetch_add(1, std::memory_order_relaxed);
                break;
            }

            auto& response = std::get<EchoResponse>(*item);
            try {
                stream_.write(response);
            } catch (const rpc::stream_error& e) {
                if (!stream_.is_active()) {
                    // Lost a race with cancellation of the call
                    st.raise(inactive_reason(), e.what());
                    break;
                }
                STREAMECHO_LOG_ERROR("{}: Error sending responses: {}", st.name, e.what());
                st.raise_transport(e);
                break;
            }
            st.counters->responses.fetch_add(1, std::memory_order_relaxed);
            STREAMECHO_LOG_INFO("{}: Sent async response: {}", st.name, response.message);
        }

        if (!drained) {
            // Nobody will take from the outbound queue again.
            st.raise(inactive_reason(), "emission stopped");
            st.emission_stopped.store(true, std::memory_order_release);
            size_t discarded = st.outbound.detach_consumer();
            if (discarded > 0) {
                st.dropped.fetch_add(discarded, std::memory_order_relaxed);
                STREAMECHO_LOG_WARNING("{}: {} pending results discarded", st.name, discarded);
            }
        }
        return drained;
    }

    /// Why the call stopped, as recorded on the call itself
    sync::cancel_reason inactive_reason() const {
        auto why = stream_.token().reason();
        return why == sync::cancel_reason::none ? sync::cancel_reason::call_inactive : why;
    }

    static pipeline_outcome classify(bool drained, sync::cancel_reason reason) {
        switch (reason) {
            case sync::cancel_reason::none:
                return drained ? pipeline_outcome::completed : pipeline_outcome::cancelled;
            case sync::cancel_reason::processing_fault:
                return pipeline_outcome::processing_fault;
            case sync::cancel_reason::transport_fault:
                return pipeline_outcome::transport_fault;
            default:
                return pipeline_outcome::cancelled;
        }
    }

    void settle_session(const pipeline_report& report) {
        switch (report.outcome) {
            case pipeline_outcome::completed:
                if (session_.state() == session_state::active) {
                    session_.begin_draining();
                }
                session_.close();
                break;
            case pipeline_outcome::cancelled:
                session_.cancel(report.reason);
                break;
            case pipeline_outcome::transport_fault:
            case pipeline_outcome::processing_fault:
                session_.fail(report.reason, report.detail);
                break;
        }
    }

    echo_stream& stream_;
    stream_session& session_;
    stage_launcher launch_;
    std::shared_ptr<detail::stream_reader> reader_;
    std::shared_ptr<detail::pipeline_state> state_;
    bool settled_ = false;
};

} // namespace streamecho::echo
