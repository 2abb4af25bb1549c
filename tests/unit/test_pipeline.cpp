#include <catch2/catch.hpp>
#include <streamecho/echo/pipeline.hpp>

#include "../test_helpers.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

using namespace streamecho;
using namespace streamecho::echo;
using namespace streamecho::test;

namespace {

std::vector<std::string> numbered(const char* prefix, size_t count) {
    std::vector<std::string> out;
    for (size_t i = 1; i <= count; ++i) {
        out.push_back(std::string(prefix) + std::to_string(i));
    }
    return out;
}

std::vector<std::string> async_echoes(const std::vector<std::string>& inputs) {
    std::vector<std::string> out;
    for (auto& m : inputs) {
        out.push_back(async_echo(m));
    }
    return out;
}

// Runs a pipeline over stream and returns its report
pipeline_report run_pipeline(fake_stream& stream, const service_config& cfg,
                             transform_fn transform = default_async_transform) {
    stream_session session(EchoBidirectionalStreamAsync::name, stream.stream_id(), stream.token());
    session.activate();
    async_pipeline pipeline(stream, session, std::move(transform), cfg);
    auto report = pipeline.run();
    REQUIRE(is_terminal(session.state()));
    return report;
}

} // namespace

TEST_CASE("pipeline echoes every message in order", "[echo][pipeline]") {
    auto inputs = numbered("msg-", 8);
    fake_stream stream({.inputs = inputs});

    stream_session session(EchoBidirectionalStreamAsync::name, 1, stream.token());
    session.activate();
    async_pipeline pipeline(stream, session, default_async_transform, fast_config());
    auto report = pipeline.run();

    REQUIRE(report.outcome == pipeline_outcome::completed);
    REQUIRE(session.state() == session_state::closed);
    REQUIRE(stream.written() == async_echoes(inputs));
    REQUIRE(report.requests == 8);
    REQUIRE(report.processed == 8);
    REQUIRE(report.responses == 8);
    REQUIRE(report.dropped == 0);
    REQUIRE(session.request_count() == 8);
    REQUIRE(session.response_count() == 8);
    REQUIRE(report.activities_joined);
    REQUIRE_FALSE(stream.aborted().has_value());
}

TEST_CASE("pipeline emits exactly one end marker per queue", "[echo][pipeline]") {
    SECTION("normal completion") {
        fake_stream stream({.inputs = numbered("m", 3)});
        auto report = run_pipeline(stream, fast_config());
        REQUIRE(report.inbound_closed);
        REQUIRE(report.outbound_closed);
        REQUIRE(report.inbound_end_markers == 1);
        REQUIRE(report.outbound_end_markers == 1);
    }

    SECTION("empty input") {
        fake_stream stream(fake_stream::script{});
        auto report = run_pipeline(stream, fast_config());
        REQUIRE(report.outcome == pipeline_outcome::completed);
        REQUIRE(report.requests == 0);
        REQUIRE(stream.written().empty());
        REQUIRE(report.inbound_end_markers == 1);
        REQUIRE(report.outbound_end_markers == 1);
    }

    SECTION("cancelled run still closes both queues") {
        fake_stream stream({.inputs = numbered("m", 2), .hold_open = true});
        std::thread canceller([&] {
            wait_until([&] { return stream.write_count() >= 2; }, scaled_ms(2000));
            stream.cancel(sync::cancel_reason::peer_cancelled);
        });
        auto report = run_pipeline(stream, fast_config());
        canceller.join();

        REQUIRE(report.outcome == pipeline_outcome::cancelled);
        REQUIRE(report.inbound_closed);
        REQUIRE(report.outbound_closed);
        REQUIRE(report.activities_joined);
    }
}

TEST_CASE("pipeline inbound queue never exceeds capacity", "[echo][pipeline]") {
    auto cfg = fast_config();
    cfg.queue_capacity = 2;
    cfg.processing_delay = std::chrono::milliseconds(10);

    auto inputs = numbered("burst-", 20);
    fake_stream stream({.inputs = inputs});
    auto report = run_pipeline(stream, cfg);

    REQUIRE(report.outcome == pipeline_outcome::completed);
    REQUIRE(report.inbound_high_water <= 2);
    REQUIRE(report.outbound_high_water <= 2);
    // Ingestion outran processing and had to wait for room
    REQUIRE(report.inbound_producer_waits > 0);
    REQUIRE(stream.written() == async_echoes(inputs));
}

TEST_CASE("pipeline slow consumer applies backpressure", "[echo][pipeline]") {
    auto cfg = fast_config();
    cfg.queue_capacity = 3;
    cfg.processing_delay = std::chrono::milliseconds(0);

    auto inputs = numbered("slow-", 15);
    fake_stream stream({.inputs = inputs, .write_delay = std::chrono::milliseconds(5)});
    auto report = run_pipeline(stream, cfg);

    REQUIRE(report.outcome == pipeline_outcome::completed);
    REQUIRE(report.outbound_high_water <= 3);
    REQUIRE(report.inbound_high_water <= 3);
    REQUIRE(stream.written() == async_echoes(inputs));
}

TEST_CASE("pipeline stops promptly when the peer cancels", "[echo][pipeline]") {
    auto cfg = fast_config();
    cfg.processing_delay = std::chrono::milliseconds(50);
    cfg.poll_interval = std::chrono::milliseconds(100);

    fake_stream stream({.inputs = numbered("m", 50)});
    stream_session session(EchoBidirectionalStreamAsync::name, 1, stream.token());
    session.activate();
    async_pipeline pipeline(stream, session, default_async_transform, cfg);

    std::chrono::steady_clock::time_point cancelled_at;
    std::thread canceller([&] {
        wait_until([&] { return stream.write_count() >= 2; }, scaled_ms(5000));
        cancelled_at = std::chrono::steady_clock::now();
        stream.cancel(sync::cancel_reason::peer_cancelled);
    });

    auto report = pipeline.run();
    auto finished_at = std::chrono::steady_clock::now();
    canceller.join();

    REQUIRE(report.outcome == pipeline_outcome::cancelled);
    REQUIRE(report.reason == sync::cancel_reason::peer_cancelled);
    REQUIRE(session.state() == session_state::cancelled);
    REQUIRE(report.activities_joined);
    // Every suspension point wakes on the signal, well inside a poll interval
    // plus the processing delay.
    REQUIRE(finished_at - cancelled_at < scaled_ms(1000));

    // Nothing is sent once the call is cancelled
    auto sent = stream.write_count();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    REQUIRE(stream.write_count() == sent);
    REQUIRE(sent < 50);
    REQUIRE(report.responses == sent);
}

TEST_CASE("pipeline handles a vanished peer", "[echo][pipeline]") {
    fake_stream stream({.inputs = numbered("m", 20), .disconnect_after_writes = 3});
    auto report = run_pipeline(stream, fast_config());

    REQUIRE(report.outcome == pipeline_outcome::cancelled);
    REQUIRE(stream.write_count() == 3);
    REQUIRE(report.responses == 3);
    REQUIRE_FALSE(stream.aborted().has_value());
}

TEST_CASE("pipeline reports processing faults", "[echo][pipeline]") {
    auto inputs = std::vector<std::string>{"ok-1", "ok-2", "poison", "ok-3"};
    fake_stream stream({.inputs = inputs, .hold_open = true});

    auto transform = [](const EchoRequest& req) {
        if (req.message == "poison") {
            throw std::runtime_error("cannot process poison");
        }
        return default_async_transform(req);
    };

    stream_session session(EchoBidirectionalStreamAsync::name, 1, stream.token());
    session.activate();
    async_pipeline pipeline(stream, session, transform, fast_config());
    auto report = pipeline.run();

    REQUIRE(report.outcome == pipeline_outcome::processing_fault);
    REQUIRE(report.reason == sync::cancel_reason::processing_fault);
    REQUIRE(session.state() == session_state::errored);
    REQUIRE(session.detail().find("cannot process poison") != std::string::npos);

    auto status = stream.aborted();
    REQUIRE(status.has_value());
    REQUIRE(status->code == rpc::status_code::internal);
    REQUIRE(status->detail.find("poison") != std::string::npos);

    // Output already emitted is not retracted; nothing after the fault
    auto written = stream.written();
    REQUIRE(written.size() <= 2);
    for (size_t i = 0; i < written.size(); ++i) {
        REQUIRE(written[i] == async_echo(inputs[i]));
    }
    REQUIRE(report.activities_joined);
}

TEST_CASE("pipeline reports write faults", "[echo][pipeline]") {
    fake_stream stream({.inputs = numbered("m", 5), .hold_open = true, .fail_write_at = 1});
    auto report = run_pipeline(stream, fast_config());

    REQUIRE(report.outcome == pipeline_outcome::transport_fault);
    REQUIRE(stream.write_count() == 1);
    auto status = stream.aborted();
    REQUIRE(status.has_value());
    REQUIRE(status->code == rpc::status_code::unavailable);
    REQUIRE(report.activities_joined);
}

TEST_CASE("pipeline reports read faults", "[echo][pipeline]") {
    fake_stream stream({.inputs = numbered("m", 5), .fail_read_at = 2});
    stream_session session(EchoBidirectionalStreamAsync::name, 1, stream.token());
    session.activate();
    async_pipeline pipeline(stream, session, default_async_transform, fast_config());
    auto report = pipeline.run();

    REQUIRE(report.outcome == pipeline_outcome::transport_fault);
    REQUIRE(report.requests == 2);
    REQUIRE(session.state() == session_state::errored);
    REQUIRE(stream.aborted().has_value());
    REQUIRE(stream.aborted()->code == rpc::status_code::unavailable);
    REQUIRE(report.status == rpc::status_code::unavailable);
    REQUIRE(report.inbound_closed);
}

TEST_CASE("pipeline keeps the code of a malformed request", "[echo][pipeline]") {
    fake_stream stream({.inputs = numbered("m", 5), .fail_read_at = 1,
                        .read_error = rpc::status_code::invalid_argument});
    auto report = run_pipeline(stream, fast_config());

    REQUIRE(report.outcome == pipeline_outcome::transport_fault);
    REQUIRE(report.status == rpc::status_code::invalid_argument);
    auto status = stream.aborted();
    REQUIRE(status.has_value());
    REQUIRE(status->code == rpc::status_code::invalid_argument);
    REQUIRE(report.activities_joined);
}

TEST_CASE("pipeline detaches an activity that overruns the join timeout", "[echo][pipeline]") {
    auto cfg = fast_config();
    cfg.join_timeout = std::chrono::milliseconds(50);

    // The transform ignores cancellation; what it touches is shared state.
    auto entered = std::make_shared<std::atomic<bool>>(false);
    auto transform = [entered](const EchoRequest& req) {
        entered->store(true);
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        return default_async_transform(req);
    };

    fake_stream stream({.inputs = numbered("m", 3), .hold_open = true});
    std::thread canceller([&] {
        wait_until([&] { return entered->load(); }, scaled_ms(2000));
        stream.cancel(sync::cancel_reason::peer_disconnected);
    });

    auto start = std::chrono::steady_clock::now();
    auto report = run_pipeline(stream, cfg, transform);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    REQUIRE(report.outcome == pipeline_outcome::cancelled);
    REQUIRE_FALSE(report.activities_joined);
    REQUIRE(elapsed < scaled_ms(2000));
    REQUIRE(stream.write_count() == 0);

    // Let the detached activity finish before the test exits
    std::this_thread::sleep_for(std::chrono::milliseconds(500));
}

TEST_CASE("pipeline fails cleanly when a stage cannot start", "[echo][pipeline]") {
    int fail_at = 0;
    SECTION("ingestion") { fail_at = 1; }
    SECTION("processing") { fail_at = 2; }
    int launches = 0;
    stage_launcher launcher = [&launches, fail_at](std::string name, std::function<void()> body) {
        if (++launches == fail_at) {
            throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again),
                                    "thread creation failed");
        }
        return runtime::activity::spawn(std::move(name), std::move(body));
    };

    auto report = [&] {
        fake_stream stream({.inputs = numbered("m", 3), .hold_open = true});
        stream_session session(EchoBidirectionalStreamAsync::name, 1, stream.token());
        session.activate();
        async_pipeline pipeline(stream, session, default_async_transform, fast_config(), launcher);
        auto result = pipeline.run();

        REQUIRE(session.state() == session_state::errored);
        auto status = stream.aborted();
        REQUIRE(status.has_value());
        REQUIRE(status->code == rpc::status_code::internal);
        REQUIRE(status->detail.find("cannot start") != std::string::npos);
        return result;
    }();

    // Any stage that did start was joined before the stream went away
    REQUIRE(report.outcome == pipeline_outcome::processing_fault);
    REQUIRE(report.status == rpc::status_code::internal);
    REQUIRE(report.activities_joined);
    REQUIRE(report.responses == 0);
}

TEST_CASE("pipeline that never ran aborts its call", "[echo][pipeline]") {
    fake_stream stream({.inputs = {"unused"}});
    stream_session session(EchoBidirectionalStreamAsync::name, 1, stream.token());
    session.activate();
    {
        async_pipeline pipeline(stream, session, default_async_transform, fast_config());
    }
    auto status = stream.aborted();
    REQUIRE(status.has_value());
    REQUIRE(status->code == rpc::status_code::internal);
    REQUIRE(session.state() == session_state::errored);
    REQUIRE(stream.reads() == 0);
}

TEST_CASE("pipeline drops results finished after emission stopped", "[echo][pipeline]") {
    auto cfg = fast_config();
    cfg.join_timeout = scaled_ms(2000);

    // Holds the first result until emission has given up on the call
    auto entered = std::make_shared<std::atomic<bool>>(false);
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto transform = [entered, release](const EchoRequest& req) {
        entered->store(true);
        while (!release->load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return default_async_transform(req);
    };

    fake_stream stream({.inputs = {"late"}, .hold_open = true});
    std::thread peer([&] {
        wait_until([&] { return entered->load(); }, scaled_ms(2000));
        stream.cancel(sync::cancel_reason::peer_disconnected);
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        release->store(true);
    });

    auto report = run_pipeline(stream, cfg, transform);
    peer.join();

    REQUIRE(report.outcome == pipeline_outcome::cancelled);
    REQUIRE(report.reason == sync::cancel_reason::peer_disconnected);
    REQUIRE(report.processed == 0);
    REQUIRE(report.dropped == 1);
    REQUIRE(report.activities_joined);
    REQUIRE(stream.write_count() == 0);
}
