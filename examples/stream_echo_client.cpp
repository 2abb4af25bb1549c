/// @file stream_echo_client.cpp
/// @brief Streaming echo client
///
/// Drives the echo call shapes against a running stream_echo_server and logs
/// every response. Runs continuously (a round per second) until Ctrl+C, or a
/// single round with --once.
///
/// Usage: ./stream_echo_client [--server host:port] [--test client|server|sync|async|all]
///                             [--messages N] [--once] [--verbose]

#include <streamecho/echo/messages.hpp>
#include <streamecho/rpc/rpc.hpp>
#include <streamecho/runtime/serve.hpp>
#include <streamecho/sync/cancel_token.hpp>

#include <fmt/format.h>

#include <atomic>
#include <cstring>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace streamecho;
using namespace streamecho::echo;

namespace {

struct client_options {
    std::string host = "localhost";
    uint16_t port = 8080;
    std::string test = "all";
    size_t messages = 5;
    bool once = false;
};

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --server host:port   Server address (default localhost:8080)\n"
              << "  --test NAME          client, server, sync, async or all (default all)\n"
              << "  --messages N         Messages per streaming call (default 5)\n"
              << "  --once               Run one round and exit\n"
              << "  --verbose            Debug logging\n";
}

std::vector<std::string> make_messages(const char* prefix, size_t count) {
    std::vector<std::string> out;
    out.reserve(count);
    for (size_t i = 1; i <= count; ++i) {
        out.push_back(fmt::format("{} message {}", prefix, i));
    }
    return out;
}

bool check(const char* name, const rpc::rpc_status& status) {
    if (status.ok()) {
        return true;
    }
    STREAMECHO_LOG_ERROR("{} failed: {} ({})", name, rpc::status_code_str(status.code), status.detail);
    return false;
}

// Many requests, one response
bool run_client_stream(rpc::stream_client& client, size_t count) {
    auto call = client.open<EchoClientStream>();
    for (auto& text : make_messages("client-stream", count)) {
        STREAMECHO_LOG_INFO("EchoClientStream: Sending: {}", text);
        if (!call.write(EchoRequest{text})) {
            break;
        }
    }
    call.writes_done();
    auto result = call.finish_with_response();
    if (!result) {
        return check(EchoClientStream::name, result.status());
    }
    STREAMECHO_LOG_INFO("EchoClientStream: Response: {}", result->message);
    return true;
}

// One request, several responses
bool run_server_stream(rpc::stream_client& client) {
    auto call = client.open<EchoServerStream>();
    call.write(EchoRequest{"server-stream request"});
    call.writes_done();
    while (auto response = call.read()) {
        STREAMECHO_LOG_INFO("EchoServerStream: Response: {}", response->message);
    }
    return check(EchoServerStream::name, call.finish());
}

// Lock-step: each write waits for its answer
bool run_sync_bidi(rpc::stream_client& client, size_t count) {
    auto call = client.open<EchoBidirectionalStreamSync>();
    for (auto& text : make_messages("sync", count)) {
        if (!call.write(EchoRequest{text})) {
            break;
        }
        auto response = call.read();
        if (!response) {
            break;
        }
        STREAMECHO_LOG_INFO("EchoBidirectionalStreamSync: {} -> {}", text, response->message);
    }
    call.writes_done();
    return check(EchoBidirectionalStreamSync::name, call.finish());
}

// Writes and reads overlap; responses trail the processing delay
bool run_async_bidi(rpc::stream_client& client, size_t count) {
    auto call = client.open<EchoBidirectionalStreamAsync>();
    std::thread writer([&call, count] {
        for (auto& text : make_messages("async", count)) {
            STREAMECHO_LOG_INFO("EchoBidirectionalStreamAsync: Sending: {}", text);
            if (!call.write(EchoRequest{text})) {
                break;
            }
        }
        call.writes_done();
    });
    while (auto response = call.read()) {
        STREAMECHO_LOG_INFO("EchoBidirectionalStreamAsync: Response: {}", response->message);
    }
    writer.join();
    return check(EchoBidirectionalStreamAsync::name, call.finish());
}

using test_fn = std::function<bool(rpc::stream_client&)>;

/// Run one test repeatedly until stop fires, or once.
/// @return true if every round succeeded
bool drive(const char* name, const client_options& opts, const test_fn& test,
           const sync::cancel_token& stop) {
    bool all_ok = true;
    do {
        auto client = rpc::stream_client::connect(opts.host, opts.port);
        if (!client) {
            STREAMECHO_LOG_ERROR("{}: cannot connect to {}:{}: {}", name, opts.host, opts.port,
                                 std::strerror(client.error()));
            all_ok = false;
        } else {
            bool ok = test(**client);
            all_ok = all_ok && ok;
            (*client)->close();
        }
    } while (!opts.once && !stop.wait_for(std::chrono::seconds(1)));
    return all_ok;
}

} // namespace

int main(int argc, char* argv[]) {
    auto sigs = runtime::block_shutdown_signals();

    client_options opts;
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--server" && i + 1 < argc) {
                std::string addr = argv[++i];
                auto colon = addr.rfind(':');
                if (colon == std::string::npos) {
                    opts.host = addr;
                } else {
                    opts.host = addr.substr(0, colon);
                    auto port = net::parse_port(addr.substr(colon + 1));
                    if (!port) {
                        throw std::invalid_argument("bad port in --server " + addr);
                    }
                    opts.port = *port;
                }
            } else if (arg == "--test" && i + 1 < argc) {
                opts.test = argv[++i];
            } else if (arg == "--messages" && i + 1 < argc) {
                opts.messages = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--once") {
                opts.once = true;
            } else if (arg == "--verbose" || arg == "-v") {
                log::logger::instance().set_level(log::level::debug);
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 2;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << "\n";
        return 2;
    }

    struct named_test {
        const char* key;
        const char* name;
        test_fn fn;
    };
    size_t n = opts.messages;
    std::vector<named_test> tests = {
        {"client", EchoClientStream::name, [n](rpc::stream_client& c) { return run_client_stream(c, n); }},
        {"server", EchoServerStream::name, [](rpc::stream_client& c) { return run_server_stream(c); }},
        {"sync", EchoBidirectionalStreamSync::name, [n](rpc::stream_client& c) { return run_sync_bidi(c, n); }},
        {"async", EchoBidirectionalStreamAsync::name, [n](rpc::stream_client& c) { return run_async_bidi(c, n); }},
    };

    std::vector<const named_test*> selected;
    for (auto& t : tests) {
        if (opts.test == "all" || opts.test == t.key) {
            selected.push_back(&t);
        }
    }
    if (selected.empty()) {
        std::cerr << "Unknown test: " << opts.test << "\n";
        print_usage(argv[0]);
        return 2;
    }

    sync::cancel_source stop;
    std::thread signal_waiter;
    if (!opts.once) {
        signal_waiter = std::thread([&sigs, &stop] {
            int signo = sigs.wait();
            STREAMECHO_LOG_INFO("Received {}, stopping", runtime::signal_name(signo));
            stop.cancel(sync::cancel_reason::requested);
        });
    }

    STREAMECHO_LOG_INFO("Connecting to {}:{}", opts.host, opts.port);
    std::atomic<bool> failed{false};
    std::vector<std::thread> workers;
    for (auto* t : selected) {
        workers.emplace_back([t, &opts, &stop, &failed] {
            if (!drive(t->name, opts, t->fn, stop.get_token())) {
                failed.store(true);
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    if (signal_waiter.joinable()) {
        // Only a signal ends continuous mode, so the waiter has returned.
        signal_waiter.join();
    }

    if (failed.load()) {
        STREAMECHO_LOG_ERROR("One or more calls failed");
        return opts.once ? 1 : 0;
    }
    STREAMECHO_LOG_INFO("Done");
    return 0;
}
