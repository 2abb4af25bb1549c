/// @file stream_echo_server.cpp
/// @brief Streaming echo server
///
/// Serves the four echo call shapes until SIGINT or SIGTERM, then stops
/// accepting, cancels the calls in flight and waits for them to wind down.
///
/// Usage: ./stream_echo_server [--port N] [--workers N] [--queue-capacity N]
///                             [--processing-delay MS] [--verbose]

#include <streamecho/echo/service.hpp>
#include <streamecho/rpc/rpc.hpp>
#include <streamecho/runtime/serve.hpp>

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

using namespace streamecho;

namespace {

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options]\n"
              << "  --port N               Listen port (default 8080)\n"
              << "  --workers N            Concurrent calls (default 10)\n"
              << "  --queue-capacity N     Async pipeline queue capacity (default 10)\n"
              << "  --processing-delay MS  Simulated work per async message (default 200)\n"
              << "  --verbose              Debug logging\n";
}

} // namespace

int main(int argc, char* argv[]) {
    // Before any thread exists, so every thread inherits the mask.
    auto sigs = runtime::block_shutdown_signals();

    uint16_t port = 8080;
    rpc::server_config server_cfg;
    echo::service_config service_cfg;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--port" && i + 1 < argc) {
                auto parsed = net::parse_port(argv[++i]);
                if (!parsed) {
                    throw std::invalid_argument(std::string("bad --port ") + argv[i]);
                }
                port = *parsed;
            } else if (arg == "--workers" && i + 1 < argc) {
                server_cfg.num_workers = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--queue-capacity" && i + 1 < argc) {
                service_cfg.queue_capacity = static_cast<size_t>(std::stoul(argv[++i]));
            } else if (arg == "--processing-delay" && i + 1 < argc) {
                service_cfg.processing_delay = std::chrono::milliseconds(std::stol(argv[++i]));
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

    rpc::stream_server server(server_cfg);
    echo::echo_service service(service_cfg);
    service.register_with(server);

    auto bound = server.start(net::ipv4_address(port));
    if (!bound) {
        STREAMECHO_LOG_ERROR("Failed to start server on port {}: {}", port, std::strerror(bound.error()));
        return 1;
    }
    STREAMECHO_LOG_INFO("Stream echo server started on {}", bound->to_string());
    STREAMECHO_LOG_INFO("Press Ctrl+C to stop");

    runtime::serve(server, sigs);

    const auto& stats = service.stats();
    STREAMECHO_LOG_INFO("Sessions: {} closed, {} cancelled, {} errored",
                        stats.closed.load(), stats.cancelled.load(), stats.errored.load());
    return 0;
}
