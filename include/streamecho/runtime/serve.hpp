#pragma once

/// @file serve.hpp
/// @brief Server lifecycle utilities
///
/// Shutdown signals are blocked process-wide before any thread is spawned and
/// then consumed synchronously with sigwaitinfo, so no handler ever runs
/// concurrently with server threads.
///
/// Usage:
/// @code
/// int main() {
///     auto sigs = runtime::block_shutdown_signals();   // before any thread
///
///     rpc::stream_server srv(cfg);
///     if (!srv.start(net::ipv4_address(8080))) return 1;
///
///     runtime::serve(srv, sigs);
///     return 0;
/// }
/// @endcode

#include <streamecho/log/macros.hpp>

#include <csignal>
#include <cerrno>
#include <initializer_list>
#include <string>
#include <pthread.h>

namespace streamecho::runtime {

/// Default shutdown signals
inline constexpr std::initializer_list<int> default_shutdown_signals = {SIGINT, SIGTERM};

/// Set of signals consumed synchronously
class signal_set {
public:
    signal_set() noexcept {
        sigemptyset(&mask_);
    }

    signal_set(std::initializer_list<int> signals) noexcept {
        sigemptyset(&mask_);
        for (int sig : signals) {
            sigaddset(&mask_, sig);
        }
    }

    signal_set& add(int signo) noexcept {
        sigaddset(&mask_, signo);
        return *this;
    }

    bool contains(int signo) const noexcept {
        return sigismember(&mask_, signo) == 1;
    }

    const sigset_t& mask() const noexcept {
        return mask_;
    }

    /// Block these signals for the calling thread and every thread it
    /// spawns afterwards.
    bool block() const noexcept {
        return pthread_sigmask(SIG_BLOCK, &mask_, nullptr) == 0;
    }

    /// Wait until one of the signals is pending and consume it.
    /// @return The signal number, or -1 on failure
    int wait() const noexcept {
        for (;;) {
            siginfo_t info{};
            int signo = sigwaitinfo(&mask_, &info);
            if (signo >= 0) {
                return signo;
            }
            if (errno != EINTR) {
                return -1;
            }
        }
    }

private:
    sigset_t mask_;
};

/// Get full signal name (e.g., "SIGINT")
inline std::string signal_name(int signo) {
    const char* abbrev = sigabbrev_np(signo);
    if (abbrev) {
        return std::string("SIG") + abbrev;
    }
    return "SIG" + std::to_string(signo);
}

/// Block the shutdown signals. Call first thing in main().
inline signal_set block_shutdown_signals(
    std::initializer_list<int> signals = default_shutdown_signals) {
    signal_set sigs(signals);
    if (!sigs.block()) {
        STREAMECHO_LOG_ERROR("Failed to block shutdown signals: errno={}", errno);
    }
    return sigs;
}

/// Wait for a shutdown signal, then stop the server.
///
/// @tparam Server Server type (must have stop() method)
template<typename Server>
void serve(Server& server, const signal_set& sigs) {
    int signo = sigs.wait();
    if (signo > 0) {
        STREAMECHO_LOG_INFO("Received {}, initiating shutdown...", signal_name(signo));
    } else {
        STREAMECHO_LOG_ERROR("Waiting for shutdown signal failed, stopping");
    }

    server.stop();
    STREAMECHO_LOG_INFO("Server stopped");
}

} // namespace streamecho::runtime
