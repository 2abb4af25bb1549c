#include <catch2/catch.hpp>
#include <streamecho/sync/cancel_token.hpp>

#include "../test_helpers.hpp"

#include <atomic>
#include <thread>

using namespace streamecho::sync;
using namespace streamecho::test;

TEST_CASE("cancel_source basic state", "[sync][cancel]") {
    cancel_source source;
    auto token = source.get_token();

    REQUIRE_FALSE(token.is_cancelled());
    REQUIRE(token.reason() == cancel_reason::none);

    SECTION("first raise wins") {
        REQUIRE(source.cancel(cancel_reason::peer_cancelled));
        REQUIRE_FALSE(source.cancel(cancel_reason::processing_fault));
        REQUIRE(token.is_cancelled());
        REQUIRE(token.reason() == cancel_reason::peer_cancelled);
    }

    SECTION("copies share the signal") {
        cancel_source copy = source;
        copy.cancel(cancel_reason::transport_fault);
        REQUIRE(source.is_cancelled());
        REQUIRE(source.reason() == cancel_reason::transport_fault);
    }
}

TEST_CASE("default token is never cancelled", "[sync][cancel]") {
    cancel_token token;
    REQUIRE_FALSE(token.is_cancelled());
    REQUIRE_FALSE(token.wait_for(std::chrono::milliseconds(1)));
}

TEST_CASE("cancel callbacks", "[sync][cancel]") {
    cancel_source source;
    auto token = source.get_token();
    std::atomic<int> calls{0};

    SECTION("run once on cancel") {
        auto reg = token.on_cancel([&] { ++calls; });
        source.cancel();
        source.cancel();
        REQUIRE(calls == 1);
    }

    SECTION("run immediately when already cancelled") {
        source.cancel();
        auto reg = token.on_cancel([&] { ++calls; });
        REQUIRE(calls == 1);
    }

    SECTION("do not run after unregistering") {
        {
            auto reg = token.on_cancel([&] { ++calls; });
        }
        source.cancel();
        REQUIRE(calls == 0);
    }
}

TEST_CASE("wait_for wakes on cancel", "[sync][cancel]") {
    cancel_source source;
    auto token = source.get_token();

    SECTION("times out without cancel") {
        auto start = std::chrono::steady_clock::now();
        REQUIRE_FALSE(token.wait_for(std::chrono::milliseconds(30)));
        REQUIRE(std::chrono::steady_clock::now() - start >= std::chrono::milliseconds(30));
    }

    SECTION("returns early on cancel") {
        std::thread canceller([&] {
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            source.cancel(cancel_reason::deadline_exceeded);
        });
        auto start = std::chrono::steady_clock::now();
        REQUIRE(token.wait_for(scaled_sec(10)));
        REQUIRE(std::chrono::steady_clock::now() - start < scaled_sec(5));
        canceller.join();
        REQUIRE(token.reason() == cancel_reason::deadline_exceeded);
    }
}

TEST_CASE("linked source follows its parent", "[sync][cancel]") {
    cancel_source parent;

    SECTION("parent cancel propagates with its reason") {
        cancel_source child(parent.get_token());
        parent.cancel(cancel_reason::peer_disconnected);
        REQUIRE(child.is_cancelled());
        REQUIRE(child.reason() == cancel_reason::peer_disconnected);
    }

    SECTION("child cancel does not reach the parent") {
        cancel_source child(parent.get_token());
        child.cancel(cancel_reason::processing_fault);
        REQUIRE(child.is_cancelled());
        REQUIRE_FALSE(parent.is_cancelled());
    }

    SECTION("child of a cancelled parent starts cancelled") {
        parent.cancel(cancel_reason::server_shutdown);
        cancel_source child(parent.get_token());
        REQUIRE(child.is_cancelled());
        REQUIRE(child.reason() == cancel_reason::server_shutdown);
    }

    SECTION("destroyed child leaves the parent usable") {
        {
            cancel_source child(parent.get_token());
        }
        REQUIRE(parent.cancel(cancel_reason::requested));
    }
}

TEST_CASE("cancel_reason names", "[sync][cancel]") {
    REQUIRE(std::string(cancel_reason_str(cancel_reason::none)) == "none");
    REQUIRE(std::string(cancel_reason_str(cancel_reason::peer_disconnected)) == "peer disconnected");
    REQUIRE(std::string(cancel_reason_str(cancel_reason::server_shutdown)) == "server shutdown");
}
