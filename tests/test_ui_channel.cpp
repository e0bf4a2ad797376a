#include <catch2/catch_test_macros.hpp>

#include "ui/ui_channel.hpp"

#include <poll.h>
#include <string>
#include <thread>
#include <vector>

namespace {

bool readable(int fd, int timeout_ms = 0) {
    pollfd pfd{.fd = fd, .events = POLLIN, .revents = 0};
    return ::poll(&pfd, 1, timeout_ms) == 1;
}

} // namespace

TEST_CASE("UI channel", "[ui]") {
    UiChannel channel;
    REQUIRE(channel.init());
    REQUIRE(channel.event_fd() >= 0);

    SECTION("EmptyChannelNotReadable") {
        REQUIRE_FALSE(readable(channel.event_fd()));
        REQUIRE_FALSE(channel.try_recv().has_value());
    }

    SECTION("SendWakesConsumer") {
        REQUIRE(channel.send(UiSignal::open("a.md")));
        REQUIRE(readable(channel.event_fd()));

        auto signals = channel.drain();
        REQUIRE(signals.size() == 1);
        REQUIRE_FALSE(readable(channel.event_fd()));
    }

    SECTION("DrainPreservesOrder") {
        REQUIRE(channel.send(UiSignal::open("1.md")));
        REQUIRE(channel.send(UiSignal::focus()));
        REQUIRE(channel.send(UiSignal::open("2.md")));

        auto signals = channel.drain();
        REQUIRE(signals.size() == 3);
        REQUIRE(signals[0].path == "1.md");
        REQUIRE(signals[1].kind == UiSignalKind::Focus);
        REQUIRE(signals[2].path == "2.md");
    }

    SECTION("CloseRejectsSendsAndWakes") {
        channel.close();
        REQUIRE(channel.closed());
        REQUIRE(readable(channel.event_fd()));
        REQUIRE_FALSE(channel.send(UiSignal::focus()));
    }

    SECTION("CrossThreadDelivery") {
        constexpr int COUNT = 500;
        std::jthread producer([&channel] {
            for (int i = 0; i < COUNT; ++i) {
                channel.send(UiSignal::open(std::to_string(i)));
            }
        });

        std::vector<UiSignal> received;
        while (received.size() < COUNT) {
            REQUIRE(readable(channel.event_fd(), 2000));
            for (auto& s : channel.drain()) received.push_back(std::move(s));
        }
        producer.join();

        REQUIRE(received.size() == COUNT);
        for (int i = 0; i < COUNT; ++i) {
            REQUIRE(received[i].path == std::to_string(i));
        }
    }
}
