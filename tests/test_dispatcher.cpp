#include <catch2/catch_test_macros.hpp>

#include "dispatcher.hpp"
#include "ui/ui_channel.hpp"

TEST_CASE("Command dispatcher", "[dispatcher]") {
    UiChannel channel;
    REQUIRE(channel.init());
    CommandDispatcher dispatcher(channel);

    SECTION("PingHasNoSideEffect") {
        for (int i = 0; i < 10; ++i) {
            REQUIRE(dispatcher.dispatch(PingCommand{}).ok());
        }
        REQUIRE(channel.drain().empty());
    }

    SECTION("OpenQueuesSignal") {
        auto resp = dispatcher.dispatch(OpenCommand{"/home/me/notes.md"});
        REQUIRE(resp.ok());

        auto signals = channel.drain();
        REQUIRE(signals.size() == 1);
        REQUIRE(signals[0].kind == UiSignalKind::Open);
        REQUIRE(signals[0].path == "/home/me/notes.md");
    }

    SECTION("OpenPassesPathThroughUnvalidated") {
        REQUIRE(dispatcher.dispatch(OpenCommand{"does/not/exist.md"}).ok());
        auto signal = channel.try_recv();
        REQUIRE(signal.has_value());
        REQUIRE(signal->path == "does/not/exist.md");
    }

    SECTION("ShowQueuesFocus") {
        REQUIRE(dispatcher.dispatch(ShowCommand{}).ok());
        auto signal = channel.try_recv();
        REQUIRE(signal.has_value());
        REQUIRE(signal->kind == UiSignalKind::Focus);
    }

    SECTION("ClosedChannelDegradesOpenAndShow") {
        channel.close();

        auto open = dispatcher.dispatch(OpenCommand{"a.md"});
        REQUIRE_FALSE(open.ok());
        REQUIRE(open.message == "ui unavailable");

        REQUIRE_FALSE(dispatcher.dispatch(ShowCommand{}).ok());

        // The process is still alive even if the UI is not.
        REQUIRE(dispatcher.dispatch(PingCommand{}).ok());
    }
}
