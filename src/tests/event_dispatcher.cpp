#include <render-loop/event_dispatcher.hpp>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <vector>

using namespace lwgpu;

TEST_CASE("Events are delivered to the handlers of their kind", "[event_dispatcher]")
{
    EventDispatcher          dispatcher;
    std::vector<WindowEvent> resizes;
    int                      closes = 0;

    dispatcher.subscribe(WindowEventKind::Resized, [&resizes](const WindowEvent& event) {
        resizes.push_back(event);
    });
    dispatcher.subscribe(WindowEventKind::CloseRequested, [&closes](const WindowEvent&) {
        ++closes;
    });

    dispatcher.post(WindowEvent::resized({640, 480}));
    dispatcher.post(WindowEvent::redrawRequested());
    dispatcher.post(WindowEvent::closeRequested());
    dispatcher.post(WindowEvent::resized({320, 240}));

    REQUIRE(dispatcher.pendingCount() == 4);
    REQUIRE(dispatcher.dispatchPending() == 4);
    REQUIRE(dispatcher.pendingCount() == 0);

    REQUIRE(resizes.size() == 2);
    REQUIRE(resizes[0].size == FramebufferSize{640, 480});
    REQUIRE(resizes[1].size == FramebufferSize{320, 240});
    REQUIRE(closes == 1);
}

TEST_CASE("Handlers of the same kind run in subscription order", "[event_dispatcher]")
{
    EventDispatcher  dispatcher;
    std::vector<int> order;

    dispatcher.subscribe(WindowEventKind::RedrawRequested, [&](const WindowEvent&) {
        order.push_back(1);
    });
    dispatcher.subscribe(WindowEventKind::RedrawRequested, [&](const WindowEvent&) {
        order.push_back(2);
    });
    REQUIRE(dispatcher.handlerCount(WindowEventKind::RedrawRequested) == 2);
    REQUIRE(dispatcher.handlerCount(WindowEventKind::Resized) == 0);

    dispatcher.post(WindowEvent::redrawRequested());
    dispatcher.dispatchPending();

    REQUIRE(order == std::vector<int>{1, 2});
}

SCENARIO("Events posted by a handler", "[event_dispatcher]")
{
    GIVEN("a resize handler which posts a redraw")
    {
        EventDispatcher              dispatcher;
        std::vector<WindowEventKind> delivered;

        dispatcher.subscribe(WindowEventKind::Resized, [&](const WindowEvent& event) {
            delivered.push_back(event.kind);
            dispatcher.post(WindowEvent::redrawRequested());
            // Nested dispatching is refused.
            REQUIRE(dispatcher.dispatchPending() == 0);
            REQUIRE(dispatcher.dispatching());
        });
        dispatcher.subscribe(WindowEventKind::RedrawRequested, [&](const WindowEvent& event) {
            delivered.push_back(event.kind);
        });
        dispatcher.subscribe(WindowEventKind::CloseRequested, [&](const WindowEvent& event) {
            delivered.push_back(event.kind);
        });

        WHEN("a resize and a close are dispatched")
        {
            dispatcher.post(WindowEvent::resized({100, 100}));
            dispatcher.post(WindowEvent::closeRequested());
            const auto count = dispatcher.dispatchPending();

            THEN("the redraw is delivered after the events queued before it")
            {
                REQUIRE(count == 3);
                const std::vector<WindowEventKind> expected{
                    WindowEventKind::Resized,
                    WindowEventKind::CloseRequested,
                    WindowEventKind::RedrawRequested};
                REQUIRE(delivered == expected);
                REQUIRE_FALSE(dispatcher.dispatching());
            }
        }
    }
}

TEST_CASE("Subscribing from a handler is an error", "[event_dispatcher]")
{
    EventDispatcher dispatcher;
    bool            threw = false;

    dispatcher.subscribe(WindowEventKind::CloseRequested, [&](const WindowEvent&) {
        try
        {
            dispatcher.subscribe(WindowEventKind::Resized, [](const WindowEvent&) {});
        }
        catch (const std::logic_error&)
        {
            threw = true;
        }
    });

    dispatcher.post(WindowEvent::closeRequested());
    dispatcher.dispatchPending();

    REQUIRE(threw);
    REQUIRE(dispatcher.handlerCount(WindowEventKind::Resized) == 0);
}

TEST_CASE("The dispatcher can be used again after a handler throws", "[event_dispatcher]")
{
    EventDispatcher dispatcher;
    int             calls = 0;

    dispatcher.subscribe(WindowEventKind::Resized, [&](const WindowEvent&) {
        if (++calls == 1)
        {
            throw std::runtime_error("handler failed");
        }
    });

    dispatcher.post(WindowEvent::resized({1, 1}));
    REQUIRE_THROWS_AS(dispatcher.dispatchPending(), std::runtime_error);
    REQUIRE_FALSE(dispatcher.dispatching());

    dispatcher.post(WindowEvent::resized({2, 2}));
    REQUIRE(dispatcher.dispatchPending() == 1);
    REQUIRE(calls == 2);
}
