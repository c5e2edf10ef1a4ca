// test_connection_coordinator.cpp - Link lifecycle and request coalescing
//
// Tests:
// 1. Concurrent callers share one physical connect; only the last proceeds
// 2. Fast path on a live link
// 3. Connect failures propagate to every waiter and reset the state
// 4. Radio-level slot retries are bounded by max_connect_attempts
// 5. Disconnect while connecting releases every waiter
// 6. Peer-initiated disconnect
// 7. Idle timeout closes the link; activity pushes it out
// 8. State events arrive in transition order
// 9. Reconnect after a cancel waits for the cancelled connect to return
// 10. Non-transport errors during link-up reach every waiter

#include "test_support.hpp"
#include "device/connection_coordinator.hpp"
#include "sim/simulated_blind.hpp"

#include <stdexcept>
#include <thread>
#include <vector>

using namespace blindlink;
using namespace blindlink::device;
using namespace std::chrono_literals;
using transport::TransportError;
using transport::TransportErrorKind;

namespace {

const LinkTarget TARGET{"AA:BB:CC:DD:EE:FF", "Living room"};

// Start `count` callers one after another so each registers before the next
std::vector<std::thread> startCallers(ConnectionCoordinator& coord, std::vector<int>& results,
                                      size_t count) {
    std::vector<std::thread> callers;
    for (size_t i = 0; i < count; i++) {
        callers.emplace_back([&coord, &results, i] {
            results[i] = coord.ensureReady() ? 1 : 0;
        });
        test::waitUntil([&coord, i] { return coord.waitingCallers() == i + 1; });
    }
    return callers;
}

void joinAll(std::vector<std::thread>& threads) {
    for (auto& th : threads) th.join();
}

// Runs ensureReady and reports the TransportError kind it threw, if any
struct ThrowingCaller {
    bool threw = false;
    TransportErrorKind kind = TransportErrorKind::TRANSIENT;

    void run(ConnectionCoordinator& coord) {
        try {
            coord.ensureReady();
        } catch (const TransportError& e) {
            threw = true;
            kind = e.kind();
        }
    }
};

} // namespace

int main() {
    std::cout << "=== Connection Coordinator Unit Test ===\n\n";

    setLogLevel(LogLevel::WARN);

    test::TestCounter t;

    // ========================================================================
    // TEST 1: Coalescing, last caller wins
    // ========================================================================
    std::cout << "TEST 1: Coalescing\n";
    {
        sim::SimulatedBlind blind;
        test::ManualScheduler sched;
        ConnectionCoordinator coord(blind, sched);
        coord.setTarget(TARGET);

        blind.holdConnects();
        std::vector<int> results(3, -1);
        auto callers = startCallers(coord, results, 3);

        t.check(test::waitUntil([&] { return blind.connectsWaiting() == 1; }),
                "one connect in flight");
        t.check(coord.getState() == ConnectionState::CONNECTING, "state CONNECTING while waiting");
        t.check(coord.waitingCallers() == 3, "three callers waiting");

        blind.releaseConnects();
        joinAll(callers);

        t.check(blind.connectCalls() == 1, "exactly one physical connect");
        t.check(sched.spawnedTasks() == 1, "exactly one connect task spawned");
        t.check(results[0] == 0 && results[1] == 0, "earlier callers get false");
        t.check(results[2] == 1, "last caller gets true");
        t.check(coord.getState() == ConnectionState::CONNECTED, "state CONNECTED");
        t.check(coord.idleTimer().isArmed(), "idle timer armed on success");

        CoordinatorStats stats = coord.getStats();
        t.check(stats.attempts_started == 1 && stats.callers_coalesced == 2,
                "stats: 1 attempt, 2 coalesced");
    }

    // ========================================================================
    // TEST 2: Fast path
    // ========================================================================
    std::cout << "\nTEST 2: Fast path on a live link\n";
    {
        sim::SimulatedBlind blind;
        test::ManualScheduler sched;
        ConnectionCoordinator coord(blind, sched);
        coord.setTarget(TARGET);

        t.check(coord.ensureReady(), "first ensureReady connects");
        t.check(coord.ensureReady(), "second ensureReady is immediate");
        t.check(coord.ensureReady(), "third ensureReady is immediate");
        t.check(blind.connectCalls() == 1, "no reconnect on a live link");
        t.check(coord.getLink().has_value(), "link handle exposed");
    }

    // ========================================================================
    // TEST 3: Connect failures
    // ========================================================================
    std::cout << "\nTEST 3: Connect failures propagate\n";
    {
        sim::SimulatedBlind blind;
        test::ManualScheduler sched;
        ConnectionCoordinator coord(blind, sched);
        coord.setTarget(TARGET);

        blind.setConnectError(TransportErrorKind::SLOTS_EXHAUSTED);
        blind.holdConnects();

        ThrowingCaller first, second;
        std::thread a([&] { first.run(coord); });
        test::waitUntil([&] { return coord.waitingCallers() == 1; });
        std::thread b([&] { second.run(coord); });
        test::waitUntil([&] { return coord.waitingCallers() == 2; });

        blind.releaseConnects();
        a.join();
        b.join();

        t.check(first.threw && first.kind == TransportErrorKind::SLOTS_EXHAUSTED,
                "first waiter sees SLOTS_EXHAUSTED");
        t.check(second.threw && second.kind == TransportErrorKind::SLOTS_EXHAUSTED,
                "second waiter sees SLOTS_EXHAUSTED");
        t.check(coord.getState() == ConnectionState::DISCONNECTED, "state reset to DISCONNECTED");
        t.check(!coord.isAttemptInFlight(), "no attempt left pending");
        t.check(!coord.idleTimer().isArmed(), "idle timer not armed");

        blind.setConnectError(TransportErrorKind::NOT_FOUND);
        ThrowingCaller lone;
        lone.run(coord);
        t.check(lone.threw && lone.kind == TransportErrorKind::NOT_FOUND, "NOT_FOUND propagates");

        blind.setConnectError(std::nullopt);
        t.check(coord.ensureReady(), "next call starts a fresh attempt");
        t.check(blind.connectCalls() == 3, "three physical connects in total");
        t.check(coord.getStats().attempts_failed == 2, "stats: 2 failed attempts");
    }

    // ========================================================================
    // TEST 4: Slot retries
    // ========================================================================
    std::cout << "\nTEST 4: Slot retries bounded by max_connect_attempts\n";
    {
        sim::SimulatedBlind blind;
        test::ManualScheduler sched;
        CoordinatorConfig config;
        config.max_connect_attempts = 5;
        ConnectionCoordinator coord(blind, sched, config);
        coord.setTarget(TARGET);

        blind.setBusySlots(3);
        t.check(coord.ensureReady(), "connects after 3 busy slots");
        t.check(blind.radioAttempts() == 4, "4 radio attempts");

        coord.disconnect();
        blind.setBusySlots(10);
        ThrowingCaller caller;
        caller.run(coord);
        t.check(caller.threw && caller.kind == TransportErrorKind::SLOTS_EXHAUSTED,
                "gives up with SLOTS_EXHAUSTED");
        t.check(blind.radioAttempts() == 9, "stopped after 5 more radio attempts");
    }

    // ========================================================================
    // TEST 5: Disconnect while connecting
    // ========================================================================
    std::cout << "\nTEST 5: Disconnect while connecting\n";
    {
        sim::SimulatedBlind blind;
        test::ManualScheduler sched;
        ConnectionCoordinator coord(blind, sched);
        coord.setTarget(TARGET);

        blind.holdConnects();
        std::vector<int> results(2, -1);
        auto callers = startCallers(coord, results, 2);
        test::waitUntil([&] { return blind.connectsWaiting() == 1; });

        coord.disconnect();
        joinAll(callers);

        t.check(results[0] == 0 && results[1] == 0, "every waiter released with false");
        t.check(coord.getState() == ConnectionState::DISCONNECTED, "state DISCONNECTED");
        t.check(!coord.idleTimer().isArmed(), "idle timer not armed");
        t.check(!coord.isAttemptInFlight(), "attempt resolved");

        // The connect finishing late must not resurrect the link
        blind.releaseConnects();
        t.check(test::waitUntil([&] { return blind.disconnectCalls() == 1; }),
                "late link closed again");
        sched.joinAll();
        t.check(!coord.getLink().has_value(), "no link recorded");
        t.check(coord.getState() == ConnectionState::DISCONNECTED, "still DISCONNECTED");
        t.check(coord.getStats().attempts_cancelled == 1, "stats: 1 cancelled attempt");
    }

    // ========================================================================
    // TEST 6: Peer disconnect
    // ========================================================================
    std::cout << "\nTEST 6: Peer-initiated disconnect\n";
    {
        sim::SimulatedBlind blind;
        test::ManualScheduler sched;
        ConnectionCoordinator coord(blind, sched);
        coord.setTarget(TARGET);

        t.check(coord.ensureReady(), "connected");
        blind.dropLink();

        t.check(coord.getState() == ConnectionState::DISCONNECTED, "state DISCONNECTED after drop");
        t.check(!coord.getLink().has_value(), "link cleared");
        t.check(!coord.idleTimer().isArmed(), "idle timer cancelled");
        t.check(coord.getStats().unsolicited_drops == 1, "stats: 1 unsolicited drop");

        t.check(coord.ensureReady(), "reconnects on next call");
        t.check(blind.connectCalls() == 2, "second physical connect");
    }

    // ========================================================================
    // TEST 7: Idle timeout
    // ========================================================================
    std::cout << "\nTEST 7: Idle timeout\n";
    {
        sim::SimulatedBlind blind;
        test::ManualScheduler sched;
        CoordinatorConfig config;
        config.idle_timeout = 15000ms;
        ConnectionCoordinator coord(blind, sched, config);
        coord.setTarget(TARGET);

        t.check(coord.ensureReady(), "connected");
        sched.advance(10000ms);
        t.check(coord.ensureReady(), "activity at t=10 s");
        sched.advance(10000ms);
        t.check(coord.getState() == ConnectionState::CONNECTED, "still connected at t=20 s");
        sched.advance(5001ms);
        t.check(coord.getState() == ConnectionState::DISCONNECTED, "disconnected at t=25 s");
        t.check(blind.disconnectCalls() == 1, "link closed by idle timer");

        t.check(coord.ensureReady(), "reconnect after idle");
        coord.refreshIdleTimer(60000ms, true);
        sched.advance(30000ms);
        t.check(coord.isConnected(), "forced 60 s window still open at 30 s");
        coord.refreshIdleTimer(1000ms);
        sched.advance(2000ms);
        t.check(coord.isConnected(), "unforced short refresh did not shorten the window");
        sched.advance(30000ms);
        t.check(!coord.isConnected(), "closed once the 60 s window ran out");
    }

    // ========================================================================
    // TEST 8: State event order
    // ========================================================================
    std::cout << "\nTEST 8: State event order\n";
    {
        sim::SimulatedBlind blind;
        test::ManualScheduler sched;
        ConnectionCoordinator coord(blind, sched);
        coord.setTarget(TARGET);

        std::mutex events_mutex;
        std::vector<ConnectionState> events;
        coord.setStateChangedCallback([&](ConnectionState s) {
            std::lock_guard<std::mutex> lock(events_mutex);
            events.push_back(s);
        });

        coord.ensureReady();
        coord.disconnect();

        std::vector<ConnectionState> expected = {
            ConnectionState::CONNECTING, ConnectionState::CONNECTED,
            ConnectionState::DISCONNECTING, ConnectionState::DISCONNECTED,
        };
        std::lock_guard<std::mutex> lock(events_mutex);
        t.check(events == expected, "CONNECTING, CONNECTED, DISCONNECTING, DISCONNECTED");
    }

    // ========================================================================
    // TEST 9: Reconnect while a cancelled connect is still blocked
    // ========================================================================
    std::cout << "\nTEST 9: Reconnect after cancel\n";
    {
        sim::SimulatedBlind blind;
        test::ManualScheduler sched;
        ConnectionCoordinator coord(blind, sched);
        coord.setTarget(TARGET);

        blind.holdConnects();
        std::vector<int> first(1, -1);
        auto cancelled = startCallers(coord, first, 1);
        test::waitUntil([&] { return blind.connectsWaiting() == 1; });
        coord.disconnect();
        joinAll(cancelled);
        t.check(first[0] == 0, "cancelled caller released with false");

        int second = -1;
        std::thread caller([&] { second = coord.ensureReady() ? 1 : 0; });
        test::waitUntil([&] { return coord.waitingCallers() == 1; });
        std::this_thread::sleep_for(50ms);
        t.check(blind.connectCalls() == 1, "new attempt does not connect while the old one is blocked");
        t.check(coord.getState() == ConnectionState::CONNECTING, "state CONNECTING");

        blind.releaseConnects();
        caller.join();

        t.check(second == 1, "new caller connected");
        t.check(blind.connectCalls() == 2, "two physical connects in total");
        t.check(blind.peakConnectsInFlight() == 1, "at most one physical connect in flight");
        t.check(blind.disconnectCalls() == 1, "late link of the cancelled attempt closed");
        auto link = coord.getLink();
        t.check(link.has_value() && blind.isConnected(*link), "new link is live");
        t.check(coord.getStats().attempts_started == 2 && coord.getStats().attempts_cancelled == 1,
                "stats: 2 started, 1 cancelled");
    }

    // ========================================================================
    // TEST 10: Non-transport error during link-up
    // ========================================================================
    std::cout << "\nTEST 10: Non-transport error during link-up\n";
    {
        sim::SimulatedBlind blind;
        test::ManualScheduler sched;
        ConnectionCoordinator coord(blind, sched);
        coord.setTarget(TARGET);
        coord.setLinkUpCallback([](bool) {
            throw std::invalid_argument("malformed ciphertext");
        });

        bool threw = false;
        try {
            coord.ensureReady();
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        t.check(threw, "caller sees the invalid_argument");
        t.check(coord.getState() == ConnectionState::DISCONNECTED, "state DISCONNECTED");
        t.check(!coord.isAttemptInFlight(), "attempt resolved");
        t.check(!coord.getLink().has_value(), "no link recorded");
        t.check(blind.disconnectCalls() == 1, "link closed");
        t.check(coord.getStats().attempts_failed == 1, "stats: 1 failed attempt");

        coord.setLinkUpCallback(nullptr);
        t.check(coord.ensureReady(), "recovers on the next call");
    }

    return t.summary("connection coordinator");
}
