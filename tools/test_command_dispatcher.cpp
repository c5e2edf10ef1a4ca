// test_command_dispatcher.cpp - Framing and bounded write retries
//
// Tests:
// 1. Frame = command hex + timestamp, written to the command characteristic
// 2. Transient failures below the ceiling are retried
// 3. Reaching the ceiling forces a disconnect and rethrows
// 4. No link: nothing written

#include "test_support.hpp"
#include "crypto/clear_text_crypt.hpp"
#include "device/command_dispatcher.hpp"
#include "sim/simulated_blind.hpp"

using namespace blindlink;
using namespace blindlink::device;
using protocol::CommandFrame;
using protocol::CommandType;
using transport::TransportError;
using transport::TransportErrorKind;

namespace {

const char* FIXED_STAMP = "1a0a13090f2a01f4";

} // namespace

int main() {
    std::cout << "=== Command Dispatcher Unit Test ===\n\n";

    setLogLevel(LogLevel::ERROR);

    test::TestCounter t;

    sim::SimulatedBlind blind;
    crypto::ClearTextCrypt crypt;
    crypt.setTimestampSource([] { return std::string(FIXED_STAMP); });

    LinkHandle link = blind.connect(LinkTarget{"AA:BB:CC:DD:EE:FF", ""}, 1);
    std::optional<LinkHandle> current = link;
    int link_failures = 0;

    CommandDispatcher dispatcher(blind, crypt, 5);
    dispatcher.setLinkProvider([&current] { return current; });
    dispatcher.setLinkFailedCallback([&link_failures] { link_failures++; });

    // ========================================================================
    // TEST 1: Framing
    // ========================================================================
    std::cout << "TEST 1: Framing\n";
    {
        bool sent = dispatcher.send(CommandFrame(CommandType::OPEN));
        t.check(sent, "OPEN acknowledged");

        auto log = blind.commandLog();
        t.check(!log.empty() && log.back() == std::string("03020301") + FIXED_STAMP,
                "wire bytes = 03020301 + timestamp");

        dispatcher.send(CommandFrame::makePercent(75));
        log = blind.commandLog();
        t.check(log.back() == std::string("050204404b00") + FIXED_STAMP,
                "PERCENT 75 = 050204404b00 + timestamp");
        t.check(blind.getModel().position_percent == 75, "peripheral moved to 75%");
    }

    // ========================================================================
    // TEST 2: Retries below the ceiling
    // ========================================================================
    std::cout << "\nTEST 2: Retries below the ceiling\n";
    {
        int writes_before = blind.writeCalls();
        blind.failNextWrites(4);

        bool sent = false;
        bool threw = false;
        try {
            sent = dispatcher.send(CommandFrame(CommandType::STOP));
        } catch (const TransportError&) {
            threw = true;
        }

        t.check(sent && !threw, "4 failures then success -> sent");
        t.check(blind.writeCalls() - writes_before == 5, "5 writes issued");
        t.check(link_failures == 0, "no forced disconnect");
        t.check(dispatcher.getStats().write_retries == 4, "stats: 4 retries");
    }

    // ========================================================================
    // TEST 3: Ceiling reached
    // ========================================================================
    std::cout << "\nTEST 3: Ceiling reached\n";
    {
        int writes_before = blind.writeCalls();
        blind.failNextWrites(5);

        bool threw = false;
        TransportErrorKind kind = TransportErrorKind::NOT_FOUND;
        try {
            dispatcher.send(CommandFrame(CommandType::CLOSE));
        } catch (const TransportError& e) {
            threw = true;
            kind = e.kind();
        }

        t.check(threw && kind == TransportErrorKind::TRANSIENT, "last transient error rethrown");
        t.check(blind.writeCalls() - writes_before == 5, "exactly 5 writes issued");
        t.check(link_failures == 1, "link-failed callback ran once");
        t.check(dispatcher.getStats().commands_failed == 1, "stats: 1 failed command");
    }

    // ========================================================================
    // TEST 4: No link
    // ========================================================================
    std::cout << "\nTEST 4: No link\n";
    {
        current.reset();
        int writes_before = blind.writeCalls();

        bool sent = dispatcher.send(CommandFrame(CommandType::OPEN));
        t.check(!sent, "send without a link returns false");
        t.check(blind.writeCalls() == writes_before, "nothing written");
        t.check(dispatcher.getStats().commands_no_link == 1, "stats: 1 dropped for no link");
    }

    return t.summary("command dispatcher");
}
