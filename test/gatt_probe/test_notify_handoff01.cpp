/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2022 Gothel Software e.K.
 *
 * Permission is hereby granted, free of charge, to any person obtaining
 * a copy of this software and associated documentation files (the
 * "Software"), to deal in the Software without restriction, including
 * without limitation the rights to use, copy, modify, merge, publish,
 * distribute, sublicense, and/or sell copies of the Software, and to
 * permit persons to whom the Software is furnished to do so, subject to
 * the following conditions:
 *
 * The above copyright notice and this permission notice shall be
 * included in all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND,
 * EXPRESS OR IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF
 * MERCHANTABILITY, FITNESS FOR A PARTICULAR PURPOSE AND
 * NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE
 * LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION
 * OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION
 * WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.
 */

#include <iostream>
#include <cinttypes>
#include <cstring>
#include <cstdio>
#include <thread>
#include <chrono>
#include <vector>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <jau/basic_types.hpp>

#include <gatt_probe/SessionCoordinator.hpp>

#include "FakeDeviceGateway.hpp"

using namespace gatt_probe;
using namespace jau::fractions_i64_literals;

static const std::string ADDR = "AA:BB:CC:DD:EE:01";
static const std::string SVC = "0000180d-0000-1000-8000-00805f9b34fb";
static const std::string ID_HR = "00002a37-0000-1000-8000-00805f9b34fb";
static const std::string KEY_HR = SVC+":"+ID_HR+":18";
static const std::string KEY_BL = SVC+":00002a38-0000-1000-8000-00805f9b34fb:23";
static const std::string KEY_IND = SVC+":0000ffe1-0000-1000-8000-00805f9b34fb:36";

static void deliver_from_thread(FakeDeviceGateway& gateway, const std::optional<uint16_t>& handle, const ValueBytes& data) {
    std::thread t([&gateway, handle, data]() { gateway.deliver(handle, data); });
    t.join();
}

class HandoffFixture {
    public:
        const std::string sink_path;
        FakeDeviceGateway gateway;
        SessionState state;
        SessionContext ctx;
        DiagnosticSink sink;
        SessionCoordinator coord;

        HandoffFixture()
        : sink_path("test_notify_handoff01_diag.log"),
          gateway(), state(LOG_MAX), ctx(64), sink(sink_path),
          coord(gateway, state, ctx, sink, PlatformType::LINUX)
        {
            gateway.discovery = make_test_discovery();
        }

        ~HandoffFixture() {
            std::remove( sink_path.c_str() );
        }

        void connectAndSubscribe() {
            REQUIRE( ProbeStatusCode::SUCCESS == coord.connect(ADDR).status );
            REQUIRE( ProbeStatusCode::SUCCESS == coord.toggleNotify(KEY_HR).status );
        }

        jau::nsize_t logSize(const std::string& key) const {
            const LogRing* log = state.getLog(key);
            return nullptr != log ? log->size() : 0;
        }
};

TEST_CASE( "Session Context Test 01", "[handoff][context]" ) {
    SessionContext ctx(4);
    REQUIRE( ctx.isSessionThread() );
    REQUIRE( 0 == ctx.runPending() );
    REQUIRE( 0 == ctx.waitAndRun(10_ms) );

    std::vector<int> order;
    std::vector<bool> posted;
    bool foreign_is_session = true;
    std::thread t([&]() {
        foreign_is_session = ctx.isSessionThread();
        for(int i=0; i<4; ++i) {
            posted.push_back( ctx.post( SessionContext::Task( [&order, i]() -> void { order.push_back(i); } ) ) );
        }
        // full
        posted.push_back( ctx.post( SessionContext::Task( [&order]() -> void { order.push_back(99); } ) ) );
    });
    t.join();
    REQUIRE_FALSE( foreign_is_session );
    REQUIRE( ( std::vector<bool>{ true, true, true, true, false } ) == posted );
    REQUIRE( 4 == ctx.getPendingCount() );
    REQUIRE( order.empty() );

    REQUIRE( 4 == ctx.runPending() );
    REQUIRE( ( std::vector<int>{ 0, 1, 2, 3 } ) == order );
    REQUIRE( 4 == ctx.getPostedCount() );
    REQUIRE( 4 == ctx.getRunCount() );
    REQUIRE( 1 == ctx.getRejectCount() );

    // a throwing closure does not stop the context
    REQUIRE( true == ctx.post( SessionContext::Task( []() -> void { throw jau::RuntimeException("test", E_FILE_LINE); } ) ) );
    REQUIRE( true == ctx.post( SessionContext::Task( [&order]() -> void { order.push_back(4); } ) ) );
    REQUIRE( 2 == ctx.waitAndRun(10_ms) );
    REQUIRE( 4 == order.back() );

    REQUIRE( true == ctx.post( SessionContext::Task( [&order]() -> void { order.push_back(5); } ) ) );
    ctx.close();
    REQUIRE( ctx.isClosed() );
    REQUIRE( 0 == ctx.getPendingCount() );
    REQUIRE( false == ctx.post( SessionContext::Task( [&order]() -> void { order.push_back(6); } ) ) );
    REQUIRE( 0 == ctx.runPending() );
    REQUIRE( 4 == order.back() );
}

TEST_CASE( "Session Context Test 02", "[handoff][context][rebind]" ) {
    SessionContext ctx(16);
    bool rebound = false;
    std::thread t([&]() {
        ctx.rebind();
        rebound = ctx.isSessionThread();
    });
    t.join();
    REQUIRE( rebound );
    REQUIRE_FALSE( ctx.isSessionThread() );
    ctx.rebind();
    REQUIRE( ctx.isSessionThread() );
}

TEST_CASE( "Notification Handoff Test 01", "[handoff][notify]" ) {
    HandoffFixture f;
    f.connectAndSubscribe();

    deliver_from_thread(f.gateway, 18, ValueBytes{ 0x01 });
    deliver_from_thread(f.gateway, 18, ValueBytes{ 0x02 });
    // nothing is applied on the delivering thread
    REQUIRE( 0 == f.logSize(KEY_HR) );

    REQUIRE( 2 == f.coord.processEvents() );
    REQUIRE( 2 == f.logSize(KEY_HR) );
    REQUIRE( "01" == f.state.getLog(KEY_HR)->getEntries()[0].hex );
    REQUIRE( "02" == f.state.getLog(KEY_HR)->getEntries()[1].hex );
    REQUIRE( ValueBytes{ 0x02 } == *f.state.getLastRaw(KEY_HR) );
    REQUIRE( "Notify "+ID_HR+" (1 B)" == f.coord.getStatusMessage() );

    deliver_from_thread(f.gateway, 18, ValueBytes{ 0x03 });
    REQUIRE( 1 == f.coord.processEvents(100_ms) );
    REQUIRE( 3 == f.logSize(KEY_HR) );
}

TEST_CASE( "Notification Handoff Test 02", "[handoff][notify][handle]" ) {
    HandoffFixture f;
    f.connectAndSubscribe();

    // delivered handle takes precedence over the subscribed key
    deliver_from_thread(f.gateway, 36, ValueBytes{ 0x10 });
    // unknown or missing handle falls back to the subscribed key
    deliver_from_thread(f.gateway, 99, ValueBytes{ 0x11 });
    deliver_from_thread(f.gateway, std::nullopt, ValueBytes{ 0x12 });
    REQUIRE( 3 == f.coord.processEvents() );

    REQUIRE( 1 == f.logSize(KEY_IND) );
    REQUIRE( "10" == f.state.getLog(KEY_IND)->newest()->hex );
    REQUIRE( 2 == f.logSize(KEY_HR) );
    REQUIRE( "11" == f.state.getLog(KEY_HR)->getEntries()[0].hex );
    REQUIRE( "12" == f.state.getLog(KEY_HR)->getEntries()[1].hex );
}

TEST_CASE( "Notification Handoff Test 03", "[handoff][notify][stale]" ) {
    HandoffFixture f;
    f.connectAndSubscribe();

    // late value after a stop request of the same connection is kept
    REQUIRE( ProbeStatusCode::SUCCESS == f.coord.toggleNotify(KEY_HR).status );
    REQUIRE_FALSE( f.state.isSubscribed(KEY_HR) );
    deliver_from_thread(f.gateway, 18, ValueBytes{ 0x01 });
    REQUIRE( 1 == f.coord.processEvents() );
    REQUIRE( 1 == f.logSize(KEY_HR) );

    // values of a previous connection are dropped
    REQUIRE( ProbeStatusCode::SUCCESS == f.coord.connect(ADDR).status );
    deliver_from_thread(f.gateway, 18, ValueBytes{ 0x02 });
    REQUIRE( 1 == f.coord.processEvents() );
    REQUIRE( 0 == f.logSize(KEY_HR) );

    REQUIRE( ProbeStatusCode::SUCCESS == f.coord.toggleNotify(KEY_HR).status );
    REQUIRE( ProbeStatusCode::SUCCESS == f.coord.disconnect().status );
    deliver_from_thread(f.gateway, 18, ValueBytes{ 0x03 });
    REQUIRE( 1 == f.coord.processEvents() );
    REQUIRE( f.state.isConnectionStateEmpty() );
    REQUIRE( "Disconnected" == f.coord.getStatusMessage() );
}

TEST_CASE( "Notification Handoff Test 04", "[handoff][notify][closed]" ) {
    HandoffFixture f;
    f.connectAndSubscribe();
    f.ctx.close();

    // closed context: a foreign thread delivery is dropped
    deliver_from_thread(f.gateway, 18, ValueBytes{ 0x01 });
    REQUIRE( 0 == f.coord.processEvents() );
    REQUIRE( 0 == f.logSize(KEY_HR) );

    // closed context: a session thread delivery is applied directly
    REQUIRE( true == f.gateway.deliver(18, ValueBytes{ 0x02 }) );
    REQUIRE( 1 == f.logSize(KEY_HR) );
    REQUIRE( "02" == f.state.getLog(KEY_HR)->newest()->hex );

    // as is an unsolicited disconnect
    REQUIRE( true == f.gateway.dropConnection("link loss") );
    REQUIRE_FALSE( f.coord.isConnected() );
    REQUIRE( f.state.isConnectionStateEmpty() );
}

TEST_CASE( "Notification Handoff Test 05", "[handoff][notify][inflight]" ) {
    HandoffFixture f;
    f.connectAndSubscribe();
    f.gateway.read_value = ValueBytes{ 0x20 };

    // a value delivered while a read is in flight is applied by the session thread before the read result
    f.gateway.on_call = [&f](const std::string& op) {
        if( "read" != op ) {
            return;
        }
        const uint64_t run0 = f.ctx.getRunCount();
        f.gateway.deliver(18, ValueBytes{ 0x10 });
        for(int i=0; i<500 && run0 == f.ctx.getRunCount(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    };
    REQUIRE( ProbeStatusCode::SUCCESS == f.coord.read(KEY_HR).status );
    f.gateway.on_call = nullptr;

    REQUIRE( 2 == f.logSize(KEY_HR) );
    REQUIRE( "10" == f.state.getLog(KEY_HR)->getEntries()[0].hex );
    REQUIRE( "20" == f.state.getLog(KEY_HR)->getEntries()[1].hex );
    REQUIRE( "Read "+ID_HR == f.coord.getStatusMessage() );
    REQUIRE( 0 == f.ctx.getPendingCount() );
}
