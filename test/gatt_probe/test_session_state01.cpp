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

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <gatt_probe/SessionState.hpp>
#include <gatt_probe/ValueCodec.hpp>

#include "FakeDeviceGateway.hpp"

using namespace gatt_probe;

static const std::string SVC = "0000180d-0000-1000-8000-00805f9b34fb";
static const std::string KEY_HR = SVC+":00002a37-0000-1000-8000-00805f9b34fb:18";
static const std::string KEY_CP = SVC+":00002a39-0000-1000-8000-00805f9b34fb:21";
static const std::string KEY_DUP1 = SVC+":0000ffe1-0000-1000-8000-00805f9b34fb:32";
static const std::string KEY_DUP2 = SVC+":0000ffe1-0000-1000-8000-00805f9b34fb:36";

TEST_CASE( "Device List Test 01", "[state][devices]" ) {
    SessionState state;
    jau::darray<DeviceRecord> list;
    list.push_back( DeviceRecord("alpha", "AA:AA:AA:AA:AA:AA", -70) );
    list.push_back( DeviceRecord("", "CC:CC:CC:CC:CC:CC", RSSI_UNKNOWN) );
    list.push_back( DeviceRecord("beta", "BB:BB:BB:BB:BB:BB", -30) );
    list.push_back( DeviceRecord("gamma", "DD:DD:DD:DD:DD:DD", -70) );
    state.replaceDevices(list);

    const jau::darray<DeviceRecord>& devices = state.getDevices();
    REQUIRE( 4 == devices.size() );
    REQUIRE( "BB:BB:BB:BB:BB:BB" == devices[0].address );
    // equal strength keeps scan order
    REQUIRE( "AA:AA:AA:AA:AA:AA" == devices[1].address );
    REQUIRE( "DD:DD:DD:DD:DD:DD" == devices[2].address );
    REQUIRE( "CC:CC:CC:CC:CC:CC" == devices[3].address );

    REQUIRE( nullptr != state.findDevice("BB:BB:BB:BB:BB:BB") );
    REQUIRE( "beta" == state.findDevice("BB:BB:BB:BB:BB:BB")->name );
    REQUIRE( nullptr == state.findDevice("EE:EE:EE:EE:EE:EE") );

    // duplicate address keeps the latest record
    jau::darray<DeviceRecord> list2;
    list2.push_back( DeviceRecord("old", "AA:AA:AA:AA:AA:AA", -90) );
    list2.push_back( DeviceRecord("new", "AA:AA:AA:AA:AA:AA", -40) );
    state.replaceDevices(list2);
    REQUIRE( 1 == state.getDevices().size() );
    REQUIRE( "new" == state.getDevices()[0].name );
    REQUIRE( -40 == state.getDevices()[0].signal_strength );

    state.clearDevices();
    REQUIRE( 0 == state.getDevices().size() );
}

TEST_CASE( "Attribute Resolve Test 01", "[state][resolve]" ) {
    SessionState state;
    REQUIRE( nullptr == state.resolve(KEY_HR) );

    state.setConnected("AA:AA:AA:AA:AA:AA");
    state.setDiscovery( make_test_discovery() );
    REQUIRE( state.isConnected() );
    REQUIRE( "AA:AA:AA:AA:AA:AA" == state.getConnectedAddress() );
    REQUIRE( 1 == state.getServiceCount() );
    REQUIRE( 5 == state.getAttributeCount() );

    const AttributeInfo* hr = state.resolve(KEY_HR);
    REQUIRE( nullptr != hr );
    REQUIRE( hr->isReadable() );
    REQUIRE( hr->isNotifiable() );
    REQUIRE_FALSE( hr->isWritable() );
    REQUIRE( "Heart Rate" == hr->description );

    // same characteristic id under two handles resolves to distinct attributes
    const AttributeInfo* d1 = state.resolve(KEY_DUP1);
    const AttributeInfo* d2 = state.resolve(KEY_DUP2);
    REQUIRE( nullptr != d1 );
    REQUIRE( nullptr != d2 );
    REQUIRE( d1 != d2 );
    REQUIRE( d1->id == d2->id );
    REQUIRE( d1->hasCapabilities(CapabilityBitVal::Notify) );
    REQUIRE( d2->hasCapabilities(CapabilityBitVal::Indicate) );
    REQUIRE( 32 == d1->transport_handle.value() );
    REQUIRE( 36 == d2->transport_handle.value() );

    REQUIRE( KEY_DUP2 == state.keyByHandle(36).value() );
    REQUIRE( KEY_HR == state.keyByHandle(18).value() );
    REQUIRE_FALSE( state.keyByHandle(99).has_value() );

    REQUIRE( nullptr == state.resolve(SVC+":00002a37-0000-1000-8000-00805f9b34fb") );
    REQUIRE( nullptr == state.resolve("unknown") );

    const AttributeTarget t1 = SessionState::targetFor(*d1);
    REQUIRE( t1.by_handle );
    REQUIRE( 32 == t1.handle );

    const AttributeInfo nohandle(SVC, "2a00", CapabilityBitVal::Read, std::nullopt);
    REQUIRE( SVC+":2a00" == nohandle.key );
    const AttributeTarget t2 = SessionState::targetFor(nohandle);
    REQUIRE_FALSE( t2.by_handle );
    REQUIRE( "2a00" == t2.id );
}

TEST_CASE( "Value History Test 01", "[state][history]" ) {
    SessionState state(3);
    state.setConnected("AA:AA:AA:AA:AA:AA");
    state.setDiscovery( make_test_discovery() );

    for(uint8_t i=0; i<5; ++i) {
        state.appendValue(KEY_HR, ValueBytes{ i });
    }
    state.appendValue(KEY_CP, ValueBytes{ 0x10, 0x11 });

    REQUIRE( 3 == state.getLog(KEY_HR)->size() );
    REQUIRE( "02" == state.getLog(KEY_HR)->getEntries()[0].hex );
    REQUIRE( ValueBytes{ 0x04 } == *state.getLastRaw(KEY_HR) );
    REQUIRE( 1 == state.getLog(KEY_CP)->size() );

    state.addSubscription(KEY_HR);
    state.clearHistory(KEY_HR);
    REQUIRE( nullptr == state.getLog(KEY_HR) );
    REQUIRE( nullptr == state.getLastRaw(KEY_HR) );
    // other keys and subscriptions are untouched
    REQUIRE( state.isSubscribed(KEY_HR) );
    REQUIRE( 1 == state.getLog(KEY_CP)->size() );
    REQUIRE( ValueBytes{ 0x10, 0x11 } == *state.getLastRaw(KEY_CP) );
}

TEST_CASE( "Value History Test 02", "[state][history][codec]" ) {
    SessionState state;
    state.setConnected("AA:AA:AA:AA:AA:AA");
    state.setDiscovery( make_test_discovery() );

    const ValueBytes doc = text_to_bytes("{\"a\":1}");
    const ValueEntry& e1 = state.appendValue(KEY_HR, doc);
    REQUIRE( doc.size() == e1.byte_length );
    const std::optional<ValueBytes> parsed = parse_hex_string(e1.hex);
    REQUIRE( parsed.has_value() );
    REQUIRE( doc == parsed.value() );
    REQUIRE( e1.json.has_value() );
    REQUIRE( "{\"a\":1}" == e1.json.value() );

    // invalid UTF-8 has no JSON rendering
    const ValueEntry& e2 = state.appendValue(KEY_HR, ValueBytes{ 0xff, 0xfe });
    REQUIRE( "ff fe" == e2.hex );
    REQUIRE_FALSE( e2.json.has_value() );
    const std::optional<ValueBytes> parsed2 = parse_hex_string(e2.hex);
    REQUIRE( parsed2.has_value() );
    REQUIRE( ValueBytes{ 0xff, 0xfe } == parsed2.value() );
    REQUIRE( 2 == state.getLog(KEY_HR)->size() );
}

TEST_CASE( "Connection Reset Test 01", "[state][reset]" ) {
    SessionState state;
    jau::darray<DeviceRecord> list;
    list.push_back( DeviceRecord("alpha", "AA:AA:AA:AA:AA:AA", -70) );
    state.replaceDevices(list);

    state.setConnected("AA:AA:AA:AA:AA:AA");
    state.setDiscovery( make_test_discovery() );
    state.appendValue(KEY_HR, ValueBytes{ 0x01 });
    state.addSubscription(KEY_HR);
    state.addSubscription(KEY_DUP1);
    REQUIRE( 2 == state.getSubscriptions().size() );
    REQUIRE_FALSE( state.isConnectionStateEmpty() );

    // new discovery drops previous subscriptions and history
    state.setDiscovery( make_test_discovery() );
    REQUIRE( 0 == state.getSubscriptions().size() );
    REQUIRE( nullptr == state.getLog(KEY_HR) );
    REQUIRE( 5 == state.getAttributeCount() );

    state.appendValue(KEY_HR, ValueBytes{ 0x02 });
    state.addSubscription(KEY_HR);

    state.clearConnectionState();
    REQUIRE_FALSE( state.isConnected() );
    REQUIRE( state.getConnectedAddress().empty() );
    REQUIRE( state.isConnectionStateEmpty() );
    REQUIRE( 0 == state.getServiceCount() );
    REQUIRE( nullptr == state.resolve(KEY_HR) );
    REQUIRE_FALSE( state.keyByHandle(18).has_value() );
    REQUIRE_FALSE( state.isSubscribed(KEY_HR) );
    // device list survives a disconnect
    REQUIRE( 1 == state.getDevices().size() );
}
