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
#include <fstream>
#include <sstream>

#define CATCH_CONFIG_RUNNER
// #define CATCH_CONFIG_MAIN
#include <catch2/catch_amalgamated.hpp>
#include <jau/test/catch2_ext.hpp>

#include <gatt_probe/PlatformHint.hpp>
#include <gatt_probe/DiagnosticSink.hpp>

using namespace gatt_probe;

static const std::string HINT_GENERIC = "Check Bluetooth availability and platform BLE prerequisites.";

TEST_CASE( "Platform Type Test 01", "[platform]" ) {
    REQUIRE( PlatformType::WINDOWS == to_platform_type("win32") );
    REQUIRE( PlatformType::LINUX == to_platform_type("linux") );
    REQUIRE( PlatformType::LINUX == to_platform_type("Linux2") );
    REQUIRE( PlatformType::MACOS == to_platform_type("darwin") );
    REQUIRE( PlatformType::UNKNOWN == to_platform_type("freebsd13") );
    REQUIRE( PlatformType::UNKNOWN == to_platform_type("") );
#if defined(__linux__)
    REQUIRE( PlatformType::LINUX == get_platform_type() );
#endif
}

TEST_CASE( "Remediation Hint Test 01", "[platform][hint]" ) {
    REQUIRE( FailureClass::ADAPTER_UNAVAILABLE == classify_failure("Bluetooth is OFF", PlatformType::LINUX) );
    REQUIRE( FailureClass::ADAPTER_UNAVAILABLE == classify_failure("BleakBluetoothNotAvailableError: x", PlatformType::MACOS) );
    REQUIRE( FailureClass::ADAPTER_UNAVAILABLE == classify_failure("no_bluetooth: no adapter", PlatformType::UNKNOWN) );

    REQUIRE( "Check that Bluetooth is enabled and a BLE adapter is available." ==
             ble_hint("Bluetooth is unsupported on this device", PlatformType::WINDOWS) );
    REQUIRE( "Check Bluetooth adapter, ensure bluetoothd is running, and verify BlueZ permissions." ==
             ble_hint("bluetooth is off", PlatformType::LINUX) );
    REQUIRE( "Check Bluetooth is enabled and grant terminal Bluetooth permission in System Settings." ==
             ble_hint("no_bluetooth", PlatformType::MACOS) );
    REQUIRE( "Check Bluetooth is enabled and an adapter is available." ==
             ble_hint("no_bluetooth", PlatformType::UNKNOWN) );

    REQUIRE( FailureClass::STACK_UNAVAILABLE == classify_failure("org.bluez.Error.NotReady", PlatformType::LINUX) );
    REQUIRE( "Ensure BlueZ/dbus are installed and running, then retry with sufficient permissions." ==
             ble_hint("[Errno 1] Operation not permitted", PlatformType::LINUX) );
    REQUIRE( "Ensure BlueZ/dbus are installed and running, then retry with sufficient permissions." ==
             ble_hint("DBus connection failed", PlatformType::LINUX) );
    // stack tokens are linux only
    REQUIRE( HINT_GENERIC == ble_hint("org.bluez.Error.NotReady", PlatformType::WINDOWS) );

    REQUIRE( FailureClass::ACCESS_DENIED == classify_failure("Access is denied.", PlatformType::WINDOWS) );
    REQUIRE( "Run with an account that has Bluetooth access and confirm adapter permissions." ==
             ble_hint("Access is denied.", PlatformType::WINDOWS) );
    REQUIRE( HINT_GENERIC == ble_hint("Access is denied.", PlatformType::LINUX) );

    REQUIRE( HINT_GENERIC == ble_hint("", PlatformType::LINUX) );
    REQUIRE( HINT_GENERIC == ble_hint("Device with address AA not found", PlatformType::MACOS) );
}

TEST_CASE( "Error Summary Test 01", "[platform][format]" ) {
    REQUIRE( "Connect failed: "+HINT_GENERIC+" (details in errors.log)" ==
             format_error("Connect", "timeout", PlatformType::LINUX, "errors.log") );
    REQUIRE( "Scan failed: Check Bluetooth adapter, ensure bluetoothd is running, and verify BlueZ permissions. (details in x.log)" ==
             format_error("Scan", "bluetooth is off: adapter hci0", PlatformType::LINUX, "x.log") );
}

static std::string read_file(const std::string& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST_CASE( "Diagnostic Sink Test 01", "[sink]" ) {
    const std::string path = "test_platform_hint01_diag.log";
    std::remove( path.c_str() );
    {
        DiagnosticSink sink(path);
        REQUIRE( path == sink.getPath() );
        REQUIRE( 0 == sink.getRecordCount() );
        REQUIRE( true == sink.record("connect AA:BB", "TIMEOUT: no response") );
        REQUIRE( true == sink.record("read key", "TRANSPORT_ERROR: line1\nline2") );
        REQUIRE( 2 == sink.getRecordCount() );
    }
    const std::string content = read_file(path);
    INFO_STR(content);
    REQUIRE( '[' == content[0] );
    REQUIRE( std::string::npos != content.find("] connect AA:BB\nTIMEOUT: no response\n") );
    REQUIRE( std::string::npos != content.find("] read key\nTRANSPORT_ERROR: line1\nline2\n") );
    // append only
    REQUIRE( content.find("connect AA:BB") < content.find("read key") );
    {
        DiagnosticSink sink(path);
        REQUIRE( true == sink.record("scan", "TIMEOUT: x") );
    }
    REQUIRE( std::string::npos != read_file(path).find("] connect AA:BB\n") );
    REQUIRE( std::string::npos != read_file(path).find("] scan\nTIMEOUT: x\n") );
    std::remove( path.c_str() );

    // unwritable path does not throw
    DiagnosticSink bad("/nonexistent-dir/sub/errors.log");
    REQUIRE( false == bad.record("scan", "x") );
    REQUIRE( 0 == bad.getRecordCount() );
}
