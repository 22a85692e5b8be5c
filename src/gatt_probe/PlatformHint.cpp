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

#include <cstring>
#include <string>
#include <cstdint>
#include <cctype>
#include <algorithm>

#include "PlatformHint.hpp"

using namespace gatt_probe;

#define PLATFORM_TYPE_ENUM(X) \
    X(UNKNOWN) \
    X(WINDOWS) \
    X(LINUX) \
    X(MACOS)

#define PLATFORM_TYPE_CASE_TO_STRING(V) case PlatformType::V: return #V;

std::string gatt_probe::to_string(const PlatformType v) noexcept {
    switch(v) {
    PLATFORM_TYPE_ENUM(PLATFORM_TYPE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown PlatformType";
}

#define FAILURE_CLASS_ENUM(X) \
    X(GENERIC) \
    X(ADAPTER_UNAVAILABLE) \
    X(STACK_UNAVAILABLE) \
    X(ACCESS_DENIED)

#define FAILURE_CLASS_CASE_TO_STRING(V) case FailureClass::V: return #V;

std::string gatt_probe::to_string(const FailureClass v) noexcept {
    switch(v) {
    FAILURE_CLASS_ENUM(FAILURE_CLASS_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown FailureClass";
}

static std::string to_lower(const std::string& s) noexcept {
    std::string res(s);
    std::transform(res.begin(), res.end(), res.begin(), [](unsigned char c) -> char { return static_cast<char>( std::tolower(c) ); });
    return res;
}

static bool starts_with(const std::string& s, const char* prefix) noexcept {
    return 0 == s.compare(0, ::strlen(prefix), prefix);
}

PlatformType gatt_probe::to_platform_type(const std::string& platform_id) noexcept {
    const std::string v = to_lower(platform_id);
    if( starts_with(v, "win") ) {
        return PlatformType::WINDOWS;
    }
    if( starts_with(v, "linux") ) {
        return PlatformType::LINUX;
    }
    if( starts_with(v, "darwin") ) {
        return PlatformType::MACOS;
    }
    return PlatformType::UNKNOWN;
}

std::string gatt_probe::get_platform_id() noexcept {
#if defined(_WIN32)
    return "win32";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}

PlatformType gatt_probe::get_platform_type() noexcept {
    return to_platform_type( get_platform_id() );
}

static const char * const unavailable_tokens[] = {
    "bluetooth is unsupported",
    "bleakbluetoothnotavailableerror",
    "no_bluetooth",
    "bluetooth is off"
};

static const char * const linux_stack_tokens[] = {
    "org.bluez",
    "bluez",
    "dbus",
    "permission denied",
    "operation not permitted"
};

template<size_t N>
static bool contains_any(const std::string& text, const char * const (&tokens)[N]) noexcept {
    for(size_t i=0; i<N; ++i) {
        if( std::string::npos != text.find(tokens[i]) ) {
            return true;
        }
    }
    return false;
}

FailureClass gatt_probe::classify_failure(const std::string& detail, const PlatformType platform) noexcept {
    const std::string text = to_lower(detail);
    if( contains_any(text, unavailable_tokens) ) {
        return FailureClass::ADAPTER_UNAVAILABLE;
    }
    if( PlatformType::LINUX == platform && contains_any(text, linux_stack_tokens) ) {
        return FailureClass::STACK_UNAVAILABLE;
    }
    if( PlatformType::WINDOWS == platform && std::string::npos != text.find("access is denied") ) {
        return FailureClass::ACCESS_DENIED;
    }
    return FailureClass::GENERIC;
}

std::string gatt_probe::ble_hint(const std::string& detail, const PlatformType platform) noexcept {
    switch( classify_failure(detail, platform) ) {
        case FailureClass::ADAPTER_UNAVAILABLE:
            switch( platform ) {
                case PlatformType::WINDOWS:
                    return "Check that Bluetooth is enabled and a BLE adapter is available.";
                case PlatformType::LINUX:
                    return "Check Bluetooth adapter, ensure bluetoothd is running, and verify BlueZ permissions.";
                case PlatformType::MACOS:
                    return "Check Bluetooth is enabled and grant terminal Bluetooth permission in System Settings.";
                default:
                    return "Check Bluetooth is enabled and an adapter is available.";
            }
        case FailureClass::STACK_UNAVAILABLE:
            return "Ensure BlueZ/dbus are installed and running, then retry with sufficient permissions.";
        case FailureClass::ACCESS_DENIED:
            return "Run with an account that has Bluetooth access and confirm adapter permissions.";
        default:
            return "Check Bluetooth availability and platform BLE prerequisites.";
    }
}

std::string gatt_probe::format_error(const std::string& action, const std::string& detail,
                                     const PlatformType platform, const std::string& sink_path) noexcept
{
    return action+" failed: "+ble_hint(detail, platform)+" (details in "+sink_path+")";
}
