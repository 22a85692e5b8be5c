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
#include <cstdio>
#include <cctype>
#include <ctime>

#include <nlohmann/json.hpp>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "ValueCodec.hpp"

using namespace gatt_probe;
using json = nlohmann::json;

std::string gatt_probe::to_hex_groups(const uint8_t * data, const jau::nsize_t length) noexcept {
    static const char * const HEX_ARRAY_LOW = "0123456789abcdef";
    std::string str;
    if( nullptr == data || 0 == length ) {
        return str;
    }
    str.reserve(length * 3);
    for(jau::nsize_t i = 0; i < length; ++i) {
        if( 0 < i ) {
            str.push_back(' ');
        }
        const int v = data[i] & 0xFF;
        str.push_back(HEX_ARRAY_LOW[v >> 4]);
        str.push_back(HEX_ARRAY_LOW[v & 0x0F]);
    }
    return str;
}

std::optional<std::string> gatt_probe::try_parse_json(const ValueBytes& data) noexcept {
    // parser rejects ill-formed UTF-8, no exception on invalid input
    const json j = json::parse(data.cbegin(), data.cend(), nullptr, false /* allow_exceptions */);
    if( j.is_discarded() ) {
        return std::nullopt;
    }
    return j.dump(-1, ' ', true /* ensure_ascii */, json::error_handler_t::replace);
}

std::optional<std::string> gatt_probe::pretty_json(const std::string& json_text, const int indent) noexcept {
    const json j = json::parse(json_text, nullptr, false /* allow_exceptions */);
    if( j.is_discarded() ) {
        return std::nullopt;
    }
    return j.dump(indent, ' ', true /* ensure_ascii */, json::error_handler_t::replace);
}

static int hex_digit_value(const char c) noexcept {
    if( '0' <= c && c <= '9' ) {
        return c - '0';
    }
    if( 'a' <= c && c <= 'f' ) {
        return c - 'a' + 10;
    }
    if( 'A' <= c && c <= 'F' ) {
        return c - 'A' + 10;
    }
    return -1;
}

std::optional<ValueBytes> gatt_probe::parse_hex_string(const std::string& text) noexcept {
    std::string digits;
    digits.reserve(text.size());
    for(const char c : text) {
        if( !std::isspace( static_cast<unsigned char>(c) ) ) {
            digits.push_back(c);
        }
    }
    if( digits.empty() || 0 != digits.size() % 2 ) {
        return std::nullopt;
    }
    ValueBytes res;
    res.reserve(digits.size() / 2);
    for(size_t i = 0; i < digits.size(); i += 2) {
        const int hi = hex_digit_value(digits[i]);
        const int lo = hex_digit_value(digits[i+1]);
        if( 0 > hi || 0 > lo ) {
            return std::nullopt;
        }
        res.push_back( static_cast<uint8_t>( ( hi << 4 ) | lo ) );
    }
    return res;
}

ValueBytes gatt_probe::text_to_bytes(const std::string& text) noexcept {
    return ValueBytes(text.cbegin(), text.cend());
}

std::string gatt_probe::preview_hex(const std::string& hex, const jau::nsize_t max_len) noexcept {
    if( hex.size() <= max_len || 3 > max_len ) {
        return hex;
    }
    return hex.substr(0, max_len - 3) + "...";
}

std::string gatt_probe::to_clock_string(const jau::fraction_timespec& t) noexcept {
    const time_t t_sec = static_cast<time_t>(t.tv_sec);
    struct tm lt;
    if( nullptr == ::localtime_r(&t_sec, &lt) ) {
        return "??:??:??.???";
    }
    char buf[32];
    const int ms = static_cast<int>( t.tv_nsec / 1000000 );
    snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d", lt.tm_hour, lt.tm_min, lt.tm_sec, ms);
    return std::string(buf);
}

ValueEntry gatt_probe::make_value_entry(const ValueBytes& data) noexcept {
    const jau::fraction_timespec now = jau::getWallClockTime();
    return ValueEntry(now, to_clock_string(now), static_cast<jau::nsize_t>(data.size()),
                      to_hex_groups(data), try_parse_json(data));
}

std::string gatt_probe::format_log_line(const ValueEntry& entry) noexcept {
    char size_str[32];
    snprintf(size_str, sizeof(size_str), "%4u", static_cast<unsigned int>(entry.byte_length));
    std::string res = entry.ts+" | "+size_str+"B | ";
    std::string hex = preview_hex(entry.hex);
    if( entry.json.has_value() ) {
        if( hex.size() < HEX_PREVIEW_MAX ) {
            hex.append(HEX_PREVIEW_MAX - hex.size(), ' ');
        }
        res.append(hex).append(" | ").append(entry.json.value());
    } else {
        res.append(hex);
    }
    return res;
}

std::string gatt_probe::format_latest(const ValueEntry& entry) noexcept {
    std::string res = entry.ts+" | "+std::to_string(entry.byte_length)+"B\n\nHex:\n"+entry.hex;
    if( entry.json.has_value() ) {
        const std::optional<std::string> pretty = pretty_json(entry.json.value());
        if( pretty.has_value() ) {
            res.append("\n\nJSON:\n").append(pretty.value());
        }
    }
    return res;
}

std::string gatt_probe::format_attribute_label(const AttributeInfo& info, const bool subscribed) noexcept {
    std::string res = info.id;
    if( info.transport_handle.has_value() ) {
        res.append(" h=").append(std::to_string(info.transport_handle.value()));
    }
    res.append(" ").append(to_string(info.capabilities));
    if( subscribed ) {
        res.append(" [N]");
    }
    return res;
}
