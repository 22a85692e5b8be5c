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

#include <jau/basic_types.hpp>

#include "ProbeTypes.hpp"

using namespace gatt_probe;

#define PROBE_STATUS_CODE(X) \
        X(SUCCESS) \
        X(FALLBACK_SUCCESS) \
        X(BUSY) \
        X(NOT_FOUND) \
        X(NOT_CONNECTED) \
        X(CAPABILITY_MISMATCH) \
        X(INVALID_INPUT) \
        X(TRANSPORT_ERROR) \
        X(TIMEOUT) \
        X(UNKNOWN)

#define PROBE_STATUS_CODE_CASE_TO_STRING(V) case ProbeStatusCode::V: return #V;

std::string gatt_probe::to_string(const ProbeStatusCode ec) noexcept {
    switch(ec) {
    PROBE_STATUS_CODE(PROBE_STATUS_CODE_CASE_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ProbeStatusCode";
}

#define CAPABILITY_ENUM(X) \
        X(CapabilityBitVal,Read,read) \
        X(CapabilityBitVal,Write,write) \
        X(CapabilityBitVal,WriteNoResp,write-without-response) \
        X(CapabilityBitVal,Notify,notify) \
        X(CapabilityBitVal,Indicate,indicate) \
        X(CapabilityBitVal,Broadcast,broadcast) \
        X(CapabilityBitVal,AuthSignedWrite,authenticated-signed-writes) \
        X(CapabilityBitVal,ExtProps,extended-properties)

#define CASE2_TO_STRING2(U,V,W) case U::V: return #W;

static std::string _getCapabilityBitValStr(const CapabilityBitVal prop) noexcept {
    switch(prop) {
        CAPABILITY_ENUM(CASE2_TO_STRING2)
        default: ; // fall through intended
    }
    return "Unknown capability";
}

std::string gatt_probe::to_string(const CapabilityBitVal mask) noexcept {
    const CapabilityBitVal none = CapabilityBitVal::NONE;
    const uint8_t one = 1;
    bool has_pre = false;
    std::string out("[");
    for(int i=0; i<8; i++) {
        const CapabilityBitVal bit = static_cast<CapabilityBitVal>( one << i );
        if( none != ( mask & bit ) ) {
            if( has_pre ) { out.append(", "); }
            out.append(_getCapabilityBitValStr(bit));
            has_pre = true;
        }
    }
    out.append("]");
    return out;
}

std::string gatt_probe::make_attribute_key(const std::string& service_id, const std::string& char_id,
                                           const std::optional<uint16_t>& handle) noexcept
{
    std::string res = service_id+":"+char_id;
    if( handle.has_value() ) {
        res.append(":").append(std::to_string(handle.value()));
    }
    return res;
}

std::string DeviceRecord::toString() const noexcept {
    return "Device[name '"+name+"', address "+address+", rssi "+std::to_string(signal_strength)+"]";
}

std::string AttributeInfo::toString() const noexcept {
    std::string handle_str = transport_handle.has_value() ? jau::to_hexstring(transport_handle.value()) : "n/a";
    std::string desc_str = description.empty() ? "" : ", '"+description+"'";
    return "Attr[key "+key+", handle "+handle_str+", props "+to_string(capabilities)+desc_str+"]";
}

std::string ServiceInfo::toString() const noexcept {
    std::string handle_str = transport_handle.has_value() ? jau::to_hexstring(transport_handle.value()) : "n/a";
    return "Service[id "+id+", handle "+handle_str+", "+std::to_string(attributes.size())+" characteristics]";
}

std::string AttributeTarget::toString() const noexcept {
    if( by_handle ) {
        return "Target[handle "+jau::to_hexstring(handle)+", id "+id+"]";
    }
    return "Target[id "+id+"]";
}

std::string ValueEntry::toString() const noexcept {
    return "Value["+ts+", "+std::to_string(byte_length)+" bytes, hex '"+hex+"', json "+( json.has_value() ? json.value() : "n/a" )+"]";
}
