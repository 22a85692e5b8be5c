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
#include <algorithm>

#include <jau/debug.hpp>

#include "ValueCodec.hpp"
#include "SessionState.hpp"

using namespace gatt_probe;

SessionState::SessionState(const jau::nsize_t log_max_) noexcept
: log_max( 0 < log_max_ ? log_max_ : 1 ),
  devices(), connected_address(), connected(false),
  services(), key_by_handle(), subscribed(), logs(), last_raw()
{ }

void SessionState::replaceDevices(const jau::darray<DeviceRecord>& list) noexcept {
    jau::darray<DeviceRecord> res;
    res.reserve(list.size());
    for(const DeviceRecord& d : list) {
        auto it = std::find_if(res.begin(), res.end(), [&](const DeviceRecord& e) -> bool { return e.address == d.address; });
        if( res.end() != it ) {
            *it = d;
        } else {
            res.push_back(d);
        }
    }
    std::stable_sort(res.begin(), res.end(), [](const DeviceRecord& a, const DeviceRecord& b) -> bool {
        return a.signal_strength > b.signal_strength;
    });
    devices = std::move(res);
}

const DeviceRecord* SessionState::findDevice(const std::string& address) const noexcept {
    for(const DeviceRecord& d : devices) {
        if( d.address == address ) {
            return &d;
        }
    }
    return nullptr;
}

void SessionState::setConnected(const std::string& address) noexcept {
    connected_address = address;
    connected = true;
}

void SessionState::setDiscovery(DiscoveryResult&& discovery) noexcept {
    jau::darray<ServiceInfo> new_services = std::move(discovery.services);
    HandleMap_t new_key_by_handle = std::move(discovery.key_by_handle);
    services.swap(new_services);
    key_by_handle.swap(new_key_by_handle);
    subscribed.clear();
    logs.clear();
    last_raw.clear();
}

void SessionState::clearConnectionState() noexcept {
    connected = false;
    connected_address.clear();
    services.clear();
    key_by_handle.clear();
    subscribed.clear();
    logs.clear();
    last_raw.clear();
}

jau::nsize_t SessionState::getAttributeCount() const noexcept {
    jau::nsize_t count = 0;
    for(const ServiceInfo& s : services) {
        count += s.attributes.size();
    }
    return count;
}

const AttributeInfo* SessionState::resolve(const std::string& key) const noexcept {
    for(const ServiceInfo& s : services) {
        for(const AttributeInfo& a : s.attributes) {
            if( a.key == key ) {
                return &a;
            }
        }
    }
    return nullptr;
}

std::optional<std::string> SessionState::keyByHandle(const uint16_t handle) const noexcept {
    auto it = key_by_handle.find(handle);
    if( key_by_handle.end() == it ) {
        return std::nullopt;
    }
    return it->second;
}

AttributeTarget SessionState::targetFor(const AttributeInfo& info) noexcept {
    if( info.transport_handle.has_value() ) {
        return AttributeTarget(info.transport_handle.value(), info.id);
    }
    return AttributeTarget(info.id);
}

const ValueEntry& SessionState::appendValue(const std::string& key, const ValueBytes& data) noexcept {
    auto it = logs.try_emplace(key, log_max).first;
    it->second.push( make_value_entry(data) );
    last_raw[key] = data;
    return *it->second.newest();
}

void SessionState::clearHistory(const std::string& key) noexcept {
    logs.erase(key);
    last_raw.erase(key);
}

const LogRing* SessionState::getLog(const std::string& key) const noexcept {
    auto it = logs.find(key);
    return logs.end() != it ? &it->second : nullptr;
}

const ValueBytes* SessionState::getLastRaw(const std::string& key) const noexcept {
    auto it = last_raw.find(key);
    return last_raw.end() != it ? &it->second : nullptr;
}

bool SessionState::isConnectionStateEmpty() const noexcept {
    return 0 == services.size() && key_by_handle.empty() && subscribed.empty() && logs.empty() && last_raw.empty();
}

std::string SessionState::toString() const noexcept {
    return "SessionState[devices "+std::to_string(devices.size())+
           ", connected "+( connected ? connected_address : "no" )+
           ", services "+std::to_string(services.size())+
           ", attributes "+std::to_string(getAttributeCount())+
           ", subscribed "+std::to_string(subscribed.size())+
           ", logs "+std::to_string(logs.size())+"]";
}
