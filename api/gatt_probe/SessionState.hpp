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

#ifndef SESSION_STATE_HPP_
#define SESSION_STATE_HPP_

#include <cstdint>
#include <string>
#include <set>
#include <unordered_map>
#include <optional>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>

#include "ProbeTypes.hpp"
#include "LogRing.hpp"
#include "DeviceGateway.hpp"

namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    /**
     * The authoritative in-memory model of one inspection session.
     *
     * Holds the device list of the last scan and, while a connection is active,
     * the discovered attributes, subscriptions, per key LogRing, last raw value and the handle to key index.
     *
     * Connection scoped fields are only modified together, see setDiscovery() and clearConnectionState().
     * The device list is independent of the connection scoped fields.
     *
     * Single writer: all mutations must happen on the session context, see SessionContext.
     */
    class SessionState {
        public:
            typedef std::unordered_map<std::string, LogRing> LogMap_t;
            typedef std::unordered_map<std::string, ValueBytes> RawMap_t;
            typedef std::unordered_map<uint16_t, std::string> HandleMap_t;
            typedef std::set<std::string> KeySet_t;

        private:
            jau::nsize_t log_max;

            jau::darray<DeviceRecord> devices;

            std::string connected_address;
            bool connected;

            jau::darray<ServiceInfo> services;
            HandleMap_t key_by_handle;
            KeySet_t subscribed;
            LogMap_t logs;
            RawMap_t last_raw;

        public:
            /**
             * @param log_max_ maximum ValueEntry count of each LogRing
             */
            explicit SessionState(const jau::nsize_t log_max_=LOG_MAX) noexcept;

            SessionState(const SessionState&) = delete;
            void operator=(const SessionState&) = delete;

            jau::nsize_t getLogMax() const noexcept { return log_max; }

            /**
             * Replaces the device list of the previous scan.
             *
             * Devices are ordered by descending signal strength, equal strength keeps the given order.
             * A repeated address keeps its first position and its last record.
             */
            void replaceDevices(const jau::darray<DeviceRecord>& list) noexcept;

            void clearDevices() noexcept { devices.clear(); }

            const jau::darray<DeviceRecord>& getDevices() const noexcept { return devices; }

            /** Returns the DeviceRecord of the given address, nullptr if unknown. */
            const DeviceRecord* findDevice(const std::string& address) const noexcept;

            void setConnected(const std::string& address) noexcept;

            bool isConnected() const noexcept { return connected; }

            /** Returns the connected address, empty if not connected. */
            const std::string& getConnectedAddress() const noexcept { return connected_address; }

            /**
             * Installs a new discovery result, replacing all previous attributes and the handle index in one step.
             *
             * Subscriptions, logs and last raw values of the previous discovery are dropped.
             */
            void setDiscovery(DiscoveryResult&& discovery) noexcept;

            /**
             * Drops the connection and all connection scoped fields together:
             * services, handle index, subscriptions, logs and last raw values.
             *
             * The device list is not modified.
             */
            void clearConnectionState() noexcept;

            const jau::darray<ServiceInfo>& getServices() const noexcept { return services; }

            jau::nsize_t getServiceCount() const noexcept { return services.size(); }

            jau::nsize_t getAttributeCount() const noexcept;

            /**
             * Returns the AttributeInfo with the given key, nullptr if not found.
             *
             * The returned pointer is valid until the next setDiscovery() or clearConnectionState().
             */
            const AttributeInfo* resolve(const std::string& key) const noexcept;

            /** Returns the key of the attribute with the given transport handle, if known. */
            std::optional<std::string> keyByHandle(const uint16_t handle) const noexcept;

            const HandleMap_t& getKeyByHandle() const noexcept { return key_by_handle; }

            /** Returns the transport handle if exposed, otherwise the characteristic id. */
            static AttributeTarget targetFor(const AttributeInfo& info) noexcept;

            /**
             * Appends a new ValueEntry of the given payload to the key's LogRing
             * and stores the payload as the key's last raw value.
             */
            const ValueEntry& appendValue(const std::string& key, const ValueBytes& data) noexcept;

            /**
             * Empties the key's LogRing and drops its last raw value.
             *
             * Subscriptions and all other keys are not modified.
             */
            void clearHistory(const std::string& key) noexcept;

            /** Returns the key's LogRing, nullptr if nothing has been recorded. */
            const LogRing* getLog(const std::string& key) const noexcept;

            const LogMap_t& getLogs() const noexcept { return logs; }

            /** Returns the key's last raw value, nullptr if nothing has been recorded. */
            const ValueBytes* getLastRaw(const std::string& key) const noexcept;

            const RawMap_t& getLastRawValues() const noexcept { return last_raw; }

            bool isSubscribed(const std::string& key) const noexcept { return subscribed.end() != subscribed.find(key); }

            void addSubscription(const std::string& key) noexcept { subscribed.insert(key); }

            void removeSubscription(const std::string& key) noexcept { subscribed.erase(key); }

            const KeySet_t& getSubscriptions() const noexcept { return subscribed; }

            /** Returns true if all connection scoped fields are empty. */
            bool isConnectionStateEmpty() const noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace gatt_probe

#endif /* SESSION_STATE_HPP_ */
