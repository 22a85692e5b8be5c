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

#ifndef DBT_DEVICE_GATEWAY_HPP_
#define DBT_DEVICE_GATEWAY_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>
#include <condition_variable>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>

#include <direct_bt/DirectBT.hpp>

#include "DeviceGateway.hpp"

namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    class DBTConnection; // forward
    typedef std::shared_ptr<DBTConnection> DBTConnectionRef;

    /**
     * DeviceGateway implementation on top of Direct-BT's BTAdapter and BTDevice, BLE client role only.
     *
     * Notifications are delivered on Direct-BT's GATT reader thread,
     * unsolicited disconnects on its HCI event thread.
     */
    class DBTDeviceGateway : public DeviceGateway {
        public:
            class StatusListener; // forward

        private:
            std::shared_ptr<direct_bt::BTAdapter> adapter;
            std::shared_ptr<StatusListener> status_listener;

            mutable std::mutex mtx_conn;
            std::condition_variable cv_conn;
            /** Connection awaiting deviceReady, nullptr if none. */
            DBTConnectionRef pending_conn;
            /** The ready connection, nullptr if none. */
            DBTConnectionRef live_conn;

            DBTConnectionRef toDBTConnection(const GattConnectionRef& conn) const noexcept;

            /** Returns the characteristic addressed by the target, nullptr if not found. */
            static direct_bt::BTGattCharRef findChar(DBTConnection& conn, const AttributeTarget& target) noexcept;

        public:
            /**
             * @param adapter_ initialized and powered adapter, see chooseAdapter()
             */
            explicit DBTDeviceGateway(std::shared_ptr<direct_bt::BTAdapter> adapter_) noexcept;

            DBTDeviceGateway(const DBTDeviceGateway&) = delete;
            void operator=(const DBTDeviceGateway&) = delete;

            ~DBTDeviceGateway() noexcept override;

            /**
             * Returns the initialized and powered adapter with the given device id,
             * the default adapter if `dev_id` is negative, or nullptr on failure.
             *
             * @param detail set to the failure reason
             */
            static std::shared_ptr<direct_bt::BTAdapter> chooseAdapter(const int dev_id, std::string& detail) noexcept;

            void deviceReady(const direct_bt::BTDeviceRef& device) noexcept;
            void deviceDisconnected(const direct_bt::BTDeviceRef& device, const direct_bt::HCIStatusCode reason) noexcept;

            GatewayResult<jau::darray<DeviceRecord>> scan(const jau::fraction_i64& timeout) noexcept override;

            GatewayResult<GattConnectionRef> connect(const std::string& address, const jau::fraction_i64& timeout,
                                                     DisconnectCallback on_disconnect) noexcept override;

            GatewayResult<bool> disconnect(const GattConnectionRef& conn) noexcept override;

            GatewayResult<DiscoveryResult> discover(const GattConnectionRef& conn) noexcept override;

            GatewayResult<ValueBytes> read(const GattConnectionRef& conn, const AttributeTarget& target) noexcept override;

            GatewayResult<bool> write(const GattConnectionRef& conn, const AttributeTarget& target,
                                      const ValueBytes& data, const bool with_response) noexcept override;

            GatewayResult<bool> startNotify(const GattConnectionRef& conn, const AttributeTarget& target,
                                            NotifyCallback on_value) noexcept override;

            GatewayResult<bool> stopNotify(const GattConnectionRef& conn, const AttributeTarget& target) noexcept override;

            std::string toString() const noexcept override;
    };

    /** Maps the characteristic's properties to a CapabilityBitVal mask. */
    CapabilityBitVal to_capabilities(const direct_bt::BTGattChar& c) noexcept;

    /**@}*/

} // namespace gatt_probe

#endif /* DBT_DEVICE_GATEWAY_HPP_ */
