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

#ifndef DEVICE_GATEWAY_HPP_
#define DEVICE_GATEWAY_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <optional>
#include <unordered_map>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/functional.hpp>
#include <jau/fraction_type.hpp>

#include "ProbeTypes.hpp"

namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    /**
     * Result of a DeviceGateway call, either a value or a failure status with its detail.
     *
     * A DeviceGateway never throws, all transport failures are returned as TRANSPORT_ERROR or TIMEOUT.
     */
    template<typename T>
    class GatewayResult {
        public:
            ProbeStatusCode status;
            /** Failure detail text, empty on success. */
            std::string detail;
            T value;

            GatewayResult(const ProbeStatusCode status_, const std::string& detail_, T&& value_) noexcept
            : status(status_), detail(detail_), value(std::move(value_)) {}

            static GatewayResult success(T v) noexcept {
                return GatewayResult(ProbeStatusCode::SUCCESS, "", std::move(v));
            }
            static GatewayResult failure(const ProbeStatusCode status_, const std::string& detail_) noexcept {
                return GatewayResult(status_, detail_, T());
            }

            bool isSuccess() const noexcept { return ProbeStatusCode::SUCCESS == status; }

            std::string toString() const noexcept {
                if( isSuccess() ) {
                    return "GatewayResult[SUCCESS]";
                }
                return "GatewayResult["+to_string(status)+", '"+detail+"']";
            }
    };

    /**
     * Opaque capability of one live transport connection.
     *
     * Created by DeviceGateway::connect() and owned by the SessionCoordinator until disconnect.
     */
    class GattConnection {
        public:
            virtual ~GattConnection() noexcept {}

            /** Returns the peer address of this connection. */
            virtual std::string getAddress() const noexcept = 0;

            virtual std::string toString() const noexcept = 0;
    };
    typedef std::shared_ptr<GattConnection> GattConnectionRef;

    /**
     * Result of one discovery cycle.
     */
    class DiscoveryResult {
        public:
            /** Discovered services in discovery order, each with its attributes. */
            jau::darray<ServiceInfo> services;
            /** Transport handle to attribute key index for notification dispatch. */
            std::unordered_map<uint16_t, std::string> key_by_handle;
            jau::nsize_t service_count;
            jau::nsize_t attribute_count;

            DiscoveryResult() noexcept
            : services(), key_by_handle(), service_count(0), attribute_count(0) {}

            /**
             * Adds the given service and indexes its attributes, updating the counts.
             */
            void add(ServiceInfo&& service) noexcept {
                for(const AttributeInfo& a : service.attributes) {
                    if( a.transport_handle.has_value() ) {
                        key_by_handle[a.transport_handle.value()] = a.key;
                    }
                }
                attribute_count += service.attributes.size();
                ++service_count;
                services.push_back(std::move(service));
            }
    };

    /**
     * Notification or indication value callback, invoked on a transport owned thread.
     *
     * The handle is the delivering characteristic's transport handle, if known.
     */
    typedef jau::function<void(const std::optional<uint16_t>& /* handle */, const ValueBytes& /* data */)> NotifyCallback;

    /**
     * Unsolicited disconnect callback, invoked on a transport owned thread.
     */
    typedef jau::function<void(const std::string& /* reason */)> DisconnectCallback;

    /**
     * Thin adapter to the external BLE transport.
     *
     * Implementations hold no state across calls except the live GattConnection,
     * all calls are blocking and bounded by the given timeouts or the transport's own.
     * Any failure is returned as a GatewayResult, never thrown.
     */
    class DeviceGateway {
        public:
            virtual ~DeviceGateway() noexcept {}

            /** Scans for `timeout` and returns all found devices. */
            virtual GatewayResult<jau::darray<DeviceRecord>> scan(const jau::fraction_i64& timeout) noexcept = 0;

            /**
             * Connects to the given address within `timeout`.
             *
             * @param on_disconnect invoked on a later unsolicited disconnect of the returned connection
             */
            virtual GatewayResult<GattConnectionRef> connect(const std::string& address, const jau::fraction_i64& timeout,
                                                             DisconnectCallback on_disconnect) noexcept = 0;

            /** Closes the connection, best effort and idempotent. */
            virtual GatewayResult<bool> disconnect(const GattConnectionRef& conn) noexcept = 0;

            /** Enumerates all services and characteristics of the connection. */
            virtual GatewayResult<DiscoveryResult> discover(const GattConnectionRef& conn) noexcept = 0;

            virtual GatewayResult<ValueBytes> read(const GattConnectionRef& conn, const AttributeTarget& target) noexcept = 0;

            virtual GatewayResult<bool> write(const GattConnectionRef& conn, const AttributeTarget& target,
                                              const ValueBytes& data, const bool with_response) noexcept = 0;

            /** Enables notification or indication, whichever is supported, delivering values to `on_value`. */
            virtual GatewayResult<bool> startNotify(const GattConnectionRef& conn, const AttributeTarget& target,
                                                    NotifyCallback on_value) noexcept = 0;

            virtual GatewayResult<bool> stopNotify(const GattConnectionRef& conn, const AttributeTarget& target) noexcept = 0;

            virtual std::string toString() const noexcept = 0;
    };

    /**@}*/

} // namespace gatt_probe

#endif /* DEVICE_GATEWAY_HPP_ */
