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

#ifndef FAKE_DEVICE_GATEWAY_HPP_
#define FAKE_DEVICE_GATEWAY_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <mutex>
#include <deque>
#include <vector>
#include <functional>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/ordered_atomic.hpp>

#include <gatt_probe/DeviceGateway.hpp>

using namespace gatt_probe;

/**
 * Scripted in-memory DeviceGateway, counting all calls and keeping the latest callbacks.
 */
class FakeConnection : public GattConnection {
    public:
        const std::string address;

        explicit FakeConnection(const std::string& address_) noexcept
        : address(address_) {}

        std::string getAddress() const noexcept override { return address; }

        std::string toString() const noexcept override { return "FakeConnection["+address+"]"; }
};

class FakeDeviceGateway : public DeviceGateway {
    public:
        typedef std::function<void(const std::string& /* op */)> CallHook;

        jau::darray<DeviceRecord> scan_devices;
        ProbeStatusCode scan_status = ProbeStatusCode::SUCCESS;

        ProbeStatusCode connect_status = ProbeStatusCode::SUCCESS;
        std::string connect_detail;

        DiscoveryResult discovery;
        ProbeStatusCode discover_status = ProbeStatusCode::SUCCESS;
        std::string discover_detail;

        ProbeStatusCode disconnect_status = ProbeStatusCode::SUCCESS;

        ValueBytes read_value;
        ProbeStatusCode read_status = ProbeStatusCode::SUCCESS;
        std::string read_detail;

        /** Consumed per write call, SUCCESS if empty. */
        std::deque<ProbeStatusCode> write_statuses;
        std::string write_detail;

        ProbeStatusCode start_notify_status = ProbeStatusCode::SUCCESS;
        ProbeStatusCode stop_notify_status = ProbeStatusCode::SUCCESS;
        std::string notify_detail;

        /** Invoked on the calling gateway thread at the start of each call. */
        CallHook on_call;

        jau::sc_atomic_int scan_calls;
        jau::sc_atomic_int connect_calls;
        jau::sc_atomic_int disconnect_calls;
        jau::sc_atomic_int discover_calls;
        jau::sc_atomic_int read_calls;
        jau::sc_atomic_int write_calls;
        jau::sc_atomic_int start_notify_calls;
        jau::sc_atomic_int stop_notify_calls;

    private:
        mutable std::mutex mtx;
        std::vector<bool> write_modes;
        std::vector<ValueBytes> written;
        NotifyCallback last_notify;
        DisconnectCallback last_disconnect;
        GattConnectionRef last_conn;

        void hook(const std::string& op) {
            if( on_call ) {
                on_call(op);
            }
        }

    public:
        FakeDeviceGateway() noexcept
        : scan_calls(0), connect_calls(0), disconnect_calls(0), discover_calls(0),
          read_calls(0), write_calls(0), start_notify_calls(0), stop_notify_calls(0)
        { }

        GatewayResult<jau::darray<DeviceRecord>> scan(const jau::fraction_i64& timeout) noexcept override {
            (void)timeout;
            ++scan_calls;
            hook("scan");
            if( ProbeStatusCode::SUCCESS != scan_status ) {
                return GatewayResult<jau::darray<DeviceRecord>>::failure(scan_status, "scan failed");
            }
            return GatewayResult<jau::darray<DeviceRecord>>::success(scan_devices);
        }

        GatewayResult<GattConnectionRef> connect(const std::string& address, const jau::fraction_i64& timeout,
                                                 DisconnectCallback on_disconnect) noexcept override {
            (void)timeout;
            ++connect_calls;
            hook("connect");
            if( ProbeStatusCode::SUCCESS != connect_status ) {
                return GatewayResult<GattConnectionRef>::failure(connect_status, connect_detail);
            }
            GattConnectionRef conn = std::make_shared<FakeConnection>(address);
            {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                last_disconnect = on_disconnect;
                last_conn = conn;
            }
            return GatewayResult<GattConnectionRef>::success(conn);
        }

        GatewayResult<bool> disconnect(const GattConnectionRef& conn) noexcept override {
            (void)conn;
            ++disconnect_calls;
            hook("disconnect");
            if( ProbeStatusCode::SUCCESS != disconnect_status ) {
                return GatewayResult<bool>::failure(disconnect_status, "disconnect failed");
            }
            return GatewayResult<bool>::success(true);
        }

        GatewayResult<DiscoveryResult> discover(const GattConnectionRef& conn) noexcept override {
            (void)conn;
            ++discover_calls;
            hook("discover");
            if( ProbeStatusCode::SUCCESS != discover_status ) {
                return GatewayResult<DiscoveryResult>::failure(discover_status, discover_detail);
            }
            return GatewayResult<DiscoveryResult>::success(discovery);
        }

        GatewayResult<ValueBytes> read(const GattConnectionRef& conn, const AttributeTarget& target) noexcept override {
            (void)conn; (void)target;
            ++read_calls;
            hook("read");
            if( ProbeStatusCode::SUCCESS != read_status ) {
                return GatewayResult<ValueBytes>::failure(read_status, read_detail);
            }
            return GatewayResult<ValueBytes>::success(read_value);
        }

        GatewayResult<bool> write(const GattConnectionRef& conn, const AttributeTarget& target,
                                  const ValueBytes& data, const bool with_response) noexcept override {
            (void)conn; (void)target;
            ++write_calls;
            hook("write");
            ProbeStatusCode status = ProbeStatusCode::SUCCESS;
            {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                write_modes.push_back(with_response);
                written.push_back(data);
                if( !write_statuses.empty() ) {
                    status = write_statuses.front();
                    write_statuses.pop_front();
                }
            }
            if( ProbeStatusCode::SUCCESS != status ) {
                return GatewayResult<bool>::failure(status, write_detail);
            }
            return GatewayResult<bool>::success(true);
        }

        GatewayResult<bool> startNotify(const GattConnectionRef& conn, const AttributeTarget& target,
                                        NotifyCallback on_value) noexcept override {
            (void)conn; (void)target;
            ++start_notify_calls;
            hook("start_notify");
            if( ProbeStatusCode::SUCCESS != start_notify_status ) {
                return GatewayResult<bool>::failure(start_notify_status, notify_detail);
            }
            {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                last_notify = on_value;
            }
            return GatewayResult<bool>::success(true);
        }

        GatewayResult<bool> stopNotify(const GattConnectionRef& conn, const AttributeTarget& target) noexcept override {
            (void)conn; (void)target;
            ++stop_notify_calls;
            hook("stop_notify");
            if( ProbeStatusCode::SUCCESS != stop_notify_status ) {
                return GatewayResult<bool>::failure(stop_notify_status, notify_detail);
            }
            return GatewayResult<bool>::success(true);
        }

        std::string toString() const noexcept override { return "FakeDeviceGateway"; }

        /** Delivers a value via the latest startNotify() callback on the calling thread. */
        bool deliver(const std::optional<uint16_t>& handle, const ValueBytes& data) {
            NotifyCallback cb;
            {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                cb = last_notify;
            }
            if( cb.is_null() ) {
                return false;
            }
            cb(handle, data);
            return true;
        }

        /** Reports an unsolicited disconnect via the latest connect() callback on the calling thread. */
        bool dropConnection(const std::string& reason) {
            DisconnectCallback cb;
            {
                const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
                cb = last_disconnect;
            }
            if( cb.is_null() ) {
                return false;
            }
            cb(reason);
            return true;
        }

        std::vector<bool> getWriteModes() const {
            const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
            return write_modes;
        }

        std::vector<ValueBytes> getWritten() const {
            const std::lock_guard<std::mutex> lock(mtx); // RAII-style acquire and relinquish via destructor
            return written;
        }
};

/**
 * Returns a discovery result with one service holding
 * a readable/notifiable, a writable and a read-only characteristic,
 * plus a characteristic id shared by two handles.
 */
inline DiscoveryResult make_test_discovery() {
    DiscoveryResult res;
    ServiceInfo svc("0000180d-0000-1000-8000-00805f9b34fb", 0x0010);
    svc.attributes.push_back( AttributeInfo(svc.id, "00002a37-0000-1000-8000-00805f9b34fb",
                                            CapabilityBitVal::Read | CapabilityBitVal::Notify, 0x0012, "Heart Rate") );
    svc.attributes.push_back( AttributeInfo(svc.id, "00002a39-0000-1000-8000-00805f9b34fb",
                                            CapabilityBitVal::Write | CapabilityBitVal::WriteNoResp, 0x0015, "") );
    svc.attributes.push_back( AttributeInfo(svc.id, "00002a38-0000-1000-8000-00805f9b34fb",
                                            CapabilityBitVal::Read, 0x0017, "") );
    svc.attributes.push_back( AttributeInfo(svc.id, "0000ffe1-0000-1000-8000-00805f9b34fb",
                                            CapabilityBitVal::Notify, 0x0020, "") );
    svc.attributes.push_back( AttributeInfo(svc.id, "0000ffe1-0000-1000-8000-00805f9b34fb",
                                            CapabilityBitVal::Indicate, 0x0024, "") );
    res.add( std::move(svc) );
    return res;
}

#endif /* FAKE_DEVICE_GATEWAY_HPP_ */
