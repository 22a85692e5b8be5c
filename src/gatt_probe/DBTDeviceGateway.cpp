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
#include <memory>
#include <cstdint>
#include <cinttypes>
#include <unordered_map>
#include <algorithm>
#include <cctype>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>
#include <jau/ordered_atomic.hpp>
#include <jau/dfa_utf8_decode.hpp>

#include "ProbeTypes.hpp"
#include "DBTDeviceGateway.hpp"

using namespace gatt_probe;
using namespace direct_bt;
using namespace jau::fractions_i64_literals;

namespace gatt_probe {

    /**
     * Live Direct-BT connection of one BTDevice.
     */
    class DBTConnection : public GattConnection {
        public:
            const std::string address;
            const BTDeviceRef device;
            const DisconnectCallback on_disconnect;

            /** Set before a requested disconnect, suppressing on_disconnect. */
            jau::sc_atomic_bool solicited_close;

            /** Guarded by DBTDeviceGateway::mtx_conn */
            bool ready;
            /** Guarded by DBTDeviceGateway::mtx_conn */
            bool disconnected;
            /** Guarded by DBTDeviceGateway::mtx_conn */
            HCIStatusCode disconnect_reason;

            std::mutex mtx_listeners;
            std::unordered_map<uint16_t, BTGattCharListenerRef> listeners;

            DBTConnection(const std::string& address_, const BTDeviceRef& device_, DisconnectCallback on_disconnect_) noexcept
            : address(address_), device(device_), on_disconnect(on_disconnect_), solicited_close(false),
              ready(false), disconnected(false), disconnect_reason(HCIStatusCode::SUCCESS) {}

            std::string getAddress() const noexcept override { return address; }

            std::string toString() const noexcept override {
                return "DBTConnection["+address+", "+device->toString()+"]";
            }
    };

    class DBTNotifyListener : public BTGattCharListener {
        private:
            NotifyCallback on_value;

            void deliver(const BTGattCharRef& charDecl, const jau::TROOctets& char_value) noexcept {
                try {
                    const ValueBytes data(char_value.get_ptr(), char_value.get_ptr() + char_value.size());
                    on_value( std::optional<uint16_t>( charDecl->value_handle ), data );
                } catch (std::exception &e) {
                    ERR_PRINT("DBTNotifyListener::deliver: Caught exception %s", e.what());
                }
            }

        public:
            explicit DBTNotifyListener(NotifyCallback on_value_) noexcept
            : on_value(on_value_) {}

            void notificationReceived(BTGattCharRef charDecl, const jau::TROOctets& char_value, const uint64_t timestamp) override {
                (void)timestamp;
                deliver(charDecl, char_value);
            }

            void indicationReceived(BTGattCharRef charDecl, const jau::TROOctets& char_value, const uint64_t timestamp,
                                    const bool confirmationSent) override {
                (void)timestamp;
                (void)confirmationSent;
                deliver(charDecl, char_value);
            }

            std::string toString() const noexcept override {
                return "DBTNotifyListener["+jau::to_hexstring(this)+"]";
            }
    };

    class DBTDeviceGateway::StatusListener : public AdapterStatusListener {
        private:
            DBTDeviceGateway& gateway;

        public:
            explicit StatusListener(DBTDeviceGateway& gateway_) noexcept
            : gateway(gateway_) {}

            void deviceReady(BTDeviceRef device, const uint64_t timestamp) override {
                (void)timestamp;
                gateway.deviceReady(device);
            }

            void deviceDisconnected(BTDeviceRef device, const HCIStatusCode reason, const uint16_t handle, const uint64_t timestamp) override {
                (void)handle;
                (void)timestamp;
                gateway.deviceDisconnected(device, reason);
            }

            std::string toString() const noexcept override {
                return "DBTDeviceGateway::StatusListener["+jau::to_hexstring(this)+"]";
            }
    };

} // namespace gatt_probe

CapabilityBitVal gatt_probe::to_capabilities(const BTGattChar& c) noexcept {
    CapabilityBitVal res = CapabilityBitVal::NONE;
    if( c.hasProperties(BTGattChar::PropertyBitVal::Read) ) { set(res, CapabilityBitVal::Read); }
    if( c.hasProperties(BTGattChar::PropertyBitVal::WriteWithAck) ) { set(res, CapabilityBitVal::Write); }
    if( c.hasProperties(BTGattChar::PropertyBitVal::WriteNoAck) ) { set(res, CapabilityBitVal::WriteNoResp); }
    if( c.hasProperties(BTGattChar::PropertyBitVal::Notify) ) { set(res, CapabilityBitVal::Notify); }
    if( c.hasProperties(BTGattChar::PropertyBitVal::Indicate) ) { set(res, CapabilityBitVal::Indicate); }
    if( c.hasProperties(BTGattChar::PropertyBitVal::Broadcast) ) { set(res, CapabilityBitVal::Broadcast); }
    if( c.hasProperties(BTGattChar::PropertyBitVal::AuthSignedWrite) ) { set(res, CapabilityBitVal::AuthSignedWrite); }
    if( c.hasProperties(BTGattChar::PropertyBitVal::ExtProps) ) { set(res, CapabilityBitVal::ExtProps); }
    return res;
}

static bool equalsIgnoreCase(const std::string& a, const std::string& b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.cbegin(), a.cend(), b.cbegin(), [](const char x, const char y) -> bool {
               return std::tolower( static_cast<unsigned char>(x) ) == std::tolower( static_cast<unsigned char>(y) );
           });
}

DBTDeviceGateway::DBTDeviceGateway(std::shared_ptr<BTAdapter> adapter_) noexcept
: adapter(std::move(adapter_)), status_listener(nullptr), pending_conn(nullptr), live_conn(nullptr)
{
    if( nullptr != adapter ) {
        status_listener = std::make_shared<StatusListener>(*this);
        adapter->addStatusListener( status_listener );
    }
    DBG_PRINT("DBTDeviceGateway::ctor: %s", toString().c_str());
}

DBTDeviceGateway::~DBTDeviceGateway() noexcept {
    if( nullptr != adapter && nullptr != status_listener ) {
        adapter->removeStatusListener( status_listener );
    }
}

std::shared_ptr<BTAdapter> DBTDeviceGateway::chooseAdapter(const int dev_id, std::string& detail) noexcept {
    std::shared_ptr<BTAdapter> a;
    try {
        std::shared_ptr<BTManager> mngr = BTManager::get();
        a = 0 <= dev_id ? mngr->getAdapter( static_cast<uint16_t>(dev_id) ) : mngr->getDefaultAdapter();
    } catch (std::exception &e) {
        detail = std::string("no_bluetooth: BTManager unavailable: ")+e.what();
        return nullptr;
    }
    if( nullptr == a ) {
        detail = "no_bluetooth: No BTAdapter available, dev_id "+std::to_string(dev_id);
        return nullptr;
    }
    if( !a->isInitialized() ) {
        const HCIStatusCode status = a->initialize( BTMode::LE );
        if( HCIStatusCode::SUCCESS != status ) {
            detail = "Adapter initialization failed: "+to_string(status)+": "+a->toString();
            return nullptr;
        }
    }
    if( !a->setPowered( true ) ) {
        detail = "bluetooth is off: Adapter power-on failed: "+a->toString();
        return nullptr;
    }
    return a;
}

DBTConnectionRef DBTDeviceGateway::toDBTConnection(const GattConnectionRef& conn) const noexcept {
    return std::dynamic_pointer_cast<DBTConnection>(conn);
}

void DBTDeviceGateway::deviceReady(const BTDeviceRef& device) noexcept {
    std::unique_lock<std::mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    if( nullptr != pending_conn && pending_conn->device->getAddressAndType() == device->getAddressAndType() ) {
        pending_conn->ready = true;
        cv_conn.notify_all();
    }
}

void DBTDeviceGateway::deviceDisconnected(const BTDeviceRef& device, const HCIStatusCode reason) noexcept {
    DBTConnectionRef lost;
    {
        std::unique_lock<std::mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
        if( nullptr != pending_conn && pending_conn->device->getAddressAndType() == device->getAddressAndType() ) {
            pending_conn->disconnected = true;
            pending_conn->disconnect_reason = reason;
            cv_conn.notify_all();
        }
        if( nullptr != live_conn && live_conn->device->getAddressAndType() == device->getAddressAndType() ) {
            live_conn->disconnected = true;
            live_conn->disconnect_reason = reason;
            lost = live_conn;
            live_conn = nullptr;
        }
    }
    if( nullptr != lost && !lost->solicited_close ) {
        try {
            lost->on_disconnect( to_string(reason) );
        } catch (std::exception &e) {
            ERR_PRINT("DBTDeviceGateway::deviceDisconnected: Caught exception %s", e.what());
        }
    }
}

GatewayResult<jau::darray<DeviceRecord>> DBTDeviceGateway::scan(const jau::fraction_i64& timeout) noexcept {
    typedef GatewayResult<jau::darray<DeviceRecord>> result_t;
    if( nullptr == adapter ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "no_bluetooth: No BTAdapter available");
    }
    adapter->removeDiscoveredDevices();
    HCIStatusCode status = adapter->startDiscovery( DiscoveryPolicy::PAUSE_CONNECTED_UNTIL_READY, true /* le_scan_active */ );
    if( HCIStatusCode::SUCCESS != status ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "startDiscovery: "+to_string(status)+": "+adapter->toString());
    }
    jau::sleep_for( timeout );
    status = adapter->stopDiscovery();
    if( HCIStatusCode::SUCCESS != status ) {
        WARN_PRINT("DBTDeviceGateway::scan: stopDiscovery %s: %s", to_string(status).c_str(), adapter->toString().c_str());
    }
    jau::darray<DeviceRecord> res;
    const jau::darray<BTDeviceRef> found = adapter->getDiscoveredDevices();
    for(const BTDeviceRef& d : found) {
        const int8_t rssi = d->getRSSI();
        // 127 denotes 'not available'
        res.push_back( DeviceRecord( d->getName(), d->getAddressAndType().address.toString(),
                                     127 == rssi ? RSSI_UNKNOWN : static_cast<int32_t>(rssi) ) );
    }
    DBG_PRINT("DBTDeviceGateway::scan: %zu devices within %" PRIi64 " ms", (size_t)res.size(), timeout.to_ms());
    return result_t::success( std::move(res) );
}

GatewayResult<GattConnectionRef> DBTDeviceGateway::connect(const std::string& address, const jau::fraction_i64& timeout,
                                                           DisconnectCallback on_disconnect) noexcept
{
    typedef GatewayResult<GattConnectionRef> result_t;
    if( nullptr == adapter ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "no_bluetooth: No BTAdapter available");
    }
    BTDeviceRef device = nullptr;
    {
        const jau::darray<BTDeviceRef> found = adapter->getDiscoveredDevices();
        for(const BTDeviceRef& d : found) {
            if( equalsIgnoreCase( d->getAddressAndType().address.toString(), address ) ) {
                device = d;
                break;
            }
        }
    }
    if( nullptr == device ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "Device "+address+" not discovered, scan first");
    }
    DBTConnectionRef conn = std::make_shared<DBTConnection>(address, device, on_disconnect);
    {
        std::unique_lock<std::mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
        pending_conn = conn;
    }
    const HCIStatusCode status = device->connectDefault();
    if( HCIStatusCode::SUCCESS != status ) {
        std::unique_lock<std::mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
        pending_conn = nullptr;
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "connectDefault: "+to_string(status)+": "+device->toString());
    }
    bool timeout_occurred = false;
    {
        std::unique_lock<std::mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
        const jau::fraction_timespec timeout_time = jau::getMonotonicTime() + jau::fraction_timespec(timeout);
        while( !conn->ready && !conn->disconnected ) {
            std::cv_status s = jau::wait_until(cv_conn, lock, timeout_time);
            if( std::cv_status::timeout == s && !conn->ready && !conn->disconnected ) {
                timeout_occurred = true;
                break;
            }
        }
        pending_conn = nullptr;
        if( conn->ready && !conn->disconnected ) {
            live_conn = conn;
            DBG_PRINT("DBTDeviceGateway::connect: Ready %s", conn->toString().c_str());
            return result_t::success( conn );
        }
    }
    if( timeout_occurred ) {
        conn->solicited_close = true;
        const HCIStatusCode dstatus = device->disconnect();
        DBG_PRINT("DBTDeviceGateway::connect: Timeout, disconnect %s", to_string(dstatus).c_str());
        return result_t::failure(ProbeStatusCode::TIMEOUT, "Connect timeout after "+std::to_string(timeout.to_ms())+" ms: "+device->toString());
    }
    return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "Disconnected while connecting: "+to_string(conn->disconnect_reason)+": "+device->toString());
}

GatewayResult<bool> DBTDeviceGateway::disconnect(const GattConnectionRef& conn_) noexcept {
    typedef GatewayResult<bool> result_t;
    DBTConnectionRef conn = toDBTConnection(conn_);
    if( nullptr == conn ) {
        return result_t::success(true);
    }
    conn->solicited_close = true;
    {
        std::unique_lock<std::mutex> lock(conn->mtx_listeners); // RAII-style acquire and relinquish via destructor
        conn->listeners.clear();
    }
    conn->device->removeAllCharListener();
    {
        std::unique_lock<std::mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
        if( live_conn == conn ) {
            live_conn = nullptr;
        }
    }
    if( !conn->device->getConnected() ) {
        return result_t::success(true);
    }
    const HCIStatusCode status = conn->device->disconnect();
    if( HCIStatusCode::SUCCESS != status && conn->device->getConnected() ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "disconnect: "+to_string(status)+": "+conn->device->toString());
    }
    return result_t::success(true);
}

GatewayResult<DiscoveryResult> DBTDeviceGateway::discover(const GattConnectionRef& conn_) noexcept {
    typedef GatewayResult<DiscoveryResult> result_t;
    DBTConnectionRef conn = toDBTConnection(conn_);
    if( nullptr == conn ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "discover: Not a Direct-BT connection");
    }
    try {
        jau::darray<BTGattServiceRef> primServices = conn->device->getGattServices();
        if( 0 == primServices.size() ) {
            return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "getGattServices() failed: "+conn->device->toString());
        }
        DiscoveryResult res;
        for(const BTGattServiceRef& s : primServices) {
            ServiceInfo si(s->type->toUUID128String(), s->handle);
            for(const BTGattCharRef& c : s->characteristicList) {
                std::string description;
                BTGattDescRef ud = c->getUserDescription();
                if( nullptr != ud ) {
                    description = jau::dfa_utf8_decode(ud->value.get_ptr(), ud->value.size());
                }
                si.attributes.push_back( AttributeInfo(si.id, c->value_type->toUUID128String(), to_capabilities(*c),
                                                       c->value_handle, description) );
            }
            res.add( std::move(si) );
        }
        return result_t::success( std::move(res) );
    } catch (std::exception &e) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, std::string("discover: ")+e.what());
    }
}

BTGattCharRef DBTDeviceGateway::findChar(DBTConnection& conn, const AttributeTarget& target) noexcept {
    jau::darray<BTGattServiceRef> primServices = conn.device->getGattServices();
    for(const BTGattServiceRef& s : primServices) {
        for(const BTGattCharRef& c : s->characteristicList) {
            if( target.by_handle ? c->value_handle == target.handle
                                 : c->value_type->toUUID128String() == target.id ) {
                return c;
            }
        }
    }
    return nullptr;
}

GatewayResult<ValueBytes> DBTDeviceGateway::read(const GattConnectionRef& conn_, const AttributeTarget& target) noexcept {
    typedef GatewayResult<ValueBytes> result_t;
    DBTConnectionRef conn = toDBTConnection(conn_);
    if( nullptr == conn ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "read: Not a Direct-BT connection");
    }
    BTGattCharRef c = findChar(*conn, target);
    if( nullptr == c ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "read: Characteristic not found: "+target.toString());
    }
    jau::POctets value(BTGattHandler::number(BTGattHandler::Defaults::MAX_ATT_MTU), 0, jau::endian::little);
    if( !c->readValue(value) ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "readValue failed: "+c->toString());
    }
    return result_t::success( ValueBytes(value.get_ptr(), value.get_ptr() + value.size()) );
}

GatewayResult<bool> DBTDeviceGateway::write(const GattConnectionRef& conn_, const AttributeTarget& target,
                                            const ValueBytes& data, const bool with_response) noexcept
{
    typedef GatewayResult<bool> result_t;
    DBTConnectionRef conn = toDBTConnection(conn_);
    if( nullptr == conn ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "write: Not a Direct-BT connection");
    }
    BTGattCharRef c = findChar(*conn, target);
    if( nullptr == c ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "write: Characteristic not found: "+target.toString());
    }
    const jau::TROOctets value(data.data(), static_cast<jau::nsize_t>(data.size()), jau::endian::little);
    const bool ok = with_response ? c->writeValue(value) : c->writeValueNoResp(value);
    if( !ok ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR,
                                 std::string(with_response ? "writeValue" : "writeValueNoResp")+" failed: "+c->toString());
    }
    return result_t::success(true);
}

GatewayResult<bool> DBTDeviceGateway::startNotify(const GattConnectionRef& conn_, const AttributeTarget& target,
                                                  NotifyCallback on_value) noexcept
{
    typedef GatewayResult<bool> result_t;
    DBTConnectionRef conn = toDBTConnection(conn_);
    if( nullptr == conn ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "startNotify: Not a Direct-BT connection");
    }
    BTGattCharRef c = findChar(*conn, target);
    if( nullptr == c ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "startNotify: Characteristic not found: "+target.toString());
    }
    BTGattCharListenerRef l = std::make_shared<DBTNotifyListener>(on_value);
    if( !c->addCharListener(l) ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "addCharListener failed: "+c->toString());
    }
    bool cccdEnableResult[2];
    if( !c->enableNotificationOrIndication( cccdEnableResult ) ) {
        c->removeCharListener(l);
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "enableNotificationOrIndication failed: "+c->toString());
    }
    {
        std::unique_lock<std::mutex> lock(conn->mtx_listeners); // RAII-style acquire and relinquish via destructor
        conn->listeners[c->value_handle] = l;
    }
    DBG_PRINT("DBTDeviceGateway::startNotify: Notification(%d), Indication(%d): %s",
              cccdEnableResult[0], cccdEnableResult[1], c->toString().c_str());
    return result_t::success(true);
}

GatewayResult<bool> DBTDeviceGateway::stopNotify(const GattConnectionRef& conn_, const AttributeTarget& target) noexcept {
    typedef GatewayResult<bool> result_t;
    DBTConnectionRef conn = toDBTConnection(conn_);
    if( nullptr == conn ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "stopNotify: Not a Direct-BT connection");
    }
    BTGattCharRef c = findChar(*conn, target);
    if( nullptr == c ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "stopNotify: Characteristic not found: "+target.toString());
    }
    if( !c->disableIndicationNotification() ) {
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, "disableIndicationNotification failed: "+c->toString());
    }
    BTGattCharListenerRef l = nullptr;
    {
        std::unique_lock<std::mutex> lock(conn->mtx_listeners); // RAII-style acquire and relinquish via destructor
        auto it = conn->listeners.find(c->value_handle);
        if( conn->listeners.end() != it ) {
            l = it->second;
            conn->listeners.erase(it);
        }
    }
    if( nullptr != l ) {
        c->removeCharListener(l);
    }
    return result_t::success(true);
}

std::string DBTDeviceGateway::toString() const noexcept {
    std::unique_lock<std::mutex> lock(mtx_conn); // RAII-style acquire and relinquish via destructor
    return "DBTDeviceGateway[adapter "+( nullptr != adapter ? adapter->getAddressAndType().toString() : "n/a" )+
           ", live "+( nullptr != live_conn ? live_conn->address : "n/a" )+"]";
}
