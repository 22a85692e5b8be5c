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
#include <cinttypes>
#include <future>
#include <chrono>
#include <system_error>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "ProbeConst.hpp"
#include "ProbeEnv.hpp"
#include "ValueCodec.hpp"
#include "SessionCoordinator.hpp"

using namespace gatt_probe;
using namespace jau::fractions_i64_literals;

namespace gatt_probe {

    /**
     * Non-blocking operation slot, released via destructor.
     */
    class OperationGuard {
        private:
            jau::sc_atomic_bool& flag;
            bool acquired;

        public:
            explicit OperationGuard(jau::sc_atomic_bool& flag_) noexcept
            : flag(flag_), acquired(false)
            {
                bool expected = false;
                acquired = flag.compare_exchange_strong(expected, true);
            }

            OperationGuard(const OperationGuard&) = delete;
            void operator=(const OperationGuard&) = delete;

            ~OperationGuard() noexcept {
                if( acquired ) {
                    flag = false;
                }
            }

            bool owns() const noexcept { return acquired; }
    };

    /**
     * Raises a state flag for the scope's lifetime.
     */
    class FlagGuard {
        private:
            jau::sc_atomic_bool& flag;

        public:
            explicit FlagGuard(jau::sc_atomic_bool& flag_) noexcept
            : flag(flag_)
            {
                flag = true;
            }

            FlagGuard(const FlagGuard&) = delete;
            void operator=(const FlagGuard&) = delete;

            ~FlagGuard() noexcept {
                flag = false;
            }
    };

} // namespace gatt_probe

static const char * const MSG_BUSY = "Busy: another operation is in progress.";
static const char * const MSG_NOT_CONNECTED = "Not connected.";
static const char * const MSG_UNKNOWN_CHAR = "Unknown characteristic.";

SessionCoordinator::SessionCoordinator(DeviceGateway& gateway_, SessionState& state_, SessionContext& ctx_, DiagnosticSink& sink_,
                                       const PlatformType platform_) noexcept
: gateway(gateway_), state(state_), ctx(ctx_), sink(sink_), platform(platform_),
  scan_timeout( ProbeEnv::get().SCAN_TIMEOUT ), connect_timeout( ProbeEnv::get().CONNECT_TIMEOUT ),
  connection(nullptr), connection_epoch(0),
  op_in_flight(false), scanning(false),
  selected_key(), status_msg("Ready")
{
    DBG_PRINT("SessionCoordinator::ctor: %s, %s", gateway.toString().c_str(), to_string(platform).c_str());
}

SessionCoordinator::~SessionCoordinator() noexcept {
    if( nullptr != connection ) {
        const GattConnectionRef conn = connection;
        resetConnection();
        const GatewayResult<bool> res = gateway.disconnect(conn);
        if( !res.isSuccess() ) {
            WARN_PRINT("SessionCoordinator::dtor: disconnect failed: %s", res.toString().c_str());
        }
    }
}

template<typename F>
auto SessionCoordinator::await(F&& call) -> decltype( call() ) {
    typedef decltype( call() ) result_t;
    // gateway call runs on its own thread while the session thread keeps running handed off closures
    std::future<result_t> f;
    try {
        f = std::async(std::launch::async, std::forward<F>(call));
    } catch (const std::system_error& e) {
        ERR_PRINT("SessionCoordinator::await: Failed to launch gateway call: %s", e.what());
        return result_t::failure(ProbeStatusCode::TRANSPORT_ERROR, std::string("Failed to launch gateway call: ")+e.what());
    }
    const std::chrono::milliseconds period( SESSION_PUMP_PERIOD.to_ms() );
    while( std::future_status::ready != f.wait_for( std::chrono::milliseconds::zero() ) ) {
        if( ctx.isClosed() ) {
            f.wait_for(period);
        } else {
            ctx.waitAndRun(SESSION_PUMP_PERIOD);
        }
    }
    return f.get();
}

void SessionCoordinator::checkSessionThread(const char * op) const {
    if( !ctx.isSessionThread() ) {
        throw jau::IllegalStateException(std::string("SessionCoordinator::")+op+": Not on session thread: "+toString(), E_FILE_LINE);
    }
}

OperationResult SessionCoordinator::reject(const ProbeStatusCode status, const std::string& msg) noexcept {
    DBG_PRINT("SessionCoordinator: Rejected %s: %s", to_string(status).c_str(), msg.c_str());
    status_msg = msg;
    return OperationResult(status, status_msg);
}

void SessionCoordinator::recordFailure(const std::string& context, const ProbeStatusCode status, const std::string& detail) noexcept {
    WARN_PRINT("SessionCoordinator: %s: %s: %s", context.c_str(), to_string(status).c_str(), detail.c_str());
    sink.record(context, to_string(status)+": "+detail);
}

OperationResult SessionCoordinator::failed(const std::string& action, const std::string& context,
                                           const ProbeStatusCode status, const std::string& detail) noexcept
{
    recordFailure(context, status, detail);
    status_msg = format_error(action, detail, platform, sink.getPath());
    return OperationResult(status, status_msg);
}

void SessionCoordinator::resetConnection() noexcept {
    connection = nullptr;
    ++connection_epoch;
    selected_key.clear();
    state.clearConnectionState();
}

void SessionCoordinator::closeStale(const GattConnectionRef& conn, const char * context) {
    const GatewayResult<bool> res = await( [this, conn]() { return gateway.disconnect(conn); } );
    if( !res.isSuccess() ) {
        recordFailure(context, res.status, res.detail);
    }
}

void SessionCoordinator::closeAndReset(const char * context) {
    if( nullptr != connection ) {
        const GattConnectionRef conn = connection;
        const GatewayResult<bool> res = await( [this, conn]() { return gateway.disconnect(conn); } );
        if( !res.isSuccess() ) {
            recordFailure(context, res.status, res.detail);
        }
    }
    resetConnection();
}

const AttributeInfo* SessionCoordinator::resolveChecked(const std::string& key, ProbeStatusCode& status_res) noexcept {
    if( nullptr == connection ) {
        status_res = ProbeStatusCode::NOT_CONNECTED;
        return nullptr;
    }
    const AttributeInfo* info = state.resolve(key);
    if( nullptr == info ) {
        status_res = ProbeStatusCode::NOT_FOUND;
        return nullptr;
    }
    status_res = ProbeStatusCode::SUCCESS;
    return info;
}

OperationResult SessionCoordinator::scan() {
    checkSessionThread("scan");
    if( scanning ) {
        return reject(ProbeStatusCode::BUSY, "Scan already running.");
    }
    OperationGuard guard(op_in_flight);
    if( !guard.owns() ) {
        return reject(ProbeStatusCode::BUSY, MSG_BUSY);
    }
    FlagGuard scan_guard(scanning);
    state.clearDevices();
    status_msg = "Scanning...";
    DBG_PRINT("SessionCoordinator::scan: timeout %" PRIi64 " ms", scan_timeout.to_ms());

    const jau::fraction_i64 timeout = scan_timeout;
    GatewayResult<jau::darray<DeviceRecord>> res = await( [this, timeout]() { return gateway.scan(timeout); } );
    if( !res.isSuccess() ) {
        return failed("Scan", "scan", res.status, res.detail);
    }
    state.replaceDevices(res.value);
    status_msg = "Scan complete: "+std::to_string(state.getDevices().size())+" device(s).";
    return OperationResult(ProbeStatusCode::SUCCESS, status_msg);
}

OperationResult SessionCoordinator::connect(const std::string& address) {
    checkSessionThread("connect");
    OperationGuard guard(op_in_flight);
    if( !guard.owns() ) {
        return reject(ProbeStatusCode::BUSY, MSG_BUSY);
    }
    closeAndReset("disconnect (before connect)");

    status_msg = "Connecting to "+address+"...";
    const uint64_t epoch = ++connection_epoch;
    const jau::fraction_i64 timeout = connect_timeout;
    DisconnectCallback on_disconnect( [this, epoch](const std::string& reason) -> void {
        onUnsolicitedDisconnect(epoch, reason);
    } );
    GatewayResult<GattConnectionRef> cres = await( [this, address, timeout, on_disconnect]() {
        return gateway.connect(address, timeout, on_disconnect);
    } );
    if( !cres.isSuccess() || nullptr == cres.value ) {
        resetConnection();
        return failed("Connect", "connect "+address, cres.isSuccess() ? ProbeStatusCode::TRANSPORT_ERROR : cres.status,
                      cres.isSuccess() ? "no connection returned" : cres.detail);
    }
    if( epoch != connection_epoch ) {
        // link lost before the handle reached the session thread
        closeStale(cres.value, "disconnect (lost during connect)");
        return OperationResult(ProbeStatusCode::NOT_CONNECTED, status_msg);
    }
    connection = cres.value;
    state.setConnected(address);
    status_msg = "Connected: "+address;
    DBG_PRINT("SessionCoordinator::connect: %s", connection->toString().c_str());

    const GattConnectionRef conn = connection;
    GatewayResult<DiscoveryResult> dres = await( [this, conn]() { return gateway.discover(conn); } );
    if( epoch != connection_epoch ) {
        closeStale(conn, "disconnect (lost during discovery)");
        return OperationResult(ProbeStatusCode::NOT_CONNECTED, status_msg);
    }
    if( !dres.isSuccess() ) {
        const OperationResult res = failed("Service discovery", "discover "+address, dres.status, dres.detail);
        closeAndReset("disconnect (after failed discovery)");
        return res;
    }
    state.setDiscovery( std::move(dres.value) );
    status_msg = "GATT loaded: "+std::to_string(state.getServiceCount())+" service(s), "+
                 std::to_string(state.getAttributeCount())+" characteristic(s).";
    return OperationResult(ProbeStatusCode::SUCCESS, status_msg);
}

OperationResult SessionCoordinator::disconnect() {
    checkSessionThread("disconnect");
    OperationGuard guard(op_in_flight);
    if( !guard.owns() ) {
        return reject(ProbeStatusCode::BUSY, MSG_BUSY);
    }
    closeAndReset("disconnect");
    status_msg = "Disconnected";
    return OperationResult(ProbeStatusCode::SUCCESS, status_msg);
}

OperationResult SessionCoordinator::read(const std::string& key) {
    checkSessionThread("read");
    OperationGuard guard(op_in_flight);
    if( !guard.owns() ) {
        return reject(ProbeStatusCode::BUSY, MSG_BUSY);
    }
    ProbeStatusCode rstatus;
    const AttributeInfo* info = resolveChecked(key, rstatus);
    if( nullptr == info ) {
        return reject(rstatus, ProbeStatusCode::NOT_CONNECTED == rstatus ? MSG_NOT_CONNECTED : MSG_UNKNOWN_CHAR);
    }
    if( !info->isReadable() ) {
        return reject(ProbeStatusCode::CAPABILITY_MISMATCH, "Selected characteristic is not readable.");
    }
    const std::string id = info->id;
    const AttributeTarget target = SessionState::targetFor(*info);
    const GattConnectionRef conn = connection;
    const uint64_t epoch = connection_epoch;

    GatewayResult<ValueBytes> res = await( [this, conn, target]() { return gateway.read(conn, target); } );
    if( epoch != connection_epoch ) {
        return OperationResult(ProbeStatusCode::NOT_CONNECTED, status_msg);
    }
    if( !res.isSuccess() ) {
        return failed("Read", "read "+key, res.status, res.detail);
    }
    state.appendValue(key, res.value);
    status_msg = "Read "+id;
    return OperationResult(ProbeStatusCode::SUCCESS, status_msg);
}

OperationResult SessionCoordinator::toggleNotify(const std::string& key) {
    checkSessionThread("toggleNotify");
    OperationGuard guard(op_in_flight);
    if( !guard.owns() ) {
        return reject(ProbeStatusCode::BUSY, MSG_BUSY);
    }
    ProbeStatusCode rstatus;
    const AttributeInfo* info = resolveChecked(key, rstatus);
    if( nullptr == info ) {
        return reject(rstatus, ProbeStatusCode::NOT_CONNECTED == rstatus ? MSG_NOT_CONNECTED : MSG_UNKNOWN_CHAR);
    }
    if( !info->isNotifiable() ) {
        return reject(ProbeStatusCode::CAPABILITY_MISMATCH, "Selected characteristic does not support notify/indicate.");
    }
    const std::string id = info->id;
    const AttributeTarget target = SessionState::targetFor(*info);
    const GattConnectionRef conn = connection;
    const uint64_t epoch = connection_epoch;

    if( state.isSubscribed(key) ) {
        GatewayResult<bool> res = await( [this, conn, target]() { return gateway.stopNotify(conn, target); } );
        if( epoch != connection_epoch ) {
            return OperationResult(ProbeStatusCode::NOT_CONNECTED, status_msg);
        }
        if( !res.isSuccess() ) {
            return failed("Stop notify", "stop_notify "+key, res.status, res.detail);
        }
        state.removeSubscription(key);
        status_msg = "Stopped notify "+id;
    } else {
        NotifyCallback on_value( [this, epoch, key](const std::optional<uint16_t>& handle, const ValueBytes& data) -> void {
            onNotification(epoch, key, handle, data);
        } );
        GatewayResult<bool> res = await( [this, conn, target, on_value]() { return gateway.startNotify(conn, target, on_value); } );
        if( epoch != connection_epoch ) {
            return OperationResult(ProbeStatusCode::NOT_CONNECTED, status_msg);
        }
        if( !res.isSuccess() ) {
            return failed("Start notify", "start_notify "+key, res.status, res.detail);
        }
        state.addSubscription(key);
        status_msg = "Subscribed "+id;
    }
    return OperationResult(ProbeStatusCode::SUCCESS, status_msg);
}

OperationResult SessionCoordinator::write(const std::string& key, const ValueBytes& data, const bool prefer_response) {
    checkSessionThread("write");
    OperationGuard guard(op_in_flight);
    if( !guard.owns() ) {
        return reject(ProbeStatusCode::BUSY, MSG_BUSY);
    }
    ProbeStatusCode rstatus;
    const AttributeInfo* info = resolveChecked(key, rstatus);
    if( nullptr == info ) {
        return reject(rstatus, ProbeStatusCode::NOT_CONNECTED == rstatus ? MSG_NOT_CONNECTED : MSG_UNKNOWN_CHAR);
    }
    if( ( prefer_response && !info->isWritable() ) || ( !prefer_response && !info->isWritableNoResp() ) ) {
        return reject(ProbeStatusCode::CAPABILITY_MISMATCH, "Selected characteristic is not writable.");
    }
    const std::string id = info->id;
    const AttributeTarget target = SessionState::targetFor(*info);
    const GattConnectionRef conn = connection;
    const uint64_t epoch = connection_epoch;
    const std::string written = "Wrote "+std::to_string(data.size())+" bytes to "+id;

    GatewayResult<bool> res = await( [this, conn, target, data, prefer_response]() {
        return gateway.write(conn, target, data, prefer_response);
    } );
    if( epoch != connection_epoch ) {
        return OperationResult(ProbeStatusCode::NOT_CONNECTED, status_msg);
    }
    if( res.isSuccess() ) {
        status_msg = written;
        return OperationResult(ProbeStatusCode::SUCCESS, status_msg);
    }
    if( !prefer_response ) {
        return failed("Write", "write "+key, res.status, res.detail);
    }
    recordFailure("write "+key+" (with-response, retrying without)", res.status, res.detail);

    GatewayResult<bool> fres = await( [this, conn, target, data]() {
        return gateway.write(conn, target, data, false /* with_response */);
    } );
    if( epoch != connection_epoch ) {
        return OperationResult(ProbeStatusCode::NOT_CONNECTED, status_msg);
    }
    if( !fres.isSuccess() ) {
        return failed("Write", "write "+key+" (without-response)", fres.status, fres.detail);
    }
    status_msg = written+" (no-response fallback)";
    return OperationResult(ProbeStatusCode::FALLBACK_SUCCESS, status_msg);
}

OperationResult SessionCoordinator::writeInput(const std::string& key, const std::string& input, const bool hex_input,
                                               const bool prefer_response)
{
    checkSessionThread("writeInput");
    if( !hex_input ) {
        return write(key, text_to_bytes(input), prefer_response);
    }
    const std::optional<ValueBytes> data = parse_hex_string(input);
    if( !data.has_value() ) {
        return reject(ProbeStatusCode::INVALID_INPUT, "Invalid value.");
    }
    return write(key, data.value(), prefer_response);
}

OperationResult SessionCoordinator::clearHistory(const std::string& key) {
    checkSessionThread("clearHistory");
    const AttributeInfo* info = state.resolve(key);
    if( nullptr == info ) {
        return reject(ProbeStatusCode::NOT_FOUND, MSG_UNKNOWN_CHAR);
    }
    state.clearHistory(key);
    status_msg = "Cleared history for "+info->id;
    return OperationResult(ProbeStatusCode::SUCCESS, status_msg);
}

void SessionCoordinator::onNotification(const uint64_t epoch, const std::string& key,
                                        const std::optional<uint16_t>& handle, const ValueBytes& data) noexcept
{
    COND_PRINT(ProbeEnv::get().DEBUG_HANDOFF, "SessionCoordinator::onNotification: epoch %" PRIu64 ", key %s, %zu bytes",
               epoch, key.c_str(), data.size());
    if( ctx.post( SessionContext::Task( [this, epoch, key, handle, data]() -> void { applyNotification(epoch, key, handle, data); } ) ) ) {
        return;
    }
    if( ctx.isSessionThread() ) {
        applyNotification(epoch, key, handle, data);
        return;
    }
    ERR_PRINT("SessionCoordinator::onNotification: Dropped notification of %s, %zu bytes: %s",
              key.c_str(), data.size(), ctx.toString().c_str());
}

void SessionCoordinator::onUnsolicitedDisconnect(const uint64_t epoch, const std::string& reason) noexcept {
    COND_PRINT(ProbeEnv::get().DEBUG_HANDOFF, "SessionCoordinator::onUnsolicitedDisconnect: epoch %" PRIu64 ", %s",
               epoch, reason.c_str());
    if( ctx.post( SessionContext::Task( [this, epoch, reason]() -> void { applyUnsolicitedDisconnect(epoch, reason); } ) ) ) {
        return;
    }
    if( ctx.isSessionThread() ) {
        applyUnsolicitedDisconnect(epoch, reason);
        return;
    }
    ERR_PRINT("SessionCoordinator::onUnsolicitedDisconnect: Dropped disconnect event, %s: %s",
              reason.c_str(), ctx.toString().c_str());
}

void SessionCoordinator::applyNotification(const uint64_t epoch, const std::string& key,
                                           const std::optional<uint16_t>& handle, const ValueBytes& data) noexcept
{
    if( epoch != connection_epoch || nullptr == connection ) {
        DBG_PRINT("SessionCoordinator::applyNotification: Stale epoch %" PRIu64 " != %" PRIu64 ", dropped %s",
                  epoch, connection_epoch, key.c_str());
        return;
    }
    std::string target_key = key;
    if( handle.has_value() ) {
        std::optional<std::string> hkey = state.keyByHandle(handle.value());
        if( hkey.has_value() ) {
            target_key = hkey.value();
        }
    }
    state.appendValue(target_key, data);
    const AttributeInfo* info = state.resolve(target_key);
    status_msg = "Notify "+( nullptr != info ? info->id : target_key )+" ("+std::to_string(data.size())+" B)";
}

void SessionCoordinator::applyUnsolicitedDisconnect(const uint64_t epoch, const std::string& reason) noexcept {
    // connection may still be nullptr while connect() awaits the handle of this epoch
    if( epoch != connection_epoch ) {
        DBG_PRINT("SessionCoordinator::applyUnsolicitedDisconnect: Stale epoch %" PRIu64 " != %" PRIu64 ", %s",
                  epoch, connection_epoch, reason.c_str());
        return;
    }
    WORDY_PRINT("SessionCoordinator: Device disconnected unexpectedly: %s, %s", reason.c_str(), state.toString().c_str());
    resetConnection();
    status_msg = "Device disconnected unexpectedly";
}

std::string SessionCoordinator::getStatusLine() const noexcept {
    const std::string conn = state.isConnected() ? "Connected "+state.getConnectedAddress() : "Disconnected";
    std::string selected = "-";
    if( !selected_key.empty() ) {
        const std::string::size_type p0 = selected_key.find(':');
        if( std::string::npos != p0 ) {
            std::string::size_type p1 = selected_key.find(':', p0+1);
            if( std::string::npos == p1 ) {
                p1 = selected_key.size();
            }
            selected = selected_key.substr(p0+1, std::min<std::string::size_type>(8, p1-p0-1));
        }
    }
    return "[CONN "+conn+"] [SCAN "+( scanning ? "Scanning" : "Idle" )+"] [CHAR "+selected+"] [NOTIFY "+
           std::to_string(state.getSubscriptions().size())+"] "+status_msg;
}

std::string SessionCoordinator::getLatestView(const std::string& key) const noexcept {
    const LogRing* log = state.getLog(key);
    if( nullptr == log || nullptr == log->newest() || nullptr == state.getLastRaw(key) ) {
        return "";
    }
    return format_latest( *log->newest() );
}

std::string SessionCoordinator::toString() const noexcept {
    return "SessionCoordinator[epoch "+std::to_string(connection_epoch)+
           ", connected "+( nullptr != connection ? "true" : "false" )+
           ", busy "+( op_in_flight ? "true" : "false" )+
           ", scanning "+( scanning ? "true" : "false" )+
           ", "+state.toString()+"]";
}
