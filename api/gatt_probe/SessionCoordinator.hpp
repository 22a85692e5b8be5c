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

#ifndef SESSION_COORDINATOR_HPP_
#define SESSION_COORDINATOR_HPP_

#include <cstdint>
#include <string>
#include <memory>
#include <optional>

#include <jau/basic_types.hpp>
#include <jau/ordered_atomic.hpp>
#include <jau/fraction_type.hpp>

#include "ProbeTypes.hpp"
#include "DeviceGateway.hpp"
#include "SessionState.hpp"
#include "SessionContext.hpp"
#include "DiagnosticSink.hpp"
#include "PlatformHint.hpp"

namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    /**
     * Outcome of one SessionCoordinator operation.
     *
     * The message equals the coordinator's status message after the operation.
     */
    class OperationResult {
        public:
            ProbeStatusCode status;
            std::string message;

            OperationResult(const ProbeStatusCode status_, const std::string& message_) noexcept
            : status(status_), message(message_) {}

            /** Returns true for SUCCESS and FALLBACK_SUCCESS. */
            bool isSuccess() const noexcept { return is_success(status); }

            std::string toString() const noexcept {
                return "OperationResult["+to_string(status)+", '"+message+"']";
            }
    };

    /**
     * Serializes all device operations against the single active connection
     * and merges unsolicited notification and disconnect events into the SessionState.
     *
     * All operations must be invoked on the SessionContext's session thread.
     * While a DeviceGateway call is in flight, the session thread keeps running posted closures,
     * an operation invoked from such closure is rejected with ProbeStatusCode::BUSY.
     *
     * DeviceGateway failures never leave this class as exceptions:
     * they are recorded to the DiagnosticSink and summarized via format_error().
     * BUSY, NOT_FOUND, NOT_CONNECTED, CAPABILITY_MISMATCH and INVALID_INPUT are silent rejections.
     */
    class SessionCoordinator {
        private:
            DeviceGateway& gateway;
            SessionState& state;
            SessionContext& ctx;
            DiagnosticSink& sink;
            const PlatformType platform;

            jau::fraction_i64 scan_timeout;
            jau::fraction_i64 connect_timeout;

            /** Owned live connection, nullptr if disconnected. */
            GattConnectionRef connection;

            /**
             * Incremented on each connect and connection reset,
             * closures of an older epoch are dropped on the session thread.
             */
            uint64_t connection_epoch;

            jau::sc_atomic_bool op_in_flight;
            jau::sc_atomic_bool scanning;

            std::string selected_key;
            std::string status_msg;

            template<typename F> auto await(F&& call) -> decltype( call() );

            void checkSessionThread(const char * op) const;

            OperationResult reject(const ProbeStatusCode status, const std::string& msg) noexcept;

            OperationResult failed(const std::string& action, const std::string& context,
                                   const ProbeStatusCode status, const std::string& detail) noexcept;

            void recordFailure(const std::string& context, const ProbeStatusCode status, const std::string& detail) noexcept;

            /** Closes a handle whose connection epoch is already gone, recording a failure. */
            void closeStale(const GattConnectionRef& conn, const char * context);

            /** Best effort close of the live connection and reset of all connection scoped state. */
            void closeAndReset(const char * context);

            void resetConnection() noexcept;

            /** Returns the resolved attribute or a rejection status, requires an active connection. */
            const AttributeInfo* resolveChecked(const std::string& key, ProbeStatusCode& status_res) noexcept;

            void onNotification(const uint64_t epoch, const std::string& key,
                                const std::optional<uint16_t>& handle, const ValueBytes& data) noexcept;

            void onUnsolicitedDisconnect(const uint64_t epoch, const std::string& reason) noexcept;

            void applyNotification(const uint64_t epoch, const std::string& key,
                                   const std::optional<uint16_t>& handle, const ValueBytes& data) noexcept;

            void applyUnsolicitedDisconnect(const uint64_t epoch, const std::string& reason) noexcept;

        public:
            SessionCoordinator(DeviceGateway& gateway_, SessionState& state_, SessionContext& ctx_, DiagnosticSink& sink_,
                               const PlatformType platform_=get_platform_type()) noexcept;

            SessionCoordinator(const SessionCoordinator&) = delete;
            void operator=(const SessionCoordinator&) = delete;

            /**
             * Closes the live connection, if any. Must be called on the session thread.
             */
            ~SessionCoordinator() noexcept;

            void setScanTimeout(const jau::fraction_i64& v) noexcept { scan_timeout = v; }
            void setConnectTimeout(const jau::fraction_i64& v) noexcept { connect_timeout = v; }

            /**
             * Replaces the device list with the result of a new scan.
             *
             * The previous list is cleared before scanning. Rejected with BUSY if a scan
             * or another operation is running.
             */
            OperationResult scan();

            /**
             * Connects to the given address and discovers its attributes.
             *
             * Any live connection is closed first. A failure of any step leaves the session disconnected.
             */
            OperationResult connect(const std::string& address);

            /**
             * Closes the live connection, best effort, and resets all connection scoped state
             * regardless of the close result.
             */
            OperationResult disconnect();

            /** Reads the attribute and appends its value, requires readable. */
            OperationResult read(const std::string& key);

            /**
             * Stops notification if subscribed, otherwise starts it.
             *
             * Requires notify or indicate. The subscription set is only modified on success.
             */
            OperationResult toggleNotify(const std::string& key);

            /**
             * Writes the value, with response if `prefer_response`, otherwise without.
             *
             * Requires write if `prefer_response`, otherwise write-without-response.
             * A failed write with response is retried once without response,
             * its success is reported as ProbeStatusCode::FALLBACK_SUCCESS.
             */
            OperationResult write(const std::string& key, const ValueBytes& data, const bool prefer_response);

            /**
             * Parses the user input and writes it, see write(const std::string&, const ValueBytes&, const bool).
             *
             * @param input hex digits, whitespace ignored, if `hex_input`, otherwise text written as its UTF-8 bytes
             * @return ProbeStatusCode::INVALID_INPUT if the hex input is empty, of odd length or holds a non-hex digit
             */
            OperationResult writeInput(const std::string& key, const std::string& input, const bool hex_input, const bool prefer_response);

            /**
             * Empties the key's log and last raw value, subscriptions and other keys are untouched.
             */
            OperationResult clearHistory(const std::string& key);

            /** Selects the attribute shown in the status line, not validated. */
            void select(const std::string& key) noexcept { selected_key = key; }

            const std::string& getSelectedKey() const noexcept { return selected_key; }

            /**
             * Runs all closures handed off to the session context.
             * @return number of executed closures
             */
            jau::nsize_t processEvents() {
                checkSessionThread("processEvents");
                return ctx.runPending();
            }

            /**
             * Waits up to `timeout` for handed off closures and runs them.
             * @return number of executed closures
             */
            jau::nsize_t processEvents(const jau::fraction_i64& timeout) {
                checkSessionThread("processEvents");
                return ctx.waitAndRun(timeout);
            }

            bool isConnected() const noexcept { return nullptr != connection; }
            bool isScanning() const noexcept { return scanning; }
            bool isBusy() const noexcept { return op_in_flight; }

            uint64_t getConnectionEpoch() const noexcept { return connection_epoch; }

            const SessionState& getState() const noexcept { return state; }

            const std::string& getStatusMessage() const noexcept { return status_msg; }

            /**
             * Returns the status line
             * `[CONN Connected <addr>|Disconnected] [SCAN Scanning|Idle] [CHAR <id prefix>|-] [NOTIFY <n>] <message>`.
             */
            std::string getStatusLine() const noexcept;

            /**
             * Returns the latest value view of the given key, empty if nothing has been recorded.
             */
            std::string getLatestView(const std::string& key) const noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace gatt_probe

#endif /* SESSION_COORDINATOR_HPP_ */
