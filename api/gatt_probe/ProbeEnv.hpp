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

#ifndef PROBE_ENV_HPP_
#define PROBE_ENV_HPP_

#include <cstdint>
#include <string>

#include <jau/environment.hpp>
#include <jau/fraction_type.hpp>

#include "ProbeConst.hpp"

namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    /**
     * gatt_probe Singleton runtime environment properties
     * <p>
     * Also see {@link jau::environment::getExplodingProperties(const std::string & prefixDomain)}.
     * </p>
     */
    class ProbeEnv : public jau::root_environment {
        private:
            ProbeEnv() noexcept;

            const bool exploding; // just to trigger exploding properties

        public:
            /**
             * Duration of one scan cycle, defaults to 5s.
             * <p>
             * Environment variable is 'gatt_probe.scan.timeout'.
             * </p>
             */
            const jau::fraction_i64 SCAN_TIMEOUT;

            /**
             * Timeout for connect including the wait for a ready connection, defaults to 10s.
             * <p>
             * Environment variable is 'gatt_probe.connect.timeout'.
             * </p>
             */
            const jau::fraction_i64 CONNECT_TIMEOUT;

            /**
             * Maximum ValueEntry count per attribute key, defaults to 200.
             * <p>
             * Environment variable is 'gatt_probe.log.max'.
             * </p>
             */
            const int32_t LOG_MAX;

            /**
             * Capacity of the session context hand-off ring, defaults to 256 closures.
             * <p>
             * Environment variable is 'gatt_probe.session.ringsize'.
             * </p>
             */
            const int32_t SESSION_RING_CAPACITY;

            /**
             * Path of the diagnostic sink, defaults to 'gatt_probe_errors.log'.
             * <p>
             * Environment variable is 'gatt_probe.error.log'.
             * </p>
             */
            const std::string ERROR_LOG_PATH;

            /**
             * Trace every hand-off of a notification or disconnect event.
             * <p>
             * Environment variable is 'gatt_probe.debug.handoff'.
             * </p>
             */
            const bool DEBUG_HANDOFF;

        public:
            static ProbeEnv& get() noexcept {
                /**
                 * Thread safe starting with C++11 6.7:
                 *
                 * If control enters the declaration concurrently while the variable is being initialized,
                 * the concurrent execution shall wait for completion of the initialization.
                 *
                 * (Magic Statics)
                 */
                static ProbeEnv e;
                return e;
            }
    };

    /**@}*/

} // namespace gatt_probe

#endif /* PROBE_ENV_HPP_ */
