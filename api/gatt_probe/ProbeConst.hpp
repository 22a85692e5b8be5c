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

#ifndef PROBE_CONST_HPP_
#define PROBE_CONST_HPP_

#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/fraction_type.hpp>

namespace gatt_probe {

    using namespace jau::fractions_i64_literals;

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    /** Default maximum number of ValueEntry kept per attribute key, see ProbeEnv::LOG_MAX. */
    inline constexpr const jau::nsize_t LOG_MAX = 200;

    /** Default scan duration, see ProbeEnv::SCAN_TIMEOUT. */
    inline constexpr const jau::fraction_i64 SCAN_TIMEOUT = 5_s;

    /** Default connect and service discovery timeout, see ProbeEnv::CONNECT_TIMEOUT. */
    inline constexpr const jau::fraction_i64 CONNECT_TIMEOUT = 10_s;

    /** Default capacity of the session context hand-off ring, see ProbeEnv::SESSION_RING_CAPACITY. */
    inline constexpr const jau::nsize_t SESSION_RING_CAPACITY = 256;

    /** Poll period of the session context while a gateway call is in flight. */
    inline constexpr const jau::fraction_i64 SESSION_PUMP_PERIOD = 10_ms;

    /** Default diagnostic sink file, see ProbeEnv::ERROR_LOG_PATH. */
    inline constexpr const char * const ERROR_LOG_FILE = "gatt_probe_errors.log";

    /** Signal strength assigned to a DeviceRecord without an RSSI value. */
    inline constexpr const int32_t RSSI_UNKNOWN = -999;

    /** Maximum length of a hex preview in a log line, including the ellipsis. */
    inline constexpr const jau::nsize_t HEX_PREVIEW_MAX = 52;

    /**@}*/

} // namespace gatt_probe

#endif /* PROBE_CONST_HPP_ */
