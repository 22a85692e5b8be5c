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

#ifndef PLATFORM_HINT_HPP_
#define PLATFORM_HINT_HPP_

#include <cstdint>
#include <string>

namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    enum class PlatformType : uint8_t {
        UNKNOWN = 0,
        WINDOWS = 1,
        LINUX   = 2,
        MACOS   = 3
    };
    std::string to_string(const PlatformType v) noexcept;

    /** Failure signature class of a gateway failure detail, see classify_failure(). */
    enum class FailureClass : uint8_t {
        /** No signature matched */
        GENERIC              = 0,
        /** Bluetooth is off, unsupported or no adapter exists */
        ADAPTER_UNAVAILABLE  = 1,
        /** Bluetooth stack or its permissions are not available */
        STACK_UNAVAILABLE    = 2,
        /** Access to the adapter has been denied */
        ACCESS_DENIED        = 3
    };
    std::string to_string(const FailureClass v) noexcept;

    /**
     * Maps a platform identifier to its PlatformType by prefix:
     * `win*` is WINDOWS, `linux*` is LINUX, `darwin*` is MACOS, otherwise UNKNOWN.
     *
     * Matching is case insensitive.
     */
    PlatformType to_platform_type(const std::string& platform_id) noexcept;

    /** Returns the identifier of the running platform, e.g. `linux`. */
    std::string get_platform_id() noexcept;

    /** Returns the PlatformType of the running platform. */
    PlatformType get_platform_type() noexcept;

    /**
     * Classifies the given failure detail on the given platform, matching case insensitive.
     *
     * ADAPTER_UNAVAILABLE is detected on all platforms, STACK_UNAVAILABLE only on LINUX
     * and ACCESS_DENIED only on WINDOWS.
     */
    FailureClass classify_failure(const std::string& detail, const PlatformType platform) noexcept;

    /** Returns the remediation hint for the given failure detail on the given platform. */
    std::string ble_hint(const std::string& detail, const PlatformType platform) noexcept;

    /**
     * Returns the user facing failure summary `<action> failed: <hint> (details in <sink_path>)`.
     */
    std::string format_error(const std::string& action, const std::string& detail,
                             const PlatformType platform, const std::string& sink_path) noexcept;

    /**@}*/

} // namespace gatt_probe

#endif /* PLATFORM_HINT_HPP_ */
