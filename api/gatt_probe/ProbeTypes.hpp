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

#ifndef PROBE_TYPES_HPP_
#define PROBE_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>
#include <optional>
#include <system_error>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/fraction_type.hpp>

#include "ProbeConst.hpp"

namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    /** Raw attribute payload as received from or sent to the transport. */
    typedef std::vector<uint8_t> ValueBytes;

    /**
     * Status of a coordinator operation or Device Gateway call.
     *
     * BUSY, NOT_FOUND, NOT_CONNECTED, CAPABILITY_MISMATCH and INVALID_INPUT are local rejections,
     * TRANSPORT_ERROR and TIMEOUT are gateway failures recorded to the DiagnosticSink.
     */
    enum class ProbeStatusCode : uint8_t {
        SUCCESS             = 0x00,
        /** Write with response failed, the single no-response fallback succeeded. */
        FALLBACK_SUCCESS    = 0x01,
        BUSY                = 0x10,
        NOT_FOUND           = 0x11,
        NOT_CONNECTED       = 0x12,
        CAPABILITY_MISMATCH = 0x13,
        INVALID_INPUT       = 0x14,
        TRANSPORT_ERROR     = 0x20,
        TIMEOUT             = 0x21,
        UNKNOWN             = 0xff
    };
    constexpr uint8_t number(const ProbeStatusCode rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ProbeStatusCode ec) noexcept;

    /** Returns true for SUCCESS and FALLBACK_SUCCESS. */
    constexpr bool is_success(const ProbeStatusCode ec) noexcept {
        return ProbeStatusCode::SUCCESS == ec || ProbeStatusCode::FALLBACK_SUCCESS == ec;
    }

    /** Returns true for gateway failures, i.e. TRANSPORT_ERROR and TIMEOUT. */
    constexpr bool is_gateway_failure(const ProbeStatusCode ec) noexcept {
        return ProbeStatusCode::TRANSPORT_ERROR == ec || ProbeStatusCode::TIMEOUT == ec;
    }

    class ProbeStatusCodeCategory : public std::error_category {
        public:
            const char* name() const noexcept override { return "GattProbe"; }
            std::string message(int condition) const override {
                return "GattProbe::"+to_string( static_cast<ProbeStatusCode>(condition) );
            }
            static ProbeStatusCodeCategory& get() {
                static ProbeStatusCodeCategory s;
                return s;
            }
    };
    inline std::error_code make_error_code( ProbeStatusCode e ) noexcept {
      return std::error_code( number(e), ProbeStatusCodeCategory::get() );
    }

    /**
     * Capability set of a characteristic, see AttributeInfo::capabilities.
     *
     * Notify and Indicate are both treated as notifiable.
     */
    enum class CapabilityBitVal : uint8_t {
        NONE            = 0,
        Read            = (1 << 0),
        Write           = (1 << 1),
        WriteNoResp     = (1 << 2),
        Notify          = (1 << 3),
        Indicate        = (1 << 4),
        Broadcast       = (1 << 5),
        AuthSignedWrite = (1 << 6),
        ExtProps        = (1 << 7)
    };
    constexpr uint8_t number(const CapabilityBitVal rhs) noexcept { return static_cast<uint8_t>(rhs); }

    constexpr CapabilityBitVal operator |(const CapabilityBitVal lhs, const CapabilityBitVal rhs) noexcept {
        return static_cast<CapabilityBitVal> ( number(lhs) | number(rhs) );
    }
    constexpr CapabilityBitVal operator &(const CapabilityBitVal lhs, const CapabilityBitVal rhs) noexcept {
        return static_cast<CapabilityBitVal> ( number(lhs) & number(rhs) );
    }
    constexpr bool operator ==(const CapabilityBitVal lhs, const CapabilityBitVal rhs) noexcept {
        return number(lhs) == number(rhs);
    }
    constexpr bool operator !=(const CapabilityBitVal lhs, const CapabilityBitVal rhs) noexcept {
        return !( lhs == rhs );
    }
    constexpr bool is_set(const CapabilityBitVal mask, const CapabilityBitVal bit) noexcept { return bit == ( mask & bit ); }
    constexpr void set(CapabilityBitVal &mask, const CapabilityBitVal bit) noexcept { mask = mask | bit; }
    std::string to_string(const CapabilityBitVal mask) noexcept;

    /**
     * A device found by the last scan, immutable.
     */
    class DeviceRecord {
        public:
            std::string name;
            std::string address;
            /** RSSI in dBm, RSSI_UNKNOWN if not reported. */
            int32_t signal_strength;

            DeviceRecord() noexcept
            : name(), address(), signal_strength(RSSI_UNKNOWN) {}

            DeviceRecord(const std::string& name_, const std::string& address_, const int32_t signal_strength_) noexcept
            : name(name_), address(address_), signal_strength(signal_strength_) {}

            std::string toString() const noexcept;
    };

    /**
     * Returns the unique attribute key `service_id:char_id[:handle]`.
     *
     * The handle suffix is only present if the transport exposes a numeric handle,
     * keeping the same characteristic id under different handles distinct.
     */
    std::string make_attribute_key(const std::string& service_id, const std::string& char_id,
                                   const std::optional<uint16_t>& handle) noexcept;

    /**
     * A discovered characteristic, immutable per discovery cycle.
     */
    class AttributeInfo {
        public:
            std::string key;
            /** Characteristic id, i.e. its 128-bit UUID string. */
            std::string id;
            CapabilityBitVal capabilities;
            std::string service_id;
            /** Transport-assigned value handle, if exposed by the transport. */
            std::optional<uint16_t> transport_handle;
            /** Optional human readable description, e.g. from the user description descriptor. */
            std::string description;

            AttributeInfo() noexcept
            : key(), id(), capabilities(CapabilityBitVal::NONE), service_id(), transport_handle(), description() {}

            AttributeInfo(const std::string& service_id_, const std::string& id_, const CapabilityBitVal capabilities_,
                          const std::optional<uint16_t>& transport_handle_, const std::string& description_="") noexcept
            : key(make_attribute_key(service_id_, id_, transport_handle_)), id(id_), capabilities(capabilities_),
              service_id(service_id_), transport_handle(transport_handle_), description(description_) {}

            bool hasCapabilities(const CapabilityBitVal v) const noexcept { return is_set(capabilities, v); }

            bool isReadable() const noexcept { return hasCapabilities(CapabilityBitVal::Read); }
            bool isWritable() const noexcept { return hasCapabilities(CapabilityBitVal::Write); }
            bool isWritableNoResp() const noexcept { return hasCapabilities(CapabilityBitVal::WriteNoResp); }
            bool isNotifiable() const noexcept {
                return hasCapabilities(CapabilityBitVal::Notify) || hasCapabilities(CapabilityBitVal::Indicate);
            }

            std::string toString() const noexcept;
    };

    /** A discovered service and its characteristics in discovery order. */
    class ServiceInfo {
        public:
            std::string id;
            std::optional<uint16_t> transport_handle;
            jau::darray<AttributeInfo> attributes;

            ServiceInfo() noexcept
            : id(), transport_handle(), attributes() {}

            ServiceInfo(const std::string& id_, const std::optional<uint16_t>& transport_handle_) noexcept
            : id(id_), transport_handle(transport_handle_), attributes() {}

            std::string toString() const noexcept;
    };

    /**
     * How the transport shall address a characteristic, see SessionState::targetFor().
     */
    class AttributeTarget {
        public:
            /** True if handle addresses the characteristic, otherwise id is used. */
            bool by_handle;
            uint16_t handle;
            std::string id;

            AttributeTarget(const uint16_t handle_, const std::string& id_) noexcept
            : by_handle(true), handle(handle_), id(id_) {}

            explicit AttributeTarget(const std::string& id_) noexcept
            : by_handle(false), handle(0), id(id_) {}

            std::string toString() const noexcept;
    };

    /**
     * A decoded value snapshot, appended to a LogRing and never mutated.
     */
    class ValueEntry {
        public:
            /** Wall-clock time of capture. */
            jau::fraction_timespec timestamp;
            /** Local time of capture as `HH:MM:SS.mmm`. */
            std::string ts;
            jau::nsize_t byte_length;
            std::string hex;
            /** Canonical compact JSON if the payload is a UTF-8 JSON document. */
            std::optional<std::string> json;

            ValueEntry() noexcept
            : timestamp(), ts(), byte_length(0), hex(), json() {}

            ValueEntry(const jau::fraction_timespec& timestamp_, const std::string& ts_, const jau::nsize_t byte_length_,
                       const std::string& hex_, const std::optional<std::string>& json_) noexcept
            : timestamp(timestamp_), ts(ts_), byte_length(byte_length_), hex(hex_), json(json_) {}

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace gatt_probe

namespace std
{
    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    template <>
    struct is_error_code_enum<gatt_probe::ProbeStatusCode> : true_type {};

    /**@}*/
}

#endif /* PROBE_TYPES_HPP_ */
