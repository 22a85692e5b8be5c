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

#ifndef VALUE_CODEC_HPP_
#define VALUE_CODEC_HPP_

#include <cstdint>
#include <string>
#include <optional>

#include <jau/basic_types.hpp>

#include "ProbeTypes.hpp"

/**
 * Stateless rendering of raw attribute payloads.
 */
namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    /**
     * Returns lowercase two-digit hex byte pairs separated by a single space,
     * e.g. `7b 22 61 22`. An empty payload results in an empty string.
     */
    std::string to_hex_groups(const uint8_t * data, const jau::nsize_t length) noexcept;

    inline std::string to_hex_groups(const ValueBytes& data) noexcept {
        return to_hex_groups(data.data(), static_cast<jau::nsize_t>(data.size()));
    }

    /**
     * Returns the canonical compact JSON rendering of the payload,
     * if it is a valid UTF-8 encoded JSON document.
     *
     * Canonical form has no insignificant whitespace and escapes all non-ASCII code points as `\uXXXX`.
     */
    std::optional<std::string> try_parse_json(const ValueBytes& data) noexcept;

    /**
     * Returns the given JSON text indented by `indent` spaces per level,
     * or nothing if the text is not a JSON document.
     */
    std::optional<std::string> pretty_json(const std::string& json_text, const int indent=2) noexcept;

    /**
     * Parses a user entered hex string, e.g. `01 02 ff` or `0102FF`.
     *
     * All whitespace is ignored. Returns nothing if the remaining string
     * is empty, of odd length or contains a non hex digit.
     */
    std::optional<ValueBytes> parse_hex_string(const std::string& text) noexcept;

    /** Returns the UTF-8 bytes of the given text. */
    ValueBytes text_to_bytes(const std::string& text) noexcept;

    /**
     * Returns the hex rendering truncated to `max_len` characters including a trailing `...`,
     * or the unmodified rendering if it fits.
     */
    std::string preview_hex(const std::string& hex, const jau::nsize_t max_len=HEX_PREVIEW_MAX) noexcept;

    /** Returns the local time of the given wall-clock time as `HH:MM:SS.mmm`. */
    std::string to_clock_string(const jau::fraction_timespec& t) noexcept;

    /** Returns a new ValueEntry for the given payload captured now. */
    ValueEntry make_value_entry(const ValueBytes& data) noexcept;

    /**
     * Returns the single line log rendering `ts |    NB | hex preview | json`.
     *
     * The hex preview is padded to HEX_PREVIEW_MAX if a JSON rendering follows.
     */
    std::string format_log_line(const ValueEntry& entry) noexcept;

    /**
     * Returns the multi-line latest value view of the given entry,
     * including its pretty printed JSON if available.
     */
    std::string format_latest(const ValueEntry& entry) noexcept;

    /** Returns the tree label `id h=handle [capabilities]`, marked ` [N]` if subscribed. */
    std::string format_attribute_label(const AttributeInfo& info, const bool subscribed) noexcept;

    /**@}*/

} // namespace gatt_probe

#endif /* VALUE_CODEC_HPP_ */
