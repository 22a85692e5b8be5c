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

#ifndef DIAGNOSTIC_SINK_HPP_
#define DIAGNOSTIC_SINK_HPP_

#include <cstdint>
#include <string>
#include <mutex>

#include <jau/basic_types.hpp>

namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    /**
     * Append-only text record of caught failures.
     *
     * Each record is written as `[<iso8601 timestamp>] <context>\n<detail>\n`
     * and the file is opened and closed per record.
     */
    class DiagnosticSink {
        private:
            const std::string path;
            jau::nsize_t record_count;
            mutable std::mutex mtx_write;

        public:
            explicit DiagnosticSink(const std::string& path_) noexcept
            : path(path_), record_count(0) {}

            DiagnosticSink(const DiagnosticSink&) = delete;
            void operator=(const DiagnosticSink&) = delete;

            /** Returns the path referenced in user facing failure messages. */
            const std::string& getPath() const noexcept { return path; }

            /**
             * Appends one record.
             * @return false if the file could not be written, reported via ERR_PRINT.
             */
            bool record(const std::string& context, const std::string& detail) noexcept;

            /** Number of records written by this instance. */
            jau::nsize_t getRecordCount() const noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace gatt_probe

#endif /* DIAGNOSTIC_SINK_HPP_ */
