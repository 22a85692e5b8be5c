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

#ifndef LOG_RING_HPP_
#define LOG_RING_HPP_

#include <cstdint>
#include <string>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>

#include "ProbeTypes.hpp"

namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    /**
     * Bounded append-only history of ValueEntry for one attribute key.
     *
     * Holds at most getMaxSize() entries, appending to a full ring drops the oldest entry.
     */
    class LogRing {
        public:
            typedef jau::nsize_t size_type;

        private:
            size_type max_size;
            jau::darray<ValueEntry, size_type> entries;

        public:
            /**
             * @param max_size_ maximum number of entries, at least one.
             */
            explicit LogRing(const size_type max_size_) noexcept;

            size_type getMaxSize() const noexcept { return max_size; }
            size_type size() const noexcept { return entries.size(); }
            bool isEmpty() const noexcept { return 0 == entries.size(); }

            /** Appends the entry, evicting the oldest if full. */
            void push(const ValueEntry& e) noexcept;

            void clear() noexcept { entries.clear(); }

            /** Returns all entries, oldest first. */
            const jau::darray<ValueEntry, size_type>& getEntries() const noexcept { return entries; }

            /** Returns the newest entry, nullptr if empty. */
            const ValueEntry* newest() const noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace gatt_probe

#endif /* LOG_RING_HPP_ */
