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

#include "LogRing.hpp"

using namespace gatt_probe;

LogRing::LogRing(const size_type max_size_) noexcept
: max_size( 0 < max_size_ ? max_size_ : 1 ), entries()
{
    entries.reserve(max_size);
}

void LogRing::push(const ValueEntry& e) noexcept {
    if( entries.size() >= max_size ) {
        entries.erase( entries.begin() );
    }
    entries.push_back(e);
}

const ValueEntry* LogRing::newest() const noexcept {
    if( 0 == entries.size() ) {
        return nullptr;
    }
    return &entries[entries.size()-1];
}

std::string LogRing::toString() const noexcept {
    return "LogRing["+std::to_string(entries.size())+"/"+std::to_string(max_size)+"]";
}
