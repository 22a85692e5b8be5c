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
#include <fstream>

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "DiagnosticSink.hpp"

using namespace gatt_probe;

bool DiagnosticSink::record(const std::string& context, const std::string& detail) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    const std::string ts = jau::getWallClockTime().to_iso8601_string();
    std::ofstream file(path, std::ios::out | std::ios::app);

    if ( !file.good() || !file.is_open() ) {
        ERR_PRINT("DiagnosticSink: Failed: File not open %s: [%s] %s: %s", path.c_str(), ts.c_str(), context.c_str(), detail.c_str());
        return false;
    }
    file << "[" << ts << "] " << context << "\n" << detail << "\n";
    file.flush();
    if( !file.good() ) {
        ERR_PRINT("DiagnosticSink: Failed: Write error %s: [%s] %s", path.c_str(), ts.c_str(), context.c_str());
        return false;
    }
    ++record_count;
    return true;
}

jau::nsize_t DiagnosticSink::getRecordCount() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_write); // RAII-style acquire and relinquish via destructor
    return record_count;
}

std::string DiagnosticSink::toString() const noexcept {
    return "DiagnosticSink[path "+path+", records "+std::to_string(getRecordCount())+"]";
}
