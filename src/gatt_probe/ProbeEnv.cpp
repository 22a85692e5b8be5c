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

#include <jau/environment.hpp>

#include "ProbeEnv.hpp"

using namespace gatt_probe;
using namespace jau::fractions_i64_literals;

ProbeEnv::ProbeEnv() noexcept
: exploding( jau::environment::getExplodingProperties("gatt_probe") ),
  SCAN_TIMEOUT( jau::environment::getFractionProperty("gatt_probe.scan.timeout", gatt_probe::SCAN_TIMEOUT, 1_s /* min */, 60_s /* max */) ),
  CONNECT_TIMEOUT( jau::environment::getFractionProperty("gatt_probe.connect.timeout", gatt_probe::CONNECT_TIMEOUT, 1_s /* min */, 120_s /* max */) ),
  LOG_MAX( jau::environment::getInt32Property("gatt_probe.log.max", static_cast<int32_t>(gatt_probe::LOG_MAX), 1 /* min */, 100000 /* max */) ),
  SESSION_RING_CAPACITY( jau::environment::getInt32Property("gatt_probe.session.ringsize",
                         static_cast<int32_t>(gatt_probe::SESSION_RING_CAPACITY), 16 /* min */, 8192 /* max */) ),
  ERROR_LOG_PATH( jau::environment::getProperty("gatt_probe.error.log", gatt_probe::ERROR_LOG_FILE) ),
  DEBUG_HANDOFF( jau::environment::getBooleanProperty("gatt_probe.debug.handoff", false) )
{
}
