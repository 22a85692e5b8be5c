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

#include <jau/debug.hpp>
#include <jau/basic_types.hpp>

#include "ProbeEnv.hpp"
#include "SessionContext.hpp"

using namespace gatt_probe;
using namespace jau::fractions_i64_literals;

SessionContext::SessionContext(const jau::nsize_t capacity)
: session_thread_id( std::this_thread::get_id() ),
  task_ring(capacity), closed(false),
  posted_count(0), run_count(0), reject_count(0)
{
    DBG_PRINT("SessionContext::ctor: capacity %u", (unsigned int)capacity);
}

SessionContext::~SessionContext() noexcept {
    close();
}

bool SessionContext::post(Task&& task) noexcept {
    if( closed ) {
        ++reject_count;
        return false;
    }
    bool ok;
    {
        const std::lock_guard<std::mutex> lock(mtx_post); // RAII-style acquire and relinquish via destructor
        ok = task_ring.put( std::move(task) );
    }
    if( !ok ) {
        ++reject_count;
        WARN_PRINT("SessionContext::post: Ring full, %u pending: %s", (unsigned int)task_ring.size(), toString().c_str());
        return false;
    }
    ++posted_count;
    COND_PRINT(ProbeEnv::get().DEBUG_HANDOFF, "SessionContext::post: %u pending", (unsigned int)task_ring.size());
    return true;
}

jau::nsize_t SessionContext::runPending() {
    jau::nsize_t count = 0;
    Task task;
    while( !closed && task_ring.get(task) ) {
        ++run_count;
        ++count;
        try {
            task();
        } catch (std::exception &e) {
            ERR_PRINT("SessionContext::runPending: Caught exception %s", e.what());
        }
    }
    return count;
}

jau::nsize_t SessionContext::waitAndRun(const jau::fraction_i64& timeout) {
    if( closed ) {
        return 0;
    }
    Task task;
    if( !task_ring.getBlocking(task, timeout) ) {
        return 0;
    }
    ++run_count;
    try {
        task();
    } catch (std::exception &e) {
        ERR_PRINT("SessionContext::waitAndRun: Caught exception %s", e.what());
    }
    return 1 + runPending();
}

void SessionContext::close() noexcept {
    bool expected = false;
    if( closed.compare_exchange_strong(expected, true) ) {
        const jau::nsize_t dropped = task_ring.size();
        task_ring.clear();
        DBG_PRINT("SessionContext::close: dropped %u pending: %s", (unsigned int)dropped, toString().c_str());
    }
}

std::string SessionContext::toString() const noexcept {
    return "SessionContext[pending "+std::to_string(task_ring.size())+
           ", posted "+std::to_string( posted_count.load() )+
           ", run "+std::to_string( run_count.load() )+
           ", rejected "+std::to_string( reject_count.load() )+
           ", closed "+( closed ? "true" : "false" )+"]";
}
