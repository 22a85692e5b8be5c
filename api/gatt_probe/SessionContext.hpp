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

#ifndef SESSION_CONTEXT_HPP_
#define SESSION_CONTEXT_HPP_

#include <cstdint>
#include <string>
#include <thread>
#include <mutex>
#include <atomic>

#include <jau/basic_types.hpp>
#include <jau/ordered_atomic.hpp>
#include <jau/ringbuffer.hpp>
#include <jau/functional.hpp>
#include <jau/fraction_type.hpp>

namespace gatt_probe {

    /** \addtogroup GattProbeAPI
     *
     *  @{
     */

    /**
     * The single execution context owning all session state mutations.
     *
     * The session thread is the thread which created this instance, see rebind().
     * Foreign threads marshal closures onto the session context via post(),
     * the session thread runs them in posting order via runPending() or waitAndRun().
     *
     * post() never waits for the session thread, a closed or full context rejects the closure.
     */
    class SessionContext {
        public:
            typedef jau::function<void()> Task;
            typedef jau::ringbuffer<Task, jau::nsize_t> TaskRing;

        private:
            std::thread::id session_thread_id;
            TaskRing task_ring;
            /** Serializes multiple producers. */
            std::mutex mtx_post;
            jau::sc_atomic_bool closed;
            jau::sc_atomic_uint64 posted_count;
            jau::sc_atomic_uint64 run_count;
            jau::sc_atomic_uint64 reject_count;

        public:
            /**
             * @param capacity maximum number of pending closures
             */
            explicit SessionContext(const jau::nsize_t capacity);

            SessionContext(const SessionContext&) = delete;
            void operator=(const SessionContext&) = delete;

            ~SessionContext() noexcept;

            /** Makes the calling thread the session thread. */
            void rebind() noexcept { session_thread_id = std::this_thread::get_id(); }

            /** Returns true if the calling thread is the session thread. */
            bool isSessionThread() const noexcept { return std::this_thread::get_id() == session_thread_id; }

            /**
             * Enqueues the closure for execution on the session thread.
             *
             * May be called from any thread.
             * @return false if this context is closed or full, the closure has not been enqueued.
             */
            bool post(Task&& task) noexcept;

            /**
             * Runs all pending closures in posting order on the calling session thread.
             *
             * Closures posted while running are executed as well.
             * @return number of executed closures
             */
            jau::nsize_t runPending();

            /**
             * Waits up to `timeout` for at least one closure and runs all pending closures.
             * @return number of executed closures
             */
            jau::nsize_t waitAndRun(const jau::fraction_i64& timeout);

            /**
             * Closes this context, pending closures are dropped and further post() calls are rejected.
             */
            void close() noexcept;

            bool isClosed() const noexcept { return closed; }

            jau::nsize_t getPendingCount() const noexcept { return task_ring.size(); }

            uint64_t getPostedCount() const noexcept { return posted_count; }
            uint64_t getRunCount() const noexcept { return run_count; }
            uint64_t getRejectCount() const noexcept { return reject_count; }

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace gatt_probe

#endif /* SESSION_CONTEXT_HPP_ */
