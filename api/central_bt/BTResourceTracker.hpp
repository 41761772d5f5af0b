/*
 * Author: Sven Gothel <sgothel@jausoft.com>
 * Copyright (c) 2020 Gothel Software e.K.
 * Copyright (c) 2020 ZAFENA AB
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

#ifndef CBT_RESOURCE_TRACKER_HPP_
#define CBT_RESOURCE_TRACKER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <type_traits>
#include <unordered_map>

#include <mutex>
#include <atomic>

#include <jau/darray.hpp>
#include <jau/debug.hpp>

#include "BTTransport.hpp"

namespace central_bt {

    /** \addtogroup CBTUserClientAPI
     *
     *  @{
     */

    /**
     * Tracks per device identifier the transport handles,
     * which must be released explicitly once the device disconnects.
     *
     * Only ::Releasable types are accepted, enforced at compile time.
     */
    class BTResourceTracker {
        public:
            typedef jau::nsize_t size_type;
            typedef jau::darray<ReleasableRef, size_type> releasable_list_t;

        private:

            std::unordered_map<std::string, releasable_list_t> tracked;
            mutable std::mutex mtx_tracked;

            bool trackImpl(const std::string& id, const ReleasableRef& obj) noexcept;

        public:
            BTResourceTracker() noexcept {}

            BTResourceTracker(const BTResourceTracker&) = delete;
            void operator=(const BTResourceTracker&) = delete;

            /**
             * Registers the given object for the given device identifier.
             *
             * Registering the same instance twice is a no-op, compared by identity.
             * Passing nullptr is a programming error and aborts.
             *
             * @return true if newly tracked, otherwise false
             */
            template<typename T>
            bool track(const std::string& id, const std::shared_ptr<T>& obj) noexcept {
                static_assert(std::is_base_of<Releasable, T>::value, "Only Releasable objects can be tracked");
                if( nullptr == obj ) {
                    ABORT("BTResourceTracker::track: null object for %s", id.c_str());
                }
                return trackImpl(id, std::static_pointer_cast<Releasable>(obj));
            }

            /**
             * Releases all objects tracked for the given device identifier
             * in the order tracked and clears the set.
             *
             * A no-op if nothing is tracked.
             *
             * @return number of released objects
             */
            size_type releaseAll(const std::string& id) noexcept;

            /**
             * Removes and returns all objects tracked for the given device identifier
             * without releasing them.
             *
             * Allows the caller to detach the set atomically with its own state change,
             * releasing it later via release().
             */
            releasable_list_t take(const std::string& id) noexcept;

            /** Releases the given objects in order, returns their number. */
            static size_type release(releasable_list_t& list) noexcept;

            /** Returns the number of objects tracked for the given device identifier. */
            size_type getTrackedCount(const std::string& id) const noexcept;
    };

    /**
     * Liveness reference counter keeping the platform session alive,
     * held while scanning and while any subscription is active.
     */
    class KeepAlive {
        private:
            std::atomic<int32_t> count;

        public:
            KeepAlive() noexcept : count(0) {}

            void ref() noexcept;

            /** Decrements the counter, never below zero. */
            void unref() noexcept;

            int32_t getCount() const noexcept { return count.load(); }

            bool isAlive() const noexcept { return count.load() > 0; }
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_RESOURCE_TRACKER_HPP_ */
