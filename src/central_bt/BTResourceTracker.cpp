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

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/debug.hpp>
#include <jau/basic_algos.hpp>

#include "BTResourceTracker.hpp"

using namespace central_bt;

bool BTResourceTracker::trackImpl(const std::string& id, const ReleasableRef& obj) noexcept {
    const std::lock_guard<std::mutex> lock(mtx_tracked); // RAII-style acquire and relinquish via destructor
    releasable_list_t& list = tracked[id];
    const Releasable* p = obj.get();
    auto it = jau::find_if(list.cbegin(), list.cend(), [p](const ReleasableRef &o) -> bool {
        return o.get() == p;
    });
    if( list.cend() != it ) {
        return false;
    }
    list.push_back(obj);
    return true;
}

BTResourceTracker::releasable_list_t BTResourceTracker::take(const std::string& id) noexcept {
    releasable_list_t list;
    const std::lock_guard<std::mutex> lock(mtx_tracked); // RAII-style acquire and relinquish via destructor
    auto it = tracked.find(id);
    if( tracked.end() != it ) {
        list = std::move(it->second);
        tracked.erase(it);
    }
    return list;
}

BTResourceTracker::size_type BTResourceTracker::release(releasable_list_t& list) noexcept {
    jau::for_each(list.begin(), list.end(), [](ReleasableRef &o) {
        o->release();
    });
    return list.size();
}

BTResourceTracker::size_type BTResourceTracker::releaseAll(const std::string& id) noexcept {
    releasable_list_t list = take(id);
    const size_type count = release(list);
    DBG_PRINT("BTResourceTracker::releaseAll: %s: released %zu", id.c_str(), (size_t)count);
    return count;
}

BTResourceTracker::size_type BTResourceTracker::getTrackedCount(const std::string& id) const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_tracked); // RAII-style acquire and relinquish via destructor
    auto it = tracked.find(id);
    return tracked.end() != it ? it->second.size() : 0;
}

void KeepAlive::ref() noexcept {
    const int32_t c = ++count;
    DBG_PRINT("KeepAlive::ref: %d", c);
}

void KeepAlive::unref() noexcept {
    int32_t c = count.load();
    while( c > 0 && !count.compare_exchange_weak(c, c-1) ) { }
    if( c <= 0 ) {
        WARN_PRINT("KeepAlive::unref: already zero");
    } else {
        DBG_PRINT("KeepAlive::unref: %d", c-1);
    }
}
