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

#ifndef CBT_UUID_HPP_
#define CBT_UUID_HPP_

#include <string>
#include <cstdint>

#include <jau/darray.hpp>

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * Returns the canonical textual form of the given GATT UUID.
     *
     * A 128-bit UUID matching the Bluetooth base UUID `0000XXXX-0000-1000-8000-00805F9B34FB`,
     * case insensitive and with optional enclosing braces, is shortened to its lowercase
     * 4 hex digit assigned number, e.g. `180d`.
     * All other UUIDs are returned lowercase with hyphens and braces stripped,
     * e.g. `6e400001b5a3f393e0a9e50e24dcca9e`.
     *
     * The operation is idempotent.
     */
    std::string formatUuid(const std::string& uuid) noexcept;

    /** Returns a new list holding formatUuid() of each element. */
    jau::darray<std::string> formatUuids(const jau::darray<std::string>& uuids) noexcept;

    /**
     * Returns true if the given formatted UUID passes the UUID allow-list.
     *
     * An empty filter lets all UUIDs pass. Filter elements are normalized via formatUuid().
     */
    bool matchesUuidFilter(const jau::darray<std::string>& filter, const std::string& formattedUuid) noexcept;

    /**@}*/

} // namespace central_bt

#endif /* CBT_UUID_HPP_ */
