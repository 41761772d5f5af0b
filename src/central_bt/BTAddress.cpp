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
#include <cstdint>
#include <cstdio>
#include <algorithm>

#include "BTAddress.hpp"

using namespace central_bt;

std::string central_bt::to_string(const BDAddressType type) noexcept {
    switch(type) {
        case BDAddressType::BDADDR_LE_PUBLIC: return "public";
        case BDAddressType::BDADDR_LE_RANDOM: return "random";
        default: ; // fall through intended
    }
    return "Unknown BDAddressType";
}

std::string central_bt::to_address_string(const uint64_t address) noexcept {
    const uint64_t a = address & BDADDR_MASK;
    // 6 * 2 hex digits + 5 colons + EOS
    char buffer[18];
    snprintf(buffer, sizeof(buffer), "%02x:%02x:%02x:%02x:%02x:%02x",
            static_cast<unsigned int>( ( a >> 40 ) & 0xff ), static_cast<unsigned int>( ( a >> 32 ) & 0xff ),
            static_cast<unsigned int>( ( a >> 24 ) & 0xff ), static_cast<unsigned int>( ( a >> 16 ) & 0xff ),
            static_cast<unsigned int>( ( a >>  8 ) & 0xff ), static_cast<unsigned int>(   a         & 0xff ));
    return std::string(buffer);
}

std::string central_bt::to_device_id(const uint64_t address) noexcept {
    std::string s = to_address_string(address);
    s.erase(std::remove(s.begin(), s.end(), ':'), s.end());
    return s;
}
