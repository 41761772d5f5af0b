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

#include <string>
#include <cstdint>
#include <cctype>

#include <jau/basic_algos.hpp>

#include "BTUUID.hpp"

using namespace central_bt;

static const std::string base_uuid_prefix = "0000";
static const std::string base_uuid_suffix = "-0000-1000-8000-00805f9b34fb";

static bool isHexString(const std::string& s, const size_t pos, const size_t len) noexcept {
    for(size_t i=pos; i<pos+len; ++i) {
        if( !std::isxdigit( static_cast<unsigned char>(s[i]) ) ) {
            return false;
        }
    }
    return true;
}

std::string central_bt::formatUuid(const std::string& uuid) noexcept {
    std::string lower;
    lower.reserve(uuid.size());
    for(const char c : uuid) {
        lower.push_back( static_cast<char>( std::tolower( static_cast<unsigned char>(c) ) ) );
    }
    // Optional enclosing braces, both or none
    std::string bare = lower;
    if( bare.size() >= 2 && '{' == bare.front() && '}' == bare.back() ) {
        bare = bare.substr(1, bare.size()-2);
    }
    if( 36 == bare.size() &&
        0 == bare.compare(0, base_uuid_prefix.size(), base_uuid_prefix) &&
        0 == bare.compare(8, base_uuid_suffix.size(), base_uuid_suffix) &&
        isHexString(bare, 4, 4) )
    {
        return bare.substr(4, 4);
    }
    std::string res;
    res.reserve(lower.size());
    for(const char c : lower) {
        if( '-' != c && '{' != c && '}' != c ) {
            res.push_back(c);
        }
    }
    return res;
}

jau::darray<std::string> central_bt::formatUuids(const jau::darray<std::string>& uuids) noexcept {
    jau::darray<std::string> res;
    jau::for_each(uuids.cbegin(), uuids.cend(), [&res](const std::string &u) {
        res.push_back( formatUuid(u) );
    });
    return res;
}

bool central_bt::matchesUuidFilter(const jau::darray<std::string>& filter, const std::string& formattedUuid) noexcept {
    if( filter.empty() ) {
        return true;
    }
    return filter.cend() != jau::find_if(filter.cbegin(), filter.cend(), [&formattedUuid](const std::string &f) -> bool {
        return formatUuid(f) == formattedUuid;
    });
}
