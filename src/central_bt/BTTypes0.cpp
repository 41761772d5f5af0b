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
#include <cstdio>

#include <jau/debug.hpp>

#include "BTTypes0.hpp"

using namespace central_bt;

template<typename T>
static void append_bitstr(std::string& out, T mask, T bit, const std::string& bitstr, bool& comma) {
    if( bit == ( mask & bit ) ) {
        if( comma ) { out.append(", "); }
        out.append(bitstr); comma = true;
    }
}
#define APPEND_BITSTR(U,V,M) append_bitstr(out, M, U::V, #V, comma);

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define CHAR_DECL_ERRORKIND_ENUM(X) \
        X(ErrorKind,NOT_FOUND) \
        X(ErrorKind,INVALID_STATE) \
        X(ErrorKind,TRANSPORT_FAILURE) \
        X(ErrorKind,UNSUPPORTED)

std::string central_bt::to_string(const ErrorKind v) noexcept {
    switch(v) {
        CHAR_DECL_ERRORKIND_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ErrorKind";
}

std::string central_bt::to_string(const RadioState v) noexcept {
    switch(v) {
        case RadioState::UNSUPPORTED: return "unsupported";
        case RadioState::UNKNOWN: return "unknown";
        case RadioState::POWERED_ON: return "poweredOn";
        case RadioState::POWERED_OFF: return "poweredOff";
        default: ; // fall through intended
    }
    return "unknown";
}

#define CHAR_DECL_AD_PDU_TYPE_ENUM(X) \
        X(AD_PDU_Type,ADV_IND) \
        X(AD_PDU_Type,ADV_DIRECT_IND) \
        X(AD_PDU_Type,ADV_SCAN_IND) \
        X(AD_PDU_Type,ADV_NONCONN_IND) \
        X(AD_PDU_Type,SCAN_RSP) \
        X(AD_PDU_Type,UNDEFINED)

std::string central_bt::to_string(const AD_PDU_Type v) noexcept {
    switch(v) {
        CHAR_DECL_AD_PDU_TYPE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown AD_PDU_Type";
}

#define CHAR_DECL_CONNECTABLE_ENUM(X) \
        X(ConnectableState,UNKNOWN) \
        X(ConnectableState,NO) \
        X(ConnectableState,YES)

std::string central_bt::to_string(const ConnectableState v) noexcept {
    switch(v) {
        CHAR_DECL_CONNECTABLE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ConnectableState";
}

ConnectableState central_bt::to_ConnectableState(const AD_PDU_Type type) noexcept {
    switch(type) {
        case AD_PDU_Type::ADV_IND:
            [[fallthrough]];
        case AD_PDU_Type::ADV_DIRECT_IND:
            return ConnectableState::YES;
        case AD_PDU_Type::ADV_NONCONN_IND:
            [[fallthrough]];
        case AD_PDU_Type::ADV_SCAN_IND:
            return ConnectableState::NO;
        default:
            return ConnectableState::UNKNOWN;
    }
}

std::string central_bt::to_string(const EIRDataType mask) noexcept {
    std::string out("[");
    bool comma = false;
    APPEND_BITSTR(EIRDataType, NAME, mask);
    APPEND_BITSTR(EIRDataType, TX_POWER, mask);
    APPEND_BITSTR(EIRDataType, MANUF_DATA, mask);
    APPEND_BITSTR(EIRDataType, SERVICE_UUID, mask);
    APPEND_BITSTR(EIRDataType, RSSI, mask);
    out.append("]");
    return out;
}
