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

#include "BTTransport.hpp"

using namespace central_bt;

#define CASE2_TO_STRING(U,V) case U::V: return #V;

#define CHAR_DECL_CACHEMODE_ENUM(X) \
        X(CacheMode,CACHED) \
        X(CacheMode,UNCACHED)

std::string central_bt::to_string(const CacheMode v) noexcept {
    switch(v) {
        CHAR_DECL_CACHEMODE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown CacheMode";
}

#define CHAR_DECL_GATTCOMMSTATUS_ENUM(X) \
        X(GattCommStatus,SUCCESS) \
        X(GattCommStatus,UNREACHABLE) \
        X(GattCommStatus,PROTOCOL_ERROR) \
        X(GattCommStatus,ACCESS_DENIED) \
        X(GattCommStatus,TRANSPORT_ERROR)

std::string central_bt::to_string(const GattCommStatus v) noexcept {
    switch(v) {
        CHAR_DECL_GATTCOMMSTATUS_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown GattCommStatus";
}

#define CHAR_DECL_CCCVALUE_ENUM(X) \
        X(ClientCharConfigValue,NONE) \
        X(ClientCharConfigValue,NOTIFY) \
        X(ClientCharConfigValue,INDICATE)

std::string central_bt::to_string(const ClientCharConfigValue v) noexcept {
    switch(v) {
        CHAR_DECL_CCCVALUE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown ClientCharConfigValue";
}

#define CHAR_DECL_RADIOSTATE_ENUM(X) \
        X(TransportRadioState,UNKNOWN) \
        X(TransportRadioState,ON) \
        X(TransportRadioState,OFF) \
        X(TransportRadioState,DISABLED)

std::string central_bt::to_string(const TransportRadioState v) noexcept {
    switch(v) {
        CHAR_DECL_RADIOSTATE_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown TransportRadioState";
}

#define CHAR_DECL_WATCHERSTATUS_ENUM(X) \
        X(WatcherStatus,CREATED) \
        X(WatcherStatus,STARTED) \
        X(WatcherStatus,STOPPING) \
        X(WatcherStatus,STOPPED) \
        X(WatcherStatus,ABORTED)

std::string central_bt::to_string(const WatcherStatus v) noexcept {
    switch(v) {
        CHAR_DECL_WATCHERSTATUS_ENUM(CASE2_TO_STRING)
        default: ; // fall through intended
    }
    return "Unknown WatcherStatus";
}

BTExceptionRef central_bt::checkCommunicationResult(const TransportResult& res, const std::string& deviceId) noexcept {
    switch( res.status ) {
        case GattCommStatus::SUCCESS:
            return nullptr;
        case GattCommStatus::UNREACHABLE:
            return std::make_shared<TransportException>("Device unreachable: "+deviceId, E_FILE_LINE);
        case GattCommStatus::PROTOCOL_ERROR:
            return std::make_shared<TransportException>("Protocol error communicating with device: "+deviceId, E_FILE_LINE);
        case GattCommStatus::ACCESS_DENIED:
            return std::make_shared<TransportException>("Access denied communicating with device: "+deviceId, E_FILE_LINE);
        default:
            return std::make_shared<TransportException>("Transport error communicating with device: "+deviceId+": "+res.error, E_FILE_LINE);
    }
}
