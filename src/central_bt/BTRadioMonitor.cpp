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

#include "BTRadioMonitor.hpp"

using namespace central_bt;

RadioState BTRadioMonitor::to_RadioState(const TransportRadioState s) noexcept {
    switch(s) {
        case TransportRadioState::ON:
            return RadioState::POWERED_ON;
        case TransportRadioState::OFF:
            [[fallthrough]];
        case TransportRadioState::DISABLED:
            return RadioState::POWERED_OFF;
        default:
            return RadioState::UNKNOWN;
    }
}

void BTRadioMonitor::init(BTTransport& transport) {
    transport.getRadios([this](const TransportResult& res, const jau::darray<TransportRadioRef>& radios) {
        if( !res.isSuccess() ) {
            ERR_PRINT("BTRadioMonitor::init: radio enumeration failed: %s, %s",
                    to_string(res.status).c_str(), res.error.c_str());
            update(RadioState::UNSUPPORTED);
            return;
        }
        auto it = jau::find_if(radios.cbegin(), radios.cend(), [](const TransportRadioRef &r) -> bool {
            return nullptr != r && TransportRadioKind::BLUETOOTH == r->getKind();
        });
        if( radios.cend() == it ) {
            WORDY_PRINT("BTRadioMonitor::init: no Bluetooth radio among %zu", (size_t)radios.size());
            update(RadioState::UNSUPPORTED);
            return;
        }
        TransportRadioRef r = *it;
        {
            const std::lock_guard<std::mutex> lock(mtx_state); // RAII-style acquire and relinquish via destructor
            radio = r;
        }
        DBG_PRINT("BTRadioMonitor::init: using radio '%s', state %s", r->getName().c_str(), to_string(r->getState()).c_str());
        r->setStateChangedCallback([this](const TransportRadioState s) {
            update( to_RadioState(s) );
        });
        update( to_RadioState( r->getState() ) );
    });
}

bool BTRadioMonitor::update(const RadioState newState) {
    RadioState oldState;
    {
        const std::lock_guard<std::mutex> lock(mtx_state); // RAII-style acquire and relinquish via destructor
        oldState = state;
        if( oldState == newState ) {
            return false;
        }
        state = newState;
    }
    DBG_PRINT("BTRadioMonitor::update: %s -> %s", to_string(oldState).c_str(), to_string(newState).c_str());
    stateChangedCallback(newState);
    return true;
}

RadioState BTRadioMonitor::getState() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_state); // RAII-style acquire and relinquish via destructor
    return state;
}

TransportRadioRef BTRadioMonitor::getRadio() const noexcept {
    const std::lock_guard<std::mutex> lock(mtx_state); // RAII-style acquire and relinquish via destructor
    return radio;
}
