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

#ifndef CBT_RADIO_MONITOR_HPP_
#define CBT_RADIO_MONITOR_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <mutex>

#include <jau/functional.hpp>

#include "BTTypes0.hpp"
#include "BTTransport.hpp"

namespace central_bt {

    /** \addtogroup CBTUserClientAPI
     *
     *  @{
     */

    typedef jau::function<void(const RadioState)> RadioStateChangedCallback;

    /**
     * Tracks the local Bluetooth radio's power state.
     *
     * The state change callback fires exactly once per actual change,
     * repeated signals of the same resolved state are dropped.
     */
    class BTRadioMonitor {
        private:
            RadioStateChangedCallback stateChangedCallback;
            RadioState state;
            TransportRadioRef radio;
            mutable std::mutex mtx_state;

        public:
            explicit BTRadioMonitor(RadioStateChangedCallback cb) noexcept
            : stateChangedCallback(cb), state(RadioState::UNKNOWN), radio(nullptr) {}

            BTRadioMonitor(const BTRadioMonitor&) = delete;
            void operator=(const BTRadioMonitor&) = delete;

            /** Maps the platform radio state, off and disabled both to ::RadioState::POWERED_OFF. */
            static RadioState to_RadioState(const TransportRadioState s) noexcept;

            /**
             * Starts the asynchronous radio enumeration, selecting the first Bluetooth radio
             * and subscribing to its state changes.
             *
             * No Bluetooth radio or a failed enumeration results in ::RadioState::UNSUPPORTED.
             */
            void init(BTTransport& transport);

            /**
             * Applies the given resolved state.
             * @return true if the state changed and the callback has been invoked
             */
            bool update(const RadioState newState);

            RadioState getState() const noexcept;

            /** Returns the selected radio or nullptr. */
            TransportRadioRef getRadio() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_RADIO_MONITOR_HPP_ */
