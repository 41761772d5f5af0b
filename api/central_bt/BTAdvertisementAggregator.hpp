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

#ifndef CBT_ADVERTISEMENT_AGGREGATOR_HPP_
#define CBT_ADVERTISEMENT_AGGREGATOR_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include "BTTypes0.hpp"
#include "BTAdvertisement.hpp"
#include "BTDeviceRegistry.hpp"
#include "BTTransport.hpp"

namespace central_bt {

    /** \addtogroup CBTUserClientAPI
     *
     *  @{
     */

    /**
     * Folds raw advertisement packets into the per device accumulated advertisement record.
     *
     * The discovery report is only produced for scan response packets,
     * carrying the fully merged advertisement.
     */
    class BTAdvertisementAggregator {
        private:
            BTDeviceRegistry& registry;

        public:
            explicit BTAdvertisementAggregator(BTDeviceRegistry& registry_) noexcept
            : registry(registry_) {}

            BTAdvertisementAggregator(const BTAdvertisementAggregator&) = delete;
            void operator=(const BTAdvertisementAggregator&) = delete;

            /**
             * Consumes one raw advertisement packet, creating or updating the device record.
             *
             * The connectable state is derived from the first packet of a new record only.
             * The TX power level is stored only if present in the packet.
             *
             * @return the discovery report if the packet is a scan response, otherwise nullptr
             */
            DiscoveryReportRef onAdvertisementReceived(const AdvertisementEvent& event) noexcept;

            /** Handles the watcher's stopped signal. */
            void onWatcherStopped(const WatcherStatus status) noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_ADVERTISEMENT_AGGREGATOR_HPP_ */
