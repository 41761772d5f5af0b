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

#ifndef CBT_DEVICE_HPP_
#define CBT_DEVICE_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>
#include <unordered_map>

#include "BTTypes0.hpp"
#include "BTAddress.hpp"
#include "BTAdvertisement.hpp"
#include "BTTransport.hpp"

namespace central_bt {

    class BTDeviceRegistry; // forward
    class BTAdvertisementAggregator; // forward
    class BTGattResolver; // forward

    /** \addtogroup CBTUserClientAPI
     *
     *  @{
     */

    /**
     * Record of one discovered or connected remote device, keyed by its identifier.
     *
     * The record is created on first advertisement and persists for the process lifetime.
     * Its mutable state is guarded by the owning BTDeviceRegistry's lock
     * and is only accessed by the registry and its companion components.
     *
     * The three GATT caches are non-empty only while a connection handle is present.
     */
    class BTDevice {
        friend class BTDeviceRegistry;
        friend class BTAdvertisementAggregator;
        friend class BTGattResolver;

        public:
            /** Raw 48-bit address */
            const uint64_t address;
            /** Colon separated lowercase address, see to_address_string() */
            const std::string addressString;
            /** Device identifier, see to_device_id() */
            const std::string id;
            const BDAddressType addressType;

        private:
            ConnectableState connectable;
            AdvertisementData advertisement;
            TransportDeviceRef connection;

            std::unordered_map<std::string, TransportGattServiceRef> serviceCache;
            std::unordered_map<std::string, TransportGattCharRef> charCache;
            std::unordered_map<std::string, TransportGattDescRef> descCache;

            /** Detaches the connection handle and clears all caches. Caller holds the registry lock. */
            void clearConnection() noexcept;

        public:
            explicit BTDevice(const uint64_t address_) noexcept;

            BTDevice(const BTDevice&) = delete;
            void operator=(const BTDevice&) = delete;

            static std::string charKey(const std::string& serviceUuid, const std::string& charUuid) noexcept {
                return serviceUuid+"/"+charUuid;
            }
            static std::string descKey(const std::string& serviceUuid, const std::string& charUuid, const std::string& descUuid) noexcept {
                return serviceUuid+"/"+charUuid+"/"+descUuid;
            }

            bool operator==(const BTDevice& rhs) const noexcept { return address == rhs.address; }
            bool operator!=(const BTDevice& rhs) const noexcept { return !(*this == rhs); }

            /** Caller holds the registry lock. */
            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<BTDevice> BTDeviceRef;

    /**@}*/

} // namespace central_bt

#endif /* CBT_DEVICE_HPP_ */
