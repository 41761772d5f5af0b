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

#ifndef CBT_ADVERTISEMENT_HPP_
#define CBT_ADVERTISEMENT_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/octets.hpp>

#include "BTTypes0.hpp"
#include "BTAddress.hpp"

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /** One raw data section of an advertising payload, see ::GAP_T. */
    struct AdvertisementDataSection {
        uint8_t type;
        jau::darray<uint8_t> data;
    };

    /** One manufacturer specific data section of an advertising payload. */
    struct ManufacturerDataSection {
        uint16_t company;
        jau::darray<uint8_t> data;
    };

    /**
     * A raw advertisement packet as delivered by the transport's advertisement watcher.
     */
    struct AdvertisementEvent {
        /** 48-bit Bluetooth address */
        uint64_t address = 0;
        AD_PDU_Type type = AD_PDU_Type::UNDEFINED;
        int8_t rssi = 0;
        /** Advertised local name, empty if not included in this packet. */
        std::string localName;
        jau::darray<ManufacturerDataSection> manufacturerData;
        /** Advertised service UUIDs in the platform's textual form. */
        jau::darray<std::string> serviceUuids;
        jau::darray<AdvertisementDataSection> dataSections;

        std::string toString() const noexcept;
    };

    /**
     * Accumulated advertisement data of one remote device,
     * merged from all received packets.
     *
     * Each field is only valid if its ::EIRDataType bit is set, see isSet().
     */
    class AdvertisementData {
        private:
            EIRDataType eir_data_mask;
            std::string name;
            int8_t tx_power;
            int8_t rssi;
            std::shared_ptr<jau::POctets> msd;
            jau::darray<std::string> services;

            void set(EIRDataType bit) noexcept { setEIRDataTypeSet(eir_data_mask, bit); }

        public:
            AdvertisementData() noexcept
            : eir_data_mask(EIRDataType::NONE), name(), tx_power(127), rssi(127), msd(nullptr), services() {}

            /** Last-write-wins. */
            void setName(const std::string& name_) noexcept;

            /** Overwrites a previously stored value. */
            void setTxPower(const int8_t v) noexcept { tx_power = v; set(EIRDataType::TX_POWER); }

            void setRSSI(const int8_t v) noexcept { rssi = v; set(EIRDataType::RSSI); }

            /**
             * Replaces the manufacturer data with the given section's data,
             * prefixed with the 2-byte little-endian company identifier.
             */
            void setManufacturerData(const ManufacturerDataSection& section) noexcept;

            /**
             * Appends the given UUID in its formatted form if not yet contained.
             * @return true if added, otherwise false
             */
            bool addService(const std::string& uuid) noexcept;

            EIRDataType getEIRDataMask() const noexcept { return eir_data_mask; }
            bool isSet(EIRDataType bit) const noexcept { return isEIRDataTypeSet(eir_data_mask, bit); }

            const std::string& getName() const noexcept { return name; }
            int8_t getTxPower() const noexcept { return tx_power; }
            int8_t getRSSI() const noexcept { return rssi; }
            /** Returns the company prefixed manufacturer data or nullptr if none has been received. */
            std::shared_ptr<jau::POctets> getManufacturerData() const noexcept { return msd; }
            /** Returns the formatted service UUIDs in first-seen order, without duplicates. */
            const jau::darray<std::string>& getServices() const noexcept { return services; }

            std::string toString() const noexcept;
    };
    typedef std::shared_ptr<AdvertisementData> AdvertisementDataRef;

    /**
     * Returns the signed TX power level of the first ::GAP_T::TX_POWER_LEVEL data section,
     * or false if none is present.
     *
     * Platform values >= 128 are reinterpreted as two's complement negative values.
     */
    bool findTxPowerLevel(const jau::darray<AdvertisementDataSection>& sections, int8_t& res) noexcept;

    /**
     * The discovery event payload, emitted on scan response packets only.
     */
    struct DiscoveryReport {
        std::string id;
        std::string address;
        BDAddressType addressType;
        ConnectableState connectable;
        int8_t rssi;
        /** Snapshot of the merged advertisement data at the time of emission. */
        AdvertisementData advertisement;
        /** Service data sections, not aggregated and always empty. */
        jau::darray<std::string> serviceData;

        std::string toString() const noexcept;
    };
    typedef std::shared_ptr<const DiscoveryReport> DiscoveryReportRef;

    /**@}*/

} // namespace central_bt

#endif /* CBT_ADVERTISEMENT_HPP_ */
