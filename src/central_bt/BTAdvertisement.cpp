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

#include "BTAdvertisement.hpp"
#include "BTUUID.hpp"

using namespace central_bt;

std::string AdvertisementEvent::toString() const noexcept {
    return "AdvEvent["+to_address_string(address)+", "+central_bt::to_string(type)+
           ", rssi "+std::to_string(rssi)+", name '"+localName+"', msd "+std::to_string(manufacturerData.size())+
           ", services "+std::to_string(serviceUuids.size())+", sections "+std::to_string(dataSections.size())+"]";
}

void AdvertisementData::setName(const std::string& name_) noexcept {
    name = name_;
    set(EIRDataType::NAME);
}

void AdvertisementData::setManufacturerData(const ManufacturerDataSection& section) noexcept {
    const jau::nsize_t size = 2 + section.data.size();
    msd = std::make_shared<jau::POctets>(size, size, jau::endian::little);
    msd->put_uint16_nc(0, section.company);
    if( section.data.size() > 0 ) {
        msd->put_bytes_nc(2, section.data.data(), section.data.size());
    }
    set(EIRDataType::MANUF_DATA);
}

bool AdvertisementData::addService(const std::string& uuid) noexcept {
    const std::string f = formatUuid(uuid);
    auto begin = services.cbegin();
    auto it = jau::find_if(begin, services.cend(), [&](const std::string &s) -> bool {
       return s == f;
    });
    if( services.cend() == it ) {
        services.push_back(f);
        set(EIRDataType::SERVICE_UUID);
        return true;
    }
    return false;
}

std::string AdvertisementData::toString() const noexcept {
    std::string msdstr = nullptr != msd ? msd->toString() : "MSD[null]";
    std::string out("AdvData[set "+central_bt::to_string(eir_data_mask)+
                    ", name '"+name+"', tx-power "+std::to_string(tx_power)+
                    ", rssi "+std::to_string(rssi)+", "+msdstr+", services [");
    bool comma = false;
    jau::for_each(services.cbegin(), services.cend(), [&](const std::string &s) {
        if( comma ) { out.append(", "); }
        out.append(s); comma = true;
    });
    out.append("]]");
    return out;
}

bool central_bt::findTxPowerLevel(const jau::darray<AdvertisementDataSection>& sections, int8_t& res) noexcept {
    auto it = jau::find_if(sections.cbegin(), sections.cend(), [](const AdvertisementDataSection &s) -> bool {
        return number(GAP_T::TX_POWER_LEVEL) == s.type && s.data.size() > 0;
    });
    if( sections.cend() == it ) {
        return false;
    }
    const int v = it->data[0];
    res = static_cast<int8_t>( v >= 128 ? v - 256 : v );
    return true;
}

std::string DiscoveryReport::toString() const noexcept {
    return "Discovery["+id+", "+address+", "+central_bt::to_string(addressType)+
           ", connectable "+central_bt::to_string(connectable)+", rssi "+std::to_string(rssi)+
           ", "+advertisement.toString()+"]";
}
