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

#include "BTDevice.hpp"

using namespace central_bt;

BTDevice::BTDevice(const uint64_t address_) noexcept
: address(address_ & BDADDR_MASK), addressString(to_address_string(address)), id(to_device_id(address)),
  addressType(to_BDAddressType(address)),
  connectable(ConnectableState::UNKNOWN), advertisement(), connection(nullptr)
{
    DBG_PRINT("BTDevice::ctor: %s", toString().c_str());
}

void BTDevice::clearConnection() noexcept {
    connection = nullptr;
    serviceCache.clear();
    charCache.clear();
    descCache.clear();
}

std::string BTDevice::toString() const noexcept {
    return "Device["+id+", "+addressString+", "+central_bt::to_string(addressType)+
           ", connectable "+central_bt::to_string(connectable)+
           ", connected "+std::to_string(nullptr != connection)+
           ", cache[svc "+std::to_string(serviceCache.size())+", char "+std::to_string(charCache.size())+
           ", desc "+std::to_string(descCache.size())+"], name '"+advertisement.getName()+"']";
}
