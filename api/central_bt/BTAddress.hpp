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

#ifndef CBT_ADDRESS_HPP_
#define CBT_ADDRESS_HPP_

#include <cstring>
#include <string>
#include <cstdint>

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * BT Core Spec v5.2:  Vol 3, Part C Generic Access Profile (GAP): 15.1.1.1 Public Bluetooth address
     * - BT public address used as BD_ADDR for the LE physical channel is defined in Vol 6, Part B 1.3
     *
     * BT Core Spec v5.2:  Vol 3, Part C Generic Access Profile (GAP): 15.1.1.2 Random Bluetooth address
     * - BT random address used as BD_ADDR on the LE physical channel is defined in Vol 3, Part C 10.8
     *
     * Only LE addresses are reported by the advertisement watcher.
     */
    enum class BDAddressType : uint8_t {
        /** Bluetooth LE public address */
        BDADDR_LE_PUBLIC  = 0x01,
        /** Bluetooth LE random address, see to_BDAddressType() */
        BDADDR_LE_RANDOM  = 0x02
    };
    constexpr uint8_t number(const BDAddressType rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Returns `public`, `random` or the enum name otherwise. */
    std::string to_string(const BDAddressType type) noexcept;

    /** Bit mask of the two most significant bits of a 48-bit address, denoting a random (static) address. */
    constexpr uint64_t BDADDR_RANDOM_MASK = 0x0000C00000000000ULL;

    /** Bit mask of a 48-bit address. */
    constexpr uint64_t BDADDR_MASK = 0x0000FFFFFFFFFFFFULL;

    /**
     * Returns the LE address type of the given 48-bit address.
     *
     * An address is ::BDAddressType::BDADDR_LE_RANDOM if both of its two most significant bits are set,
     * i.e. `address >= 3 * 2^46`, otherwise ::BDAddressType::BDADDR_LE_PUBLIC.
     */
    constexpr BDAddressType to_BDAddressType(const uint64_t address) noexcept {
        return BDADDR_RANDOM_MASK == ( address & BDADDR_RANDOM_MASK ) ? BDAddressType::BDADDR_LE_RANDOM : BDAddressType::BDADDR_LE_PUBLIC;
    }

    /**
     * Returns the given 48-bit address as six lowercase hex byte pairs joined by colons,
     * most significant byte first, e.g. `00:11:22:33:44:aa`.
     */
    std::string to_address_string(const uint64_t address) noexcept;

    /**
     * Returns the device identifier of the given 48-bit address,
     * i.e. twelve lowercase hex digits without separators, e.g. `0011223344aa`.
     *
     * The identifier is stable for the process lifetime.
     */
    std::string to_device_id(const uint64_t address) noexcept;

    /**@}*/

} // namespace central_bt

#endif /* CBT_ADDRESS_HPP_ */
