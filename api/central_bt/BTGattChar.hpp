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

#ifndef CBT_GATT_CHARACTERISTIC_HPP_
#define CBT_GATT_CHARACTERISTIC_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>

/**
 * - - - - - - - - - - - - - - -
 *
 * Module GATTCharacteristic:
 *
 * - BT Core Spec v5.2: Vol 3, Part G Generic Attribute Protocol (GATT)
 * - BT Core Spec v5.2: Vol 3, Part G GATT: 2.6 GATT Profile Hierarchy
 * - BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.1.1 Characteristic Properties
 */
namespace central_bt {

    /** \addtogroup CBTUserClientAPI
     *
     *  @{
     */

    /**
     * Discovered characteristic as reported to the application.
     */
    class BTGattChar {
        public:
            /**
             * Characteristic Properties
             * <p>
             * BT Core Spec v5.2: Vol 3, Part G GATT: 3.3.1.1 Characteristic Properties
             * </p>
             */
            enum PropertyBitVal : uint8_t {
                NONE            = 0,
                Broadcast       = (1 << 0),
                Read            = (1 << 1),
                WriteNoAck      = (1 << 2),
                WriteWithAck    = (1 << 3),
                Notify          = (1 << 4),
                Indicate        = (1 << 5),
                AuthSignedWrite = (1 << 6),
                ExtProps        = (1 << 7)
            };

            /** Formatted UUID, see formatUuid() */
            const std::string uuid;

            const PropertyBitVal properties;

            BTGattChar(const std::string& uuid_, const uint8_t properties_) noexcept
            : uuid(uuid_), properties(static_cast<PropertyBitVal>(properties_)) {}

            bool hasProperties(const PropertyBitVal v) const noexcept { return v == ( properties & v ); }

            /**
             * Returns the capability names of all set property bits in ascending bit order,
             * each bit decoded independently:
             * `broadcast`, `read`, `writeWithoutResponse`, `write`, `notify`, `indicate`,
             * `authenticatedSignedWrites`, `extendedProperties`.
             */
            jau::darray<std::string> getPropertyNames() const noexcept { return getPropertyNames(properties); }

            static jau::darray<std::string> getPropertyNames(const PropertyBitVal mask) noexcept;

            static std::string getPropertiesString(const PropertyBitVal mask) noexcept;

            std::string toString() const noexcept;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_GATT_CHARACTERISTIC_HPP_ */
