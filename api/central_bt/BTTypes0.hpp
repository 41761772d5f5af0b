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

#ifndef CBT_TYPES0_HPP_
#define CBT_TYPES0_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/basic_types.hpp>
#include <jau/darray.hpp>
#include <jau/octets.hpp>

namespace central_bt {

    /** \addtogroup CBTUserAPI
     *
     *  @{
     */

    /**
     * Classification of all failures reported by this library,
     * either thrown synchronously or delivered via a listener event.
     */
    enum class ErrorKind : uint8_t {
        /** Unknown device, service, characteristic or descriptor id. */
        NOT_FOUND           = 0,
        /** Operation requires a connection state which doesn't hold, or the device is not connectable. */
        INVALID_STATE       = 1,
        /** Wraps an underlying transport failure, including unreachable and protocol error status codes. */
        TRANSPORT_FAILURE   = 2,
        /** Operation has no defined behavior, e.g. broadcast or handle based read and write. */
        UNSUPPORTED         = 3
    };
    constexpr uint8_t number(const ErrorKind rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ErrorKind v) noexcept;

    class BTException : public jau::RuntimeException {
        private:
            ErrorKind kind;

        protected:
            BTException(std::string const type, const ErrorKind kind_, std::string const m, const char* file, int line) noexcept
            : RuntimeException(type, m, file, line), kind(kind_) {}

        public:
            ErrorKind getKind() const noexcept { return kind; }
    };
    typedef std::shared_ptr<BTException> BTExceptionRef;

    class NotFoundException : public BTException {
        public:
            NotFoundException(std::string const m, const char* file, int line) noexcept
            : BTException("NotFoundException", ErrorKind::NOT_FOUND, m, file, line) {}
    };

    class InvalidStateException : public BTException {
        public:
            InvalidStateException(std::string const m, const char* file, int line) noexcept
            : BTException("InvalidStateException", ErrorKind::INVALID_STATE, m, file, line) {}
    };

    class TransportException : public BTException {
        public:
            TransportException(std::string const m, const char* file, int line) noexcept
            : BTException("TransportException", ErrorKind::TRANSPORT_FAILURE, m, file, line) {}
    };

    class UnsupportedException : public BTException {
        public:
            UnsupportedException(std::string const m, const char* file, int line) noexcept
            : BTException("UnsupportedException", ErrorKind::UNSUPPORTED, m, file, line) {}
    };

    /**
     * Local Bluetooth radio state as reported to the application.
     *
     * The platform's explicit off and disabled states both map to ::RadioState::POWERED_OFF.
     */
    enum class RadioState : uint8_t {
        /** No Bluetooth radio present. */
        UNSUPPORTED = 0,
        /** Initial state before the first radio resolution. */
        UNKNOWN     = 1,
        POWERED_ON  = 2,
        POWERED_OFF = 3
    };
    constexpr uint8_t number(const RadioState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    /** Returns `unsupported`, `unknown`, `poweredOn` or `poweredOff`. */
    std::string to_string(const RadioState v) noexcept;

    /**
     * LE Advertising PDU type as reported by the advertisement watcher.
     * <pre>
     * BT Core Spec v5.2: Vol 6 LE Controller, Part B Link Layer: 2.3 Advertising physical channel PDU
     * </pre>
     */
    enum class AD_PDU_Type : uint8_t {
        /** Connectable undirected advertising. */
        ADV_IND         = 0x00,
        /** Connectable directed advertising. */
        ADV_DIRECT_IND  = 0x01,
        /** Scannable undirected advertising. */
        ADV_SCAN_IND    = 0x02,
        /** Non connectable undirected advertising. */
        ADV_NONCONN_IND = 0x03,
        /** Scan response to an active scan request. */
        SCAN_RSP        = 0x04,
        UNDEFINED       = 0xff
    };
    constexpr uint8_t number(const AD_PDU_Type rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const AD_PDU_Type v) noexcept;

    /** Tri-state connectable flag of a remote device, derived from its first advertising PDU. */
    enum class ConnectableState : uint8_t {
        UNKNOWN = 0,
        NO      = 1,
        YES     = 2
    };
    constexpr uint8_t number(const ConnectableState rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }
    std::string to_string(const ConnectableState v) noexcept;

    /**
     * Classifies the given advertising PDU type.
     *
     * Connectable undirected and directed PDUs are connectable,
     * non-connectable undirected and scannable undirected PDUs are not,
     * anything else is unknown.
     */
    ConnectableState to_ConnectableState(const AD_PDU_Type type) noexcept;

    /**
     * Subset of the Generic Access Profile data types
     * found in advertising and scan response payloads.
     * <pre>
     * Assigned Numbers - Generic Access Profile
     * </pre>
     */
    enum class GAP_T : uint8_t {
        FLAGS                   = 0x01,
        UUID16_INCOMPLETE       = 0x02,
        UUID16_COMPLETE         = 0x03,
        UUID128_INCOMPLETE      = 0x06,
        UUID128_COMPLETE        = 0x07,
        NAME_LOCAL_SHORT        = 0x08,
        NAME_LOCAL_COMPLETE     = 0x09,
        TX_POWER_LEVEL          = 0x0A,
        SVC_DATA_UUID16         = 0x16,
        MANUFACTURE_SPECIFIC    = 0xFF
    };
    constexpr uint8_t number(const GAP_T rhs) noexcept {
        return static_cast<uint8_t>(rhs);
    }

    /**
     * Bit mask of advertisement data fields present in an ::AdvertisementData instance.
     */
    enum class EIRDataType : uint32_t {
        NONE         = 0,
        NAME         = (1 << 0),
        TX_POWER     = (1 << 1),
        MANUF_DATA   = (1 << 2),
        SERVICE_UUID = (1 << 3),
        RSSI         = (1 << 4),
        ALL          = 0xffffffff
    };
    constexpr uint32_t number(const EIRDataType rhs) noexcept {
        return static_cast<uint32_t>(rhs);
    }
    constexpr EIRDataType operator ^(const EIRDataType lhs, const EIRDataType rhs) noexcept {
        return static_cast<EIRDataType> ( number(lhs) ^ number(rhs) );
    }
    constexpr EIRDataType operator |(const EIRDataType lhs, const EIRDataType rhs) noexcept {
        return static_cast<EIRDataType> ( number(lhs) | number(rhs) );
    }
    constexpr EIRDataType operator &(const EIRDataType lhs, const EIRDataType rhs) noexcept {
        return static_cast<EIRDataType> ( number(lhs) & number(rhs) );
    }
    constexpr bool operator ==(const EIRDataType lhs, const EIRDataType rhs) noexcept {
        return number(lhs) == number(rhs);
    }
    constexpr bool operator !=(const EIRDataType lhs, const EIRDataType rhs) noexcept {
        return !( lhs == rhs );
    }
    constexpr bool isEIRDataTypeSet(const EIRDataType mask, const EIRDataType bit) noexcept { return bit == ( mask & bit ); }
    constexpr void setEIRDataTypeSet(EIRDataType &mask, const EIRDataType bit) noexcept { mask = mask | bit; }
    std::string to_string(const EIRDataType mask) noexcept;

    /**@}*/

} // namespace central_bt

#endif /* CBT_TYPES0_HPP_ */
