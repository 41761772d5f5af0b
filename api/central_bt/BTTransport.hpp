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

#ifndef CBT_TRANSPORT_HPP_
#define CBT_TRANSPORT_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/octets.hpp>
#include <jau/functional.hpp>

#include "BTTypes0.hpp"
#include "BTAdvertisement.hpp"

/**
 * - - - - - - - - - - - - - - -
 *
 * Module Transport:
 *
 * Boundary to the platform's Bluetooth radio and GATT transport,
 * consumed by this library and implemented by a platform binding.
 *
 * All asynchronous operations complete exactly once via the passed callback,
 * which may be invoked on any thread, including the calling thread.
 */
namespace central_bt {

    /** \addtogroup CBTTransportAPI
     *
     *  @{
     */

    /**
     * Capability of every transport handle owning a native resource,
     * which must be released explicitly.
     */
    class Releasable {
        public:
            virtual ~Releasable() noexcept {}

            /** Releases the native resource. Must tolerate repeated calls. */
            virtual void release() noexcept = 0;
    };
    typedef std::shared_ptr<Releasable> ReleasableRef;

    /** GATT query mode, whether the platform may answer from its last known object graph. */
    enum class CacheMode : uint8_t {
        CACHED   = 0,
        UNCACHED = 1
    };
    std::string to_string(const CacheMode v) noexcept;

    /** GATT communication status of a completed transport operation. */
    enum class GattCommStatus : uint8_t {
        SUCCESS         = 0,
        UNREACHABLE     = 1,
        PROTOCOL_ERROR  = 2,
        ACCESS_DENIED   = 3,
        /** Any other platform failure, described by TransportResult::error. */
        TRANSPORT_ERROR = 4
    };
    std::string to_string(const GattCommStatus v) noexcept;

    /** Client Characteristic Configuration Descriptor value. */
    enum class ClientCharConfigValue : uint16_t {
        NONE     = 0x0000,
        NOTIFY   = 0x0001,
        INDICATE = 0x0002
    };
    std::string to_string(const ClientCharConfigValue v) noexcept;

    struct TransportResult {
        GattCommStatus status = GattCommStatus::SUCCESS;
        /** Platform error text, only meaningful for ::GattCommStatus::TRANSPORT_ERROR. */
        std::string error;

        bool isSuccess() const noexcept { return GattCommStatus::SUCCESS == status; }
    };

    /**
     * Returns nullptr if the given result is successful,
     * otherwise a TransportException describing the failure for the given device.
     *
     * - ::GattCommStatus::UNREACHABLE -> `Device unreachable: <id>`
     * - ::GattCommStatus::PROTOCOL_ERROR -> `Protocol error communicating with device: <id>`
     */
    BTExceptionRef checkCommunicationResult(const TransportResult& res, const std::string& deviceId) noexcept;

    class TransportGattDesc; // forward
    class TransportGattChar; // forward
    class TransportGattService; // forward
    class TransportDevice; // forward
    class TransportRadio; // forward
    typedef std::shared_ptr<TransportGattDesc> TransportGattDescRef;
    typedef std::shared_ptr<TransportGattChar> TransportGattCharRef;
    typedef std::shared_ptr<TransportGattService> TransportGattServiceRef;
    typedef std::shared_ptr<TransportDevice> TransportDeviceRef;
    typedef std::shared_ptr<TransportRadio> TransportRadioRef;

    typedef jau::function<void(const TransportResult&)> TransportStatusCallback;
    typedef jau::function<void(const TransportResult&, const jau::TROOctets&)> TransportValueCallback;
    typedef jau::function<void(const TransportResult&, const jau::darray<TransportGattServiceRef>&)> TransportServicesCallback;
    typedef jau::function<void(const TransportResult&, const jau::darray<TransportGattCharRef>&)> TransportCharsCallback;
    typedef jau::function<void(const TransportResult&, const jau::darray<TransportGattDescRef>&)> TransportDescsCallback;
    typedef jau::function<void(const jau::TROOctets&)> TransportValueChangedCallback;

    class TransportGattDesc : public Releasable {
        public:
            /** Platform textual UUID, see formatUuid() */
            virtual std::string getUuid() const noexcept = 0;

            virtual void readValue(const CacheMode mode, TransportValueCallback cb) = 0;

            virtual void writeValue(const jau::TROOctets& value, TransportStatusCallback cb) = 0;
    };

    class TransportGattChar : public Releasable {
        public:
            /** Platform textual UUID, see formatUuid() */
            virtual std::string getUuid() const noexcept = 0;

            /** Characteristic properties bit mask, see ::BTGattChar::PropertyBitVal */
            virtual uint8_t getProperties() const noexcept = 0;

            virtual void getDescriptors(const CacheMode mode, TransportDescsCallback cb) = 0;

            virtual void readValue(const CacheMode mode, TransportValueCallback cb) = 0;

            virtual void writeValue(const jau::TROOctets& value, const bool withResponse, TransportStatusCallback cb) = 0;

            virtual void writeClientCharConfig(const ClientCharConfigValue value, TransportStatusCallback cb) = 0;

            /** Registers the given value changed listener and returns its token. */
            virtual uint64_t addValueChangedListener(TransportValueChangedCallback cb) = 0;

            /** Removes the value changed listener of the given token, returns false if unknown. */
            virtual bool removeValueChangedListener(const uint64_t token) noexcept = 0;
    };

    class TransportGattService : public Releasable {
        public:
            /** Platform textual UUID, see formatUuid() */
            virtual std::string getUuid() const noexcept = 0;

            virtual void getCharacteristics(const CacheMode mode, TransportCharsCallback cb) = 0;

            virtual void getIncludedServices(const CacheMode mode, TransportServicesCallback cb) = 0;
    };

    /** A connection handle to a remote device. */
    class TransportDevice : public Releasable {
        public:
            virtual uint64_t getAddress() const noexcept = 0;

            virtual void getServices(const CacheMode mode, TransportServicesCallback cb) = 0;
    };

    enum class TransportRadioKind : uint8_t {
        OTHER     = 0,
        BLUETOOTH = 1,
        WIFI      = 2
    };

    enum class TransportRadioState : uint8_t {
        UNKNOWN  = 0,
        ON       = 1,
        OFF      = 2,
        DISABLED = 3
    };
    std::string to_string(const TransportRadioState v) noexcept;

    typedef jau::function<void(const TransportRadioState)> TransportRadioStateCallback;

    class TransportRadio {
        public:
            virtual ~TransportRadio() noexcept {}

            virtual TransportRadioKind getKind() const noexcept = 0;

            virtual TransportRadioState getState() const noexcept = 0;

            virtual std::string getName() const noexcept = 0;

            virtual void setStateChangedCallback(TransportRadioStateCallback cb) = 0;
    };

    enum class WatcherStatus : uint8_t {
        CREATED  = 0,
        STARTED  = 1,
        STOPPING = 2,
        STOPPED  = 3,
        ABORTED  = 4
    };
    std::string to_string(const WatcherStatus v) noexcept;

    typedef jau::function<void(const AdvertisementEvent&)> AdvertisementReceivedCallback;
    typedef jau::function<void(const WatcherStatus)> WatcherStoppedCallback;

    class TransportAdvertisementWatcher {
        public:
            virtual ~TransportAdvertisementWatcher() noexcept {}

            virtual void start() = 0;

            virtual void stop() = 0;

            virtual WatcherStatus getStatus() const noexcept = 0;

            /** Active scanning requests scan responses, passive doesn't. */
            virtual void setScanningMode(const bool active) = 0;

            virtual void setReceivedCallback(AdvertisementReceivedCallback cb) = 0;

            virtual void setStoppedCallback(WatcherStoppedCallback cb) = 0;
    };
    typedef std::shared_ptr<TransportAdvertisementWatcher> TransportAdvertisementWatcherRef;

    typedef jau::function<void(const TransportResult&, const jau::darray<TransportRadioRef>&)> TransportRadiosCallback;
    typedef jau::function<void(const TransportResult&, const TransportDeviceRef&)> TransportConnectCallback;

    /**
     * Entry point of a platform binding.
     */
    class BTTransport {
        public:
            virtual ~BTTransport() noexcept {}

            virtual void getRadios(TransportRadiosCallback cb) = 0;

            /** Returns the advertisement watcher, the same instance for each call. */
            virtual TransportAdvertisementWatcherRef getAdvertisementWatcher() = 0;

            /** Resolves a connection handle for the given 48-bit address. */
            virtual void connectByAddress(const uint64_t address, TransportConnectCallback cb) = 0;
    };

    /**@}*/

} // namespace central_bt

#endif /* CBT_TRANSPORT_HPP_ */
