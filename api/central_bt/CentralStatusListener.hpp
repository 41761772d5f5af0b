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

#ifndef CBT_CENTRAL_STATUS_LISTENER_HPP_
#define CBT_CENTRAL_STATUS_LISTENER_HPP_

#include <cstring>
#include <string>
#include <memory>
#include <cstdint>

#include <jau/darray.hpp>
#include <jau/octets.hpp>

#include "BTTypes0.hpp"
#include "BTAdvertisement.hpp"
#include "BTGattChar.hpp"

namespace central_bt {

    /** \addtogroup CBTUserClientAPI
     *
     *  @{
     */

    /**
     * Application facing event sink of BTCentral, one method per event.
     *
     * Operation events carry either a success payload or an error,
     * never both: if `error` is set, the payload is empty.
     *
     * Exceptions thrown by an implementation are caught and logged by BTCentral.
     */
    class CentralStatusListener {
        public:
            virtual ~CentralStatusListener() noexcept {}

            /** The local radio state has changed. */
            virtual void stateChange(const RadioState state) {
                (void)state;
            }

            virtual void scanStart() {}

            virtual void scanStop() {}

            /**
             * A remote device has been discovered, emitted on scan response packets only.
             * @param report the device information and merged advertisement snapshot
             */
            virtual void discover(const DiscoveryReport& report) {
                (void)report;
            }

            virtual void connect(const std::string& id, const BTExceptionRef& error) {
                (void)id;
                (void)error;
            }

            /** The device has been disconnected, either requested or by connection loss. */
            virtual void disconnect(const std::string& id) {
                (void)id;
            }

            virtual void rssiUpdate(const std::string& id, const int8_t rssi, const BTExceptionRef& error) {
                (void)id;
                (void)rssi;
                (void)error;
            }

            virtual void servicesDiscover(const std::string& id, const jau::darray<std::string>& serviceUuids, const BTExceptionRef& error) {
                (void)id;
                (void)serviceUuids;
                (void)error;
            }

            virtual void includedServicesDiscover(const std::string& id, const std::string& serviceUuid,
                                                  const jau::darray<std::string>& includedServiceUuids, const BTExceptionRef& error) {
                (void)id;
                (void)serviceUuid;
                (void)includedServiceUuids;
                (void)error;
            }

            virtual void characteristicsDiscover(const std::string& id, const std::string& serviceUuid,
                                                 const jau::darray<BTGattChar>& characteristics, const BTExceptionRef& error) {
                (void)id;
                (void)serviceUuid;
                (void)characteristics;
                (void)error;
            }

            virtual void descriptorsDiscover(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                             const jau::darray<std::string>& descriptorUuids, const BTExceptionRef& error) {
                (void)id;
                (void)serviceUuid;
                (void)charUuid;
                (void)descriptorUuids;
                (void)error;
            }

            /**
             * A characteristic value has been read or notified.
             * @param isNotification true if the value stems from a notification, false for a read response
             */
            virtual void read(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                              const jau::TROOctets& data, const bool isNotification, const BTExceptionRef& error) {
                (void)id;
                (void)serviceUuid;
                (void)charUuid;
                (void)data;
                (void)isNotification;
                (void)error;
            }

            virtual void write(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                               const BTExceptionRef& error) {
                (void)id;
                (void)serviceUuid;
                (void)charUuid;
                (void)error;
            }

            virtual void broadcast(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                   const bool state, const BTExceptionRef& error) {
                (void)id;
                (void)serviceUuid;
                (void)charUuid;
                (void)state;
                (void)error;
            }

            virtual void notify(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                const bool state, const BTExceptionRef& error) {
                (void)id;
                (void)serviceUuid;
                (void)charUuid;
                (void)state;
                (void)error;
            }

            virtual void readValue(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                   const std::string& descUuid, const jau::TROOctets& data, const BTExceptionRef& error) {
                (void)id;
                (void)serviceUuid;
                (void)charUuid;
                (void)descUuid;
                (void)data;
                (void)error;
            }

            virtual void writeValue(const std::string& id, const std::string& serviceUuid, const std::string& charUuid,
                                    const std::string& descUuid, const BTExceptionRef& error) {
                (void)id;
                (void)serviceUuid;
                (void)charUuid;
                (void)descUuid;
                (void)error;
            }

            virtual void readHandle(const std::string& id, const uint16_t handle, const jau::TROOctets& data, const BTExceptionRef& error) {
                (void)id;
                (void)handle;
                (void)data;
                (void)error;
            }

            virtual void writeHandle(const std::string& id, const uint16_t handle, const BTExceptionRef& error) {
                (void)id;
                (void)handle;
                (void)error;
            }

            virtual std::string toString() const noexcept { return "CentralStatusListener"; }

            /**
             * Default comparison operator, merely testing for same memory reference.
             * <p>
             * Specializations may override.
             * </p>
             */
            virtual bool operator==(const CentralStatusListener& rhs) const noexcept
            { return this == &rhs; }

            bool operator!=(const CentralStatusListener& rhs) const noexcept
            { return !(*this == rhs); }
    };
    typedef std::shared_ptr<CentralStatusListener> CentralStatusListenerRef;

    /**@}*/

} // namespace central_bt

#endif /* CBT_CENTRAL_STATUS_LISTENER_HPP_ */
