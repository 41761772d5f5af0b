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

#ifndef CENTRAL_BT_HPP_
#define CENTRAL_BT_HPP_

/**
 * \defgroup CBTUserAPI Central BT User Level API
 *  General user level types, addressing and advertisement data.
 */

/**
 * \defgroup CBTUserClientAPI Central BT User Level GATT Client API
 *  Central facade, device registry, GATT resolution and notification subscriptions.
 */

#include "BTTypes0.hpp"
#include "BTAddress.hpp"
#include "BTUUID.hpp"
#include "BTAdvertisement.hpp"
#include "BTTransport.hpp"
#include "BTResourceTracker.hpp"
#include "BTGattChar.hpp"
#include "BTDevice.hpp"
#include "BTDeviceRegistry.hpp"
#include "BTGattResolver.hpp"
#include "BTSubscriptionManager.hpp"
#include "BTRadioMonitor.hpp"
#include "BTAdvertisementAggregator.hpp"
#include "CentralStatusListener.hpp"
#include "BTCentral.hpp"

#endif /* CENTRAL_BT_HPP_ */
