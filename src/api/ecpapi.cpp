/*******************************************************************************
 *
 * Copyright (c) 2000-2003 Intel Corporation
 * Copyright (c) 2020 J.F. Dockes <jf@dockes.org>
 * Copyright (c) 2026 The ecpemu contributors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * - Redistributions of source code must retain the above copyright notice,
 * this list of conditions and the following disclaimer.
 * - Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * - Neither name of Intel Corporation nor the names of its contributors
 * may be used to endorse or promote products derived from this software
 * without specific prior written permission.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
 * "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
 * LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
 * A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL INTEL OR
 * CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
 * EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
 * PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
 * PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY
 * OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
 * NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 *
 ******************************************************************************/

/*!
 * \file
 *
 * \brief EmulatedDevice: lifecycle of the HTTP server and discovery engine.
 */

#include "ecpemu.h"

#include <memory>
#include <mutex>
#include <string>

#include "commandserver.h"
#include "deviceconfig.h"
#include "ecpdebug.h"
#include "ssdplib.h"

class EmulatedDevice::Internal {
public:
    Internal(std::shared_ptr<EcpCommandHandler> handler, const EcpDeviceConfig& in)
        : cfg(in) {
        if (!handler) {
            handler = std::make_shared<EcpNullCommandHandler>();
        }
        if (cfg.status() == ECP_E_SUCCESS) {
            server = std::make_unique<CommandServer>(cfg, handler);
            discovery = std::make_unique<DiscoveryEngine>(cfg);
        }
    }

    /* Serializes start() and stop() */
    mutable std::mutex mutex;
    DeviceConfiguration cfg;
    std::unique_ptr<CommandServer> server;
    std::unique_ptr<DiscoveryEngine> discovery;
    bool running{false};
};

EmulatedDevice::EmulatedDevice(std::shared_ptr<EcpCommandHandler> handler,
                               const EcpDeviceConfig& config)
    : m(std::make_unique<Internal>(std::move(handler), config))
{
}

EmulatedDevice::~EmulatedDevice()
{
    stop();
}

int EmulatedDevice::start()
{
    int retVal = ECP_E_SUCCESS;

    std::unique_lock<std::mutex> lck(m->mutex);

    EcpInitLog();

    if (m->cfg.status() != ECP_E_SUCCESS) {
        EcpPrintf(ECP_ERROR, API, __FILE__, __LINE__,
                  "EmulatedDevice::start: bad configuration: %d\n",
                  m->cfg.status());
        retVal = m->cfg.status();
        goto exit_function;
    }
    if (m->running) {
        if (m->discovery->state() == DiscoveryEngine::State::Listening) {
            retVal = ECP_E_INIT;
            goto exit_function;
        }
        // Discovery died on a socket error: restart everything
        EcpPrintf(ECP_INFO, API, __FILE__, __LINE__,
                  "EmulatedDevice::start: restarting after discovery failure\n");
        m->discovery->stop();
        m->server->stop();
        m->running = false;
    }

    EcpPrintf(ECP_INFO, API, __FILE__, __LINE__,
              "EmulatedDevice::start: usn %s host %s:%d advertise %s:%d\n",
              m->cfg.usn().c_str(), m->cfg.hostIp().c_str(),
              static_cast<int>(m->cfg.listenPort()),
              m->cfg.advertiseIp().c_str(),
              static_cast<int>(m->cfg.advertisePort()));

    retVal = m->server->start();
    if (retVal != ECP_E_SUCCESS) {
        EcpPrintf(ECP_CRITICAL, API, __FILE__, __LINE__,
                  "Command server start error %d\n", retVal);
        goto exit_function;
    }

    retVal = m->discovery->start();
    if (retVal != ECP_E_SUCCESS) {
        EcpPrintf(ECP_CRITICAL, API, __FILE__, __LINE__,
                  "Discovery start error %d\n", retVal);
        m->server->stop();
        goto exit_function;
    }
    m->running = true;

exit_function:
    return retVal;
}

void EmulatedDevice::stop()
{
    std::unique_lock<std::mutex> lck(m->mutex);
    if (!m->running) {
        return;
    }
    m->discovery->stop();
    m->server->stop();
    m->running = false;
    EcpPrintf(ECP_INFO, API, __FILE__, __LINE__,
              "EmulatedDevice::stop: %s stopped\n", m->cfg.usn().c_str());
}

bool EmulatedDevice::isRunning() const
{
    std::unique_lock<std::mutex> lck(m->mutex);
    return m->running &&
        m->discovery->state() == DiscoveryEngine::State::Listening;
}

const DeviceConfiguration& EmulatedDevice::config() const
{
    return m->cfg;
}
