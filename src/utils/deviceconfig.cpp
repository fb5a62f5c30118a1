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

#include "deviceconfig.h"

#include <algorithm>
#include <cerrno>
#include <string>
#include <vector>

#include <sys/socket.h>
#include <unistd.h>

#include "deviceid.h"
#include "ecpdebug.h"
#include "genut.h"
#include "netif.h"

#ifdef _WIN32
#define ECP_DEFAULT_BIND_WILDCARD true
#else
#define ECP_DEFAULT_BIND_WILDCARD false
#endif

static void addAllowed(std::vector<std::string>& v, const std::string& h)
{
    if (std::find(v.begin(), v.end(), h) == v.end()) {
        v.push_back(h);
    }
}

DeviceConfiguration::DeviceConfiguration(const EcpDeviceConfig& in)
    : m_usn(in.usn), m_hostIp(in.hostIp), m_listenPort(in.listenPort),
      m_advertiseIp(in.advertiseIp), m_advertisePort(in.advertisePort)
{
    m_deviceId = ecp_derive_device_id(m_usn);
    m_bindWildcard = in.bindMulticast < 0 ? ECP_DEFAULT_BIND_WILDCARD :
        in.bindMulticast != 0;
    m_announceInterval = std::chrono::seconds(in.announceIntervalSecs);

    if (m_usn.empty()) {
        EcpPrintf(ECP_ERROR, API, __FILE__, __LINE__,
                  "DeviceConfiguration: empty usn\n");
        m_status = ECP_E_INVALID_PARAM;
        return;
    }
    NetIF::IPAddr hostaddr(m_hostIp);
    if (!hostaddr.ok() || hostaddr.family() != NetIF::IPAddr::Family::IPV4) {
        EcpPrintf(ECP_ERROR, API, __FILE__, __LINE__,
                  "DeviceConfiguration: bad host address [%s]\n", m_hostIp.c_str());
        m_status = ECP_E_INVALID_PARAM;
        return;
    }
    // Use the canonical form, this is what goes in the allow-list
    m_hostIp = hostaddr.straddr();
    if (m_advertiseIp.empty()) {
        m_advertiseIp = m_hostIp;
    } else {
        NetIF::IPAddr advaddr(m_advertiseIp);
        if (!advaddr.ok() || advaddr.family() != NetIF::IPAddr::Family::IPV4) {
            EcpPrintf(ECP_ERROR, API, __FILE__, __LINE__,
                      "DeviceConfiguration: bad advertise address [%s]\n",
                      m_advertiseIp.c_str());
            m_status = ECP_E_INVALID_PARAM;
            return;
        }
        m_advertiseIp = advaddr.straddr();
    }
    if (in.announceIntervalSecs <= 0) {
        EcpPrintf(ECP_ERROR, API, __FILE__, __LINE__,
                  "DeviceConfiguration: bad announce interval %d\n",
                  in.announceIntervalSecs);
        m_status = ECP_E_INVALID_PARAM;
        return;
    }

    if (m_listenPort == 0) {
        int port = available_port(m_hostIp, ECP_DEFAULT_PORT);
        if (port < 0) {
            EcpPrintf(ECP_ERROR, API, __FILE__, __LINE__,
                      "DeviceConfiguration: no free port at or above %d\n",
                      ECP_DEFAULT_PORT);
            m_status = ECP_E_LISTEN;
            return;
        }
        m_listenPort = static_cast<uint16_t>(port);
    }
    if (m_advertisePort == 0) {
        m_advertisePort = m_listenPort;
    }

    addAllowed(m_allowedHosts, m_hostIp);
    addAllowed(m_allowedHosts, m_hostIp + ":" + std::to_string(m_listenPort));
    addAllowed(m_allowedHosts, m_advertiseIp);
    addAllowed(m_allowedHosts, m_advertiseIp + ":" + std::to_string(m_advertisePort));

    EcpPrintf(ECP_DEBUG, API, __FILE__, __LINE__,
              "DeviceConfiguration: usn [%s] id [%s] http %s:%d location %s\n",
              m_usn.c_str(), m_deviceId.c_str(), m_hostIp.c_str(),
              m_listenPort, location().c_str());
}

std::string DeviceConfiguration::location() const
{
    return "http://" + m_advertiseIp + ":" + std::to_string(m_advertisePort) + "/";
}

int available_port(const std::string& hostip, int reqport)
{
    char errorBuffer[ERROR_BUFFER_LEN];
    NetIF::IPAddr ipa(hostip);
    if (!ipa.ok()) {
        return ECP_E_INVALID_PARAM;
    }
    int sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) {
        posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
        EcpPrintf(ECP_CRITICAL, MSERV, __FILE__, __LINE__,
                  "available_port: socket(): %s\n", errorBuffer);
        return ECP_E_OUTOF_SOCKET;
    }
    int onOff = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<char *>(&onOff), sizeof(onOff)) < 0) {
        posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
        EcpPrintf(ECP_CRITICAL, MSERV, __FILE__, __LINE__,
                  "available_port: reuseaddr: %s\n", errorBuffer);
    }

    int port = reqport <= 0 ? ECP_DEFAULT_PORT : reqport;
    int ret = ECP_E_SOCKET_BIND;
    for (int i = 0; i < 20 && port <= 65535; i++) {
        ipa.setport(static_cast<uint16_t>(port));
        if (bind(sock, reinterpret_cast<const struct sockaddr*>(&ipa.getaddr()),
                 ipa.addrlen()) == 0) {
            ret = port;
            break;
        }
        if (errno == EADDRINUSE) {
            port++;
            continue;
        }
        posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
        EcpPrintf(ECP_CRITICAL, MSERV, __FILE__, __LINE__,
                  "available_port: bind(): %s\n", errorBuffer);
        ret = ECP_E_SOCKET_BIND;
        break;
    }

    close(sock);
    return ret;
}
