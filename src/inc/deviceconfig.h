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
#ifndef DEVICECONFIG_H
#define DEVICECONFIG_H

#include <chrono>
#include <string>
#include <vector>

#include "ecpemu.h"

/* The real device's ECP port. First port tried when the application asks
   for automatic selection. */
#define ECP_DEFAULT_PORT 8060

/*!
 * \brief Resolved, immutable device parameters.
 *
 * Built once from the application's EcpDeviceConfig: defaults applied,
 * automatic port chosen, device id derived, HOST allow-list computed.
 */
class DeviceConfiguration {
public:
    explicit DeviceConfiguration(const EcpDeviceConfig& in);

    /*! ECP_E_SUCCESS, ECP_E_INVALID_PARAM (empty usn, bad address or
     *  interval) or ECP_E_LISTEN (no free port for automatic selection) */
    int status() const {return m_status;}

    const std::string& usn() const {return m_usn;}
    const std::string& deviceId() const {return m_deviceId;}
    const std::string& hostIp() const {return m_hostIp;}
    uint16_t listenPort() const {return m_listenPort;}
    const std::string& advertiseIp() const {return m_advertiseIp;}
    uint16_t advertisePort() const {return m_advertisePort;}
    bool bindMulticastWildcard() const {return m_bindWildcard;}
    std::chrono::seconds announceInterval() const {return m_announceInterval;}
    /*! hostIp, hostIp:listenPort, advertiseIp, advertiseIp:advertisePort */
    const std::vector<std::string>& allowedHosts() const {return m_allowedHosts;}

    /*! URL published in the SSDP LOCATION header */
    std::string location() const;

private:
    int m_status{ECP_E_SUCCESS};
    std::string m_usn;
    std::string m_deviceId;
    std::string m_hostIp;
    uint16_t m_listenPort{0};
    std::string m_advertiseIp;
    uint16_t m_advertisePort{0};
    bool m_bindWildcard{false};
    std::chrono::seconds m_announceInterval{300};
    std::vector<std::string> m_allowedHosts;
};

/*!
 * \brief Find a free TCP port on hostip, trying reqport and the 19
 * following ones.
 *
 * \return the port, or a negative ECP_E_XXX error.
 */
int available_port(const std::string& hostip, int reqport);

#endif /* DEVICECONFIG_H */
