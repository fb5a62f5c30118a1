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

#include "accessguard.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <string>
#include <vector>

#include "ecpdebug.h"

struct V4Net {
    uint32_t net;
    uint32_t mask;
};

static const V4Net private_nets[] = {
    {0x0A000000, 0xFF000000}, /* 10.0.0.0/8 */
    {0xAC100000, 0xFFF00000}, /* 172.16.0.0/12 */
    {0xC0A80000, 0xFFFF0000}, /* 192.168.0.0/16 */
    {0x7F000000, 0xFF000000}, /* 127.0.0.0/8 */
};

bool ecp_is_private_ipv4(const NetIF::IPAddr& addr)
{
    if (addr.family() != NetIF::IPAddr::Family::IPV4) {
        return false;
    }
    uint32_t a = addr.ipv4();
    return std::any_of(std::begin(private_nets), std::end(private_nets),
                       [a](const V4Net& n) { return (a & n.mask) == n.net; });
}

AccessDecision ecp_authorize(const char *hosthdr, const NetIF::IPAddr& remote,
                             const std::vector<std::string>& allowedHosts)
{
    AccessDecision decision;
    if (nullptr == hosthdr) {
        decision.status = ACCESS_BAD_HOST;
        decision.reason = "Missing HOST header";
    } else if (std::find(allowedHosts.begin(), allowedHosts.end(), hosthdr) ==
               allowedHosts.end()) {
        decision.status = ACCESS_BAD_HOST;
        decision.reason = std::string("Unrecognized HOST header: ") + hosthdr;
    } else if (!remote.ok()) {
        decision.status = ACCESS_BAD_REMOTE;
        decision.reason = "Missing or invalid remote address";
    } else if (!ecp_is_private_ipv4(remote)) {
        decision.status = ACCESS_BAD_REMOTE;
        decision.reason = "Remote address not on a private network: " +
            remote.straddr();
    }
    if (!decision.allowed()) {
        EcpPrintf(ECP_WARNING, HTTP, __FILE__, __LINE__,
                  "Rejected request: %s\n", decision.reason.c_str());
    }
    return decision;
}

AccessDecision ecp_authorize(const char *hosthdr, const char *remote,
                             const std::vector<std::string>& allowedHosts)
{
    NetIF::IPAddr addr(remote ? remote : "");
    if (addr.family() == NetIF::IPAddr::Family::IPV6) {
        // Normalize ::ffff:a.b.c.d
        struct sockaddr_storage ss;
        addr.copyToStorage(&ss);
        addr = NetIF::IPAddr(reinterpret_cast<struct sockaddr*>(&ss), true);
    }
    return ecp_authorize(hosthdr, addr, allowedHosts);
}
