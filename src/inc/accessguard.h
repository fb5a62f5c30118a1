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
#ifndef ACCESSGUARD_H
#define ACCESSGUARD_H

/*!
 * \file
 *
 * \brief Origin checks for the ECP HTTP requests.
 *
 * A request is accepted only if its HOST header is one of the exact
 * host[:port] strings we answer to (mitigates DNS rebinding from a local
 * browser), and if it comes from a private IPV4 network or the loopback.
 */

#include <string>
#include <vector>

#include "netif.h"

enum AccessStatus {ACCESS_ALLOW, ACCESS_BAD_HOST, ACCESS_BAD_REMOTE};

struct AccessDecision {
    AccessStatus status{ACCESS_ALLOW};
    /* Human-readable, suitable for a log line or a 403 body */
    std::string reason;
    bool allowed() const {
        return status == ACCESS_ALLOW;
    }
};

/*!
 * \brief Check a request.
 *
 * \param hosthdr the HOST header value, or nullptr if absent.
 * \param remote the client address. IPV6-mapped IPV4 addresses must have
 *    been unmapped (the NetIF::IPAddr sockaddr constructor does it).
 * \param allowedHosts exact accepted HOST values.
 *
 * The HOST check runs first. A rejection is logged at warning level.
 */
AccessDecision ecp_authorize(const char *hosthdr, const NetIF::IPAddr& remote,
                             const std::vector<std::string>& allowedHosts);

/* Same, with the client address in textual form. nullptr or an empty
   string mean no address. */
AccessDecision ecp_authorize(const char *hosthdr, const char *remote,
                             const std::vector<std::string>& allowedHosts);

/*! True if addr is IPV4 in 10/8, 172.16/12, 192.168/16 or 127/8 */
bool ecp_is_private_ipv4(const NetIF::IPAddr& addr);

#endif /* ACCESSGUARD_H */
