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

#include <string>
#include <vector>

#include "accessguard.h"
#include "netif.h"
#include "testutil.h"

int main(int, char **)
{
    std::vector<std::string> allowed{
        "192.168.1.10", "192.168.1.10:8060", "10.0.0.2", "10.0.0.2:18060"};

    CHECK(ecp_is_private_ipv4(NetIF::IPAddr("10.200.3.4")));
    CHECK(ecp_is_private_ipv4(NetIF::IPAddr("172.16.0.1")));
    CHECK(ecp_is_private_ipv4(NetIF::IPAddr("172.31.255.255")));
    CHECK(!ecp_is_private_ipv4(NetIF::IPAddr("172.32.0.1")));
    CHECK(!ecp_is_private_ipv4(NetIF::IPAddr("172.15.255.255")));
    CHECK(ecp_is_private_ipv4(NetIF::IPAddr("192.168.0.1")));
    CHECK(!ecp_is_private_ipv4(NetIF::IPAddr("192.169.0.1")));
    CHECK(ecp_is_private_ipv4(NetIF::IPAddr("127.0.0.1")));
    CHECK(!ecp_is_private_ipv4(NetIF::IPAddr("8.8.8.8")));
    CHECK(!ecp_is_private_ipv4(NetIF::IPAddr("fe80::1")));
    CHECK(!ecp_is_private_ipv4(NetIF::IPAddr()));

    AccessDecision d;
    d = ecp_authorize("192.168.1.10:8060", "192.168.1.5", allowed);
    CHECK(d.allowed());
    d = ecp_authorize("192.168.1.10", "192.168.1.5", allowed);
    CHECK(d.allowed());
    d = ecp_authorize("10.0.0.2:18060", "10.1.2.3", allowed);
    CHECK(d.allowed());

    // Remote checks
    d = ecp_authorize("192.168.1.10:8060", "8.8.8.8", allowed);
    CHECK(!d.allowed());
    CHECK(d.status == ACCESS_BAD_REMOTE);
    CHECK(d.reason.find("8.8.8.8") != std::string::npos);
    d = ecp_authorize("192.168.1.10:8060", "::ffff:10.1.2.3", allowed);
    CHECK(d.allowed());
    d = ecp_authorize("192.168.1.10:8060", "::ffff:8.8.4.4", allowed);
    CHECK(d.status == ACCESS_BAD_REMOTE);
    d = ecp_authorize("192.168.1.10:8060", "fd00::1", allowed);
    CHECK(d.status == ACCESS_BAD_REMOTE);
    d = ecp_authorize("192.168.1.10:8060", "", allowed);
    CHECK(d.status == ACCESS_BAD_REMOTE);
    d = ecp_authorize("192.168.1.10:8060", static_cast<const char *>(nullptr),
                      allowed);
    CHECK(d.status == ACCESS_BAD_REMOTE);

    // Host checks
    d = ecp_authorize(nullptr, "192.168.1.5", allowed);
    CHECK(d.status == ACCESS_BAD_HOST);
    d = ecp_authorize("evil.example.com", "192.168.1.5", allowed);
    CHECK(d.status == ACCESS_BAD_HOST);
    CHECK(d.reason.find("evil.example.com") != std::string::npos);
    d = ecp_authorize("192.168.1.10:9999", "192.168.1.5", allowed);
    CHECK(d.status == ACCESS_BAD_HOST);
    // Both wrong: the host is checked first
    d = ecp_authorize("evil.example.com", "8.8.8.8", allowed);
    CHECK(d.status == ACCESS_BAD_HOST);

    // Address form
    NetIF::IPAddr remote("192.168.7.7");
    remote.setport(40000);
    d = ecp_authorize("10.0.0.2", remote, allowed);
    CHECK(d.allowed());

    return test_result("test_accessguard");
}
