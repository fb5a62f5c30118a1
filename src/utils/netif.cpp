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

#include "netif.h"

#include <cstring>
#include <string>

#ifndef _WIN32
#include <sys/types.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#else /* _WIN32 -> */
#include <winsock2.h>
#include <ws2tcpip.h>
#endif /* _WIN32 */

namespace NetIF {

class IPAddr::Internal {
public:
    bool ok{false};
    struct sockaddr_storage address{};
    struct sockaddr *saddr() {
        return reinterpret_cast<struct sockaddr*>(&address);
    }
    struct sockaddr_in *sin() {
        return reinterpret_cast<struct sockaddr_in*>(&address);
    }
    struct sockaddr_in6 *sin6() {
        return reinterpret_cast<struct sockaddr_in6*>(&address);
    }
};

IPAddr::IPAddr()
    : m(std::make_unique<Internal>())
{
}

IPAddr::IPAddr(const IPAddr& o)
    : m(std::make_unique<Internal>(*o.m))
{
}

IPAddr& IPAddr::operator=(const IPAddr& o)
{
    if (&o != this) {
        *m = *o.m;
    }
    return *this;
}

IPAddr::~IPAddr() = default;

IPAddr::IPAddr(const char *caddr)
    : IPAddr()
{
    if (nullptr == caddr || *caddr == 0) {
        return;
    }
    if (nullptr != std::strchr(caddr, ':')) {
        if (inet_pton(AF_INET6, caddr, &m->sin6()->sin6_addr) == 1) {
            m->saddr()->sa_family = AF_INET6;
            m->ok = true;
        }
    } else {
        if (inet_pton(AF_INET, caddr, &m->sin()->sin_addr) == 1) {
            m->saddr()->sa_family = AF_INET;
            m->ok = true;
        }
    }
}

static const uint8_t ipv4mappedprefix[12] = {0,0,0,0,0,0,0,0,0,0,0xff,0xff};

IPAddr::IPAddr(const struct sockaddr *sa, bool unmapv4)
    : IPAddr()
{
    if (nullptr == sa) {
        return;
    }
    switch (sa->sa_family) {
    case AF_INET:
        memcpy(m->saddr(), sa, sizeof(struct sockaddr_in));
        m->ok = true;
        break;
    case AF_INET6:
    {
        auto sa6 = reinterpret_cast<const struct sockaddr_in6 *>(sa);
        if (unmapv4) {
            const uint8_t *bytes = sa6->sin6_addr.s6_addr;
            if (!memcmp(bytes, ipv4mappedprefix, 12)) {
                auto a = m->sin();
                a->sin_family = AF_INET;
                a->sin_port = sa6->sin6_port;
                memcpy(&a->sin_addr.s_addr, bytes+12, 4);
                m->ok = true;
                break;
            }
        }
        memcpy(m->saddr(), sa, sizeof(struct sockaddr_in6));
        m->ok = true;
    }
    break;
    default:
        break;
    }
}

bool IPAddr::ok() const
{
    return m->ok;
}

IPAddr::Family IPAddr::family() const
{
    if (m->ok) {
        return static_cast<IPAddr::Family>(m->saddr()->sa_family);
    }
    return Family::Invalid;
}

bool IPAddr::copyToStorage(struct sockaddr_storage *dest) const
{
    if (!m->ok) {
        *dest = {};
        return false;
    }
    memcpy(dest, &m->address, sizeof(struct sockaddr_storage));
    return true;
}

socklen_t IPAddr::addrlen() const
{
    switch (family()) {
    case Family::IPV4: return sizeof(struct sockaddr_in);
    case Family::IPV6: return sizeof(struct sockaddr_in6);
    default: return 0;
    }
}

const struct sockaddr_storage& IPAddr::getaddr() const
{
    return m->address;
}

uint16_t IPAddr::port() const
{
    switch (family()) {
    case Family::IPV4: return ntohs(m->sin()->sin_port);
    case Family::IPV6: return ntohs(m->sin6()->sin6_port);
    default: return 0;
    }
}

void IPAddr::setport(uint16_t port)
{
    switch (family()) {
    case Family::IPV4: m->sin()->sin_port = htons(port); break;
    case Family::IPV6: m->sin6()->sin6_port = htons(port); break;
    default: break;
    }
}

uint32_t IPAddr::ipv4() const
{
    if (family() != Family::IPV4) {
        return 0;
    }
    return ntohl(m->sin()->sin_addr.s_addr);
}

std::string IPAddr::straddr() const
{
    if (!ok())
        return {};

    char buf[INET6_ADDRSTRLEN + 1];
    buf[0] = 0;
    switch(m->saddr()->sa_family) {
    case AF_INET:
        inet_ntop(AF_INET, &m->sin()->sin_addr, buf, sizeof(buf));
        break;
    case AF_INET6:
        inet_ntop(AF_INET6, &m->sin6()->sin6_addr, buf, sizeof(buf));
        break;
    }
    return buf;
}

std::string IPAddr::strhostport() const
{
    if (!ok())
        return {};
    if (family() == Family::IPV6) {
        return std::string("[") + straddr() + "]:" + std::to_string(port());
    }
    return straddr() + ":" + std::to_string(port());
}

} /* namespace NetIF */
