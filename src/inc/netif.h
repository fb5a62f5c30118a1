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
#ifndef _NETIF_H_INCLUDED_
#define _NETIF_H_INCLUDED_

/*
 * System-independant representation of an IP address, and of a socket
 * address (address + port).
 */
#include <cstdint>
#include <memory>
#include <string>
#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <sys/socket.h>
#include <netinet/in.h>
#endif

namespace NetIF {

/** Represent an IPV4 or IPV6 address, with an optional port */
class IPAddr {
public:
    enum class Family {Invalid = -1, IPV4 = AF_INET, IPV6 = AF_INET6};
    IPAddr();
    /** Build from textual representation (e.g. 192.168.4.4) */
    explicit IPAddr(const char *);
    /** Build from textual representation (e.g. 192.168.4.4) */
    explicit IPAddr(const std::string& s)
        : IPAddr(s.c_str()) {}
    /** Build from binary address in network byte order. If unmapv4 is set,
     *  an IPV6-mapped IPV4 address (::ffff:a.b.c.d) becomes a plain IPV4
     *  one */
    explicit IPAddr(const struct sockaddr *sa, bool unmapv4 = true);

    IPAddr(const IPAddr&);
    IPAddr& operator=(const IPAddr&);
    ~IPAddr();

    /** Check constructor success */
    bool ok() const;
    /** Returns the address family */
    Family family() const;

    /** Copies out for use with a system interface */
    /* Zeroes out up to sizeof(sockaddr_storage) */
    bool copyToStorage(struct sockaddr_storage *dest) const;
    /* Size of the sockaddr for the family, 0 if invalid */
    socklen_t addrlen() const;

    const struct sockaddr_storage& getaddr() const;

    /** Port in host byte order */
    uint16_t port() const;
    void setport(uint16_t port);

    /** IPV4 address in host byte order. 0 if the family is not IPV4 */
    uint32_t ipv4() const;

    /** Convert to textual representation */
    std::string straddr() const;
    /** Textual representation with port: a.b.c.d:port */
    std::string strhostport() const;

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

} /* namespace NetIF */

#endif /* _NETIF_H_INCLUDED_ */
