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
 * \brief UDP transport for the discovery engine.
 */

#include "ssdplib.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "ecpdebug.h"
#include "ecpemu.h"
#include "genut.h"

/* Largest datagram we accept */
#define SSDP_BUFSIZE 2500

#define STOP_MESSAGE "ShutDown"

UdpSsdpSocket::~UdpSsdpSocket()
{
    close();
}

/* Create the loopback socket used to interrupt select() in receive() */
static int get_stopsock(int *sock, uint16_t *port)
{
    char errorBuffer[ERROR_BUFFER_LEN];
    struct sockaddr_in stop_sockaddr = {};
    socklen_t len = sizeof(stop_sockaddr);

    *sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (*sock < 0) {
        posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
        EcpPrintf(ECP_CRITICAL, SSDP, __FILE__, __LINE__,
                  "ssdp: stopsock: socket(): %s\n", errorBuffer);
        return ECP_E_OUTOF_SOCKET;
    }
    stop_sockaddr.sin_family = static_cast<sa_family_t>(AF_INET);
    stop_sockaddr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (bind(*sock, reinterpret_cast<struct sockaddr *>(&stop_sockaddr),
             sizeof(stop_sockaddr)) < 0 ||
        getsockname(*sock, reinterpret_cast<struct sockaddr *>(&stop_sockaddr),
                    &len) < 0) {
        posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
        EcpPrintf(ECP_CRITICAL, SSDP, __FILE__, __LINE__,
                  "ssdp: stopsock: bind(localhost): %s\n", errorBuffer);
        ::close(*sock);
        *sock = -1;
        return ECP_E_SOCKET_BIND;
    }
    *port = ntohs(stop_sockaddr.sin_port);
    return ECP_E_SUCCESS;
}

int UdpSsdpSocket::open(const NetIF::IPAddr& hostaddr, bool bindwildcard)
{
    int onOff;
    unsigned char ttl = 2;
    struct sockaddr_in ssdpAddr4 = {};
    struct ip_mreq ssdpMcastAddr = {};
    struct in_addr ifaddr = {};
    int ret = ECP_E_SOCKET_ERROR;
    std::string errorcause;

    close();

    if (hostaddr.family() != NetIF::IPAddr::Family::IPV4) {
        EcpPrintf(ECP_CRITICAL, SSDP, __FILE__, __LINE__,
                  "UdpSsdpSocket::open: need an IPV4 host address\n");
        return ECP_E_INVALID_PARAM;
    }
    ifaddr.s_addr = htonl(hostaddr.ipv4());

    ret = get_stopsock(&m_stopSock, &m_stopPort);
    if (ret != ECP_E_SUCCESS) {
        return ret;
    }

    m_sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (m_sock < 0) {
        errorcause = "socket()";
        ret = ECP_E_OUTOF_SOCKET;
        goto error_handler;
    }
    // select() can't watch descriptors at or above FD_SETSIZE
    if (m_sock >= FD_SETSIZE || m_stopSock >= FD_SETSIZE) {
        errorcause = "descriptor above FD_SETSIZE";
        errno = EMFILE;
        ret = ECP_E_OUTOF_SOCKET;
        goto error_handler;
    }

    onOff = 1;
    if (setsockopt(m_sock, SOL_SOCKET, SO_REUSEADDR,
                   reinterpret_cast<char *>(&onOff), sizeof(onOff)) == -1) {
        errorcause = "setsockopt() SO_REUSEADDR";
        ret = ECP_E_SOCKET_ERROR;
        goto error_handler;
    }

#if (defined(BSD) && !defined(__GNU__)) || defined(__OSX__) || defined(__APPLE__)
    onOff = 1;
    if (setsockopt(m_sock, SOL_SOCKET, SO_REUSEPORT,
                   reinterpret_cast<char *>(&onOff), sizeof(onOff)) == -1) {
        errorcause = "setsockopt() SO_REUSEPORT";
        ret = ECP_E_SOCKET_ERROR;
        goto error_handler;
    }
#endif /* BSD, __OSX__, __APPLE__ */

    ssdpAddr4.sin_family = static_cast<sa_family_t>(AF_INET);
    ssdpAddr4.sin_addr.s_addr = bindwildcard ? htonl(INADDR_ANY) : ifaddr.s_addr;
    ssdpAddr4.sin_port = htons(SSDP_PORT);
    if (bind(m_sock, reinterpret_cast<struct sockaddr *>(&ssdpAddr4),
             sizeof(ssdpAddr4)) == -1) {
        errorcause = bindwildcard ? "bind(INADDR_ANY)" : "bind(host address)";
        ret = ECP_E_SOCKET_BIND;
        goto error_handler;
    }

    ssdpMcastAddr.imr_interface = ifaddr;
    if (inet_pton(AF_INET, SSDP_IP, &(ssdpMcastAddr.imr_multiaddr)) != 1) {
        errorcause = "inet_pton() error for multicast address";
        ret = ECP_E_SOCKET_ERROR;
        goto error_handler;
    }
    if (setsockopt(m_sock, IPPROTO_IP, IP_ADD_MEMBERSHIP,
                   reinterpret_cast<char *>(&ssdpMcastAddr), sizeof(ssdpMcastAddr)) == -1) {
        errorcause = "setsockopt() IP_ADD_MEMBERSHIP";
        ret = ECP_E_SOCKET_ERROR;
        goto error_handler;
    }
    if (setsockopt(m_sock, IPPROTO_IP, IP_MULTICAST_IF,
                   reinterpret_cast<char *>(&ifaddr), sizeof(ifaddr)) < 0) {
        errorcause = "setsockopt(IP_MULTICAST_IF)";
        ret = ECP_E_SOCKET_ERROR;
        goto error_handler;
    }
    if (setsockopt(m_sock, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
        errorcause = "setsockopt(IP_MULTICAST_TTL)";
        ret = ECP_E_SOCKET_ERROR;
        goto error_handler;
    }

    EcpPrintf(ECP_INFO, SSDP, __FILE__, __LINE__,
              "SSDP socket bound to %s:%d, group joined on %s\n",
              bindwildcard ? "0.0.0.0" : hostaddr.straddr().c_str(), SSDP_PORT,
              hostaddr.straddr().c_str());
    return ECP_E_SUCCESS;

error_handler:
    char errorBuffer[ERROR_BUFFER_LEN];
    posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
    EcpPrintf(ECP_CRITICAL, SSDP, __FILE__, __LINE__,
              "%s: %s\n", errorcause.c_str(), errorBuffer);
    close();
    return ret;
}

int UdpSsdpSocket::receive(std::string& data, NetIF::IPAddr& from)
{
    char errorBuffer[ERROR_BUFFER_LEN];
    fd_set rdSet;

    if (m_sock < 0 || m_stopSock < 0 ||
        m_sock >= FD_SETSIZE || m_stopSock >= FD_SETSIZE) {
        return ECP_E_SOCKET_READ;
    }
    int maxsock = std::max(m_sock, m_stopSock) + 1;

    for (;;) {
        FD_ZERO(&rdSet);
        FD_SET(m_sock, &rdSet);
        FD_SET(m_stopSock, &rdSet);
        int ret = select(maxsock, &rdSet, nullptr, nullptr, nullptr);
        if (ret == -1 && errno == EINTR) {
            continue;
        }
        if (ret == -1) {
            posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
            EcpPrintf(ECP_CRITICAL, SSDP, __FILE__, __LINE__,
                      "ssdp: select(): %s\n", errorBuffer);
            return ECP_E_SOCKET_READ;
        }

        if (FD_ISSET(m_stopSock, &rdSet)) {
            char requestBuf[100];
            ssize_t cnt = recv(m_stopSock, requestBuf, sizeof(requestBuf) - 1, 0);
            if (cnt > 0) {
                requestBuf[cnt] = '\0';
                if (nullptr != strstr(requestBuf, STOP_MESSAGE)) {
                    return 0;
                }
            }
        }

        if (FD_ISSET(m_sock, &rdSet)) {
            char buf[SSDP_BUFSIZE];
            struct sockaddr_storage ss = {};
            socklen_t socklen = sizeof(ss);
            ssize_t cnt = recvfrom(m_sock, buf, sizeof(buf), 0,
                                   reinterpret_cast<struct sockaddr *>(&ss), &socklen);
            if (cnt > 0) {
                data.assign(buf, static_cast<size_t>(cnt));
                from = NetIF::IPAddr(reinterpret_cast<struct sockaddr *>(&ss));
                return static_cast<int>(cnt);
            }
            if (cnt < 0 && errno != EINTR && errno != EAGAIN) {
                posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
                EcpPrintf(ECP_ERROR, SSDP, __FILE__, __LINE__,
                          "ssdp: recvfrom(): %s\n", errorBuffer);
                return ECP_E_SOCKET_READ;
            }
        }
    }
}

int UdpSsdpSocket::sendTo(const std::string& data, const NetIF::IPAddr& dest)
{
    if (m_sock < 0) {
        return ECP_E_SOCKET_WRITE;
    }
    ssize_t rc = sendto(m_sock, data.c_str(), data.size(), 0,
                        reinterpret_cast<const struct sockaddr *>(&dest.getaddr()),
                        dest.addrlen());
    if (rc == -1) {
        char errorBuffer[ERROR_BUFFER_LEN];
        posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
        EcpPrintf(ECP_ERROR, SSDP, __FILE__, __LINE__,
                  "ssdp: sendto %s: %s\n", dest.strhostport().c_str(), errorBuffer);
        return ECP_E_SOCKET_WRITE;
    }
    return ECP_E_SUCCESS;
}

void UdpSsdpSocket::wakeup()
{
    char errorBuffer[ERROR_BUFFER_LEN];
    struct sockaddr_in stopaddr = {};

    if (m_stopSock < 0) {
        return;
    }
    int sock = socket(AF_INET, SOCK_DGRAM, 0);
    if (sock < 0) {
        posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
        EcpPrintf(ECP_ERROR, SSDP, __FILE__, __LINE__,
                  "ssdp: wakeup: socket(): %s\n", errorBuffer);
        return;
    }
    stopaddr.sin_family = static_cast<sa_family_t>(AF_INET);
    stopaddr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    stopaddr.sin_port = htons(m_stopPort);
    if (sendto(sock, STOP_MESSAGE, strlen(STOP_MESSAGE), 0,
               reinterpret_cast<struct sockaddr *>(&stopaddr), sizeof(stopaddr)) < 0) {
        posix_strerror_r(errno, errorBuffer, ERROR_BUFFER_LEN);
        EcpPrintf(ECP_ERROR, SSDP, __FILE__, __LINE__,
                  "ssdp: wakeup: sendto(): %s\n", errorBuffer);
    }
    ::close(sock);
}

void UdpSsdpSocket::close()
{
    if (m_sock >= 0) {
        ::close(m_sock);
        m_sock = -1;
    }
    if (m_stopSock >= 0) {
        ::close(m_stopSock);
        m_stopSock = -1;
    }
    m_stopPort = 0;
}
