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

/* Exercise the real UDP transport over the loopback interface. Exits with
   TEST_SKIP if the multicast setup is not possible on this host. */

#include <atomic>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/resource.h>
#include <sys/select.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "ecpemu.h"
#include "netif.h"
#include "ssdplib.h"
#include "testutil.h"

// With every descriptor below FD_SETSIZE in use, open() must fail
// cleanly instead of handing select() an out of range descriptor.
static void highdescriptors(const NetIF::IPAddr& host)
{
    struct rlimit rl;
    if (getrlimit(RLIMIT_NOFILE, &rl) != 0) {
        return;
    }
    if (rl.rlim_cur < static_cast<rlim_t>(FD_SETSIZE) + 16) {
        rl.rlim_cur = rl.rlim_max;
        if (rl.rlim_cur < static_cast<rlim_t>(FD_SETSIZE) + 16 ||
            setrlimit(RLIMIT_NOFILE, &rl) != 0) {
            fprintf(stderr, "test_udpsocket: descriptor limit too low, "
                    "skipping FD_SETSIZE check\n");
            return;
        }
    }

    std::vector<int> fillers;
    bool full = false;
    for (;;) {
        int fd = ::open("/dev/null", O_RDONLY);
        if (fd < 0) {
            break;
        }
        if (fd >= FD_SETSIZE) {
            ::close(fd);
            full = true;
            break;
        }
        fillers.push_back(fd);
    }
    if (full) {
        UdpSsdpSocket sock;
        CHECK(sock.open(host, true) == ECP_E_OUTOF_SOCKET);
        std::string d;
        NetIF::IPAddr f;
        CHECK(sock.receive(d, f) == ECP_E_SOCKET_READ);
    } else {
        fprintf(stderr, "test_udpsocket: could not fill the descriptor "
                "table, skipping FD_SETSIZE check\n");
    }
    for (auto fd : fillers) {
        ::close(fd);
    }
}

int main(int, char **)
{
    UdpSsdpSocket sock;
    NetIF::IPAddr host("127.0.0.1");
    int ret = sock.open(host, true);
    if (ret != ECP_E_SUCCESS) {
        fprintf(stderr, "test_udpsocket: open failed (%d), skipping\n", ret);
        return TEST_SKIP;
    }

    // A datagram sent to the SSDP port is received with its origin
    int client = socket(AF_INET, SOCK_DGRAM, 0);
    CHECK(client >= 0);
    struct sockaddr_in caddr = {};
    caddr.sin_family = AF_INET;
    caddr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    CHECK(bind(client, reinterpret_cast<struct sockaddr *>(&caddr),
               sizeof(caddr)) == 0);
    socklen_t clen = sizeof(caddr);
    CHECK(getsockname(client, reinterpret_cast<struct sockaddr *>(&caddr),
                      &clen) == 0);

    struct sockaddr_in dest = {};
    dest.sin_family = AF_INET;
    dest.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    dest.sin_port = htons(SSDP_PORT);
    std::string msg("M-SEARCH * HTTP/1.1\r\nST: roku:ecp\r\nMX: 0\r\n\r\n");
    CHECK(sendto(client, msg.c_str(), msg.size(), 0,
                 reinterpret_cast<struct sockaddr *>(&dest), sizeof(dest)) ==
          static_cast<ssize_t>(msg.size()));

    std::string data;
    NetIF::IPAddr from;
    // Skip any unrelated SSDP traffic on this host
    for (int i = 0; i < 20; i++) {
        ret = sock.receive(data, from);
        if (ret <= 0 || from.port() == ntohs(caddr.sin_port))
            break;
    }
    CHECK(ret == static_cast<int>(msg.size()));
    CHECK(data == msg);
    CHECK(from.straddr() == "127.0.0.1");
    CHECK(from.port() == ntohs(caddr.sin_port));

    // Unicast answer back to the client
    CHECK(sock.sendTo("HTTP/1.1 200 OK\r\n\r\n", from) == ECP_E_SUCCESS);
    char buf[100];
    ssize_t cnt = recv(client, buf, sizeof(buf), 0);
    CHECK(cnt == 19);

    // wakeup() interrupts a blocked receive
    std::atomic<int> rcvret{-1000};
    std::thread rcv([&] {
        std::string d;
        NetIF::IPAddr f;
        rcvret = sock.receive(d, f);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    sock.wakeup();
    rcv.join();
    CHECK(rcvret == 0);

    ::close(client);
    sock.close();
    CHECK(sock.sendTo("x", from) == ECP_E_SOCKET_WRITE);
    std::string d;
    CHECK(sock.receive(d, from) == ECP_E_SOCKET_READ);

    highdescriptors(host);
    return test_result("test_udpsocket");
}
