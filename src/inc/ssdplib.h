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
#ifndef SSDPLIB_H
#define SSDPLIB_H

/*!
 * \file
 *
 * \brief SSDP discovery for the emulated device: answers M-SEARCH requests
 * for our search target, and periodically announces the device on the
 * multicast group.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>

#include "deviceconfig.h"
#include "netif.h"
#include "ssdpparser.h"
#include "TimerThread.h"

/* Standard defined values for the UPnP multicast address */
#define SSDP_IP   "239.255.255.250"
#define SSDP_PORT 1900

/* Advertised max-age, also the default announcement period */
#define SSDP_MAX_AGE 300
/* Largest MX hint we honour. Replies are spread over (MX % (MAX+1)) + 1
   seconds */
#define SSDP_MAX_DELAY 5

#define SSDP_ALL_TARGET "ssdp:all"
#define ECP_SEARCH_TARGET "roku:ecp"
#define ECP_SERVER_STRING "Roku/12.0.0 UPnP/1.0 Roku/12.0.0"

/*!
 * \brief Transport used by the DiscoveryEngine.
 *
 * The engine calls receive() from its receive thread, and open(),
 * sendTo(), wakeup() and close() from other threads, never concurrently
 * with each other.
 */
class SsdpSocket {
public:
    virtual ~SsdpSocket() = default;

    /*!
     * \brief Create the socket, bind the SSDP port and join the multicast
     * group on the hostaddr interface.
     *
     * \return ECP_E_SUCCESS, or ECP_E_OUTOF_SOCKET, ECP_E_SOCKET_BIND,
     *    ECP_E_SOCKET_ERROR. Nothing stays open on error.
     */
    virtual int open(const NetIF::IPAddr& hostaddr, bool bindwildcard) = 0;

    /*!
     * \brief Wait for a datagram.
     *
     * \return the datagram size (> 0), 0 if interrupted by wakeup(), or
     *    ECP_E_SOCKET_READ if the socket is unusable.
     */
    virtual int receive(std::string& data, NetIF::IPAddr& from) = 0;

    /*! \return ECP_E_SUCCESS or ECP_E_SOCKET_WRITE */
    virtual int sendTo(const std::string& data, const NetIF::IPAddr& dest) = 0;

    /*! Make a blocked or the next receive() call return 0 */
    virtual void wakeup() = 0;

    virtual void close() = 0;
};

/*!
 * \brief The real thing: UDP socket on port 1900, select() loop with a
 * local stop socket for wakeup().
 */
class UdpSsdpSocket : public SsdpSocket {
public:
    UdpSsdpSocket() = default;
    ~UdpSsdpSocket() override;
    UdpSsdpSocket(const UdpSsdpSocket&) = delete;
    UdpSsdpSocket& operator=(const UdpSsdpSocket&) = delete;

    int open(const NetIF::IPAddr& hostaddr, bool bindwildcard) override;
    int receive(std::string& data, NetIF::IPAddr& from) override;
    int sendTo(const std::string& data, const NetIF::IPAddr& dest) override;
    void wakeup() override;
    void close() override;

private:
    int m_sock{-1};
    int m_stopSock{-1};
    uint16_t m_stopPort{0};
};

/*!
 * \brief Upper bound (exclusive) for the reply delay, in milliseconds.
 *
 * A non-negative integer MX value gives ((MX % (SSDP_MAX_DELAY+1)) + 1)
 * seconds. Anything else (absent, empty, negative, not a number) gives
 * the largest bound, (SSDP_MAX_DELAY + 1) seconds.
 */
int ssdp_reply_delay_bound_ms(const char *mx);

/*! Draw a reply delay uniformly in [0, ssdp_reply_delay_bound_ms(mx)) */
std::chrono::milliseconds ssdp_reply_delay(const char *mx, std::mt19937& gen);

/*! True for "M-SEARCH * HTTP/1.1" with ST exactly ssdp:all or roku:ecp */
bool ssdp_is_ecp_search(const SSDPPacketParser& parser);

/*! Unicast answer to a matching M-SEARCH */
std::string ssdp_search_response(const std::string& location,
                                 const std::string& usn);

/*! ssdp:alive announcement for the multicast group */
std::string ssdp_notify_alive(const std::string& location,
                              const std::string& usn);

/*!
 * \brief SSDP responder and announcer for one device.
 *
 * States: Stopped (initial and final) and Listening. Replies and
 * announcements are run by a private timer thread, and are only sent if
 * the engine is still Listening in the same start generation when they
 * fire. No send happens after stop() returns.
 */
class DiscoveryEngine {
public:
    enum class State {Stopped, Listening};

    /*!
     * \param cfg resolved device configuration. Must have status() ==
     *    ECP_E_SUCCESS.
     * \param sock transport. nullptr: use a UdpSsdpSocket
     */
    explicit DiscoveryEngine(const DeviceConfiguration& cfg,
                             std::unique_ptr<SsdpSocket> sock = nullptr);
    ~DiscoveryEngine();
    DiscoveryEngine(const DiscoveryEngine&) = delete;
    DiscoveryEngine& operator=(const DiscoveryEngine&) = delete;

    /*! Reseed the reply delay generator (for reproducible tests) */
    void seed(uint32_t value);

    /*!
     * \brief Open the socket, announce, arm the periodic announcement and
     * start receiving.
     *
     * \return ECP_E_SUCCESS, ECP_E_INIT if already Listening, or the
     *    socket open() error.
     */
    int start();

    /*! Stop listening and invalidate all pending work. Never fails,
     *  can be called any number of times. */
    void stop();

    State state() const;

    /* Called by the timer jobs */
    void announce(unsigned int generation);
    void reply(unsigned int generation, const NetIF::IPAddr& dest);

private:
    void receiveLoop(unsigned int generation);
    void handleDatagram(const std::string& data, const NetIF::IPAddr& from,
                        unsigned int generation);
    void sendLocked(const std::string& data, const NetIF::IPAddr& dest);
    void joinAndClose();

    DeviceConfiguration m_cfg;
    NetIF::IPAddr m_hostaddr;
    NetIF::IPAddr m_groupaddr;
    const std::string m_response;
    const std::string m_notify;
    std::unique_ptr<SsdpSocket> m_sock;
    // Cleared by the receive thread on a socket error, read by
    // start()/stop() after joining it
    bool m_sockopen{false};

    // Serializes start() and stop()
    std::mutex m_lifemutex;
    // Guards the following
    mutable std::mutex m_mutex;
    State m_state{State::Stopped};
    unsigned int m_generation{0};
    int m_announceId{-1};
    std::mt19937 m_rng;

    std::thread m_recvthread;
    TimerThread m_timer;
};

#endif /* SSDPLIB_H */
