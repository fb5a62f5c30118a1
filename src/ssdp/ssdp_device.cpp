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
 * \brief SSDP device side: search replies and alive announcements.
 */

#include "ssdplib.h"

#include <cstring>
#include <sstream>
#include <string>

#include "ecpdebug.h"
#include "ecpemu.h"

int ssdp_reply_delay_bound_ms(const char *mx)
{
    static const int maxbound = (SSDP_MAX_DELAY + 1) * 1000;
    if (nullptr == mx || *mx == 0) {
        return maxbound;
    }
    // Any number of digits: only the remainder is needed
    int rem = 0;
    for (const char *cp = mx; *cp; cp++) {
        if (*cp < '0' || *cp > '9') {
            return maxbound;
        }
        rem = (rem * 10 + (*cp - '0')) % (SSDP_MAX_DELAY + 1);
    }
    return (rem + 1) * 1000;
}

std::chrono::milliseconds ssdp_reply_delay(const char *mx, std::mt19937& gen)
{
    std::uniform_int_distribution<int> dist(0, ssdp_reply_delay_bound_ms(mx) - 1);
    return std::chrono::milliseconds(dist(gen));
}

bool ssdp_is_ecp_search(const SSDPPacketParser& parser)
{
    if (parser.isresponse || nullptr == parser.method ||
        strcmp(parser.method, "M-SEARCH") || strcmp(parser.url, "*") ||
        strcmp(parser.version, "HTTP/1.1")) {
        return false;
    }
    return parser.st && (!strcmp(parser.st, SSDP_ALL_TARGET) ||
                         !strcmp(parser.st, ECP_SEARCH_TARGET));
}

std::string ssdp_search_response(const std::string& location, const std::string& usn)
{
    std::ostringstream str;
    str <<
        "HTTP/1.1 200 OK\r\n" <<
        "Cache-Control: max-age=" << SSDP_MAX_AGE << "\r\n" <<
        "ST: " << ECP_SEARCH_TARGET << "\r\n" <<
        "SERVER: " << ECP_SERVER_STRING << "\r\n" <<
        "Ext: \r\n" <<
        "Location: " << location << "\r\n" <<
        "USN: uuid:" << ECP_SEARCH_TARGET << ":" << usn << "\r\n" <<
        "\r\n";
    return str.str();
}

std::string ssdp_notify_alive(const std::string& location, const std::string& usn)
{
    std::ostringstream str;
    str <<
        "NOTIFY * HTTP/1.1\r\n" <<
        "HOST: " << SSDP_IP << ":" << SSDP_PORT << "\r\n" <<
        "Cache-Control: max-age=" << SSDP_MAX_AGE << "\r\n" <<
        "NT: upnp:rootdevice\r\n" <<
        "NTS: ssdp:alive\r\n" <<
        "Location: " << location << "\r\n" <<
        "USN: uuid:" << ECP_SEARCH_TARGET << ":" << usn << "\r\n" <<
        "\r\n";
    return str.str();
}

class AnnounceJobWorker : public JobWorker {
public:
    AnnounceJobWorker(DiscoveryEngine *engine, unsigned int generation)
        : m_engine(engine), m_generation(generation) {}
    void work() override {
        m_engine->announce(m_generation);
    }
private:
    DiscoveryEngine *m_engine;
    unsigned int m_generation;
};

class ReplyJobWorker : public JobWorker {
public:
    ReplyJobWorker(DiscoveryEngine *engine, unsigned int generation,
                   const NetIF::IPAddr& dest)
        : m_engine(engine), m_generation(generation), m_dest(dest) {}
    void work() override {
        m_engine->reply(m_generation, m_dest);
    }
private:
    DiscoveryEngine *m_engine;
    unsigned int m_generation;
    NetIF::IPAddr m_dest;
};

DiscoveryEngine::DiscoveryEngine(
    const DeviceConfiguration& cfg, std::unique_ptr<SsdpSocket> sock)
    : m_cfg(cfg), m_hostaddr(cfg.hostIp()), m_groupaddr(SSDP_IP),
      m_response(ssdp_search_response(cfg.location(), cfg.usn())),
      m_notify(ssdp_notify_alive(cfg.location(), cfg.usn())),
      m_sock(std::move(sock))
{
    if (!m_sock) {
        m_sock = std::make_unique<UdpSsdpSocket>();
    }
    m_groupaddr.setport(SSDP_PORT);
    std::random_device rd;
    m_rng.seed(rd());
}

DiscoveryEngine::~DiscoveryEngine()
{
    stop();
    m_timer.shutdown();
}

void DiscoveryEngine::seed(uint32_t value)
{
    std::scoped_lock lck(m_mutex);
    m_rng.seed(value);
}

DiscoveryEngine::State DiscoveryEngine::state() const
{
    std::scoped_lock lck(m_mutex);
    return m_state;
}

// Wait for the receive thread and release the socket. m_lifemutex held.
void DiscoveryEngine::joinAndClose()
{
    if (m_recvthread.joinable()) {
        {
            // The receive thread may be closing the socket
            std::scoped_lock lck(m_mutex);
            m_sock->wakeup();
        }
        m_recvthread.join();
    }
    if (m_sockopen) {
        m_sock->close();
        m_sockopen = false;
    }
}

int DiscoveryEngine::start()
{
    std::scoped_lock lifelck(m_lifemutex);
    if (state() == State::Listening) {
        EcpPrintf(ECP_ERROR, SSDP, __FILE__, __LINE__,
                  "DiscoveryEngine::start: already listening\n");
        return ECP_E_INIT;
    }
    // The receive thread may have exited on a socket error
    joinAndClose();

    int ret = m_sock->open(m_hostaddr, m_cfg.bindMulticastWildcard());
    if (ret != ECP_E_SUCCESS) {
        EcpPrintf(ECP_CRITICAL, SSDP, __FILE__, __LINE__,
                  "DiscoveryEngine::start: socket setup failed: %d\n", ret);
        m_sock->close();
        return ret;
    }
    m_sockopen = true;

    unsigned int generation;
    {
        std::scoped_lock lck(m_mutex);
        m_state = State::Listening;
        generation = ++m_generation;
        EcpPrintf(ECP_INFO, SSDP, __FILE__, __LINE__,
                  "DiscoveryEngine: listening, location %s usn %s\n",
                  m_cfg.location().c_str(), m_cfg.usn().c_str());
        sendLocked(m_notify, m_groupaddr);
        m_timer.schedule(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                m_cfg.announceInterval()),
            &m_announceId, std::make_unique<AnnounceJobWorker>(this, generation));
    }
    m_recvthread = std::thread(&DiscoveryEngine::receiveLoop, this, generation);
    return ECP_E_SUCCESS;
}

void DiscoveryEngine::stop()
{
    std::scoped_lock lifelck(m_lifemutex);
    {
        std::scoped_lock lck(m_mutex);
        if (m_state == State::Listening) {
            EcpPrintf(ECP_INFO, SSDP, __FILE__, __LINE__,
                      "DiscoveryEngine: stopping\n");
            m_state = State::Stopped;
            ++m_generation;
        }
        if (m_announceId != -1) {
            m_timer.remove(m_announceId);
            m_announceId = -1;
        }
    }
    joinAndClose();
}

void DiscoveryEngine::announce(unsigned int generation)
{
    std::scoped_lock lck(m_mutex);
    if (m_state != State::Listening || generation != m_generation) {
        return;
    }
    EcpPrintf(ECP_DEBUG, SSDP, __FILE__, __LINE__,
              "DiscoveryEngine: periodic announcement\n");
    sendLocked(m_notify, m_groupaddr);
    m_timer.schedule(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            m_cfg.announceInterval()),
        &m_announceId, std::make_unique<AnnounceJobWorker>(this, generation));
}

void DiscoveryEngine::reply(unsigned int generation, const NetIF::IPAddr& dest)
{
    std::scoped_lock lck(m_mutex);
    if (m_state != State::Listening || generation != m_generation) {
        EcpPrintf(ECP_DEBUG, SSDP, __FILE__, __LINE__,
                  "DiscoveryEngine: reply to %s suppressed, engine stopped\n",
                  dest.strhostport().c_str());
        return;
    }
    sendLocked(m_response, dest);
}

// m_mutex held
void DiscoveryEngine::sendLocked(const std::string& data, const NetIF::IPAddr& dest)
{
    EcpPrintf(ECP_ALL, SSDP, __FILE__, __LINE__,
              ">>> SSDP SEND to %s >>>\n%s\n", dest.strhostport().c_str(),
              data.c_str());
    if (m_sock->sendTo(data, dest) != ECP_E_SUCCESS) {
        EcpPrintf(ECP_ERROR, SSDP, __FILE__, __LINE__,
                  "DiscoveryEngine: send to %s failed\n",
                  dest.strhostport().c_str());
    }
}

void DiscoveryEngine::handleDatagram(
    const std::string& data, const NetIF::IPAddr& from, unsigned int generation)
{
    EcpPrintf(ECP_ALL, SSDP, __FILE__, __LINE__,
              "\nSSDP message from host %s --------------------\n"
              "%s\n"
              "End of received data -----------------------------\n",
              from.strhostport().c_str(), data.c_str());

    SSDPPacketParser parser(data);
    if (!parser.parse()) {
        EcpPrintf(ECP_DEBUG, SSDP, __FILE__, __LINE__,
                  "SSDP parser error for packet from %s\n", from.straddr().c_str());
        return;
    }
    if (EcpGetDebugFile(ECP_ALL, SSDP)) {
        std::ostringstream str;
        parser.dump(str);
        EcpPrintf(ECP_ALL, SSDP, __FILE__, __LINE__, "%s", str.str().c_str());
    }
    if (!ssdp_is_ecp_search(parser)) {
        EcpPrintf(ECP_DEBUG, SSDP, __FILE__, __LINE__,
                  "SSDP: ignoring %s %s from %s\n",
                  parser.isresponse ? "response" : parser.method,
                  parser.st ? parser.st : (parser.nt ? parser.nt : "(no target)"),
                  from.straddr().c_str());
        return;
    }

    std::scoped_lock lck(m_mutex);
    if (m_state != State::Listening || generation != m_generation) {
        return;
    }
    auto delay = ssdp_reply_delay(parser.mx, m_rng);
    EcpPrintf(ECP_DEBUG, SSDP, __FILE__, __LINE__,
              "SSDP: M-SEARCH ST %s MX %s from %s, replying in %d ms\n",
              parser.st, parser.mx ? parser.mx : "(none)",
              from.strhostport().c_str(), static_cast<int>(delay.count()));
    m_timer.schedule(delay, nullptr,
                     std::make_unique<ReplyJobWorker>(this, generation, from));
}

void DiscoveryEngine::receiveLoop(unsigned int generation)
{
    std::string data;
    NetIF::IPAddr from;
    for (;;) {
        int ret = m_sock->receive(data, from);
        if (ret < 0) {
            // Socket closed or broken: nothing more can be done with it
            std::scoped_lock lck(m_mutex);
            if (m_state == State::Listening && generation == m_generation) {
                EcpPrintf(ECP_ERROR, SSDP, __FILE__, __LINE__,
                          "DiscoveryEngine: socket error, stopping\n");
                m_state = State::Stopped;
                ++m_generation;
                if (m_announceId != -1) {
                    m_timer.remove(m_announceId);
                    m_announceId = -1;
                }
                // Sends check the state under this lock, none can follow
                m_sock->close();
                m_sockopen = false;
            }
            return;
        }
        if (ret == 0) {
            std::scoped_lock lck(m_mutex);
            if (m_state != State::Listening || generation != m_generation) {
                return;
            }
            continue;
        }
        handleDatagram(data, from, generation);
    }
}
