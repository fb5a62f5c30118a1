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
 * \brief libmicrohttpd glue and request routing for the ECP interface.
 */

#include "commandserver.h"

#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <string>

#include <sys/types.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <netinet/in.h>

#include <microhttpd.h>

#include "accessguard.h"
#include "ecpdebug.h"
#include "ecpdocs.h"
#include "httputils.h"
#include "netif.h"
#include "smallut.h"
#include "statcodes.h"

#if MHD_VERSION < 0x00095300
#define MHD_USE_INTERNAL_POLLING_THREAD MHD_USE_SELECT_INTERNALLY
#endif

/* Connection idle timeout, seconds */
#define ECP_HTTP_TIMEOUT 30
/* We have no use for request bodies, just don't store more than this */
#define ECP_MAX_POSTDATA 65536

static MHD_Result headers_cb(void *cls, enum MHD_ValueKind, const char *k, const char *value)
{
    auto mhtt = static_cast<MHDTransaction *>(cls);
    std::string key(k);
    stringtolower(key);
    // It is always possible to combine multiple identically named headers
    // name into one comma separated list. See HTTP 1.1 section 4.2
    auto it = mhtt->headers.find(key);
    if (it != mhtt->headers.end()) {
        it->second = it->second + "," + value;
    } else {
        mhtt->headers[key] = value;
    }
    EcpPrintf(ECP_ALL, MSERV, __FILE__, __LINE__,
              "commandserver:req_header: [%s: %s]\n", key.c_str(), value);
    return MHD_YES;
}

static void request_completed_cb(
    void *, struct MHD_Connection *,
    void **con_cls, enum MHD_RequestTerminationCode)
{
    if (nullptr == con_cls)
        return;
    auto mhdt = static_cast<MHDTransaction *>(*con_cls);
    delete mhdt;
    *con_cls = nullptr;
}

static MHD_Result answer_to_connection(
    void *cls, struct MHD_Connection *conn,
    const char *url, const char *method, const char *version,
    const char *upload_data, size_t *upload_data_size,
    void **con_cls)
{
    auto server = static_cast<CommandServer *>(cls);

    if (nullptr == *con_cls) {
        EcpPrintf(ECP_DEBUG, MSERV, __FILE__, __LINE__,
                  "answer_to_connection: url [%s] method [%s] version [%s]\n",
                  url, method, version);
        // First call, allocate and set context, get the headers, etc.
        auto mhdt = new MHDTransaction;
        *con_cls = mhdt;
        MHD_get_connection_values(conn, MHD_HEADER_KIND, headers_cb, mhdt);
        const union MHD_ConnectionInfo *info =
            MHD_get_connection_info(conn, MHD_CONNECTION_INFO_CLIENT_ADDRESS);
        if (info && info->client_addr) {
            NetIF::IPAddr claddr(info->client_addr, false);
            claddr.copyToStorage(&mhdt->client_address);
        }
        mhdt->conn = conn;
        mhdt->url = url;
        mhdt->version = version;
        mhdt->method = httpmethod_str2enum(method);
        return MHD_YES;
    }

    auto mhdt = static_cast<MHDTransaction *>(*con_cls);
    if (*upload_data_size) {
        if (mhdt->postdata.size() < ECP_MAX_POSTDATA) {
            mhdt->postdata.append(upload_data, *upload_data_size);
        }
        *upload_data_size = 0;
        return MHD_YES;
    }

    /* We now have the full request */
    server->handle(mhdt);

    if (nullptr == mhdt->response) {
        EcpPrintf(ECP_ERROR, MSERV, __FILE__, __LINE__,
                  "answer_to_connection: NULL response !!\n");
        return MHD_NO;
    }

    MHD_Result ret = MHD_queue_response(conn, mhdt->httpstatus, mhdt->response);
    MHD_destroy_response(mhdt->response);
    mhdt->response = nullptr;
    return ret;
}

static void mhdlogger(void *, const char *fmt, va_list ap)
{
    char buf[1024];
    vsnprintf(buf, 1023, fmt, ap);
    buf[1023] = 0;
    EcpPrintf(ECP_DEBUG, MSERV, __FILE__, __LINE__, "microhttpd: %s\n", buf);
}

const CommandServer::Route CommandServer::routes[] = {
    {"/", false, HTTPMETHOD_GET, &CommandServer::rootDoc},
    {"/query/device-info", false, HTTPMETHOD_GET, &CommandServer::deviceInfo},
    {"/query/apps", false, HTTPMETHOD_GET, &CommandServer::apps},
    {"/query/active-app", false, HTTPMETHOD_GET, &CommandServer::activeApp},
    {"/query/icon/", true, HTTPMETHOD_GET, &CommandServer::icon},
    {"/input", false, HTTPMETHOD_POST, &CommandServer::noop},
    {"/search", false, HTTPMETHOD_POST, &CommandServer::noop},
    {"/keydown/", true, HTTPMETHOD_POST, &CommandServer::keyDown},
    {"/keyup/", true, HTTPMETHOD_POST, &CommandServer::keyUp},
    {"/keypress/", true, HTTPMETHOD_POST, &CommandServer::keyPress},
    {"/launch/", true, HTTPMETHOD_POST, &CommandServer::launch},
};

CommandServer::CommandServer(
    const DeviceConfiguration& cfg, std::shared_ptr<EcpCommandHandler> handler)
    : m_cfg(cfg), m_handler(std::move(handler)),
      m_rootdoc(ecp_root_description(cfg)), m_deviceinfo(ecp_device_info(cfg))
{
    if (!m_handler) {
        m_handler = std::make_shared<EcpNullCommandHandler>();
    }
}

CommandServer::~CommandServer()
{
    stop();
}

int CommandServer::start()
{
    std::scoped_lock lck(m_mutex);
    if (m_mhd) {
        EcpPrintf(ECP_ERROR, MSERV, __FILE__, __LINE__,
                  "CommandServer: ALREADY RUNNING !\n");
        return ECP_E_INIT;
    }

    NetIF::IPAddr bindaddr(m_cfg.hostIp());
    if (!bindaddr.ok()) {
        return ECP_E_INVALID_PARAM;
    }
    bindaddr.setport(m_cfg.listenPort());
    struct sockaddr_storage ss;
    bindaddr.copyToStorage(&ss);

    unsigned int mhdflags = MHD_USE_THREAD_PER_CONNECTION |
        MHD_USE_INTERNAL_POLLING_THREAD |
        MHD_USE_DEBUG;

    m_mhd = MHD_start_daemon(
        mhdflags, m_cfg.listenPort(),
        nullptr, nullptr, /* Accept policy callback and arg */
        &answer_to_connection, this, /* Request handler and arg */
        MHD_OPTION_SOCK_ADDR, reinterpret_cast<struct sockaddr *>(&ss),
        MHD_OPTION_NOTIFY_COMPLETED, request_completed_cb, nullptr,
        MHD_OPTION_CONNECTION_TIMEOUT, static_cast<unsigned int>(ECP_HTTP_TIMEOUT),
        MHD_OPTION_EXTERNAL_LOGGER, mhdlogger, nullptr,
        MHD_OPTION_END);
    if (nullptr == m_mhd) {
        EcpPrintf(ECP_CRITICAL, MSERV, __FILE__, __LINE__,
                  "MHD_start_daemon failed for %s\n", bindaddr.strhostport().c_str());
        return ECP_E_LISTEN;
    }
    EcpPrintf(ECP_INFO, MSERV, __FILE__, __LINE__,
              "CommandServer: listening on %s\n", bindaddr.strhostport().c_str());
    return ECP_E_SUCCESS;
}

void CommandServer::stop()
{
    std::scoped_lock lck(m_mutex);
    if (m_mhd) {
        MHD_stop_daemon(m_mhd);
        m_mhd = nullptr;
        EcpPrintf(ECP_INFO, MSERV, __FILE__, __LINE__,
                  "CommandServer: stopped\n");
    }
}

bool CommandServer::isRunning() const
{
    std::scoped_lock lck(m_mutex);
    return m_mhd != nullptr;
}

void CommandServer::handle(MHDTransaction *mhdt)
{
    NetIF::IPAddr claddr(reinterpret_cast<struct sockaddr *>(&mhdt->client_address));
    AccessDecision access = ecp_authorize(mhdt->header("host"), claddr,
                                          m_cfg.allowedHosts());
    if (!access.allowed()) {
        http_SendStatusResponse(mhdt, HTTP_FORBIDDEN, access.reason);
        return;
    }

    // HEAD is answered as GET, microhttpd drops the body
    int method = mhdt->method == HTTPMETHOD_HEAD ? HTTPMETHOD_GET : mhdt->method;
    const Route *pathmatch{nullptr};
    std::string param;
    for (const auto& route : routes) {
        if (route.hasparam) {
            // The parameter is one non-empty path segment
            size_t plen = strlen(route.path);
            if (!beginswith(mhdt->url, route.path) ||
                mhdt->url.size() == plen ||
                mhdt->url.find('/', plen) != std::string::npos) {
                continue;
            }
        } else if (mhdt->url != route.path) {
            continue;
        }
        pathmatch = &route;
        if (route.method == method) {
            param = route.hasparam ? mhdt->url.substr(strlen(route.path)) : std::string();
            EcpPrintf(ECP_DEBUG, MSERV, __FILE__, __LINE__,
                      "CommandServer: %s %s from %s\n",
                      method == HTTPMETHOD_GET ? "GET" : "POST",
                      mhdt->url.c_str(), claddr.straddr().c_str());
            (this->*route.action)(mhdt, param);
            return;
        }
    }

    if (nullptr == pathmatch) {
        EcpPrintf(ECP_INFO, MSERV, __FILE__, __LINE__,
                  "CommandServer: no route for %s\n", mhdt->url.c_str());
        http_SendStatusResponse(mhdt, HTTP_NOT_FOUND);
        return;
    }
    EcpPrintf(ECP_INFO, MSERV, __FILE__, __LINE__,
              "CommandServer: bad method for %s\n", mhdt->url.c_str());
    if (http_SendStatusResponse(mhdt, HTTP_METHOD_NOT_ALLOWED) == ECP_E_SUCCESS) {
        MHD_add_response_header(mhdt->response, "Allow",
                                pathmatch->method == HTTPMETHOD_GET ?
                                "GET, HEAD" : "POST");
    }
}

void CommandServer::rootDoc(MHDTransaction *mhdt, const std::string&)
{
    http_SendDataResponse(mhdt, HTTP_OK, m_rootdoc, "text/xml");
}

void CommandServer::deviceInfo(MHDTransaction *mhdt, const std::string&)
{
    http_SendDataResponse(mhdt, HTTP_OK, m_deviceinfo, "text/xml");
}

void CommandServer::apps(MHDTransaction *mhdt, const std::string&)
{
    http_SendDataResponse(mhdt, HTTP_OK, ecp_app_list(), "text/xml");
}

void CommandServer::activeApp(MHDTransaction *mhdt, const std::string&)
{
    http_SendDataResponse(mhdt, HTTP_OK, ecp_active_app(), "text/xml");
}

void CommandServer::icon(MHDTransaction *mhdt, const std::string&)
{
    http_SendDataResponse(mhdt, HTTP_OK, ecp_placeholder_icon(), "image/png");
}

void CommandServer::noop(MHDTransaction *mhdt, const std::string&)
{
    http_SendDataResponse(mhdt, HTTP_OK, std::string(), nullptr);
}

void CommandServer::keyDown(MHDTransaction *mhdt, const std::string& key)
{
    m_handler->onKeyDown(m_cfg.usn(), key);
    http_SendDataResponse(mhdt, HTTP_OK, std::string(), nullptr);
}

void CommandServer::keyUp(MHDTransaction *mhdt, const std::string& key)
{
    m_handler->onKeyUp(m_cfg.usn(), key);
    http_SendDataResponse(mhdt, HTTP_OK, std::string(), nullptr);
}

void CommandServer::keyPress(MHDTransaction *mhdt, const std::string& key)
{
    m_handler->onKeyPress(m_cfg.usn(), key);
    http_SendDataResponse(mhdt, HTTP_OK, std::string(), nullptr);
}

void CommandServer::launch(MHDTransaction *mhdt, const std::string& appid)
{
    m_handler->launch(m_cfg.usn(), appid);
    http_SendDataResponse(mhdt, HTTP_OK, std::string(), nullptr);
}
