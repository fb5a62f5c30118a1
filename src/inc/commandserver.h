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
#ifndef COMMANDSERVER_H
#define COMMANDSERVER_H

/*!
 * \file
 *
 * \brief The ECP HTTP server.
 *
 * Every request goes through the access checks first. Then the GET routes
 * return the device documents, and the POST command routes are forwarded
 * to the application EcpCommandHandler.
 */

#include <memory>
#include <mutex>
#include <string>

#include "deviceconfig.h"
#include "ecpemu.h"

struct MHDTransaction;
struct MHD_Daemon;

class CommandServer {
public:
    /*! \param handler if null, an EcpNullCommandHandler is used */
    CommandServer(const DeviceConfiguration& cfg,
                  std::shared_ptr<EcpCommandHandler> handler);
    ~CommandServer();
    CommandServer(const CommandServer&) = delete;
    CommandServer& operator=(const CommandServer&) = delete;

    /*!
     * \brief Start listening on hostIp:listenPort
     *
     * \return ECP_E_SUCCESS, ECP_E_INIT if already running, ECP_E_LISTEN
     */
    int start();

    /*! Stop the listener. Waits for the connection threads. Idempotent. */
    void stop();

    bool isRunning() const;

    /*! Compute the answer for a complete request. Sets mhdt->response
     *  and mhdt->httpstatus */
    void handle(MHDTransaction *mhdt);

private:
    typedef void (CommandServer::*RouteAction)(MHDTransaction *, const std::string&);
    struct Route {
        const char *path;
        /* If set, path is a prefix followed by a one-segment parameter */
        bool hasparam;
        int method;
        RouteAction action;
    };
    static const Route routes[];

    void rootDoc(MHDTransaction *mhdt, const std::string&);
    void deviceInfo(MHDTransaction *mhdt, const std::string&);
    void apps(MHDTransaction *mhdt, const std::string&);
    void activeApp(MHDTransaction *mhdt, const std::string&);
    void icon(MHDTransaction *mhdt, const std::string&);
    void noop(MHDTransaction *mhdt, const std::string&);
    void keyDown(MHDTransaction *mhdt, const std::string& key);
    void keyUp(MHDTransaction *mhdt, const std::string& key);
    void keyPress(MHDTransaction *mhdt, const std::string& key);
    void launch(MHDTransaction *mhdt, const std::string& appid);

    const DeviceConfiguration m_cfg;
    std::shared_ptr<EcpCommandHandler> m_handler;
    const std::string m_rootdoc;
    const std::string m_deviceinfo;
    mutable std::mutex m_mutex;
    struct MHD_Daemon *m_mhd{nullptr};
};

#endif /* COMMANDSERVER_H */
