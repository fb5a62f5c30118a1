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

/* Run one emulated device until interrupted, logging the remote commands. */

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>
#include <unistd.h>

#include <memory>
#include <string>

#include "ecpemu.h"
#include "ecpdebug.h"
#include "deviceconfig.h"

static volatile sig_atomic_t gotsig;

static struct option long_options[] = {
    {"usn", required_argument, 0, 'u'},
    {"host", required_argument, 0, 'h'},
    {"port", required_argument, 0, 'p'},
    {"advertise-ip", required_argument, 0, 'a'},
    {"advertise-port", required_argument, 0, 'P'},
    {"bind-wildcard", required_argument, 0, 'w'},
    {"interval", required_argument, 0, 'i'},
    {"loglevel", required_argument, 0, 'l'},
    {"logfile", required_argument, 0, 'f'},
    {"version", no_argument, 0, 'v'},
    {0, 0, 0, 0}
};

static char *thisprog;
static char usage [] =
    "-u, --usn <serial>         : device serial (required)\n"
    "-h, --host <ipv4>          : local address (required)\n"
    "-p, --port <port>          : HTTP port, 0 for automatic. Default 8060\n"
    "-a, --advertise-ip <ipv4>  : address published in SSDP messages\n"
    "-P, --advertise-port <port>: port published in SSDP messages\n"
    "-w, --bind-wildcard <0|1>  : bind the SSDP socket to the wildcard address\n"
    "-i, --interval <secs>      : ssdp:alive interval. Default 300\n"
    "-l, --loglevel <0-5>       : log verbosity. Default 3\n"
    "-f, --logfile <path>       : log to file instead of stderr\n"
    "-v, --version              : print version and exit\n"
    ;

static void
Usage(void)
{
    fprintf(stderr, "%s: usage:\n%s", thisprog, usage);
    exit(1);
}

class LoggingHandler : public EcpCommandHandler {
public:
    void onKeyDown(const std::string& usn, const std::string& key) override {
        EcpPrintf(ECP_INFO, API, __FILE__, __LINE__,
                  "[%s] keydown %s\n", usn.c_str(), key.c_str());
    }
    void onKeyUp(const std::string& usn, const std::string& key) override {
        EcpPrintf(ECP_INFO, API, __FILE__, __LINE__,
                  "[%s] keyup %s\n", usn.c_str(), key.c_str());
    }
    void onKeyPress(const std::string& usn, const std::string& key) override {
        EcpPrintf(ECP_INFO, API, __FILE__, __LINE__,
                  "[%s] keypress %s\n", usn.c_str(), key.c_str());
    }
    void launch(const std::string& usn, const std::string& appid) override {
        EcpPrintf(ECP_INFO, API, __FILE__, __LINE__,
                  "[%s] launch %s\n", usn.c_str(), appid.c_str());
    }
};

static void sighandler(int)
{
    gotsig = 1;
}

static int portarg(const char *s)
{
    char *endp;
    long l = strtol(s, &endp, 10);
    if (*s == 0 || *endp != 0 || l < 0 || l > 65535) {
        fprintf(stderr, "%s: bad port value [%s]\n", thisprog, s);
        Usage();
    }
    return static_cast<int>(l);
}

int main(int argc, char *argv[])
{
    thisprog = argv[0];
    EcpDeviceConfig cfg;
    int loglevel = ECP_DEFAULT_LOG_LEVEL;
    std::string logfile;
    int ret;
    while ((ret = getopt_long(argc, argv, "u:h:p:a:P:w:i:l:f:v",
                              long_options, NULL)) != -1) {
        switch (ret) {
        case 'u': cfg.usn = optarg; break;
        case 'h': cfg.hostIp = optarg; break;
        case 'p': cfg.listenPort = static_cast<uint16_t>(portarg(optarg)); break;
        case 'a': cfg.advertiseIp = optarg; break;
        case 'P': cfg.advertisePort = static_cast<uint16_t>(portarg(optarg)); break;
        case 'w': cfg.bindMulticast = atoi(optarg) ? 1 : 0; break;
        case 'i': cfg.announceIntervalSecs = atoi(optarg); break;
        case 'l': loglevel = atoi(optarg); break;
        case 'f': logfile = optarg; break;
        case 'v': printf("ecpemud %s\n", ECP_VERSION_STRING); return 0;
        default: Usage();
        }
    }
    if (optind != argc || cfg.usn.empty() || cfg.hostIp.empty()) {
        Usage();
    }
    if (loglevel < ECP_CRITICAL || loglevel > ECP_ALL) {
        Usage();
    }

    EcpSetLogFileNames(logfile.c_str(), "");
    EcpSetLogLevel(static_cast<Ecp_LogLevel>(loglevel));

    EmulatedDevice device(std::make_shared<LoggingHandler>(), cfg);
    ret = device.start();
    if (ret != ECP_E_SUCCESS) {
        fprintf(stderr, "%s: start failed: error %d\n", thisprog, ret);
        return 1;
    }
    fprintf(stderr, "%s: device %s at %s\n", thisprog, cfg.usn.c_str(),
            device.config().location().c_str());

    signal(SIGINT, sighandler);
    signal(SIGTERM, sighandler);
    while (!gotsig) {
        pause();
    }

    device.stop();
    EcpCloseLog();
    return 0;
}
