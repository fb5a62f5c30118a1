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

#include "deviceconfig.h"
#include "ecpemu.h"
#include "testutil.h"

static void configuration()
{
    EcpDeviceConfig in;
    in.usn = "ABC123";
    in.hostIp = "192.168.1.10";
    in.listenPort = 8060;
    {
        DeviceConfiguration cfg(in);
        CHECK(cfg.status() == ECP_E_SUCCESS);
        CHECK_STREQ(cfg.advertiseIp(), "192.168.1.10");
        CHECK(cfg.advertisePort() == 8060);
        CHECK_STREQ(cfg.location(), "http://192.168.1.10:8060/");
        CHECK_STREQ(cfg.deviceId(), "5d3850a0-aa83-5501-b94c-defd9c1ba43c");
        CHECK(cfg.announceInterval().count() == 300);
        // Duplicates removed
        CHECK(cfg.allowedHosts().size() == 2);
    }
    {
        EcpDeviceConfig c(in);
        c.advertiseIp = "10.0.0.2";
        c.advertisePort = 18060;
        DeviceConfiguration cfg(c);
        CHECK(cfg.status() == ECP_E_SUCCESS);
        CHECK_STREQ(cfg.location(), "http://10.0.0.2:18060/");
        CHECK(cfg.allowedHosts().size() == 4);
    }
    {
        EcpDeviceConfig c(in);
        c.usn.clear();
        CHECK(DeviceConfiguration(c).status() == ECP_E_INVALID_PARAM);
        EmulatedDevice dev(nullptr, c);
        CHECK(dev.start() == ECP_E_INVALID_PARAM);
        CHECK(!dev.isRunning());
        dev.stop();
    }
    {
        EcpDeviceConfig c(in);
        c.hostIp = "not.an.address";
        CHECK(DeviceConfiguration(c).status() == ECP_E_INVALID_PARAM);
        c.hostIp = "fe80::1";
        CHECK(DeviceConfiguration(c).status() == ECP_E_INVALID_PARAM);
    }
    {
        EcpDeviceConfig c(in);
        c.advertiseIp = "bogus";
        CHECK(DeviceConfiguration(c).status() == ECP_E_INVALID_PARAM);
    }
    {
        EcpDeviceConfig c(in);
        c.announceIntervalSecs = 0;
        CHECK(DeviceConfiguration(c).status() == ECP_E_INVALID_PARAM);
    }
}

static int lifecycle()
{
    EcpDeviceConfig in;
    in.usn = "ABC123";
    in.hostIp = "127.0.0.1";
    in.listenPort = 0;
    in.bindMulticast = 1;
    EmulatedDevice dev(nullptr, in);
    CHECK(dev.config().status() == ECP_E_SUCCESS);
    CHECK(dev.config().listenPort() >= ECP_DEFAULT_PORT);
    int ret = dev.start();
    if (ret == ECP_E_SOCKET_ERROR || ret == ECP_E_SOCKET_BIND ||
        ret == ECP_E_LISTEN || ret == ECP_E_OUTOF_SOCKET) {
        fprintf(stderr, "test_emulateddevice: can't start (%d), skipping\n", ret);
        CHECK(!dev.isRunning());
        return TEST_SKIP;
    }
    CHECK(ret == ECP_E_SUCCESS);
    CHECK(dev.isRunning());
    CHECK(dev.start() == ECP_E_INIT);
    dev.stop();
    CHECK(!dev.isRunning());
    dev.stop();
    // Restart
    CHECK(dev.start() == ECP_E_SUCCESS);
    CHECK(dev.isRunning());
    return 0;
}

int main(int, char **)
{
    configuration();
    int ret = lifecycle();
    if (ret == TEST_SKIP && test_failures == 0) {
        return TEST_SKIP;
    }
    return test_result("test_emulateddevice");
}
