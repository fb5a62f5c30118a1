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

#include "ecpdocs.h"

#include <sstream>
#include <string>

#include "deviceconfig.h"
#include "genut.h"

#define ECP_APP_COUNT 10

std::string ecp_root_description(const DeviceConfiguration& cfg)
{
    std::string usn = xmlQuote(cfg.usn());
    std::ostringstream str;
    str <<
        "<?xml version=\"1.0\" encoding=\"UTF-8\" ?>\n"
        "<root xmlns=\"urn:schemas-upnp-org:device-1-0\">\n"
        "  <specVersion>\n"
        "    <major>1</major>\n"
        "    <minor>0</minor>\n"
        "  </specVersion>\n"
        "  <device>\n"
        "  <deviceType>urn:roku-com:device:player:1-0</deviceType>\n"
        "  <friendlyName>" << usn << "</friendlyName>\n"
        "  <manufacturer>Roku</manufacturer>\n"
        "  <manufacturerURL>http://www.roku.com/</manufacturerURL>\n"
        "  <modelDescription>Emulated Roku</modelDescription>\n"
        "  <modelName>Roku 4</modelName>\n"
        "  <modelNumber>4400x</modelNumber>\n"
        "  <modelURL>http://www.roku.com/</modelURL>\n"
        "  <serialNumber>" << usn << "</serialNumber>\n"
        "  <UDN>uuid:" << cfg.deviceId() << "</UDN>\n"
        "  </device>\n"
        "</root>\n";
    return str.str();
}

std::string ecp_device_info(const DeviceConfiguration& cfg)
{
    std::string usn = xmlQuote(cfg.usn());
    std::ostringstream str;
    str <<
        "<device-info>\n"
        "  <udn>" << cfg.deviceId() << "</udn>\n"
        "  <serial-number>" << usn << "</serial-number>\n"
        "  <device-id>" << usn << "</device-id>\n"
        "  <vendor-name>Roku</vendor-name>\n"
        "  <model-number>4400X</model-number>\n"
        "  <model-name>Roku 4</model-name>\n"
        "  <model-region>US</model-region>\n"
        "  <supports-ethernet>true</supports-ethernet>\n"
        "  <wifi-mac>00:00:00:00:00:00</wifi-mac>\n"
        "  <ethernet-mac>00:00:00:00:00:00</ethernet-mac>\n"
        "  <network-type>ethernet</network-type>\n"
        "  <user-device-name>" << usn << "</user-device-name>\n"
        "  <software-version>7.5.0</software-version>\n"
        "  <software-build>09021</software-build>\n"
        "  <secure-device>true</secure-device>\n"
        "  <language>en</language>\n"
        "  <country>US</country>\n"
        "  <locale>en_US</locale>\n"
        "  <time-zone>US/Pacific</time-zone>\n"
        "  <time-zone-offset>-480</time-zone-offset>\n"
        "  <power-mode>PowerOn</power-mode>\n"
        "  <supports-suspend>false</supports-suspend>\n"
        "  <supports-find-remote>false</supports-find-remote>\n"
        "  <supports-audio-guide>false</supports-audio-guide>\n"
        "  <developer-enabled>false</developer-enabled>\n"
        "  <keyed-developer-id>0000000000000000000000000000000000000000</keyed-developer-id>\n"
        "  <search-enabled>false</search-enabled>\n"
        "  <voice-search-enabled>false</voice-search-enabled>\n"
        "  <notifications-enabled>false</notifications-enabled>\n"
        "  <notifications-first-use>false</notifications-first-use>\n"
        "  <supports-private-listening>false</supports-private-listening>\n"
        "  <headphones-connected>false</headphones-connected>\n"
        "</device-info>\n";
    return str.str();
}

static std::string make_app_list()
{
    std::ostringstream str;
    str << "<apps>\n";
    for (int i = 1; i <= ECP_APP_COUNT; i++) {
        str << "  <app id=\"" << i << "\" version=\"1.0.0\">Emulated App " <<
            i << "</app>\n";
    }
    str << "</apps>\n";
    return str.str();
}

const std::string& ecp_app_list()
{
    static const std::string apps = make_app_list();
    return apps;
}

const std::string& ecp_active_app()
{
    static const std::string active{
        "<active-app>\n"
        "  <app>Roku</app>\n"
        "</active-app>\n"};
    return active;
}

static const unsigned char placeholder_png[] = {
    0x89, 0x50, 0x4e, 0x47, 0x0d, 0x0a, 0x1a, 0x0a, 0x00, 0x00, 0x00, 0x0d,
    0x49, 0x48, 0x44, 0x52, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01,
    0x08, 0x04, 0x00, 0x00, 0x00, 0xb5, 0x1c, 0x0c, 0x02, 0x00, 0x00, 0x00,
    0x0b, 0x49, 0x44, 0x41, 0x54, 0x78, 0xda, 0x63, 0xfc, 0x5f, 0x0f, 0x00,
    0x02, 0x83, 0x01, 0x80, 0x34, 0xc3, 0xda, 0xa8, 0x00, 0x00, 0x00, 0x00,
    0x49, 0x45, 0x4e, 0x44, 0xae, 0x42, 0x60, 0x82
};

const std::string& ecp_placeholder_icon()
{
    static const std::string icon(reinterpret_cast<const char*>(placeholder_png),
                                  sizeof(placeholder_png));
    return icon;
}
