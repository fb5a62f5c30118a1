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
#ifndef _SSDPPARSER_H_
#define _SSDPPARSER_H_

#include <cstddef>
#include <iostream>
#include <string>

// Simple parser for an SSDP request or response packet.
//
// Lines may be terminated by CRLF or by a bare LF. The empty line
// which ends the headers is optional, anything after it is ignored.
class SSDPPacketParser {
public:
    // The data is copied.
    SSDPPacketParser(const char *packet, size_t len)
        : m_packet(packet, len) {}
    explicit SSDPPacketParser(const std::string& packet)
        : m_packet(packet) {}

    SSDPPacketParser(const SSDPPacketParser&) = delete;
    SSDPPacketParser& operator=(const SSDPPacketParser&) = delete;

    // Returns false if the first line or a header line is malformed.
    bool parse();
    void dump(std::ostream& os) const;

    // Results. After parsing, the set fields point into our copy of the
    // packet, with white space trimmed. Absent headers are nullptr.
    bool isresponse{false};
    const char *cache_control{nullptr};
    bool  ext{false};
    const char *host{nullptr};
    const char *location{nullptr};
    const char *man{nullptr};
    const char *method{nullptr};
    const char *mx{nullptr};
    const char *nt{nullptr};
    const char *nts{nullptr};
    const char *server{nullptr};
    const char *st{nullptr};
    const char *status{nullptr};
    const char *url{nullptr};
    const char *user_agent{nullptr};
    const char *usn{nullptr};
    // "HTTP/1.1"
    const char *version{nullptr};

private:
    static char *trim(char *cp, char *end);
    bool parseFirstLine(char *line);
    std::string m_packet;
};

#endif /* _SSDPPARSER_H_ */
