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

#include "ssdpparser.h"

#include <cstring>
#include <iostream>
#include <string>
#include <strings.h>

#include "ecpdebug.h"

#define NULLSTR(X) ((X) ? (X) : "(null)")

// Trim white space at both ends of [cp, end), zero-terminate and return
// the new beginning.
char *SSDPPacketParser::trim(char *cp, char *end)
{
    while (cp < end && (*cp == ' ' || *cp == '\t')) {
        cp++;
    }
    while (end > cp && (end[-1] == ' ' || end[-1] == '\t' || end[-1] == '\r')) {
        end--;
    }
    *end = 0;
    return cp;
}

void SSDPPacketParser::dump(std::ostream& os) const {
    os <<
        " isresponse " << (isresponse ? "true" : "false") <<
        " method " << NULLSTR(method) <<
        " url " << NULLSTR(url) <<
        " version " << NULLSTR(version) <<
        " status " << NULLSTR(status) <<
        " cache_control " << NULLSTR(cache_control) <<
        " ext " << (ext ? "true" : "false") <<
        " host " << NULLSTR(host) <<
        " location " << NULLSTR(location) <<
        " man " << NULLSTR(man) <<
        " mx " << NULLSTR(mx) <<
        " nt " << NULLSTR(nt) <<
        " nts " << NULLSTR(nts) <<
        " server " << NULLSTR(server) <<
        " st " << NULLSTR(st) <<
        " user_agent " << NULLSTR(user_agent) <<
        " usn " << NULLSTR(usn) <<
        "\n";
}

// Request: METHOD URL VERSION. Response: VERSION STATUS [REASON]
bool SSDPPacketParser::parseFirstLine(char *line)
{
    char *tokens[3] = {nullptr, nullptr, nullptr};
    int ntok = 0;
    char *cp = line;
    while (*cp && ntok < 3) {
        while (*cp == ' ' || *cp == '\t') {
            cp++;
        }
        if (*cp == 0) {
            break;
        }
        tokens[ntok++] = cp;
        // The reason phrase may contain spaces: keep it whole
        if (ntok == 3) {
            break;
        }
        while (*cp && *cp != ' ' && *cp != '\t') {
            cp++;
        }
        if (*cp) {
            *cp++ = 0;
        }
    }

    if (ntok >= 2 && !strncmp(tokens[0], "HTTP/", 5)) {
        isresponse = true;
        version = tokens[0];
        status = tokens[1];
        return true;
    }
    if (ntok != 3) {
        return false;
    }
    method = tokens[0];
    url = tokens[1];
    version = tokens[2];
    return true;
}

bool SSDPPacketParser::parse()
{
    char *cp = &m_packet[0];
    // An embedded null ends the packet
    char *end = cp + strlen(cp);

    char *eol = strchr(cp, '\n');
    char *lineend = eol ? eol : end;
    char *first = trim(cp, lineend);
    if (!parseFirstLine(first)) {
        EcpPrintf(ECP_DEBUG, SSDP, __FILE__, __LINE__,
                  "SSDP parser: bad first line in [%s]\n", first);
        return false;
    }
    cp = eol ? eol + 1 : end;

    while (cp < end) {
        eol = strchr(cp, '\n');
        lineend = eol ? eol : end;
        char *nextline = eol ? eol + 1 : end;
        if (cp == lineend || (lineend - cp == 1 && *cp == '\r')) {
            // Empty line: end of headers
            return true;
        }
        char *colon = static_cast<char*>(memchr(cp, ':', lineend - cp));
        if (nullptr == colon) {
            *lineend = 0;
            EcpPrintf(ECP_DEBUG, SSDP, __FILE__, __LINE__,
                      "SSDP parser: no colon in header line [%s]\n", cp);
            return false;
        }
        char *nm = trim(cp, colon);
        char *val = trim(colon + 1, lineend);
        cp = nextline;

        bool known{false};
        switch (nm[0]) {
        case 'c': case 'C':
            if (!strcasecmp("CACHE-CONTROL", nm)) {
                cache_control = val; known = true;
            }
            break;
        case 'e': case 'E':
            if (!strcasecmp("EXT", nm)) {
                ext = true; known = true;
            }
            break;
        case 'h': case 'H':
            if (!strcasecmp("HOST", nm)) {
                host = val; known = true;
            }
            break;
        case 'l': case 'L':
            if (!strcasecmp("LOCATION", nm)) {
                location = val; known = true;
            }
            break;
        case 'm': case 'M':
            if (!strcasecmp("MAN", nm)) {
                man = val; known = true;
            } else if (!strcasecmp("MX", nm)) {
                mx = val; known = true;
            }
            break;
        case 'n': case 'N':
            if (!strcasecmp("NT", nm)) {
                nt = val; known = true;
            } else if (!strcasecmp("NTS", nm)) {
                nts = val; known = true;
            }
            break;
        case 's': case 'S':
            if (!strcasecmp("SERVER", nm)) {
                server = val; known = true;
            } else if (!strcasecmp("ST", nm)) {
                st = val; known = true;
            }
            break;
        case 'u': case 'U':
            if (!strcasecmp("USER-AGENT", nm)) {
                user_agent = val; known = true;
            } else if (!strcasecmp("USN", nm)) {
                usn = val; known = true;
            }
            break;
        default:
            break;
        }
        if (!known) {
            EcpPrintf(ECP_ALL, SSDP, __FILE__, __LINE__,
                      "SSDP parser: unknown header name [%s]\n", nm);
        }
    }
    return true;
}
