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

/* Misc HTTP-related utilities */

#include "httputils.h"

#include <cstring>
#include <map>
#include <sstream>
#include <string>

#include "ecpemu.h"
#include "ecpdebug.h"
#include "genut.h"
#include "smallut.h"
#include "statcodes.h"

static const std::map<std::string, int> Http_Method_Table {
    {"GET", HTTPMETHOD_GET},
    {"HEAD", HTTPMETHOD_HEAD},
    {"POST", HTTPMETHOD_POST},
};

http_method_t httpmethod_str2enum(const char *methname)
{
    const auto it = Http_Method_Table.find(methname);
    if (it == Http_Method_Table.end()) {
        return HTTPMETHOD_UNKNOWN;
    }

    return static_cast<http_method_t>(it->second);
}

const char *MHDTransaction::header(const std::string& name) const
{
    auto it = headers.find(stringtolower(name));
    if (it == headers.end()) {
        return nullptr;
    }
    return it->second.c_str();
}

int http_SendStatusResponse(MHDTransaction *mhdt, int status_code,
                            const std::string& detail)
{
    std::ostringstream body;
    body << "<html><body><h1>" << status_code << " " <<
        http_get_code_text(status_code) << "</h1>";
    if (!detail.empty()) {
        body << "<p>" << xmlQuote(detail) << "</p>";
    }
    body << "</body></html>";
    return http_SendDataResponse(mhdt, status_code, body.str(), "text/html");
}

int http_SendDataResponse(MHDTransaction *mhdt, int status_code,
                          const std::string& data, const char *content_type)
{
    mhdt->response = MHD_create_response_from_buffer(
        data.size(), const_cast<char*>(data.c_str()), MHD_RESPMEM_MUST_COPY);
    if (nullptr == mhdt->response) {
        EcpPrintf(ECP_ERROR, HTTP, __FILE__, __LINE__,
                  "http_SendDataResponse: can't create response\n");
        return ECP_E_OUTOF_MEMORY;
    }
    if (content_type && *content_type) {
        MHD_add_response_header(mhdt->response, "Content-Type", content_type);
    }
    mhdt->httpstatus = status_code;
    return ECP_E_SUCCESS;
}
