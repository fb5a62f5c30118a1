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

#ifndef _HTTPUTILS_H_
#define _HTTPUTILS_H_

#include <map>
#include <string>

#include <sys/socket.h>

#include <microhttpd.h>

#if MHD_VERSION <= 0x00097000
#define MHD_Result int
#endif

/* method in a HTTP request. */
typedef enum {
    HTTPMETHOD_POST,
    HTTPMETHOD_GET,
    HTTPMETHOD_HEAD,
    HTTPMETHOD_UNKNOWN
} http_method_t;

/* Translate method name to numeric. Methname must be uppercase */
http_method_t httpmethod_str2enum(const char *methname);

/* Context for a microhttpd request/response */
struct MHDTransaction {
public:
    struct MHD_Connection *conn{nullptr};
    struct sockaddr_storage client_address{};
    std::string url;
    http_method_t method{HTTPMETHOD_UNKNOWN};
    std::string version;
    /* Header names are lowercased */
    std::map<std::string, std::string> headers;
    std::string postdata;
    /* Set by callback */
    struct MHD_Response *response{nullptr};
    int httpstatus{0};

    // Returns nullptr if header not found
    const char *header(const std::string& name) const;
};

/* Generate a status response message (response with status +
   bit of explanatory HTML) */
int http_SendStatusResponse(MHDTransaction *mhdt, int http_status_code,
                            const std::string& detail = std::string());

/* Generate a response with a copy of data as body. An empty content type
   means no Content-Type header */
int http_SendDataResponse(MHDTransaction *mhdt, int http_status_code,
                          const std::string& data, const char *content_type);

#endif /* _HTTPUTILS_H_ */
