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

/* Drive the HTTP command server over the loopback interface with libcurl,
   checking the XML answers with expat. */

#include <cstring>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <curl/curl.h>
#include <expat.h>

#include "commandserver.h"
#include "deviceconfig.h"
#include "deviceid.h"
#include "ecpdocs.h"
#include "ecpemu.h"
#include "smallut.h"
#include "testutil.h"

class RecordingHandler : public EcpCommandHandler {
public:
    void onKeyDown(const std::string& usn, const std::string& key) override {
        record("keydown", usn, key);
    }
    void onKeyUp(const std::string& usn, const std::string& key) override {
        record("keyup", usn, key);
    }
    void onKeyPress(const std::string& usn, const std::string& key) override {
        record("keypress", usn, key);
    }
    void launch(const std::string& usn, const std::string& appid) override {
        record("launch", usn, appid);
    }
    std::vector<std::string> calls() {
        std::scoped_lock lck(m_mutex);
        return m_calls;
    }
private:
    void record(const char *what, const std::string& usn, const std::string& arg) {
        std::scoped_lock lck(m_mutex);
        m_calls.push_back(std::string(what) + " " + usn + " " + arg);
    }
    std::mutex m_mutex;
    std::vector<std::string> m_calls;
};

struct HttpAnswer {
    long status{0};
    std::string body;
    std::map<std::string, std::string> headers;
};

static size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    auto answer = static_cast<HttpAnswer *>(userdata);
    answer->body.append(ptr, size * nmemb);
    return size * nmemb;
}

static size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    auto answer = static_cast<HttpAnswer *>(userdata);
    std::string line(buffer, size * nitems);
    std::string::size_type colon = line.find(':');
    if (colon != std::string::npos) {
        std::string value = line.substr(colon + 1);
        answer->headers[stringtolower(line.substr(0, colon))] =
            trimstring(value, " \t\r\n");
    }
    return size * nitems;
}

static HttpAnswer request(const std::string& method, const std::string& url,
                          const char *hosthdr = nullptr)
{
    HttpAnswer answer;
    CURL *curl = curl_easy_init();
    if (nullptr == curl) {
        return answer;
    }
    struct curl_slist *hdrs = nullptr;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &answer);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &answer);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 10L);
    if (method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, "");
    } else if (method == "HEAD") {
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    } else if (method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    }
    if (hosthdr) {
        hdrs = curl_slist_append(hdrs, (std::string("Host: ") + hosthdr).c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, hdrs);
    }
    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &answer.status);
    } else {
        fprintf(stderr, "curl: %s: %s\n", url.c_str(), curl_easy_strerror(res));
    }
    curl_slist_free_all(hdrs);
    curl_easy_cleanup(curl);
    return answer;
}

/* Collect the character data of each element, by name */
struct XMLTexts {
    std::map<std::string, std::string> texts;
    std::vector<std::string> stack;
    std::vector<std::map<std::string, std::string>> apps;
    bool ok{false};
};

static void XMLCALL start_element(void *userData, const XML_Char *name,
                                  const XML_Char **atts)
{
    auto data = static_cast<XMLTexts *>(userData);
    data->stack.push_back(name);
    if (!strcmp(name, "app")) {
        std::map<std::string, std::string> attrs;
        for (int i = 0; atts[i]; i += 2) {
            attrs[atts[i]] = atts[i+1];
        }
        data->apps.push_back(attrs);
    }
}

static void XMLCALL end_element(void *userData, const XML_Char *)
{
    auto data = static_cast<XMLTexts *>(userData);
    data->stack.pop_back();
}

static void XMLCALL char_data(void *userData, const XML_Char *s, int len)
{
    auto data = static_cast<XMLTexts *>(userData);
    if (!data->stack.empty()) {
        data->texts[data->stack.back()].append(s, len);
    }
}

static XMLTexts parsexml(const std::string& doc)
{
    XMLTexts data;
    XML_Parser parser = XML_ParserCreate(nullptr);
    XML_SetUserData(parser, &data);
    XML_SetElementHandler(parser, start_element, end_element);
    XML_SetCharacterDataHandler(parser, char_data);
    data.ok = XML_Parse(parser, doc.c_str(), static_cast<int>(doc.size()), 1) ==
        XML_STATUS_OK;
    if (!data.ok) {
        fprintf(stderr, "XML error: %s at line %d\n",
                XML_ErrorString(XML_GetErrorCode(parser)),
                static_cast<int>(XML_GetCurrentLineNumber(parser)));
    }
    XML_ParserFree(parser);
    return data;
}

int main(int, char **)
{
    curl_global_init(CURL_GLOBAL_DEFAULT);

    EcpDeviceConfig in;
    in.usn = "ABC123";
    in.hostIp = "127.0.0.1";
    in.listenPort = 0;
    DeviceConfiguration cfg(in);
    CHECK(cfg.status() == ECP_E_SUCCESS);
    if (cfg.status() != ECP_E_SUCCESS) {
        return test_result("test_commandserver");
    }
    auto handler = std::make_shared<RecordingHandler>();
    CommandServer server(cfg, handler);
    int ret = server.start();
    if (ret != ECP_E_SUCCESS) {
        fprintf(stderr, "test_commandserver: can't listen (%d), skipping\n", ret);
        return TEST_SKIP;
    }
    CHECK(server.isRunning());
    CHECK(server.start() == ECP_E_INIT);

    std::string base = "http://127.0.0.1:" + std::to_string(cfg.listenPort());
    HttpAnswer a;

    // Documents
    a = request("GET", base + "/query/device-info");
    CHECK(a.status == 200);
    CHECK_STREQ(a.headers["content-type"], "text/xml");
    {
        XMLTexts x = parsexml(a.body);
        CHECK(x.ok);
        CHECK_STREQ(x.texts["device-id"], "ABC123");
        CHECK_STREQ(x.texts["serial-number"], "ABC123");
        CHECK_STREQ(x.texts["udn"], "5d3850a0-aa83-5501-b94c-defd9c1ba43c");
    }
    a = request("GET", base + "/");
    CHECK(a.status == 200);
    {
        XMLTexts x = parsexml(a.body);
        CHECK(x.ok);
        CHECK_STREQ(x.texts["UDN"], "uuid:" + ecp_derive_device_id("ABC123"));
        CHECK_STREQ(x.texts["serialNumber"], "ABC123");
    }
    a = request("GET", base + "/query/apps");
    CHECK(a.status == 200);
    {
        XMLTexts x = parsexml(a.body);
        CHECK(x.ok);
        CHECK(x.apps.size() == 10);
        if (x.apps.size() == 10) {
            CHECK_STREQ(x.apps[0]["id"], "1");
            CHECK_STREQ(x.apps[9]["id"], "10");
            CHECK_STREQ(x.apps[3]["version"], "1.0.0");
        }
    }
    a = request("GET", base + "/query/active-app");
    CHECK(a.status == 200);
    CHECK(parsexml(a.body).ok);
    a = request("GET", base + "/query/icon/12");
    CHECK(a.status == 200);
    CHECK_STREQ(a.headers["content-type"], "image/png");
    CHECK(a.body == ecp_placeholder_icon());
    CHECK(a.body.compare(0, 4, "\x89PNG") == 0);
    a = request("HEAD", base + "/query/device-info");
    CHECK(a.status == 200);
    CHECK(a.body.empty());

    // Commands
    a = request("POST", base + "/keydown/Home");
    CHECK(a.status == 200);
    CHECK(a.body.empty());
    a = request("POST", base + "/keyup/Home");
    CHECK(a.status == 200);
    a = request("POST", base + "/keypress/Lit_a");
    CHECK(a.status == 200);
    a = request("POST", base + "/launch/12");
    CHECK(a.status == 200);
    a = request("POST", base + "/input");
    CHECK(a.status == 200);
    a = request("POST", base + "/search");
    CHECK(a.status == 200);
    {
        auto calls = handler->calls();
        CHECK(calls.size() == 4);
        if (calls.size() == 4) {
            CHECK_STREQ(calls[0], std::string("keydown ABC123 ") + EcpKeys::KEY_HOME);
            CHECK_STREQ(calls[1], "keyup ABC123 Home");
            CHECK_STREQ(calls[2], "keypress ABC123 Lit_a");
            CHECK_STREQ(calls[3], "launch ABC123 12");
        }
    }

    // Errors
    a = request("GET", base + "/nosuchpath");
    CHECK(a.status == 404);
    CHECK(a.body.find("Not Found") != std::string::npos);
    a = request("POST", base + "/keydown/");
    CHECK(a.status == 404);
    // Parameters are a single path segment
    a = request("POST", base + "/keydown/a/b");
    CHECK(a.status == 404);
    a = request("POST", base + "/launch/1/2");
    CHECK(a.status == 404);
    a = request("GET", base + "/query/icon/x/y");
    CHECK(a.status == 404);
    a = request("GET", base + "/keydown/Home");
    CHECK(a.status == 405);
    CHECK_STREQ(a.headers["allow"], "POST");
    CHECK(a.body.find("Method Not Allowed") != std::string::npos);
    a = request("POST", base + "/query/device-info");
    CHECK(a.status == 405);
    a = request("DELETE", base + "/");
    CHECK(a.status == 405);
    CHECK(handler->calls().size() == 4);

    // Access control. Loopback clients are always private, so the
    // non-private remote address case is covered in test_accessguard.
    a = request("POST", base + "/keydown/Home", "evil.example.com");
    CHECK(a.status == 403);
    CHECK(a.body.find("Forbidden") != std::string::npos);
    CHECK(a.body.find("evil.example.com") != std::string::npos);
    a = request("GET", base + "/query/device-info", "127.0.0.1:1");
    CHECK(a.status == 403);
    a = request("GET", base + "/query/device-info", "127.0.0.1");
    CHECK(a.status == 200);
    CHECK(handler->calls().size() == 4);

    server.stop();
    CHECK(!server.isRunning());
    server.stop();
    a = request("GET", base + "/query/device-info");
    CHECK(a.status == 0);

    curl_global_cleanup();
    return test_result("test_commandserver");
}
