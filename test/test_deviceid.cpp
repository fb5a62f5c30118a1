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

#include "deviceid.h"
#include "testutil.h"

int main(int, char **)
{
    CHECK_STREQ(ecp_derive_device_id("ABC123"),
                "5d3850a0-aa83-5501-b94c-defd9c1ba43c");
    CHECK_STREQ(ecp_derive_device_id("P0A070000007"),
                "358eb97a-874d-59bb-9d2b-6e3e6b0a4f72");
    CHECK_STREQ(ecp_derive_device_id("emulated-roku"),
                "5c2d6c17-f903-5393-9924-f04a6033aba7");
    CHECK_STREQ(ecp_derive_device_id(""),
                "0a68eb57-c88a-5f34-9e9d-27f85e68af4f");

    // Stable, and different usns give different ids
    CHECK(ecp_derive_device_id("ABC123") == ecp_derive_device_id("ABC123"));
    CHECK(ecp_derive_device_id("ABC123") != ecp_derive_device_id("abc123"));

    std::string id = ecp_derive_device_id("some other serial");
    CHECK(id.size() == 36);
    CHECK(id[14] == '5');
    CHECK(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
    return test_result("test_deviceid");
}
