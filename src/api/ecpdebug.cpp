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

/*!
 * \file
 */

#include "ecpemu.h"
#include "ecpdebug.h"

#include <mutex>
#include <thread>
#include <sstream>

#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>

/*! Mutex to synchronize all the log file operations */
static std::mutex GlobalDebugMutex;

/*! Global log level */
static Ecp_LogLevel g_log_level = ECP_DEFAULT_LOG_LEVEL;

/* Output file pointer */
static FILE *fp;
static int is_stderr;

/* Set if the user called setlogfilename() or setloglevel() */
static int setlogwascalled;
/* Name of the output file. We keep a copy */
static std::string fileName;

/* This is called from EmulatedDevice::start(). So the user must call
 * EcpSetLogFileNames() before. This can be called again, for example to
 * rotate the log file. */
int EcpInitLog()
{
    std::unique_lock<std::mutex> lck(GlobalDebugMutex);
    /* If the user did not ask for logging do nothing */
    if (setlogwascalled == 0 && !getenv("ECPEMU_FORCELOG")) {
        return ECP_E_SUCCESS;
    }
    if (fp) {
        if (is_stderr == 0) {
            fclose(fp);
            fp = nullptr;
        }
    }
    is_stderr = 0;
    if (!fileName.empty()) {
        if ((fp = fopen(fileName.c_str(), "a")) == nullptr) {
            fprintf(stderr, "Failed to open fileName (%s): %s\n",
                    fileName.c_str(), strerror(errno));
        }
    }
    if (fp == nullptr) {
        fp = stderr;
        is_stderr = 1;
    }
    return ECP_E_SUCCESS;
}

void EcpSetLogLevel(Ecp_LogLevel log_level)
{
    g_log_level = log_level;
    setlogwascalled = 1;
}

void EcpCloseLog()
{
    std::unique_lock<std::mutex> lck(GlobalDebugMutex);

    if (fp != nullptr && is_stderr == 0) {
        fclose(fp);
    }
    fp = nullptr;
    is_stderr = 0;
}

void EcpSetLogFileNames(const char *newFileName, const char *ignored)
{
    (void)ignored;

    std::unique_lock<std::mutex> lck(GlobalDebugMutex);
    fileName.clear();
    if (newFileName && *newFileName) {
        fileName = newFileName;
    }
    setlogwascalled = 1;
}

static int DebugAtThisLevel(Ecp_LogLevel DLevel, Dbg_Module)
{
    return DLevel <= g_log_level;
}

static void EcpDisplayFileAndLine(
    FILE *fp, const char *DbgFileName,
    int DbgLineNo, Ecp_LogLevel DLevel, Dbg_Module Module)
{
    char timebuf[26];
    time_t now = time(nullptr);
    struct tm tmbuf;
    const char *smod;
    char slev[25];
    snprintf(slev, 25, "%d", DLevel);

    switch(Module) {
    case SSDP: smod="SSDP";break;
    case HTTP: smod="HTTP";break;
    case MSERV: smod="MSER";break;
    case API: smod="API_";break;
    case TIMER: smod="TIMR";break;
    default: smod="UNKN";break;
    }

    localtime_r(&now, &tmbuf);
    strftime(timebuf, 26, "%Y-%m-%d %H:%M:%S", &tmbuf);
    std::ostringstream ss;
    ss << "0x" << std::hex << std::this_thread::get_id();
    fprintf(fp, "%s ECP-%s-%s: Thread:%s [%s:%d]: ", timebuf, smod, slev,
            ss.str().c_str(), DbgFileName, DbgLineNo);
}

void EcpPrintf(
    Ecp_LogLevel DLevel, Dbg_Module Module,
    const char *DbgFileName, int DbgLineNo, const char *FmtStr, ...)
{
    va_list ArgList;

    if (!DebugAtThisLevel(DLevel, Module))
        return;

    std::unique_lock<std::mutex> lck(GlobalDebugMutex);
    if (fp == nullptr) {
        return;
    }

    va_start(ArgList, FmtStr);
    if (DbgFileName) {
        EcpDisplayFileAndLine(fp, DbgFileName, DbgLineNo, DLevel, Module);
        vfprintf(fp, FmtStr, ArgList);
        fflush(fp);
    }
    va_end(ArgList);
}

/* No locking here, the app should be careful about not calling
   closelog from a separate thread... */
FILE *EcpGetDebugFile(Ecp_LogLevel DLevel, Dbg_Module Module)
{
    if (!DebugAtThisLevel(DLevel, Module)) {
        return nullptr;
    }

    return fp;
}
