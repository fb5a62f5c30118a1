#ifndef ECPDEBUG_H
#define ECPDEBUG_H

/*******************************************************************************
 *
 * Copyright (c) 2000-2003 Intel Corporation
 * Copyright (C) 2020 J.F. Dockes <jf@dockes.org>
 * Copyright (C) 2026 The ecpemu contributors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 * * Redistributions of source code must retain the above copyright notice,
 * this list of conditions and the following disclaimer.
 * * Redistributions in binary form must reproduce the above copyright notice,
 * this list of conditions and the following disclaimer in the documentation
 * and/or other materials provided with the distribution.
 * * Neither name of Intel Corporation nor the names of its contributors
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
 *
 * \brief Leveled, module-tagged logging.
 *
 * Nothing is output unless the application called EcpSetLogLevel() or
 * EcpSetLogFileNames() before EcpInitLog(), or the ECPEMU_FORCELOG
 * environment variable is set.
 */

#include <cstdio>

/*! Log levels. A message is output if its level is <= the current one. */
typedef enum {
    ECP_CRITICAL,
    ECP_ERROR,
    ECP_WARNING,
    ECP_INFO,
    ECP_DEBUG,
    ECP_ALL
} Ecp_LogLevel;

#define ECP_DEFAULT_LOG_LEVEL ECP_INFO

/*! Source modules, printed in the message prefix */
typedef enum {
    SSDP,
    HTTP,
    MSERV,
    API,
    TIMER
} Dbg_Module;

/*!
 * \brief Open the log output. Called by EmulatedDevice::start(), can be
 * called again, e.g. to reopen a rotated log file.
 *
 * \return ECP_E_SUCCESS. Failure to open the file falls back to stderr.
 */
int EcpInitLog();

/*! Set the log level (see Ecp_LogLevel) */
void EcpSetLogLevel(Ecp_LogLevel log_level);

/*! Close the log file if it is not stderr. */
void EcpCloseLog();

/*!
 * \brief Set the name of the log file. The second argument is ignored,
 * it is kept for compatibility with the two-file scheme of the old code.
 * An empty or null name means stderr.
 */
void EcpSetLogFileNames(const char *fileName, const char *ignored);

/*!
 * \brief Output a formatted message if level and module allow it.
 *
 * The message is prefixed by the date, module, level, thread id, source
 * file and line.
 */
void EcpPrintf(Ecp_LogLevel DLevel, Dbg_Module Module,
               const char *DbgFileName, int DbgLineNo,
               const char *FmtStr, ...)
#if (__GNUC__ >= 3)
    __attribute__((format(__printf__, 5, 6)))
#endif
    ;

/*! Return the log FILE if output is enabled for this level and module,
 *  else nullptr. */
FILE *EcpGetDebugFile(Ecp_LogLevel level, Dbg_Module module);

#endif /* ECPDEBUG_H */
