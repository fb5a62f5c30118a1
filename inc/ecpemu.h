#ifndef ECPEMU_H
#define ECPEMU_H

/*******************************************************************************
 *
 * Copyright (c) 2000-2003 Intel Corporation
 * Copyright (C) 2011-2012 France Telecom All rights reserved.
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
 * \brief Public interface of the emulated ECP media player device.
 *
 * An EmulatedDevice answers SSDP searches for the "roku:ecp" search target,
 * periodically announces itself on the SSDP multicast group, and serves the
 * ECP HTTP command API. Remote control commands are forwarded to an
 * application-supplied EcpCommandHandler.
 */

#include <cstdint>
#include <memory>
#include <string>

#include "ecpconfig.h"

/*!
 * \name Error codes
 *
 * The functions in the API return 0 (ECP_E_SUCCESS) or one of the negative
 * codes below.
 *
 * @{
 */

/*!
 * \brief The operation completed successfully.
 */
#define ECP_E_SUCCESS           0

/*!
 * \brief One or more of the parameters passed to the function is not valid.
 *
 * For EmulatedDevice::start(), this means that the usn is empty or that
 * the host or advertise address could not be parsed.
 */
#define ECP_E_INVALID_PARAM     -101

#define ECP_E_OUTOF_MEMORY      -104

/*!
 * \brief The object was already started.
 *
 * Starting twice simply returns this error with no other ill effects.
 */
#define ECP_E_INIT              -105

/*!
 * \brief A network send failed.
 */
#define ECP_E_SOCKET_WRITE      -201

#define ECP_E_SOCKET_READ       -202

/*!
 * \brief Binding a socket failed.
 *
 * For the discovery engine, this usually means that the host address is
 * not configured on this machine, or that the SSDP port is held by another
 * process without SO_REUSEADDR.
 */
#define ECP_E_SOCKET_BIND       -203

/*!
 * \brief A socket could not be created.
 */
#define ECP_E_OUTOF_SOCKET      -205

/*!
 * \brief The HTTP listener could not be started.
 */
#define ECP_E_LISTEN            -206

/*!
 * \brief Generic socket error, e.g. a failed multicast group join.
 */
#define ECP_E_SOCKET_ERROR      -208

/* @} Error codes */

/*! Well-known key names sent by the remote to /keydown, /keyup and
 *  /keypress */
namespace EcpKeys {
constexpr const char *KEY_HOME = "Home";
constexpr const char *KEY_REV = "Rev";
constexpr const char *KEY_FWD = "Fwd";
constexpr const char *KEY_PLAY = "Play";
constexpr const char *KEY_SELECT = "Select";
constexpr const char *KEY_LEFT = "Left";
constexpr const char *KEY_RIGHT = "Right";
constexpr const char *KEY_DOWN = "Down";
constexpr const char *KEY_UP = "Up";
constexpr const char *KEY_BACK = "Back";
constexpr const char *KEY_INSTANTREPLAY = "InstantReplay";
constexpr const char *KEY_INFO = "Info";
constexpr const char *KEY_BACKSPACE = "Backspace";
constexpr const char *KEY_SEARCH = "Search";
constexpr const char *KEY_ENTER = "Enter";
constexpr const char *KEY_FINDREMOTE = "FindRemote";
constexpr const char *KEY_VOLUMEDOWN = "VolumeDown";
constexpr const char *KEY_VOLUMEMUTE = "VolumeMute";
constexpr const char *KEY_VOLUMEUP = "VolumeUp";
constexpr const char *KEY_POWEROFF = "PowerOff";
constexpr const char *KEY_CHANNELUP = "ChannelUp";
constexpr const char *KEY_CHANNELDOWN = "ChannelDown";
constexpr const char *KEY_INPUTTUNER = "InputTuner";
constexpr const char *KEY_INPUTHDMI1 = "InputHDMI1";
constexpr const char *KEY_INPUTHDMI2 = "InputHDMI2";
constexpr const char *KEY_INPUTHDMI3 = "InputHDMI3";
constexpr const char *KEY_INPUTHDMI4 = "InputHDMI4";
constexpr const char *KEY_INPUTAV1 = "InputAV1";
}

/*!
 * \brief Receiver for the remote control commands.
 *
 * The methods are called from the HTTP connection threads, possibly
 * concurrently, after the request passed the access checks. Return values
 * are not observed, and the HTTP client always gets an empty 200 answer.
 */
class EcpCommandHandler {
public:
    virtual ~EcpCommandHandler() = default;
    virtual void onKeyDown(const std::string& usn, const std::string& key) = 0;
    virtual void onKeyUp(const std::string& usn, const std::string& key) = 0;
    virtual void onKeyPress(const std::string& usn, const std::string& key) = 0;
    virtual void launch(const std::string& usn, const std::string& appid) = 0;
};

/*! Handler used when the application does not supply one: does nothing. */
class EcpNullCommandHandler : public EcpCommandHandler {
public:
    void onKeyDown(const std::string&, const std::string&) override {}
    void onKeyUp(const std::string&, const std::string&) override {}
    void onKeyPress(const std::string&, const std::string&) override {}
    void launch(const std::string&, const std::string&) override {}
};

/*! Device parameters supplied by the application */
struct EcpDeviceConfig {
    /*! Device serial. Appears in the documents and in the SSDP USN. */
    std::string usn;
    /*! Local address for the HTTP listener and the multicast join. */
    std::string hostIp;
    /*! HTTP port. 0: use the first free port at or above 8060. */
    uint16_t listenPort{8060};
    /*! Address published in SSDP messages. Empty: use hostIp */
    std::string advertiseIp;
    /*! Port published in SSDP messages. 0: use listenPort */
    uint16_t advertisePort{0};
    /*! -1: platform default, 0: bind hostIp, 1: bind the wildcard address */
    int bindMulticast{-1};
    /*! Interval between ssdp:alive announcements */
    int announceIntervalSecs{300};
};

class DeviceConfiguration;

/*!
 * \brief One emulated device: HTTP command server plus SSDP discovery.
 *
 * Each instance owns its own UDP socket and HTTP listener. Several
 * instances can coexist in one process if their addresses differ.
 */
class EmulatedDevice {
public:
    /*! \param handler may be null, in which case commands are ignored. */
    EmulatedDevice(std::shared_ptr<EcpCommandHandler> handler,
                   const EcpDeviceConfig& config);
    ~EmulatedDevice();
    EmulatedDevice(const EmulatedDevice&) = delete;
    EmulatedDevice& operator=(const EmulatedDevice&) = delete;

    /*!
     * \brief Start the HTTP listener, then the discovery engine.
     *
     * \return
     *     \li \c ECP_E_SUCCESS
     *     \li \c ECP_E_INVALID_PARAM: bad configuration.
     *     \li \c ECP_E_INIT: already running. After a discovery socket
     *         failure, start() restarts the device instead.
     *     \li \c ECP_E_LISTEN: the HTTP listener could not start.
     *     \li \c ECP_E_OUTOF_SOCKET, \c ECP_E_SOCKET_BIND,
     *         \c ECP_E_SOCKET_ERROR: the SSDP socket could not be set up.
     *         The HTTP listener is stopped again in this case.
     */
    int start();

    /*! Stop discovery, then the HTTP listener. Can be called any number
     *  of times. */
    void stop();

    /*! False after stop(), and also if discovery stopped on a socket
     *  error. start() can then be called again. */
    bool isRunning() const;

    /*! Resolved configuration (defaults applied, port chosen) */
    const DeviceConfiguration& config() const;

    class Internal;
private:
    std::unique_ptr<Internal> m;
};

#endif /* ECPEMU_H */
