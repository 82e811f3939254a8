/**
 * Copyright (C) 2025, Bruce MacKinnon KC1FSZ
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "redphone/Presence.h"
#include "redphone/QuietHours.h"

namespace redphone {

/**
 * The typed view of the configuration document. The document is always
 * merged with the defaults before it gets here, see ConfigPoller.
 */
class Config {
public:

    // ----- phone -----
    std::string phoneName = "RedPhone";
    unsigned extension = 100;
    // Empty means use the system host name
    std::string hostName;

    QuietHoursWindow quietHours;

    // ----- discovery -----
    bool udpBroadcast = true;
    unsigned udpPort = 5199;
    unsigned announceInterval = 30;
    unsigned phoneTimeout = 120;
    unsigned sweepInterval = 15;
    // Directed broadcast address of the VPN subnet, empty to disable
    std::string vpnBroadcast;
    unsigned vpnUdpPort = 5200;
    bool tailscaleApi = true;
    unsigned pollInterval = 30;
    std::string tailscaleSocket = "/var/run/tailscale/tailscaled.sock";
    std::string networkTag = "redphone";

    // ----- asterisk -----
    std::string amiHost = "127.0.0.1";
    unsigned amiPort = 5038;
    std::string amiUser;
    std::string amiSecret;
    std::string dialTemplate = "PJSIP/{ext}@{addr}";
    std::string localChannel = "Console/dsp";
    std::string inboundContext = "redphone-inbound";
    std::string answerCommand = "console answer";

    // ----- gpio -----
    bool gpioEnabled = false;
    unsigned hookPin = 17;
    std::string hookLogic = "high_on_lift";

    unsigned uiPort = 5000;

    // ----- admin -----
    bool adminEnabled = false;
    std::string adminPassword;

    // ----- logging -----
    std::string logLevel = "INFO";
    std::string logFile;

    /**
     * Loads from a (defaults-merged) document. Throws 
     * nlohmann::json::exception on type errors and std::invalid_argument
     * on bad values.
     */
    void fromJson(const nlohmann::json& j);

    nlohmann::json toJson() const;

    bool isDebug() const { return logLevel == "DEBUG"; }

    /**
     * @returns The identity of this phone as seen by its peers.
     */
    SelfIdentity makeSelf() const;
};

}
