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
#include <unistd.h>

#include <stdexcept>

#include "Config.h"

using namespace std;
using json = nlohmann::json;

namespace redphone {

static unsigned parseTime(const json& section, const char* name) {
    std::string s = section[name].get<std::string>();
    int m = parseTimeOfDay(s.c_str());
    if (m < 0)
        throw std::invalid_argument("Invalid time of day for quiet_hours." + 
            std::string(name) + ": " + s);
    return (unsigned)m;
}

void Config::fromJson(const json& j) {

    const json& phone = j.at("phone");
    phoneName = phone.at("name").get<std::string>();
    extension = phone.at("extension").get<unsigned>();
    hostName = phone.at("hostname").get<std::string>();
    if (extension == 0)
        throw std::invalid_argument("phone.extension must be non-zero");

    const json& qh = j.at("quiet_hours");
    quietHours.enabled = qh.at("enabled").get<bool>();
    quietHours.startMin = parseTime(qh, "start");
    quietHours.endMin = parseTime(qh, "end");
    quietHours.timezone = qh.at("timezone").get<std::string>();

    const json& d = j.at("discovery");
    udpBroadcast = d.at("udp_broadcast").get<bool>();
    udpPort = d.at("udp_port").get<unsigned>();
    announceInterval = d.at("announce_interval").get<unsigned>();
    phoneTimeout = d.at("phone_timeout").get<unsigned>();
    sweepInterval = d.at("sweep_interval").get<unsigned>();
    vpnBroadcast = d.at("vpn_broadcast").get<std::string>();
    vpnUdpPort = d.at("vpn_udp_port").get<unsigned>();
    tailscaleApi = d.at("tailscale_api").get<bool>();
    pollInterval = d.at("poll_interval").get<unsigned>();
    tailscaleSocket = d.at("tailscale_socket").get<std::string>();
    if (announceInterval == 0 || phoneTimeout == 0 || sweepInterval == 0 ||
        pollInterval == 0)
        throw std::invalid_argument("Discovery intervals must be non-zero");

    networkTag = j.at("network").at("tag").get<std::string>();

    const json& a = j.at("asterisk");
    amiHost = a.at("ami_host").get<std::string>();
    amiPort = a.at("ami_port").get<unsigned>();
    amiUser = a.at("ami_user").get<std::string>();
    amiSecret = a.at("ami_secret").get<std::string>();
    dialTemplate = a.at("dial_template").get<std::string>();
    localChannel = a.at("local_channel").get<std::string>();
    inboundContext = a.at("inbound_context").get<std::string>();
    answerCommand = a.at("answer_command").get<std::string>();

    const json& g = j.at("gpio");
    gpioEnabled = g.at("enabled").get<bool>();
    hookPin = g.at("hook_pin").get<unsigned>();
    hookLogic = g.at("hook_logic").get<std::string>();
    if (hookLogic != "high_on_lift" && hookLogic != "low_on_lift")
        throw std::invalid_argument("Invalid gpio.hook_logic: " + hookLogic);

    uiPort = j.at("ui").at("port").get<unsigned>();

    adminEnabled = j.at("admin").at("enabled").get<bool>();
    adminPassword = j.at("admin").at("password").get<std::string>();

    logLevel = j.at("logging").at("level").get<std::string>();
    logFile = j.at("logging").at("file").get<std::string>();
}

json Config::toJson() const {
    json o;
    o["phone"]["name"] = phoneName;
    o["phone"]["extension"] = extension;
    o["phone"]["hostname"] = hostName;
    o["quiet_hours"]["enabled"] = quietHours.enabled;
    o["quiet_hours"]["start"] = formatTimeOfDay(quietHours.startMin);
    o["quiet_hours"]["end"] = formatTimeOfDay(quietHours.endMin);
    o["quiet_hours"]["timezone"] = quietHours.timezone;
    o["discovery"]["udp_broadcast"] = udpBroadcast;
    o["discovery"]["udp_port"] = udpPort;
    o["discovery"]["announce_interval"] = announceInterval;
    o["discovery"]["phone_timeout"] = phoneTimeout;
    o["discovery"]["sweep_interval"] = sweepInterval;
    o["discovery"]["vpn_broadcast"] = vpnBroadcast;
    o["discovery"]["vpn_udp_port"] = vpnUdpPort;
    o["discovery"]["tailscale_api"] = tailscaleApi;
    o["discovery"]["poll_interval"] = pollInterval;
    o["discovery"]["tailscale_socket"] = tailscaleSocket;
    o["network"]["tag"] = networkTag;
    o["asterisk"]["ami_host"] = amiHost;
    o["asterisk"]["ami_port"] = amiPort;
    o["asterisk"]["ami_user"] = amiUser;
    // Secrets are never handed back out
    o["asterisk"]["ami_secret"] = "";
    o["asterisk"]["dial_template"] = dialTemplate;
    o["asterisk"]["local_channel"] = localChannel;
    o["asterisk"]["inbound_context"] = inboundContext;
    o["asterisk"]["answer_command"] = answerCommand;
    o["gpio"]["enabled"] = gpioEnabled;
    o["gpio"]["hook_pin"] = hookPin;
    o["gpio"]["hook_logic"] = hookLogic;
    o["ui"]["port"] = uiPort;
    o["admin"]["enabled"] = adminEnabled;
    o["admin"]["password"] = "";
    o["logging"]["level"] = logLevel;
    o["logging"]["file"] = logFile;
    return o;
}

SelfIdentity Config::makeSelf() const {
    SelfIdentity self;
    self.hostName = hostName;
    if (self.hostName.empty()) {
        char buf[256];
        if (gethostname(buf, sizeof(buf)) == 0) {
            buf[sizeof(buf) - 1] = 0;
            self.hostName = buf;
        }
        else {
            self.hostName = "redphone";
        }
    }
    self.displayName = phoneName;
    self.extension = extension;
    self.uiPort = uiPort;
    self.identity = makeIdentity(self.hostName.c_str(), extension);
    return self;
}

}
