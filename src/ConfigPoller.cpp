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
#include <exception>
#include <fstream>
#include <sstream>

#include "kc1fsz-tools/Log.h"

#include "ConfigPoller.h"

using namespace std;
using json = nlohmann::json;

namespace redphone {

const char* ConfigPoller::DEFAULT_CONFIG_FILE = "/etc/redphone/config.json";

const char* ConfigPoller::DEFAULT_CONFIG = R"({
    "phone": { "name": "RedPhone", "extension": 100, "hostname": "" },
    "quiet_hours": { "enabled": true, "start": "22:00", "end": "08:00", "timezone": "UTC" },
    "discovery": { 
        "udp_broadcast": true, "udp_port": 5199, "announce_interval": 30, 
        "phone_timeout": 120, "sweep_interval": 15, 
        "vpn_broadcast": "", "vpn_udp_port": 5200,
        "tailscale_api": true, "poll_interval": 30, 
        "tailscale_socket": "/var/run/tailscale/tailscaled.sock" 
    },
    "network": { "tag": "redphone" },
    "asterisk": { 
        "ami_host": "127.0.0.1", "ami_port": 5038, "ami_user": "redphone", 
        "ami_secret": "", "dial_template": "PJSIP/{ext}@{addr}", 
        "local_channel": "Console/dsp", "inbound_context": "redphone-inbound",
        "answer_command": "console answer"
    },
    "gpio": { "enabled": false, "hook_pin": 17, "hook_logic": "high_on_lift" },
    "ui": { "port": 5000 },
    "admin": { "enabled": false, "password": "" },
    "logging": { "level": "INFO", "file": "" }
})";

ConfigPoller::ConfigPoller(kc1fsz::Log& log, const char* cfgFileName, 
    std::function<void(const json& cfg)> cb) 
:   _log(log),
    _fn(cfgFileName),
    _cb(cb) { 
}

json ConfigPoller::merge(const json& doc) {
    json j = json::parse(DEFAULT_CONFIG);
    j.merge_patch(doc);
    return j;
}

int ConfigPoller::readDocument(const char* fn, json& doc) {
    std::error_code ec;
    if (!std::filesystem::exists(fn, ec)) {
        doc = json::object();
        return 0;
    }
    ifstream cfg(fn);
    if (!cfg.good())
        return -1;
    std::stringstream buffer;
    buffer << cfg.rdbuf();
    doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        return -2;
    return 0;
}

int ConfigPoller::writeDocument(const char* fn, const json& doc) {
    // Written beside the real file and then renamed into place so that 
    // poll() never sees a partial document
    const std::string tmp = std::string(fn) + ".tmp";
    {
        ofstream cfg(tmp, std::ios::trunc);
        if (!cfg.good())
            return -1;
        cfg << doc.dump(4) << std::endl;
        if (!cfg.good())
            return -1;
    }
    std::error_code ec;
    std::filesystem::rename(tmp, fn, ec);
    if (ec) {
        std::filesystem::remove(tmp, ec);
        return -2;
    }
    return 0;
}

bool ConfigPoller::poll() {   

    std::error_code ec;
    if (!std::filesystem::exists(_fn, ec)) {
        if (!_missingFileReported) {
            _log.info("Config file %s not found, using defaults", _fn.c_str());
            _missingFileReported = true;
        }
        // Run once on the defaults so that the system can come up
        if (_startup) {
            _startup = false;
            try {
                _cb(merge(json::object()));
                return true;
            } catch (const std::exception& ex) {
                _log.error("Unable to apply default config %s", ex.what());
            }
        }
        return false;
    }
    _missingFileReported = false;

    try {
        auto ftime = std::filesystem::last_write_time(_fn);
        if (!_startup && ftime <= _lastUpdate)
            return false;
        _lastUpdate = ftime;
        _startup = false;

        ifstream cfg(_fn);
        std::stringstream buffer;
        buffer << cfg.rdbuf();
        cfg.close();

        try {
            json j = json::parse(buffer.str());
            if (!j.is_object()) {
                _log.error("Invalid config file format, not an object");
                return false;
            }
            // Fire the callback
            _cb(merge(j));
            _log.info("Loaded config file %s", _fn.c_str());
            return true;
        } catch (const json::exception& ex) {
            _log.error("Invalid config file format %s", ex.what());
        }
    } catch (const std::exception& ex) {
        _log.error("Unable to load config file %s %s", _fn.c_str(), ex.what());
    }
    return false;
}

}
