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

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "redphone/Presence.h"

#include "Config.h"

namespace httplib {
class Server;
}

namespace kc1fsz {
class Log;
class Clock;
}

namespace redphone {

class DiscoveryEngine;
class CallStateMachine;

/**
 * The HTTP API used by the touch screen, by admin tools, and by other 
 * phones (which read /api/info to learn our extension). The server runs 
 * on its own thread.
 */
class WebUi {
public:

    // The longest a client can wait for the phone list to change
    static constexpr unsigned MAX_WAIT_SEC = 25;

    WebUi(kc1fsz::Log& log, kc1fsz::Clock& clock, DiscoveryEngine& discovery,
        CallStateMachine& call, const SelfIdentity& self);
    ~WebUi();

    /**
     * @returns 0 if the server thread was started.
     */
    int start(const char* bindAddr, unsigned listenPort);
    void stop();

    /**
     * Called on every configuration change. Controls access to the admin 
     * requests and provides the document for GET /api/config.
     */
    void setConfig(const Config& cfg);

    /**
     * The file that PUT /api/config writes to.
     */
    void setConfigFile(const std::string& fn);

    // ----- Documents, exposed for unit testing -----------------------------

    nlohmann::json makeInfo() const;
    nlohmann::json makeStatus() const;
    nlohmann::json makePhones() const;
    // Secrets are blanked out
    nlohmann::json makeConfig() const;

    /**
     * Handles a dial request body like {"identity":"kitchen/101"}.
     *
     * @returns The HTTP status code to send back.
     */
    int handleCall(const std::string& body, nlohmann::json& result);

    /**
     * Handles a handset request body like {"lifted":true}.
     */
    int handleHandset(const std::string& body, nlohmann::json& result);

    /**
     * Handles an admin configuration update. The body is a JSON object 
     * that is merged into the configuration file. Keys may be nested 
     * objects or dotted paths like "quiet_hours.enabled". A blank secret
     * leaves the existing one in place. The document is validated before 
     * anything is written.
     *
     * @param authorization The Authorization header, "Bearer <password>".
     */
    int handleConfigUpdate(const std::string& authorization, 
        const std::string& body, nlohmann::json& result);

    /**
     * Blocks until the phone list revision is beyond the one provided, the
     * server is stopping, or the timeout passes.
     *
     * @returns true if the list changed.
     */
    bool waitForChange(uint64_t revision, unsigned timeoutSec);

private:

    void _thread();

    kc1fsz::Log& _log;
    kc1fsz::Clock& _clock;
    DiscoveryEngine& _discovery;
    CallStateMachine& _call;
    const SelfIdentity _self;

    std::unique_ptr<httplib::Server> _svr;
    std::thread _worker;
    std::atomic<bool> _done;
    std::string _bindAddr;
    unsigned _listenPort = 0;

    int _subscription = 0;
    std::mutex _changeLock;
    std::condition_variable _changeCv;
    uint64_t _revision = 0;
    bool _stopping = false;

    mutable std::mutex _configLock;
    Config _config;
    std::string _configFile;
    // One admin update at a time
    std::mutex _updateLock;
};

}
