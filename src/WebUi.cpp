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
#include "httplib.h"

#include <chrono>
#include <functional>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/Clock.h"

#include "redphone/QuietHours.h"

#include "DiscoveryEngine.h"
#include "CallStateMachine.h"
#include "ConfigPoller.h"
#include "ThreadUtil.h"
#include "WebUi.h"

using namespace std;
using json = nlohmann::json;

// https://github.com/yhirose/cpp-httplib
// https://github.com/nlohmann/json

namespace redphone {

static const char* JSON_TYPE = "application/json";

static json makeError(const char* msg) {
    json o;
    o["error"] = msg;
    return o;
}

static json makeResult(const char* result) {
    json o;
    o["result"] = result;
    return o;
}

static json recordToJson(const PresenceRecord& rec) {
    json o;
    o["identity"] = rec.identity;
    o["name"] = rec.displayName;
    o["extension"] = rec.extension;
    o["address"] = rec.address;
    o["source"] = tierName(rec.tier);
    o["status"] = statusName(rec.status);
    return o;
}

// Turns {"quiet_hours.enabled": true} into {"quiet_hours": {"enabled": true}}
static json expandKeys(const json& req) {
    json out = json::object();
    for (auto it = req.begin(); it != req.end(); ++it) {
        json* node = &out;
        std::string key = it.key();
        size_t pos;
        while ((pos = key.find('.')) != std::string::npos) {
            json& child = (*node)[key.substr(0, pos)];
            if (!child.is_object())
                child = json::object();
            node = &child;
            key = key.substr(pos + 1);
        }
        json& target = (*node)[key];
        if (target.is_object() && it.value().is_object())
            target.merge_patch(it.value());
        else 
            target = it.value();
    }
    return out;
}

static void dropBlank(json& patch, const char* section, const char* key) {
    auto s = patch.find(section);
    if (s == patch.end() || !s->is_object())
        return;
    auto k = s->find(key);
    if (k != s->end() && k->is_string() && k->get<std::string>().empty())
        s->erase(k);
}

WebUi::WebUi(kc1fsz::Log& log, kc1fsz::Clock& clock, DiscoveryEngine& discovery,
    CallStateMachine& call, const SelfIdentity& self) 
:   _log(log), 
    _clock(clock),
    _discovery(discovery),
    _call(call),
    _self(self),
    _done(false) {
    _revision = _discovery.revision();
    // Wake up anyone waiting for the phone list
    _subscription = _discovery.subscribe(
        [this](const std::vector<PresenceRecord>&, uint64_t revision) {
            {
                std::lock_guard<std::mutex> lock(_changeLock);
                _revision = revision;
            }
            _changeCv.notify_all();
        });
}

WebUi::~WebUi() {
    stop();
    _discovery.unsubscribe(_subscription);
}

json WebUi::makeInfo() const {
    CallStateMachine::Status s = _call.status();
    json o;
    o["name"] = _self.displayName;
    o["extension"] = _self.extension;
    o["hostname"] = _self.hostName;
    o["identity"] = _self.identity;
    o["status"] = CallStateMachine::stateName(s.state);
    return o;
}

json WebUi::makeStatus() const {
    CallStateMachine::Status s = _call.status();
    json o;
    o["name"] = _self.displayName;
    o["extension"] = _self.extension;
    o["identity"] = _self.identity;
    o["status"] = CallStateMachine::stateName(s.state);
    o["handset_lifted"] = s.handsetLifted;
    if (s.state == CallStateMachine::State::STATE_IDLE) {
        o["current_call"] = nullptr;
    }
    else {
        json c;
        c["identity"] = s.peerIdentity;
        c["name"] = s.peerName;
        c["extension"] = s.peerExtension;
        c["role"] = CallStateMachine::roleName(s.role);
        c["elapsed"] = s.elapsedSec;
        c["quiet_hours_acknowledged"] = s.quietHoursAcknowledged;
        o["current_call"] = c;
    }
    o["last_end_reason"] = CallStateMachine::endReasonName(s.lastEndReason);
    o["is_quiet_hours"] = _call.isQuietHours();
    o["quiet_hours"] = describe(_call.getQuietHours());
    return o;
}

json WebUi::makePhones() const {
    // Take the revision first so that a change during the snapshot is 
    // seen by the next waiter
    uint64_t revision = _discovery.revision();
    auto a = json::array();
    for (const PresenceRecord& rec : _discovery.list())
        a.push_back(recordToJson(rec));
    json o;
    o["phones"] = a;
    o["revision"] = revision;
    return o;
}

int WebUi::handleCall(const std::string& body, json& result) {
    json req = json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object() || !req.contains("identity") ||
        !req["identity"].is_string()) {
        result = makeError("Expected {\"identity\": \"...\"}");
        return 400;
    }
    CallStateMachine::DialResult r = _call.dial(req["identity"].get<std::string>());
    result = makeResult(CallStateMachine::dialResultName(r));
    result["status"] = CallStateMachine::stateName(_call.status().state);
    if (r == CallStateMachine::DialResult::DIAL_BUSY)
        return 409;
    else if (r == CallStateMachine::DialResult::DIAL_UNREACHABLE)
        return 404;
    return 200;
}

json WebUi::makeConfig() const {
    std::lock_guard<std::mutex> lock(_configLock);
    return _config.toJson();
}

void WebUi::setConfig(const Config& cfg) {
    std::lock_guard<std::mutex> lock(_configLock);
    _config = cfg;
}

void WebUi::setConfigFile(const std::string& fn) {
    std::lock_guard<std::mutex> lock(_configLock);
    _configFile = fn;
}

int WebUi::handleConfigUpdate(const std::string& authorization, 
    const std::string& body, json& result) {

    bool enabled;
    std::string password, fn;
    {
        std::lock_guard<std::mutex> lock(_configLock);
        enabled = _config.adminEnabled;
        password = _config.adminPassword;
        fn = _configFile;
    }

    if (!enabled) {
        result = makeError("Admin interface disabled");
        return 403;
    }
    // An empty password never opens the admin interface
    if (password.empty()) {
        result = makeError("Admin password not set");
        return 403;
    }
    const std::string prefix = "Bearer ";
    if (authorization.compare(0, prefix.size(), prefix) != 0 ||
        authorization.substr(prefix.size()) != password) {
        _log.info("Rejected configuration update, bad credentials");
        result = makeError("Unauthorized");
        return 401;
    }

    json req = json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object() || req.empty()) {
        result = makeError("No data provided");
        return 400;
    }
    json patch = expandKeys(req);
    // GET hands out blank secrets, sending one back means no change
    dropBlank(patch, "asterisk", "ami_secret");
    dropBlank(patch, "admin", "password");

    std::lock_guard<std::mutex> lock(_updateLock);

    json doc;
    if (fn.empty() || ConfigPoller::readDocument(fn.c_str(), doc) != 0) {
        _log.error("Unable to read configuration file %s", fn.c_str());
        result = makeError("Unable to read the configuration file");
        return 500;
    }
    doc.merge_patch(patch);

    try {
        Config check;
        check.fromJson(ConfigPoller::merge(doc));
    }
    catch (const json::exception& ex) {
        result = makeError("Invalid configuration");
        result["detail"] = ex.what();
        return 400;
    }
    catch (const std::invalid_argument& ex) {
        result = makeError("Invalid configuration");
        result["detail"] = ex.what();
        return 400;
    }

    if (ConfigPoller::writeDocument(fn.c_str(), doc) != 0) {
        _log.error("Unable to write configuration file %s", fn.c_str());
        result = makeError("Unable to write the configuration file");
        return 500;
    }

    _log.info("Configuration file %s updated", fn.c_str());
    result = makeResult("ok");
    return 200;
}

int WebUi::handleHandset(const std::string& body, json& result) {
    json req = json::parse(body, nullptr, false);
    if (req.is_discarded() || !req.is_object() || !req.contains("lifted") ||
        !req["lifted"].is_boolean()) {
        result = makeError("Expected {\"lifted\": true|false}");
        return 400;
    }
    if (req["lifted"].get<bool>())
        _call.handsetLifted();
    else 
        _call.handsetReplaced();
    result = makeResult("ok");
    result["status"] = CallStateMachine::stateName(_call.status().state);
    return 200;
}

bool WebUi::waitForChange(uint64_t revision, unsigned timeoutSec) {
    std::unique_lock<std::mutex> lock(_changeLock);
    return _changeCv.wait_for(lock, std::chrono::seconds(timeoutSec), 
        [this, revision]() { return _revision > revision || _stopping; });
}

int WebUi::start(const char* bindAddr, unsigned listenPort) {
    if (_svr)
        return -1;
    _bindAddr = bindAddr;
    _listenPort = listenPort;
    _svr.reset(new httplib::Server());
    _done = false;
    {
        std::lock_guard<std::mutex> lock(_changeLock);
        _stopping = false;
    }
    _worker = std::thread(&WebUi::_thread, this);
    return 0;
}

void WebUi::stop() {
    if (_svr) {
        // A stop() that lands before listen() would be lost
        for (unsigned i = 0; i < 200 && !_done.load() && !_svr->is_running(); i++)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        _svr->stop();
        // Release any long-polls
        {
            std::lock_guard<std::mutex> lock(_changeLock);
            _stopping = true;
        }
        _changeCv.notify_all();
        if (_worker.joinable())
            _worker.join();
        _svr.reset();
    }
}

void WebUi::_thread() {

    setThreadName("rp-ui");

    _log.info("HTTP server listening on %s:%u", _bindAddr.c_str(), _listenPort);

    httplib::Server& svr = *_svr;

    svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(makeResult("ok").dump(), JSON_TYPE);
    });

    // ------ Presence ---------------------------------------------------------

    svr.Get("/api/info", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(makeInfo().dump(), JSON_TYPE);
    });
    svr.Get("/api/phones", [this](const httplib::Request& req, httplib::Response& res) {
        // A client that passes the revision it has gets a long-poll
        if (req.has_param("revision")) {
            uint64_t rev = strtoull(req.get_param_value("revision").c_str(), 0, 10);
            waitForChange(rev, MAX_WAIT_SEC);
        }
        res.set_content(makePhones().dump(), JSON_TYPE);
    });

    // ------ Admin ------------------------------------------------------------

    svr.Get("/api/config", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(makeConfig().dump(), JSON_TYPE);
    });
    svr.Put("/api/config", [this](const httplib::Request& req, httplib::Response& res) {
        json result;
        res.status = handleConfigUpdate(req.get_header_value("Authorization"), 
            req.body, result);
        res.set_content(result.dump(), JSON_TYPE);
    });

    // ------ Call control -----------------------------------------------------

    svr.Get("/api/status", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(makeStatus().dump(), JSON_TYPE);
    });
    svr.Post("/api/call", [this](const httplib::Request& req, httplib::Response& res) {
        json result;
        res.status = handleCall(req.body, result);
        res.set_content(result.dump(), JSON_TYPE);
    });
    svr.Post("/api/handset", [this](const httplib::Request& req, httplib::Response& res) {
        json result;
        res.status = handleHandset(req.body, result);
        res.set_content(result.dump(), JSON_TYPE);
    });

    // The simple actions all look the same
    struct Action {
        const char* path;
        std::function<CallStateMachine::ActionResult()> fn;
    };
    Action actions[] = {
        { "/api/confirm", [this]() { return _call.confirm(); } },
        { "/api/cancel", [this]() { return _call.cancel(); } },
        { "/api/answer", [this]() { return _call.answer(); } },
        { "/api/hangup", [this]() { return _call.hangup(); } }
    };
    for (const Action& action : actions) {
        auto fn = action.fn;
        svr.Post(action.path, [this, fn](const httplib::Request&, httplib::Response& res) {
            json result;
            CallStateMachine::ActionResult r = fn();
            if (r == CallStateMachine::ActionResult::ACTION_OK) {
                result = makeResult("ok");
            } 
            else if (r == CallStateMachine::ActionResult::ACTION_UNREACHABLE) {
                res.status = 404;
                result = makeError("The other phone is no longer reachable");
            }
            else {
                res.status = 409;
                result = makeError("Not allowed in the current state");
            }
            result["status"] = CallStateMachine::stateName(_call.status().state);
            res.set_content(result.dump(), JSON_TYPE);
        });
    }

    if (!svr.listen(_bindAddr, _listenPort))
        _log.error("HTTP server unable to listen on port %u", _listenPort);
    else 
        _log.info("HTTP server stopped");

    _done = true;
}

}
