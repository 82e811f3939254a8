#include <iostream>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"

#include "Config.h"
#include "ConfigPoller.h"

using namespace std;
using namespace kc1fsz;
using namespace redphone;
using json = nlohmann::json;

static void defaultsTest() {

    Config cfg;
    cfg.fromJson(ConfigPoller::merge(json::object()));
    assert(cfg.phoneName == "RedPhone");
    assert(cfg.extension == 100);
    assert(cfg.quietHours.enabled);
    assert(cfg.quietHours.startMin == 22 * 60);
    assert(cfg.quietHours.endMin == 8 * 60);
    assert(cfg.quietHours.timezone == "UTC");
    assert(cfg.udpBroadcast);
    assert(cfg.udpPort == 5199);
    assert(cfg.announceInterval == 30);
    assert(cfg.phoneTimeout == 120);
    assert(cfg.vpnBroadcast.empty());
    assert(cfg.vpnUdpPort == 5200);
    assert(cfg.tailscaleApi);
    assert(cfg.pollInterval == 30);
    assert(cfg.networkTag == "redphone");
    assert(cfg.amiPort == 5038);
    assert(cfg.amiUser == "redphone");
    assert(cfg.inboundContext == "redphone-inbound");
    assert(!cfg.gpioEnabled);
    assert(cfg.uiPort == 5000);
    assert(!cfg.adminEnabled);
    assert(cfg.adminPassword.empty());
    assert(!cfg.isDebug());
}

static void mergeTest() {

    // Only what's in the file changes, everything else keeps its default
    json doc = json::parse(R"({
        "phone": { "name": "Kitchen", "extension": 101, "hostname": "kitchen" },
        "quiet_hours": { "start": "21:30", "timezone": "America/New_York" },
        "discovery": { "vpn_broadcast": "100.127.255.255" },
        "asterisk": { "ami_secret": "s3cret" },
        "admin": { "enabled": true, "password": "letmein" },
        "logging": { "level": "DEBUG" }
    })");

    Config cfg;
    cfg.fromJson(ConfigPoller::merge(doc));
    assert(cfg.phoneName == "Kitchen");
    assert(cfg.extension == 101);
    assert(cfg.quietHours.enabled);
    assert(cfg.quietHours.startMin == 21 * 60 + 30);
    assert(cfg.quietHours.endMin == 8 * 60);
    assert(cfg.quietHours.timezone == "America/New_York");
    assert(cfg.vpnBroadcast == "100.127.255.255");
    assert(cfg.udpPort == 5199);
    assert(cfg.amiSecret == "s3cret");
    assert(cfg.isDebug());

    SelfIdentity self = cfg.makeSelf();
    assert(self.identity == "kitchen/101");
    assert(self.displayName == "Kitchen");
    assert(self.uiPort == 5000);

    // The secret never goes back out
    json out = cfg.toJson();
    assert(out["asterisk"]["ami_secret"] == "");
    assert(cfg.adminEnabled);
    assert(cfg.adminPassword == "letmein");
    assert(out["admin"]["enabled"] == true);
    assert(out["admin"]["password"] == "");
    assert(out["quiet_hours"]["start"] == "21:30");
    assert(out["phone"]["extension"] == 101);

    // An empty host name falls back to the system
    Config cfg2;
    cfg2.fromJson(ConfigPoller::merge(json::object()));
    SelfIdentity self2 = cfg2.makeSelf();
    assert(!self2.hostName.empty());
    assert(self2.identity == self2.hostName + "/100");
}

static bool rejects(const char* text) {
    Config cfg;
    try {
        cfg.fromJson(ConfigPoller::merge(json::parse(text)));
    } catch (const json::exception&) {
        return true;
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static void invalidTest() {
    assert(rejects(R"({ "quiet_hours": { "start": "25:00" } })"));
    assert(rejects(R"({ "quiet_hours": { "end": "eight" } })"));
    assert(rejects(R"({ "quiet_hours": { "enabled": "yes" } })"));
    assert(rejects(R"({ "phone": { "extension": 0 } })"));
    assert(rejects(R"({ "phone": { "extension": "101" } })"));
    assert(rejects(R"({ "discovery": { "phone_timeout": 0 } })"));
    assert(rejects(R"({ "discovery": { "udp_port": "x" } })"));
    assert(rejects(R"({ "gpio": { "hook_logic": "sideways" } })"));
    assert(!rejects(R"({ "gpio": { "hook_logic": "low_on_lift" } })"));
}

static void pollerTest() {

    Log log;

    std::filesystem::path fn = std::filesystem::temp_directory_path() /
        ("redphone-config-test-" + to_string(getpid()) + ".json");
    std::filesystem::remove(fn);

    unsigned calls = 0;
    Config current;
    ConfigPoller poller(log, fn.c_str(), [&calls, &current](const json& j) {
        Config c;
        c.fromJson(j);
        current = c;
        calls++;
    });

    // No file, the defaults are used once
    assert(poller.poll());
    assert(calls == 1);
    assert(current.extension == 100);
    assert(!poller.poll());
    assert(calls == 1);

    {
        ofstream f(fn);
        f << R"({ "phone": { "name": "Kitchen", "extension": 101 } })";
    }
    std::filesystem::last_write_time(fn, 
        std::filesystem::file_time_type::clock::now() - std::chrono::seconds(60));
    assert(poller.poll());
    assert(calls == 2);
    assert(current.extension == 101);

    // Unchanged
    assert(!poller.poll());
    assert(calls == 2);

    // Broken file, the old configuration stays
    {
        ofstream f(fn);
        f << "{ \"phone\": ";
    }
    std::filesystem::last_write_time(fn, 
        std::filesystem::file_time_type::clock::now() - std::chrono::seconds(30));
    assert(!poller.poll());
    assert(calls == 2);
    assert(current.extension == 101);

    // Valid JSON, invalid value
    {
        ofstream f(fn);
        f << R"({ "quiet_hours": { "start": "99:99" } })";
    }
    std::filesystem::last_write_time(fn, 
        std::filesystem::file_time_type::clock::now() - std::chrono::seconds(20));
    assert(!poller.poll());
    assert(calls == 2);
    assert(current.extension == 101);

    // Fixed
    {
        ofstream f(fn);
        f << R"({ "phone": { "extension": 105 }, "quiet_hours": { "enabled": false } })";
    }
    std::filesystem::last_write_time(fn, 
        std::filesystem::file_time_type::clock::now() - std::chrono::seconds(10));
    poller.oneSecTick();
    assert(calls == 3);
    assert(current.extension == 105);
    assert(!current.quietHours.enabled);

    std::filesystem::remove(fn);
}

static void documentTest() {

    std::filesystem::path fn = std::filesystem::temp_directory_path() /
        ("redphone-document-test-" + to_string(getpid()) + ".json");
    std::filesystem::remove(fn);

    // Missing reads as empty
    json doc;
    assert(ConfigPoller::readDocument(fn.c_str(), doc) == 0);
    assert(doc.is_object() && doc.empty());

    doc["phone"]["extension"] = 107;
    assert(ConfigPoller::writeDocument(fn.c_str(), doc) == 0);
    assert(!std::filesystem::exists(fn.string() + ".tmp"));

    json back;
    assert(ConfigPoller::readDocument(fn.c_str(), back) == 0);
    assert(back == doc);

    {
        ofstream f(fn);
        f << "[1, 2]";
    }
    assert(ConfigPoller::readDocument(fn.c_str(), back) == -2);

    // Nowhere to write
    assert(ConfigPoller::writeDocument("/nonexistent-dir/config.json", doc) != 0);

    std::filesystem::remove(fn);
}

int main(int, const char**) {
    defaultsTest();
    mergeTest();
    invalidTest();
    pollerTest();
    documentTest();
    cout << "config-test OK" << endl;
}
