#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"

#include "redphone/Presence.h"
#include "DiscoveryEngine.h"
#include "CallStateMachine.h"
#include "Config.h"
#include "ConfigPoller.h"
#include "WebUi.h"
#include "tests/TestUtil.h"

using namespace std;
using namespace kc1fsz;
using namespace redphone;
using json = nlohmann::json;

static SelfIdentity makeSelf() {
    SelfIdentity self;
    self.hostName = "kitchen";
    self.displayName = "Kitchen";
    self.extension = 101;
    self.identity = makeIdentity("kitchen", 101);
    return self;
}

static void documentTest() {

    Log log;
    TestClock clock(log);
    clock.setTime(1000);
    FakePbx pbx;
    ManualSource local("local");
    DiscoveryEngine engine(log, clock, makeSelf());
    engine.addSource(&local);
    engine.start();
    CallStateMachine machine(log, clock, pbx, engine, makeSelf());
    machine.setWallClock([]() { return (time_t)1704067200 + 43200; });
    WebUi ui(log, clock, engine, machine, makeSelf());

    json info = ui.makeInfo();
    assert(info["extension"] == 101);
    assert(info["name"] == "Kitchen");
    assert(info["identity"] == "kitchen/101");
    assert(info["status"] == "IDLE");

    local.announce(makeRecord("bedroom", 102, "Bedroom", "192.168.1.22", 1000));
    local.announce(makeRecord("garage", 104, "Garage", "100.64.0.4", 1000,
        PresenceRecord::Tier::TIER_VPN_DIRECTORY));

    json phones = ui.makePhones();
    assert(phones["phones"].size() == 2);
    assert(phones["phones"][0]["identity"] == "bedroom/102");
    assert(phones["phones"][0]["source"] == "local");
    assert(phones["phones"][0]["status"] == "online");
    assert(phones["phones"][1]["name"] == "Garage");
    assert(phones["phones"][1]["source"] == "vpn-directory");
    assert(phones["revision"] == engine.revision());

    json status = ui.makeStatus();
    assert(status["status"] == "IDLE");
    assert(status["current_call"].is_null());
    assert(status["is_quiet_hours"] == false);

    // Dialing through the API
    json result;
    assert(ui.handleCall("{\"identity\":\"nowhere/1\"}", result) == 404);
    assert(result["result"] == "unreachable");
    assert(ui.handleCall("not json", result) == 400);
    assert(ui.handleCall("{\"id\":\"bedroom/102\"}", result) == 400);
    assert(ui.handleCall("{\"identity\":102}", result) == 400);

    assert(ui.handleCall("{\"identity\":\"bedroom/102\"}", result) == 200);
    assert(result["result"] == "accepted");
    assert(result["status"] == "CALLING");
    assert(pbx.count("dial") == 1);

    status = ui.makeStatus();
    assert(status["status"] == "CALLING");
    assert(status["current_call"]["identity"] == "bedroom/102");
    assert(status["current_call"]["role"] == "caller");

    // Already busy
    assert(ui.handleCall("{\"identity\":\"garage/104\"}", result) == 409);
    assert(result["result"] == "busy");

    // The handset can be driven too
    assert(ui.handleHandset("{\"lifted\":\"yes\"}", result) == 400);
    assert(ui.handleHandset("{\"lifted\":false}", result) == 200);
    assert(result["status"] == "IDLE");
    assert(pbx.count("terminate") == 1);
    assert(ui.handleHandset("{\"lifted\":true}", result) == 200);
    assert(result["status"] == "DIALING");
    assert(ui.makeStatus()["handset_lifted"] == true);
}

static void waitTest() {

    Log log;
    TestClock clock(log);
    FakePbx pbx;
    ManualSource local("local");
    DiscoveryEngine engine(log, clock, makeSelf());
    engine.addSource(&local);
    engine.start();
    CallStateMachine machine(log, clock, pbx, engine, makeSelf());
    WebUi ui(log, clock, engine, machine, makeSelf());

    uint64_t rev = ui.makePhones()["revision"].get<uint64_t>();
    assert(!ui.waitForChange(rev, 0));

    local.announce(makeRecord("bedroom", 102, "Bedroom", "192.168.1.22", 10));
    // Waiters hear about it once the engine notifies
    engine.notifyIfChanged();
    assert(ui.waitForChange(rev, 0));
    uint64_t rev2 = ui.makePhones()["revision"].get<uint64_t>();
    assert(rev2 > rev);
    assert(!ui.waitForChange(rev2, 0));
}

static void configTest() {

    Log log;
    TestClock clock(log);
    FakePbx pbx;
    DiscoveryEngine engine(log, clock, makeSelf());
    CallStateMachine machine(log, clock, pbx, engine, makeSelf());
    WebUi ui(log, clock, engine, machine, makeSelf());

    std::filesystem::path fn = std::filesystem::temp_directory_path() /
        ("redphone-webui-test-" + to_string(getpid()) + ".json");
    std::filesystem::remove(fn);
    {
        ofstream f(fn);
        f << R"({ "phone": { "name": "Kitchen", "extension": 101 }, 
            "asterisk": { "ami_secret": "s3cret" } })";
    }
    ui.setConfigFile(fn.string());

    Config cfg;
    cfg.fromJson(ConfigPoller::merge(json::parse(R"({ 
        "phone": { "name": "Kitchen", "extension": 101 },
        "asterisk": { "ami_secret": "s3cret" } })")));
    ui.setConfig(cfg);

    // Reading is open, secrets are blanked
    json doc = ui.makeConfig();
    assert(doc["phone"]["name"] == "Kitchen");
    assert(doc["asterisk"]["ami_secret"] == "");
    assert(doc["admin"]["enabled"] == false);

    const string update = R"({ "quiet_hours.enabled": false })";
    json result;

    // Admin is off by default
    assert(ui.handleConfigUpdate("Bearer x", update, result) == 403);

    // On, but without a password it stays closed
    cfg.adminEnabled = true;
    ui.setConfig(cfg);
    assert(ui.handleConfigUpdate("Bearer ", update, result) == 403);

    cfg.adminPassword = "letmein";
    ui.setConfig(cfg);
    assert(ui.handleConfigUpdate("", update, result) == 401);
    assert(ui.handleConfigUpdate("Bearer wrong", update, result) == 401);
    assert(ui.handleConfigUpdate("letmein", update, result) == 401);
    assert(ui.makeConfig()["admin"]["password"] == "");

    assert(ui.handleConfigUpdate("Bearer letmein", "not json", result) == 400);
    assert(ui.handleConfigUpdate("Bearer letmein", "{}", result) == 400);
    // Bad values are refused and nothing is written
    assert(ui.handleConfigUpdate("Bearer letmein", 
        R"({ "quiet_hours": { "start": "25:00" } })", result) == 400);
    json file;
    assert(ConfigPoller::readDocument(fn.c_str(), file) == 0);
    assert(!file.contains("quiet_hours"));

    // Dotted and nested keys, blank secret left alone
    assert(ui.handleConfigUpdate("Bearer letmein", R"({ 
        "quiet_hours.enabled": false, 
        "phone": { "name": "Pantry" },
        "asterisk": { "ami_secret": "" } })", result) == 200);
    assert(result["result"] == "ok");
    assert(ConfigPoller::readDocument(fn.c_str(), file) == 0);
    assert(file["quiet_hours"]["enabled"] == false);
    assert(file["phone"]["name"] == "Pantry");
    assert(file["phone"]["extension"] == 101);
    assert(file["asterisk"]["ami_secret"] == "s3cret");

    // The poller sees the new document
    unsigned calls = 0;
    Config loaded;
    ConfigPoller poller(log, fn.c_str(), [&calls, &loaded](const json& j) {
        loaded.fromJson(j);
        calls++;
    });
    assert(poller.poll());
    assert(calls == 1);
    assert(loaded.phoneName == "Pantry");
    assert(!loaded.quietHours.enabled);
    assert(loaded.amiSecret == "s3cret");

    std::filesystem::remove(fn);
}

// A call waiting for confirmation whose target went away
static void unreachableTest() {

    Log log;
    TestClock clock(log);
    clock.setTime(1000);
    FakePbx pbx;
    ManualSource local("local");
    DiscoveryEngine engine(log, clock, makeSelf());
    engine.addSource(&local);
    engine.start();
    CallStateMachine machine(log, clock, pbx, engine, makeSelf());
    QuietHoursWindow w;
    w.enabled = true;
    w.startMin = 22 * 60;
    w.endMin = 8 * 60;
    w.timezone = "UTC";
    machine.setQuietHours(w);
    // 23:30
    machine.setWallClock([]() { return (time_t)1704067200 + 84600; });
    WebUi ui(log, clock, engine, machine, makeSelf());

    local.announce(makeRecord("bedroom", 102, "Bedroom", "192.168.1.22", 1000));
    json result;
    assert(ui.handleCall("{\"identity\":\"bedroom/102\"}", result) == 200);
    assert(result["status"] == "AWAITING_CONFIRMATION");

    clock.setTime(200 * 1000);
    engine.sweep();
    assert(machine.confirm() == CallStateMachine::ActionResult::ACTION_UNREACHABLE);
    assert(ui.makeStatus()["status"] == "IDLE");
    assert(pbx.count("dial") == 0);
}

int main(int, const char**) {
    documentTest();
    waitTest();
    configTest();
    unreachableTest();
    cout << "webui-test OK" << endl;
}
