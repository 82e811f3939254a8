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
#include <execinfo.h>
#include <signal.h>
#include <unistd.h>

#include <atomic>
#include <cstdio>
#include <iterator>
#include <iostream>
#include <string>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"
#include "kc1fsz-tools/linux/StdClock.h"

#include "redphone/Presence.h"

#include "AmiPbx.h"
#include "BroadcastSource.h"
#include "CallStateMachine.h"
#include "Config.h"
#include "ConfigPoller.h"
#include "ConsoleFileLog.h"
#include "DirectorySource.h"
#include "DiscoveryEngine.h"
#include "EventLoop.h"
#include "GpioHookSwitch.h"
#include "TailscaleDirectory.h"
#include "ThreadUtil.h"
#include "WebUi.h"

using namespace std;
using namespace kc1fsz;
using namespace redphone;
using json = nlohmann::json;

static const char* LOCAL_BROADCAST_ADDR = "255.255.255.255";

static std::atomic<bool> stopRequested(false);

static void sigHandler(int sig) {
    void *array[32];
    // get void*'s for all entries on the stack
    size_t size = backtrace(array, 32);
    // print out all the frames to stderr
    fprintf(stderr, "Error: signal %d:\n", sig);
    backtrace_symbols_fd(array, size, STDERR_FILENO);
    // Now do the regular thing
    signal(sig, SIG_DFL); 
    raise(sig);
}

static void stopHandler(int) {
    stopRequested = true;
}

int main(int argc, const char** argv) {

    signal(SIGSEGV, sigHandler);
    signal(SIGINT, stopHandler);
    signal(SIGTERM, stopHandler);

    setThreadName("rp-main");

    ConsoleFileLog log;
    log.info("Red-Phone core starting");

    CURLcode res = curl_global_init(CURL_GLOBAL_ALL);
    if (res) {
        log.error("Unable to initialize libcurl (%d)", (int)res);
        return -1;
    }

    StdClock clock;

    const char* cfgFileName = argc > 1 ? argv[1] : ConfigPoller::DEFAULT_CONFIG_FILE;

    // These get filled in once everything is built so that later 
    // configuration changes can be applied
    Config cfg;
    bool running = false;
    DiscoveryEngine* discoveryPtr = 0;
    CallStateMachine* callPtr = 0;
    AmiPbx* pbxPtr = 0;
    BroadcastSource* localSourcePtr = 0;
    BroadcastSource* vpnSourcePtr = 0;
    DirectorySource* directorySourcePtr = 0;
    TailscaleDirectory* tailscalePtr = 0;
    WebUi* webUiPtr = 0;

    ConfigPoller cfgPoller(log, cfgFileName, 
        // This function will be called on any update to the configuration document.
        [&](const json& doc) {
            Config newCfg;
            newCfg.fromJson(doc);

            if (log.setFile(newCfg.logFile) != 0)
                log.error("Unable to open log file %s", newCfg.logFile.c_str());
            const bool trace = newCfg.isDebug();

            if (callPtr) {
                callPtr->setQuietHours(newCfg.quietHours);
                callPtr->setTrace(trace);
            }
            if (discoveryPtr) {
                discoveryPtr->setThresholds(newCfg.phoneTimeout, 10 * newCfg.phoneTimeout);
                discoveryPtr->setSweepInterval(newCfg.sweepInterval);
                discoveryPtr->setTrace(trace);
            }
            if (pbxPtr) {
                pbxPtr->configure(newCfg.amiHost.c_str(), newCfg.amiPort, 
                    newCfg.amiUser.c_str(), newCfg.amiSecret.c_str(),
                    newCfg.dialTemplate.c_str(), newCfg.localChannel.c_str(),
                    newCfg.inboundContext.c_str(), newCfg.answerCommand.c_str());
                pbxPtr->setTrace(trace);
            }
            if (localSourcePtr) localSourcePtr->setTrace(trace);
            if (vpnSourcePtr) vpnSourcePtr->setTrace(trace);
            if (directorySourcePtr) directorySourcePtr->setTrace(trace);
            if (tailscalePtr) tailscalePtr->setTrace(trace);
            if (webUiPtr) webUiPtr->setConfig(newCfg);

            if (running) {
                json before = cfg.toJson();
                json after = newCfg.toJson();
                if (before["phone"] != after["phone"] || 
                    before["discovery"] != after["discovery"] ||
                    before["network"] != after["network"] ||
                    before["gpio"] != after["gpio"] ||
                    before["ui"] != after["ui"])
                    log.info("Some configuration changes take effect after a restart");
            }

            cfg = newCfg;
        }
    );

    // The first load happens before anything is built
    if (!cfgPoller.poll())
        log.info("Using built-in configuration");

    const SelfIdentity self = cfg.makeSelf();
    const bool trace = cfg.isDebug();
    log.info("This phone is %s (%s)", self.identity.c_str(), self.displayName.c_str());

    // ----- Discovery -------------------------------------------------------

    BroadcastSource localSource(log, clock, PresenceRecord::Tier::TIER_LOCAL_SEGMENT,
        LOCAL_BROADCAST_ADDR, cfg.udpPort, cfg.announceInterval);
    localSource.setTrace(trace);
    BroadcastSource vpnSource(log, clock, PresenceRecord::Tier::TIER_VPN_BROADCAST,
        cfg.vpnBroadcast.c_str(), cfg.vpnUdpPort, cfg.announceInterval);
    vpnSource.setTrace(trace);
    TailscaleDirectory tailscale(log, cfg.tailscaleSocket.c_str(), 
        cfg.networkTag.c_str(), cfg.uiPort);
    tailscale.setTrace(trace);
    DirectorySource directorySource(log, clock, tailscale, cfg.pollInterval);
    directorySource.setTrace(trace);

    DiscoveryEngine discovery(log, clock, self);
    discovery.setThresholds(cfg.phoneTimeout, 10 * cfg.phoneTimeout);
    discovery.setSweepInterval(cfg.sweepInterval);
    discovery.setTrace(trace);
    if (cfg.udpBroadcast)
        discovery.addSource(&localSource);
    if (!cfg.vpnBroadcast.empty())
        discovery.addSource(&vpnSource);
    if (cfg.tailscaleApi)
        discovery.addSource(&directorySource);

    // ----- Calls -----------------------------------------------------------

    AmiPbx pbx(log, clock);
    pbx.setTrace(trace);
    pbx.configure(cfg.amiHost.c_str(), cfg.amiPort, cfg.amiUser.c_str(), 
        cfg.amiSecret.c_str(), cfg.dialTemplate.c_str(), cfg.localChannel.c_str(),
        cfg.inboundContext.c_str(), cfg.answerCommand.c_str());

    CallStateMachine call(log, clock, pbx, discovery, self);
    call.setTrace(trace);
    call.setQuietHours(cfg.quietHours);
    pbx.setEventSink(&call);

    GpioHookSwitch hookSwitch(log, clock, [&call](bool lifted) {
        if (lifted)
            call.handsetLifted();
        else 
            call.handsetReplaced();
    });
    if (cfg.gpioEnabled) {
        if (hookSwitch.open(cfg.hookPin, 
            GpioHookSwitch::parseLogic(cfg.hookLogic.c_str())) != 0)
            log.error("Hook switch unavailable, use /api/handset instead");
    }

    WebUi webUi(log, clock, discovery, call, self);
    webUi.setConfig(cfg);
    webUi.setConfigFile(cfgFileName);
    if (webUi.start("0.0.0.0", cfg.uiPort) != 0)
        log.error("Unable to start the HTTP server");

    discovery.start();

    discoveryPtr = &discovery;
    callPtr = &call;
    pbxPtr = &pbx;
    localSourcePtr = &localSource;
    vpnSourcePtr = &vpnSource;
    directorySourcePtr = &directorySource;
    tailscalePtr = &tailscale;
    webUiPtr = &webUi;
    running = true;

    // Main loop        
    Task* tasks[] = { &discovery, &call, &pbx, &hookSwitch, &cfgPoller };
    EventLoop::run(log, clock, tasks, std::size(tasks), 
        []() { return !stopRequested.load(); }, trace);

    log.info("Stopping");

    webUi.stop();
    discovery.stop();
    hookSwitch.close();
    pbx.setEventSink(0);
    pbx.disconnect();

    curl_global_cleanup();

    log.info("Done");

    return 0;
}
