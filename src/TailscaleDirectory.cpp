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
#include <cstdio>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "kc1fsz-tools/Log.h"

#include "TailscaleDirectory.h"

using namespace std;
using namespace kc1fsz;
using json = nlohmann::json;

namespace redphone {

static const char* STATUS_URL = "http://local-tailscaled.sock/localapi/v0/status";
static const char* USER_AGENT = "redphone-libcurl-agent/1.0";
// Status documents on a big tailnet can be large, but not this large
static const size_t MAX_BODY_SIZE = 4 * 1024 * 1024;

TailscaleDirectory::TailscaleDirectory(Log& log, const char* socketPath, 
    const char* tag, unsigned infoPort) 
:   _log(log),
    _socketPath(socketPath),
    _tag(tag),
    _infoPort(infoPort) {
}

int TailscaleDirectory::listTaggedPeers(std::vector<DirectoryEntry>& peers) {

    std::string body;
    if (_get(STATUS_URL, _socketPath.c_str(), 10L, body) != 0)
        return -1;

    int rc = parseStatus(body, _tag.c_str(), peers);
    if (rc < 0) {
        _log.error("Unable to parse Tailscale status");
        return -1;
    }

    // Ask each phone who it is
    for (DirectoryEntry& entry : peers) {
        char url[128];
        snprintf(url, sizeof(url), "http://%s:%u/api/info", entry.address.c_str(),
            _infoPort);
        std::string infoBody;
        if (_get(url, 0, 2L, infoBody) != 0 || parseInfo(infoBody, entry) != 0) {
            if (_trace)
                _log.info("No phone info from %s", entry.address.c_str());
        }
    }

    return (int)peers.size();
}

int TailscaleDirectory::parseStatus(const std::string& doc, const char* tag,
    std::vector<DirectoryEntry>& peers) {

    json o = json::parse(doc, nullptr, false);
    if (o.is_discarded() || !o.is_object())
        return -1;
    if (!o.contains("Peer") || !o["Peer"].is_object())
        return 0;

    std::string fullTag("tag:");
    fullTag += tag;

    int count = 0;
    for (const auto& peer : o["Peer"]) {
        if (!peer.is_object())
            continue;
        if (!peer.contains("Tags") || !peer["Tags"].is_array())
            continue;
        bool tagged = false;
        for (const auto& t : peer["Tags"])
            if (t.is_string() && t.get<std::string>() == fullTag)
                tagged = true;
        if (!tagged)
            continue;
        if (!peer.contains("Online") || !peer["Online"].is_boolean() ||
            !peer["Online"].get<bool>())
            continue;
        if (!peer.contains("TailscaleIPs") || !peer["TailscaleIPs"].is_array() ||
            peer["TailscaleIPs"].empty() || !peer["TailscaleIPs"][0].is_string())
            continue;
        if (!peer.contains("HostName") || !peer["HostName"].is_string())
            continue;

        DirectoryEntry entry;
        entry.hostName = peer["HostName"].get<std::string>();
        if (entry.hostName.empty())
            continue;
        entry.address = peer["TailscaleIPs"][0].get<std::string>();
        if (peer.contains("DisplayName") && peer["DisplayName"].is_string())
            entry.displayName = peer["DisplayName"].get<std::string>();
        else 
            entry.displayName = entry.hostName;
        peers.push_back(entry);
        count++;
    }

    return count;
}

int TailscaleDirectory::parseInfo(const std::string& doc, DirectoryEntry& entry) {
    json o = json::parse(doc, nullptr, false);
    if (o.is_discarded() || !o.is_object())
        return -1;
    if (!o.contains("extension") || !o["extension"].is_number_unsigned())
        return -1;
    unsigned ext = o["extension"].get<unsigned>();
    if (ext == 0)
        return -1;
    entry.extension = ext;
    if (o.contains("name") && o["name"].is_string() && 
        !o["name"].get<std::string>().empty())
        entry.displayName = o["name"].get<std::string>();
    return 0;
}

int TailscaleDirectory::_get(const char* url, const char* unixSocketPath,
    long timeoutSec, std::string& body) {

    CURL* curl = curl_easy_init();
    if (!curl) {
        _log.error("Unable to create HTTP client");
        return -1;
    }

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, _writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_URL, url);
    if (unixSocketPath)
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, unixSocketPath);
    curl_easy_setopt(curl, CURLOPT_FORBID_REUSE, 1L); 
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeoutSec);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeoutSec);

    int result = 0;
    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK) {
        if (_trace)
            _log.info("Request to %s failed: %s", url, curl_easy_strerror(res));
        result = -1;
    }
    else {
        long http_code = 0;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        if (http_code != 200) {
            if (_trace)
                _log.info("Request to %s failed with HTTP %ld", url, http_code);
            result = -1;
        }
    }

    curl_easy_cleanup(curl);
    return result;
}

size_t TailscaleDirectory::_writeCallback(void* contents, size_t size, 
    size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    std::string* body = (std::string*)userp;
    // Returning short aborts the transfer
    if (body->size() + realsize > MAX_BODY_SIZE)
        return 0;
    body->append((const char*)contents, realsize);
    return realsize;
}

}
