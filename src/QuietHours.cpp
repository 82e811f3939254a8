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
#include <chrono>
#include <cstdio>
#include <stdexcept>

#include <date/tz.h>

#include "redphone/QuietHours.h"

// https://github.com/HowardHinnant/date

namespace redphone {

static const date::time_zone* findZone(const std::string& tz) {
    if (tz.empty())
        return 0;
    try {
        return date::locate_zone(tz);
    }
    catch (const std::runtime_error&) {
        return 0;
    }
}

int parseTimeOfDay(const char* hhmm) {
    if (hhmm == 0)
        return -1;
    unsigned h = 0, m = 0;
    char extra = 0;
    if (sscanf(hhmm, "%u:%u%c", &h, &m, &extra) != 2)
        return -1;
    if (h > 23 || m > 59)
        return -1;
    return h * 60 + m;
}

std::string formatTimeOfDay(unsigned minuteOfDay) {
    char buf[8];
    snprintf(buf, sizeof(buf), "%02u:%02u", (minuteOfDay / 60) % 24, minuteOfDay % 60);
    return std::string(buf);
}

unsigned secondOfDay(time_t now, const std::string& timezone) {
    const date::sys_seconds utc{std::chrono::seconds{now}};
    std::chrono::seconds sinceMidnight;
    const date::time_zone* zone = findZone(timezone);
    if (zone) {
        const date::local_seconds local = zone->to_local(utc);
        sinceMidnight = local - date::floor<date::days>(local);
    }
    else {
        sinceMidnight = utc - date::floor<date::days>(utc);
    }
    return (unsigned)sinceMidnight.count();
}

bool isInsideWindow(unsigned secOfDay, unsigned startMin, unsigned endMin) {
    const unsigned startSec = startMin * 60;
    const unsigned endSec = endMin * 60;
    // Empty window
    if (startSec == endSec)
        return false;
    if (startSec < endSec)
        return secOfDay >= startSec && secOfDay < endSec;
    // Window spans midnight
    else 
        return secOfDay >= startSec || secOfDay < endSec;
}

bool requiresConfirmation(time_t now, const QuietHoursWindow& window) {
    if (!window.enabled)
        return false;
    return isInsideWindow(secondOfDay(now, window.timezone), 
        window.startMin, window.endMin);
}

std::string describe(const QuietHoursWindow& window) {
    if (!window.enabled)
        return std::string("Quiet hours disabled");
    std::string r("Quiet hours: ");
    r += formatTimeOfDay(window.startMin);
    r += " - ";
    r += formatTimeOfDay(window.endMin);
    r += " (";
    r += window.timezone;
    r += ")";
    return r;
}

}
