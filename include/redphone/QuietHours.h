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

#include <ctime>
#include <string>

namespace redphone {

/**
 * A time-of-day window during which calls need to be confirmed.
 * The window is [start, end). If start is after end then the window
 * spans midnight.
 */
struct QuietHoursWindow {
    bool enabled = false;
    // Minutes since midnight
    unsigned startMin = 22 * 60;
    unsigned endMin = 8 * 60;
    // An IANA zone name like "America/New_York"
    std::string timezone = "UTC";
};

/**
 * @returns Minutes since midnight for a "HH:MM" string, or -1 if
 * the string isn't a valid time.
 */
int parseTimeOfDay(const char* hhmm);

/**
 * @returns "HH:MM" for the minute-of-day provided.
 */
std::string formatTimeOfDay(unsigned minuteOfDay);

/**
 * @returns Seconds since midnight of the time provided, as seen in
 * the named timezone. Unknown zones are treated as UTC.
 */
unsigned secondOfDay(time_t now, const std::string& timezone);

/**
 * @returns true if the second-of-day falls inside of [startMin, endMin).
 */
bool isInsideWindow(unsigned secOfDay, unsigned startMin, unsigned endMin);

/**
 * The quiet-hours gate. No side-effects, safe to call from any thread.
 *
 * @returns true if placing a call at this time needs an explicit
 * confirmation from the user.
 */
bool requiresConfirmation(time_t now, const QuietHoursWindow& window);

/**
 * @returns A human-readable description of the window.
 */
std::string describe(const QuietHoursWindow& window);

}
