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

#include <functional>

namespace kc1fsz {
class Log;
class Clock;
}

namespace redphone {

class Task;

class EventLoop {
public:

    /**
     * Runs the tasks until the callback asks to stop.
     *
     * @param cb (Optional) Called on every cycle. If false is
     * returned then the loop exits.
     */
    static void run(kc1fsz::Log& log, kc1fsz::Clock& clock, 
        Task** tasks, unsigned tasksLen,
        std::function<bool()> cb = nullptr,
        bool trace = false);    
};

}
