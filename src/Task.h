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

struct pollfd;

namespace redphone {

/**
 * A unit of work serviced by the EventLoop on the main thread.
 */
class Task {
public:

    virtual ~Task() { }

    /**
     * Adds the descriptors this task is waiting on to the poll list.
     *
     * @returns How many entries were added, or -1 if fdsCapacity is 
     * too small.
     */
    virtual int getPolls(pollfd* fds, unsigned fdsCapacity) { return 0; }

    /**
     * Called after every poll wakeup, and again right away as long as 
     * some task reports unfinished work.
     *
     * @returns true if this task has more to do.
     */
    virtual bool run2() { return false; }

    virtual void oneSecTick() { }
    
    virtual void tenSecTick() { }
};

}
