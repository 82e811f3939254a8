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

#include <filesystem>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "Task.h"

namespace kc1fsz {
class Log;
}

namespace redphone {

/**
 * Polls the configuration file and fires a callback any time the 
 * configuration changes. This should be the only thing that reads the
 * configuration file.
 *
 * The document handed to the callback always has every key: whatever the
 * file provides is merged on top of DEFAULT_CONFIG. A missing file means 
 * the defaults are used.
 */
class ConfigPoller : public Task {
public:

    static const char* DEFAULT_CONFIG;
    static const char* DEFAULT_CONFIG_FILE;

    /**
     * @param configChangeCb Called every time the configuration document 
     *   changes. May throw, a failure is logged and the previous 
     *   configuration stays in force.
     */
    ConfigPoller(kc1fsz::Log& log, const char* cfgFileName, 
        std::function<void(const nlohmann::json& cfg)> configChangeCb);

    /**
     * Checks the file right now. 
     *
     * @returns true if the callback was fired and accepted the document.
     */
    bool poll();

    /**
     * @returns The defaults with the document provided merged on top.
     */
    static nlohmann::json merge(const nlohmann::json& doc);

    /**
     * Reads the raw configuration document, without the defaults. A 
     * missing file reads as an empty object.
     *
     * @returns 0 on success, -1 if the file can't be read, -2 if it 
     *   doesn't hold a JSON object.
     */
    static int readDocument(const char* fn, nlohmann::json& doc);

    /**
     * Replaces the configuration file. The poller picks up the change on
     * its next pass.
     *
     * @returns 0 on success.
     */
    static int writeDocument(const char* fn, const nlohmann::json& doc);

    // ----- Task ------------------------------------------------------------

    virtual void oneSecTick() { poll(); }

private: 

    kc1fsz::Log& _log;
    const std::string _fn;
    std::function<void(const nlohmann::json& cfg)> _cb;
    std::filesystem::file_time_type _lastUpdate;
    bool _startup = true;
    bool _missingFileReported = false;
};

}
