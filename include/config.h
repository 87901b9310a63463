/*
 * This file is part of TweakGuard.
 *
 * Copyright (c) 2025 Ian Anthony R. Tancinco
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

#ifndef TWEAKGUARD_CONFIG_H
#define TWEAKGUARD_CONFIG_H

#include "constants.h"
#include <filesystem>
#include <istream>
#include <string>

// Runtime settings from config.ini [global]
struct AppConfig
{
    int serviceTimeoutMs = DEFAULT_SERVICE_TIMEOUT_MS;
    int powerTimeoutMs = DEFAULT_POWER_TIMEOUT_MS;
    bool restoreStartTypes = false;
    bool verifyWrites = true;
    int configVersion = 0;   // [meta] version, 0 when missing
};

// <appdata>/config.ini
std::filesystem::path GetConfigPath();

bool CreateDefaultConfig(const std::filesystem::path& configPath);

// Parses INI text. Unknown keys are ignored; invalid values keep the
// default and are logged.
AppConfig ParseConfig(std::istream& in);

// Creates the file from the default template when missing. An outdated
// file is kept as config.ini.old and replaced by the current template.
AppConfig LoadConfig(const std::filesystem::path& configPath);

#endif // TWEAKGUARD_CONFIG_H
