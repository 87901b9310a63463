#ifndef TWEAKGUARD_LOGGER_H
#define TWEAKGUARD_LOGGER_H

#include <string>
#include <filesystem>

// Log a message to the per-user log file
void Log(const std::string& msg);

// Per-user application directory (log, config, backups). Created on demand.
std::filesystem::path GetAppDataPath();

#endif // TWEAKGUARD_LOGGER_H
