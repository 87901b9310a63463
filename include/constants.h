#ifndef TWEAKGUARD_CONSTANTS_H
#define TWEAKGUARD_CONSTANTS_H

// Config
static constexpr char CONFIG_FILENAME[] = "config.ini";
static constexpr int CONFIG_VERSION = 1; // Increment when config structure changes

// Snapshot slots: <appdata>/backups/<subsystem>_snapshot.json
static constexpr char BACKUP_DIRNAME[] = "backups";
static constexpr char SNAPSHOT_FILE_SUFFIX[] = "_snapshot.json";
static constexpr int SNAPSHOT_FORMAT_VERSION = 1;

// External control surfaces
static constexpr int DEFAULT_SERVICE_TIMEOUT_MS = 30000;
static constexpr int DEFAULT_POWER_TIMEOUT_MS = 10000;
static constexpr int SERVICE_POLL_INTERVAL_MS = 100;

// Startup items
static constexpr char RUN_KEY_USER[] = "HKCU\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run";
static constexpr char RUN_KEY_MACHINE[] = "HKLM\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run";
static constexpr char DISABLED_SUBKEY[] = "TweakGuard_Disabled";
static constexpr char DISABLED_FILE_SUFFIX[] = ".disabled";

// Well-known power schemes
static constexpr char POWER_SCHEME_ULTIMATE[] = "e9a42b02-d5df-448d-aa00-03f14749eb61";
static constexpr char POWER_SCHEME_HIGH[] = "8c5e7fda-e8bf-4a96-9a85-a6e23a8c635c";
static constexpr char POWER_SCHEME_BALANCED[] = "381b4222-f694-41f0-9685-ff5bb260df2e";

// Default config template
static constexpr const char* DEFAULT_CONFIG = R"(; TweakGuard Configuration
; Auto-generated config file
;
; Every tweak captures the prior state before it changes anything.
; "tweakguard restore" puts the captured values back.

[meta]
version=1

[global]
; Upper bound for a single service start/stop/query (milliseconds)
; A service that does not answer in time is reported as a timeout
; and the rest of the batch continues
service_timeout_ms = 30000

; Upper bound for power scheme query/activation (milliseconds)
power_timeout_ms = 10000

; Also capture and restore the boot-time start type (auto/manual/disabled)
; of services touched by a tweak. Run state is always restored.
restore_start_types = false

; Read every value back after writing it and log mismatches
verify_writes = true
)";

#endif // TWEAKGUARD_CONSTANTS_H
