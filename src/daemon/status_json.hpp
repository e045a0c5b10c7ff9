#pragma once

#include "supervisor/backup_hook.hpp"
#include "supervisor/restart_policy.hpp"
#include "supervisor/watchdog.hpp"

#include <nlohmann/json.hpp>

// Wire format shared by the daemon and DaemonClient.
// Times are sent as epoch seconds.

void to_json(nlohmann::json& j, const StatusSnapshot& s);
void from_json(const nlohmann::json& j, StatusSnapshot& s);

void to_json(nlohmann::json& j, const RestartRecord& r);
void from_json(const nlohmann::json& j, RestartRecord& r);

void to_json(nlohmann::json& j, const BackupInfo& b);
void from_json(const nlohmann::json& j, BackupInfo& b);

WatchdogState watchdog_state_from_string(const std::string& s);
HealthState health_state_from_string(const std::string& s);
