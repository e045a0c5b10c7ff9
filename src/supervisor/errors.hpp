#pragma once

#include <string>

/// Error kinds reported by the supervision components.
/// Operations return these inside result structs instead of throwing.
enum class SupervisorError {
    None,
    AlreadyRunning,
    LockUnavailable,
    LaunchFailed,
    NotRunning,
    StopTimedOut,
    WriteFailed,
    ProcessGone,
    BackupFailed,
    RestoreFailed,
    RestartLimitExceeded,
};

inline const char* to_string(SupervisorError err) {
    switch (err) {
        case SupervisorError::None:                 return "none";
        case SupervisorError::AlreadyRunning:       return "already_running";
        case SupervisorError::LockUnavailable:      return "lock_unavailable";
        case SupervisorError::LaunchFailed:         return "launch_failed";
        case SupervisorError::NotRunning:           return "not_running";
        case SupervisorError::StopTimedOut:         return "stop_timed_out";
        case SupervisorError::WriteFailed:          return "write_failed";
        case SupervisorError::ProcessGone:          return "process_gone";
        case SupervisorError::BackupFailed:         return "backup_failed";
        case SupervisorError::RestoreFailed:        return "restore_failed";
        case SupervisorError::RestartLimitExceeded: return "restart_limit_exceeded";
    }
    return "unknown";
}
