#pragma once

#include "exec/command.hpp"

#include <optional>
#include <string>

namespace zsend::zfs {

// ── ZFS command surface ───────────────────────────────────────────────────────
//
// Builders for the handful of zfs(8) invocations the replication core uses.
// They only build argv; running them is the executor's job.

struct ReceiveOptions {
    bool force    = false;  // -F: roll back to the most recent snapshot first
    bool no_mount = false;  // -u: do not mount the received file system
};

// zfs list -H -o name <dataset>
[[nodiscard]] exec::Command list_dataset(const std::string& dataset);

// zfs list -H -t snapshot -o name -s createtxg -d 1 <dataset>
// Snapshots of the dataset itself only, oldest first.
[[nodiscard]] exec::Command list_snapshots(const std::string& dataset);

// zfs list -t snapshot -o name,creation -s createtxg -d 1 <dataset>
// Human-readable listing for the final report.
[[nodiscard]] exec::Command list_snapshots_with_creation(const std::string& dataset);

// zfs send -n -v -P [-i @<from>] <dataset>@<to>
[[nodiscard]] exec::Command send_estimate(const std::string& dataset,
                                          const std::optional<std::string>& from,
                                          const std::string& to);

// zfs send [-i @<from>] <dataset>@<to>
[[nodiscard]] exec::Command send(const std::string& dataset,
                                 const std::optional<std::string>& from,
                                 const std::string& to);

// zfs receive [-F] [-u] <dataset>
[[nodiscard]] exec::Command receive(const std::string& dataset, const ReceiveOptions& opts);

} // namespace zsend::zfs
