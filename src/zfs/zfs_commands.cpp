#include "zfs/zfs_commands.hpp"

#include "zfs/snapshot.hpp"

namespace zsend::zfs {

namespace {
    constexpr const char* kZfs = "zfs";

    void add_incremental_source(exec::Command& cmd, const std::optional<std::string>& from) {
        if (from) {
            cmd.arg("-i").arg("@" + *from);
        }
    }
} // anonymous namespace

exec::Command list_dataset(const std::string& dataset) {
    return {kZfs, "list", "-H", "-o", "name", dataset};
}

exec::Command list_snapshots(const std::string& dataset) {
    return {kZfs, "list", "-H", "-t", "snapshot", "-o", "name",
            "-s", "createtxg", "-d", "1", dataset};
}

exec::Command list_snapshots_with_creation(const std::string& dataset) {
    return {kZfs, "list", "-t", "snapshot", "-o", "name,creation",
            "-s", "createtxg", "-d", "1", dataset};
}

exec::Command send_estimate(const std::string& dataset,
                            const std::optional<std::string>& from,
                            const std::string& to)
{
    exec::Command cmd{kZfs, "send", "-n", "-v", "-P"};
    add_incremental_source(cmd, from);
    cmd.arg(snapshot_ref(dataset, to));
    return cmd;
}

exec::Command send(const std::string& dataset,
                   const std::optional<std::string>& from,
                   const std::string& to)
{
    exec::Command cmd{kZfs, "send"};
    add_incremental_source(cmd, from);
    cmd.arg(snapshot_ref(dataset, to));
    return cmd;
}

exec::Command receive(const std::string& dataset, const ReceiveOptions& opts) {
    exec::Command cmd{kZfs, "receive"};
    if (opts.force) {
        cmd.arg("-F");
    }
    if (opts.no_mount) {
        cmd.arg("-u");
    }
    cmd.arg(dataset);
    return cmd;
}

} // namespace zsend::zfs
