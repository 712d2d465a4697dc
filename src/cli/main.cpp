#include "cli/prompt.hpp"
#include "common/command_check.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/run_config.hpp"
#include "exec/local_executor.hpp"
#include "exec/pipeline.hpp"
#include "exec/ssh_executor.hpp"
#include "replication/clock.hpp"
#include "replication/convergence_loop.hpp"
#include "replication/enumerator.hpp"
#include "replication/reconciler.hpp"
#include "replication/transfer_engine.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdio>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <pwd.h>
#include <unistd.h>

namespace {

std::string current_user_name() {
    if (const passwd* pw = ::getpwuid(::geteuid())) {
        return pw->pw_name;
    }
    return {};
}

} // anonymous namespace

// ── main ──────────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
    // ── Parse CLI arguments ──────────────────────────────────────────────────
    zsend::RunConfig cfg;
    try {
        cfg = zsend::parse_config(argc, argv);
    } catch (const zsend::HelpRequested& h) {
        fprintf(stdout, "%s\n", h.what());
        return 0;
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Missing datasets are asked for interactively ────────────────────────
    try {
        if (cfg.source.empty()) {
            cfg.source = zsend::cli::prompt_line(std::cin, std::cout, "Enter the SOURCE dataset:").value_or("");
            zsend::validate_dataset_name(cfg.source, "source dataset");
        }
        if (cfg.destination.empty()) {
            cfg.destination = zsend::cli::prompt_line(std::cin, std::cout, "Enter the DESTINATION dataset:").value_or("");
            zsend::validate_dataset_name(cfg.destination, "destination dataset");
        }
    } catch (const std::runtime_error& e) {
        fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    // ── Logging ──────────────────────────────────────────────────────────────
    const auto level = zsend::parse_log_level(cfg.log_level);
    try {
        zsend::init_default_logger(level, cfg.log_file);
    } catch (const spdlog::spdlog_ex& e) {
        fprintf(stderr, "Unable to open log file %s: %s\n", cfg.log_file.c_str(), e.what());
        return 1;
    }
    auto logger = spdlog::default_logger();

    // A receiver that dies mid-stream must surface as an error, not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    // ── Required commands ────────────────────────────────────────────────────
    std::vector<std::string> required{"zfs"};
    if (cfg.topology != zsend::Topology::Local) {
        required.emplace_back("ssh");
    }
    if (const auto missing = zsend::missing_commands(required); !missing.empty()) {
        for (const auto& m : missing) {
            logger->error("{} is required but not installed. Exiting.", m);
        }
        return 1;
    }

    if (cfg.topology == zsend::Topology::Local) {
        logger->info("No remote host was specified. Running in local mode..");
    } else if (cfg.user.empty()) {
        cfg.user = current_user_name();
        logger->info("SSH user name was not specified. Using {}..", cfg.user);
    }

    logger->info("zsend: {} → {} ({}{})", cfg.source, cfg.destination,
                 zsend::to_string(cfg.topology),
                 cfg.host.empty() ? std::string{} : ", host " + cfg.host);
    if (cfg.force_receive) {
        logger->warn("Receiving with -F: the destination is rolled back to its latest snapshot first");
    }

    // ── Executors ────────────────────────────────────────────────────────────
    const auto query_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.query_timeout);

    zsend::exec::LocalExecutor local{zsend::make_logger("local", level)};
    std::unique_ptr<zsend::exec::SshExecutor> remote;
    if (cfg.topology != zsend::Topology::Local) {
        remote = std::make_unique<zsend::exec::SshExecutor>(
            zsend::exec::SshTarget{cfg.host, cfg.user, cfg.port, cfg.control_path},
            std::chrono::duration_cast<std::chrono::milliseconds>(cfg.connect_timeout),
            zsend::make_logger("ssh", level));
    }

    zsend::exec::Executor& source_exec =
        cfg.topology == zsend::Topology::Pull ? static_cast<zsend::exec::Executor&>(*remote) : local;
    zsend::exec::Executor& dest_exec =
        cfg.topology == zsend::Topology::Push ? static_cast<zsend::exec::Executor&>(*remote) : local;

    zsend::replication::SnapshotEnumerator source_enum{source_exec, query_timeout, logger};
    zsend::replication::SnapshotEnumerator dest_enum{dest_exec, query_timeout, logger};

    zsend::replication::SteadyClock clock;
    zsend::exec::ProcessPipeline pipeline;

    zsend::replication::TransferOptions options;
    options.receive.force    = cfg.force_receive;
    options.receive.no_mount = cfg.no_mount;
    options.query_timeout    = query_timeout;

    zsend::replication::ChainReconciler reconciler{dest_enum, cfg.destination, cfg.strict, logger};
    zsend::replication::TransferEngine engine{
        source_exec, dest_exec, pipeline, cfg.source, cfg.destination, options,
        zsend::make_logger("transfer", level), clock};
    zsend::replication::ConvergenceLoop loop{reconciler, engine, logger};

    try {
        // ── Preview & confirmation ───────────────────────────────────────────
        const auto chain = source_enum.list_chain(cfg.source, cfg.bounds);

        fprintf(stdout, "\nSnapshot list:\n");
        for (const auto& name : chain) {
            fprintf(stdout, "  %s\n", name.c_str());
        }
        fprintf(stdout, "\n");

        if (!cfg.assume_yes && !zsend::cli::confirm_proceed(std::cin, std::cout)) {
            logger->error("You've chosen to not proceed. Exiting.");
            return 1;
        }

        // ── Converge ─────────────────────────────────────────────────────────
        const auto report = loop.run(chain);

        if (report.transfers.empty()) {
            logger->info("Destination {} already holds {}; nothing to send",
                         cfg.destination, chain.back());
        }
        logger->info("Snapshots on {}:\n{}", cfg.destination,
                     dest_enum.describe_snapshots(cfg.destination));
    } catch (const zsend::Error& e) {
        // The loop already logged its own failures.
        if (loop.state() != zsend::replication::LoopState::Failed) {
            logger->error("{} failed: {}", e.phase(), e.what());
        }
        return 1;
    } catch (const std::exception& e) {
        if (loop.state() != zsend::replication::LoopState::Failed) {
            logger->error("zsend: {}", e.what());
        }
        return 1;
    }

    return 0;
}
