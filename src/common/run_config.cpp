#include "common/run_config.hpp"

#include <fmt/format.h>

#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace po = boost::program_options;

namespace zsend {

namespace {

constexpr const char* kDefaultControlPath = "~/.ssh/zsend-%r@%h:%p";

[[nodiscard]] std::optional<std::string> optional_string(const po::variables_map& vm,
                                                         const char* key) {
    if (!vm.count(key)) {
        return std::nullopt;
    }
    return vm[key].as<std::string>();
}

// Validate the fully populated RunConfig.
void validate(const RunConfig& cfg, const po::variables_map& vm) {
    if (cfg.bounds.count && cfg.bounds.end) {
        throw std::runtime_error("--count and --end are mutually exclusive");
    }

    if (cfg.host.empty()) {
        if (vm["push"].as<bool>()) {
            throw std::runtime_error("--push requires --host");
        }
        if (vm.count("user")) {
            throw std::runtime_error("--user requires --host");
        }
        if (!vm["port"].defaulted()) {
            throw std::runtime_error("--port requires --host");
        }
    }

    if (cfg.port == 0) {
        throw std::runtime_error("--port must be in [1, 65535], got 0");
    }
    if (cfg.query_timeout.count() <= 0) {
        throw std::runtime_error("--query-timeout must be > 0");
    }
    if (cfg.connect_timeout.count() <= 0) {
        throw std::runtime_error("--connect-timeout must be > 0");
    }
    if (cfg.control_path.empty()) {
        throw std::runtime_error("--control-path must not be empty");
    }

    if (!cfg.source.empty()) {
        validate_dataset_name(cfg.source, "--source");
    }
    if (!cfg.destination.empty()) {
        validate_dataset_name(cfg.destination, "--destination");
    }

    for (const auto* snap : {&cfg.bounds.start, &cfg.bounds.end}) {
        if (*snap && (snap->value().empty() || snap->value().find('@') != std::string::npos)) {
            throw std::runtime_error(fmt::format(
                "Snapshot names are given without the dataset part, got '{}'",
                snap->value()));
        }
    }
}

} // anonymous namespace

const char* to_string(Topology t) noexcept {
    switch (t) {
        case Topology::Local: return "local";
        case Topology::Push:  return "push";
        case Topology::Pull:  return "pull";
    }
    return "unknown";
}

void validate_dataset_name(const std::string& name, const char* what) {
    if (name.empty()) {
        throw std::runtime_error(fmt::format("{} must not be empty", what));
    }
    if (name.find('@') != std::string::npos) {
        throw std::runtime_error(fmt::format(
            "{} must name a dataset, not a snapshot: '{}'", what, name));
    }
    if (name.front() == '-' || name.find_first_of(" \t\n") != std::string::npos) {
        throw std::runtime_error(fmt::format("{} is not a valid dataset name: '{}'", what, name));
    }
}

// ── add_options ───────────────────────────────────────────────────────────────

void add_options(po::options_description& desc) {
    desc.add_options()
        ("help,h",
            "Show this help message and exit")
        ("source,o",
            po::value<std::string>(),
            "Source dataset (prompted when omitted)")
        ("destination,d",
            po::value<std::string>(),
            "Destination dataset (prompted when omitted)")
        ("host,s",
            po::value<std::string>(),
            "Remote host; without it both pools are local")
        ("user,u",
            po::value<std::string>(),
            "SSH user on the remote host (default: current user)")
        ("port,p",
            po::value<uint16_t>()->default_value(22),
            "SSH port on the remote host")
        ("push,P",
            po::bool_switch()->default_value(false),
            "Push local source to the remote destination (default: pull from the remote source)")
        ("first,f",
            po::value<std::string>(),
            "First snapshot to send (default: earliest snapshot)")
        ("count,c",
            po::value<uint32_t>(),
            "Number of snapshots to send after the first (4 sends 5 in total)")
        ("end,r",
            po::value<std::string>(),
            "Last snapshot to send, inclusive")
        ("yes,y",
            po::bool_switch()->default_value(false),
            "Do not ask for confirmation")
        ("force,F",
            po::bool_switch()->default_value(false),
            "Receive with -F (roll the destination back to its latest snapshot)")
        ("no-mount",
            po::bool_switch()->default_value(false),
            "Receive with -u (do not mount the received file system)")
        ("strict",
            po::bool_switch()->default_value(false),
            "Require every destination snapshot to appear, in order, in the source chain")
        ("query-timeout",
            po::value<uint32_t>()->default_value(180),
            "Seconds allowed for each pool or dataset query")
        ("connect-timeout",
            po::value<uint32_t>()->default_value(30),
            "Seconds allowed for opening the SSH session")
        ("control-path",
            po::value<std::string>()->default_value(kDefaultControlPath),
            "SSH ControlPath of the shared master connection")
        ("log-level",
            po::value<std::string>()->default_value("info"),
            "Log level: trace|debug|info|warn|error|critical")
        ("log-file",
            po::value<std::string>()->default_value(""),
            "Also append log lines to this file");
}

// ── parse_config ──────────────────────────────────────────────────────────────

RunConfig parse_config(int argc, char* argv[]) {
    po::options_description desc("zsend options");
    add_options(desc);

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::ostringstream oss;
            oss << "Replicate a ZFS snapshot chain, resuming from the destination's latest snapshot.\n\n"
                << "Usage: zsend -o <source dataset> -d <destination dataset> [options]\n\n"
                << desc;
            throw HelpRequested(oss.str());
        }

        po::notify(vm);
    } catch (const po::error& e) {
        throw std::runtime_error(fmt::format("Argument error: {}", e.what()));
    }

    RunConfig cfg;
    cfg.source          = optional_string(vm, "source").value_or("");
    cfg.destination     = optional_string(vm, "destination").value_or("");
    cfg.host            = optional_string(vm, "host").value_or("");
    cfg.user            = optional_string(vm, "user").value_or("");
    cfg.port            = vm["port"].as<uint16_t>();
    cfg.control_path    = vm["control-path"].as<std::string>();
    cfg.bounds.start    = optional_string(vm, "first");
    cfg.bounds.end      = optional_string(vm, "end");
    if (vm.count("count")) {
        cfg.bounds.count = vm["count"].as<uint32_t>();
    }
    cfg.assume_yes      = vm["yes"].as<bool>();
    cfg.force_receive   = vm["force"].as<bool>();
    cfg.no_mount        = vm["no-mount"].as<bool>();
    cfg.strict          = vm["strict"].as<bool>();
    cfg.query_timeout   = std::chrono::seconds{vm["query-timeout"].as<uint32_t>()};
    cfg.connect_timeout = std::chrono::seconds{vm["connect-timeout"].as<uint32_t>()};
    cfg.log_level       = vm["log-level"].as<std::string>();
    cfg.log_file        = vm["log-file"].as<std::string>();

    if (cfg.host.empty()) {
        cfg.topology = Topology::Local;
    } else {
        cfg.topology = vm["push"].as<bool>() ? Topology::Push : Topology::Pull;
    }

    validate(cfg, vm);
    return cfg;
}

} // namespace zsend
