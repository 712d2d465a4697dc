#pragma once

#include "zfs/snapshot.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <boost/program_options.hpp>

namespace zsend {

// ── Topology ──────────────────────────────────────────────────────────────────
// Which side of the transfer is reached over SSH.  Fixed for a whole run.

enum class Topology : uint8_t {
    Local = 0,  // source and destination pools on this host
    Push  = 1,  // local source → destination on the remote host
    Pull  = 2,  // source on the remote host → local destination
};

[[nodiscard]] const char* to_string(Topology t) noexcept;

// ── RunConfig ─────────────────────────────────────────────────────────────────
// Immutable run context.  Populated by parse_config() from CLI arguments.

struct RunConfig {
    std::string source;                 // Source dataset (may be empty → prompt)
    std::string destination;            // Destination dataset (may be empty → prompt)

    Topology    topology = Topology::Local;
    std::string host;                   // Remote host, empty for Local
    std::string user;                   // SSH user, empty → caller's login name
    uint16_t    port = 22;              // SSH port
    std::string control_path;           // SSH ControlPath for the shared master

    zfs::ChainBounds bounds;            // Slice of the source chain to replicate

    bool assume_yes    = false;         // Skip the confirmation prompt
    bool force_receive = false;         // zfs receive -F
    bool no_mount      = false;         // zfs receive -u
    bool strict        = false;         // Full-ancestry divergence check

    std::chrono::seconds query_timeout{180};   // Bound on every pool/dataset query
    std::chrono::seconds connect_timeout{30};  // Bound on opening the SSH master

    std::string log_level;              // spdlog level string
    std::string log_file;               // Extra file sink, empty = none
};

// Thrown by parse_config() for --help; what() holds the rendered option list.
class HelpRequested final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── parse_config ──────────────────────────────────────────────────────────────
// Parse CLI arguments into a RunConfig.
//
// On success: returns a validated RunConfig.
// On error  : throws std::runtime_error with a human-readable message.
//
// Validates:
//   - --count and --end are not both given
//   - --push, --user and --port require --host
//   - timeouts > 0, port != 0
//   - dataset names (when given) are non-empty and contain no '@'

[[nodiscard]] RunConfig parse_config(int argc, char* argv[]);

// ── add_options ───────────────────────────────────────────────────────────────
// Populate an options_description with zsend options.
// Exposed for testing and help-text generation.

void add_options(boost::program_options::options_description& desc);

// Throws std::runtime_error if `name` is not usable as a dataset identifier.
void validate_dataset_name(const std::string& name, const char* what);

} // namespace zsend
