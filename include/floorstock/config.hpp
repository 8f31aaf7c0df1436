#pragma once

#include <string>

namespace floorstock {

constexpr int DEFAULT_PORT = 50510;

/**
 * Process configuration, read from the environment:
 *   FLOORSTOCK_HOST            listen address (default 0.0.0.0)
 *   FLOORSTOCK_PORT            listen port (default 50510)
 *   FLOORSTOCK_DATA_DIR        directory holding journal.bin (default ./data)
 *   FLOORSTOCK_SEED_LOCATIONS  "1" or "true" to register the default departments at startup
 */
struct Config {
    std::string host = "0.0.0.0";
    int port = DEFAULT_PORT;
    std::string data_dir = "./data";
    bool seed_locations = false;

    std::string journal_path() const { return data_dir + "/journal.bin"; }
    std::string listen_address() const { return host + ":" + std::to_string(port); }

    /// Throws InvalidArgument for a malformed port.
    static Config from_env();
};

/// Parse a TCP port; throws InvalidArgument unless it is in 1..65535.
int parse_port(const std::string& value);

} // namespace floorstock
