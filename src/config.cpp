#include "floorstock/config.hpp"
#include "floorstock/errors.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace floorstock {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value && *value ? value : fallback;
}

bool is_truthy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "yes";
}

} // anonymous namespace

int parse_port(const std::string& value) {
    char* end = nullptr;
    long port = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || port < 1 || port > 65535) {
        throw InventoryError::invalid_argument("Invalid port: " + value);
    }
    return static_cast<int>(port);
}

Config Config::from_env() {
    Config config;
    config.host = env_or("FLOORSTOCK_HOST", config.host);
    config.port = parse_port(env_or("FLOORSTOCK_PORT", std::to_string(DEFAULT_PORT)));
    config.data_dir = env_or("FLOORSTOCK_DATA_DIR", config.data_dir);
    config.seed_locations = is_truthy(env_or("FLOORSTOCK_SEED_LOCATIONS", "false"));
    return config;
}

} // namespace floorstock
