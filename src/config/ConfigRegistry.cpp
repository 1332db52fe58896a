#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <stdexcept>

namespace cs::config {

void ConfigRegistry::init(const Config& config) {
    std::call_once(init_flag_, [&]() {
        config_ = config;
        initialized_ = true;
    });
}

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfig(path);
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

std::filesystem::path ConfigRegistry::defaultPath() {
    if (const char* env = std::getenv("COSYNC_CONFIG"); env && *env) return env;
    return "/etc/cosync/config.yaml";
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace cs::config
