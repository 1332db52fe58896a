#pragma once

#include "config/Config.hpp"

#include <mutex>

namespace cs::config {

class ConfigRegistry {
public:
    static void init(const Config& config);
    static void init(const std::filesystem::path& path);
    static const Config& get();

    // COSYNC_CONFIG if set, else /etc/cosync/config.yaml
    [[nodiscard]] static std::filesystem::path defaultPath();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace cs::config
