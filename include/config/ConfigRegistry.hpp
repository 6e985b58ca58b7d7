#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>
#include <optional>

namespace pv::config {

class ConfigRegistry {
public:
    // Loads `path` when given, otherwise keeps the compiled-in defaults.
    static void init(const std::optional<std::filesystem::path>& path = std::nullopt);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace pv::config
