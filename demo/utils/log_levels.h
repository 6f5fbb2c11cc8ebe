#pragma once

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace LogLevels {

// Names accepted by --log_level.  spdlog::level::from_str maps anything
// else to "off", so the option is restricted to this list.
inline const std::vector<std::string>& names() {
    static const std::vector<std::string> accepted = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    return accepted;
}

inline spdlog::level::level_enum parse(const std::string& name) {
    return spdlog::level::from_str(name);
}

} // namespace LogLevels
