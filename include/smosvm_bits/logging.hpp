#ifndef SMOSVM_LOGGING_HPP
#define SMOSVM_LOGGING_HPP

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace smosvm {

// Library logger "smosvm", colored stdout, level warn until changed
std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum level);
// "trace", "debug", "info", "warning"/"warn", "error"/"err", "critical" or "off",
// anything else throws InvalidParameter
void set_log_level(const std::string& name);
spdlog::level::level_enum parse_log_level(const std::string& name);

}

#endif
