#include "../include/smosvm_bits/logging.hpp"
#include "../include/smosvm_bits/errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace smosvm {

namespace {

// Singleton holder, registered with spdlog so applications can reach it by name
class InternalLogger {
public:
    InternalLogger() {
        // a logger the application registered under this name keeps its settings
        _spdlogger = spdlog::get("smosvm");
        if (!_spdlogger) {
            _spdlogger = spdlog::stdout_color_mt("smosvm");
            _spdlogger->set_level(spdlog::level::warn);
            _spdlogger->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        }
    }

    std::shared_ptr<spdlog::logger> get() const { return _spdlogger; }

private:
    std::shared_ptr<spdlog::logger> _spdlogger = nullptr;
};

InternalLogger& get_internal_logger() {
    static InternalLogger logger;
    return logger;
}

}

std::shared_ptr<spdlog::logger> logger() {
    return get_internal_logger().get();
}

void set_log_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    // from_str maps unknown names to off
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        throw InvalidParameter("unknown log level '" + name + "'");
    }
    return level;
}

void set_log_level(const std::string& name) {
    set_log_level(parse_log_level(name));
}

}
