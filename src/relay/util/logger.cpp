#include <relay/util/logger.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>

namespace relay {

namespace {

// Accessed only through std::atomic_load/atomic_store so readers on the
// dispatch path never contend on a mutex.
std::shared_ptr<Logger> g_logger = std::make_shared<NullLogger>();

}  // namespace

void set_logger(std::shared_ptr<Logger> logger) {
    if (!logger) {
        logger = std::make_shared<NullLogger>();
    }
    std::atomic_store(&g_logger, std::move(logger));
}

std::shared_ptr<Logger> logger() {
    return std::atomic_load(&g_logger);
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    return LogLevel::INFO;
}

}  // namespace relay
