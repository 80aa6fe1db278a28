#include "ads_log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>

namespace ads {
namespace log {

namespace {

std::mutex g_mutex;
std::set<std::string> g_names;
spdlog::level::level_enum g_level = spdlog::level::info;

} // namespace

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(g_mutex);
    auto logger = spdlog::get(name);
    if (!logger) {
        logger = spdlog::stderr_color_mt(name);
        logger->set_level(g_level);
    }
    g_names.insert(name);
    return logger;
}

void set_level(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(g_mutex);
    g_level = level;
    for (const auto& name : g_names) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(level);
        }
    }
}

void log_buffer(const std::shared_ptr<spdlog::logger>& logger,
                spdlog::level::level_enum level,
                const std::vector<uint8_t>& buffer,
                const std::string& header,
                size_t max_bytes) {
    if (!logger || !logger->should_log(level)) {
        return;
    }

    logger->log(level, "{} ({} bytes)", header, buffer.size());

    const size_t count = std::min(buffer.size(), max_bytes);
    for (size_t line = 0; line < count; line += 16) {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        oss << "  " << std::setw(4) << line << ":";
        for (size_t i = line; i < std::min(line + 16, count); ++i) {
            oss << ' ' << std::setw(2) << static_cast<unsigned>(buffer[i]);
        }
        logger->log(level, "{}", oss.str());
    }
    if (count < buffer.size()) {
        logger->log(level, "  ... {} more bytes", buffer.size() - count);
    }
}

} // namespace log
} // namespace ads
