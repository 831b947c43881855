#include "printmon/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <memory>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace printmon {

void init_logging(const std::string& level, const std::string& file) {
    std::string lvl = level;
    std::transform(lvl.begin(), lvl.end(), lvl.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lvl == "warning") lvl = "warn";

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!file.empty()) {
        try {
            auto parent = std::filesystem::path(file).parent_path();
            if (!parent.empty()) std::filesystem::create_directories(parent);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
        } catch (const std::exception& e) {
            // stdout stays usable; report through it once the logger exists
            auto fallback = std::make_shared<spdlog::logger>("print-monitor", sinks.begin(), sinks.end());
            fallback->warn("[log] cannot open log file {}: {}", file, e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("print-monitor", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S - %n - %^%l%$ - %v");
    auto parsed = spdlog::level::from_str(lvl);
    if (parsed == spdlog::level::off && lvl != "off") parsed = spdlog::level::info;
    logger->set_level(parsed);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

}  // namespace printmon
