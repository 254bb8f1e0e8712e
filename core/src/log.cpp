#include "safetynet/log.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace safetynet {

bool debug_logging_requested() {
    const char* v = std::getenv("DEBUG");
    if (!v) return false;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s == "true";
}

std::shared_ptr<spdlog::logger> logger() {
    static std::shared_ptr<spdlog::logger> log = [] {
        auto existing = spdlog::get("safetynet");
        if (existing) return existing;
        auto l = spdlog::stdout_color_mt("safetynet");
        l->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
        l->set_level(debug_logging_requested() ? spdlog::level::debug : spdlog::level::info);
        return l;
    }();
    return log;
}

} // namespace safetynet
