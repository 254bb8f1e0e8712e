#include "safetynet/store_layout.hpp"
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace safetynet {

std::string format_session_id(Clock::time_point t) {
    const std::time_t tt = Clock::to_time_t(t);
    std::tm tm {};
    localtime_r(&tt, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, kSessionIdFormat);
    return oss.str();
}

std::optional<Clock::time_point> parse_session_id(const std::string& name) {
    // YYYYMMDD-HHMMSS
    if (name.size() != 15 || name[8] != '-') return std::nullopt;
    for (size_t i = 0; i < name.size(); ++i) {
        if (i == 8) continue;
        if (name[i] < '0' || name[i] > '9') return std::nullopt;
    }

    std::tm tm {};
    std::istringstream in(name);
    in >> std::get_time(&tm, kSessionIdFormat);
    if (in.fail()) return std::nullopt;

    tm.tm_isdst = -1;
    const std::time_t tt = std::mktime(&tm);
    if (tt == static_cast<std::time_t>(-1)) return std::nullopt;
    return Clock::from_time_t(tt);
}

fs::path default_store_root() {
    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home) / kStoreDirName;
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    return (ec ? fs::path(".") : cwd) / kStoreDirName;
}

std::string snapshot_file_name(const std::string& display_name) {
    std::string out = display_name;
    for (char& c : out) {
        if (c == '/' || c == '\\' || c == '\0') c = '_';
    }
    if (out.empty()) return "untitled";
    if (out == "." || out == "..") out.assign(out.size(), '_');
    return out;
}

std::string partial_file_name(const std::string& file_name) {
    return "." + file_name + ".partial";
}

bool is_partial_file(const std::string& file_name) {
    static const std::string suffix = ".partial";
    return file_name.size() > suffix.size() + 1 && file_name.front() == '.' &&
           file_name.compare(file_name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

StoreLayout StoreLayout::forProcessStart(fs::path root) {
    return StoreLayout {std::move(root), format_session_id(Clock::now())};
}

} // namespace safetynet
