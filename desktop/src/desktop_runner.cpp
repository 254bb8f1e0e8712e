#include "safetynet/log.hpp"
#include "safetynet/session_store.hpp"
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace safetynet;

static std::optional<std::string> get_arg(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (flag == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

static bool has_flag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) return true;
    }
    return false;
}

static void usage() {
    std::cerr << "usage: safetynet_runner [--root <dir>] (--list | --sweep)\n"
              << "  --list   print stored snapshots of unsaved documents per session\n"
              << "  --sweep  remove sessions older than " << kRetention.count() / 24 << " days\n";
}

int main(int argc, char** argv) {
    const bool list = has_flag(argc, argv, "--list");
    const bool sweep = has_flag(argc, argv, "--sweep");
    if (list == sweep) {
        usage();
        return 2;
    }

    try {
        StoreLayout layout = StoreLayout::forProcessStart();
        if (has_flag(argc, argv, "--root")) {
            const auto root = get_arg(argc, argv, "--root");
            if (!root || root->empty() || root->rfind("--", 0) == 0) {
                throw std::runtime_error("--root needs a directory argument");
            }
            layout.root = *root;
        }
        SessionStore store(layout);

        if (sweep) {
            const SweepReport r = store.sweepOldSessions();
            std::cout << "Sessions: " << r.scanned << " scanned, " << r.removed << " removed, "
                      << r.kept << " kept, " << r.skipped << " skipped, " << r.failed << " failed\n";
            return r.failed == 0 ? 0 : 1;
        }

        const auto sessions = store.listSessions();
        if (sessions.empty()) {
            std::cout << "No unsaved snapshots under " << layout.root.string() << "\n";
            return 0;
        }
        for (const auto& s : sessions) {
            std::cout << s.sessionId << "  (" << s.files.size() << " file(s))\n";
            for (const auto& f : s.files) std::cout << "    " << (s.dir / f).string() << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        logger()->critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
