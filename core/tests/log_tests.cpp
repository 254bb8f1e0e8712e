// DEBUG environment toggle for the shared logger.
#include "safetynet/log.hpp"
#include <cassert>
#include <cstdlib>

using namespace safetynet;

static void test_debug_variable_parsing() {
    unsetenv("DEBUG");
    assert(!debug_logging_requested());
    setenv("DEBUG", "false", 1);
    assert(!debug_logging_requested());
    setenv("DEBUG", "1", 1);
    assert(!debug_logging_requested());
    setenv("DEBUG", "true", 1);
    assert(debug_logging_requested());
    setenv("DEBUG", "True", 1);
    assert(debug_logging_requested());
}

static void test_logger_level_follows_debug() {
    // The level is fixed when the logger is first created.
    setenv("DEBUG", "TRUE", 1);
    auto log = logger();
    assert(log->name() == "safetynet");
    assert(log->level() == spdlog::level::debug);
    assert(logger() == log);
}

int main() {
    test_debug_variable_parsing();
    test_logger_level_follows_debug();
    return 0;
}
