#include "config/Settings.hpp"

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace opm::config {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    try {
        return std::stoi(val);
    } catch (const std::logic_error&) {
        return fallback;
    }
}

bool env_bool_or(const char* name, bool fallback) {
    const char* val = std::getenv(name);
    if (!val) return fallback;
    std::string str(val);
    if (str == "true" || str == "1") return true;
    if (str == "false" || str == "0") return false;
    return fallback;
}

} // namespace

Settings Settings::from_environment() {
    std::string env = env_or("OPM_ENV", "development");
    Settings s = (env == "production") ? production() : development();
    s.output.pretty = env_bool_or("OPM_PRETTY_OUTPUT", s.output.pretty);
    s.calculator.stop_on_error = env_bool_or("OPM_STOP_ON_ERROR", s.calculator.stop_on_error);
    s.calculator.verbose = env_bool_or("OPM_VERBOSE", s.calculator.verbose);
    s.calculator.stats_interval = env_int_or("OPM_STATS_INTERVAL", s.calculator.stats_interval);
    return s;
}

Settings Settings::development() {
    Settings s;
    s.calculator.verbose = true;
    s.calculator.stats_interval = 100;
    return s;
}

Settings Settings::production() {
    Settings s;
    s.calculator.stop_on_error = true;
    s.calculator.verbose = false;
    s.calculator.stats_interval = 10000;
    return s;
}

} // namespace opm::config
