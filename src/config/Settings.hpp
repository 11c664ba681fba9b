#pragma once

namespace opm::config {

struct OutputSettings {
    bool pretty = false;  // indent results by 2 instead of one line each
};

struct CalculatorSettings {
    bool stop_on_error = false;
    bool verbose = false;
    int stats_interval = 0;  // requests between [stats] lines, 0 disables
};

struct Settings {
    OutputSettings output;
    CalculatorSettings calculator;

    static Settings from_environment();
    static Settings development();
    static Settings production();
};

} // namespace opm::config
