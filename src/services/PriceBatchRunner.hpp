#pragma once

#include "config/Settings.hpp"
#include "infrastructure/PriceJsonCodec.hpp"
#include "services/PriceCalculatorService.hpp"

#include <cstdint>
#include <iosfwd>
#include <string>

namespace opm::services {

// Drives newline-delimited requests through the calculator: one result line
// per non-blank input line, log lines on the separate log stream.
class PriceBatchRunner {
public:
    static constexpr int EXIT_ALL_OK = 0;
    static constexpr int EXIT_USAGE = 1;
    static constexpr int EXIT_HAD_FAILURES = 2;

    PriceBatchRunner(const config::Settings& settings, std::ostream& log);

    // Returns EXIT_ALL_OK or EXIT_HAD_FAILURES.
    int run(std::istream& in, std::ostream& out);

    uint64_t processed_count() const noexcept { return service_.request_count() + invalid_count_; }
    uint64_t failed_count() const noexcept { return service_.failure_count() + invalid_count_; }
    uint64_t invalid_count() const noexcept { return invalid_count_; }

private:
    // Returns true when the line failed.
    bool process_line(const std::string& line, uint64_t line_number, std::ostream& out);
    void maybe_report_stats();

    const config::Settings& settings_;
    std::ostream& log_;
    infrastructure::PriceJsonCodec codec_;
    PriceCalculatorService service_;
    uint64_t invalid_count_{0};
};

} // namespace opm::services
