#include "services/PriceBatchRunner.hpp"

#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

using namespace opm::domain;

namespace opm::services {

PriceBatchRunner::PriceBatchRunner(const config::Settings& settings, std::ostream& log)
    : settings_(settings)
    , log_(log) {}

int PriceBatchRunner::run(std::istream& in, std::ostream& out) {
    uint64_t line_number = 0;
    std::string line;

    while (std::getline(in, line)) {
        ++line_number;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;

        bool failed = process_line(line, line_number, out);
        maybe_report_stats();

        if (failed && settings_.calculator.stop_on_error) {
            log_ << "[price_calc] Stopping at line " << line_number << std::endl;
            break;
        }
    }

    log_ << "[price_calc] Done. Processed " << processed_count()
         << " requests, " << failed_count() << " failed." << std::endl;

    return failed_count() > 0 ? EXIT_HAD_FAILURES : EXIT_ALL_OK;
}

bool PriceBatchRunner::process_line(const std::string& line, uint64_t line_number, std::ostream& out) {
    const int indent = settings_.output.pretty ? 2 : -1;

    try {
        auto request = codec_.parse_request(line);
        auto result = service_.evaluate(request);

        if (settings_.calculator.verbose) {
            log_ << "[price_calc] line " << line_number << " id=" << request.id
                 << (result.ok() ? " ok" : " failed: " + result.message) << std::endl;
        }
        out << codec_.serialize_result(result, indent) << std::endl;
        return !result.ok();
    } catch (const std::invalid_argument& e) {
        ++invalid_count_;
        log_ << "[price_calc] line " << line_number << " rejected: " << e.what() << std::endl;
        out << codec_.serialize_failure(codec_.request_id(line), "INVALID_REQUEST", e.what(), indent)
            << std::endl;
        return true;
    }
}

void PriceBatchRunner::maybe_report_stats() {
    const auto interval = settings_.calculator.stats_interval;
    if (interval <= 0 || processed_count() % static_cast<uint64_t>(interval) != 0) return;

    log_ << "[stats] requests=" << processed_count()
         << " ok=" << service_.success_count()
         << " failed=" << service_.failure_count()
         << " invalid=" << invalid_count_ << std::endl;
}

} // namespace opm::services
