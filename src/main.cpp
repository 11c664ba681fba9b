#include "config/Settings.hpp"
#include "services/PriceBatchRunner.hpp"

#include <fstream>
#include <iostream>

using opm::services::PriceBatchRunner;

int main(int argc, char* argv[]) {
    auto settings = opm::config::Settings::from_environment();

    if (argc > 2) {
        std::cerr << "Usage: price_calc [requests.ndjson]" << std::endl;
        std::cerr << "       Reads one JSON request per line from the file or stdin." << std::endl;
        return PriceBatchRunner::EXIT_USAGE;
    }

    std::ifstream file;
    if (argc == 2) {
        file.open(argv[1]);
        if (!file) {
            std::cerr << "[price_calc] Cannot open " << argv[1] << std::endl;
            return PriceBatchRunner::EXIT_USAGE;
        }
    }
    std::istream& in = (argc == 2) ? static_cast<std::istream&>(file) : std::cin;

    PriceBatchRunner runner(settings, std::cerr);
    return runner.run(in, std::cout);
}
