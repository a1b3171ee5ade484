#include "config/config.hpp"
#include "idmap/errors.hpp"
#include "idmap/normalizer.hpp"
#include "idmap/partitioner.hpp"
#include "idmap/render.hpp"
#include "utils/log.hpp"

#include <cstdlib>
#include <cxxopts.hpp>
#include <iostream>
#include <stdexcept>


constexpr int EXIT_USAGE = 2;


int main(int argc, char** argv) {
    auto& config = Config::instance();
    try {
        config.parse_cli(argc, argv);
    } catch (const cxxopts::exceptions::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config.usage;
        return EXIT_USAGE;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config.usage;
        return EXIT_USAGE;
    }

    if (config.help) {
        std::cout << config.usage << '\n';
        return EXIT_SUCCESS;
    }

    idmap::log::debug_enabled = config.verbose;
    if (config.verbose) {
        config.print(std::cerr);
    }

    try {
        auto points = idmap::normalize(config.mappings, config.users, config.groups);
        auto records = idmap::partition(points);
        if (config.verify) {
            idmap::verify_partition(records);
            LOG_DEBUG("verified %zu ranges", records.size());
        }
        std::cout << idmap::render_report(records, config.conf_path(), config.owner);
    } catch (const idmap::error::NoInput& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << config.usage;
        return EXIT_USAGE;
    } catch (const idmap::error::IdmapError& e) {
        LOG_ERROR("%s", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
