#include <omp.h>

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include "../common/conf.hpp"
#include "../common/config.hpp"
#include "../common/simulation.hpp"

int main(int argc, char* argv[]) {
    std::string conf_path = DEFAULT_CONF_PATH;
    if (argc > 1) {
        conf_path = argv[1];
    }

    std::uint64_t max_generations = MAX_GENERATIONS;
    if (argc > 2) {
        max_generations = std::strtoull(argv[2], nullptr, 10);
    }

    int num_threads = omp_get_max_threads();
    if (argc > 3) {
        num_threads = std::atoi(argv[3]);
        if (num_threads < 1) {
            std::cerr << "Invalid thread count: " << argv[3] << std::endl;
            return 1;
        }
        omp_set_num_threads(num_threads);
    }

    const Conf conf = load_conf(conf_path);

    std::cout << "=== Formicarium (Headless) ===" << std::endl;
    std::cout << "Grid size: " << conf.env.dimension.x << " x " << conf.env.dimension.y << std::endl;
    std::cout << "Number of ants: " << conf.ants.count << std::endl;
    std::cout << "Number of morsels: " << conf.morsels.count << std::endl;
    std::cout << "Food per morsel: " << conf.morsels.storage << std::endl;
    std::cout << "Nest: (" << conf.nest.location.x << ", " << conf.nest.location.y << ")" << std::endl;
    std::cout << "Random seed: " << conf.seed << std::endl;
    std::cout << "OpenMP threads: " << num_threads << std::endl;
    std::cout << "==============================\n"
              << std::endl;

    try {
        AntSimulation simulation(conf);
        SimStats stats = simulation.run(max_generations, REPORT_EVERY);
        return stats.total_food_collected == stats.total_food_available ? 0 : 2;
    } catch (const std::exception& e) {
        std::cerr << "Simulation aborted: " << e.what() << std::endl;
        return 1;
    }
}
