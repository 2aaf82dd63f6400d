#include "server_params_parsing.hpp"

#include <boost/program_options.hpp>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "setup.hpp"

namespace ServerProgramParams {
    static bool help_provided(boost::program_options::variables_map &vm) {
        return vm.count("help");
    }

    static bool seed_provided(boost::program_options::variables_map &vm) {
        return vm.count("seed");
    }

    static bool necessary_arguments_provided(boost::program_options::variables_map &vm) {
        return vm.count("port");
    }

    // The spawn rows of both sides and at least one row between them must fit.
    static void check_board(const ServerProgramParams &params) {
        if (params.grid_size < 2 * Setup::SPAWN_ROWS + 1)
            throw std::invalid_argument("grid-size must be at least " +
                                        std::to_string(2 * Setup::SPAWN_ROWS + 1));
        if (params.heroes_per_player == 0 ||
            params.heroes_per_player > Setup::SPAWN_ROWS * params.grid_size)
            throw std::invalid_argument("heroes-per-player does not fit the spawn rows");
        if (params.obstacle_percent > 100)
            throw std::invalid_argument("obstacle-percent must be between 0 and 100");
    }

    static ServerProgramParams get_server_program_params(boost::program_options::variables_map &vm) {
        if (seed_provided(vm)) {
            return ServerProgramParams(vm["port"].as<uint16_t>(),
                                       vm["grid-size"].as<uint16_t>(),
                                       vm["heroes-per-player"].as<uint16_t>(),
                                       vm["obstacle-percent"].as<uint16_t>(),
                                       vm["seed"].as<uint32_t>());
        } else {
            return ServerProgramParams(vm["port"].as<uint16_t>(),
                                       vm["grid-size"].as<uint16_t>(),
                                       vm["heroes-per-player"].as<uint16_t>(),
                                       vm["obstacle-percent"].as<uint16_t>());
        }
    }

    ServerProgramParams parse_program_params(int argc, char **av) {
        boost::program_options::options_description desc("Allowed options");
        desc.add_options()
                ("help,h", "produce help message")
                ("port,p", boost::program_options::value<uint16_t>(), "port")
                ("grid-size,g", boost::program_options::value<uint16_t>()->default_value(20),
                 "grid-size")
                ("heroes-per-player,k",
                 boost::program_options::value<uint16_t>()->default_value(4),
                 "heroes-per-player")
                ("obstacle-percent,o",
                 boost::program_options::value<uint16_t>()->default_value(15),
                 "obstacle-percent")
                ("seed,s", boost::program_options::value<uint32_t>(), "seed");

        boost::program_options::variables_map vm;
        boost::program_options::store(boost::program_options::parse_command_line(argc, av, desc),
                                      vm);
        boost::program_options::notify(vm);
        if (help_provided(vm)) {
            std::cout << desc << "\n";
            exit(0);
        }
        if (!necessary_arguments_provided(vm)) {
            std::cerr << "Wrong arguments provided\n";
            std::cerr << desc << "\n";
            exit(1);
        }
        ServerProgramParams params = get_server_program_params(vm);
        check_board(params);
        return params;
    }
}
