#include "params_parsing.hpp"

#include <boost/fusion/adapted/std_tuple.hpp>
#include <boost/program_options.hpp>
#include <boost/spirit/home/x3.hpp>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <tuple>

namespace ProgramParams {
    AddressPair parse_server_address(const std::string &address_spec,
                                     const std::string &default_service) {
        using namespace boost::spirit::x3;
        auto service = ':' >> +~char_(":") >> eoi;
        auto host = '[' >> *~char_(']') >> ']'  // e.g. for IPV6
                    | raw[*("::" | (char_ - service))];

        std::tuple<std::string, std::string> result;
        auto first = address_spec.begin();
        bool parsed = parse(first, address_spec.end(),
                            host >> (service | attr(default_service)), result);
        if (!parsed || first != address_spec.end() || std::get<0>(result).empty())
            throw std::invalid_argument("Invalid server address: " + address_spec);

        return AddressPair{std::get<0>(result), std::get<1>(result)};
    }

    ProgramParams parse_program_params(int argc, char **av) {
        boost::program_options::options_description desc("Allowed options");
        desc.add_options()
                ("help,h", "produce help message")
                ("server-address,s", boost::program_options::value<std::string>(),
                 "server-address, host[:port]")
                ("game-id,g", boost::program_options::value<std::string>(), "game-id")
                ("player-id,i", boost::program_options::value<std::string>(), "player-id")
                ("player-name,n", boost::program_options::value<std::string>(), "player-name")
                ("max-retries,r", boost::program_options::value<uint32_t>()->default_value(3),
                 "max-retries")
                ("base-delay,d", boost::program_options::value<uint32_t>()->default_value(1000),
                 "base-delay in milliseconds");

        boost::program_options::variables_map vm;
        boost::program_options::store(boost::program_options::parse_command_line(argc, av, desc),
                                      vm);
        boost::program_options::notify(vm);
        if (vm.count("help")) {
            std::cout << desc << "\n";
            exit(0);
        }

        if (!vm.count("server-address") || !vm.count("game-id") || !vm.count("player-id")) {
            std::cerr << "Wrong arguments provided\n";
            std::cerr << desc << "\n";
            exit(1);
        }
        std::optional<std::string> player_name;
        if (vm.count("player-name"))
            player_name = vm["player-name"].as<std::string>();

        return ProgramParams(parse_server_address(vm["server-address"].as<std::string>()),
                             vm["game-id"].as<std::string>(),
                             vm["player-id"].as<std::string>(),
                             player_name,
                             vm["max-retries"].as<uint32_t>(),
                             std::chrono::milliseconds(vm["base-delay"].as<uint32_t>()));
    }
}
