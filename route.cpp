#include "route.hpp"

#include <boost/fusion/adapted/std_tuple.hpp>
#include <boost/spirit/home/x3.hpp>
#include <tuple>

namespace Route {
    std::string game_target(const std::string &game_id, const std::string &player_id) {
        return "/ws/game/" + game_id + "/player/" + player_id;
    }

    std::optional<GameRoute> parse_game_target(const std::string &target) {
        using namespace boost::spirit::x3;
        auto segment = +~char_("/?#");

        std::tuple<std::string, std::string> result;
        auto first = target.begin();
        bool parsed = parse(first, target.end(),
                            lit("/ws/game/") >> segment >> lit("/player/") >> segment >> -lit('/'),
                            result);
        if (!parsed || first != target.end())
            return std::nullopt;
        return GameRoute{std::get<0>(result), std::get<1>(result)};
    }
}
