#include "path_finding.hpp"

#include <algorithm>
#include <map>
#include <queue>

namespace PathFinding {
    static bool expandable(const Grid::GridModel &grid, const Position &position,
                           bool ignore_occupancy, const hero_id_t &mover_id) {
        if (!grid.is_in_bounds(position) || grid.is_obstacle(position))
            return false;
        return ignore_occupancy || !grid.occupied_excluding(position, mover_id);
    }

    static Path reconstruct(const std::map<Position, Position> &parents, const Position &start,
                            const Position &end) {
        Path path;
        Position current = end;
        path.push_back(current);
        while (current != start) {
            current = parents.at(current);
            path.push_back(current);
        }
        std::reverse(path.begin(), path.end());
        return path;
    }

    std::optional<Path> find_path(const Grid::GridModel &grid, const Position &start,
                                  const Position &end, int32_t max_steps,
                                  bool ignore_occupancy, const hero_id_t &mover_id) {
        if (!grid.is_in_bounds(start) || !grid.is_in_bounds(end) || max_steps < 0)
            return std::nullopt;

        std::queue<Position> frontier;
        std::map<Position, int32_t> depth;
        std::map<Position, Position> parents;
        frontier.push(start);
        depth[start] = 0;

        while (!frontier.empty()) {
            Position current = frontier.front();
            frontier.pop();
            if (current == end)
                return reconstruct(parents, start, end);

            int32_t current_depth = depth[current];
            if (current_depth >= max_steps)
                continue;

            for (auto &direction: DIRECTIONS) {
                Position next(current.x + direction.x, current.y + direction.y);
                if (depth.contains(next))
                    continue;
                if (!expandable(grid, next, ignore_occupancy, mover_id))
                    continue;
                depth[next] = current_depth + 1;
                parents[next] = current;
                frontier.push(next);
            }
        }
        return std::nullopt;
    }
}
