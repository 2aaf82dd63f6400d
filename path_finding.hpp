#pragma once

#include <array>
#include <optional>
#include <vector>

#include "grid.hpp"

namespace PathFinding {
    using Path = std::vector<Position>;

    // Exploration order is fixed so that every build picks the same route: +x, -x, +y, -y.
    const std::array<Position, 4> DIRECTIONS = {Position(1, 0), Position(-1, 0),
                                                Position(0, 1), Position(0, -1)};

    // Breadth-first search over 4-connected cells. The returned path starts with start and ends
    // with end; its length minus one is the number of steps. Cells deeper than max_steps are
    // never expanded. Unless ignore_occupancy is set, cells holding a hero other than mover_id
    // are impassable.
    std::optional<Path> find_path(const Grid::GridModel &grid, const Position &start,
                                  const Position &end, int32_t max_steps,
                                  bool ignore_occupancy, const hero_id_t &mover_id = {});

    inline size_t path_length(const Path &path) {
        return path.empty() ? 0 : path.size() - 1;
    }
}
