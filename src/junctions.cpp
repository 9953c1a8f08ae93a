#include "junctions.hpp"

#include <algorithm>

namespace {

void flagJunctionNeighbours(TileGrid& grid, int x, int y) {
    for (const auto& dv : DIRS4) {
        const int nx = x + dv[0];
        const int ny = y + dv[1];
        if (!grid.inBounds(nx, ny)) continue;
        Tile& n = grid.at(nx, ny);
        if (n.isOpen() && n.room != ROOM_HALLWAY) n.set(TF_Junction);
    }
}

} // namespace

void finalizeJunctions(TileGrid& grid) {
    for (int y = 0; y < grid.height; ++y) {
        for (int x = 0; x < grid.width; ++x) {
            Tile& t = grid.at(x, y);
            if (t.room == ROOM_ANCHOR) t.room = ROOM_HALLWAY;
            if (t.isOpen() && t.room == ROOM_HALLWAY) flagJunctionNeighbours(grid, x, y);
        }
    }
}

void flagHallwayJunctions(TileGrid& grid, int x0, int y0, int x1, int y1) {
    x0 = std::max(x0, 0);
    y0 = std::max(y0, 0);
    x1 = std::min(x1, grid.width - 1);
    y1 = std::min(y1, grid.height - 1);

    for (int y = y0; y <= y1; ++y) {
        for (int x = x0; x <= x1; ++x) {
            Tile& t = grid.at(x, y);
            if (!t.isOpen() || t.room == ROOM_HALLWAY) continue;
            for (const auto& dv : DIRS4) {
                if (grid.isHallway(x + dv[0], y + dv[1])) {
                    t.set(TF_Junction);
                    break;
                }
            }
        }
    }
}

bool isNextToHallway(const TileGrid& grid, int x, int y) {
    for (int oy = -1; oy <= 1; ++oy) {
        for (int ox = -1; ox <= 1; ++ox) {
            if (grid.isHallway(x + ox, y + oy)) return true;
        }
    }
    return false;
}
