#include "hallway.hpp"

#include <algorithm>

namespace {

void appendSegment(std::vector<Vec2i>& out, Vec2i from, Vec2i to) {
    const int dx = sign(to.x - from.x);
    const int dy = sign(to.y - from.y);
    Vec2i p = from;
    if (out.empty() || out.back() != p) out.push_back(p);
    while (p != to) {
        p.x += dx;
        p.y += dy;
        out.push_back(p);
    }
}

int carvePass(TileGrid& grid, const std::vector<Vec2i>& path, bool reverse) {
    int carved = 0;
    const size_t n = path.size();
    for (size_t i = 0; i < n; ++i) {
        const Vec2i& p = reverse ? path[n - 1 - i] : path[i];
        if (!grid.inBounds(p.x, p.y)) break;
        Tile& t = grid.at(p.x, p.y);
        if (t.has(TF_Impassable)) break;
        if (t.isOpen()) {
            if (i > 0) break;
            continue;
        }
        t.terrain = Terrain::Floor;
        t.room = ROOM_HALLWAY;
        ++carved;
    }
    return carved;
}

// A tile just outside the given side of the cell's room, or the anchor itself.
Vec2i exitPoint(const GridCell& c, int side, RandomSource& rng) {
    if (c.role == CellRole::HallwayAnchor) return { c.area.x0, c.area.y0 };

    const Recti& a = c.area;
    const Recti& b = c.bounds;
    if (side == DIR_LEFT || side == DIR_RIGHT) {
        const int lo = std::max(a.y0, b.y0);
        const int hi = std::max(lo, std::min(a.y1, b.y1) - 1);
        const int y = rng.range(lo, hi);
        return { side == DIR_RIGHT ? a.x1 : a.x0 - 1, y };
    }
    const int lo = std::max(a.x0, b.x0);
    const int hi = std::max(lo, std::min(a.x1, b.x1) - 1);
    const int x = rng.range(lo, hi);
    return { x, side == DIR_DOWN ? a.y1 : a.y0 - 1 };
}

} // namespace

std::vector<Vec2i> hallwayPath(Vec2i start, Vec2i end, bool vertical, int middleX, int middleY) {
    std::vector<Vec2i> out;
    if (start.x == end.x || start.y == end.y) {
        appendSegment(out, start, end);
        return out;
    }

    if (vertical) {
        appendSegment(out, start, { start.x, middleY });
        appendSegment(out, { start.x, middleY }, { end.x, middleY });
        appendSegment(out, { end.x, middleY }, end);
    } else {
        appendSegment(out, start, { middleX, start.y });
        appendSegment(out, { middleX, start.y }, { middleX, end.y });
        appendSegment(out, { middleX, end.y }, end);
    }
    return out;
}

int createHallway(TileGrid& grid, Vec2i start, Vec2i end, bool vertical, int middleX, int middleY) {
    const std::vector<Vec2i> path = hallwayPath(start, end, vertical, middleX, middleY);
    int carved = carvePass(grid, path, false);
    carved += carvePass(grid, path, true);
    return carved;
}

int createGridCellConnections(TileGrid& grid, const DungeonGrid& cells, RandomSource& rng) {
    int hallways = 0;
    for (int y = 0; y < cells.rows; ++y) {
        for (int x = 0; x < cells.cols; ++x) {
            const GridCell& c = cells.cell(x, y);
            if (!c.usable()) continue;

            if (c.connRight && cells.usable(x + 1, y)) {
                const GridCell& n = cells.cell(x + 1, y);
                const Vec2i a = exitPoint(c, DIR_RIGHT, rng);
                const Vec2i b = exitPoint(n, DIR_LEFT, rng);
                createHallway(grid, a, b, false, cells.xs[static_cast<size_t>(x + 1)], 0);
                ++hallways;
            }
            if (c.connBottom && !c.mergedBelow && cells.usable(x, y + 1)) {
                const GridCell& n = cells.cell(x, y + 1);
                const Vec2i a = exitPoint(c, DIR_DOWN, rng);
                const Vec2i b = exitPoint(n, DIR_UP, rng);
                createHallway(grid, a, b, true, 0, cells.ys[static_cast<size_t>(y + 1)]);
                ++hallways;
            }
        }
    }
    return hallways;
}
