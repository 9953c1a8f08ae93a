#include "grid_layout.hpp"

#include <algorithm>
#include <vector>

namespace {

// Margin between a cell edge and the rectangle a room may occupy.
constexpr int ROOM_CELL_MARGIN = 2;
constexpr int ROOM_MIN_W = 5;
constexpr int ROOM_MIN_H = 4;
constexpr int MAZE_MIN_SIDE = 7;

std::vector<int> usableNeighbourDirs(const DungeonGrid& grid, int x, int y, bool skipLinked) {
    std::vector<int> dirs;
    for (int d = 0; d < 4; ++d) {
        const int nx = x + DIRS4[d][0];
        const int ny = y + DIRS4[d][1];
        if (!grid.usable(nx, ny)) continue;
        if (skipLinked && cellsLinked(grid, x, y, d)) continue;
        dirs.push_back(d);
    }
    return dirs;
}

void setAllRoles(DungeonGrid& grid, CellRole role) {
    for (auto& c : grid.cells) {
        if (!c.invalid) c.role = role;
    }
}

void invalidateCell(DungeonGrid& grid, int x, int y) {
    GridCell& c = grid.cell(x, y);
    c.invalid = true;
    c.role = CellRole::Unused;
}

bool planStandard(Floor& floor, DungeonGrid& grid, const FloorProperties& props, RandomSource& rng) {
    const int maxCols = std::max(2, std::min(6, floor.width() / 9));
    const int maxRows = std::max(2, std::min(4, floor.height() / 8));
    const int cols = (props.gridCols > 0) ? props.gridCols : rng.range(2, maxCols);
    const int rows = (props.gridRows > 0) ? props.gridRows : rng.range(2, maxRows);

    initDungeonGrid(grid, floor.width(), floor.height(), cols, rows, props.floorSize);
    assignRooms(grid, props.roomDensity, rng);
    assignGridCellConnections(grid, props.connectivity, rng);
    ensureConnectedGrid(grid, props.has(FF_AllowDeadEnds), rng);
    return createRoomsAndAnchors(floor, grid, props, rng);
}

bool planOuterRing(Floor& floor, DungeonGrid& grid, const FloorProperties& props, RandomSource& rng) {
    initDungeonGrid(grid, floor.width(), floor.height(), 6, 4, FloorSize::Large);

    for (int y = 0; y < grid.rows; ++y) {
        for (int x = 0; x < grid.cols; ++x) {
            const bool ring = (x == 0 || y == 0 || x == grid.cols - 1 || y == grid.rows - 1);
            grid.cell(x, y).role = ring ? CellRole::HallwayAnchor : CellRole::Room;
        }
    }

    // The ring itself is one closed loop of hallways.
    for (int x = 0; x < grid.cols - 1; ++x) {
        linkCells(grid, x, 0, DIR_RIGHT);
        linkCells(grid, x, grid.rows - 1, DIR_RIGHT);
    }
    for (int y = 0; y < grid.rows - 1; ++y) {
        linkCells(grid, 0, y, DIR_DOWN);
        linkCells(grid, grid.cols - 1, y, DIR_DOWN);
    }

    for (int y = 1; y < grid.rows - 1; ++y) {
        for (int x = 1; x < grid.cols - 1; ++x) {
            if (x < grid.cols - 2 && rng.coin()) linkCells(grid, x, y, DIR_RIGHT);
            if (y < grid.rows - 2 && rng.coin()) linkCells(grid, x, y, DIR_DOWN);
        }
    }
    for (int x = 1; x < grid.cols - 1; ++x) {
        linkCells(grid, x, 1, DIR_UP);
        linkCells(grid, x, grid.rows - 2, DIR_DOWN);
    }

    return createRoomsAndAnchors(floor, grid, props, rng);
}

bool planCrossroads(Floor& floor, DungeonGrid& grid, const FloorProperties& props, RandomSource& rng) {
    initDungeonGrid(grid, floor.width(), floor.height(), 5, 4, FloorSize::Large);
    const int lastX = grid.cols - 1;
    const int lastY = grid.rows - 1;

    invalidateCell(grid, 0, 0);
    invalidateCell(grid, lastX, 0);
    invalidateCell(grid, 0, lastY);
    invalidateCell(grid, lastX, lastY);

    for (int y = 0; y < grid.rows; ++y) {
        for (int x = 0; x < grid.cols; ++x) {
            GridCell& c = grid.cell(x, y);
            if (c.invalid) continue;
            const bool interior = (x > 0 && y > 0 && x < lastX && y < lastY);
            c.role = interior ? CellRole::HallwayAnchor : CellRole::Room;
        }
    }

    // Interior anchors form a full mesh.
    for (int y = 1; y < lastY; ++y) {
        for (int x = 1; x < lastX; ++x) {
            if (x < lastX - 1) linkCells(grid, x, y, DIR_RIGHT);
            if (y < lastY - 1) linkCells(grid, x, y, DIR_DOWN);
        }
    }
    for (int x = 1; x < lastX; ++x) {
        linkCells(grid, x, 0, DIR_DOWN);
        linkCells(grid, x, lastY, DIR_UP);
    }
    for (int y = 1; y < lastY; ++y) {
        linkCells(grid, 0, y, DIR_RIGHT);
        linkCells(grid, lastX, y, DIR_LEFT);
    }

    return createRoomsAndAnchors(floor, grid, props, rng);
}

bool planLine(Floor& floor, DungeonGrid& grid, const FloorProperties& props, RandomSource& rng) {
    initDungeonGrid(grid, floor.width(), floor.height(), 5, 1, FloorSize::Large);
    assignRooms(grid, props.roomDensity, rng);
    for (int x = 0; x < grid.cols - 1; ++x) {
        linkCells(grid, x, 0, DIR_RIGHT);
    }
    ensureConnectedGrid(grid, props.has(FF_AllowDeadEnds), rng);
    return createRoomsAndAnchors(floor, grid, props, rng);
}

bool planCross(Floor& floor, DungeonGrid& grid, const FloorProperties& props, RandomSource& rng) {
    initDungeonGrid(grid, floor.width(), floor.height(), 3, 3, FloorSize::Large);
    invalidateCell(grid, 0, 0);
    invalidateCell(grid, 2, 0);
    invalidateCell(grid, 0, 2);
    invalidateCell(grid, 2, 2);
    setAllRoles(grid, CellRole::Room);

    for (int d = 0; d < 4; ++d) {
        linkCells(grid, 1, 1, d);
    }
    return createRoomsAndAnchors(floor, grid, props, rng);
}

bool planBeetle(Floor& floor, DungeonGrid& grid, const FloorProperties& props, RandomSource& rng) {
    initDungeonGrid(grid, floor.width(), floor.height(), 3, 3, FloorSize::Large);
    setAllRoles(grid, CellRole::Room);

    for (int y = 0; y < grid.rows; ++y) {
        linkCells(grid, 0, y, DIR_RIGHT);
        linkCells(grid, 1, y, DIR_RIGHT);
    }
    if (!createRoomsAndAnchors(floor, grid, props, rng)) return false;
    // The body of the beetle is one tall room.
    return mergeRoomsVertically(floor, grid, 1, 0, grid.rows - 1);
}

bool planOuterRooms(Floor& floor, DungeonGrid& grid, const FloorProperties& props, RandomSource& rng) {
    const int maxCols = std::max(4, std::min(6, floor.width() / 9));
    const int cols = (props.gridCols > 0) ? props.gridCols : rng.range(4, maxCols);
    const int rows = (props.gridRows > 0) ? props.gridRows : std::max(2, std::min(4, floor.height() / 8));
    initDungeonGrid(grid, floor.width(), floor.height(), cols, rows, FloorSize::Large);

    for (int y = 0; y < grid.rows; ++y) {
        for (int x = 0; x < grid.cols; ++x) {
            const bool edge = (x == 0 || y == 0 || x == grid.cols - 1 || y == grid.rows - 1);
            if (edge) grid.cell(x, y).role = CellRole::Room;
            else invalidateCell(grid, x, y);
        }
    }

    for (int y = 0; y < grid.rows - 1; ++y) {
        linkCells(grid, 0, y, DIR_DOWN);
        linkCells(grid, grid.cols - 1, y, DIR_DOWN);
    }
    for (int x = 1; x <= grid.cols - 3; ++x) {
        linkCells(grid, x, 0, DIR_RIGHT);
        linkCells(grid, x, grid.rows - 1, DIR_RIGHT);
    }
    // With fewer than 4 columns the corner links are never made, so the middle
    // rooms of the top and bottom rows stay isolated.
    if (grid.cols >= 4) {
        linkCells(grid, 0, 0, DIR_RIGHT);
        linkCells(grid, grid.cols - 2, 0, DIR_RIGHT);
        linkCells(grid, 0, grid.rows - 1, DIR_RIGHT);
        linkCells(grid, grid.cols - 2, grid.rows - 1, DIR_RIGHT);
    }

    return createRoomsAndAnchors(floor, grid, props, rng);
}

bool planOneRoomMonsterHouse(Floor& floor, DungeonGrid& grid) {
    initDungeonGrid(grid, floor.width(), floor.height(), 1, 1, FloorSize::Large);
    buildOneRoomMonsterHouse(floor);

    GridCell& c = grid.cell(0, 0);
    c.role = CellRole::Room;
    c.roomIndex = 0;
    c.area = floor.rooms.front().bounds;
    return true;
}

bool planTwoRoomsWithMonsterHouse(Floor& floor, DungeonGrid& grid, const FloorProperties& props, RandomSource& rng) {
    initDungeonGrid(grid, floor.width(), floor.height(), 2, 1, FloorSize::Large);
    setAllRoles(grid, CellRole::Room);
    linkCells(grid, 0, 0, DIR_RIGHT);
    if (!createRoomsAndAnchors(floor, grid, props, rng)) return false;

    const GridCell& pick = grid.cell(rng.below(2), 0);
    RoomInfo* room = floor.findRoom(pick.roomIndex);
    if (!room) return false;
    room->monsterHouse = true;
    floor.grid.flagRoomTiles(room->index, TF_MonsterHouse);
    return true;
}

} // namespace

std::vector<int> gridPositions(int extent, int count) {
    std::vector<int> out;
    if (count <= 0) count = 1;
    const int step = extent / count;
    out.reserve(static_cast<size_t>(count + 1));
    for (int i = 0; i < count; ++i) {
        out.push_back(i * step);
    }
    out.push_back(extent);
    return out;
}

void initDungeonGrid(DungeonGrid& grid, int width, int height, int cols, int rows, FloorSize size) {
    grid.cols = std::max(1, cols);
    grid.rows = std::max(1, rows);
    grid.xs = gridPositions(width, grid.cols);
    grid.ys = gridPositions(height, grid.rows);
    grid.cells.assign(static_cast<size_t>(grid.cols * grid.rows), GridCell{});

    int keepCols = grid.cols;
    if (size == FloorSize::Medium) keepCols = std::max(1, (3 * grid.cols) / 4);
    else if (size == FloorSize::Small) keepCols = std::max(1, grid.cols / 2);

    for (int y = 0; y < grid.rows; ++y) {
        for (int x = 0; x < grid.cols; ++x) {
            GridCell& c = grid.cell(x, y);
            c.bounds = { grid.xs[static_cast<size_t>(x)], grid.ys[static_cast<size_t>(y)],
                         grid.xs[static_cast<size_t>(x + 1)], grid.ys[static_cast<size_t>(y + 1)] };
            c.invalid = (x >= keepCols);
        }
    }
}

int assignRooms(DungeonGrid& grid, int roomDensity, RandomSource& rng) {
    std::vector<size_t> valid;
    for (size_t i = 0; i < grid.cells.size(); ++i) {
        if (!grid.cells[i].invalid) valid.push_back(i);
    }

    int n = (roomDensity < 0) ? -roomDensity : roomDensity + rng.range(0, 2);
    if (valid.size() >= 2) n = std::max(n, 2);
    n = std::min(n, static_cast<int>(valid.size()));

    shuffleInPlace(valid, rng);
    for (size_t i = 0; i < valid.size(); ++i) {
        grid.cells[valid[i]].role = (static_cast<int>(i) < n) ? CellRole::Room : CellRole::HallwayAnchor;
    }
    return n;
}

void linkCells(DungeonGrid& grid, int x, int y, int dir) {
    const int nx = x + DIRS4[dir][0];
    const int ny = y + DIRS4[dir][1];
    if (!grid.inGrid(x, y) || !grid.inGrid(nx, ny)) return;

    GridCell& a = grid.cell(x, y);
    GridCell& b = grid.cell(nx, ny);
    switch (dir) {
        case DIR_UP:    a.connTop = true;    b.connBottom = true; break;
        case DIR_RIGHT: a.connRight = true;  b.connLeft = true;   break;
        case DIR_DOWN:  a.connBottom = true; b.connTop = true;    break;
        case DIR_LEFT:  a.connLeft = true;   b.connRight = true;  break;
        default: break;
    }
}

bool cellsLinked(const DungeonGrid& grid, int x, int y, int dir) {
    if (!grid.inGrid(x, y)) return false;
    const GridCell& c = grid.cell(x, y);
    switch (dir) {
        case DIR_UP:    return c.connTop;
        case DIR_RIGHT: return c.connRight;
        case DIR_DOWN:  return c.connBottom;
        case DIR_LEFT:  return c.connLeft;
        default: return false;
    }
}

void assignGridCellConnections(DungeonGrid& grid, int steps, RandomSource& rng) {
    std::vector<Vec2i> usable;
    for (int y = 0; y < grid.rows; ++y) {
        for (int x = 0; x < grid.cols; ++x) {
            if (grid.usable(x, y)) usable.push_back({x, y});
        }
    }
    if (usable.empty()) return;

    Vec2i cur = usable[static_cast<size_t>(rng.below(static_cast<int>(usable.size())))];
    for (int i = 0; i < steps; ++i) {
        const int startDir = rng.below(4);
        bool moved = false;
        for (int k = 0; k < 4; ++k) {
            const int d = (startDir + k) & 3;
            const int nx = cur.x + DIRS4[d][0];
            const int ny = cur.y + DIRS4[d][1];
            if (!grid.usable(nx, ny)) continue;
            linkCells(grid, cur.x, cur.y, d);
            cur = {nx, ny};
            moved = true;
            break;
        }
        if (!moved) break;
    }
}

void ensureConnectedGrid(DungeonGrid& grid, bool allowDeadEnds, RandomSource& rng) {
    for (int y = 0; y < grid.rows; ++y) {
        for (int x = 0; x < grid.cols; ++x) {
            const GridCell& c = grid.cell(x, y);
            if (!c.usable() || c.role != CellRole::Room || c.connectionCount() > 0) continue;
            const std::vector<int> dirs = usableNeighbourDirs(grid, x, y, false);
            if (dirs.empty()) continue;
            linkCells(grid, x, y, dirs[static_cast<size_t>(rng.below(static_cast<int>(dirs.size())))]);
        }
    }

    for (auto& c : grid.cells) {
        if (c.usable() && c.role == CellRole::HallwayAnchor && c.connectionCount() == 0) {
            c.role = CellRole::Unused;
            c.invalid = true;
        }
    }

    if (allowDeadEnds) return;

    for (int y = 0; y < grid.rows; ++y) {
        for (int x = 0; x < grid.cols; ++x) {
            const GridCell& c = grid.cell(x, y);
            if (!c.usable() || c.role != CellRole::HallwayAnchor || c.connectionCount() != 1) continue;
            const std::vector<int> dirs = usableNeighbourDirs(grid, x, y, true);
            if (dirs.empty()) continue;
            linkCells(grid, x, y, dirs[static_cast<size_t>(rng.below(static_cast<int>(dirs.size())))]);
        }
    }
}

bool createRoomsAndAnchors(Floor& floor, DungeonGrid& grid, const FloorProperties& props, RandomSource& rng) {
    TileGrid& g = floor.grid;
    int nextIndex = 0;
    bool mazeChosen = false;

    for (int y = 0; y < grid.rows; ++y) {
        for (int x = 0; x < grid.cols; ++x) {
            GridCell& c = grid.cell(x, y);
            if (!c.usable()) continue;

            if (c.role == CellRole::HallwayAnchor) {
                if (c.bounds.empty()) return false;
                const int ax = clampi(c.bounds.cx(), 1, g.width - 2);
                const int ay = clampi(c.bounds.cy(), 1, g.height - 2);
                Tile& t = g.at(ax, ay);
                t.terrain = Terrain::Floor;
                t.room = ROOM_ANCHOR;
                c.area = { ax, ay, ax + 1, ay + 1 };
                continue;
            }

            const Recti avail{ c.bounds.x0 + ROOM_CELL_MARGIN, c.bounds.y0 + ROOM_CELL_MARGIN,
                               c.bounds.x1 - ROOM_CELL_MARGIN, c.bounds.y1 - ROOM_CELL_MARGIN };
            if (avail.width() < ROOM_MIN_W || avail.height() < ROOM_MIN_H) return false;
            if (nextIndex > ROOM_INDEX_MAX) return false;

            bool maze = false;
            if (props.has(FF_MazeRooms) && !mazeChosen &&
                avail.width() >= MAZE_MIN_SIDE && avail.height() >= MAZE_MIN_SIDE) {
                maze = rng.chancePct(props.mazeRoomChance);
            }

            int w = rng.range(maze ? MAZE_MIN_SIDE : ROOM_MIN_W, avail.width());
            int h = rng.range(maze ? MAZE_MIN_SIDE : ROOM_MIN_H, avail.height());
            // Maze lines walk on a stride of two, so maze rooms need odd sides.
            if (maze) {
                if (w % 2 == 0) --w;
                if (h % 2 == 0) --h;
                mazeChosen = true;
            }

            const int rx = rng.range(avail.x0, avail.x1 - w);
            const int ry = rng.range(avail.y0, avail.y1 - h);

            RoomInfo info;
            info.index = static_cast<uint8_t>(nextIndex++);
            info.bounds = { rx, ry, rx + w, ry + h };
            info.maze = maze;
            if (props.has(FF_ImperfectRooms)) info.imperfect = rng.chancePct(props.imperfectionChance);
            if (props.has(FF_SecondaryTerrain) && !maze) info.secondaryStructure = rng.coin();

            g.fillRoom(info.bounds, info.index);
            c.area = info.bounds;
            c.roomIndex = info.index;
            floor.rooms.push_back(info);
        }
    }
    return true;
}

bool mergeRoomsVertically(Floor& floor, DungeonGrid& grid, int x, int y0, int y1) {
    if (!grid.inGrid(x, y0) || !grid.inGrid(x, y1) || y1 <= y0) return false;

    Recti u = grid.cell(x, y0).area;
    for (int y = y0; y <= y1; ++y) {
        const GridCell& c = grid.cell(x, y);
        if (!c.usable() || c.role != CellRole::Room) return false;
        u.x0 = std::min(u.x0, c.area.x0);
        u.y0 = std::min(u.y0, c.area.y0);
        u.x1 = std::max(u.x1, c.area.x1);
        u.y1 = std::max(u.y1, c.area.y1);
    }

    const uint8_t keep = grid.cell(x, y0).roomIndex;
    for (int y = y0; y <= y1; ++y) {
        GridCell& c = grid.cell(x, y);
        if (c.roomIndex != keep) {
            const uint8_t gone = c.roomIndex;
            floor.rooms.erase(std::remove_if(floor.rooms.begin(), floor.rooms.end(),
                                             [gone](const RoomInfo& r) { return r.index == gone; }),
                              floor.rooms.end());
        }
        c.roomIndex = keep;
        c.area = u;
        c.mergedBelow = (y < y1);
    }

    floor.grid.fillRoom(u, keep);
    RoomInfo* room = floor.findRoom(keep);
    if (!room) return false;
    room->bounds = u;
    room->merged = true;
    room->maze = false;
    return true;
}

void buildOneRoomMonsterHouse(Floor& floor) {
    const Recti r{ 2, 2, floor.width() - 2, floor.height() - 2 };
    floor.grid.fillRoom(r, 0);

    RoomInfo info;
    info.index = 0;
    info.bounds = r;
    info.monsterHouse = true;
    floor.rooms.push_back(info);
    floor.grid.flagRoomTiles(0, TF_MonsterHouse);
}

bool planLayout(Floor& floor, DungeonGrid& grid, FloorLayout layout, const FloorProperties& props, RandomSource& rng) {
    switch (layout) {
        case FloorLayout::Standard:                 return planStandard(floor, grid, props, rng);
        case FloorLayout::OuterRing:                return planOuterRing(floor, grid, props, rng);
        case FloorLayout::Crossroads:               return planCrossroads(floor, grid, props, rng);
        case FloorLayout::Line:                     return planLine(floor, grid, props, rng);
        case FloorLayout::Cross:                    return planCross(floor, grid, props, rng);
        case FloorLayout::Beetle:                   return planBeetle(floor, grid, props, rng);
        case FloorLayout::OuterRooms:               return planOuterRooms(floor, grid, props, rng);
        case FloorLayout::OneRoomMonsterHouse:      return planOneRoomMonsterHouse(floor, grid);
        case FloorLayout::TwoRoomsWithMonsterHouse: return planTwoRoomsWithMonsterHouse(floor, grid, props, rng);
    }
    return false;
}
