#include "floor_features.hpp"

#include "junctions.hpp"

#include <algorithm>
#include <vector>

namespace {

constexpr int RIVER_SIDESTEP_CHANCE = 30;
constexpr int RIVER_LAKE_CHANCE = 3;
constexpr int EXTRA_HALLWAY_MAX_STEPS = 30;
constexpr int EXTRA_HALLWAY_TURN_CHANCE = 20;

bool isRoomTile(const TileGrid& g, int x, int y, uint8_t roomIndex) {
    if (!g.inBounds(x, y)) return false;
    const Tile& t = g.at(x, y);
    return t.isOpen() && t.room == roomIndex;
}

// Removes up to `len` tiles from a room corner, walking in direction (dx, dy).
// Stops at the first tile that must stay open.
int trimCornerStrip(TileGrid& g, const RoomInfo& room, int x, int y, int dx, int dy, int len) {
    int removed = 0;
    for (int i = 0; i < len; ++i) {
        if (!isRoomTile(g, x, y, room.index)) break;
        Tile& t = g.at(x, y);
        if (t.has(TF_Junction) || isNextToHallway(g, x, y)) break;
        t.terrain = Terrain::Wall;
        t.room = ROOM_HALLWAY;
        ++removed;
        x += dx;
        y += dy;
    }
    return removed;
}

// Adds one floor tile just outside a random side of the room.
bool growNub(TileGrid& g, const RoomInfo& room, RandomSource& rng) {
    const Recti& b = room.bounds;
    const int side = rng.below(4);
    int x = 0;
    int y = 0;
    switch (side) {
        case DIR_UP:    x = rng.range(b.x0, b.x1 - 1); y = b.y0 - 1; break;
        case DIR_DOWN:  x = rng.range(b.x0, b.x1 - 1); y = b.y1;     break;
        case DIR_LEFT:  x = b.x0 - 1; y = rng.range(b.y0, b.y1 - 1); break;
        default:        x = b.x1;     y = rng.range(b.y0, b.y1 - 1); break;
    }

    if (!g.inInterior(x, y) || !g.isPassableWall(x, y)) return false;
    const int inX = x - DIRS4[side][0];
    const int inY = y - DIRS4[side][1];
    if (!isRoomTile(g, inX, inY, room.index)) return false;

    // The nub may only touch its own room.
    for (const auto& dv : DIRS4) {
        const int nx = x + dv[0];
        const int ny = y + dv[1];
        if (nx == inX && ny == inY) continue;
        if (g.inBounds(nx, ny) && g.at(nx, ny).terrain != Terrain::Wall) return false;
    }

    Tile& t = g.at(x, y);
    t.terrain = Terrain::Floor;
    t.room = room.index;
    return true;
}

// Digs one extra hallway. The path is committed only when it reaches open ground
// that is not the room it started from.
bool digExtraHallway(Floor& floor, RandomSource& rng) {
    TileGrid& g = floor.grid;
    if (floor.rooms.empty()) return false;

    const RoomInfo& room = floor.rooms[static_cast<size_t>(rng.below(static_cast<int>(floor.rooms.size())))];
    int x = rng.range(room.bounds.x0, room.bounds.x1 - 1);
    int y = rng.range(room.bounds.y0, room.bounds.y1 - 1);
    int dir = rng.below(4);
    if (!isRoomTile(g, x, y, room.index)) return false;

    while (isRoomTile(g, x, y, room.index)) {
        x += DIRS4[dir][0];
        y += DIRS4[dir][1];
    }

    std::vector<Vec2i> path;
    bool reached = false;
    for (int step = 0; step < EXTRA_HALLWAY_MAX_STEPS; ++step) {
        if (!g.inInterior(x, y)) return false;
        const Tile& t = g.at(x, y);
        if (t.has(TF_Impassable)) return false;
        if (t.isOpen()) {
            if (t.room == room.index) return false;
            reached = true;
            break;
        }
        if (t.terrain != Terrain::Wall) return false;

        const int sx = DIRS4[(dir + 1) & 3][0];
        const int sy = DIRS4[(dir + 1) & 3][1];
        if (g.isWalkable(x + sx, y + sy) || g.isWalkable(x - sx, y - sy)) return false;

        path.push_back({x, y});
        if (path.size() >= 3 && rng.chancePct(EXTRA_HALLWAY_TURN_CHANCE)) {
            dir = (dir + (rng.coin() ? 1 : 3)) & 3;
        }
        x += DIRS4[dir][0];
        y += DIRS4[dir][1];
    }
    if (!reached || path.empty()) return false;

    int minX = path.front().x, maxX = minX;
    int minY = path.front().y, maxY = minY;
    for (const Vec2i& p : path) {
        Tile& t = g.at(p.x, p.y);
        t.terrain = Terrain::Floor;
        t.room = ROOM_HALLWAY;
        minX = std::min(minX, p.x);
        maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y);
        maxY = std::max(maxY, p.y);
    }
    flagHallwayJunctions(g, minX - 1, minY - 1, maxX + 1, maxY + 1);
    return true;
}

} // namespace

void setTerrainObstacleChecked(TileGrid& grid, int x, int y, bool useSecondary, uint8_t roomIndex) {
    if (!grid.inBounds(x, y)) return;
    Tile& t = grid.at(x, y);
    if (useSecondary && t.room == roomIndex && !t.has(TF_Impassable)) {
        t.terrain = Terrain::Secondary;
    } else {
        t.terrain = Terrain::Wall;
    }
    t.clear(TF_Junction);
}

bool setSecondaryTerrainOnWall(TileGrid& grid, int x, int y) {
    if (!grid.inInterior(x, y) || !grid.isPassableWall(x, y)) return false;
    grid.at(x, y).terrain = Terrain::Secondary;
    return true;
}

int generateMazeLine(TileGrid& grid, const Recti& bounds, Vec2i start, bool useSecondary,
                     uint8_t roomIndex, RandomSource& rng) {
    auto openIn = [&](int x, int y) {
        return bounds.contains(x, y) && grid.inBounds(x, y) && grid.at(x, y).isOpen();
    };

    int placed = 0;
    Vec2i cur = start;
    for (;;) {
        int dirs[4];
        int n = 0;
        for (int d = 0; d < 4; ++d) {
            const int mx = cur.x + DIRS4[d][0];
            const int my = cur.y + DIRS4[d][1];
            const int tx = cur.x + 2 * DIRS4[d][0];
            const int ty = cur.y + 2 * DIRS4[d][1];
            if (openIn(mx, my) && openIn(tx, ty)) dirs[n++] = d;
        }
        if (n == 0) break;

        const int d = dirs[rng.below(n)];
        const int mx = cur.x + DIRS4[d][0];
        const int my = cur.y + DIRS4[d][1];
        cur = { cur.x + 2 * DIRS4[d][0], cur.y + 2 * DIRS4[d][1] };
        setTerrainObstacleChecked(grid, mx, my, useSecondary, roomIndex);
        setTerrainObstacleChecked(grid, cur.x, cur.y, useSecondary, roomIndex);
        placed += 2;
    }
    return placed;
}

int generateMaze(TileGrid& grid, const RoomInfo& room, bool useSecondary, RandomSource& rng) {
    const Recti& b = room.bounds;
    int placed = 0;

    auto fromWall = [&](int x, int y) {
        if (!grid.inBounds(x, y) || grid.at(x, y).isOpen()) return;
        placed += generateMazeLine(grid, b, {x, y}, useSecondary, room.index, rng);
    };

    for (int x = b.x0 + 1; x < b.x1; x += 2) {
        fromWall(x, b.y0 - 1);
        fromWall(x, b.y1);
    }
    for (int y = b.y0 + 1; y < b.y1; y += 2) {
        fromWall(b.x0 - 1, y);
        fromWall(b.x1, y);
    }

    for (int y = b.y0 + 3; y <= b.y1 - 4; y += 2) {
        for (int x = b.x0 + 3; x <= b.x1 - 4; x += 2) {
            if (!isRoomTile(grid, x, y, room.index)) continue;
            setTerrainObstacleChecked(grid, x, y, useSecondary, room.index);
            placed += 1 + generateMazeLine(grid, b, {x, y}, useSecondary, room.index, rng);
        }
    }
    return placed;
}

int generateLake(TileGrid& grid, Vec2i center, int size, RandomSource& rng) {
    const int W = grid.width;
    auto idx = [&](int x, int y) -> size_t { return static_cast<size_t>(y * W + x); };

    std::vector<uint8_t> seen(grid.tiles.size(), 0);
    std::vector<Vec2i> frontier;
    int converted = 0;
    if (!grid.inBounds(center.x, center.y)) return 0;
    seen[idx(center.x, center.y)] = 1;
    if (setSecondaryTerrainOnWall(grid, center.x, center.y)) ++converted;

    auto pushNeighbours = [&](const Vec2i& p) {
        for (const auto& dv : DIRS4) {
            const int nx = p.x + dv[0];
            const int ny = p.y + dv[1];
            if (!grid.inInterior(nx, ny) || seen[idx(nx, ny)]) continue;
            seen[idx(nx, ny)] = 1;
            frontier.push_back({nx, ny});
        }
    };
    pushNeighbours(center);

    while (converted < size && !frontier.empty()) {
        const size_t i = static_cast<size_t>(rng.below(static_cast<int>(frontier.size())));
        const Vec2i p = frontier[i];
        frontier[i] = frontier.back();
        frontier.pop_back();
        if (!setSecondaryTerrainOnWall(grid, p.x, p.y)) continue;
        ++converted;
        pushNeighbours(p);
    }
    return converted;
}

int generateSecondaryTerrainFormations(TileGrid& grid, int count, RandomSource& rng, FeatureSummary* summary) {
    const int W = grid.width;
    const int H = grid.height;
    if (W < 6 || H < 4) return 0;

    int converted = 0;
    for (int r = 0; r < count; ++r) {
        int x = rng.range(2, W - 3);
        const bool fromTop = rng.coin();
        int y = fromTop ? 1 : H - 2;
        const int dy = fromTop ? 1 : -1;
        bool sidestepped = false;

        if (summary) summary->rivers++;
        for (int steps = 0; steps < W * H; ++steps) {
            if (!grid.inInterior(x, y)) break;
            if (grid.at(x, y).terrain == Terrain::Secondary) break;
            if (setSecondaryTerrainOnWall(grid, x, y)) ++converted;

            if (steps > 4 && rng.chancePct(RIVER_LAKE_CHANCE)) {
                converted += generateLake(grid, {x, y}, rng.range(4, 12), rng);
                if (summary) summary->lakes++;
                break;
            }

            // Never two sidesteps in a row, so a river cannot fold back on itself.
            if (!sidestepped && rng.chancePct(RIVER_SIDESTEP_CHANCE)) {
                x += rng.coin() ? 1 : -1;
                sidestepped = true;
            } else {
                y += dy;
                sidestepped = false;
            }
        }
    }

    if (summary) summary->secondaryTiles += converted;
    return converted;
}

int generateSecondaryStructures(Floor& floor, int budget, RandomSource& rng) {
    TileGrid& g = floor.grid;
    int built = 0;
    for (const RoomInfo& room : floor.rooms) {
        if (built >= budget) break;
        if (!room.secondaryStructure || room.maze) continue;
        const Recti& b = room.bounds;
        if (b.width() < 5 || b.height() < 5) continue;

        if (rng.coin()) {
            // Central pool with a two tile walkable ring.
            const Recti pool{ b.x0 + 2, b.y0 + 2, b.x1 - 2, b.y1 - 2 };
            if (pool.empty()) continue;
            for (int y = pool.y0; y < pool.y1; ++y) {
                for (int x = pool.x0; x < pool.x1; ++x) {
                    if (isRoomTile(g, x, y, room.index)) setTerrainObstacleChecked(g, x, y, true, room.index);
                }
            }
        } else {
            for (int y = b.y0 + 1; y < b.y1 - 1; y += 2) {
                for (int x = b.x0 + 1; x < b.x1 - 1; x += 2) {
                    if (isRoomTile(g, x, y, room.index)) setTerrainObstacleChecked(g, x, y, true, room.index);
                }
            }
        }
        ++built;
    }
    return built;
}

int generateRoomImperfections(Floor& floor, RandomSource& rng) {
    TileGrid& g = floor.grid;
    int changed = 0;
    for (const RoomInfo& room : floor.rooms) {
        if (!room.imperfect || room.maze || room.merged) continue;
        const Recti& b = room.bounds;

        // Corner, direction along the row, direction along the column.
        const int corners[4][4] = {
            { b.x0,     b.y0,      1,  1 },
            { b.x1 - 1, b.y0,     -1,  1 },
            { b.x0,     b.y1 - 1,  1, -1 },
            { b.x1 - 1, b.y1 - 1, -1, -1 },
        };

        int removed = 0;
        for (const auto& c : corners) {
            if (!rng.coin()) continue;
            if (rng.coin()) {
                const int len = rng.range(1, std::max(1, b.width() / 3));
                removed += trimCornerStrip(g, room, c[0], c[1], c[2], 0, len);
            } else {
                const int len = rng.range(1, std::max(1, b.height() / 3));
                removed += trimCornerStrip(g, room, c[0], c[1], 0, c[3], len);
            }
        }

        const bool nub = rng.chancePct(50) && growNub(g, room, rng);
        if (removed > 0 || nub) ++changed;
    }
    return changed;
}

int generateExtraHallways(Floor& floor, int count, RandomSource& rng) {
    int made = 0;
    for (int i = 0; i < count; ++i) {
        if (digExtraHallway(floor, rng)) ++made;
    }
    return made;
}

int generateKecleonShop(Floor& floor, int chancePct, RandomSource& rng) {
    if (!rng.chancePct(chancePct)) return -1;

    std::vector<size_t> eligible;
    for (size_t i = 0; i < floor.rooms.size(); ++i) {
        const RoomInfo& r = floor.rooms[i];
        if (r.maze || r.monsterHouse || r.merged) continue;
        if (r.bounds.width() < 5 || r.bounds.height() < 4) continue;
        eligible.push_back(i);
    }
    if (eligible.empty()) return -1;

    RoomInfo& room = floor.rooms[eligible[static_cast<size_t>(rng.below(static_cast<int>(eligible.size())))]];
    room.kecleonShop = true;

    const Recti& b = room.bounds;
    for (int y = b.y0 + 1; y < b.y1 - 1; ++y) {
        for (int x = b.x0 + 1; x < b.x1 - 1; ++x) {
            if (isRoomTile(floor.grid, x, y, room.index)) floor.grid.at(x, y).set(TF_KecleonShop);
        }
    }
    return room.index;
}

int markMonsterHouse(Floor& floor, uint8_t roomIndex) {
    if (roomIndex > ROOM_INDEX_MAX) return 0;
    RoomInfo* room = floor.findRoom(roomIndex);
    if (room) room->monsterHouse = true;
    return floor.grid.flagRoomTiles(roomIndex, TF_MonsterHouse);
}

int generateMonsterHouse(Floor& floor, int chancePct, RandomSource& rng) {
    // Layouts that come with a Monster House already chose it.
    for (const RoomInfo& r : floor.rooms) {
        if (r.monsterHouse) {
            markMonsterHouse(floor, r.index);
            return r.index;
        }
    }
    if (!rng.chancePct(chancePct)) return -1;

    std::vector<uint8_t> eligible;
    for (const RoomInfo& r : floor.rooms) {
        if (!r.kecleonShop && !r.maze) eligible.push_back(r.index);
    }
    if (eligible.empty()) return -1;

    const uint8_t pick = eligible[static_cast<size_t>(rng.below(static_cast<int>(eligible.size())))];
    markMonsterHouse(floor, pick);
    return pick;
}

int convertSecondaryTerrainToChasms(TileGrid& grid) {
    int n = 0;
    for (auto& t : grid.tiles) {
        if (t.terrain != Terrain::Secondary) continue;
        t.terrain = Terrain::Chasm;
        ++n;
    }
    return n;
}

int convertWallsToChasms(TileGrid& grid) {
    int n = 0;
    for (auto& t : grid.tiles) {
        if (t.terrain != Terrain::Wall || t.has(TF_Impassable)) continue;
        t.terrain = Terrain::Chasm;
        ++n;
    }
    return n;
}

int ensureImpassableTilesAreWalls(TileGrid& grid) {
    int n = 0;
    for (auto& t : grid.tiles) {
        if (!t.has(TF_Impassable) || t.terrain == Terrain::Wall) continue;
        t.terrain = Terrain::Wall;
        ++n;
    }
    return n;
}

FeatureSummary applyFloorFeatures(Floor& floor, const FloorProperties& props, RandomSource& rng) {
    FeatureSummary s;
    TileGrid& g = floor.grid;

    if (props.has(FF_MazeRooms)) {
        for (const RoomInfo& room : floor.rooms) {
            if (!room.maze) continue;
            const bool useSecondary = props.has(FF_SecondaryTerrain) && rng.coin();
            s.mazeObstacles += generateMaze(g, room, useSecondary, rng);
            s.mazeRooms++;
        }
    }

    if (props.has(FF_SecondaryTerrain)) {
        generateSecondaryTerrainFormations(g, props.secondaryTerrainDensity, rng, &s);
        s.secondaryStructures = generateSecondaryStructures(floor, props.secondaryStructuresBudget, rng);
    }

    if (props.has(FF_ImperfectRooms)) {
        s.imperfectRooms = generateRoomImperfections(floor, rng);
    }

    if (props.has(FF_ExtraHallways)) {
        s.extraHallways = generateExtraHallways(floor, props.extraHallwayDensity, rng);
    }

    if (props.has(FF_KecleonShop)) {
        s.kecleonShopRoom = generateKecleonShop(floor, props.kecleonShopChance, rng);
    }
    s.monsterHouseRoom = generateMonsterHouse(floor, props.has(FF_MonsterHouse) ? props.monsterHouseChance : 0, rng);

    if (props.has(FF_SecondaryAsChasms)) s.chasmTiles += convertSecondaryTerrainToChasms(g);
    if (props.has(FF_WallsAsChasms)) s.chasmTiles += convertWallsToChasms(g);
    ensureImpassableTilesAreWalls(g);

    return s;
}
