#include "dungeon.hpp"
#include "fixed_room.hpp"
#include "floor_dump.hpp"
#include "floor_features.hpp"
#include "floor_generator.hpp"
#include "floor_props.hpp"
#include "grid_layout.hpp"
#include "hallway.hpp"
#include "junctions.hpp"
#include "reachability.hpp"
#include "rng.hpp"
#include "spawn.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace {

int failures = 0;

void expect(bool cond, const std::string& msg) {
    if (!cond) {
        ++failures;
        std::cerr << "[FAIL] " << msg << "\n";
    }
}

int countRoomIndex(const TileGrid& g, uint8_t room) {
    int n = 0;
    for (const auto& t : g.tiles) {
        if (t.room == room) ++n;
    }
    return n;
}

void openRoom(TileGrid& g, const Recti& r, uint8_t index) {
    g.fillRoom(r, index);
}

void openHallway(TileGrid& g, int x, int y) {
    Tile& t = g.at(x, y);
    t.terrain = Terrain::Floor;
    t.room = ROOM_HALLWAY;
}

bool borderIsImpassableWall(const TileGrid& g) {
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            if (g.inInterior(x, y)) continue;
            const Tile& t = g.at(x, y);
            if (!t.has(TF_Impassable) || t.terrain != Terrain::Wall) return false;
        }
    }
    return true;
}

void test_rng_reproducible() {
    RNG rng(123u);
    const std::vector<uint32_t> expected = {
        31682556u,
        4018661298u,
        2101636938u,
        3842487452u,
        1628673942u,
    };

    for (size_t i = 0; i < expected.size(); ++i) {
        const uint32_t v = rng.nextU32();
        expect(v == expected[i], "RNG sequence mismatch at index " + std::to_string(i));
    }

    for (int i = 0; i < 1000; ++i) {
        int r = rng.range(-3, 7);
        expect(r >= -3 && r <= 7, "RNG range() out of bounds");
    }
}

void test_scripted_random() {
    ScriptedRandom rng({5u, 7u});
    expect(rng.below(4) == 1, "below(4) of 5 is 1");
    expect(rng.range(10, 12) == 11, "range(10,12) of 7 is 11");
    expect(!rng.coin(), "coin() of 5 is false (wrapped)");
    expect(rng.chancePct(10), "chancePct(10) of 7 passes");
    expect(rng.consumed() == 4, "every helper draws exactly one value");

    // Degenerate ranges still draw.
    ScriptedRandom r2({9u});
    expect(r2.below(1) == 0, "below(1) is 0");
    expect(r2.range(3, 3) == 3, "range(3,3) is 3");
    expect(r2.consumed() == 2, "degenerate helpers still draw");
}

void test_grid_reset_border() {
    TileGrid g(24, 16);
    expect(borderIsImpassableWall(g), "fresh grid has an impassable wall border");

    int interiorBad = 0;
    for (int y = 1; y < g.height - 1; ++y) {
        for (int x = 1; x < g.width - 1; ++x) {
            const Tile& t = g.at(x, y);
            if (t.terrain != Terrain::Wall || t.room != ROOM_HALLWAY || t.flags != TF_None) ++interiorBad;
        }
    }
    expect(interiorBad == 0, "fresh grid interior is plain wall with no room");

    openRoom(g, {0, 0, 24, 16}, 3);
    expect(g.at(0, 0).terrain == Terrain::Wall, "fillRoom never opens the outer ring");
    expect(g.at(1, 1).room == 3, "fillRoom stamps the room index");

    g.reset();
    expect(countRoomIndex(g, 3) == 0, "reset clears room indices");
    expect(borderIsImpassableWall(g), "reset restores the border");
}

void test_grid_positions() {
    const std::vector<int> a = gridPositions(56, 4);
    expect(a == std::vector<int>({0, 14, 28, 42, 56}), "gridPositions(56, 4)");

    const std::vector<int> b = gridPositions(56, 6);
    expect(b == std::vector<int>({0, 9, 18, 27, 36, 45, 56}), "gridPositions(56, 6) pins the last entry");
}

void test_grid_floor_size_classes() {
    DungeonGrid grid;
    initDungeonGrid(grid, 56, 32, 4, 2, FloorSize::Medium);
    expect(!grid.cell(2, 0).invalid, "medium keeps the first three of four columns");
    expect(grid.cell(3, 1).invalid, "medium drops the fourth column");

    initDungeonGrid(grid, 56, 32, 4, 2, FloorSize::Small);
    expect(!grid.cell(1, 1).invalid, "small keeps half the columns");
    expect(grid.cell(2, 0).invalid, "small drops the right half");

    initDungeonGrid(grid, 56, 32, 1, 1, FloorSize::Small);
    expect(!grid.cell(0, 0).invalid, "small always keeps at least one column");

    const GridCell& c = grid.cell(0, 0);
    expect(c.bounds.x0 == 0 && c.bounds.x1 == 56 && c.bounds.y1 == 32, "single cell spans the floor");
}

void test_connections_and_dead_ends() {
    DungeonGrid grid;
    initDungeonGrid(grid, 56, 32, 3, 1, FloorSize::Large);
    grid.cell(0, 0).role = CellRole::Room;
    grid.cell(1, 0).role = CellRole::HallwayAnchor;
    grid.cell(2, 0).role = CellRole::Room;
    linkCells(grid, 0, 0, DIR_RIGHT);

    expect(cellsLinked(grid, 0, 0, DIR_RIGHT) && cellsLinked(grid, 1, 0, DIR_LEFT), "links are recorded on both sides");

    RNG rng(5u);
    ensureConnectedGrid(grid, false, rng);
    expect(grid.cell(2, 0).connectionCount() > 0, "isolated room gets a link");
    expect(grid.cell(1, 0).connectionCount() == 2, "anchor is not left as a dead end");

    DungeonGrid lonely;
    initDungeonGrid(lonely, 56, 32, 2, 1, FloorSize::Large);
    lonely.cell(0, 0).role = CellRole::HallwayAnchor;
    lonely.cell(1, 0).role = CellRole::HallwayAnchor;
    ensureConnectedGrid(lonely, true, rng);
    expect(!lonely.cell(0, 0).usable() && !lonely.cell(1, 0).usable(), "unlinked anchors are dropped");
}

void test_rooms_too_small_fail() {
    Floor f(24, 16);
    DungeonGrid grid;
    initDungeonGrid(grid, 24, 16, 3, 2, FloorSize::Large);
    for (auto& c : grid.cells) c.role = CellRole::Room;

    FloorProperties props;
    RNG rng(1u);
    // 8x8 cells leave 4x4 after the margin, short of 5x4.
    expect(!createRoomsAndAnchors(f, grid, props, rng), "cells smaller than a 5x4 room are a structural failure");
}

void test_rooms_and_anchors() {
    Floor f(56, 32);
    DungeonGrid grid;
    initDungeonGrid(grid, 56, 32, 2, 1, FloorSize::Large);
    grid.cell(0, 0).role = CellRole::Room;
    grid.cell(1, 0).role = CellRole::HallwayAnchor;

    FloorProperties props;
    props.features = FF_None;
    RNG rng(77u);
    expect(createRoomsAndAnchors(f, grid, props, rng), "rooms and anchors fit");
    expect(f.rooms.size() == 1, "one room recorded");
    expect(countRoomIndex(f.grid, ROOM_ANCHOR) == 1, "one anchor tile stamped");

    const Recti& r = f.rooms.front().bounds;
    const Recti& cb = grid.cell(0, 0).bounds;
    expect(r.width() >= 5 && r.height() >= 4, "room is at least 5x4");
    expect(r.x0 >= cb.x0 + 2 && r.x1 <= cb.x1 - 2 && r.y0 >= cb.y0 + 2 && r.y1 <= cb.y1 - 2,
           "room stays inside the cell margin");
    expect(f.grid.at(r.x0, r.y0).room == 0 && f.grid.at(r.x0, r.y0).isOpen(), "room tiles are open and indexed");

    const GridCell& a = grid.cell(1, 0);
    expect(f.grid.at(a.area.x0, a.area.y0).room == ROOM_ANCHOR, "anchor sits at the recorded position");
}

void test_hallway_straight() {
    TileGrid g(20, 10);
    const int carved = createHallway(g, {2, 5}, {10, 5}, false, 0, 0);
    expect(carved == 9, "straight hallway carves every tile once");
    for (int x = 2; x <= 10; ++x) {
        expect(g.isHallway(x, 5), "straight hallway tile " + std::to_string(x));
    }
    expect(!g.at(11, 5).isOpen() && !g.at(6, 4).isOpen(), "nothing outside the path is carved");
}

void test_hallway_kinked() {
    TileGrid g(20, 10);
    createHallway(g, {2, 2}, {10, 7}, false, 6, 0);
    expect(g.isHallway(4, 2), "first leg runs along the start row");
    expect(g.isHallway(6, 4), "kink runs along middleX");
    expect(g.isHallway(8, 7), "last leg runs along the end row");
    expect(!g.at(2, 7).isOpen(), "no shortcut through the corner");

    const std::vector<Vec2i> v = hallwayPath({3, 1}, {9, 8}, true, 0, 4);
    expect(v.front() == Vec2i{3, 1} && v.back() == Vec2i{9, 8}, "vertical path runs start to end");
    bool hitMiddle = false;
    for (const auto& p : v) {
        if (p == Vec2i{6, 4}) hitMiddle = true;
    }
    expect(hitMiddle, "vertical path crosses along middleY");
}

void test_hallway_stops_at_open_and_impassable() {
    TileGrid g(20, 10);
    openRoom(g, {6, 5, 7, 6}, 0);
    const int carved = createHallway(g, {2, 5}, {10, 5}, false, 0, 0);
    expect(carved == 8, "both passes stop at the open tile");
    expect(g.at(6, 5).room == 0, "open tile keeps its room index");

    TileGrid h(20, 10);
    h.at(6, 5).set(TF_Impassable);
    createHallway(h, {2, 5}, {10, 5}, false, 0, 0);
    expect(h.at(6, 5).terrain == Terrain::Wall, "impassable tile is never carved");
    expect(h.isHallway(5, 5) && h.isHallway(7, 5), "both sides of the impassable tile are carved");
}

// x wall, - and | hallway, o hallway anchor. Rows are stamped with their top-left at (ox, oy).
void stampHallwayRows(TileGrid& g, const std::vector<std::string>& rows, int ox, int oy) {
    for (size_t r = 0; r < rows.size(); ++r) {
        for (size_t c = 0; c < rows[r].size(); ++c) {
            const int x = ox + static_cast<int>(c);
            const int y = oy + static_cast<int>(r);
            const char ch = rows[r][c];
            if (ch == '-' || ch == '|') {
                openHallway(g, x, y);
            } else if (ch == 'o') {
                g.at(x, y).terrain = Terrain::Floor;
                g.at(x, y).room = ROOM_ANCHOR;
            }
        }
    }
}

void test_junction_anchor_scan_order() {
    // Hallway enters from the left and leaves downward: the left neighbour is
    // scanned first while the anchor still looks like a room tile.
    TileGrid a(9, 6);
    stampHallwayRows(a, { "xxxxx",
                          "---ox",
                          "xxx|x",
                          "xxx|x" }, 2, 1);
    finalizeJunctions(a);
    expect(a.at(5, 2).has(TF_Junction), "anchor after its hallway is flagged");
    expect(a.at(5, 2).room == ROOM_HALLWAY, "anchor becomes hallway");
    expect(!a.at(4, 2).has(TF_Junction) && !a.at(5, 3).has(TF_Junction), "hallway legs are not junctions");

    // Hallway leaves right and downward: the anchor is converted before any leg is scanned.
    TileGrid b(9, 6);
    stampHallwayRows(b, { "xxxxx",
                          "xo---",
                          "x|xxx",
                          "x|xxx" }, 2, 1);
    finalizeJunctions(b);
    expect(!b.at(3, 2).has(TF_Junction), "anchor before its hallway is not flagged");
    expect(b.at(3, 2).room == ROOM_HALLWAY, "leading anchor becomes hallway");
    expect(countRoomIndex(b, ROOM_ANCHOR) == 0, "no anchors survive");
    expect(b.countFlag(TF_Junction) == 0, "no junctions without rooms");
}

void test_junction_room_edges() {
    TileGrid g(12, 8);
    openRoom(g, {2, 2, 5, 5}, 0);
    openHallway(g, 5, 3);
    openHallway(g, 6, 3);
    finalizeJunctions(g);
    expect(g.at(4, 3).has(TF_Junction), "room tile next to hallway is a junction");
    expect(!g.at(4, 2).has(TF_Junction), "room tile diagonal to hallway is not");
    expect(!g.at(5, 3).has(TF_Junction), "hallway tiles are never junctions");

    TileGrid h(12, 8);
    openRoom(h, {2, 2, 5, 5}, 0);
    openHallway(h, 5, 3);
    flagHallwayJunctions(h, -5, -5, 100, 100);
    expect(h.at(4, 3).has(TF_Junction), "flagHallwayJunctions finds the edge");
    expect(h.countFlag(TF_Junction) == 1, "only the touching tile is flagged");

    expect(isNextToHallway(h, 4, 2), "diagonal counts as next to hallway");
    expect(!isNextToHallway(h, 3, 3), "two tiles away is not next to hallway");
}

void test_grid_connections_carve() {
    Floor f(56, 32);
    DungeonGrid grid;
    initDungeonGrid(grid, 56, 32, 2, 2, FloorSize::Large);
    for (auto& c : grid.cells) c.role = CellRole::Room;
    // Bottom-right room is left unlinked.
    linkCells(grid, 0, 0, DIR_RIGHT);
    linkCells(grid, 0, 0, DIR_DOWN);

    FloorProperties props;
    props.features = FF_None;
    RNG rng(31u);
    expect(createRoomsAndAnchors(f, grid, props, rng), "2x2 rooms fit");
    expect(createGridCellConnections(f.grid, grid, rng) == 2, "one hallway per link");
    finalizeJunctions(f.grid);

    const ReachabilityResult r = stairsAlwaysReachable(f.grid, {f.rooms[0].bounds.x0, f.rooms[0].bounds.y0});
    expect(r.unreachable == f.rooms.back().bounds.width() * f.rooms.back().bounds.height(),
           "the unlinked room is the only unreachable part");
    expect(f.grid.countFlag(TF_Junction) > 0, "carved hallways produce junctions");
}

void test_maze_keeps_passages_connected() {
    for (uint32_t seed = 1; seed <= 12; ++seed) {
        Floor f(40, 30);
        const Recti b{5, 5, 20, 18};
        f.grid.fillRoom(b, 0);
        RoomInfo room;
        room.index = 0;
        room.bounds = b;
        room.maze = true;
        f.rooms.push_back(room);

        openHallway(f.grid, 10, 4);
        openHallway(f.grid, 4, 11);

        RNG rng(seed);
        const bool secondary = (seed % 2) == 0;
        const int placed = generateMaze(f.grid, room, secondary, rng);
        expect(placed > 0, "maze places obstacles (seed " + std::to_string(seed) + ")");

        const ReachabilityResult r = stairsAlwaysReachable(f.grid, {10, 4});
        expect(r.ok, "maze passages stay connected (seed " + std::to_string(seed) + ")");

        expect(f.grid.at(10, 5).isOpen() && f.grid.at(5, 11).isOpen(), "maze keeps hallway entrances open");
        if (secondary) {
            expect(f.grid.countTerrain(Terrain::Secondary) > 0, "secondary maze uses water");
            expect(f.grid.at(10, 4).terrain == Terrain::Floor, "entrance tile is untouched");
        }
        expect(borderIsImpassableWall(f.grid), "maze never touches the border");
    }
}

void test_secondary_terrain_rules() {
    TileGrid g(24, 16);
    g.at(5, 5).terrain = Terrain::Floor;
    expect(!setSecondaryTerrainOnWall(g, 5, 5), "open floor is not converted");
    expect(!setSecondaryTerrainOnWall(g, 0, 5), "impassable wall is not converted");
    expect(setSecondaryTerrainOnWall(g, 6, 5), "passable wall is converted");

    setTerrainObstacleChecked(g, 0, 3, true, ROOM_HALLWAY);
    expect(g.at(0, 3).terrain == Terrain::Wall, "obstacle on impassable stays wall");

    Floor f(56, 32);
    openRoom(f.grid, {10, 10, 20, 16}, 0);
    RNG rng(2024u);
    FeatureSummary s;
    const int n = generateSecondaryTerrainFormations(f.grid, 8, rng, &s);
    expect(n > 0 && s.rivers == 8, "rivers are drawn");
    expect(borderIsImpassableWall(f.grid), "rivers never reach the border");

    int roomOk = 0;
    for (int y = 10; y < 16; ++y) {
        for (int x = 10; x < 20; ++x) {
            if (f.grid.at(x, y).terrain == Terrain::Floor) ++roomOk;
        }
    }
    expect(roomOk == 60, "rivers go around open floor");

    TileGrid lake(24, 16);
    RNG lrng(8u);
    expect(generateLake(lake, {10, 8}, 6, lrng) == 6, "lake converts exactly its size");
    expect(lake.countTerrain(Terrain::Secondary) == 6, "lake tiles are secondary terrain");
}

void test_secondary_structures_and_imperfections() {
    Floor f(56, 32);
    const Recti b{10, 10, 21, 19};
    openRoom(f.grid, b, 0);
    RoomInfo room;
    room.index = 0;
    room.bounds = b;
    room.secondaryStructure = true;
    room.imperfect = true;
    f.rooms.push_back(room);
    openHallway(f.grid, 9, 14);
    finalizeJunctions(f.grid);

    RNG rng(12u);
    expect(generateSecondaryStructures(f, 4, rng) == 1, "one structure per tagged room");
    expect(f.grid.countTerrain(Terrain::Secondary) > 0, "structure places water");

    for (uint32_t seed = 1; seed <= 10; ++seed) {
        Floor g = f;
        RNG r2(seed);
        generateRoomImperfections(g, r2);
        expect(g.grid.at(10, 14).isOpen(), "imperfections keep junction tiles");
        expect(stairsAlwaysReachable(g.grid, {9, 14}).ok, "imperfect room stays connected");
    }
}

void test_extra_hallways_connect_rooms() {
    Floor f(40, 20);
    openRoom(f.grid, {3, 5, 9, 12}, 0);
    openRoom(f.grid, {14, 5, 20, 12}, 1);
    RoomInfo a;
    a.index = 0;
    a.bounds = {3, 5, 9, 12};
    RoomInfo b;
    b.index = 1;
    b.bounds = {14, 5, 20, 12};
    f.rooms.push_back(a);
    f.rooms.push_back(b);

    int made = 0;
    for (uint32_t seed = 1; seed <= 40 && made == 0; ++seed) {
        Floor g = f;
        RNG rng(seed);
        made = generateExtraHallways(g, 4, rng);
        if (made > 0) {
            expect(g.grid.countFlag(TF_Junction) > 0, "extra hallway flags junctions");
            expect(stairsAlwaysReachable(g.grid, {4, 6}).ok, "extra hallway joins the two rooms");
        }
    }
    expect(made > 0, "an extra hallway is dug between nearby rooms");
}

void test_reachability() {
    TileGrid g(20, 10);
    openRoom(g, {2, 2, 6, 6}, 0);
    openRoom(g, {10, 2, 15, 6}, 1);

    ReachabilityResult r = stairsAlwaysReachable(g, {3, 3});
    expect(!r.ok, "disconnected rooms fail the check");
    expect(r.unreachable == 20, "every tile of the far room is unreachable");
    expect(g.at(12, 3).has(TF_Unreachable), "unreachable tiles are annotated");

    r = stairsAlwaysReachable(g, {3, 3}, true);
    expect(r.ok && r.unreachable == 20, "diagnostic mode succeeds but still counts");

    for (int x = 6; x < 10; ++x) openHallway(g, x, 3);
    r = stairsAlwaysReachable(g, {3, 3});
    expect(r.ok, "joined rooms pass the check");
    expect(g.countFlag(TF_Unreachable) == 0, "annotations are cleared on success");

    r = stairsAlwaysReachable(g, {0, 0});
    expect(!r.ok && r.visited == 0, "stairs on a wall fail");
}

void test_fallback_room_is_valid() {
    const int sizes[4][2] = { {24, 16}, {40, 20}, {56, 32}, {96, 64} };
    for (const auto& s : sizes) {
        Floor f(s[0], s[1]);
        buildOneRoomMonsterHouse(f);
        finalizeJunctions(f.grid);
        const std::string tag = std::to_string(s[0]) + "x" + std::to_string(s[1]);
        expect(stairsAlwaysReachable(f.grid, {2, 2}).ok, "fallback room is connected " + tag);
        expect(f.grid.countFlag(TF_MonsterHouse) == (s[0] - 4) * (s[1] - 4), "fallback room is a Monster House " + tag);
        expect(f.rooms.size() == 1 && f.rooms.front().monsterHouse, "fallback records one room " + tag);
    }
}

void test_spawn_predicates() {
    TileGrid g(20, 10);
    openRoom(g, {2, 2, 8, 6}, 0);
    openHallway(g, 8, 3);
    finalizeJunctions(g);
    g.at(3, 3).set(TF_KecleonShop);
    g.at(4, 4).set(TF_Special);

    expect(tileMeetsRequirement(g, 5, 5, SR_Open), "room floor is open");
    expect(tileMeetsRequirement(g, 5, 5, SR_InRoom), "room floor is in a room");
    expect(!tileMeetsRequirement(g, 8, 3, SR_InRoom), "hallway is not in a room");
    expect(tileMeetsRequirement(g, 12, 5, SR_Wall), "interior wall is a wall spot");
    expect(!tileMeetsRequirement(g, 0, 5, SR_Wall), "border is not a wall spot");
    expect(!tileMeetsRequirement(g, 3, 3, SR_NotShop), "shop tile fails NotShop");

    const uint32_t stairsReq = spawnRule(SpawnSlot::Stairs).requirements;
    expect(!tileEligible(g, 7, 3, stairsReq), "stairs avoid junctions");
    expect(!tileEligible(g, 3, 3, stairsReq), "stairs avoid shops");
    expect(!tileEligible(g, 4, 4, stairsReq), "stairs avoid special tiles");
    expect(tileEligible(g, 5, 5, stairsReq), "plain room floor takes stairs");
    expect(!tileEligible(g, -1, 5, SR_None), "out of bounds is never eligible");

    const std::vector<Vec2i> spots = eligibleTiles(g, stairsReq);
    expect(!spots.empty() && spots.front() == Vec2i{2, 2}, "eligible tiles come out row-major");

    expect(spawnRule(SpawnSlot::BuriedItem).origin == SpawnOrigin::Buried, "buried slot marks its origin");
    expect(std::string(spawnSlotName(SpawnSlot::MonsterHouseEnemy)) == "monster_house_enemy", "slot names");
}

void test_resolver_precedence() {
    Floor f(20, 10);
    openRoom(f.grid, {2, 2, 8, 6}, 0);

    auto put = [&](SpawnKind k, int x, int y, SpawnOrigin o) {
        SpawnRecord s;
        s.kind = k;
        s.pos = {x, y};
        s.origin = o;
        f.spawns.push_back(s);
        f.grid.at(x, y).set(spawnFlagFor(k));
    };

    put(SpawnKind::Stairs, 3, 3, SpawnOrigin::Normal);
    put(SpawnKind::Trap, 3, 3, SpawnOrigin::Normal);
    put(SpawnKind::Item, 4, 3, SpawnOrigin::Normal);
    put(SpawnKind::Trap, 4, 3, SpawnOrigin::Normal);
    put(SpawnKind::Player, 5, 3, SpawnOrigin::Normal);
    put(SpawnKind::Enemy, 5, 3, SpawnOrigin::Normal);
    put(SpawnKind::Trap, 10, 8, SpawnOrigin::Normal);
    put(SpawnKind::Item, 12, 7, SpawnOrigin::Buried);
    put(SpawnKind::Item, 13, 7, SpawnOrigin::Normal);

    const int removed = resolveInvalidSpawns(f);
    expect(removed == 5, "five conflicting or misplaced spawns are removed");
    expect(f.spawns.size() == 4, "four spawns survive");
    expect(!f.grid.at(3, 3).has(TF_SpawnTrap) && f.grid.at(3, 3).has(TF_SpawnStairs), "stairs beat trap");
    expect(!f.grid.at(4, 3).has(TF_SpawnTrap), "item beats trap");
    expect(!f.grid.at(5, 3).has(TF_SpawnEnemy), "player beats enemy");
    expect(f.grid.at(12, 7).has(TF_SpawnItem), "buried item stays in the wall");
    expect(!f.grid.at(13, 7).has(TF_SpawnItem), "plain item in a wall is dropped");
    expect(!f.grid.at(10, 8).has(TF_SpawnTrap), "trap in a wall is dropped");
}

void test_pick_spawn_id() {
    const SpawnTable t{ {1, 30}, {2, 20} };
    ScriptedRandom a({29u});
    expect(pickSpawnId(t, a) == 1, "roll 29 of 50 picks the first entry");
    ScriptedRandom b({30u});
    expect(pickSpawnId(t, b) == 2, "roll 30 of 50 picks the second entry");

    ScriptedRandom c({4u});
    expect(pickSpawnId(SpawnTable{}, c) == 0, "empty table yields 0");
    expect(c.consumed() == 1, "empty table still draws");
}

void test_shop_floors_have_no_spawns_in_shop() {
    FloorProperties props;
    props.kecleonShopChance = 100;
    props.features |= FF_KecleonShop;

    int shops = 0;
    for (uint32_t seed = 1; seed <= 20; ++seed) {
        Floor f;
        RNG rng(seed);
        FloorGenReport rep;
        generateFloor(f, props, rng, nullptr, &rep);
        if (f.grid.countFlag(TF_KecleonShop) > 0) ++shops;

        bool clean = true;
        for (const auto& s : f.spawns) {
            if (f.grid.at(s.pos.x, s.pos.y).has(TF_KecleonShop)) clean = false;
        }
        expect(clean, "no spawn inside the shop (seed " + std::to_string(seed) + ")");
        if (rep.features.kecleonShopRoom >= 0) {
            const RoomInfo* r = f.findRoom(static_cast<uint8_t>(rep.features.kecleonShopRoom));
            expect(r && !r->monsterHouse, "shop room is never the Monster House");
        }
    }
    expect(shops > 0, "guaranteed shop chance produces shops");
}

void test_generation_deterministic() {
    FloorProperties props;
    props.features |= FF_SecondaryTerrain;

    Floor a;
    Floor b;
    RNG ra(1234u);
    RNG rb(1234u);
    FloorGenReport repA;
    FloorGenReport repB;
    generateFloor(a, props, ra, nullptr, &repA);
    generateFloor(b, props, rb, nullptr, &repB);
    expect(floorHash(a) == floorHash(b), "same seed gives the same floor");
    expect(floorToAscii(a) == floorToAscii(b), "same seed gives the same picture");
    expect(repA.trace == repB.trace && repA.attempts == repB.attempts, "same seed gives the same trace");

    Floor c;
    RNG rc(4321u);
    generateFloor(c, props, rc);
    expect(floorHash(a) != floorHash(c), "different seeds give different floors");
}

void test_accepted_floors_are_connected() {
    FloorProperties props;
    props.features |= FF_SecondaryTerrain;

    int accepted = 0;
    for (uint32_t seed = 1; seed <= 30; ++seed) {
        Floor f;
        RNG rng(seed);
        FloorGenReport rep;
        const bool ok = generateFloor(f, props, rng, nullptr, &rep);
        const std::string tag = " (seed " + std::to_string(seed) + ")";

        expect(ok, "floor is complete" + tag);
        expect(countRoomIndex(f.grid, ROOM_ANCHOR) == 0, "no anchors survive" + tag);
        expect(borderIsImpassableWall(f.grid), "border is impassable wall" + tag);
        expect(f.stairs.x >= 0 && f.grid.at(f.stairs.x, f.stairs.y).has(TF_SpawnStairs), "stairs are recorded" + tag);
        expect(f.hasSpawn(SpawnKind::Player), "player is placed" + tag);
        expect(rep.trace.back() == GenState::Done, "run ends in Done" + tag);
        expect(rep.attempts >= 1 && rep.attempts <= 10, "attempts stay within the cap" + tag);

        if (!rep.usedFallback) {
            ++accepted;
            Floor probe = f;
            expect(stairsAlwaysReachable(probe.grid, probe.stairs).ok, "accepted floor is connected" + tag);
        }

        for (const auto& s : f.spawns) {
            const Tile& t = f.grid.at(s.pos.x, s.pos.y);
            if (s.origin == SpawnOrigin::Buried) {
                expect(t.terrain == Terrain::Wall, "buried item sits in a wall" + tag);
            } else {
                expect(t.terrain == Terrain::Floor, "spawn sits on floor" + tag);
            }
            expect(t.has(spawnFlagFor(s.kind)), "spawn record matches its tile flag" + tag);
        }
    }
    expect(accepted > 0, "most standard floors are accepted without the fallback");
}

void test_every_layout_completes() {
    for (int i = 0; i < FLOOR_LAYOUT_COUNT; ++i) {
        FloorProperties props;
        props.layout = static_cast<FloorLayout>(i);
        const std::string name = floorLayoutName(props.layout);

        for (uint32_t seed = 1; seed <= 3; ++seed) {
            Floor f;
            RNG rng(hashCombine(seed, static_cast<uint32_t>(i)));
            FloorGenReport rep;
            const bool ok = generateFloor(f, props, rng, nullptr, &rep);
            expect(ok, name + " floor is complete");
            expect(f.hasSpawn(SpawnKind::Stairs) && f.hasSpawn(SpawnKind::Player), name + " has stairs and player");
            expect(rep.trace.back() == GenState::Done, name + " ends in Done");
            if (!rep.usedFallback) {
                expect(rep.layout == props.layout, name + " report names the layout");
            }
        }
    }
}

void test_two_rooms_monster_house() {
    FloorProperties props;
    props.layout = FloorLayout::TwoRoomsWithMonsterHouse;
    props.features = FF_None;

    Floor f;
    RNG rng(3u);
    FloorGenReport rep;
    generateFloor(f, props, rng, nullptr, &rep);
    if (!rep.usedFallback) {
        expect(f.rooms.size() == 2, "two rooms");
        int houses = 0;
        for (const auto& r : f.rooms) {
            if (r.monsterHouse) ++houses;
        }
        expect(houses == 1, "exactly one of them is a Monster House");
        expect(rep.features.monsterHouseRoom >= 0, "feature pass keeps the preset house");
    }
}

void test_outer_rooms_with_three_columns_falls_back() {
    FloorProperties props;
    props.layout = FloorLayout::OuterRooms;
    props.gridCols = 3;
    // Extra hallways could bridge the isolated rooms by chance.
    props.features &= ~static_cast<uint32_t>(FF_ExtraHallways);

    Floor f;
    RNG rng(9u);
    FloorGenReport rep;
    const bool ok = generateFloor(f, props, rng, nullptr, &rep);
    expect(ok, "fallback floor is complete");
    expect(rep.usedFallback, "three column outer rooms never connect");
    expect(rep.attempts == 10, "every attempt is used first");
    expect(!rep.failures.empty() && rep.failures.back() == GenFailure::AttemptsExhausted, "attempts exhausted is reported");
    expect(rep.layout == FloorLayout::OneRoomMonsterHouse, "fallback layout is reported");
    expect(f.rooms.size() == 1 && f.rooms.front().monsterHouse, "fallback is one Monster House room");
    expect(rep.lastUnreachable > 0, "last failed attempt counted unreachable tiles");
}

void test_attempt_cap_option() {
    FloorProperties props;
    props.layout = FloorLayout::OuterRooms;
    props.gridCols = 3;
    props.features &= ~static_cast<uint32_t>(FF_ExtraHallways);

    GeneratorOptions opt;
    opt.maxAttempts = 2;
    Floor f;
    RNG rng(9u);
    FloorGenReport rep;
    generateFloor(f, props, rng, nullptr, &rep, opt);
    expect(rep.attempts == 2 && rep.usedFallback, "attempt cap is configurable");
}

void test_state_machine_steps() {
    FloorProperties props;
    RNG rng(55u);
    FloorGenerator gen(props, rng);
    expect(gen.state() == GenState::ResetFloor, "generator starts at ResetFloor");

    Floor f;
    int steps = 0;
    while (gen.step(f)) {
        ++steps;
        if (steps > 1000) break;
    }
    expect(steps < 1000, "state machine terminates");
    expect(gen.state() == GenState::Done, "state machine ends in Done");
    expect(!gen.step(f), "Done stays Done");

    const auto& tr = gen.report().trace;
    expect(tr.size() >= 2 && tr[0] == GenState::ResetFloor && tr[1] == GenState::LayoutSelected, "trace starts with reset and layout");

    for (size_t i = 1; i < tr.size(); ++i) {
        if (tr[i] == GenState::Accepted) expect(tr[i - 1] == GenState::ReachabilityChecked, "Accepted follows the check");
        if (tr[i] == GenState::HallwaysCarved) expect(tr[i - 1] == GenState::GridBuilt, "hallways follow the grid");
        if (tr[i] == GenState::FeaturesApplied) expect(tr[i - 1] == GenState::JunctionsResolved, "features follow junctions");
        if (tr[i] == GenState::Fallback) expect(tr[i - 1] == GenState::Retry, "fallback follows a retry");
        if (tr[i] == GenState::Done) expect(tr[i - 1] == GenState::EntitiesPlaced, "Done follows entity placement");
    }
    expect(f.width() == FLOOR_DEFAULT_WIDTH && f.height() == FLOOR_DEFAULT_HEIGHT, "floor sized from props");
}

void test_floor_dimensions_are_clamped() {
    FloorProperties props;
    props.width = 10;
    props.height = 500;
    Floor f;
    RNG rng(1u);
    generateFloor(f, props, rng);
    expect(f.width() == FLOOR_MIN_WIDTH && f.height() == FLOOR_MAX_HEIGHT, "dimensions clamp to the supported range");
}

const std::vector<std::string> SAMPLE_ROOM = {
    "#########",
    "#.......#",
    "#.>...P.#",
    "#...$.K.#",
    "#########",
};

void test_fixed_room_loaded() {
    FixedRoomData data;
    std::string err;
    expect(parseFixedRoomAscii(7, SAMPLE_ROOM, data, &err), "sample room parses");
    expect(data.width == 9 && data.height == 5 && data.spawns.size() == 3, "sample room size and spawns");

    FixedRoomCatalog catalog;
    catalog.add(data);

    FloorProperties props;
    props.fixedRoomId = 7;
    Floor f;
    RNG rng(1u);
    FloorGenReport rep;
    const bool ok = generateFloor(f, props, rng, &catalog, &rep);
    expect(ok, "fixed room floor is complete");
    expect(rep.usedFixedRoom && !rep.usedFallback, "fixed room used");

    const std::vector<GenState> want = { GenState::ResetFloor, GenState::LayoutSelected,
                                         GenState::FixedRoomLoaded, GenState::Done };
    expect(rep.trace == want, "fixed room skips straight to Done");

    const int ox = (56 - 9) / 2;
    const int oy = (32 - 5) / 2;
    expect(f.stairs == Vec2i{ox + 2, oy + 2}, "stairs come from the room");
    expect(f.grid.at(ox + 6, oy + 3).has(TF_Special), "key door tile is special");
    expect(f.spawns.size() == 3, "only the room's own spawns");
    expect(f.spawns.front().origin == SpawnOrigin::FixedRoom, "spawns are tagged as fixed room spawns");
}

void test_fixed_room_not_found() {
    FixedRoomCatalog catalog;
    FloorProperties props;
    props.fixedRoomId = 99;
    Floor f;
    RNG rng(2u);
    FloorGenReport rep;
    const bool ok = generateFloor(f, props, rng, &catalog, &rep);
    expect(ok, "missing fixed room still produces a floor");
    expect(!rep.usedFixedRoom, "missing fixed room is not used");
    expect(!rep.failures.empty() && rep.failures.front() == GenFailure::FixedRoomNotFound, "not found is reported first");
    expect(!rep.warnings.empty(), "not found carries a warning");

    FixedRoomData bad;
    std::string err;
    expect(!parseFixedRoomAscii(1, {"###", "#?#", "###"}, bad, &err), "unknown glyph is rejected");
    expect(err.find('?') != std::string::npos, "error names the glyph");
    expect(!parseFixedRoomAscii(1, {"###", "##", "###"}, bad, &err), "ragged rows are rejected");

    FixedRoomData big;
    expect(parseFixedRoomAscii(2, {std::string(60, '.')}, big, &err), "wide room parses");
    Floor small(56, 32);
    expect(!stampFixedRoom(small, big, &err), "room wider than the floor does not fit");
}

void test_fixed_room_catalog_file() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "floorforge_test_rooms.txt";
    {
        std::ofstream out(path);
        out << "; sample catalog\n"
            << "[room 3]\n"
            << "#####\n"
            << "#.>P#\n"
            << "#####\n"
            << "\n"
            << "[room 4]\n"
            << "#?#\n"
            << "[nonsense]\n";
    }

    FixedRoomCatalog catalog;
    std::string warns;
    expect(loadFixedRoomCatalogFile(path.string(), catalog, &warns), "catalog file loads");
    expect(catalog.size() == 1, "only the valid room is kept");
    expect(warns.find("room 4") != std::string::npos, "bad room is reported");
    expect(warns.find("bad room header") != std::string::npos, "bad header is reported");

    FixedRoomData d;
    expect(catalog.load(3, d) && d.width == 5, "room 3 is in the catalog");
    expect(!catalog.load(4, d), "room 4 is not");

    std::error_code ec;
    fs::remove(path, ec);

    FixedRoomCatalog none;
    expect(!loadFixedRoomCatalogFile((fs::temp_directory_path() / "floorforge_no_such_file.txt").string(), none, &warns),
           "missing catalog file fails");
}

void test_props_ini_parsing() {
    const std::string text =
        "width = 200\n"
        "height=10\n"
        "layout = Outer-Ring\n"
        "maze_rooms = off\n"
        "items = 5:2, 6\n"
        "bogus = 1\n"
        "floor_size = medium\n"
        "hidden_stairs = secret_room ; inline comment\n"
        "rescue_floor = yes\n"
        "trap_density = -4\n";

    FloorProperties p;
    std::string warns;
    const bool clean = parseFloorPropertiesIni(text, p, &warns);
    expect(!clean, "unknown key makes the parse unclean");
    expect(p.width == FLOOR_MAX_WIDTH && p.height == FLOOR_MIN_HEIGHT, "dimensions are clamped");
    expect(p.layout == FloorLayout::OuterRing, "layout names are forgiving");
    expect(!p.has(FF_MazeRooms), "feature flag turned off");
    expect(p.has(FF_KecleonShop), "untouched flags keep defaults");
    expect(p.items.size() == 2 && p.items[0].id == 5 && p.items[0].weight == 2 && p.items[1].weight == 1, "spawn table parsed");
    expect(p.floorSize == FloorSize::Medium, "floor size parsed");
    expect(p.hiddenStairs == HiddenStairsType::SecretRoom, "hidden stairs parsed");
    expect(p.rescueFloor, "rescue floor parsed");
    expect(p.trapDensity == -4, "negative density kept");
    expect(warns.find("line 6") != std::string::npos && warns.find("bogus") != std::string::npos, "warning names the line and key");

    FloorProperties q;
    expect(parseFloorPropertiesIni("\xEF\xBB\xBFwidth = 40\n# comment\n\n", q, &warns), "BOM and comments are fine");
    expect(q.width == 40 && warns.empty(), "BOM stripped from the first key");

    FloorLayout l = FloorLayout::Standard;
    expect(!parseFloorLayout("spiral", l), "unknown layout rejected");
    for (int i = 0; i < FLOOR_LAYOUT_COUNT; ++i) {
        const FloorLayout want = static_cast<FloorLayout>(i);
        expect(parseFloorLayout(floorLayoutName(want), l) && l == want, "layout names round trip");
    }
}

void test_default_props_file() {
    namespace fs = std::filesystem;
    const fs::path path = fs::temp_directory_path() / "floorforge_test_props.ini";
    expect(writeDefaultFloorPropertiesIni(path.string()), "default props written");

    FloorProperties p;
    p.width = 30;
    std::string warns;
    bool clean = false;
    expect(loadFloorPropertiesIni(path.string(), p, &warns, &clean), "default props load");
    expect(clean && warns.empty(), "default props parse without warnings");
    expect(p.width == FLOOR_DEFAULT_WIDTH, "default props restore the default width");

    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << "width = 40\nnot a setting\n";
    }
    FloorProperties q;
    expect(loadFloorPropertiesIni(path.string(), q, &warns, &clean), "file with a bad line still loads");
    expect(!clean && !warns.empty(), "rejected line is reported to the caller");
    expect(q.width == 40, "good lines still apply");

    std::error_code ec;
    const fs::path missing = fs::temp_directory_path() / "floorforge_test_missing.ini";
    fs::remove(missing, ec);
    clean = true;
    expect(!loadFloorPropertiesIni(missing.string(), q, &warns, &clean), "missing file fails");
    expect(!clean, "missing file is not clean");

    fs::remove(path, ec);
}

void test_rescue_floor_stairs_room_is_monster_house() {
    FloorProperties props;
    props.rescueFloor = true;
    props.features &= ~static_cast<uint32_t>(FF_MonsterHouse | FF_KecleonShop);

    for (uint32_t seed = 1; seed <= 5; ++seed) {
        Floor f;
        RNG rng(seed);
        generateFloor(f, props, rng);
        expect(f.grid.at(f.stairs.x, f.stairs.y).has(TF_MonsterHouse), "rescue floor stairs room is a Monster House");
    }
}

void test_rescue_floor_never_turns_shop_into_monster_house() {
    FloorProperties props;
    props.rescueFloor = true;

    int edgeStairs = 0;
    for (uint32_t seed = 1; seed <= 40; ++seed) {
        Floor f(20, 12);
        const Recti bounds{ 4, 3, 11, 9 };
        f.grid.fillRoom(bounds, 0);
        RoomInfo room;
        room.index = 0;
        room.bounds = bounds;
        f.rooms.push_back(room);

        RNG rng(seed);
        expect(generateKecleonShop(f, 100, rng) == 0, "single room becomes the shop");
        expect(spawnStairs(f, props, rng), "stairs placed beside the shop stock");

        // Only the edge ring is free of the shop flag, so the stairs always land there.
        if (f.stairs.x == bounds.x0 || f.stairs.x == bounds.x1 - 1 ||
            f.stairs.y == bounds.y0 || f.stairs.y == bounds.y1 - 1) {
            ++edgeStairs;
        }
        expect(!f.rooms[0].monsterHouse, "shop room is not tagged Monster House");
        expect(f.grid.countFlag(TF_MonsterHouse) == 0, "no Monster House tiles in the shop");
    }
    expect(edgeStairs == 40, "stairs sit on the shop edge");
}

void test_hidden_stairs_gating() {
    FloorProperties props;
    props.layout = FloorLayout::OneRoomMonsterHouse;
    props.hiddenStairs = HiddenStairsType::SecretBazaar;

    props.floorsRemaining = 1;
    Floor a;
    RNG ra(4u);
    generateFloor(a, props, ra);
    expect(!a.hasSpawn(SpawnKind::HiddenStairs), "no hidden stairs near the end of the dungeon");

    props.floorsRemaining = 5;
    Floor b;
    RNG rb(4u);
    generateFloor(b, props, rb);
    expect(b.hasSpawn(SpawnKind::HiddenStairs), "hidden stairs placed when enabled");
    for (const auto& s : b.spawns) {
        if (s.kind != SpawnKind::HiddenStairs) continue;
        expect(s.payload == static_cast<int>(HiddenStairsType::SecretBazaar), "hidden stairs payload is the type");
        expect(s.pos != b.stairs, "hidden stairs never share the stairs tile");
    }

    props.hiddenStairs = HiddenStairsType::None;
    Floor c;
    RNG rc(4u);
    generateFloor(c, props, rc);
    expect(!c.hasSpawn(SpawnKind::HiddenStairs), "no hidden stairs when disabled");
}

void test_monster_house_population() {
    FloorProperties props;
    props.layout = FloorLayout::OneRoomMonsterHouse;

    props.emptyMonsterHouseChance = 0;
    Floor full;
    RNG r1(6u);
    generateFloor(full, props, r1);
    expect(full.countSpawns(SpawnKind::Enemy) >= 8, "full Monster House is packed with enemies");

    props.emptyMonsterHouseChance = 100;
    Floor empty;
    RNG r2(6u);
    generateFloor(empty, props, r2);
    expect(empty.countSpawns(SpawnKind::Enemy) <= 7, "empty Monster House holds only a few enemies");

    int houseItems = 0;
    for (const auto& s : empty.spawns) {
        if (s.origin == SpawnOrigin::MonsterHouse && s.kind != SpawnKind::Enemy) ++houseItems;
    }
    expect(houseItems == 0, "empty Monster House has no extra items or traps");
}

void test_chasm_conversions() {
    TileGrid g(24, 16);
    g.at(5, 5).terrain = Terrain::Secondary;
    expect(convertSecondaryTerrainToChasms(g) == 1, "one secondary tile converted");
    expect(g.at(5, 5).terrain == Terrain::Chasm, "secondary becomes chasm");

    expect(convertWallsToChasms(g) == 22 * 14 - 1, "every passable wall becomes chasm");
    expect(borderIsImpassableWall(g), "the border is left alone");

    g.at(0, 3).terrain = Terrain::Floor;
    expect(ensureImpassableTilesAreWalls(g) == 1, "stray impassable floor is fixed");
    expect(g.at(0, 3).terrain == Terrain::Wall, "impassable tile is wall again");

    FloorProperties props;
    props.layout = FloorLayout::OneRoomMonsterHouse;
    props.features |= FF_WallsAsChasms;
    // Normal items avoid the Monster House, so only a populated house guarantees items.
    props.emptyMonsterHouseChance = 0;
    Floor f;
    RNG rng(8u);
    generateFloor(f, props, rng);
    int interiorWalls = 0;
    for (int y = 1; y < f.height() - 1; ++y) {
        for (int x = 1; x < f.width() - 1; ++x) {
            if (f.grid.at(x, y).terrain == Terrain::Wall) ++interiorWalls;
        }
    }
    expect(interiorWalls == 0, "walls-as-chasms floors have no interior walls");
    expect(f.countSpawns(SpawnKind::Item) >= 1, "items still spawn");
    for (const auto& s : f.spawns) {
        expect(s.origin != SpawnOrigin::Buried, "no buried items without walls");
    }
}

void test_floor_dump() {
    Floor f(24, 16);
    buildOneRoomMonsterHouse(f);
    finalizeJunctions(f.grid);
    const std::string art = floorToAscii(f);
    expect(art.size() == static_cast<size_t>(25 * 16), "one line per row");
    expect(art[0] == 'X', "border draws as impassable wall");
    expect(art[static_cast<size_t>(2 * 25 + 2)] == 'm', "Monster House floor glyph");

    f.grid.at(3, 3).set(TF_SpawnPlayer | TF_SpawnEnemy);
    expect(tileGlyph(f.grid.at(3, 3)) == '@', "player glyph wins");
    expect(jsonEscape("a\"b\n") == "a\\\"b\\n", "json escape");
    expect(floorSummaryLine(f).find("24x16") == 0, "summary starts with the size");
}

} // namespace

int main() {
    std::cout << "Running FloorForge tests...\n";

    test_rng_reproducible();
    test_scripted_random();
    test_grid_reset_border();

    test_grid_positions();
    test_grid_floor_size_classes();
    test_connections_and_dead_ends();
    test_rooms_too_small_fail();
    test_rooms_and_anchors();

    test_hallway_straight();
    test_hallway_kinked();
    test_hallway_stops_at_open_and_impassable();
    test_grid_connections_carve();

    test_junction_anchor_scan_order();
    test_junction_room_edges();

    test_maze_keeps_passages_connected();
    test_secondary_terrain_rules();
    test_secondary_structures_and_imperfections();
    test_extra_hallways_connect_rooms();
    test_chasm_conversions();

    test_reachability();
    test_fallback_room_is_valid();

    test_spawn_predicates();
    test_resolver_precedence();
    test_pick_spawn_id();

    test_shop_floors_have_no_spawns_in_shop();
    test_generation_deterministic();
    test_accepted_floors_are_connected();
    test_every_layout_completes();
    test_two_rooms_monster_house();
    test_outer_rooms_with_three_columns_falls_back();
    test_attempt_cap_option();
    test_state_machine_steps();
    test_floor_dimensions_are_clamped();

    test_fixed_room_loaded();
    test_fixed_room_not_found();
    test_fixed_room_catalog_file();

    test_props_ini_parsing();
    test_default_props_file();

    test_rescue_floor_stairs_room_is_monster_house();
    test_rescue_floor_never_turns_shop_into_monster_house();
    test_hidden_stairs_gating();
    test_monster_house_population();
    test_floor_dump();

    if (failures == 0) {
        std::cout << "All tests passed.\n";
        return 0;
    }

    std::cerr << failures << " test(s) failed.\n";
    return 1;
}
