#include "spawn.hpp"

#include "floor_features.hpp"

#include <algorithm>
#include <array>

namespace {

const std::array<SpawnRule, SPAWN_SLOT_COUNT> SPAWN_RULES = {{
    { SpawnSlot::Stairs, SpawnKind::Stairs, SpawnOrigin::Normal,
      SR_Open | SR_InRoom | SR_NotShop | SR_NoEnemy | SR_NotJunction | SR_NotSpecial },
    { SpawnSlot::HiddenStairs, SpawnKind::HiddenStairs, SpawnOrigin::Normal,
      SR_Open | SR_InRoom | SR_NotShop | SR_NoEnemy | SR_NotJunction | SR_NotSpecial | SR_NoStairs },
    { SpawnSlot::Item, SpawnKind::Item, SpawnOrigin::Normal,
      SR_Open | SR_InRoom | SR_NotShop | SR_NotMonsterHouse | SR_NotJunction | SR_NotSpecial },
    { SpawnSlot::BuriedItem, SpawnKind::Item, SpawnOrigin::Buried,
      SR_Wall },
    { SpawnSlot::MonsterHouseItem, SpawnKind::Item, SpawnOrigin::MonsterHouse,
      SR_MonsterHouse | SR_NotShop | SR_NotJunction },
    { SpawnSlot::Trap, SpawnKind::Trap, SpawnOrigin::Normal,
      SR_Open | SR_InRoom | SR_NotShop | SR_NoItem | SR_NoEnemy | SR_NotSpecial },
    { SpawnSlot::MonsterHouseTrap, SpawnKind::Trap, SpawnOrigin::MonsterHouse,
      SR_MonsterHouse | SR_NotShop | SR_NotJunction },
    { SpawnSlot::Player, SpawnKind::Player, SpawnOrigin::Normal,
      SR_Open | SR_InRoom | SR_NotShop | SR_NotJunction | SR_NoItem | SR_NoEnemy | SR_NoTrap | SR_NotSpecial },
    { SpawnSlot::Enemy, SpawnKind::Enemy, SpawnOrigin::Normal,
      SR_Open | SR_NotShop | SR_NoStairs | SR_NoItem | SR_NoTrap | SR_NoEnemy | SR_NoPlayer | SR_NotSpecial },
    { SpawnSlot::MonsterHouseEnemy, SpawnKind::Enemy, SpawnOrigin::MonsterHouse,
      SR_MonsterHouse | SR_NotShop | SR_NoPlayer | SR_NotSpecial },
}};

// Negative density means exactly that many.
int rollCount(int density, int lo, int hi, RandomSource& rng) {
    if (density < 0) return -density;
    if (density == 0) return 0;
    return rng.range(lo, hi);
}

bool hasMonsterHouse(const TileGrid& g) {
    return g.countFlag(TF_MonsterHouse) > 0;
}

} // namespace

const SpawnRule& spawnRule(SpawnSlot slot) {
    return SPAWN_RULES[static_cast<size_t>(slot)];
}

const char* spawnSlotName(SpawnSlot slot) {
    switch (slot) {
        case SpawnSlot::Stairs:            return "stairs";
        case SpawnSlot::HiddenStairs:      return "hidden_stairs";
        case SpawnSlot::Item:              return "item";
        case SpawnSlot::BuriedItem:        return "buried_item";
        case SpawnSlot::MonsterHouseItem:  return "monster_house_item";
        case SpawnSlot::Trap:              return "trap";
        case SpawnSlot::MonsterHouseTrap:  return "monster_house_trap";
        case SpawnSlot::Player:            return "player";
        case SpawnSlot::Enemy:             return "enemy";
        case SpawnSlot::MonsterHouseEnemy: return "monster_house_enemy";
    }
    return "unknown";
}

bool tileMeetsRequirement(const TileGrid& grid, int x, int y, SpawnRequirement req) {
    if (!grid.inBounds(x, y)) return false;
    const Tile& t = grid.at(x, y);
    switch (req) {
        case SR_None:            return true;
        case SR_Open:            return t.isOpen() && !t.has(TF_Impassable);
        case SR_InRoom:          return t.inRoom();
        case SR_Wall:            return grid.inInterior(x, y) && grid.isPassableWall(x, y);
        case SR_MonsterHouse:    return t.has(TF_MonsterHouse);
        case SR_NotShop:         return !t.has(TF_KecleonShop);
        case SR_NotMonsterHouse: return !t.has(TF_MonsterHouse);
        case SR_NotJunction:     return !t.has(TF_Junction);
        case SR_NotSpecial:      return !t.has(TF_Special);
        case SR_NoStairs:        return !t.has(TF_SpawnStairs | TF_SpawnHiddenStairs);
        case SR_NoItem:          return !t.has(TF_SpawnItem);
        case SR_NoTrap:          return !t.has(TF_SpawnTrap);
        case SR_NoEnemy:         return !t.has(TF_SpawnEnemy);
        case SR_NoPlayer:        return !t.has(TF_SpawnPlayer);
    }
    return false;
}

bool tileEligible(const TileGrid& grid, int x, int y, uint32_t requirements) {
    for (uint32_t bit = 1; bit != 0 && bit <= requirements; bit <<= 1) {
        if ((requirements & bit) == 0) continue;
        if (!tileMeetsRequirement(grid, x, y, static_cast<SpawnRequirement>(bit))) return false;
    }
    return grid.inBounds(x, y);
}

std::vector<Vec2i> eligibleTiles(const TileGrid& grid, uint32_t requirements) {
    std::vector<Vec2i> out;
    for (int y = 0; y < grid.height; ++y) {
        for (int x = 0; x < grid.width; ++x) {
            if (tileEligible(grid, x, y, requirements)) out.push_back({x, y});
        }
    }
    return out;
}

void shuffleSpawnPositions(std::vector<Vec2i>& positions, RandomSource& rng) {
    shuffleInPlace(positions, rng);
}

int placeSpawns(Floor& floor, SpawnSlot slot, int count, const SpawnTable* table, int payload, RandomSource& rng) {
    if (count <= 0) return 0;
    const SpawnRule& rule = spawnRule(slot);

    std::vector<Vec2i> spots = eligibleTiles(floor.grid, rule.requirements);
    shuffleSpawnPositions(spots, rng);

    const int n = std::min(count, static_cast<int>(spots.size()));
    for (int i = 0; i < n; ++i) {
        const Vec2i p = spots[static_cast<size_t>(i)];
        SpawnRecord rec;
        rec.kind = rule.kind;
        rec.pos = p;
        rec.payload = table ? pickSpawnId(*table, rng) : payload;
        rec.origin = rule.origin;
        floor.grid.at(p.x, p.y).set(spawnFlagFor(rule.kind));
        floor.spawns.push_back(rec);
    }
    return n;
}

bool spawnStairs(Floor& floor, const FloorProperties& props, RandomSource& rng) {
    if (floor.hasSpawn(SpawnKind::Stairs)) return true;
    if (placeSpawns(floor, SpawnSlot::Stairs, 1, nullptr, 0, rng) == 0) return false;

    floor.stairs = floor.spawns.back().pos;
    if (props.rescueFloor) {
        const Tile& t = floor.grid.at(floor.stairs.x, floor.stairs.y);
        // Shop flags cover only the inner tiles; the room tag covers its edges too.
        const RoomInfo* room = t.inRoom() ? floor.findRoom(t.room) : nullptr;
        if (room && !room->kecleonShop && !t.has(TF_KecleonShop)) markMonsterHouse(floor, t.room);
    }
    return true;
}

int spawnNonEnemies(Floor& floor, const FloorProperties& props, bool emptyMonsterHouse, RandomSource& rng) {
    const size_t before = floor.spawns.size();
    const bool haveStairs = spawnStairs(floor, props, rng);

    if (haveStairs && props.hiddenStairs != HiddenStairsType::None && props.floorsRemaining >= 2) {
        placeSpawns(floor, SpawnSlot::HiddenStairs, 1, nullptr, static_cast<int>(props.hiddenStairs), rng);
    }

    const int d = props.itemDensity;
    placeSpawns(floor, SpawnSlot::Item, rollCount(d, std::max(1, d - 2), d + 1, rng), &props.items, 0, rng);

    const int b = props.buriedItemDensity;
    placeSpawns(floor, SpawnSlot::BuriedItem, rollCount(b, std::max(0, b - 1), b, rng), &props.items, 0, rng);

    const bool house = hasMonsterHouse(floor.grid);
    if (house && !emptyMonsterHouse) {
        placeSpawns(floor, SpawnSlot::MonsterHouseItem, rng.range(7, 12), &props.items, 0, rng);
    }

    const int t = props.trapDensity;
    placeSpawns(floor, SpawnSlot::Trap, rollCount(t, std::max(1, t / 2), t, rng), &props.traps, 0, rng);
    if (house && !emptyMonsterHouse) {
        placeSpawns(floor, SpawnSlot::MonsterHouseTrap, rng.range(2, 5), &props.traps, 0, rng);
    }

    placeSpawns(floor, SpawnSlot::Player, 1, nullptr, 0, rng);
    return static_cast<int>(floor.spawns.size() - before);
}

int spawnEnemies(Floor& floor, const FloorProperties& props, bool emptyMonsterHouse, RandomSource& rng) {
    const size_t before = floor.spawns.size();

    const int e = props.enemyDensity;
    placeSpawns(floor, SpawnSlot::Enemy, rollCount(e, std::max(1, e / 2), e, rng), &props.enemies, 0, rng);

    if (hasMonsterHouse(floor.grid)) {
        const int n = emptyMonsterHouse ? rng.range(2, 3) : rng.range(8, 13);
        placeSpawns(floor, SpawnSlot::MonsterHouseEnemy, n, &props.enemies, 0, rng);
    }
    return static_cast<int>(floor.spawns.size() - before);
}

int resolveInvalidSpawns(Floor& floor) {
    TileGrid& g = floor.grid;
    auto idx = [&](const Vec2i& p) -> size_t { return static_cast<size_t>(p.y * g.width + p.x); };

    std::vector<uint8_t> buried(g.tiles.size(), 0);
    for (const SpawnRecord& s : floor.spawns) {
        if (s.kind == SpawnKind::Item && s.origin == SpawnOrigin::Buried && g.inBounds(s.pos.x, s.pos.y)) {
            buried[idx(s.pos)] = 1;
        }
    }

    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            Tile& t = g.at(x, y);
            if (t.has(TF_SpawnStairs)) t.clear(TF_SpawnHiddenStairs | TF_SpawnItem | TF_SpawnTrap);
            else if (t.has(TF_SpawnHiddenStairs)) t.clear(TF_SpawnItem | TF_SpawnTrap);
            if (t.has(TF_SpawnItem)) t.clear(TF_SpawnTrap);
            if (t.has(TF_SpawnPlayer)) t.clear(TF_SpawnEnemy);

            if (t.terrain != Terrain::Floor) {
                t.clear(TF_SpawnTrap | TF_SpawnEnemy);
                if (!buried[idx({x, y})]) t.clear(TF_SpawnItem);
            }
        }
    }

    const size_t before = floor.spawns.size();
    floor.spawns.erase(std::remove_if(floor.spawns.begin(), floor.spawns.end(),
        [&](const SpawnRecord& s) {
            if (!g.inBounds(s.pos.x, s.pos.y)) return true;
            const Tile& t = g.at(s.pos.x, s.pos.y);
            if (!t.has(spawnFlagFor(s.kind))) return true;
            if (s.kind == SpawnKind::Item && t.terrain != Terrain::Floor) return s.origin != SpawnOrigin::Buried;
            return false;
        }),
        floor.spawns.end());
    return static_cast<int>(before - floor.spawns.size());
}
