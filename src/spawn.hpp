#pragma once

#include "dungeon.hpp"
#include "floor_props.hpp"
#include "rng.hpp"

#include <cstdint>
#include <vector>

// Entity placer
//
// Every spawn slot is described by one row of a rule table: the entity kind it
// produces and the set of tile predicates a position must satisfy. Eligible tiles are
// collected row-major, shuffled, and consumed in order.

enum SpawnRequirement : uint32_t {
    SR_None            = 0,
    SR_Open            = 1u << 0,  // open floor terrain
    SR_InRoom          = 1u << 1,  // real room index (not hallway)
    SR_Wall            = 1u << 2,  // passable wall
    SR_MonsterHouse    = 1u << 3,
    SR_NotShop         = 1u << 4,
    SR_NotMonsterHouse = 1u << 5,
    SR_NotJunction     = 1u << 6,
    SR_NotSpecial      = 1u << 7,
    SR_NoStairs        = 1u << 8,  // neither stairs nor hidden stairs
    SR_NoItem          = 1u << 9,
    SR_NoTrap          = 1u << 10,
    SR_NoEnemy         = 1u << 11,
    SR_NoPlayer        = 1u << 12,
};

enum class SpawnSlot : uint8_t {
    Stairs = 0,
    HiddenStairs,
    Item,
    BuriedItem,
    MonsterHouseItem,
    Trap,
    MonsterHouseTrap,
    Player,
    Enemy,
    MonsterHouseEnemy,
};

constexpr int SPAWN_SLOT_COUNT = 10;

struct SpawnRule {
    SpawnSlot slot;
    SpawnKind kind;
    SpawnOrigin origin;
    uint32_t requirements;
};

const SpawnRule& spawnRule(SpawnSlot slot);
const char* spawnSlotName(SpawnSlot slot);

bool tileMeetsRequirement(const TileGrid& grid, int x, int y, SpawnRequirement req);
bool tileEligible(const TileGrid& grid, int x, int y, uint32_t requirements);
std::vector<Vec2i> eligibleTiles(const TileGrid& grid, uint32_t requirements);

// Uniform permutation of candidate positions.
void shuffleSpawnPositions(std::vector<Vec2i>& positions, RandomSource& rng);

// Places up to `count` spawns for a slot, drawing payloads from `table` when given.
// Returns the number placed.
int placeSpawns(Floor& floor, SpawnSlot slot, int count, const SpawnTable* table, int payload, RandomSource& rng);

// Places the stairs unless the floor already has them, and records floor.stairs.
// On rescue floors the stairs room becomes a Monster House (unless it is a shop).
// Returns false when no eligible tile exists.
bool spawnStairs(Floor& floor, const FloorProperties& props, RandomSource& rng);

// Stairs (if missing), hidden stairs, items, buried items, Monster House items, traps,
// Monster House traps, then the player. Returns the number of spawns placed.
int spawnNonEnemies(Floor& floor, const FloorProperties& props, bool emptyMonsterHouse, RandomSource& rng);

// Normal enemies, then Monster House enemies. Returns the number placed.
int spawnEnemies(Floor& floor, const FloorProperties& props, bool emptyMonsterHouse, RandomSource& rng);

// Clears conflicting spawn flags (stairs > hidden stairs > item > trap, player >
// enemy), drops traps and enemies off floor terrain and items off walls unless
// buried, then removes records whose flag was cleared. Returns the records removed.
int resolveInvalidSpawns(Floor& floor);
