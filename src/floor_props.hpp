#pragma once

#include "dungeon.hpp"
#include "rng.hpp"

#include <cstdint>
#include <string>
#include <vector>

enum class FloorLayout : uint8_t {
    Standard = 0,
    OuterRing,
    Crossroads,
    Line,
    Cross,
    Beetle,
    OuterRooms,
    OneRoomMonsterHouse,
    TwoRoomsWithMonsterHouse,
};

constexpr int FLOOR_LAYOUT_COUNT = 9;

const char* floorLayoutName(FloorLayout l);
bool parseFloorLayout(const std::string& name, FloorLayout& out);

// Large floors use the whole grid; smaller ones invalidate the right-hand columns.
enum class FloorSize : uint8_t {
    Large = 0,
    Medium,
    Small,
};

enum class HiddenStairsType : uint8_t {
    None = 0,
    SecretBazaar,
    SecretRoom,
};

// Per-feature enable bits.
enum FloorFeature : uint32_t {
    FF_None             = 0,
    FF_AllowDeadEnds    = 1u << 0,
    FF_ImperfectRooms   = 1u << 1,
    FF_SecondaryTerrain = 1u << 2,
    FF_MazeRooms        = 1u << 3,
    FF_KecleonShop      = 1u << 4,
    FF_MonsterHouse     = 1u << 5,
    FF_ExtraHallways    = 1u << 6,
    FF_SecondaryAsChasms = 1u << 7, // sky floors: water/lava becomes chasm
    FF_WallsAsChasms    = 1u << 8,
};

struct SpawnEntry {
    int id = 0;
    int weight = 1;
};

using SpawnTable = std::vector<SpawnEntry>;

// Weighted pick. Returns 0 for an empty (or all-zero) table.
int pickSpawnId(const SpawnTable& table, RandomSource& rng);

// Caller-supplied, read-only configuration for one floor.
struct FloorProperties {
    int width = FLOOR_DEFAULT_WIDTH;
    int height = FLOOR_DEFAULT_HEIGHT;

    FloorLayout layout = FloorLayout::Standard;
    // 0 = pick at random within what the floor size allows.
    int gridCols = 0;
    int gridRows = 0;
    FloorSize floorSize = FloorSize::Large;

    uint32_t features = FF_ImperfectRooms | FF_MazeRooms | FF_KecleonShop | FF_MonsterHouse | FF_ExtraHallways;

    // Negative densities mean "exactly this many".
    int roomDensity = 6;
    int connectivity = 15;
    int extraHallwayDensity = 3;

    // Chances are percentages.
    int imperfectionChance = 35;
    int mazeRoomChance = 8;
    int kecleonShopChance = 20;
    int monsterHouseChance = 15;
    int emptyMonsterHouseChance = 20;

    int secondaryTerrainDensity = 3;
    int secondaryStructuresBudget = 2;

    int itemDensity = 5;
    int buriedItemDensity = 2;
    int trapDensity = 3;
    int enemyDensity = 4;

    HiddenStairsType hiddenStairs = HiddenStairsType::None;
    int floorsRemaining = 5;
    bool rescueFloor = false;

    // 0 = no fixed room.
    int fixedRoomId = 0;

    SpawnTable items{ {1, 30}, {2, 20}, {3, 10}, {4, 5} };
    SpawnTable traps{ {1, 10}, {2, 6}, {3, 4} };
    SpawnTable enemies{ {1, 12}, {2, 8}, {3, 5}, {4, 2} };

    bool has(FloorFeature f) const { return (features & f) != 0; }
};

// Parse INI-ish text (key = value, # or ; comments). Unknown keys and bad values are
// reported in outWarnings and otherwise ignored. Returns true when every line was accepted.
bool parseFloorPropertiesIni(const std::string& text, FloorProperties& out, std::string* outWarnings = nullptr);

// Load floor properties from a file. Returns false if the file could not be read.
// outAllAccepted receives the parse result (false when any line was rejected).
bool loadFloorPropertiesIni(const std::string& path, FloorProperties& out, std::string* outWarnings = nullptr,
                            bool* outAllAccepted = nullptr);

// Writes a commented default properties file. Returns true on success.
bool writeDefaultFloorPropertiesIni(const std::string& path);
