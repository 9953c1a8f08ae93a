#pragma once
#include "common.hpp"
#include <cstdint>
#include <vector>

constexpr int FLOOR_DEFAULT_WIDTH = 56;
constexpr int FLOOR_DEFAULT_HEIGHT = 32;

constexpr int FLOOR_MIN_WIDTH = 24;
constexpr int FLOOR_MAX_WIDTH = 96;
constexpr int FLOOR_MIN_HEIGHT = 16;
constexpr int FLOOR_MAX_HEIGHT = 64;

// Room index values. Anything <= ROOM_INDEX_MAX is a real room.
constexpr uint8_t ROOM_INDEX_MAX = 0xEF;
// Hallway anchor placeholder. Only exists between layout planning and junction resolution.
constexpr uint8_t ROOM_ANCHOR = 0xFE;
// Hallway, or no room at all. Freshly reset tiles carry this value.
constexpr uint8_t ROOM_HALLWAY = 0xFF;

enum class Terrain : uint8_t {
    Wall = 0,
    Floor,
    // Water/lava.
    Secondary,
    Chasm,
};

enum TileFlag : uint16_t {
    TF_None              = 0,
    TF_Junction          = 1u << 0,
    TF_Impassable        = 1u << 1,
    TF_MonsterHouse      = 1u << 2,
    TF_KecleonShop       = 1u << 3,
    TF_Special           = 1u << 4, // key doors and similar fixed-room tiles
    TF_SpawnStairs       = 1u << 5,
    TF_SpawnHiddenStairs = 1u << 6,
    TF_SpawnItem         = 1u << 7,
    TF_SpawnTrap         = 1u << 8,
    TF_SpawnEnemy        = 1u << 9,
    TF_SpawnPlayer       = 1u << 10,
    TF_Unreachable       = 1u << 11, // diagnostic, set by the reachability check
};

constexpr uint16_t TF_SpawnMask = TF_SpawnStairs | TF_SpawnHiddenStairs | TF_SpawnItem |
                                  TF_SpawnTrap | TF_SpawnEnemy | TF_SpawnPlayer;

struct Tile {
    Terrain terrain = Terrain::Wall;
    uint8_t room = ROOM_HALLWAY;
    uint16_t flags = TF_None;

    bool has(uint16_t f) const { return (flags & f) != 0; }
    void set(uint16_t f) { flags = static_cast<uint16_t>(flags | f); }
    void clear(uint16_t f) { flags = static_cast<uint16_t>(flags & ~f); }

    bool isOpen() const { return terrain == Terrain::Floor; }
    bool inRoom() const { return room <= ROOM_INDEX_MAX; }
};

inline bool operator==(const Tile& a, const Tile& b) {
    return a.terrain == b.terrain && a.room == b.room && a.flags == b.flags;
}

inline bool operator!=(const Tile& a, const Tile& b) {
    return !(a == b);
}

// The mutable tile array every generation phase writes into.
// One instance is owned by exactly one generation run at a time.
class TileGrid {
public:
    int width = 0;
    int height = 0;
    std::vector<Tile> tiles;

    TileGrid() = default;
    TileGrid(int w, int h);

    bool inBounds(int x, int y) const {
        return x >= 0 && y >= 0 && x < width && y < height;
    }

    // Strictly inside the impassable outer ring.
    bool inInterior(int x, int y) const {
        return x >= 1 && y >= 1 && x < width - 1 && y < height - 1;
    }

    Tile& at(int x, int y) { return tiles[static_cast<size_t>(y * width + x)]; }
    const Tile& at(int x, int y) const { return tiles[static_cast<size_t>(y * width + x)]; }

    // All tiles back to plain wall with no room, outer ring impassable.
    void reset();

    bool isWalkable(int x, int y) const;
    bool isPassableWall(int x, int y) const;
    bool isHallway(int x, int y) const;

    int countFlag(uint16_t f) const;
    int countTerrain(Terrain t) const;
    void clearFlagEverywhere(uint16_t f);

    // Open + room index stamp over a rectangle (clipped to the interior).
    void fillRoom(const Recti& r, uint8_t roomIndex);
    // Sets f on every tile carrying roomIndex. Returns the number of tiles touched.
    int flagRoomTiles(uint8_t roomIndex, uint16_t f);
};

struct RoomInfo {
    uint8_t index = 0;
    Recti bounds;
    bool maze = false;
    bool kecleonShop = false;
    bool monsterHouse = false;
    bool imperfect = false;
    bool merged = false;
    bool secondaryStructure = false;
};

enum class SpawnKind : uint8_t {
    Stairs = 0,
    HiddenStairs,
    Item,
    Trap,
    Enemy,
    Player,
};

enum class SpawnOrigin : uint8_t {
    Normal = 0,
    Buried,
    MonsterHouse,
    FixedRoom,
};

struct SpawnRecord {
    SpawnKind kind = SpawnKind::Item;
    Vec2i pos;
    int payload = 0; // item/trap/enemy id, hidden stairs type
    SpawnOrigin origin = SpawnOrigin::Normal;
};

inline bool operator==(const SpawnRecord& a, const SpawnRecord& b) {
    return a.kind == b.kind && a.pos == b.pos && a.payload == b.payload && a.origin == b.origin;
}

uint16_t spawnFlagFor(SpawnKind k);
const char* spawnKindName(SpawnKind k);

// A generated floor: the tile grid plus what lives on it.
struct Floor {
    TileGrid grid;
    std::vector<RoomInfo> rooms;
    std::vector<SpawnRecord> spawns;
    Vec2i stairs{ -1, -1 };

    Floor() = default;
    Floor(int w, int h) : grid(w, h) {}

    int width() const { return grid.width; }
    int height() const { return grid.height; }

    void reset();

    RoomInfo* findRoom(uint8_t index);
    const RoomInfo* findRoom(uint8_t index) const;

    bool hasSpawn(SpawnKind k) const;
    int countSpawns(SpawnKind k) const;
};
