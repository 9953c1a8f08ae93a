#include "dungeon.hpp"

TileGrid::TileGrid(int w, int h) : width(w), height(h), tiles(static_cast<size_t>(w * h)) {
    reset();
}

void TileGrid::reset() {
    for (auto& t : tiles) {
        t = Tile{};
    }
    for (int x = 0; x < width; ++x) {
        at(x, 0).set(TF_Impassable);
        at(x, height - 1).set(TF_Impassable);
    }
    for (int y = 0; y < height; ++y) {
        at(0, y).set(TF_Impassable);
        at(width - 1, y).set(TF_Impassable);
    }
}

bool TileGrid::isWalkable(int x, int y) const {
    if (!inBounds(x, y)) return false;
    const Tile& t = at(x, y);
    return t.isOpen() && !t.has(TF_Impassable);
}

bool TileGrid::isPassableWall(int x, int y) const {
    if (!inBounds(x, y)) return false;
    const Tile& t = at(x, y);
    return t.terrain == Terrain::Wall && !t.has(TF_Impassable);
}

bool TileGrid::isHallway(int x, int y) const {
    if (!inBounds(x, y)) return false;
    const Tile& t = at(x, y);
    return t.isOpen() && t.room == ROOM_HALLWAY;
}

int TileGrid::countFlag(uint16_t f) const {
    int n = 0;
    for (const auto& t : tiles) {
        if (t.has(f)) ++n;
    }
    return n;
}

int TileGrid::countTerrain(Terrain terrain) const {
    int n = 0;
    for (const auto& t : tiles) {
        if (t.terrain == terrain) ++n;
    }
    return n;
}

void TileGrid::clearFlagEverywhere(uint16_t f) {
    for (auto& t : tiles) t.clear(f);
}

void TileGrid::fillRoom(const Recti& r, uint8_t roomIndex) {
    for (int y = r.y0; y < r.y1; ++y) {
        for (int x = r.x0; x < r.x1; ++x) {
            if (!inInterior(x, y)) continue;
            Tile& t = at(x, y);
            t.terrain = Terrain::Floor;
            t.room = roomIndex;
        }
    }
}

int TileGrid::flagRoomTiles(uint8_t roomIndex, uint16_t f) {
    int n = 0;
    for (auto& t : tiles) {
        if (t.room != roomIndex) continue;
        t.set(f);
        ++n;
    }
    return n;
}

uint16_t spawnFlagFor(SpawnKind k) {
    switch (k) {
        case SpawnKind::Stairs:       return TF_SpawnStairs;
        case SpawnKind::HiddenStairs: return TF_SpawnHiddenStairs;
        case SpawnKind::Item:         return TF_SpawnItem;
        case SpawnKind::Trap:         return TF_SpawnTrap;
        case SpawnKind::Enemy:        return TF_SpawnEnemy;
        case SpawnKind::Player:       return TF_SpawnPlayer;
    }
    return TF_None;
}

const char* spawnKindName(SpawnKind k) {
    switch (k) {
        case SpawnKind::Stairs:       return "stairs";
        case SpawnKind::HiddenStairs: return "hidden_stairs";
        case SpawnKind::Item:         return "item";
        case SpawnKind::Trap:         return "trap";
        case SpawnKind::Enemy:        return "enemy";
        case SpawnKind::Player:       return "player";
    }
    return "unknown";
}

void Floor::reset() {
    grid.reset();
    rooms.clear();
    spawns.clear();
    stairs = { -1, -1 };
}

RoomInfo* Floor::findRoom(uint8_t index) {
    for (auto& r : rooms) {
        if (r.index == index) return &r;
    }
    return nullptr;
}

const RoomInfo* Floor::findRoom(uint8_t index) const {
    for (const auto& r : rooms) {
        if (r.index == index) return &r;
    }
    return nullptr;
}

bool Floor::hasSpawn(SpawnKind k) const {
    for (const auto& s : spawns) {
        if (s.kind == k) return true;
    }
    return false;
}

int Floor::countSpawns(SpawnKind k) const {
    int n = 0;
    for (const auto& s : spawns) {
        if (s.kind == k) ++n;
    }
    return n;
}
