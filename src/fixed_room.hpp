#pragma once

#include "dungeon.hpp"

#include <map>
#include <string>
#include <vector>

// Hand-authored rooms.
//
// ASCII legend:
//   #  wall            X  impassable wall
//   .  room floor      =  hallway floor
//   ~  water/lava      _  chasm
//   K  key-door floor (special)
//   >  stairs   P  player   $  item   ^  trap   M  enemy
//
// Spawn characters sit on room floor.

struct FixedRoomData {
    int id = 0;
    int width = 0;
    int height = 0;
    std::vector<Tile> tiles;          // row-major, room indices already assigned
    std::vector<SpawnRecord> spawns;  // positions relative to the room's top-left corner
};

// Source of fixed rooms. Implementations return false when the id is unknown.
class FixedRoomProvider {
public:
    virtual ~FixedRoomProvider() = default;
    virtual bool load(int id, FixedRoomData& out) const = 0;
};

class FixedRoomCatalog final : public FixedRoomProvider {
public:
    bool load(int id, FixedRoomData& out) const override;

    void add(const FixedRoomData& room);
    size_t size() const { return rooms_.size(); }

private:
    std::map<int, FixedRoomData> rooms_;
};

// Builds a room from ASCII rows. All rows must be the same width.
bool parseFixedRoomAscii(int id, const std::vector<std::string>& rows, FixedRoomData& out, std::string* err = nullptr);

// Catalog file: "[room N]" headers, each followed by ASCII rows. Lines starting with
// ';' are comments. Returns false only if the file could not be read; bad rooms are
// skipped and reported in outWarnings.
bool loadFixedRoomCatalogFile(const std::string& path, FixedRoomCatalog& catalog, std::string* outWarnings = nullptr);

// Stamps the room centred on a freshly reset floor, copies its spawns, flags
// junctions over the stamped area and re-asserts the impassable walls.
// Returns false when the room does not fit.
bool stampFixedRoom(Floor& floor, const FixedRoomData& room, std::string* err = nullptr);
