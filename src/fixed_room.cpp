#include "fixed_room.hpp"

#include "floor_features.hpp"
#include "junctions.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace {

constexpr uint8_t FIXED_ROOM_INDEX = 0;

void setErr(std::string* err, const std::string& msg) {
    if (err) *err = msg;
}

std::string rtrim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.pop_back();
    return s;
}

bool charToTile(char c, Tile& t, bool& hasSpawn, SpawnKind& kind) {
    t = Tile{};
    hasSpawn = false;
    switch (c) {
        case '#': return true;
        case 'X': t.set(TF_Impassable); return true;
        case '=': t.terrain = Terrain::Floor; return true;
        case '.': t.terrain = Terrain::Floor; t.room = FIXED_ROOM_INDEX; return true;
        case '~': t.terrain = Terrain::Secondary; t.room = FIXED_ROOM_INDEX; return true;
        case '_': t.terrain = Terrain::Chasm; return true;
        case 'K':
            t.terrain = Terrain::Floor;
            t.room = FIXED_ROOM_INDEX;
            t.set(TF_Special);
            return true;
        case '>': kind = SpawnKind::Stairs; break;
        case 'P': kind = SpawnKind::Player; break;
        case '$': kind = SpawnKind::Item; break;
        case '^': kind = SpawnKind::Trap; break;
        case 'M': kind = SpawnKind::Enemy; break;
        default: return false;
    }
    t.terrain = Terrain::Floor;
    t.room = FIXED_ROOM_INDEX;
    hasSpawn = true;
    return true;
}

bool parseRoomHeader(const std::string& line, int& id) {
    // [room N]
    if (line.size() < 3 || line.front() != '[' || line.back() != ']') return false;
    std::istringstream iss(line.substr(1, line.size() - 2));
    std::string word;
    if (!(iss >> word)) return false;
    if (toLower(word) != "room") return false;
    if (!(iss >> id)) return false;
    return id > 0;
}

} // namespace

bool FixedRoomCatalog::load(int id, FixedRoomData& out) const {
    auto it = rooms_.find(id);
    if (it == rooms_.end()) return false;
    out = it->second;
    return true;
}

void FixedRoomCatalog::add(const FixedRoomData& room) {
    rooms_[room.id] = room;
}

bool parseFixedRoomAscii(int id, const std::vector<std::string>& rows, FixedRoomData& out, std::string* err) {
    if (rows.empty() || rows.front().empty()) {
        setErr(err, "room " + std::to_string(id) + " is empty");
        return false;
    }

    FixedRoomData room;
    room.id = id;
    room.width = static_cast<int>(rows.front().size());
    room.height = static_cast<int>(rows.size());
    room.tiles.resize(static_cast<size_t>(room.width * room.height));

    for (int y = 0; y < room.height; ++y) {
        const std::string& row = rows[static_cast<size_t>(y)];
        if (static_cast<int>(row.size()) != room.width) {
            setErr(err, "room " + std::to_string(id) + " row " + std::to_string(y + 1) + " has width " +
                        std::to_string(row.size()) + ", expected " + std::to_string(room.width));
            return false;
        }
        for (int x = 0; x < room.width; ++x) {
            Tile t;
            bool hasSpawn = false;
            SpawnKind kind = SpawnKind::Item;
            if (!charToTile(row[static_cast<size_t>(x)], t, hasSpawn, kind)) {
                setErr(err, "room " + std::to_string(id) + " has unknown tile '" +
                            std::string(1, row[static_cast<size_t>(x)]) + "' at " +
                            std::to_string(x) + "," + std::to_string(y));
                return false;
            }
            if (hasSpawn) {
                SpawnRecord rec;
                rec.kind = kind;
                rec.pos = {x, y};
                rec.payload = (kind == SpawnKind::Item || kind == SpawnKind::Trap || kind == SpawnKind::Enemy) ? 1 : 0;
                rec.origin = SpawnOrigin::FixedRoom;
                room.spawns.push_back(rec);
            }
            room.tiles[static_cast<size_t>(y * room.width + x)] = t;
        }
    }

    out = std::move(room);
    return true;
}

bool loadFixedRoomCatalogFile(const std::string& path, FixedRoomCatalog& catalog, std::string* outWarnings) {
    std::ifstream f(path);
    if (!f) {
        if (outWarnings) *outWarnings = "Could not open fixed room file: " + path;
        return false;
    }

    std::string warnings;
    int currentId = 0;
    std::vector<std::string> rows;

    auto flush = [&]() {
        if (currentId <= 0) return;
        FixedRoomData room;
        std::string err;
        if (parseFixedRoomAscii(currentId, rows, room, &err)) {
            catalog.add(room);
        } else {
            warnings += err + "\n";
        }
        rows.clear();
    };

    std::string line;
    for (int lineNo = 1; std::getline(f, line); ++lineNo) {
        line = rtrim(line);
        const size_t first = line.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        if (line[first] == ';') continue;

        if (line[first] == '[') {
            flush();
            currentId = 0;
            int id = 0;
            if (parseRoomHeader(line.substr(first), id)) {
                currentId = id;
            } else {
                warnings += "line " + std::to_string(lineNo) + ": bad room header: " + line + "\n";
            }
            continue;
        }

        if (currentId <= 0) {
            warnings += "line " + std::to_string(lineNo) + ": tile row outside of a [room N] section\n";
            continue;
        }
        rows.push_back(line.substr(first));
    }
    flush();

    if (outWarnings) *outWarnings = warnings;
    return true;
}

bool stampFixedRoom(Floor& floor, const FixedRoomData& room, std::string* err) {
    TileGrid& g = floor.grid;
    if (room.width <= 0 || room.height <= 0 ||
        room.width > g.width - 2 || room.height > g.height - 2) {
        setErr(err, "fixed room " + std::to_string(room.id) + " (" + std::to_string(room.width) + "x" +
                    std::to_string(room.height) + ") does not fit the floor");
        return false;
    }

    const int ox = std::max(1, (g.width - room.width) / 2);
    const int oy = std::max(1, (g.height - room.height) / 2);

    Recti roomBounds{ g.width, g.height, 0, 0 };
    for (int y = 0; y < room.height; ++y) {
        for (int x = 0; x < room.width; ++x) {
            const Tile& src = room.tiles[static_cast<size_t>(y * room.width + x)];
            Tile& dst = g.at(ox + x, oy + y);
            dst = src;
            if (!src.inRoom()) continue;
            roomBounds.x0 = std::min(roomBounds.x0, ox + x);
            roomBounds.y0 = std::min(roomBounds.y0, oy + y);
            roomBounds.x1 = std::max(roomBounds.x1, ox + x + 1);
            roomBounds.y1 = std::max(roomBounds.y1, oy + y + 1);
        }
    }

    if (!roomBounds.empty()) {
        RoomInfo info;
        info.index = FIXED_ROOM_INDEX;
        info.bounds = roomBounds;
        floor.rooms.push_back(info);
    }

    for (const SpawnRecord& s : room.spawns) {
        SpawnRecord rec = s;
        rec.pos = { ox + s.pos.x, oy + s.pos.y };
        g.at(rec.pos.x, rec.pos.y).set(spawnFlagFor(rec.kind));
        floor.spawns.push_back(rec);
        if (rec.kind == SpawnKind::Stairs && floor.stairs.x < 0) floor.stairs = rec.pos;
    }

    flagHallwayJunctions(g, ox - 1, oy - 1, ox + room.width, oy + room.height);
    ensureImpassableTilesAreWalls(g);
    return true;
}
