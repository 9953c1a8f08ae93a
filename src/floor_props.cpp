#include "floor_props.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace {

std::string ltrim(std::string s) {
    s.erase(s.begin(),
        std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
    return s;
}

std::string rtrim(std::string s) {
    s.erase(
        std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
        s.end());
    return s;
}

std::string trim(std::string s) {
    return rtrim(ltrim(std::move(s)));
}

void stripUtf8Bom(std::string& s) {
    if (s.size() >= 3 &&
        static_cast<unsigned char>(s[0]) == 0xEF &&
        static_cast<unsigned char>(s[1]) == 0xBB &&
        static_cast<unsigned char>(s[2]) == 0xBF) {
        s.erase(0, 3);
    }
}

bool parseBool(const std::string& v, bool& out) {
    const std::string s = toLower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") {
        out = true;
        return true;
    }
    if (s == "0" || s == "false" || s == "no" || s == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parseInt(const std::string& v, int& out) {
    const std::string s = trim(v);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    const long n = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || end == s.c_str() || *end != '\0') return false;
    if (n < -1000000L || n > 1000000L) return false;
    out = static_cast<int>(n);
    return true;
}

// "id:weight, id:weight, ..." (a bare id gets weight 1).
bool parseSpawnTable(const std::string& v, SpawnTable& out) {
    SpawnTable table;
    std::stringstream ss(v);
    std::string tok;
    while (std::getline(ss, tok, ',')) {
        tok = trim(tok);
        if (tok.empty()) continue;
        SpawnEntry e;
        const size_t colon = tok.find(':');
        if (colon == std::string::npos) {
            if (!parseInt(tok, e.id)) return false;
        } else {
            if (!parseInt(tok.substr(0, colon), e.id)) return false;
            if (!parseInt(tok.substr(colon + 1), e.weight)) return false;
        }
        if (e.id < 0 || e.weight < 0) return false;
        table.push_back(e);
    }
    out = std::move(table);
    return true;
}

void appendWarning(std::string& warnings, int lineNo, const std::string& msg, int& count) {
    ++count;
    // Keep the report readable for badly broken files.
    if (count > 24) return;
    warnings += "line " + std::to_string(lineNo) + ": " + msg + "\n";
}

struct FeatureKey {
    const char* key;
    FloorFeature bit;
};

const FeatureKey FEATURE_KEYS[] = {
    { "dead_ends",           FF_AllowDeadEnds },
    { "imperfect_rooms",     FF_ImperfectRooms },
    { "secondary_terrain",   FF_SecondaryTerrain },
    { "maze_rooms",          FF_MazeRooms },
    { "kecleon_shop",        FF_KecleonShop },
    { "monster_house",       FF_MonsterHouse },
    { "extra_hallways",      FF_ExtraHallways },
    { "secondary_as_chasms", FF_SecondaryAsChasms },
    { "walls_as_chasms",     FF_WallsAsChasms },
};

struct IntKey {
    const char* key;
    int FloorProperties::*field;
    int lo;
    int hi;
};

const IntKey INT_KEYS[] = {
    { "width",                       &FloorProperties::width, FLOOR_MIN_WIDTH, FLOOR_MAX_WIDTH },
    { "height",                      &FloorProperties::height, FLOOR_MIN_HEIGHT, FLOOR_MAX_HEIGHT },
    { "grid_cols",                   &FloorProperties::gridCols, 0, 8 },
    { "grid_rows",                   &FloorProperties::gridRows, 0, 6 },
    { "room_density",                &FloorProperties::roomDensity, -32, 32 },
    { "connectivity",                &FloorProperties::connectivity, 0, 64 },
    { "extra_hallway_density",       &FloorProperties::extraHallwayDensity, 0, 32 },
    { "imperfection_chance",         &FloorProperties::imperfectionChance, 0, 100 },
    { "maze_room_chance",            &FloorProperties::mazeRoomChance, 0, 100 },
    { "kecleon_shop_chance",         &FloorProperties::kecleonShopChance, 0, 100 },
    { "monster_house_chance",        &FloorProperties::monsterHouseChance, 0, 100 },
    { "empty_monster_house_chance",  &FloorProperties::emptyMonsterHouseChance, 0, 100 },
    { "secondary_terrain_density",   &FloorProperties::secondaryTerrainDensity, 0, 16 },
    { "secondary_structures_budget", &FloorProperties::secondaryStructuresBudget, 0, 16 },
    { "item_density",                &FloorProperties::itemDensity, -64, 64 },
    { "buried_item_density",         &FloorProperties::buriedItemDensity, -64, 64 },
    { "trap_density",                &FloorProperties::trapDensity, -64, 64 },
    { "enemy_density",               &FloorProperties::enemyDensity, -64, 64 },
    { "floors_remaining",            &FloorProperties::floorsRemaining, 0, 999 },
    { "fixed_room_id",               &FloorProperties::fixedRoomId, 0, 65535 },
};

} // namespace

const char* floorLayoutName(FloorLayout l) {
    switch (l) {
        case FloorLayout::Standard:                 return "standard";
        case FloorLayout::OuterRing:                return "outer_ring";
        case FloorLayout::Crossroads:               return "crossroads";
        case FloorLayout::Line:                     return "line";
        case FloorLayout::Cross:                    return "cross";
        case FloorLayout::Beetle:                   return "beetle";
        case FloorLayout::OuterRooms:               return "outer_rooms";
        case FloorLayout::OneRoomMonsterHouse:      return "one_room_monster_house";
        case FloorLayout::TwoRoomsWithMonsterHouse: return "two_rooms_monster_house";
    }
    return "standard";
}

bool parseFloorLayout(const std::string& name, FloorLayout& out) {
    std::string s = toLower(trim(name));
    std::replace(s.begin(), s.end(), '-', '_');
    for (int i = 0; i < FLOOR_LAYOUT_COUNT; ++i) {
        const FloorLayout l = static_cast<FloorLayout>(i);
        if (s == floorLayoutName(l)) {
            out = l;
            return true;
        }
    }
    return false;
}

int pickSpawnId(const SpawnTable& table, RandomSource& rng) {
    int total = 0;
    for (const auto& e : table) total += std::max(0, e.weight);
    const int roll = rng.below(total);
    if (total <= 0) return 0;

    int acc = 0;
    for (const auto& e : table) {
        acc += std::max(0, e.weight);
        if (roll < acc) return e.id;
    }
    return table.back().id;
}

bool parseFloorPropertiesIni(const std::string& text, FloorProperties& out, std::string* outWarnings) {
    std::istringstream iss(text);
    std::string line;

    std::string warnings;
    int warnCount = 0;

    for (int lineNo = 1; std::getline(iss, line); ++lineNo) {
        if (lineNo == 1) stripUtf8Bom(line);

        // Strip comments (# or ;)
        const size_t hash = line.find('#');
        const size_t semi = line.find(';');
        const size_t cut = std::min(hash == std::string::npos ? line.size() : hash,
                                    semi == std::string::npos ? line.size() : semi);
        line = trim(line.substr(0, cut));
        if (line.empty()) continue;

        const size_t eq = line.find('=');
        if (eq == std::string::npos) {
            appendWarning(warnings, lineNo, "Expected key=value", warnCount);
            continue;
        }

        const std::string key = toLower(trim(line.substr(0, eq)));
        const std::string val = trim(line.substr(eq + 1));

        bool handled = false;
        for (const auto& k : INT_KEYS) {
            if (key != k.key) continue;
            handled = true;
            int v = 0;
            if (parseInt(val, v)) {
                out.*(k.field) = std::clamp(v, k.lo, k.hi);
            } else {
                appendWarning(warnings, lineNo, "Invalid integer for " + key + ": " + val, warnCount);
            }
            break;
        }
        if (handled) continue;

        for (const auto& k : FEATURE_KEYS) {
            if (key != k.key) continue;
            handled = true;
            bool b = false;
            if (parseBool(val, b)) {
                if (b) out.features |= k.bit;
                else out.features &= ~static_cast<uint32_t>(k.bit);
            } else {
                appendWarning(warnings, lineNo, "Invalid boolean for " + key + ": " + val, warnCount);
            }
            break;
        }
        if (handled) continue;

        if (key == "layout") {
            FloorLayout l = FloorLayout::Standard;
            if (parseFloorLayout(val, l)) out.layout = l;
            else appendWarning(warnings, lineNo, "Unknown layout: " + val, warnCount);
        } else if (key == "floor_size") {
            const std::string v = toLower(val);
            if (v == "large") out.floorSize = FloorSize::Large;
            else if (v == "medium") out.floorSize = FloorSize::Medium;
            else if (v == "small") out.floorSize = FloorSize::Small;
            else appendWarning(warnings, lineNo, "Unknown floor_size: " + val, warnCount);
        } else if (key == "hidden_stairs") {
            const std::string v = toLower(val);
            if (v == "none") out.hiddenStairs = HiddenStairsType::None;
            else if (v == "secret_bazaar") out.hiddenStairs = HiddenStairsType::SecretBazaar;
            else if (v == "secret_room") out.hiddenStairs = HiddenStairsType::SecretRoom;
            else appendWarning(warnings, lineNo, "Unknown hidden_stairs: " + val, warnCount);
        } else if (key == "rescue_floor") {
            bool b = false;
            if (parseBool(val, b)) out.rescueFloor = b;
            else appendWarning(warnings, lineNo, "Invalid boolean for rescue_floor: " + val, warnCount);
        } else if (key == "items" || key == "traps" || key == "enemies") {
            SpawnTable& table = (key == "items") ? out.items : (key == "traps") ? out.traps : out.enemies;
            if (!parseSpawnTable(val, table)) {
                appendWarning(warnings, lineNo, "Invalid spawn table for " + key + " (expected id:weight, ...)", warnCount);
            }
        } else {
            appendWarning(warnings, lineNo, "Unknown key: " + key, warnCount);
        }
    }

    if (warnCount > 24) {
        warnings += "(" + std::to_string(warnCount - 24) + " more warnings suppressed)\n";
    }
    if (outWarnings) *outWarnings = warnings;
    return warnCount == 0;
}

bool loadFloorPropertiesIni(const std::string& path, FloorProperties& out, std::string* outWarnings,
                            bool* outAllAccepted) {
    if (outAllAccepted) *outAllAccepted = false;
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        if (outWarnings) *outWarnings = "Could not open floor properties file: " + path;
        return false;
    }

    std::ostringstream oss;
    oss << f.rdbuf();
    const bool clean = parseFloorPropertiesIni(oss.str(), out, outWarnings);
    if (outAllAccepted) *outAllAccepted = clean;
    return true;
}

bool writeDefaultFloorPropertiesIni(const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;

    f << R"INI(# FloorForge floor properties
#
# Lines are: key = value
# Comments start with # or ;

# Geometry
# width: 24..96, height: 16..64
width = 56
height = 32
# layout: standard | outer_ring | crossroads | line | cross | beetle | outer_rooms
#         one_room_monster_house | two_rooms_monster_house
layout = standard
# grid_cols / grid_rows: 0 picks at random
grid_cols = 0
grid_rows = 0
# floor_size: large | medium | small
floor_size = large

# Structure
# room_density: negative means "exactly this many rooms"
room_density = 6
connectivity = 15
extra_hallway_density = 3

# Features (true/false)
dead_ends = false
imperfect_rooms = true
secondary_terrain = false
maze_rooms = true
kecleon_shop = true
monster_house = true
extra_hallways = true
secondary_as_chasms = false
walls_as_chasms = false

# Feature chances (percent)
imperfection_chance = 35
maze_room_chance = 8
kecleon_shop_chance = 20
monster_house_chance = 15
empty_monster_house_chance = 20

# Water/lava
secondary_terrain_density = 3
secondary_structures_budget = 2

# Entities (negative density = exact count)
item_density = 5
buried_item_density = 2
trap_density = 3
enemy_density = 4
# hidden_stairs: none | secret_bazaar | secret_room
hidden_stairs = none
floors_remaining = 5
rescue_floor = false

# Spawn tables: id:weight, ...
items = 1:30, 2:20, 3:10, 4:5
traps = 1:10, 2:6, 3:4
enemies = 1:12, 2:8, 3:5, 4:2

# Fixed room id (0 = none)
fixed_room_id = 0
)INI";

    return static_cast<bool>(f);
}
