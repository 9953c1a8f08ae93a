#include "floor_dump.hpp"

#include <sstream>

namespace {

constexpr uint64_t FNV64_OFFSET = 14695981039346656037ull;
constexpr uint64_t FNV64_PRIME = 1099511628211ull;

inline void mixByte(uint64_t& h, uint8_t b) {
    h ^= b;
    h *= FNV64_PRIME;
}

inline void mixU32(uint64_t& h, uint32_t v) {
    for (int i = 0; i < 4; ++i) mixByte(h, static_cast<uint8_t>((v >> (8 * i)) & 0xFFu));
}

} // namespace

char tileGlyph(const Tile& t) {
    if (t.has(TF_SpawnPlayer)) return '@';
    if (t.has(TF_SpawnStairs)) return '>';
    if (t.has(TF_SpawnHiddenStairs)) return '}';
    if (t.has(TF_SpawnEnemy)) return 'M';
    if (t.has(TF_SpawnTrap)) return '^';
    if (t.has(TF_SpawnItem)) return '$';

    switch (t.terrain) {
        case Terrain::Wall:      return t.has(TF_Impassable) ? 'X' : '#';
        case Terrain::Secondary: return '~';
        case Terrain::Chasm:     return '_';
        case Terrain::Floor:     break;
    }

    if (t.has(TF_KecleonShop)) return 'k';
    if (t.has(TF_MonsterHouse)) return 'm';
    if (t.has(TF_Junction)) return '+';
    if (!t.inRoom()) return ',';
    return '.';
}

std::string floorToAscii(const Floor& floor) {
    const TileGrid& g = floor.grid;
    std::string out;
    out.reserve(static_cast<size_t>((g.width + 1) * g.height));
    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            out.push_back(tileGlyph(g.at(x, y)));
        }
        out.push_back('\n');
    }
    return out;
}

uint64_t floorHash(const Floor& floor) {
    uint64_t h = FNV64_OFFSET;
    mixU32(h, static_cast<uint32_t>(floor.width()));
    mixU32(h, static_cast<uint32_t>(floor.height()));
    for (const Tile& t : floor.grid.tiles) {
        mixByte(h, static_cast<uint8_t>(t.terrain));
        mixByte(h, t.room);
        mixByte(h, static_cast<uint8_t>(t.flags & 0xFFu));
        mixByte(h, static_cast<uint8_t>((t.flags >> 8) & 0xFFu));
    }
    for (const SpawnRecord& s : floor.spawns) {
        mixByte(h, static_cast<uint8_t>(s.kind));
        mixByte(h, static_cast<uint8_t>(s.origin));
        mixU32(h, static_cast<uint32_t>(s.pos.x));
        mixU32(h, static_cast<uint32_t>(s.pos.y));
        mixU32(h, static_cast<uint32_t>(s.payload));
    }
    return h;
}

std::string floorSummaryLine(const Floor& floor) {
    std::ostringstream ss;
    ss << floor.width() << "x" << floor.height()
       << " rooms=" << floor.rooms.size()
       << " stairs=(" << floor.stairs.x << "," << floor.stairs.y << ")"
       << " items=" << floor.countSpawns(SpawnKind::Item)
       << " traps=" << floor.countSpawns(SpawnKind::Trap)
       << " enemies=" << floor.countSpawns(SpawnKind::Enemy)
       << " player=" << (floor.hasSpawn(SpawnKind::Player) ? "yes" : "no");
    if (floor.hasSpawn(SpawnKind::HiddenStairs)) ss << " hidden_stairs=yes";
    return ss.str();
}

std::string jsonEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    static const char* hex = "0123456789abcdef";
                    out += "\\u00";
                    out += hex[(c >> 4) & 0xF];
                    out += hex[c & 0xF];
                } else {
                    out.push_back(static_cast<char>(c));
                }
                break;
        }
    }
    return out;
}
