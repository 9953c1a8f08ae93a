#include "fixed_room.hpp"
#include "floor_dump.hpp"
#include "floor_generator.hpp"
#include "floor_props.hpp"
#include "reachability.hpp"
#include "rng.hpp"
#include "version.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {

static void printUsage(const char* argv0) {
    std::cout
        << "Usage:\n"
        << "  " << argv0 << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>                 Run seed (default 1).\n"
        << "  --floor <n>                Floor number; mixed into the seed (default 1).\n"
        << "  --layout <name>            Override the layout (standard, outer_ring, crossroads, line,\n"
        << "                             cross, beetle, outer_rooms, one_room_monster_house,\n"
        << "                             two_rooms_monster_house).\n"
        << "  --props <path>             Floor properties INI to load.\n"
        << "  --fixed-rooms <path>       Fixed room catalog file.\n"
        << "  --fixed-room <id>          Generate this fixed room instead of a random floor.\n"
        << "  --max-attempts <n>         Attempts before falling back (default 10).\n"
        << "  --batch <n>                Generate n consecutive floors and verify connectivity\n"
        << "                             and determinism of each.\n"
        << "  --ascii / --no-ascii       Print the floor as text (default on for single floors).\n"
        << "  --json-report <path>       Write a JSON summary report (useful for CI).\n"
        << "  --write-default-props <path>  Write a commented default properties file and exit.\n"
        << "  --version                  Print version.\n"
        << "  --help                     Show this help.\n";
}

static bool argValue(int& i, int argc, char** argv, std::string& out) {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
}

static bool parseU32(const std::string& s, uint32_t& out) {
    if (s.empty()) return false;
    uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + static_cast<uint64_t>(c - '0');
        if (v > 0xFFFFFFFFull) return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

static std::string hex64(uint64_t v) {
    std::ostringstream ss;
    ss << "0x" << std::hex << v;
    return ss.str();
}

struct FloorRunResult {
    uint32_t floorNumber = 0;
    uint32_t seed = 0;
    bool ok = false;
    bool complete = false;
    bool connected = false;
    bool deterministic = true;
    uint64_t hash = 0;
    std::string summary;
    FloorGenReport report;
};

static uint32_t floorSeed(uint32_t runSeed, uint32_t floorNumber) {
    return hashCombine(runSeed, tag32("FLOOR"), floorNumber);
}

static FloorRunResult runOne(const FloorProperties& props, const FixedRoomProvider* fixedRooms,
                             const GeneratorOptions& opt, uint32_t runSeed, uint32_t floorNumber,
                             bool checkDeterminism, Floor* outFloor) {
    FloorRunResult rr;
    rr.floorNumber = floorNumber;
    rr.seed = floorSeed(runSeed, floorNumber);

    Floor floor;
    RNG rng(rr.seed);
    rr.complete = generateFloor(floor, props, rng, fixedRooms, &rr.report, opt);
    rr.hash = floorHash(floor);
    rr.summary = floorSummaryLine(floor);

    // Fixed rooms are authored by hand and are not required to be connected.
    if (rr.report.usedFixedRoom) {
        rr.connected = true;
    } else {
        Floor probe = floor;
        rr.connected = stairsAlwaysReachable(probe.grid, probe.stairs).ok;
    }

    if (checkDeterminism) {
        Floor again;
        RNG rng2(rr.seed);
        FloorGenReport rep2;
        generateFloor(again, props, rng2, fixedRooms, &rep2, opt);
        rr.deterministic = (floorHash(again) == rr.hash) && (rep2.trace == rr.report.trace);
    }

    rr.ok = rr.complete && rr.connected && rr.deterministic;
    if (outFloor) *outFloor = std::move(floor);
    return rr;
}

static bool writeJsonReport(const std::filesystem::path& path,
                            const std::vector<FloorRunResult>& results,
                            uint32_t runSeed,
                            const FloorProperties& props,
                            std::string* err) {
    std::ofstream f(path);
    if (!f) {
        if (err) *err = "Failed to open JSON report for writing: " + path.generic_string();
        return false;
    }

    size_t okCount = 0;
    size_t fallbacks = 0;
    for (const auto& r : results) {
        if (r.ok) ++okCount;
        if (r.report.usedFallback) ++fallbacks;
    }

    f << "{\n";
    f << "  \"tool\": \"" << jsonEscape(FLOORFORGE_APPNAME) << "\",\n";
    f << "  \"version\": \"" << jsonEscape(FLOORFORGE_VERSION) << "\",\n";
    f << "  \"options\": {\n";
    f << "    \"seed\": " << runSeed << ",\n";
    f << "    \"width\": " << props.width << ",\n";
    f << "    \"height\": " << props.height << ",\n";
    f << "    \"layout\": \"" << jsonEscape(floorLayoutName(props.layout)) << "\",\n";
    f << "    \"fixedRoom\": " << props.fixedRoomId << "\n";
    f << "  },\n";
    f << "  \"summary\": {\n";
    f << "    \"total\": " << results.size() << ",\n";
    f << "    \"ok\": " << okCount << ",\n";
    f << "    \"failed\": " << (results.size() - okCount) << ",\n";
    f << "    \"fallbacks\": " << fallbacks << "\n";
    f << "  },\n";
    f << "  \"results\": [\n";

    for (size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        f << "    {\n";
        f << "      \"floor\": " << r.floorNumber << ",\n";
        f << "      \"seed\": " << r.seed << ",\n";
        f << "      \"ok\": " << (r.ok ? "true" : "false") << ",\n";
        f << "      \"layout\": \"" << jsonEscape(floorLayoutName(r.report.layout)) << "\",\n";
        f << "      \"attempts\": " << r.report.attempts << ",\n";
        f << "      \"fallback\": " << (r.report.usedFallback ? "true" : "false") << ",\n";
        f << "      \"fixedRoom\": " << (r.report.usedFixedRoom ? "true" : "false") << ",\n";
        f << "      \"connected\": " << (r.connected ? "true" : "false") << ",\n";
        f << "      \"deterministic\": " << (r.deterministic ? "true" : "false") << ",\n";
        f << "      \"hash\": \"" << jsonEscape(hex64(r.hash)) << "\",\n";
        f << "      \"summary\": \"" << jsonEscape(r.summary) << "\",\n";

        f << "      \"failures\": [";
        for (size_t k = 0; k < r.report.failures.size(); ++k) {
            if (k) f << ", ";
            f << "\"" << genFailureName(r.report.failures[k]) << "\"";
        }
        f << "],\n";

        f << "      \"warnings\": [";
        for (size_t k = 0; k < r.report.warnings.size(); ++k) {
            if (k) f << ", ";
            f << "\"" << jsonEscape(r.report.warnings[k]) << "\"";
        }
        f << "]\n";

        f << "    }";
        if (i + 1 < results.size()) f << ",";
        f << "\n";
    }

    f << "  ]\n";
    f << "}\n";
    return true;
}

} // namespace

int main(int argc, char** argv) {
    uint32_t seed = 1;
    uint32_t floorNumber = 1;
    uint32_t batch = 0;
    uint32_t fixedRoomId = 0;
    uint32_t maxAttempts = 10;
    bool haveFixedRoomId = false;
    bool haveLayout = false;
    FloorLayout layout = FloorLayout::Standard;
    int ascii = -1; // -1 = auto
    std::filesystem::path propsPath;
    std::filesystem::path fixedRoomsPath;
    std::filesystem::path jsonReport;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (a == "--version" || a == "-v") {
            std::cout << FLOORFORGE_APPNAME << " " << FLOORFORGE_VERSION << "\n";
            return 0;
        } else if (a == "--seed" || a == "--floor" || a == "--batch" ||
                   a == "--fixed-room" || a == "--max-attempts") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << a << " requires a value\n";
                return 2;
            }
            uint32_t n = 0;
            if (!parseU32(v, n)) {
                std::cerr << "Invalid " << a << ": " << v << "\n";
                return 2;
            }
            if (a == "--seed") seed = n;
            else if (a == "--floor") floorNumber = n;
            else if (a == "--batch") batch = n;
            else if (a == "--max-attempts") maxAttempts = n;
            else {
                fixedRoomId = n;
                haveFixedRoomId = true;
            }
        } else if (a == "--layout") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--layout requires a name\n";
                return 2;
            }
            if (!parseFloorLayout(v, layout)) {
                std::cerr << "Unknown layout: " << v << "\n";
                return 2;
            }
            haveLayout = true;
        } else if (a == "--props") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--props requires a path\n";
                return 2;
            }
            propsPath = v;
        } else if (a == "--fixed-rooms") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--fixed-rooms requires a path\n";
                return 2;
            }
            fixedRoomsPath = v;
        } else if (a == "--ascii") {
            ascii = 1;
        } else if (a == "--no-ascii") {
            ascii = 0;
        } else if (a == "--json-report") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--json-report requires a path\n";
                return 2;
            }
            jsonReport = v;
        } else if (a == "--write-default-props") {
            std::string v;
            if (!argValue(i, argc, argv, v)) {
                std::cerr << "--write-default-props requires a path\n";
                return 2;
            }
            if (!writeDefaultFloorPropertiesIni(v)) {
                std::cerr << "Failed to write " << v << "\n";
                return 1;
            }
            std::cout << "Wrote " << v << "\n";
            return 0;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    FloorProperties props;
    if (!propsPath.empty()) {
        std::string warns;
        bool clean = false;
        if (!loadFloorPropertiesIni(propsPath.string(), props, &warns, &clean)) {
            std::cerr << "Failed to load floor properties: " << propsPath.string() << "\n";
            if (!warns.empty()) std::cerr << warns << "\n";
            return 1;
        }
        if (!clean) std::cerr << propsPath.string() << ": some lines were ignored\n" << warns;
    }
    if (haveLayout) props.layout = layout;
    if (haveFixedRoomId) props.fixedRoomId = static_cast<int>(fixedRoomId);

    FixedRoomCatalog catalog;
    if (!fixedRoomsPath.empty()) {
        std::string warns;
        if (!loadFixedRoomCatalogFile(fixedRoomsPath.string(), catalog, &warns)) {
            std::cerr << warns << "\n";
            return 1;
        }
        if (!warns.empty()) std::cerr << warns;
    }

    GeneratorOptions opt;
    opt.maxAttempts = static_cast<int>(maxAttempts);

    std::vector<FloorRunResult> results;

    if (batch == 0) {
        Floor floor;
        FloorRunResult rr = runOne(props, &catalog, opt, seed, floorNumber, false, &floor);
        results.push_back(rr);

        for (const auto& w : rr.report.warnings) std::cerr << "warning: " << w << "\n";
        if (ascii != 0) std::cout << floorToAscii(floor);
        std::cout << "Floor " << floorNumber << " seed=" << rr.seed
                  << " layout=" << floorLayoutName(rr.report.layout)
                  << " attempts=" << rr.report.attempts
                  << (rr.report.usedFallback ? " fallback" : "")
                  << (rr.report.usedFixedRoom ? " fixed-room" : "")
                  << " hash=" << hex64(rr.hash) << "\n";
        std::cout << "  " << rr.summary << "\n";

        if (!jsonReport.empty()) {
            std::string jerr;
            if (!writeJsonReport(jsonReport, results, seed, props, &jerr)) {
                std::cerr << jerr << "\n";
            }
        }
        return rr.ok ? 0 : 1;
    }

    // Batch mode.
    size_t okCount = 0;
    for (uint32_t k = 0; k < batch; ++k) {
        Floor floor;
        FloorRunResult rr = runOne(props, &catalog, opt, seed, floorNumber + k, true, &floor);
        results.push_back(rr);

        if (rr.ok) {
            ++okCount;
            std::cout << "OK   floor=" << rr.floorNumber
                      << " layout=" << floorLayoutName(rr.report.layout)
                      << " attempts=" << rr.report.attempts
                      << (rr.report.usedFallback ? " fallback" : "")
                      << "\n";
        } else {
            std::cout << "FAIL floor=" << rr.floorNumber << " seed=" << rr.seed
                      << (rr.connected ? "" : " disconnected")
                      << (rr.deterministic ? "" : " nondeterministic")
                      << (rr.complete ? "" : " incomplete")
                      << "\n";
            for (const auto& w : rr.report.warnings) std::cout << "     " << w << "\n";
        }
        if (ascii == 1) std::cout << floorToAscii(floor);
    }

    const size_t total = results.size();
    const size_t failed = total - okCount;
    std::cout << "Summary: total=" << total << " ok=" << okCount << " failed=" << failed << "\n";

    if (!jsonReport.empty()) {
        std::string jerr;
        if (!writeJsonReport(jsonReport, results, seed, props, &jerr)) {
            std::cerr << jerr << "\n";
        }
    }

    return (failed == 0) ? 0 : 1;
}
