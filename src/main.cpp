#include "sdl.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "fixed_room.hpp"
#include "floor_dump.hpp"
#include "floor_generator.hpp"
#include "floor_props.hpp"
#include "render.hpp"
#include "rng.hpp"
#include "version.hpp"

static std::optional<uint32_t> parseSeedArg(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--seed" && i + 1 < argc) {
            char* end = nullptr;
            const unsigned long v = std::strtoul(argv[i + 1], &end, 0);
            if (end == argv[i + 1] || *end != '\0') return std::nullopt;
            return static_cast<uint32_t>(v);
        }
    }
    return std::nullopt;
}

static bool hasFlag(int argc, char** argv, const char* flag) {
    for (int i = 1; i < argc; ++i) {
        if (std::string(argv[i]) == flag) return true;
    }
    return false;
}

static std::optional<std::string> parseStringArg(int argc, char** argv, const char* opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == opt && i + 1 < argc) {
            return std::string(argv[i + 1]);
        }
    }
    return std::nullopt;
}

static void printUsage(const char* exe) {
    std::cout
        << FLOORFORGE_APPNAME << " viewer " << FLOORFORGE_VERSION << "\n"
        << "Usage: " << (exe ? exe : "floorforge_view") << " [options]\n\n"
        << "Options:\n"
        << "  --seed <n>           First seed to show\n"
        << "  --props <path>       Floor properties INI\n"
        << "  --fixed-rooms <path> Fixed room catalog file\n"
        << "  --tile <px>          Tile size in pixels (default 12)\n"
        << "\n"
        << "Keys: Space/N next seed, B previous seed, L cycle layout, J toggle junctions,\n"
        << "      F12 screenshot, Esc quit\n"
        << "\n"
        << "  --version, -v        Print version and exit\n"
        << "  --help, -h           Show this help and exit\n";
}

namespace {

FloorLayout nextLayout(FloorLayout l) {
    return static_cast<FloorLayout>((static_cast<int>(l) + 1) % FLOOR_LAYOUT_COUNT);
}

void regenerate(Floor& floor, const FloorProperties& props, const FixedRoomProvider* fixedRooms,
                uint32_t seed, FloorRenderer& view) {
    RNG rng(seed);
    FloorGenReport report;
    const bool ok = generateFloor(floor, props, rng, fixedRooms, &report);
    for (const auto& w : report.warnings) std::cerr << "warning: " << w << "\n";

    std::string title = "seed " + std::to_string(seed) + "  " + floorLayoutName(report.layout) +
                        "  attempts " + std::to_string(report.attempts);
    if (report.usedFallback) title += "  (fallback)";
    if (!ok) title += "  (incomplete)";
    view.setTitle(title);
    std::cout << title << "\n  " << floorSummaryLine(floor) << "\n";
}

} // namespace

int main(int argc, char** argv) {
    if (hasFlag(argc, argv, "--help") || hasFlag(argc, argv, "-h")) {
        printUsage(argc > 0 ? argv[0] : "floorforge_view");
        return 0;
    }
    if (hasFlag(argc, argv, "--version") || hasFlag(argc, argv, "-v")) {
        std::cout << FLOORFORGE_APPNAME << " " << FLOORFORGE_VERSION << "\n";
        return 0;
    }

    FloorProperties props;
    if (const auto p = parseStringArg(argc, argv, "--props")) {
        std::string warns;
        if (!loadFloorPropertiesIni(*p, props, &warns)) {
            std::cerr << "Failed to load floor properties: " << *p << "\n";
            return 1;
        }
        if (!warns.empty()) std::cerr << warns;
    }

    FixedRoomCatalog catalog;
    if (const auto p = parseStringArg(argc, argv, "--fixed-rooms")) {
        std::string warns;
        if (!loadFixedRoomCatalogFile(*p, catalog, &warns)) {
            std::cerr << warns << "\n";
            return 1;
        }
        if (!warns.empty()) std::cerr << warns;
    }

    int tilePx = 12;
    if (const auto t = parseStringArg(argc, argv, "--tile")) {
        tilePx = clampi(std::atoi(t->c_str()), 4, 32);
    }

    uint32_t seed = parseSeedArg(argc, argv).value_or(1u);

    SDL_SetMainReady();
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0) {
        std::cerr << "SDL_Init failed: " << SDL_GetError() << "\n";
        return 1;
    }

    // Window is sized for the largest floor so the layout can change without a resize.
    FloorRenderer view(FLOOR_MAX_WIDTH * tilePx, FLOOR_MAX_HEIGHT * tilePx, tilePx, true);
    if (!view.init()) {
        SDL_Quit();
        return 1;
    }

    Floor floor;
    regenerate(floor, props, &catalog, seed, view);

    bool running = true;
    bool showJunctions = true;
    bool dirty = true;

    while (running) {
        SDL_Event ev;
        while (SDL_PollEvent(&ev)) {
            switch (ev.type) {
                case SDL_QUIT:
                    running = false;
                    break;

                case SDL_WINDOWEVENT:
                    dirty = true;
                    break;

                case SDL_KEYDOWN:
                    switch (ev.key.keysym.sym) {
                        case SDLK_ESCAPE:
                            running = false;
                            break;
                        case SDLK_SPACE:
                        case SDLK_n:
                            ++seed;
                            regenerate(floor, props, &catalog, seed, view);
                            dirty = true;
                            break;
                        case SDLK_b:
                            --seed;
                            regenerate(floor, props, &catalog, seed, view);
                            dirty = true;
                            break;
                        case SDLK_l:
                            props.layout = nextLayout(props.layout);
                            regenerate(floor, props, &catalog, seed, view);
                            dirty = true;
                            break;
                        case SDLK_j:
                            showJunctions = !showJunctions;
                            dirty = true;
                            break;
                        case SDLK_F12: {
                            view.render(floor, showJunctions);
                            const std::string path = view.saveScreenshotBMP("");
                            if (path.empty()) std::cerr << "Screenshot failed: " << SDL_GetError() << "\n";
                            else std::cout << "Saved " << path << "\n";
                            break;
                        }
                        default:
                            break;
                    }
                    break;

                default:
                    break;
            }
        }

        if (dirty) {
            view.render(floor, showJunctions);
            dirty = false;
        }
        SDL_Delay(16);
    }

    view.shutdown();
    SDL_Quit();
    return 0;
}
