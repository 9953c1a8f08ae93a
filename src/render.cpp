#include "render.hpp"
#include "version.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

struct Rgb {
    uint8_t r, g, b;
};

Rgb terrainColor(const Tile& t) {
    switch (t.terrain) {
        case Terrain::Wall:
            return t.has(TF_Impassable) ? Rgb{ 18, 18, 22 } : Rgb{ 58, 52, 48 };
        case Terrain::Secondary:
            return Rgb{ 40, 90, 170 };
        case Terrain::Chasm:
            return Rgb{ 6, 6, 10 };
        case Terrain::Floor:
            break;
    }
    if (t.has(TF_KecleonShop)) return Rgb{ 150, 120, 60 };
    if (t.has(TF_MonsterHouse)) return Rgb{ 120, 60, 60 };
    if (!t.inRoom()) return Rgb{ 110, 110, 100 };
    return Rgb{ 150, 150, 140 };
}

bool spawnColor(const Tile& t, Rgb& out) {
    if (t.has(TF_SpawnPlayer))       { out = Rgb{ 240, 240, 80 };  return true; }
    if (t.has(TF_SpawnStairs))       { out = Rgb{ 80, 230, 230 };  return true; }
    if (t.has(TF_SpawnHiddenStairs)) { out = Rgb{ 200, 110, 240 }; return true; }
    if (t.has(TF_SpawnEnemy))        { out = Rgb{ 230, 60, 60 };   return true; }
    if (t.has(TF_SpawnTrap))         { out = Rgb{ 240, 140, 40 };  return true; }
    if (t.has(TF_SpawnItem))         { out = Rgb{ 90, 210, 90 };   return true; }
    return false;
}

} // namespace

FloorRenderer::FloorRenderer(int windowW, int windowH, int tileSize, bool vsync)
    : winW(windowW), winH(windowH), tile(tileSize), vsyncEnabled(vsync) {}

FloorRenderer::~FloorRenderer() {
    shutdown();
}

bool FloorRenderer::init() {
    if (initialized) return true;

    SDL_SetHint(SDL_HINT_RENDER_SCALE_QUALITY, "0"); // nearest-neighbor

    const std::string title = std::string(FLOORFORGE_APPNAME) + " v" + FLOORFORGE_VERSION;
    window = SDL_CreateWindow(title.c_str(),
                              SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              winW, winH,
                              SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (!window) {
        std::cerr << "SDL_CreateWindow failed: " << SDL_GetError() << "\n";
        return false;
    }

    Uint32 rFlags = SDL_RENDERER_ACCELERATED;
    if (vsyncEnabled) rFlags |= SDL_RENDERER_PRESENTVSYNC;
    renderer = SDL_CreateRenderer(window, -1, rFlags);
    if (!renderer) {
        std::cerr << "SDL_CreateRenderer failed: " << SDL_GetError() << "\n";
        SDL_DestroyWindow(window); window = nullptr;
        return false;
    }

    // Fixed virtual resolution; SDL scales to the actual window.
    SDL_RenderSetLogicalSize(renderer, winW, winH);
    SDL_RenderSetIntegerScale(renderer, SDL_TRUE);

    initialized = true;
    return true;
}

void FloorRenderer::shutdown() {
    if (renderer) { SDL_DestroyRenderer(renderer); renderer = nullptr; }
    if (window) { SDL_DestroyWindow(window); window = nullptr; }
    initialized = false;
}

void FloorRenderer::setTitle(const std::string& text) {
    if (!window) return;
    const std::string title = std::string(FLOORFORGE_APPNAME) + " - " + text;
    SDL_SetWindowTitle(window, title.c_str());
}

void FloorRenderer::fillTile(int x, int y, int inset, uint8_t r, uint8_t g, uint8_t b) {
    SDL_Rect rc{ x * tile + inset, y * tile + inset, tile - inset * 2, tile - inset * 2 };
    if (rc.w <= 0 || rc.h <= 0) return;
    SDL_SetRenderDrawColor(renderer, r, g, b, 255);
    SDL_RenderFillRect(renderer, &rc);
}

void FloorRenderer::render(const Floor& floor, bool showJunctions) {
    if (!initialized) return;

    SDL_SetRenderDrawColor(renderer, 0, 0, 0, 255);
    SDL_RenderClear(renderer);

    const TileGrid& g = floor.grid;
    const int markerInset = std::max(1, tile / 4);

    for (int y = 0; y < g.height; ++y) {
        for (int x = 0; x < g.width; ++x) {
            const Tile& t = g.at(x, y);
            const Rgb c = terrainColor(t);
            fillTile(x, y, 0, c.r, c.g, c.b);

            if (showJunctions && t.has(TF_Junction)) {
                fillTile(x, y, markerInset + 1, 220, 220, 220);
            }
            if (t.has(TF_Unreachable)) {
                fillTile(x, y, markerInset, 255, 0, 255);
            }

            Rgb s{};
            if (spawnColor(t, s)) fillTile(x, y, markerInset, s.r, s.g, s.b);
        }
    }

    SDL_RenderPresent(renderer);
}

std::string FloorRenderer::saveScreenshotBMP(const std::string& directory, const std::string& prefix) const {
    namespace fs = std::filesystem;
    if (!renderer) return {};

    std::error_code ec;
    if (!directory.empty()) {
        fs::create_directories(fs::path(directory), ec);
    }

    std::time_t t = std::time(nullptr);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    tm = *std::localtime(&t);
#endif

    std::ostringstream name;
    name << prefix << "_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".bmp";

    const fs::path outPath = directory.empty() ? fs::path(name.str()) : fs::path(directory) / name.str();

    int w = 0, h = 0;
    if (SDL_GetRendererOutputSize(renderer, &w, &h) != 0) {
        w = winW;
        h = winH;
    }

    SDL_Surface* surface = SDL_CreateRGBSurfaceWithFormat(0, w, h, 32, SDL_PIXELFORMAT_RGBA32);
    if (!surface) return {};

    if (SDL_RenderReadPixels(renderer, nullptr, surface->format->format, surface->pixels, surface->pitch) != 0) {
        SDL_FreeSurface(surface);
        return {};
    }

    const int rc = SDL_SaveBMP(surface, outPath.string().c_str());
    SDL_FreeSurface(surface);
    if (rc != 0) return {};
    return outPath.string();
}
