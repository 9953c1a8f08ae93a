#pragma once
#include "sdl.hpp"

#include "dungeon.hpp"

#include <cstdint>
#include <string>

// Flat-colored floor preview. One filled square per tile, with spawn markers
// drawn as smaller squares on top.
class FloorRenderer {
public:
    FloorRenderer(int windowW, int windowH, int tileSize, bool vsync);
    ~FloorRenderer();

    FloorRenderer(const FloorRenderer&) = delete;
    FloorRenderer& operator=(const FloorRenderer&) = delete;

    bool init();
    void shutdown();

    void render(const Floor& floor, bool showJunctions);

    void setTitle(const std::string& text);

    // Saves a BMP of the current frame.
    // Returns the full path written, or an empty string on failure.
    std::string saveScreenshotBMP(const std::string& directory, const std::string& prefix = "floorforge_shot") const;

private:
    int winW = 0;
    int winH = 0;
    int tile = 12;
    bool vsyncEnabled = false;
    bool initialized = false;

    SDL_Window* window = nullptr;
    SDL_Renderer* renderer = nullptr;

    void fillTile(int x, int y, int inset, uint8_t r, uint8_t g, uint8_t b);
};
