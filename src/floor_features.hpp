#pragma once

#include "dungeon.hpp"
#include "floor_props.hpp"
#include "rng.hpp"

// Feature generator
//
// Runs after junctions are resolved, in a fixed order:
//  1) maze rooms
//  2) secondary terrain (rivers, lakes, in-room structures)
//  3) room imperfections
//  4) extra hallways
//  5) Kecleon shop, then Monster House
// followed by the chasm conversions and the impassable-wall enforcement pass.

struct FeatureSummary {
    int mazeRooms = 0;
    int mazeObstacles = 0;
    int rivers = 0;
    int lakes = 0;
    int secondaryTiles = 0;
    int secondaryStructures = 0;
    int imperfectRooms = 0;
    int extraHallways = 0;
    int kecleonShopRoom = -1;
    int monsterHouseRoom = -1;
    int chasmTiles = 0;
};

// Obstacle placement used by mazes and in-room structures: secondary terrain when
// requested and the tile belongs to roomIndex, plain wall otherwise. Clears the
// junction flag.
void setTerrainObstacleChecked(TileGrid& grid, int x, int y, bool useSecondary, uint8_t roomIndex);

// Converts a passable wall to secondary terrain. Returns false (and changes nothing)
// for anything else, impassable tiles included.
bool setSecondaryTerrainOnWall(TileGrid& grid, int x, int y);

// One maze line: from start, repeatedly steps two tiles in a random direction whose
// midpoint and target are open and inside bounds, turning both into obstacles.
// Returns the number of obstacles placed.
int generateMazeLine(TileGrid& grid, const Recti& bounds, Vec2i start, bool useSecondary,
                     uint8_t roomIndex, RandomSource& rng);

// Fills a room (odd width and height) with maze lines grown from its surrounding wall
// and from interior posts. Passages stay connected.
int generateMaze(TileGrid& grid, const RoomInfo& room, bool useSecondary, RandomSource& rng);

// Grows a blob of up to `size` secondary tiles over passable walls around center.
int generateLake(TileGrid& grid, Vec2i center, int size, RandomSource& rng);

// `count` rivers from the top or bottom edge toward the opposite edge.
// Returns the number of tiles converted.
int generateSecondaryTerrainFormations(TileGrid& grid, int count, RandomSource& rng, FeatureSummary* summary = nullptr);

// Pools or checkerboards inside rooms tagged for them, at most `budget` rooms.
int generateSecondaryStructures(Floor& floor, int budget, RandomSource& rng);

// Trims corner strips and grows wall nubs on rooms tagged imperfect.
// Returns the number of rooms changed.
int generateRoomImperfections(Floor& floor, RandomSource& rng);

// Extra hallways dug from random room edges through solid wall until they hit
// another open area. Returns the number carved.
int generateExtraHallways(Floor& floor, int count, RandomSource& rng);

// Returns the room index used, or -1.
int generateKecleonShop(Floor& floor, int chancePct, RandomSource& rng);
int generateMonsterHouse(Floor& floor, int chancePct, RandomSource& rng);

// Flags every tile of the room and tags its RoomInfo. Returns the tiles flagged.
int markMonsterHouse(Floor& floor, uint8_t roomIndex);

int convertSecondaryTerrainToChasms(TileGrid& grid);
int convertWallsToChasms(TileGrid& grid);
int ensureImpassableTilesAreWalls(TileGrid& grid);

FeatureSummary applyFloorFeatures(Floor& floor, const FloorProperties& props, RandomSource& rng);
