#pragma once

#include "dungeon.hpp"

#include <cstdint>
#include <string>

// Text views of a generated floor (for the CLI, tests and bug reports).
//
// Glyphs, highest priority first:
//   @ player  > stairs  } hidden stairs  M enemy  ^ trap  $ item (on a wall: buried)
//   X impassable wall  # wall  ~ water/lava  _ chasm
//   k shop floor  m Monster House floor  + junction  , hallway  . room floor
char tileGlyph(const Tile& t);

// One line per row, '\n' terminated.
std::string floorToAscii(const Floor& floor);

// FNV-1a 64 over dimensions, tiles and spawn records (in order).
uint64_t floorHash(const Floor& floor);

// "56x32 rooms=6 stairs=(x,y) items=.. traps=.. enemies=.. player=yes"
std::string floorSummaryLine(const Floor& floor);

std::string jsonEscape(const std::string& s);
