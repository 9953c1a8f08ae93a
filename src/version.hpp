#pragma once

// Build/version info.
//
// CMake defines FLOORFORGE_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef FLOORFORGE_VERSION
#define FLOORFORGE_VERSION "dev"
#endif

#ifndef FLOORFORGE_APPNAME
#define FLOORFORGE_APPNAME "FloorForge"
#endif
