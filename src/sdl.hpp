#pragma once

// Single place the viewer pulls in SDL.
// SDL_MAIN_HANDLED keeps SDL from renaming main() to SDL_main, so the viewer links
// without SDLmain; SDL_SetMainReady() is called before SDL_Init() instead.
#ifndef SDL_MAIN_HANDLED
#define SDL_MAIN_HANDLED
#endif

#include <SDL.h>
