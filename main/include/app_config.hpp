#pragma once

// Demo wiring; override with -D at build time.

#ifndef K_STRIP_GPIO
#define K_STRIP_GPIO 5
#endif

#ifndef K_STRIP_LEDS
#define K_STRIP_LEDS 60
#endif

// Cadence of TickScheduler::tick() in the main loop
#ifndef K_TICK_PERIOD_MS
#define K_TICK_PERIOD_MS 20
#endif

// How long each demo scene runs before the next one starts
#ifndef K_SCENE_PERIOD_MS
#define K_SCENE_PERIOD_MS 12000
#endif

// Segments of the breathing wave scene
#ifndef K_WAVE_SEGMENTS
#define K_WAVE_SEGMENTS 6
#endif

// Wire order of the strip's LEDs (device::ColorOrder)
#ifndef K_STRIP_COLOR_ORDER
#define K_STRIP_COLOR_ORDER device::ColorOrder::GRB
#endif
