// BlockRoll - roll a 1x2x1 block across a tile board until it stands in the hole
// Build: cmake -S . -B build && cmake --build build   (links -lGL -lGLU -lglut)

#ifndef BLOCKROLL_CONFIG_HPP
#define BLOCKROLL_CONFIG_HPP

// ============================================================================
// CONFIG MODULE
// ============================================================================

namespace Config {
    // Window / camera
    const int WINDOW_W = 960;
    const int WINDOW_H = 640;
    const int WINDOW_POS_X = 100;
    const int WINDOW_POS_Y = 100;
    const double FRUSTUM_SIZE = 10.0;
    const double CAMERA_NEAR = 1.0;
    const double CAMERA_FAR = 500.0;
    const double CAMERA_OFFSET_X = -7.0;
    const double CAMERA_OFFSET_Y = 20.0;
    const double CAMERA_OFFSET_Z = 25.0;

    // Block / tiles
    const double BLOCK_HALF_HEIGHT = 1.0;   // standing block centre height
    const double TILE_THICKNESS = 0.2;
    const double CLIP_PLANE_DEPTH = 0.2;    // block is hidden below y = -0.2

    // Rolls
    const double ROLL_ANGLE_DEG = 90.0;
    const double BOUNCE_ANGLE_DEG = 30.0;
    const int ROLL_STEPS = 18;
    const int ROLL_STEP_MS = 15;
    const int BOUNCE_STEPS = 18;            // per half (forward, then back)
    const int BOUNCE_STEP_MS = 10;

    // Win sequence
    const int WIN_DELAY_MS = 50;
    const int WIN_STEP_MS = 30;
    const double WIN_SINK_STEP = 0.1;
    const double WIN_SINK_FLOOR = -0.9;
    const int WIN_TRANSITION_DELAY_MS = 100;

    // Level transition
    const int FADE_STEPS = 20;              // per half (out, then in)
    const int FADE_STEP_MS = 25;

    // Input / loop
    const int MENU_LOCK_MS = 1000;
    const int TICK_MS = 15;
    const double GEOMETRY_EPSILON = 1e-9;
}

#endif
