/**
 * @file sim_manager.hpp
 * @brief Main loop of the native viewer: input, stepping, drawing.
 */

#pragma once

#include "quadsim/arch/native/renderer_native.hpp"
#include "quadsim/core/simulator.hpp"

class SimManager {
public:
    explicit SimManager(const SimConfig& config);

    /**
     * @brief Opens the window
     * @return false if the renderer failed to initialize
     */
    bool init();

    /** @brief Runs until the window closes or Escape is pressed */
    void run();

private:
    bool handleEvents();
    void applyPlayerInput();
    void render();

    Simulator simulator;
    Renderer renderer;
    bool running = true;
    bool paused = false;
    bool showTree = true;
};
