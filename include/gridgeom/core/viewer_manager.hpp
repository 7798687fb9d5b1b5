/**
 * @fileoverview viewer_manager.hpp
 * @brief High-level controller for the path viewer: input, measurement and drawing.
 */

#pragma once

#include <memory>

#include <entt/entt.hpp>

#include "gridgeom/core/grid_preset_manager.hpp"
#include "gridgeom/measure/grid_measurer.hpp"
#include "gridgeom/rendering/path_renderer.hpp"

/**
 * @class ViewerManager
 * @brief Owns the grid, the token registry and the renderer, and runs the main loop.
 *
 * Controls:
 * - Left click: add a waypoint at the pending elevation
 * - Right click: move the token to the cursor and clear its waypoints
 * - Up / Down: raise or lower the pending elevation by one step
 * - 1 to 8: select a diagonal rule
 * - G: cycle the grid preset
 * - Backspace: remove the last waypoint
 * - Escape: quit
 */
class ViewerManager {
 public:
  ViewerManager();

  /**
   * @brief Opens the window and builds the initial grid and token.
   * @return true on success, false otherwise.
   */
  bool init();

  /**
   * @brief Runs the event/render loop until the window closes.
   */
  void run();

  /**
   * @brief Processes window events for the current frame.
   * @return false if the viewer should quit, true otherwise.
   */
  bool handleEvents();

  void render();

  /**
   * @brief Rebuilds the grid for a preset, keeping the current rule.
   */
  void selectPreset(GridPreset preset);

  /**
   * @brief Rebuilds the grid with a new diagonal rule.
   */
  void selectRule(GridGeom::DiagonalRule rule);

  void addWaypoint(double x, double y);
  void removeLastWaypoint();
  void placeToken(double x, double y);

  /**
   * @brief Re-measures the token and prints the result to stdout.
   */
  void remeasure();

  PathRenderer renderer;
  GridPresetManager presetManager;
  entt::registry registry;

 private:
  std::unique_ptr<GridGeom::IGridProvider> grid;
  std::unique_ptr<GridGeom::GridMeasurer> measurer;
  entt::entity token;
  GridGeom::DiagonalRule rule;
  int pendingElevation;
  bool running;

  void rebuildGrid();
};
