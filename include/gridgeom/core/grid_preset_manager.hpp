/**
 * @fileoverview grid_preset_manager.hpp
 * @brief Maintains a list of named grid presets and creates grid providers from them.
 */

#ifndef GRIDGEOM_GRID_PRESET_MANAGER_HPP
#define GRIDGEOM_GRID_PRESET_MANAGER_HPP

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gridgeom/core/grid_config.hpp"
#include "gridgeom/grid/i_grid_provider.hpp"

/**
 * @brief Named grid setups commonly used by scenes.
 */
enum class GridPreset {
    SQUARE_5FT,
    HEX_ROWS_5FT,
    HEX_COLUMNS_5FT,
    GRIDLESS
};

/**
 * @class GridPresetManager
 * @brief Catalog of available grid presets and a factory to create grids.
 */
class GridPresetManager {
 public:
  /**
   * @brief Builds an internal list of all available presets.
   */
  void buildPresetList();

  /**
   * @brief Returns the list of presets built by buildPresetList().
   * @return A constant reference to the preset list.
   */
  const std::vector<std::pair<GridPreset, std::string>>& getPresetList() const;

  /**
   * @brief Sets the preset that is considered current.
   * @param preset The chosen preset.
   */
  void setCurrentPreset(GridPreset preset);

  /**
   * @brief Returns the currently selected preset.
   */
  GridPreset getCurrentPreset() const;

  /**
   * @brief Advances the current preset to the next one in the list, wrapping around.
   * @return The new current preset.
   */
  GridPreset cyclePreset();

  static std::string getPresetName(GridPreset preset);

  /**
   * @brief Configuration of a preset, using the given rule for diagonals.
   */
  static GridConfig configFor(GridPreset preset,
                              GridGeom::DiagonalRule diagonals = GridGeom::DiagonalRule::EQUIDISTANT);

  /**
   * @brief Creates the grid provider matching a configuration's grid type.
   * @param cfg Grid configuration; validated before construction.
   * @return A unique_ptr to a newly constructed grid.
   */
  static std::unique_ptr<GridGeom::IGridProvider> createGrid(const GridConfig& cfg);

 private:
  std::vector<std::pair<GridPreset, std::string>> presetList;
  GridPreset currentPreset = GridPreset::SQUARE_5FT;
};

#endif // GRIDGEOM_GRID_PRESET_MANAGER_HPP
