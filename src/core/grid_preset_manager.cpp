/**
 * @fileoverview grid_preset_manager.cpp
 * @brief Implementation of GridPresetManager.
 */

#include <stdexcept>

#include "gridgeom/core/grid_preset_manager.hpp"
#include "gridgeom/grid/hex_grid.hpp"
#include "gridgeom/grid/square_grid.hpp"

using GridGeom::DiagonalRule;
using GridGeom::GridType;

void GridPresetManager::buildPresetList() {
  presetList.clear();
  for (auto p : {GridPreset::SQUARE_5FT, GridPreset::HEX_ROWS_5FT,
                 GridPreset::HEX_COLUMNS_5FT, GridPreset::GRIDLESS}) {
    presetList.emplace_back(p, getPresetName(p));
  }
}

const std::vector<std::pair<GridPreset, std::string>>&
GridPresetManager::getPresetList() const {
  return presetList;
}

void GridPresetManager::setCurrentPreset(GridPreset preset) {
  currentPreset = preset;
}

GridPreset GridPresetManager::getCurrentPreset() const {
  return currentPreset;
}

GridPreset GridPresetManager::cyclePreset() {
  if (presetList.empty()) {
    buildPresetList();
  }
  for (std::size_t i = 0; i < presetList.size(); ++i) {
    if (presetList[i].first == currentPreset) {
      currentPreset = presetList[(i + 1) % presetList.size()].first;
      return currentPreset;
    }
  }
  currentPreset = presetList.front().first;
  return currentPreset;
}

std::string GridPresetManager::getPresetName(GridPreset preset) {
  switch (preset) {
    case GridPreset::SQUARE_5FT:      return "SQUARE_5FT";
    case GridPreset::HEX_ROWS_5FT:    return "HEX_ROWS_5FT";
    case GridPreset::HEX_COLUMNS_5FT: return "HEX_COLUMNS_5FT";
    case GridPreset::GRIDLESS:        return "GRIDLESS";
  }
  throw std::invalid_argument("Unknown grid preset " + std::to_string(static_cast<int>(preset)));
}

GridConfig GridPresetManager::configFor(GridPreset preset, DiagonalRule diagonals) {
  GridConfig cfg;
  cfg.size = 100.0;
  cfg.distance = 5.0;
  cfg.diagonals = diagonals;

  switch (preset) {
    case GridPreset::SQUARE_5FT:
      cfg.type = GridType::SQUARE;
      return cfg;

    case GridPreset::HEX_ROWS_5FT:
      cfg.type = GridType::HEX;
      cfg.hexColumns = false;
      return cfg;

    case GridPreset::HEX_COLUMNS_5FT:
      cfg.type = GridType::HEX;
      cfg.hexColumns = true;
      return cfg;

    case GridPreset::GRIDLESS:
      cfg.type = GridType::GRIDLESS;
      return cfg;
  }
  throw std::invalid_argument("Unknown grid preset " + std::to_string(static_cast<int>(preset)));
}

std::unique_ptr<GridGeom::IGridProvider> GridPresetManager::createGrid(const GridConfig& cfg) {
  validateGridConfig(cfg);
  switch (cfg.type) {
    case GridType::SQUARE:
      return std::make_unique<GridGeom::SquareGrid>(cfg);

    case GridType::HEX:
      return std::make_unique<GridGeom::HexGrid>(cfg);

    case GridType::GRIDLESS:
      return std::make_unique<GridGeom::GridlessGrid>(cfg);
  }
  throw std::invalid_argument("Unknown grid type " + std::to_string(static_cast<int>(cfg.type)));
}
