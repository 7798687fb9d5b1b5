/**
 * @file path_renderer.hpp
 * @brief Grid and path drawing using SFML
 *
 * This system handles:
 * - Square and hex grid lines
 * - Planned path cells, waypoint polylines and tokens
 * - Status text
 */

#ifndef GRIDGEOM_PATH_RENDERER_HPP
#define GRIDGEOM_PATH_RENDERER_HPP

#include <string>

#include <entt/entt.hpp>
#include <SFML/Graphics.hpp>

#include "gridgeom/grid/i_grid_provider.hpp"

class PathRenderer {
public:
    /**
     * @brief Constructs renderer with specified screen dimensions
     * @param screenWidth Width of render window in pixels
     * @param screenHeight Height of render window in pixels
     */
    PathRenderer(int screenWidth, int screenHeight);

    /**
     * @brief Opens the SFML window and loads the first font found
     *
     * A missing font only disables text.
     * @return true if the window opened, false otherwise
     */
    bool init();

    void clear();
    void present();

    /** @brief Draws the cell outlines of the grid; nothing for gridless scenes */
    void renderGrid(const GridGeom::IGridProvider& grid);

    /**
     * @brief Draws every token's planned cells, waypoint polyline and marker
     * @param registry Registry holding tokens with Position, Waypoints, PlannedPath
     * @param grid Grid the cells belong to
     */
    void renderPaths(const entt::registry& registry, const GridGeom::IGridProvider& grid);

    void renderText(const std::string& text, int x, int y, sf::Color color = sf::Color::White);

    bool isInitialized() const { return initialized; }

    sf::RenderWindow& getWindow() { return window; }

private:
    sf::RenderWindow window;
    sf::Font font;
    bool initialized;
    bool fontLoaded;
    int screenWidth;
    int screenHeight;

    void drawCell(const GridGeom::IGridProvider& grid, const GridGeom::Position& center,
                  sf::Color fill, sf::Color outline);
    void drawArrowhead(const GridGeom::Position& from, const GridGeom::Position& to, double length);
};

#endif
