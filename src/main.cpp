/**
 * @fileoverview main.cpp
 * @brief Entry point for the path viewer.
 *
 * Opens the viewer window and runs its loop until closed.
 */

#include <exception>
#include <iostream>

#include "gridgeom/core/viewer_manager.hpp"

int main() {
    ViewerManager viewer;
    try {
        if (!viewer.init()) {
            return 1;
        }
        viewer.run();
    } catch (const std::exception& e) {
        std::cerr << "Viewer stopped: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
