#pragma once

/**
 * @brief Window configuration structure containing basic window dimensions
 */
struct WindowConfig {
    int screen_width;  ///< Screen width in pixels
    int screen_height; ///< Screen height in pixels
    int panel_width;   ///< Control panel width in pixels
};
