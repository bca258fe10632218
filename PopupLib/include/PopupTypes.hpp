// Public enums and constants shared by the popup
// layers, the manager and the application

#pragma once

#include <string>

/// Visual treatment of a popup border/background.
enum class PopupStyle
{
    None, // No painter at all
    Simple,
    Bordered,
    Light,
    Dark
};

/**
 * @brief Stacking depths used inside a window root.
 *
 * Children of a root without a depth tag are regular content and stay at
 * LayerDepth::Content. Higher depths are always stacked above lower ones.
 */
namespace LayerDepth
{
    constexpr int Content   = 0;
    constexpr int Popups    = 100;
    constexpr int Shade     = 200;
    constexpr int Transient = 400; // Drag images, tooltips, etc
} // namespace LayerDepth

/**
 * @brief Returns the lowercase style name used for painter registration
 *        and resource lookup (e.g. "bordered").
 */
std::string popupStyleName(PopupStyle style);
