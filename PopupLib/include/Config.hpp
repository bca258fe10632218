#pragma once

#include <QString>

#include "ItemFactory.hpp"

class PopupPainter;

namespace config
{

    /**
     * @brief Register the built-in popup style painters into @p factory.
     *
     * Every style except PopupStyle::None is registered under its style name
     * and creates a NinePatchPainter from ":/popup/<name>.9.png".
     *
     * Typical usage:
     * @code
     * ItemFactory<PopupPainter> painters;
     * config::registerPopupStyles(painters);
     * @endcode
     */
    void registerPopupStyles(ItemFactory<PopupPainter>& factory);

    /// Resource path of the nine-patch image used for @p styleName.
    QString popupStyleResource(const std::string& styleName);

} // namespace config
