#ifndef POPUPPAINTER_HPP
#define POPUPPAINTER_HPP

#include <QMargins>

class QPainter;
class QRect;

/**
 * @brief Renders the border and background of a popup.
 *
 * Painters are created once per PopupStyle by the PopupManager and shared
 * by every popup using that style, so paint() must not keep per-popup state.
 */
class PopupPainter
{
public:
    virtual ~PopupPainter() = default;

    /// Paints the decoration into @p rect (popup local coordinates).
    virtual void paint(QPainter& painter, const QRect& rect) const = 0;

    /// Space the decoration occupies around the popup contents.
    virtual QMargins padding() const = 0;
};

#endif // POPUPPAINTER_HPP
