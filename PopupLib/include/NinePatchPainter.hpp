#ifndef NINEPATCHPAINTER_HPP
#define NINEPATCHPAINTER_HPP

#include <QImage>
#include <QPixmap>
#include <QString>

#include "PopupPainter.hpp"

/**
 * @brief Border-image painter driven by a nine-patch image.
 *
 * The image carries a one pixel guide frame:
 *  - top / left rows: opaque pixels mark the stretchable region
 *  - bottom / right rows: opaque pixels mark the content region (optional)
 *
 * Everything outside the stretchable region is drawn unscaled at the
 * corners and edges of the target rectangle.
 */
class NinePatchPainter : public PopupPainter
{
public:
    /**
     * @brief Loads and parses the nine-patch image at @p path.
     *
     * @throws std::runtime_error if the image cannot be loaded or has no
     *         stretch markers.
     */
    explicit NinePatchPainter(const QString& path);

    /// Builds the painter from an already loaded image.
    explicit NinePatchPainter(const QImage& image);

    void     paint(QPainter& painter, const QRect& rect) const override;
    QMargins padding() const override;

    /// Unscaled border sizes used when drawing.
    QMargins borders() const noexcept
    {
        return m_borders;
    }

private:
    void parse(const QImage& image);

    QPixmap  m_pixmap;
    QMargins m_borders;
    QMargins m_padding;
};

#endif // NINEPATCHPAINTER_HPP
