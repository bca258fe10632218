#include "NinePatchPainter.hpp"

#include <QPainter>
#include <qdrawutil.h>

#include "PopupUtilities.hpp"

namespace
{
    struct Span
    {
        int first = -1;
        int last  = -1;

        bool valid() const
        {
            return first >= 0;
        }
    };

    // Guide pixels are any pixel with alpha above half.
    bool isMarker(const QImage& image, int x, int y)
    {
        return qAlpha(image.pixel(x, y)) > 127;
    }

    Span rowSpan(const QImage& image, int y)
    {
        Span span;
        for (int x = 1; x < image.width() - 1; ++x)
        {
            if (isMarker(image, x, y))
            {
                if (!span.valid())
                    span.first = x - 1;
                span.last = x - 1;
            }
        }
        return span;
    }

    Span columnSpan(const QImage& image, int x)
    {
        Span span;
        for (int y = 1; y < image.height() - 1; ++y)
        {
            if (isMarker(image, x, y))
            {
                if (!span.valid())
                    span.first = y - 1;
                span.last = y - 1;
            }
        }
        return span;
    }

} // namespace

NinePatchPainter::NinePatchPainter(const QString& path)
{
    QImage image(path);
    if (image.isNull())
        throw util::popup_exception("Failed to load nine-patch image \"" + path.toStdString() + "\"");

    parse(image);
}

NinePatchPainter::NinePatchPainter(const QImage& image)
{
    if (image.isNull())
        throw util::popup_exception("Nine-patch image is empty");

    parse(image);
}

void NinePatchPainter::parse(const QImage& source)
{
    if (source.width() < 3 || source.height() < 3)
        throw util::popup_exception("Nine-patch image is smaller than its guide frame");

    const QImage image  = source.convertToFormat(QImage::Format_ARGB32);
    const int    innerW = image.width() - 2;
    const int    innerH = image.height() - 2;

    const Span stretchX = rowSpan(image, 0);
    const Span stretchY = columnSpan(image, 0);
    if (!stretchX.valid() || !stretchY.valid())
        throw util::popup_exception("Nine-patch image has no stretch markers");

    m_borders = QMargins(stretchX.first, stretchY.first, innerW - 1 - stretchX.last, innerH - 1 - stretchY.last);

    const Span contentX = rowSpan(image, image.height() - 1);
    const Span contentY = columnSpan(image, image.width() - 1);

    // Without content markers the contents sit inside the fixed borders
    m_padding = m_borders;
    if (contentX.valid())
    {
        m_padding.setLeft(contentX.first);
        m_padding.setRight(innerW - 1 - contentX.last);
    }
    if (contentY.valid())
    {
        m_padding.setTop(contentY.first);
        m_padding.setBottom(innerH - 1 - contentY.last);
    }

    m_pixmap = QPixmap::fromImage(image.copy(1, 1, innerW, innerH));
}

void NinePatchPainter::paint(QPainter& painter, const QRect& rect) const
{
    qDrawBorderPixmap(&painter, rect, m_borders, m_pixmap);
}

QMargins NinePatchPainter::padding() const
{
    return m_padding;
}
