#include <gtest/gtest.h>

#include <QImage>
#include <QPainter>
#include <stdexcept>

#include "Config.hpp"
#include "NinePatchPainter.hpp"
#include "PopupManager.hpp"

namespace
{
    // Transparent image with stretch markers on the top row and left column.
    QImage markedImage(int width, int height, int x0, int x1, int y0, int y1)
    {
        QImage image(width, height, QImage::Format_ARGB32);
        image.fill(Qt::transparent);
        for (int x = x0; x <= x1; ++x)
            image.setPixel(x, 0, qRgba(0, 0, 0, 255));
        for (int y = y0; y <= y1; ++y)
            image.setPixel(0, y, qRgba(0, 0, 0, 255));
        return image;
    }

} // namespace

class NinePatchPainterTest : public ::testing::Test
{
protected:
    // Registers the resource file
    PopupManager manager;
};

TEST_F(NinePatchPainterTest, ParsesBuiltInImage)
{
    NinePatchPainter painter(config::popupStyleResource("bordered"));

    EXPECT_EQ(painter.borders(), QMargins(7, 7, 7, 7));
    EXPECT_EQ(painter.padding(), QMargins(4, 4, 4, 4));
}

TEST_F(NinePatchPainterTest, PaddingDefaultsToBordersWithoutContentMarkers)
{
    // 12x12 image, 10x10 inside the guide frame
    NinePatchPainter painter(markedImage(12, 12, 4, 6, 2, 8));

    EXPECT_EQ(painter.borders(), QMargins(3, 1, 4, 2));
    EXPECT_EQ(painter.padding(), painter.borders());
}

TEST_F(NinePatchPainterTest, ContentMarkersDefinePadding)
{
    QImage image = markedImage(12, 12, 4, 6, 2, 8);
    for (int x = 2; x <= 9; ++x)
        image.setPixel(x, 11, qRgba(0, 0, 0, 255));
    for (int y = 3; y <= 5; ++y)
        image.setPixel(11, y, qRgba(0, 0, 0, 255));

    NinePatchPainter painter(image);

    EXPECT_EQ(painter.padding(), QMargins(1, 2, 1, 5));
}

TEST_F(NinePatchPainterTest, InvalidImagesThrow)
{
    EXPECT_THROW(NinePatchPainter{QString(":/popup/missing.9.png")}, std::runtime_error);
    EXPECT_THROW(NinePatchPainter{QImage()}, std::runtime_error);
    EXPECT_THROW(NinePatchPainter(markedImage(12, 12, 1, 0, 1, 0)), std::runtime_error);
    EXPECT_THROW(NinePatchPainter(markedImage(2, 2, 1, 0, 1, 0)), std::runtime_error);
}

TEST_F(NinePatchPainterTest, StretchesCenterAcrossTarget)
{
    NinePatchPainter painter(config::popupStyleResource("bordered"));

    QImage target(120, 80, QImage::Format_ARGB32_Premultiplied);
    target.fill(Qt::transparent);
    {
        QPainter p(&target);
        painter.paint(p, target.rect());
    }

    EXPECT_EQ(target.pixel(60, 40), qRgba(245, 245, 248, 255));
    EXPECT_EQ(target.pixel(0, 0), qRgba(0, 0, 0, 0));
}
