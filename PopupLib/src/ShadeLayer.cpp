#include "ShadeLayer.hpp"

#include <QMouseEvent>
#include <QPainter>

#include "Popup.hpp"

ShadeLayer::ShadeLayer(QWidget* parent) : PopupLayer(parent)
{
    updateInputRegion();
}

void ShadeLayer::showPopup(Popup* popup, bool hfill, bool vfill)
{
    Q_ASSERT(popup);

    if (Popup* previous = hostedPopup(); previous && previous != popup && !previous->isHidden())
        previous->hidePopup();

    adopt(popup);

    m_popup = popup;
    m_hfill = hfill;
    m_vfill = vfill;

    layoutPopups();

    popup->show();
    popup->raise();

    updateInputRegion();
    update();
}

void ShadeLayer::setShadeOpacity(qreal opacity)
{
    m_shadeOpacity = qBound<qreal>(0.0, opacity, 1.0);
    update();
}

void ShadeLayer::layoutPopups()
{
    Popup* popup = hostedPopup();
    if (!popup)
        return;

    // Natural size is the size hint; popups without a layout keep their size
    QSize natural = popup->sizeHint();
    if (natural.isValid())
        natural = natural.expandedTo(popup->minimumSizeHint());
    else
        natural = popup->size();

    QSize bounds = natural.boundedTo(size());
    if (m_hfill)
        bounds.setWidth(width());
    if (m_vfill)
        bounds.setHeight(height());

    // Centre on the size actually applied, minimum sizes may exceed the layer
    popup->resize(bounds);
    const QSize actual = popup->size();
    popup->move(m_hfill ? 0 : qMax(0, (width() - actual.width()) / 2), m_vfill ? 0 : qMax(0, (height() - actual.height()) / 2));
}

void ShadeLayer::updateInputRegion()
{
    clearMask();
    setAttribute(Qt::WA_TransparentForMouseEvents, !hasVisiblePopups());
}

void ShadeLayer::popupVisibilityChanged()
{
    updateInputRegion();
    update();
}

void ShadeLayer::paintEvent(QPaintEvent*)
{
    if (!hasVisiblePopups())
        return;

    QPainter painter(this);
    painter.setOpacity(m_shadeOpacity);
    painter.fillRect(rect(), Qt::black);
}

void ShadeLayer::mousePressEvent(QMouseEvent* event)
{
    Popup* popup = hostedPopup();
    if (popup && !popup->isHidden() && !popup->geometry().contains(event->position().toPoint()))
    {
        if (popup->closeOnOuterAction())
            popup->hidePopup();
    }
    event->accept();
}

Popup* ShadeLayer::hostedPopup() const
{
    if (m_popup && m_popup->parentWidget() == this)
        return m_popup;
    return nullptr;
}
