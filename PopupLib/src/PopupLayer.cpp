#include "PopupLayer.hpp"

#include <QChildEvent>
#include <QRegion>
#include <QResizeEvent>

#include "Popup.hpp"

namespace
{
    QPoint clampInside(const QRect& bounds, const QSize& size, QPoint pos)
    {
        pos.setX(qMax(bounds.left(), qMin(pos.x(), bounds.right() + 1 - size.width())));
        pos.setY(qMax(bounds.top(), qMin(pos.y(), bounds.bottom() + 1 - size.height())));
        return pos;
    }

} // namespace

PopupLayer::PopupLayer(QWidget* parent) : QWidget(parent)
{
    setAttribute(Qt::WA_NoSystemBackground);
    setAttribute(Qt::WA_TranslucentBackground);
    setFocusPolicy(Qt::NoFocus);
    updateInputRegion();
}

PopupLayer::~PopupLayer()
{
    // Popups that came from inside our window go down with it; anything owned
    // elsewhere must outlive the layer
    QWidget* root = parentWidget();
    for (Popup* popup : popups())
    {
        QWidget* previous = m_previousParents.value(popup);
        if (root && previous && (previous == root || root->isAncestorOf(previous)))
            continue;
        release(popup);
    }
}

void PopupLayer::showPopup(Popup* popup)
{
    Q_ASSERT(popup);

    adopt(popup);

    if (!popup->testAttribute(Qt::WA_Resized))
        popup->adjustSize();

    QPoint pos = popup->pos();
    if (QWidget* invoker = popup->invoker())
        pos = mapFromGlobal(invoker->mapToGlobal(popup->invokerOffset()));

    popup->move(clampInside(rect(), popup->size(), pos));
    popup->show();
    popup->raise();

    updateInputRegion();
}

void PopupLayer::hideAllPopups()
{
    for (Popup* popup : popups())
    {
        if (!popup->isHidden())
            popup->hidePopup();
    }
}

QList<Popup*> PopupLayer::popups() const
{
    QList<Popup*> result;
    for (QObject* child : children())
    {
        if (Popup* popup = qobject_cast<Popup*>(child))
            result.push_back(popup);
    }
    return result;
}

bool PopupLayer::hasVisiblePopups() const
{
    for (const Popup* popup : popups())
    {
        if (!popup->isHidden())
            return true;
    }
    return false;
}

void PopupLayer::releasePopups()
{
    for (Popup* popup : popups())
        release(popup);
}

void PopupLayer::adopt(Popup* popup)
{
    if (popup->parentWidget() != this)
    {
        m_previousParents.insert(popup, popup->parentWidget());
        popup->setParent(this);
        popup->installEventFilter(this);
    }
}

void PopupLayer::release(Popup* popup)
{
    popup->removeEventFilter(this);

    if (!popup->isHidden())
        popup->hidePopup();

    popup->setPainter(nullptr);
    popup->setParent(m_previousParents.take(popup).data());
}

bool PopupLayer::eventFilter(QObject* watched, QEvent* event)
{
    if (watched->parent() == this)
    {
        switch (event->type())
        {
            case QEvent::Show:
            case QEvent::Hide:
                popupVisibilityChanged();
                break;
            case QEvent::Move:
            case QEvent::Resize:
                updateInputRegion();
                break;
            default:
                break;
        }
    }
    return QWidget::eventFilter(watched, event);
}

void PopupLayer::childEvent(QChildEvent* event)
{
    QWidget::childEvent(event);

    if (event->removed())
    {
        event->child()->removeEventFilter(this);
        m_previousParents.remove(event->child());
        popupVisibilityChanged();
    }
}

void PopupLayer::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    layoutPopups();
}

void PopupLayer::layoutPopups()
{
    for (Popup* popup : popups())
        popup->move(clampInside(rect(), popup->size(), popup->pos()));

    updateInputRegion();
}

void PopupLayer::updateInputRegion()
{
    QRegion region;
    for (const Popup* popup : popups())
    {
        if (!popup->isHidden())
            region += popup->geometry();
    }

    // An empty mask means "no mask" to Qt, so let input fall through instead
    if (region.isEmpty())
    {
        clearMask();
        setAttribute(Qt::WA_TransparentForMouseEvents, true);
    }
    else
    {
        setAttribute(Qt::WA_TransparentForMouseEvents, false);
        setMask(region);
    }
}

void PopupLayer::popupVisibilityChanged()
{
    updateInputRegion();
}
