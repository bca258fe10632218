#include "Popup.hpp"

#include <QPainter>

#include "PopupPainter.hpp"

Popup::Popup(QWidget* parent) : QWidget(parent)
{
    setAttribute(Qt::WA_TranslucentBackground);
    setFocusPolicy(Qt::NoFocus);
    hide();
}

void Popup::setPopupStyle(std::optional<PopupStyle> style)
{
    m_style = style;
}

void Popup::setPainter(const PopupPainter* painter)
{
    if (m_painter == painter)
        return;

    m_painter = painter;
    setContentsMargins(m_painter ? m_painter->padding() : QMargins());
    update();
}

void Popup::setInvoker(QWidget* invoker, QPoint offset)
{
    m_invoker       = invoker;
    m_invokerOffset = offset;
}

bool Popup::transferFocus()
{
    for (QWidget* w = nextInFocusChain(); w && w != this; w = w->nextInFocusChain())
    {
        if (!isAncestorOf(w))
            continue;

        if (w->isEnabled() && w->isVisibleTo(this) && (w->focusPolicy() & Qt::TabFocus))
        {
            w->setFocus(Qt::PopupFocusReason);
            return true;
        }
    }
    return false;
}

void Popup::hidePopup()
{
    hide();
}

void Popup::paintEvent(QPaintEvent* event)
{
    if (!m_painter)
    {
        QWidget::paintEvent(event);
        return;
    }

    QPainter painter(this);
    m_painter->paint(painter, rect());
}

void Popup::showEvent(QShowEvent* event)
{
    QWidget::showEvent(event);
    emit popupShown();
}

void Popup::hideEvent(QHideEvent* event)
{
    QWidget::hideEvent(event);
    emit popupHidden();
}
