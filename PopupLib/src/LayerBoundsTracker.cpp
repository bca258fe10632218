#include "LayerBoundsTracker.hpp"

#include <QEvent>
#include <QLayout>
#include <QWidget>

#include "LayerStack.hpp"

LayerBoundsTracker::LayerBoundsTracker(QWidget* root, QWidget* layer) :
    QObject(layer),
    m_root(root),
    m_layer(layer)
{
    Q_ASSERT(root);
    Q_ASSERT(layer);

    // Embedded roots have no window state of their own
    m_tracksWindowState = root->isWindow();

    m_root->installEventFilter(this);
}

LayerBoundsTracker::~LayerBoundsTracker()
{
    detach();
}

void LayerBoundsTracker::detach()
{
    if (m_root)
        m_root->removeEventFilter(this);

    m_root = nullptr;
}

void LayerBoundsTracker::syncBounds()
{
    if (!m_root || !m_layer)
        return;

    m_layer->setGeometry(0, 0, m_root->width(), m_root->height());

    if (QLayout* layout = m_layer->layout())
        layout->invalidate();
    m_layer->updateGeometry();
}

bool LayerBoundsTracker::eventFilter(QObject* watched, QEvent* event)
{
    if (watched == m_root)
    {
        switch (event->type())
        {
            case QEvent::Resize:
                syncBounds();
                break;
            case QEvent::WindowStateChange:
                if (m_tracksWindowState)
                    syncBounds();
                break;
            case QEvent::ChildPolished:
                LayerStack::restack(m_root);
                break;
            default:
                break;
        }
    }
    return QObject::eventFilter(watched, event);
}
