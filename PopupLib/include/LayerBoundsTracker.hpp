#ifndef LAYERBOUNDSTRACKER_HPP
#define LAYERBOUNDSTRACKER_HPP

#include <QObject>
#include <QPointer>

class QWidget;

/**
 * @brief Keeps a layer sized to its window root.
 *
 * Installed as an event filter on the root. On every resize of the root, and
 * on every window state change when the root is a top-level window, the layer
 * geometry is reset to (0, 0, root width, root height). When content children
 * are added to the root later on, the root's layers are restacked above them.
 *
 * The tracker is a child of the layer it tracks; destroying it (or the layer)
 * uninstalls the filter from the root.
 */
class LayerBoundsTracker : public QObject
{
    Q_OBJECT

public:
    LayerBoundsTracker(QWidget* root, QWidget* layer);
    ~LayerBoundsTracker() override;

    LayerBoundsTracker(const LayerBoundsTracker&)            = delete;
    LayerBoundsTracker& operator=(const LayerBoundsTracker&) = delete;

    /// Applies the root bounds to the layer and re-lays it out.
    void syncBounds();

    /// Stops tracking. Idempotent.
    void detach();

    bool tracksWindowState() const noexcept
    {
        return m_tracksWindowState;
    }

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    QPointer<QWidget> m_root;
    QPointer<QWidget> m_layer; // Not owned, parent of this tracker

    bool m_tracksWindowState = false;
};

#endif // LAYERBOUNDSTRACKER_HPP
