#ifndef POPUPLAYER_HPP
#define POPUPLAYER_HPP

#include <QHash>
#include <QList>
#include <QPointer>
#include <QWidget>

class Popup;

/**
 * @brief Transparent full-window surface hosting non-modal popups.
 *
 * The layer covers its window root entirely but only takes mouse input where
 * a visible popup is, so the content below stays usable. Several popups can
 * be shown at once; the most recently shown one is on top.
 *
 * Popups are borrowed, not owned: a popup is reparented into the layer while
 * hosted and handed back to its previous parent by releasePopups().
 */
class PopupLayer : public QWidget
{
    Q_OBJECT

public:
    explicit PopupLayer(QWidget* parent = nullptr);
    ~PopupLayer() override;

    /**
     * @brief Adopts @p popup, places it and shows it above the other popups.
     *
     * A popup with an invoker is placed relative to that invoker; the result
     * is clamped inside the layer.
     */
    void showPopup(Popup* popup);

    /// Hides every popup hosted by this layer.
    void hideAllPopups();

    /// Popups currently hosted by this layer, bottom to top.
    QList<Popup*> popups() const;

    /// True if at least one hosted popup is visible.
    bool hasVisiblePopups() const;

    /**
     * @brief Hides every hosted popup and returns it to its previous parent.
     *
     * Released popups lose their painter, which belongs to the PopupManager.
     */
    void releasePopups();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void childEvent(QChildEvent* event) override;

    /// Adds @p popup as a child and starts tracking its geometry.
    void adopt(Popup* popup);

    /// Undoes adopt() for @p popup.
    void release(Popup* popup);

    /// Keeps hosted popups inside the layer after a resize.
    virtual void layoutPopups();

    /// Decides which part of the layer receives mouse input.
    virtual void updateInputRegion();

    /// Called after a hosted popup became visible or hidden.
    virtual void popupVisibilityChanged();

private:
    QHash<QObject*, QPointer<QWidget>> m_previousParents;
};

#endif // POPUPLAYER_HPP
