#ifndef POPUPMANAGER_HPP
#define POPUPMANAGER_HPP

#include <QHash>
#include <QObject>
#include <QPointer>
#include <memory>
#include <unordered_map>

#include "ItemFactory.hpp"
#include "PopupLayer.hpp"
#include "PopupPainter.hpp"
#include "PopupTypes.hpp"
#include "ShadeLayer.hpp"

class Popup;
class QWidget;

/**
 * @brief Registry of popup layers per window root.
 *
 * The PopupManager lazily installs one PopupLayer (non-modal popups) and one
 * ShadeLayer (modal popups) into each window root it is asked about, keeps them
 * sized to the root and coordinates modal/non-modal display:
 *
 * - showPopup() stacks a popup on the window's PopupLayer
 * - showModalPopup() hides everything shown for the window and shows the popup
 *   alone on the window's ShadeLayer
 *
 * A window root is a top-level widget, or a widget explicitly marked with
 * setPopupRoot() (e.g. a panel embedded in another toolkit surface).
 *
 * Layers are deleted by releaseWindow(), by the manager's destructor, or with
 * their window. In the last case the registry entries are dropped
 * automatically.
 *
 * It also resolves popup styles into shared painters, created once per style
 * through painterFactory() and cached for the manager's lifetime.
 *
 * IMPORTANT:
 * - Must be used from the GUI thread only.
 */
class PopupManager : public QObject
{
    Q_OBJECT

public:
    explicit PopupManager(QObject* parent = nullptr);
    ~PopupManager() override;

    PopupManager(const PopupManager&)            = delete;
    PopupManager& operator=(const PopupManager&) = delete;

    /**
     * @brief Resolves the window root owning @p widget.
     *
     * Walks the parent chain upward and returns the first widget that is
     * either marked as popup root or is a window.
     *
     * @return The root, or nullptr for a null widget.
     */
    static QWidget* windowRoot(const QWidget* widget);

    /// Marks @p widget as a window root for popups even though it is not a window.
    static void setPopupRoot(QWidget* widget, bool root = true);
    static bool isPopupRoot(const QWidget* widget);

    // ------------------------------------------------------------
    // Layers
    // ------------------------------------------------------------

    /**
     * @brief Returns the popup layer of the window owning @p component.
     *
     * @throws std::runtime_error if @p component has no window root or the
     *         root cannot host layers.
     */
    PopupLayer* popupLayer(QWidget* component);

    /**
     * @brief Returns the popup layer of @p root, installing it on first use.
     *
     * @throws std::runtime_error if @p root is null, not a window root, or a
     *         window kind that cannot host layers (popup, tooltip, splash
     *         screen or desktop windows).
     */
    PopupLayer* popupLayerForWindow(QWidget* root);

    /**
     * @brief Returns the shade layer of @p root, installing it on first use.
     *
     * @throws std::runtime_error under the same conditions as popupLayerForWindow().
     */
    ShadeLayer* shadeLayerForWindow(QWidget* root);

    /// True if a popup or shade layer is cached for @p root.
    bool hasLayers(const QWidget* root) const;

    /// Number of window roots with at least one cached layer.
    int windowCount() const;

    /**
     * @brief Deletes the layers of @p root and stops tracking it.
     *
     * Hosted popups are hidden, lose their painter and go back to the parent
     * they had before they were shown; they are never deleted here. No-op if
     * nothing is cached for @p root.
     */
    void releaseWindow(QWidget* root);

    // ------------------------------------------------------------
    // Show / hide
    // ------------------------------------------------------------

    /**
     * @brief Shows a non-modal popup in the window owning @p owner.
     *
     * The popup is decorated with the painter of its style (or the default
     * style), added on top of the window's other non-modal popups and, when
     * @p transferFocus is set, given keyboard focus.
     *
     * A null @p owner is logged and ignored.
     */
    void showPopup(QWidget* owner, Popup* popup, bool transferFocus = true);

    /**
     * @brief Shows a modal popup in the window owning @p owner.
     *
     * Hides every popup currently shown for that window first, then shows
     * @p popup on the window's shade layer and gives it keyboard focus.
     *
     * @param hfill Stretch the popup to the full window width.
     * @param vfill Stretch the popup to the full window height.
     */
    void showModalPopup(QWidget* owner, Popup* popup, bool hfill = false, bool vfill = false);

    /// Hides all popups of all windows.
    void hideAllPopups();

    /// Hides all popups of the window owning @p windowOrComponent. No-op if none are cached.
    void hideAllPopups(QWidget* windowOrComponent);

    // ------------------------------------------------------------
    // Styles
    // ------------------------------------------------------------

    PopupStyle defaultPopupStyle() const noexcept
    {
        return m_defaultStyle;
    }
    void setDefaultPopupStyle(PopupStyle style) noexcept
    {
        m_defaultStyle = style;
    }

    /// Painter of the current default style.
    const PopupPainter* defaultPopupPainter();

    /**
     * @brief Returns the cached painter for @p style, creating it on first use.
     *
     * PopupStyle::None always yields nullptr and never reaches the factory.
     *
     * @throws std::runtime_error if no painter is registered for the style
     *         or its image cannot be loaded.
     */
    const PopupPainter* popupPainter(PopupStyle style);

    /// Painter creators keyed by style name. Pre-filled by config::registerPopupStyles().
    ItemFactory<PopupPainter>& painterFactory() noexcept
    {
        return m_painterFactory;
    }

signals:
    void layerInstalled(QWidget* root, PopupLayer* layer);

private:
    void validateRoot(const QWidget* root) const;
    void installLayer(PopupLayer* layer, QWidget* root, int depth);
    void watchWindow(QWidget* root);
    void forgetWindow(QWidget* root);
    void applyStyle(Popup* popup);

private:
    /// Non-modal layers per window root
    QHash<QWidget*, QPointer<PopupLayer>> m_popupLayers;

    /// Modal layers per window root
    QHash<QWidget*, QPointer<ShadeLayer>> m_shadeLayers;

    /// Destruction watches per window root
    QHash<QWidget*, QMetaObject::Connection> m_windowWatches;

    PopupStyle m_defaultStyle = PopupStyle::Bordered;

    ItemFactory<PopupPainter>                                     m_painterFactory;
    std::unordered_map<PopupStyle, std::unique_ptr<PopupPainter>> m_painters;
};

#endif // POPUPMANAGER_HPP
