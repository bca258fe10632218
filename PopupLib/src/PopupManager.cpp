#include "PopupManager.hpp"

#include <QDebug>
#include <QVariant>
#include <QWidget>

#include "Config.hpp"
#include "LayerBoundsTracker.hpp"
#include "LayerStack.hpp"
#include "Popup.hpp"
#include "PopupUtilities.hpp"

namespace
{
    constexpr const char* kPopupRootProperty = "popupkitRoot";

    bool canHostLayers(const QWidget* root)
    {
        switch (root->windowType())
        {
            case Qt::Popup:
            case Qt::ToolTip:
            case Qt::SplashScreen:
            case Qt::Desktop:
                return false;
            default:
                return true;
        }
    }

} // namespace

PopupManager::PopupManager(QObject* parent) : QObject(parent)
{
    Q_INIT_RESOURCE(popups);

    config::registerPopupStyles(m_painterFactory);
}

PopupManager::~PopupManager()
{
    const QList<QWidget*> roots = m_windowWatches.keys();
    for (QWidget* root : roots)
        releaseWindow(root);
}

QWidget* PopupManager::windowRoot(const QWidget* widget)
{
    for (const QWidget* w = widget; w; w = w->parentWidget())
    {
        if (isPopupRoot(w) || w->isWindow())
            return const_cast<QWidget*>(w);
    }
    return nullptr;
}

void PopupManager::setPopupRoot(QWidget* widget, bool root)
{
    Q_ASSERT(widget);
    widget->setProperty(kPopupRootProperty, root);
}

bool PopupManager::isPopupRoot(const QWidget* widget)
{
    return widget && widget->property(kPopupRootProperty).toBool();
}

PopupLayer* PopupManager::popupLayer(QWidget* component)
{
    QWidget* root = windowRoot(component);
    if (!root)
        throw util::popup_exception("Window root for popup layer cannot be found");

    return popupLayerForWindow(root);
}

PopupLayer* PopupManager::popupLayerForWindow(QWidget* root)
{
    if (auto it = m_popupLayers.constFind(root); it != m_popupLayers.constEnd() && *it)
        return *it;

    validateRoot(root);

    auto* layer = new PopupLayer();
    layer->setObjectName(QStringLiteral("PopupLayer"));
    installLayer(layer, root, LayerDepth::Popups);
    m_popupLayers.insert(root, layer);

    emit layerInstalled(root, layer);
    return layer;
}

ShadeLayer* PopupManager::shadeLayerForWindow(QWidget* root)
{
    if (auto it = m_shadeLayers.constFind(root); it != m_shadeLayers.constEnd() && *it)
        return *it;

    validateRoot(root);

    auto* layer = new ShadeLayer();
    layer->setObjectName(QStringLiteral("ShadeLayer"));
    installLayer(layer, root, LayerDepth::Shade);
    m_shadeLayers.insert(root, layer);

    emit layerInstalled(root, layer);
    return layer;
}

bool PopupManager::hasLayers(const QWidget* root) const
{
    QWidget* key = const_cast<QWidget*>(root);
    return m_popupLayers.contains(key) || m_shadeLayers.contains(key);
}

int PopupManager::windowCount() const
{
    return m_windowWatches.size();
}

void PopupManager::validateRoot(const QWidget* root) const
{
    if (!root)
        throw util::popup_exception("Window root for popup layer cannot be found");

    if (!root->isWindow() && !isPopupRoot(root))
        throw util::popup_exception("Popup layers can only be installed into a window or a widget marked as popup root");

    if (!canHostLayers(root))
        throw util::popup_exception("Popup layers cannot be installed into popup, tooltip, splash screen or desktop windows");
}

void PopupManager::installLayer(PopupLayer* layer, QWidget* root, int depth)
{
    LayerStack::insert(root, layer, depth);
    layer->setGeometry(0, 0, root->width(), root->height());
    layer->setVisible(true);

    // The tracker is owned by the layer and goes away with it
    auto* tracker = new LayerBoundsTracker(root, layer);
    tracker->syncBounds();

    watchWindow(root);

    qDebug() << "[PopupManager] Installed" << layer->metaObject()->className() << "into" << root
             << (tracker->tracksWindowState() ? "(tracking window state)" : "");
}

void PopupManager::watchWindow(QWidget* root)
{
    if (m_windowWatches.contains(root))
        return;

    m_windowWatches.insert(root, connect(root, &QObject::destroyed, this, [this, root]() {
        forgetWindow(root);
    }));
}

void PopupManager::forgetWindow(QWidget* root)
{
    // Only the key is used here, the root is being destroyed
    m_popupLayers.remove(root);
    m_shadeLayers.remove(root);
    m_windowWatches.remove(root);
}

void PopupManager::releaseWindow(QWidget* root)
{
    if (!m_windowWatches.contains(root))
        return;

    QPointer<PopupLayer> popupLayer = m_popupLayers.take(root);
    QPointer<ShadeLayer> shadeLayer = m_shadeLayers.take(root);
    disconnect(m_windowWatches.take(root));

    // Popups belong to the caller, only the layers are ours to delete
    if (shadeLayer)
    {
        shadeLayer->releasePopups();
        delete shadeLayer.data();
    }
    if (popupLayer)
    {
        popupLayer->releasePopups();
        delete popupLayer.data();
    }

    qDebug() << "[PopupManager] Released layers of" << root;
}

void PopupManager::applyStyle(Popup* popup)
{
    popup->setPainter(popupPainter(popup->popupStyle().value_or(m_defaultStyle)));
}

void PopupManager::showPopup(QWidget* owner, Popup* popup, bool transferFocus)
{
    if (!popup)
        throw util::popup_exception("Cannot show a null popup");

    QWidget* root = windowRoot(owner);
    if (!root)
    {
        qWarning() << "[PopupManager] Ignoring popup without owner window";
        return;
    }

    PopupLayer* layer = popupLayerForWindow(root);
    applyStyle(popup);
    layer->showPopup(popup);

    if (transferFocus)
        popup->transferFocus();
}

void PopupManager::showModalPopup(QWidget* owner, Popup* popup, bool hfill, bool vfill)
{
    if (!popup)
        throw util::popup_exception("Cannot show a null popup");

    QWidget* root = windowRoot(owner);
    if (!root)
    {
        qWarning() << "[PopupManager] Ignoring modal popup without owner window";
        return;
    }

    // Only one modal interaction per window
    hideAllPopups(root);

    ShadeLayer* layer = shadeLayerForWindow(root);
    applyStyle(popup);
    layer->showPopup(popup, hfill, vfill);

    popup->transferFocus();
}

void PopupManager::hideAllPopups()
{
    // Copies: hiding may run user code reacting to popupHidden()
    const QList<QPointer<ShadeLayer>> shadeLayers = m_shadeLayers.values();
    for (const QPointer<ShadeLayer>& layer : shadeLayers)
    {
        if (layer)
            layer->hideAllPopups();
    }

    const QList<QPointer<PopupLayer>> popupLayers = m_popupLayers.values();
    for (const QPointer<PopupLayer>& layer : popupLayers)
    {
        if (layer)
            layer->hideAllPopups();
    }
}

void PopupManager::hideAllPopups(QWidget* windowOrComponent)
{
    QWidget* root = windowRoot(windowOrComponent);
    if (!root)
        return;

    if (QPointer<ShadeLayer> layer = m_shadeLayers.value(root))
        layer->hideAllPopups();

    if (QPointer<PopupLayer> layer = m_popupLayers.value(root))
        layer->hideAllPopups();
}

const PopupPainter* PopupManager::defaultPopupPainter()
{
    return popupPainter(m_defaultStyle);
}

const PopupPainter* PopupManager::popupPainter(PopupStyle style)
{
    if (style == PopupStyle::None)
        return nullptr;

    if (auto it = m_painters.find(style); it != m_painters.end())
        return it->second.get();

    const std::string name = popupStyleName(style);

    std::unique_ptr<PopupPainter> painter = m_painterFactory.createItem(name);
    if (!painter)
        throw util::popup_exception("No painter registered for popup style \"" + name + "\"");

    const PopupPainter* result = painter.get();
    m_painters.emplace(style, std::move(painter));
    return result;
}
