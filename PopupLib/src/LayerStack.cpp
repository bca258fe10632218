#include "LayerStack.hpp"

#include <QVariant>
#include <QWidget>
#include <algorithm>
#include <vector>

#include "PopupTypes.hpp"

namespace
{
    constexpr const char* kDepthProperty = "popupkitLayerDepth";
    constexpr const char* kOrderProperty = "popupkitLayerOrder";

    int nextInsertOrder()
    {
        static int order = 0;
        return ++order;
    }

} // namespace

namespace LayerStack
{
    void insert(QWidget* root, QWidget* surface, int depth)
    {
        Q_ASSERT(root);
        Q_ASSERT(surface);

        surface->setProperty(kDepthProperty, depth);
        surface->setProperty(kOrderProperty, nextInsertOrder());

        if (surface->parentWidget() != root)
            surface->setParent(root);

        restack(root);
    }

    int depth(const QWidget* widget)
    {
        const QVariant value = widget->property(kDepthProperty);
        return value.isValid() ? value.toInt() : LayerDepth::Content;
    }

    void restack(QWidget* root)
    {
        std::vector<QWidget*> tagged;
        for (QObject* child : root->children())
        {
            QWidget* widget = qobject_cast<QWidget*>(child);
            if (widget && !widget->isWindow() && widget->property(kDepthProperty).isValid())
                tagged.push_back(widget);
        }

        std::stable_sort(tagged.begin(), tagged.end(), [](const QWidget* a, const QWidget* b) {
            const int da = depth(a);
            const int db = depth(b);
            if (da != db)
                return da < db;
            return a->property(kOrderProperty).toInt() < b->property(kOrderProperty).toInt();
        });

        for (QWidget* widget : tagged)
            widget->raise();
    }

} // namespace LayerStack
