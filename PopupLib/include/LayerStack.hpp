#ifndef LAYERSTACK_HPP
#define LAYERSTACK_HPP

class QWidget;

/**
 * @brief Depth ordering for the direct children of a window root.
 *
 * Qt stacks sibling widgets in creation/raise order only. LayerStack tags
 * selected children with an integer depth (see LayerDepth) and restacks the
 * tagged children so that a child with a higher depth is always above a child
 * with a lower one. Untagged children are content and stay below every tagged
 * child.
 */
namespace LayerStack
{
    /**
     * @brief Reparents @p surface into @p root at the given depth and restacks.
     *
     * Surfaces sharing a depth keep their relative insertion order, the most
     * recently inserted one on top.
     */
    void insert(QWidget* root, QWidget* surface, int depth);

    /// @return The depth tag of @p widget, LayerDepth::Content when untagged.
    int depth(const QWidget* widget);

    /// Raises every tagged child of @p root in ascending depth order.
    void restack(QWidget* root);

} // namespace LayerStack

#endif // LAYERSTACK_HPP
