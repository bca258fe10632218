#ifndef POPUP_HPP
#define POPUP_HPP

#include <QPointer>
#include <QWidget>
#include <optional>

#include "PopupTypes.hpp"

class PopupPainter;

/**
 * @brief Overlay widget displayed by a PopupLayer or ShadeLayer.
 *
 * A popup is a plain child widget of a layer while it is shown. It does not
 * own its painter: painters are shared per style and owned by the
 * PopupManager that displays the popup.
 */
class Popup : public QWidget
{
    Q_OBJECT

public:
    explicit Popup(QWidget* parent = nullptr);
    ~Popup() override = default;

    /**
     * @brief Style used to decorate the popup.
     *
     * Unset means the default style of the manager showing the popup.
     */
    std::optional<PopupStyle> popupStyle() const noexcept
    {
        return m_style;
    }
    void setPopupStyle(std::optional<PopupStyle> style);

    const PopupPainter* painter() const noexcept
    {
        return m_painter;
    }

    /// Sets the decoration painter (not owned) and adopts its padding as contents margins.
    void setPainter(const PopupPainter* painter);

    /**
     * @brief Anchors the popup to @p invoker.
     *
     * When shown by a PopupLayer the popup is placed at @p offset relative
     * to the invoker's top-left corner.
     */
    void setInvoker(QWidget* invoker, QPoint offset = {});

    QWidget* invoker() const
    {
        return m_invoker;
    }

    QPoint invokerOffset() const noexcept
    {
        return m_invokerOffset;
    }

    /// Hide the popup when the user clicks outside of it on a shade layer.
    bool closeOnOuterAction() const noexcept
    {
        return m_closeOnOuterAction;
    }
    void setCloseOnOuterAction(bool close) noexcept
    {
        m_closeOnOuterAction = close;
    }

    /**
     * @brief Moves keyboard focus to the first focusable child.
     *
     * Children are visited in focus-chain order; a child qualifies when it is
     * enabled, visible inside the popup and accepts tab focus.
     *
     * @return True if a child received focus.
     */
    virtual bool transferFocus();

public slots:
    void hidePopup();

signals:
    void popupShown();
    void popupHidden();

protected:
    void paintEvent(QPaintEvent* event) override;
    void showEvent(QShowEvent* event) override;
    void hideEvent(QHideEvent* event) override;

private:
    std::optional<PopupStyle> m_style;
    const PopupPainter*       m_painter = nullptr;

    QPointer<QWidget> m_invoker;
    QPoint            m_invokerOffset;

    bool m_closeOnOuterAction = true;
};

#endif // POPUP_HPP
