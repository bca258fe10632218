#ifndef SHADELAYER_HPP
#define SHADELAYER_HPP

#include <QPointer>

#include "PopupLayer.hpp"

/**
 * @brief Full-window surface showing one modal popup over a dimmed backdrop.
 *
 * While its popup is visible the layer swallows all mouse input so the
 * content below cannot be used. Clicking the backdrop hides the popup when
 * the popup allows it (Popup::closeOnOuterAction).
 */
class ShadeLayer : public PopupLayer
{
    Q_OBJECT

public:
    explicit ShadeLayer(QWidget* parent = nullptr);
    ~ShadeLayer() override = default;

    /**
     * @brief Shows @p popup as the only popup of this layer.
     *
     * Any popup shown before is hidden first.
     *
     * @param hfill Stretch the popup to the full layer width.
     * @param vfill Stretch the popup to the full layer height.
     */
    void showPopup(Popup* popup, bool hfill, bool vfill);

    /// The popup shown last, null if none was shown or it was deleted.
    Popup* currentPopup() const
    {
        return m_popup;
    }

    bool horizontalFill() const noexcept
    {
        return m_hfill;
    }
    bool verticalFill() const noexcept
    {
        return m_vfill;
    }

    /// Backdrop opacity in [0, 1].
    qreal shadeOpacity() const noexcept
    {
        return m_shadeOpacity;
    }
    void setShadeOpacity(qreal opacity);

protected:
    void paintEvent(QPaintEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;

    void layoutPopups() override;
    void updateInputRegion() override;
    void popupVisibilityChanged() override;

private:
    /// m_popup while it is still a child of this layer.
    Popup* hostedPopup() const;

    QPointer<Popup> m_popup;

    bool  m_hfill        = false;
    bool  m_vfill        = false;
    qreal m_shadeOpacity = 0.5;
};

#endif // SHADELAYER_HPP
