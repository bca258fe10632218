#ifndef MAINWINDOW_HPP
#define MAINWINDOW_HPP

#include <QMainWindow>
#include <memory>

class Popup;
class PopupManager;
class QComboBox;
class QPushButton;

/**
 * @brief Demo window exercising non-modal and modal popups.
 */
class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    MainWindow(QWidget* parent = nullptr);
    ~MainWindow() noexcept override;

protected:
    void keyPressEvent(QKeyEvent* event) override;

private slots:
    void handleAction();
    void styleChanged(int index);

private:
    void buildUi();

    void showNotePopup();
    void showConfirmPopup(bool hfill, bool vfill);

    std::unique_ptr<PopupManager> m_popupManager;

    QComboBox*   m_cmbStyle     = nullptr;
    QPushButton* m_btnNote      = nullptr;
    QPushButton* m_btnModal     = nullptr;
    QPushButton* m_btnModalWide = nullptr;
    QPushButton* m_btnHideAll   = nullptr;

    // Created on first use and reused
    std::unique_ptr<Popup> m_notePopup;
    std::unique_ptr<Popup> m_confirmPopup;
};
#endif // MAINWINDOW_HPP
