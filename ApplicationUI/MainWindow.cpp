#include "MainWindow.hpp"

#include <QComboBox>
#include <QDebug>
#include <QHBoxLayout>
#include <QKeyEvent>
#include <QLabel>
#include <QLineEdit>
#include <QMenu>
#include <QMenuBar>
#include <QMessageBox>
#include <QPushButton>
#include <QVBoxLayout>

#include "Popup.hpp"
#include "PopupManager.hpp"

namespace
{
    // ------------------------------------------------------------
    // Popup builders
    // ------------------------------------------------------------
    Popup* createNotePopup()
    {
        auto* popup = new Popup();
        popup->setObjectName("NotePopup");

        auto* layout = new QVBoxLayout(popup);
        layout->setSpacing(4);

        layout->addWidget(new QLabel(QObject::tr("Quick note"), popup));

        auto* edit = new QLineEdit(popup);
        edit->setPlaceholderText(QObject::tr("Type and press Close"));
        layout->addWidget(edit);

        auto* btnClose = new QPushButton(QObject::tr("Close"), popup);
        QObject::connect(btnClose, &QPushButton::clicked, popup, &Popup::hidePopup);
        layout->addWidget(btnClose);

        return popup;
    }

    Popup* createConfirmPopup()
    {
        auto* popup = new Popup();
        popup->setObjectName("ConfirmPopup");
        popup->setCloseOnOuterAction(false);

        auto* layout = new QVBoxLayout(popup);
        layout->addWidget(new QLabel(QObject::tr("Discard all changes?"), popup));

        auto* buttons = new QHBoxLayout();
        auto* btnYes  = new QPushButton(QObject::tr("Discard"), popup);
        auto* btnNo   = new QPushButton(QObject::tr("Cancel"), popup);
        buttons->addStretch();
        buttons->addWidget(btnYes);
        buttons->addWidget(btnNo);
        layout->addLayout(buttons);

        QObject::connect(btnYes, &QPushButton::clicked, popup, &Popup::hidePopup);
        QObject::connect(btnNo, &QPushButton::clicked, popup, &Popup::hidePopup);

        return popup;
    }

} // namespace

MainWindow::MainWindow(QWidget* parent) : QMainWindow(parent), m_popupManager(std::make_unique<PopupManager>())
{
    resize(960, 640);
    setWindowTitle("PopupKit Demo");

    buildUi();

    // Menu actions are routed through handleAction by object name
    QMenu* menuPopups = menuBar()->addMenu(tr("&Popups"));

    QAction* actionNote = menuPopups->addAction(tr("Show Note"));
    actionNote->setObjectName("actionShowNote");
    actionNote->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_N));

    QAction* actionModal = menuPopups->addAction(tr("Show Modal"));
    actionModal->setObjectName("actionShowModal");
    actionModal->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_M));

    QAction* actionModalWide = menuPopups->addAction(tr("Show Modal (Full Width)"));
    actionModalWide->setObjectName("actionShowModalWide");

    menuPopups->addSeparator();

    QAction* actionHideAll = menuPopups->addAction(tr("Hide All"));
    actionHideAll->setObjectName("actionHideAll");

    QAction* actionExit = menuPopups->addAction(tr("Exit"));
    actionExit->setObjectName("actionExit");
    actionExit->setShortcuts(QKeySequence::Quit);

    for (QAction* action : menuPopups->actions())
    {
        connect(action, &QAction::triggered, this, &MainWindow::handleAction);
    }

    // Buttons go through the actions so errors are reported in one place
    connect(m_btnNote, &QPushButton::clicked, actionNote, &QAction::trigger);
    connect(m_btnModal, &QPushButton::clicked, actionModal, &QAction::trigger);
    connect(m_btnModalWide, &QPushButton::clicked, actionModalWide, &QAction::trigger);
    connect(m_btnHideAll, &QPushButton::clicked, actionHideAll, &QAction::trigger);
    connect(m_cmbStyle, &QComboBox::currentIndexChanged, this, &MainWindow::styleChanged);
}

MainWindow::~MainWindow() noexcept
{
    // Layers hand the popups back before the window children go
    m_popupManager.reset();
}

void MainWindow::buildUi()
{
    auto* central = new QWidget(this);
    central->setObjectName("centralWidget");
    auto* layout  = new QVBoxLayout(central);
    layout->setContentsMargins(12, 12, 12, 12);

    auto* row = new QHBoxLayout();
    row->addWidget(new QLabel(tr("Default style"), central));

    m_cmbStyle = new QComboBox(central);
    m_cmbStyle->addItem(tr("None"), static_cast<int>(PopupStyle::None));
    m_cmbStyle->addItem(tr("Simple"), static_cast<int>(PopupStyle::Simple));
    m_cmbStyle->addItem(tr("Bordered"), static_cast<int>(PopupStyle::Bordered));
    m_cmbStyle->addItem(tr("Light"), static_cast<int>(PopupStyle::Light));
    m_cmbStyle->addItem(tr("Dark"), static_cast<int>(PopupStyle::Dark));
    m_cmbStyle->setCurrentIndex(m_cmbStyle->findData(static_cast<int>(m_popupManager->defaultPopupStyle())));
    row->addWidget(m_cmbStyle);
    row->addStretch();
    layout->addLayout(row);

    m_btnNote      = new QPushButton(tr("Show note popup"), central);
    m_btnModal     = new QPushButton(tr("Show modal popup"), central);
    m_btnModalWide = new QPushButton(tr("Show modal popup (full width)"), central);
    m_btnHideAll   = new QPushButton(tr("Hide all popups"), central);

    layout->addWidget(m_btnNote);
    layout->addWidget(m_btnModal);
    layout->addWidget(m_btnModalWide);
    layout->addWidget(m_btnHideAll);
    layout->addStretch();

    setCentralWidget(central);
}

void MainWindow::showNotePopup()
{
    if (!m_notePopup)
        m_notePopup.reset(createNotePopup());

    m_notePopup->setInvoker(m_btnNote, QPoint(0, m_btnNote->height()));
    m_popupManager->showPopup(m_btnNote, m_notePopup.get());
}

void MainWindow::showConfirmPopup(bool hfill, bool vfill)
{
    if (!m_confirmPopup)
        m_confirmPopup.reset(createConfirmPopup());

    m_popupManager->showModalPopup(this, m_confirmPopup.get(), hfill, vfill);
}

void MainWindow::styleChanged(int index)
{
    const auto style = static_cast<PopupStyle>(m_cmbStyle->itemData(index).toInt());
    m_popupManager->setDefaultPopupStyle(style);

    qDebug() << "[MainWindow] Default popup style:" << QString::fromStdString(popupStyleName(style));
}

void MainWindow::keyPressEvent(QKeyEvent* event)
{
    if (event->key() == Qt::Key_Escape)
    {
        m_popupManager->hideAllPopups();
        event->accept();
        return;
    }
    QMainWindow::keyPressEvent(event);
}

void MainWindow::handleAction()
{
    QAction* action = qobject_cast<QAction*>(sender());
    if (!action)
        return;

    const QString name = action->objectName();

    try
    {
        if (name == "actionShowNote")
        {
            showNotePopup();
        }
        else if (name == "actionShowModal")
        {
            showConfirmPopup(false, false);
        }
        else if (name == "actionShowModalWide")
        {
            showConfirmPopup(true, false);
        }
        else if (name == "actionHideAll")
        {
            m_popupManager->hideAllPopups(this);
        }
        else if (name == "actionExit")
        {
            close();
        }
    }
    catch (const std::exception& e)
    {
        qWarning() << e.what();
        QMessageBox::critical(this, tr("Error"), QString::fromLocal8Bit(e.what()));
    }
}
