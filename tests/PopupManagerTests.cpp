#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QPointer>
#include <QPushButton>
#include <stdexcept>

#include "LayerStack.hpp"
#include "PopupManager.hpp"
#include "TestPopups.hpp"

class PopupManagerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        window = makeTestWindow(400, 300);
        button = new QPushButton("Owner", window.get());
        button->setGeometry(20, 20, 80, 24);
        button->show();
    }

    void TearDown() override
    {
        manager.reset();
        window.reset();
    }

    EventLog                      log;
    std::unique_ptr<QWidget>      window;
    QPushButton*                  button  = nullptr;
    std::unique_ptr<PopupManager> manager = std::make_unique<PopupManager>();
};

TEST_F(PopupManagerTest, PopupLayerIsCreatedOncePerWindow)
{
    PopupLayer* first  = manager->popupLayerForWindow(window.get());
    PopupLayer* second = manager->popupLayerForWindow(window.get());
    PopupLayer* viaWidget = manager->popupLayer(button);

    EXPECT_EQ(first, second);
    EXPECT_EQ(first, viaWidget);
    EXPECT_EQ(manager->windowCount(), 1);
    EXPECT_EQ(window->findChildren<PopupLayer*>(Qt::FindDirectChildrenOnly).size(), 1);
}

TEST_F(PopupManagerTest, ShadeLayerIsCachedSeparately)
{
    PopupLayer* popupLayer = manager->popupLayerForWindow(window.get());
    ShadeLayer* shade      = manager->shadeLayerForWindow(window.get());

    EXPECT_NE(static_cast<QWidget*>(popupLayer), static_cast<QWidget*>(shade));
    EXPECT_EQ(shade, manager->shadeLayerForWindow(window.get()));
    EXPECT_EQ(manager->windowCount(), 1);
}

TEST_F(PopupManagerTest, InstalledLayerCoversWindow)
{
    PopupLayer* layer = manager->popupLayerForWindow(window.get());

    EXPECT_EQ(layer->parentWidget(), window.get());
    EXPECT_EQ(layer->geometry(), QRect(0, 0, 400, 300));
    EXPECT_FALSE(layer->isHidden());
    EXPECT_EQ(LayerStack::depth(layer), LayerDepth::Popups);
    EXPECT_EQ(LayerStack::depth(manager->shadeLayerForWindow(window.get())), LayerDepth::Shade);
}

TEST_F(PopupManagerTest, ResizeKeepsBothLayersMatchingWindow)
{
    PopupLayer* popupLayer = manager->popupLayerForWindow(window.get());
    ShadeLayer* shade      = manager->shadeLayerForWindow(window.get());

    window->resize(640, 480);
    QCoreApplication::processEvents();

    EXPECT_EQ(popupLayer->geometry(), QRect(0, 0, 640, 480));
    EXPECT_EQ(shade->geometry(), QRect(0, 0, 640, 480));

    window->resize(200, 150);
    QCoreApplication::processEvents();

    EXPECT_EQ(popupLayer->geometry(), QRect(0, 0, 200, 150));
    EXPECT_EQ(shade->geometry(), QRect(0, 0, 200, 150));
}

TEST_F(PopupManagerTest, WindowStateChangeReappliesBounds)
{
    PopupLayer* layer = manager->popupLayerForWindow(window.get());
    layer->setGeometry(5, 5, 10, 10);

    window->setWindowState(Qt::WindowMaximized);

    EXPECT_EQ(layer->geometry(), QRect(QPoint(0, 0), window->size()));
}

TEST_F(PopupManagerTest, EmbeddedRootTracksItsOwnSize)
{
    auto* panel = new QWidget(window.get());
    panel->setGeometry(10, 10, 200, 100);
    panel->show();
    PopupManager::setPopupRoot(panel);

    PopupLayer* layer = manager->popupLayer(panel);

    EXPECT_EQ(layer->parentWidget(), panel);
    EXPECT_EQ(layer->geometry(), QRect(0, 0, 200, 100));

    panel->resize(300, 120);
    QCoreApplication::processEvents();
    EXPECT_EQ(layer->geometry(), QRect(0, 0, 300, 120));

    // Widgets inside the embedded root resolve to it, not to the window
    auto* inner = new QWidget(panel);
    EXPECT_EQ(PopupManager::windowRoot(inner), panel);
    EXPECT_EQ(PopupManager::windowRoot(button), window.get());
}

TEST_F(PopupManagerTest, UnresolvableWindowsThrow)
{
    EXPECT_THROW(manager->popupLayerForWindow(nullptr), std::runtime_error);
    EXPECT_THROW(manager->popupLayer(nullptr), std::runtime_error);
    EXPECT_THROW(manager->shadeLayerForWindow(nullptr), std::runtime_error);

    // A plain child is not a window root
    EXPECT_THROW(manager->popupLayerForWindow(button), std::runtime_error);

    QWidget popupWindow(nullptr, Qt::Popup);
    EXPECT_THROW(manager->popupLayerForWindow(&popupWindow), std::runtime_error);
    EXPECT_THROW(manager->popupLayer(&popupWindow), std::runtime_error);

    EXPECT_EQ(manager->windowCount(), 0);
}

TEST_F(PopupManagerTest, ShowPopupInstallsLayerAndTransfersFocus)
{
    auto* popup = new SpyPopup(&log, "X", window.get());
    ASSERT_EQ(manager->windowCount(), 0);

    manager->showPopup(button, popup);

    ASSERT_EQ(manager->windowCount(), 1);
    PopupLayer* layer = manager->popupLayerForWindow(window.get());
    EXPECT_EQ(popup->parentWidget(), layer);
    EXPECT_FALSE(popup->isHidden());
    EXPECT_TRUE(layer->popups().contains(popup));

    EXPECT_EQ(popup->focusTransfers, 1);
    EXPECT_EQ(popup->focusWidget(), popup->edit());
    EXPECT_LT(indexOf(log, "show:X"), indexOf(log, "focus:X"));
}

TEST_F(PopupManagerTest, ShowPopupWithoutFocusTransfer)
{
    auto* popup = new SpyPopup(&log, "X", window.get());

    manager->showPopup(button, popup, false);

    EXPECT_FALSE(popup->isHidden());
    EXPECT_EQ(popup->focusTransfers, 0);
}

TEST_F(PopupManagerTest, NonModalPopupsStack)
{
    auto* first  = new SpyPopup(&log, "A", window.get());
    auto* second = new SpyPopup(&log, "B", window.get());

    manager->showPopup(button, first);
    manager->showPopup(button, second);

    EXPECT_FALSE(first->isHidden());
    EXPECT_FALSE(second->isHidden());

    const QList<Popup*> popups = manager->popupLayer(button)->popups();
    ASSERT_EQ(popups.size(), 2);
    EXPECT_EQ(popups.last(), second);
}

TEST_F(PopupManagerTest, ShowPopupWithNullOwnerIsIgnored)
{
    auto* popup = new SpyPopup(&log, "X", window.get());

    EXPECT_NO_THROW(manager->showPopup(nullptr, popup));
    EXPECT_NO_THROW(manager->showModalPopup(nullptr, popup, false, false));

    EXPECT_EQ(manager->windowCount(), 0);
    EXPECT_TRUE(popup->isHidden());
}

TEST_F(PopupManagerTest, ShowNullPopupThrows)
{
    EXPECT_THROW(manager->showPopup(button, nullptr), std::runtime_error);
    EXPECT_THROW(manager->showModalPopup(button, nullptr), std::runtime_error);
}

TEST_F(PopupManagerTest, ModalPopupHidesEverythingBeforeShowing)
{
    auto* plain  = new SpyPopup(&log, "plain", window.get());
    auto* modal  = new SpyPopup(&log, "modal", window.get());
    auto* second = new SpyPopup(&log, "second", window.get());

    manager->showPopup(button, plain);
    manager->showModalPopup(button, modal, false, false);

    EXPECT_TRUE(plain->isHidden());
    EXPECT_FALSE(modal->isHidden());
    EXPECT_LT(indexOf(log, "hide:plain"), indexOf(log, "show:modal"));

    manager->showModalPopup(window.get(), second, false, false);

    EXPECT_TRUE(modal->isHidden());
    EXPECT_FALSE(second->isHidden());
    EXPECT_LT(indexOf(log, "hide:modal"), indexOf(log, "show:second"));

    // Focus always moves into the modal popup
    EXPECT_EQ(second->focusTransfers, 1);
    EXPECT_EQ(second->focusWidget(), second->edit());
}

TEST_F(PopupManagerTest, ModalPopupFillsWidthOnly)
{
    window->resize(800, 600);
    QCoreApplication::processEvents();

    auto* plain = new SpyPopup(&log, "plain", window.get());
    auto* modal = new SpyPopup(&log, "modal", window.get());

    manager->showPopup(button, plain);
    manager->showModalPopup(button, modal, true, false);

    EXPECT_TRUE(plain->isHidden());
    EXPECT_FALSE(modal->isHidden());

    ShadeLayer* shade = manager->shadeLayerForWindow(window.get());
    EXPECT_EQ(modal->parentWidget(), shade);
    EXPECT_TRUE(shade->horizontalFill());
    EXPECT_FALSE(shade->verticalFill());

    const int naturalHeight = modal->sizeHint().expandedTo(modal->minimumSizeHint()).height();
    EXPECT_EQ(modal->width(), 800);
    EXPECT_EQ(modal->height(), naturalHeight);
    EXPECT_EQ(modal->x(), 0);
    EXPECT_EQ(modal->y(), (600 - naturalHeight) / 2);
    EXPECT_EQ(modal->focusTransfers, 1);
}

TEST_F(PopupManagerTest, HideAllWithoutLayersIsNoop)
{
    EXPECT_NO_THROW(manager->hideAllPopups());
    EXPECT_NO_THROW(manager->hideAllPopups(window.get()));
    EXPECT_NO_THROW(manager->hideAllPopups(nullptr));

    EXPECT_EQ(manager->windowCount(), 0);
    EXPECT_FALSE(manager->hasLayers(window.get()));
}

TEST_F(PopupManagerTest, HideAllForWindowLeavesOtherWindowsAlone)
{
    auto other = makeTestWindow(300, 200);

    auto* mine   = new SpyPopup(&log, "mine", window.get());
    auto* theirs = new SpyPopup(&log, "theirs", other.get());

    manager->showPopup(button, mine);
    manager->showModalPopup(other.get(), theirs, false, false);

    manager->hideAllPopups(button);
    EXPECT_TRUE(mine->isHidden());
    EXPECT_FALSE(theirs->isHidden());

    manager->showPopup(button, mine);
    manager->hideAllPopups();
    EXPECT_TRUE(mine->isHidden());
    EXPECT_TRUE(theirs->isHidden());

    manager->releaseWindow(other.get());
}

TEST_F(PopupManagerTest, ReleaseWindowDeletesLayers)
{
    QPointer<PopupLayer> layer = manager->popupLayerForWindow(window.get());
    QPointer<ShadeLayer> shade = manager->shadeLayerForWindow(window.get());

    manager->releaseWindow(window.get());

    EXPECT_TRUE(layer.isNull());
    EXPECT_TRUE(shade.isNull());
    EXPECT_EQ(manager->windowCount(), 0);
    EXPECT_FALSE(manager->hasLayers(window.get()));

    // No tracker left behind on the window
    window->resize(500, 400);
    QCoreApplication::processEvents();

    PopupLayer* fresh = manager->popupLayerForWindow(window.get());
    EXPECT_EQ(fresh->geometry(), QRect(0, 0, 500, 400));

    // Releasing an unknown window does nothing
    QWidget unknown;
    EXPECT_NO_THROW(manager->releaseWindow(&unknown));
}

TEST_F(PopupManagerTest, ReleaseWindowHandsPopupsBack)
{
    auto owned = std::make_unique<SpyPopup>(&log, "owned");
    auto* child = new SpyPopup(&log, "child", window.get());
    QPointer<SpyPopup> watch(owned.get());

    manager->showPopup(button, owned.get(), false);
    manager->showModalPopup(window.get(), child);
    ASSERT_NE(child->painter(), nullptr);

    manager->releaseWindow(window.get());

    EXPECT_EQ(owned->parentWidget(), nullptr);
    EXPECT_TRUE(owned->isHidden());
    EXPECT_EQ(owned->painter(), nullptr);

    EXPECT_EQ(child->parentWidget(), window.get());
    EXPECT_TRUE(child->isHidden());
    EXPECT_EQ(child->painter(), nullptr);

    // The painters went with the manager, the popups did not
    manager.reset();
    EXPECT_FALSE(watch.isNull());
    EXPECT_EQ(owned->painter(), nullptr);
}

TEST_F(PopupManagerTest, PopupOwnedElsewhereOutlivesItsWindow)
{
    auto other = makeTestWindow(300, 200);
    auto owned = std::make_unique<SpyPopup>(&log, "owned");
    QPointer<SpyPopup> watch(owned.get());

    manager->showPopup(other.get(), owned.get(), false);
    ASSERT_EQ(owned->parentWidget(), manager->popupLayerForWindow(other.get()));

    other.reset();

    ASSERT_FALSE(watch.isNull());
    EXPECT_EQ(owned->parentWidget(), nullptr);
    EXPECT_TRUE(owned->isHidden());
    EXPECT_EQ(manager->windowCount(), 0);
}

TEST_F(PopupManagerTest, DestroyedWindowIsForgotten)
{
    auto other = makeTestWindow(300, 200);
    manager->popupLayerForWindow(other.get());
    manager->shadeLayerForWindow(other.get());
    ASSERT_EQ(manager->windowCount(), 1);

    other.reset();

    EXPECT_EQ(manager->windowCount(), 0);
    EXPECT_NO_THROW(manager->hideAllPopups());
}

TEST_F(PopupManagerTest, LayersStayAboveContentAddedLater)
{
    PopupLayer* layer = manager->popupLayerForWindow(window.get());
    ShadeLayer* shade = manager->shadeLayerForWindow(window.get());

    auto* late = new QWidget(window.get());
    late->setGeometry(0, 0, 50, 50);
    late->show();

    const QObjectList children = window->children();
    EXPECT_LT(children.indexOf(late), children.indexOf(layer));
    EXPECT_LT(children.indexOf(layer), children.indexOf(shade));
}

TEST_F(PopupManagerTest, LayerInstalledSignalFiresOncePerLayer)
{
    int installed = 0;
    QObject::connect(manager.get(), &PopupManager::layerInstalled, [&installed](QWidget*, PopupLayer*) { ++installed; });

    manager->popupLayerForWindow(window.get());
    manager->popupLayerForWindow(window.get());
    manager->shadeLayerForWindow(window.get());

    EXPECT_EQ(installed, 2);
}
