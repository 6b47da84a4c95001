/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "PortalRegistryTest.h"

#include <QCloseEvent>
#include <QSignalSpy>
#include <QTest>
#include <QWidget>

#include "../portal/HostedSurface.h"
#include "../portal/PortalHost.h"
#include "../portal/PortalOverlay.h"
#include "../portal/PortalRegistry.h"

using namespace Tessera;

namespace
{
QWidget *createAnchor(QWidget *parent, const QRect &geometry)
{
    auto *anchor = new QWidget(parent);
    anchor->setGeometry(geometry);
    return anchor;
}

class ConnectionCountingSurface : public HostedSurface
{
public:
    int destroyedReceivers() const
    {
        return receivers(SIGNAL(destroyed(QObject *)));
    }
};

class StubbornWindow : public QWidget
{
protected:
    void closeEvent(QCloseEvent *event) override
    {
        event->ignore();
    }
};
}

void PortalRegistryTest::testBindCreatesOneHostPerWindow()
{
    HostedSurface first;
    HostedSurface second;
    HostedSurface third;
    QWidget firstWindow;
    QWidget secondWindow;
    firstWindow.resize(500, 500);
    secondWindow.resize(500, 500);
    QWidget *firstAnchor = createAnchor(&firstWindow, QRect(0, 0, 100, 100));
    QWidget *secondAnchor = createAnchor(&secondWindow, QRect(0, 0, 100, 100));
    QWidget *thirdAnchor = createAnchor(&firstWindow, QRect(200, 200, 100, 100));

    PortalRegistry registry;
    QSignalSpy added(&registry, &PortalRegistry::hostAdded);

    registry.bind(&first, firstAnchor, true);
    registry.bind(&second, secondAnchor, true);
    registry.bind(&third, thirdAnchor, true);

    QCOMPARE(registry.hostCount(), 2);
    QCOMPARE(added.count(), 2);
    QCOMPARE(registry.hosts().size(), 2);
    QVERIFY(registry.hosts().contains(added.at(0).at(0).value<PortalHost *>()));
    QVERIFY(registry.hosts().contains(added.at(1).at(0).value<PortalHost *>()));
    QCOMPARE(registry.windowForSurface(&first), &firstWindow);
    QCOMPARE(registry.windowForSurface(&second), &secondWindow);
    QCOMPARE(registry.windowForSurface(&third), &firstWindow);

    PortalHost *firstHost = registry.hostForWindow(&firstWindow);
    QVERIFY(firstHost);
    QCOMPARE(firstHost->window(), &firstWindow);
    QCOMPARE(firstHost->bindingCount(), 2);
    QCOMPARE(registry.hostForWindow(&secondWindow)->bindingCount(), 1);
}

void PortalRegistryTest::testBindWithoutWindowIsNoop()
{
    HostedSurface surface;
    QWidget looseAnchor;

    PortalRegistry registry;
    registry.bind(&surface, &looseAnchor, true);
    registry.bind(nullptr, &looseAnchor, true);
    registry.bind(&surface, nullptr, true);

    QCOMPARE(registry.hostCount(), 0);
    QCOMPARE(registry.windowForSurface(&surface), nullptr);
    QCOMPARE(PortalRegistry::windowForAnchor(&looseAnchor), nullptr);
    QCOMPARE(surface.parentWidget(), nullptr);
}

void PortalRegistryTest::testSynchronizeCreatesHost()
{
    QWidget window;
    window.resize(500, 500);
    QWidget *anchor = createAnchor(&window, QRect(0, 0, 100, 100));

    PortalRegistry registry;
    registry.synchronize(anchor);
    QCOMPARE(registry.hostCount(), 1);
    QVERIFY(registry.hostForWindow(&window));

    QCOMPARE(registry.hitTest(QPoint(50, 50), &window), nullptr);
    QCOMPARE(registry.hitTest(QPoint(50, 50), nullptr), nullptr);
    QCOMPARE(registry.hostCount(), 1);
}

void PortalRegistryTest::testMigrationBetweenWindows()
{
    HostedSurface surface;
    QWidget firstWindow;
    QWidget secondWindow;
    firstWindow.resize(500, 500);
    secondWindow.resize(500, 500);
    QWidget *firstAnchor = createAnchor(&firstWindow, QRect(0, 0, 100, 100));
    QWidget *secondAnchor = createAnchor(&secondWindow, QRect(50, 50, 200, 200));

    PortalRegistry registry;
    registry.bind(&surface, firstAnchor, true);
    PortalHost *firstHost = registry.hostForWindow(&firstWindow);
    QCOMPARE(surface.parentWidget(), firstHost->overlay());

    // A tab dragged into another window.
    registry.bind(&surface, secondAnchor, true);
    PortalHost *secondHost = registry.hostForWindow(&secondWindow);

    QVERIFY(!firstHost->isBound(&surface));
    QVERIFY(secondHost->isBound(&surface));
    QCOMPARE(secondHost->bindingCount(), 1);
    QCOMPARE(registry.windowForSurface(&surface), &secondWindow);
    QCOMPARE(surface.parentWidget(), secondHost->overlay());
    QCOMPARE(surface.geometry(), QRect(50, 50, 200, 200));

    QCOMPARE(registry.hitTest(QPoint(10, 10), &firstWindow), nullptr);
    QCOMPARE(registry.hitTest(QPoint(100, 100), &secondWindow), &surface);
}

void PortalRegistryTest::testWindowAgnosticDispatch()
{
    HostedSurface surface;
    auto *child = new QWidget(&surface);
    child->setGeometry(0, 0, 10, 10);
    QWidget window;
    window.resize(500, 500);
    QWidget *anchor = createAnchor(&window, QRect(0, 0, 100, 100));

    PortalRegistry registry;
    registry.bind(&surface, anchor, true);
    QCOMPARE(registry.hitTest(QPoint(50, 50), &window), &surface);
    QCOMPARE(registry.widgetAt(QPoint(5, 5), &window), child);

    registry.hide(&surface);
    QVERIFY(surface.isHidden());
    QCOMPARE(registry.hitTest(QPoint(50, 50), &window), nullptr);

    registry.setVisibilityOnly(&surface, true);
    QVERIFY(surface.isHidden());
    registry.synchronize(anchor);
    QVERIFY(!surface.isHidden());

    anchor->setGeometry(100, 100, 150, 150);
    registry.synchronize(anchor);
    QCOMPARE(surface.geometry(), QRect(100, 100, 150, 150));
}

void PortalRegistryTest::testDetachForgetsSurface()
{
    HostedSurface surface;
    QWidget window;
    window.resize(500, 500);
    QWidget *anchor = createAnchor(&window, QRect(0, 0, 100, 100));

    PortalRegistry registry;
    registry.bind(&surface, anchor, true);
    registry.detach(&surface);

    QCOMPARE(registry.windowForSurface(&surface), nullptr);
    QVERIFY(!registry.hostForWindow(&window)->isBound(&surface));
    QCOMPARE(surface.parentWidget(), nullptr);

    // Unknown surfaces are ignored.
    registry.detach(&surface);
    registry.hide(&surface);
    registry.setVisibilityOnly(&surface, true);
    QCOMPARE(registry.hostCount(), 1);
}

void PortalRegistryTest::testWindowDestroyedTearsDownHost()
{
    HostedSurface surface;
    auto *window = new QWidget;
    window->resize(500, 500);
    QWidget *anchor = createAnchor(window, QRect(0, 0, 100, 100));

    PortalRegistry registry;
    QSignalSpy removed(&registry, &PortalRegistry::hostRemoved);
    registry.bind(&surface, anchor, true);
    QCOMPARE(registry.hostCount(), 1);

    delete window;

    QCOMPARE(registry.hostCount(), 0);
    QCOMPARE(removed.count(), 1);
    QCOMPARE(registry.windowForSurface(&surface), nullptr);
    QCOMPARE(surface.parentWidget(), nullptr);
}

void PortalRegistryTest::testWindowCloseTearsDownHost()
{
    HostedSurface surface;
    QWidget window;
    window.resize(500, 500);
    QWidget *anchor = createAnchor(&window, QRect(0, 0, 100, 100));
    window.show();
    QVERIFY(QTest::qWaitForWindowExposed(&window));

    PortalRegistry registry;
    QSignalSpy removed(&registry, &PortalRegistry::hostRemoved);
    registry.bind(&surface, anchor, true);
    QVERIFY(surface.isVisible());

    QVERIFY(window.close());
    QTRY_COMPARE(registry.hostCount(), 0);
    QCOMPARE(removed.count(), 1);
    QCOMPARE(removed.at(0).at(0).value<QWidget *>(), &window);
    QCOMPARE(registry.windowForSurface(&surface), nullptr);
    QCOMPARE(surface.parentWidget(), nullptr);
    QCOMPARE(window.findChildren<PortalOverlay *>().size(), 0);
}

void PortalRegistryTest::testRejectedCloseKeepsHost()
{
    HostedSurface surface;
    StubbornWindow window;
    window.resize(500, 500);
    QWidget *anchor = createAnchor(&window, QRect(0, 0, 100, 100));
    window.show();
    QVERIFY(QTest::qWaitForWindowExposed(&window));

    PortalRegistry registry;
    registry.bind(&surface, anchor, true);

    QVERIFY(!window.close());
    QTest::qWait(50);

    QCOMPARE(registry.hostCount(), 1);
    QVERIFY(registry.hostForWindow(&window)->isBound(&surface));
    QCOMPARE(registry.windowForSurface(&surface), &window);
}

void PortalRegistryTest::testRemoveWindow()
{
    HostedSurface surface;
    QWidget window;
    window.resize(500, 500);
    QWidget *anchor = createAnchor(&window, QRect(0, 0, 100, 100));

    PortalRegistry registry;
    QSignalSpy added(&registry, &PortalRegistry::hostAdded);
    QSignalSpy removed(&registry, &PortalRegistry::hostRemoved);
    registry.bind(&surface, anchor, true);

    registry.removeWindow(&window);
    registry.removeWindow(nullptr);
    QCOMPARE(registry.hostCount(), 0);
    QCOMPARE(removed.count(), 1);
    QCOMPARE(removed.at(0).at(0).value<QWidget *>(), &window);
    QCOMPARE(surface.parentWidget(), nullptr);

    // A later bind starts over with a fresh host.
    registry.bind(&surface, anchor, true);
    QCOMPARE(added.count(), 2);
    QCOMPARE(registry.hostCount(), 1);
    QVERIFY(registry.hostForWindow(&window)->isBound(&surface));
}

void PortalRegistryTest::testSurfaceDestroyedDropsRecord()
{
    auto *surface = new HostedSurface;
    HostedSurface *const key = surface;
    QWidget window;
    window.resize(500, 500);
    QWidget *anchor = createAnchor(&window, QRect(0, 0, 100, 100));

    PortalRegistry registry;
    registry.bind(surface, anchor, true);
    QCOMPARE(registry.windowForSurface(key), &window);

    delete surface;
    QCOMPARE(registry.windowForSurface(key), nullptr);

    registry.synchronize(anchor);
    QCOMPARE(registry.hostForWindow(&window)->bindingCount(), 0);
}

void PortalRegistryTest::testSurfaceConnectionsDoNotAccumulate()
{
    ConnectionCountingSurface surface;
    QWidget firstWindow;
    QWidget secondWindow;
    firstWindow.resize(500, 500);
    secondWindow.resize(500, 500);
    QWidget *anchor = createAnchor(&firstWindow, QRect(0, 0, 100, 100));
    QWidget *otherAnchor = createAnchor(&secondWindow, QRect(0, 0, 100, 100));

    PortalRegistry registry;
    const int baseline = surface.destroyedReceivers();

    for (int i = 0; i < 5; ++i) {
        registry.bind(&surface, anchor, true);
        QCOMPARE(surface.destroyedReceivers(), baseline + 1);
        registry.detach(&surface);
        QCOMPARE(surface.destroyedReceivers(), baseline);
    }

    // Moving between windows keeps the single record.
    registry.bind(&surface, anchor, true);
    registry.bind(&surface, otherAnchor, true);
    QCOMPARE(surface.destroyedReceivers(), baseline + 1);

    // Window teardown drops it as well.
    registry.removeWindow(&secondWindow);
    QCOMPARE(registry.windowForSurface(&surface), nullptr);
    QCOMPARE(surface.destroyedReceivers(), baseline);

    // A record pruned because its anchor went away.
    registry.bind(&surface, anchor, true);
    delete anchor;
    QWidget *replacement = createAnchor(&firstWindow, QRect(0, 0, 100, 100));
    HostedSurface other;
    registry.bind(&other, replacement, true);
    QCOMPARE(registry.windowForSurface(&surface), nullptr);
    QCOMPARE(surface.destroyedReceivers(), baseline);

    registry.bind(&surface, replacement, true);
    QCOMPARE(surface.destroyedReceivers(), baseline + 1);
}

void PortalRegistryTest::testRegistryDestructionReleasesSurfaces()
{
    HostedSurface surface;
    QWidget window;
    window.resize(500, 500);
    QWidget *anchor = createAnchor(&window, QRect(0, 0, 100, 100));

    auto *registry = new PortalRegistry;
    registry->bind(&surface, anchor, true);
    QCOMPARE(window.findChildren<PortalOverlay *>().size(), 1);

    delete registry;

    QCOMPARE(surface.parentWidget(), nullptr);
    QCOMPARE(window.findChildren<PortalOverlay *>().size(), 0);
}

QTEST_MAIN(PortalRegistryTest)
