/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PORTALREGISTRYTEST_H
#define PORTALREGISTRYTEST_H

#include <QObject>

namespace Tessera
{
class PortalRegistryTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testBindCreatesOneHostPerWindow();
    void testBindWithoutWindowIsNoop();
    void testSynchronizeCreatesHost();
    void testMigrationBetweenWindows();
    void testWindowAgnosticDispatch();
    void testDetachForgetsSurface();
    void testWindowDestroyedTearsDownHost();
    void testWindowCloseTearsDownHost();
    void testRejectedCloseKeepsHost();
    void testRemoveWindow();
    void testSurfaceDestroyedDropsRecord();
    void testSurfaceConnectionsDoNotAccumulate();
    void testRegistryDestructionReleasesSurfaces();
};
}

#endif // PORTALREGISTRYTEST_H
