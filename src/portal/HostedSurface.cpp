/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "portal/HostedSurface.h"

#include <QLayout>

namespace Tessera
{

HostedSurface::HostedSurface(QWidget *parent)
    : QWidget(parent)
{
}

void HostedSurface::reconcileGeometry()
{
    if (QLayout *surfaceLayout = layout()) {
        surfaceLayout->activate();
    }
    updateGeometry();
    Q_EMIT geometryReconciled(size());
}

} // namespace Tessera

#include "moc_HostedSurface.cpp"
