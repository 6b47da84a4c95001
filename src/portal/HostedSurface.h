/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOSTEDSURFACE_H
#define HOSTEDSURFACE_H

#include <QSize>
#include <QWidget>

#include "tesseraprivate_export.h"

namespace Tessera
{

/**
 * A persistent rendering widget (a terminal display, a web view, ...)
 * that is hosted by a PortalHost instead of living inside the layout
 * tree.
 *
 * The application owns the surface.  The portal only reparents it into
 * its overlay, positions it and toggles its visibility; the surface keeps
 * its internal state across all of those moves.
 */
class TESSERAPRIVATE_EXPORT HostedSurface : public QWidget
{
    Q_OBJECT

public:
    explicit HostedSurface(QWidget *parent = nullptr);

    /**
     * Called by the portal after it changed the size of the surface.
     *
     * A geometry write on a hidden widget, or on one inside a window that
     * is not shown yet, only queues a resize event.  Subclasses that keep
     * a grid or a framebuffer sized to the widget must relayout here.
     */
    virtual void reconcileGeometry();

Q_SIGNALS:
    void geometryReconciled(const QSize &size);
};

} // namespace Tessera

#endif // HOSTEDSURFACE_H
