/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PORTALHOST_H
#define PORTALHOST_H

#include <QList>
#include <QObject>
#include <QPoint>
#include <QPointer>

#include "portal/PortalBinding.h"
#include "tesseraprivate_export.h"

class QWidget;

namespace Tessera
{

class HostedSurface;
class PortalOverlay;

/**
 * Hosts persistent surfaces for one top-level window.
 *
 * The layout tree only contains cheap anchor widgets that come and go
 * as tabs and splits are rebuilt.  The host keeps the real surfaces in a
 * PortalOverlay stacked above the window content and moves each one over
 * the anchor it is bound to, so a surface is never destroyed or
 * reparented into the churning layout tree.
 *
 * Every operation is a silent no-op when the window, the anchor or the
 * surface has gone away; stale bindings are pruned lazily.
 */
class TESSERAPRIVATE_EXPORT PortalHost : public QObject
{
    Q_OBJECT

public:
    explicit PortalHost(QWidget *window, QObject *parent = nullptr);
    ~PortalHost() override;

    // Cap on synchronize requests served back to back from inside a running pass.
    static constexpr int MaxSynchronizePasses = 8;

    void bind(HostedSurface *surface, QWidget *anchor, bool visibleRequested, int zPriority = 0);
    void detach(HostedSurface *surface);

    /** Hides the surface but keeps its binding; it may come back later. */
    void hide(HostedSurface *surface);

    /** Updates the requested visibility without touching the binding or the surface. */
    void setVisibilityOnly(HostedSurface *surface, bool visibleRequested);

    /**
     * Re-places the surface bound to @p anchor, then every other bound
     * surface, and queues one more full pass for the next event loop
     * iteration.
     */
    void synchronize(QWidget *anchor);

    /** Topmost visible bound surface at @p windowPos, in window coordinates. */
    HostedSurface *hitTest(const QPoint &windowPos);

    /** The deepest child of the surface hit at @p windowPos, or the surface itself. */
    QWidget *widgetAt(const QPoint &windowPos);

    void pruneDeadEntries();

    /** Detaches every surface and removes the overlay from the window. */
    void tearDown();

    /** Keeps @p widget, a sibling of the overlay, stacked above it. */
    void setForegroundWidget(QWidget *widget);

    QWidget *window() const;
    PortalOverlay *overlay() const;
    QWidget *contentContainer() const;

    bool isBound(HostedSurface *surface) const;
    QList<HostedSurface *> boundSurfaces() const;
    int bindingCount() const;
    const PortalBindingIndex &index() const;

    bool hasPendingFullSync() const
    {
        return _deferredFullSyncScheduled;
    }

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    bool installOverlayIfNeeded();
    bool overlayNeedsRaise(QWidget *container, QWidget *reference) const;
    void detachBinding(HostedSurface *surface);
    void releaseSurface(HostedSurface *surface);
    void synchronizeSurface(HostedSurface *surface);
    void synchronizeAll(HostedSurface *skip);
    void synchronizeAnchor(QWidget *anchor);
    void runSynchronizePasses(QWidget *anchor);
    void flushPendingSynchronize();
    void scheduleDeferredFullSync();
    void runDeferredFullSync();
    void updateInputRegion();

    QPointer<QWidget> _window;
    QPointer<PortalOverlay> _overlay;
    QPointer<QWidget> _installedContainer;
    QPointer<QWidget> _installedReference;
    QPointer<QWidget> _foregroundWidget;

    PortalBindingIndex _index;

    bool _deferredFullSyncScheduled = false;

    // Re-entrant synchronize() calls park their anchor here instead of recursing.
    bool _synchronizing = false;
    bool _hasPendingSynchronize = false;
    QPointer<QWidget> _pendingSynchronizeAnchor;
};

} // namespace Tessera

#endif // PORTALHOST_H
