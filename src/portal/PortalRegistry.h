/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PORTALREGISTRY_H
#define PORTALREGISTRY_H

#include <QHash>
#include <QList>
#include <QObject>
#include <QPoint>

#include "tesseraprivate_export.h"

class QWidget;

namespace Tessera
{

class HostedSurface;
class PortalHost;

/**
 * Routes portal operations to the PortalHost of the right window.
 *
 * Hosts are created on the first bind into a window and torn down when
 * that window closes.  Callers only deal with surfaces and anchors; the
 * registry remembers which window each surface lives in and moves it
 * when it gets bound into another one.
 */
class TESSERAPRIVATE_EXPORT PortalRegistry : public QObject
{
    Q_OBJECT

public:
    explicit PortalRegistry(QObject *parent = nullptr);
    ~PortalRegistry() override;

    void bind(HostedSurface *surface, QWidget *anchor, bool visibleRequested, int zPriority = 0);
    void detach(HostedSurface *surface);
    void hide(HostedSurface *surface);
    void setVisibilityOnly(HostedSurface *surface, bool visibleRequested);
    void synchronize(QWidget *anchor);

    HostedSurface *hitTest(const QPoint &windowPos, QWidget *window);
    QWidget *widgetAt(const QPoint &windowPos, QWidget *window);

    /** Tears down the host of @p window, detaching everything bound there. */
    void removeWindow(QWidget *window);

    PortalHost *hostForWindow(QWidget *window) const;
    QWidget *windowForSurface(HostedSurface *surface) const;
    QList<PortalHost *> hosts() const;

    int hostCount() const
    {
        return _hosts.size();
    }

    /** The top-level window an anchor is placed in, or nullptr while it is not attached. */
    static QWidget *windowForAnchor(const QWidget *anchor);

Q_SIGNALS:
    void hostAdded(PortalHost *host);
    void hostRemoved(QWidget *window);

protected:
    bool eventFilter(QObject *watched, QEvent *event) override;

private:
    PortalHost *hostFor(QWidget *window);
    void removeHost(QWidget *window, bool windowAlive);
    void pruneSurfaceWindows(QWidget *window, const PortalHost *host);
    void recordSurfaceWindow(HostedSurface *surface, QWidget *window);

    QHash<QWidget *, PortalHost *> _hosts;
    QHash<HostedSurface *, QWidget *> _surfaceWindows;
};

} // namespace Tessera

#endif // PORTALREGISTRY_H
