/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SURFACEANCHOR_H
#define SURFACEANCHOR_H

#include <QPointer>
#include <QWidget>

#include "tesseraprivate_export.h"

namespace Tessera
{

class HostedSurface;
class PortalRegistry;

/**
 * An empty placeholder that stands in for a hosted surface inside a
 * layout tree.
 *
 * The anchor binds its surface through the registry once it is part of a
 * window, and asks for a resync whenever it is moved, resized, shown or
 * hidden.  Anchors are cheap; split and tab rebuilds may destroy and
 * recreate them at will.
 */
class TESSERAPRIVATE_EXPORT SurfaceAnchor : public QWidget
{
    Q_OBJECT

public:
    explicit SurfaceAnchor(PortalRegistry *registry, QWidget *parent = nullptr);

    void setSurface(HostedSurface *surface, bool visibleInUI = true, int zPriority = 0);
    HostedSurface *surface() const;

    void setVisibleInUI(bool visibleInUI);

    bool isVisibleInUI() const
    {
        return _visibleInUI;
    }

    void setZPriority(int zPriority);

    int zPriority() const
    {
        return _zPriority;
    }

    /** Hides the surface but keeps it bound to this anchor. */
    void unmount();

    /** Detaches the surface and forgets it. */
    void clearSurface();

Q_SIGNALS:
    void geometryChanged();

protected:
    bool event(QEvent *event) override;

private:
    void rebind();

    QPointer<PortalRegistry> _registry;
    QPointer<HostedSurface> _surface;
    bool _visibleInUI = true;
    int _zPriority = 0;
};

} // namespace Tessera

#endif // SURFACEANCHOR_H
