/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PORTALBINDING_H
#define PORTALBINDING_H

#include <QHash>
#include <QList>
#include <QPointer>
#include <QWidget>

#include <optional>

#include "portal/HostedSurface.h"
#include "tesseraprivate_export.h"

namespace Tessera
{

/**
 * One hosted surface placed over one anchor.  Neither side is owned:
 * the layout engine may delete the anchor and the application may delete
 * the surface at any time, which turns the binding stale.
 */
struct PortalBinding {
    QPointer<HostedSurface> surface;
    QPointer<QWidget> anchor;
    bool visibleRequested = false;
    int zPriority = 0;

    bool isAlive() const
    {
        return !surface.isNull() && !anchor.isNull();
    }
};

/**
 * Bidirectional surface <-> anchor lookup for one PortalHost.
 *
 * Keys are object identities only; they are never dereferenced.  A key
 * whose object died stays in the index until the host prunes it.
 */
class TESSERAPRIVATE_EXPORT PortalBindingIndex
{
public:
    /**
     * Records @p surface on @p anchor.  If another surface held the anchor
     * its binding is removed and returned so the caller can release it.
     * A surface moving to a new anchor drops the mapping of its old one.
     */
    std::optional<PortalBinding> insert(HostedSurface *surface, QWidget *anchor, bool visibleRequested, int zPriority);

    /** Removes the binding of @p surface.  Returns nothing if it was not bound. */
    std::optional<PortalBinding> take(HostedSurface *surface);

    PortalBinding *binding(HostedSurface *surface);
    const PortalBinding *binding(HostedSurface *surface) const;

    HostedSurface *surfaceForAnchor(QWidget *anchor) const;

    bool contains(HostedSurface *surface) const;
    QList<HostedSurface *> surfaces() const;

    int count() const
    {
        return _bindings.size();
    }

    bool isEmpty() const
    {
        return _bindings.isEmpty();
    }

    int anchorCount() const
    {
        return _surfaceByAnchor.size();
    }

    /** Keeps only anchor mappings whose binding still points at that anchor. */
    void dropStaleAnchors();

    void clear();

private:
    QHash<HostedSurface *, PortalBinding> _bindings;
    QHash<QWidget *, HostedSurface *> _surfaceByAnchor;
};

} // namespace Tessera

#endif // PORTALBINDING_H
