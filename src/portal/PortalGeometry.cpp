/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "portal/PortalGeometry.h"

#include "portal/HostedSurface.h"
#include "portal/PortalBinding.h"

#include <QLoggingCategory>
#include <QWidget>
#include <QtMath>

Q_LOGGING_CATEGORY(lcPortalGeometry, "tessera.portal.geometry")

namespace Tessera
{

static bool isTiny(const QRectF &frame)
{
    return frame.width() <= PortalGeometry::MinimumExtent || frame.height() <= PortalGeometry::MinimumExtent;
}

PortalGeometry::Placement PortalGeometry::place(const QRectF &anchorInWindow, const QRectF &hostInWindow, bool anchorHidden, bool visibleRequested)
{
    Placement placement;
    placement.frame = anchorInWindow.translated(-hostInWindow.topLeft());

    const QRectF &frame = placement.frame;
    placement.hasFrame = qIsFinite(frame.x()) && qIsFinite(frame.y()) && qIsFinite(frame.width()) && qIsFinite(frame.height());

    if (!visibleRequested) {
        placement.hiddenReasons |= VisibilityNotRequested;
    }
    if (anchorHidden) {
        placement.hiddenReasons |= AnchorHidden;
    }
    if (!placement.hasFrame) {
        placement.hiddenReasons |= NonFiniteFrame;
        return placement;
    }
    if (isTiny(frame)) {
        placement.hiddenReasons |= TinyFrame;
    }
    const QRectF hostBounds(QPointF(0, 0), hostInWindow.size());
    if (!frame.intersects(hostBounds)) {
        placement.hiddenReasons |= OutsideHost;
    }

    return placement;
}

PortalGeometry::Placement PortalGeometry::placeInOtherWindow()
{
    Placement placement;
    placement.hiddenReasons = AnchorInOtherWindow;
    return placement;
}

std::optional<bool> PortalGeometry::hiddenWithoutAnchor(bool visibleRequested)
{
    if (!visibleRequested) {
        return true;
    }
    return std::nullopt;
}

bool PortalGeometry::isApproximatelyEqual(const QRectF &lhs, const QRectF &rhs, qreal epsilon)
{
    return qAbs(lhs.x() - rhs.x()) <= epsilon && qAbs(lhs.y() - rhs.y()) <= epsilon && qAbs(lhs.width() - rhs.width()) <= epsilon
        && qAbs(lhs.height() - rhs.height()) <= epsilon;
}

bool PortalGeometry::sizeDiffers(const QRectF &lhs, const QRectF &rhs, qreal epsilon)
{
    return qAbs(lhs.width() - rhs.width()) > epsilon || qAbs(lhs.height() - rhs.height()) > epsilon;
}

bool PortalGeometry::shouldRaise(const PortalBinding *previous, bool visibleRequested, int zPriority)
{
    if (!previous) {
        return true;
    }
    const bool becameVisible = !previous->visibleRequested && visibleRequested;
    const bool priorityIncreased = zPriority > previous->zPriority;
    return becameVisible || priorityIncreased;
}

QRectF PortalGeometry::rectInWindow(const QWidget *widget, const QWidget *window)
{
    if (widget == window) {
        return QRectF(QPointF(0, 0), QSizeF(window->size()));
    }
    return QRectF(QPointF(widget->mapTo(window, QPoint(0, 0))), QSizeF(widget->size()));
}

bool PortalGeometry::isHiddenOrAncestorHidden(const QWidget *widget, const QWidget *window)
{
    if (widget == window) {
        return false;
    }
    return !widget->isVisibleTo(window);
}

PortalGeometry::AppliedChanges PortalGeometry::apply(HostedSurface *surface, const Placement &placement)
{
    AppliedChanges changes;

    if (placement.hasFrame) {
        const QRectF oldFrame(surface->geometry());
        if (!isApproximatelyEqual(oldFrame, placement.frame)) {
            if (!isTiny(oldFrame) && isTiny(placement.frame)) {
                qCDebug(lcPortalGeometry) << "frame collapse" << surface << oldFrame << "->" << placement.frame;
            } else if (isTiny(oldFrame) && !isTiny(placement.frame)) {
                qCDebug(lcPortalGeometry) << "frame restore" << surface << oldFrame << "->" << placement.frame;
            }

            surface->setGeometry(placement.frame.toRect());
            changes |= FrameChanged;

            // Resize events are only queued for hidden widgets; make the surface relayout now.
            if (sizeDiffers(oldFrame, placement.frame)) {
                surface->reconcileGeometry();
                changes |= Resized;
            }
        }
    }

    const bool hidden = placement.isHidden();
    if (surface->isHidden() != hidden) {
        qCDebug(lcPortalGeometry) << "hidden" << surface << hidden << "reasons" << placement.hiddenReasons << "frame" << placement.frame;
        surface->setHidden(hidden);
        changes |= VisibilityChanged;
    }

    return changes;
}

} // namespace Tessera
