/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PORTALGEOMETRY_H
#define PORTALGEOMETRY_H

#include <QFlags>
#include <QRectF>

#include <optional>

#include "tesseraprivate_export.h"

class QWidget;

namespace Tessera
{

class HostedSurface;
struct PortalBinding;

/**
 * Stateless placement rules for hosted surfaces.
 *
 * All rectangles passed in are in the coordinate space of the top-level
 * window; the computed frame is local to the portal overlay.
 */
class TESSERAPRIVATE_EXPORT PortalGeometry
{
public:
    enum HiddenReason {
        NotHidden = 0x00,
        VisibilityNotRequested = 0x01,
        AnchorHidden = 0x02,
        TinyFrame = 0x04,
        NonFiniteFrame = 0x08,
        OutsideHost = 0x10,
        AnchorInOtherWindow = 0x20,
    };
    Q_DECLARE_FLAGS(HiddenReasons, HiddenReason)

    enum AppliedChange {
        NoChange = 0x00,
        FrameChanged = 0x01,
        Resized = 0x02,
        VisibilityChanged = 0x04,
    };
    Q_DECLARE_FLAGS(AppliedChanges, AppliedChange)

    struct Placement {
        QRectF frame;
        bool hasFrame = false;
        HiddenReasons hiddenReasons;

        bool isHidden() const
        {
            return hiddenReasons.toInt() != 0;
        }
    };

    // Frames closer than this in every dimension are treated as equal.
    static constexpr qreal FrameEpsilon = 0.5;
    // A width or height at or below this is a transitional layout state, not a real size.
    static constexpr qreal MinimumExtent = 1.0;

    static Placement place(const QRectF &anchorInWindow, const QRectF &hostInWindow, bool anchorHidden, bool visibleRequested);

    /** Placement for an anchor that lives in another window than the host. */
    static Placement placeInOtherWindow();

    /**
     * Hidden state for a binding whose anchor (or window) is missing.
     * Returns std::nullopt when the current state must be left alone: a
     * caller may have announced visibility before its new anchor exists.
     */
    static std::optional<bool> hiddenWithoutAnchor(bool visibleRequested);

    static bool isApproximatelyEqual(const QRectF &lhs, const QRectF &rhs, qreal epsilon = FrameEpsilon);
    static bool sizeDiffers(const QRectF &lhs, const QRectF &rhs, qreal epsilon = FrameEpsilon);

    /**
     * Whether a (re)bound surface goes to the top of the overlay.  Only a
     * new binding, a hidden-to-visible request or a raised z-priority
     * restacks; anchor churn alone never does.
     */
    static bool shouldRaise(const PortalBinding *previous, bool visibleRequested, int zPriority);

    static QRectF rectInWindow(const QWidget *widget, const QWidget *window);
    static bool isHiddenOrAncestorHidden(const QWidget *widget, const QWidget *window);

    /** Writes @p placement to @p surface, touching only what actually changed. */
    static AppliedChanges apply(HostedSurface *surface, const Placement &placement);
};

Q_DECLARE_OPERATORS_FOR_FLAGS(PortalGeometry::HiddenReasons)
Q_DECLARE_OPERATORS_FOR_FLAGS(PortalGeometry::AppliedChanges)

} // namespace Tessera

#endif // PORTALGEOMETRY_H
