/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef PORTALOVERLAY_H
#define PORTALOVERLAY_H

#include <QList>
#include <QPointer>
#include <QRegion>
#include <QWidget>

#include "tesseraprivate_export.h"

namespace Tessera
{

class HostedSurface;

/**
 * The persistent layer a PortalHost installs above the window content.
 *
 * Hosted surfaces are its direct children; the child order is the
 * stacking order.  The overlay itself is see-through: its input region
 * only covers visible hosted surfaces, minus the split handles of the
 * content below so divider drags still reach them.
 */
class TESSERAPRIVATE_EXPORT PortalOverlay : public QWidget
{
    Q_OBJECT

public:
    explicit PortalOverlay(QWidget *parent = nullptr);
    ~PortalOverlay() override;

    // Extra reach around a split handle that keeps grabbing it reliable.
    static constexpr int SplitterHandleMargin = 5;

    /** The widget tree searched for split handles. */
    void setContentRoot(QWidget *contentRoot);

    QWidget *contentRoot() const
    {
        return _contentRoot;
    }

    /** Hosted surfaces ordered from the top of the stack to the bottom. */
    QList<HostedSurface *> surfacesTopToBottom() const;

    bool isTopmost(const HostedSurface *surface) const;

    /** Whether @p windowPos (top-level window coordinates) is on or next to a split handle. */
    bool isSplitterHandleAt(const QPoint &windowPos) const;

    /** Restricts input to @p visibleFrames (overlay coordinates) minus split handles. */
    void updateInputRegion(const QRegion &visibleFrames);

private:
    QRegion splitterHandleRegion(int margin) const;

    QPointer<QWidget> _contentRoot;
};

} // namespace Tessera

#endif // PORTALOVERLAY_H
