/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "portal/PortalOverlay.h"

#include "portal/HostedSurface.h"

#include <QSplitter>
#include <QSplitterHandle>

namespace Tessera
{

PortalOverlay::PortalOverlay(QWidget *parent)
    : QWidget(parent)
{
    setObjectName(QStringLiteral("PortalOverlay"));
    setAttribute(Qt::WA_NoSystemBackground);
    setAutoFillBackground(false);
    setFocusPolicy(Qt::NoFocus);
}

PortalOverlay::~PortalOverlay()
{
    // Surfaces belong to the application; give them back before QWidget
    // deletes its children.
    const auto surfaces = findChildren<HostedSurface *>(QString(), Qt::FindDirectChildrenOnly);
    for (HostedSurface *surface : surfaces) {
        surface->setParent(nullptr);
    }
}

void PortalOverlay::setContentRoot(QWidget *contentRoot)
{
    _contentRoot = contentRoot;
}

QList<HostedSurface *> PortalOverlay::surfacesTopToBottom() const
{
    QList<HostedSurface *> surfaces;
    const QObjectList &childList = children();
    for (auto it = childList.crbegin(); it != childList.crend(); ++it) {
        if (auto *surface = qobject_cast<HostedSurface *>(*it)) {
            surfaces.append(surface);
        }
    }
    return surfaces;
}

bool PortalOverlay::isTopmost(const HostedSurface *surface) const
{
    const QList<HostedSurface *> surfaces = surfacesTopToBottom();
    return !surfaces.isEmpty() && surfaces.first() == surface;
}

QRegion PortalOverlay::splitterHandleRegion(int margin) const
{
    QRegion region;
    if (!_contentRoot) {
        return region;
    }

    QWidget *topLevel = window();
    const auto splitters = _contentRoot->findChildren<QSplitter *>();
    for (QSplitter *splitter : splitters) {
        // Splitters inside hosted surfaces are the surface's own business.
        if (isAncestorOf(splitter) || !splitter->isVisibleTo(topLevel)) {
            continue;
        }

        const bool horizontal = splitter->orientation() == Qt::Horizontal;
        // handle(0) sits before the first widget and is never shown.
        for (int i = 1; i < splitter->count(); ++i) {
            QSplitterHandle *handle = splitter->handle(i);
            if (!handle || handle->isHidden()) {
                continue;
            }
            const QWidget *before = splitter->widget(i - 1);
            const QWidget *after = splitter->widget(i);
            const int beforeExtent = horizontal ? before->width() : before->height();
            const int afterExtent = horizontal ? after->width() : after->height();
            if (beforeExtent <= 1 || afterExtent <= 1) {
                continue;
            }

            const QRect handleRect(handle->mapTo(topLevel, QPoint(0, 0)), handle->size());
            region += handleRect.adjusted(-margin, -margin, margin, margin);
        }
    }

    return region.translated(-mapTo(topLevel, QPoint(0, 0)));
}

bool PortalOverlay::isSplitterHandleAt(const QPoint &windowPos) const
{
    return splitterHandleRegion(SplitterHandleMargin).contains(mapFrom(window(), windowPos));
}

void PortalOverlay::updateInputRegion(const QRegion &visibleFrames)
{
    // Only the handles themselves are cut out; the margin would also clip painting.
    const QRegion inputRegion = visibleFrames.intersected(rect()).subtracted(splitterHandleRegion(0));
    if (inputRegion.isEmpty()) {
        // An empty mask means "no mask" to QWidget; there is nothing to show anyway.
        clearMask();
        hide();
        return;
    }
    setMask(inputRegion);
    show();
}

} // namespace Tessera

#include "moc_PortalOverlay.cpp"
