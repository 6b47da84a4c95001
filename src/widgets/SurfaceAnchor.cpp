/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "widgets/SurfaceAnchor.h"

#include "portal/HostedSurface.h"
#include "portal/PortalRegistry.h"

#include <QEvent>
#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcPortal)

namespace Tessera
{

SurfaceAnchor::SurfaceAnchor(PortalRegistry *registry, QWidget *parent)
    : QWidget(parent)
    , _registry(registry)
{
    setAttribute(Qt::WA_NoSystemBackground);
    setFocusPolicy(Qt::NoFocus);
}

HostedSurface *SurfaceAnchor::surface() const
{
    return _surface;
}

void SurfaceAnchor::setSurface(HostedSurface *surface, bool visibleInUI, int zPriority)
{
    _surface = surface;
    _visibleInUI = visibleInUI;
    _zPriority = zPriority;
    rebind();
}

void SurfaceAnchor::setVisibleInUI(bool visibleInUI)
{
    if (_visibleInUI == visibleInUI) {
        return;
    }
    _visibleInUI = visibleInUI;
    rebind();
}

void SurfaceAnchor::setZPriority(int zPriority)
{
    if (_zPriority == zPriority) {
        return;
    }
    _zPriority = zPriority;
    rebind();
}

void SurfaceAnchor::unmount()
{
    if (_registry && _surface) {
        _registry->hide(_surface);
    }
}

void SurfaceAnchor::clearSurface()
{
    if (_registry && _surface) {
        _registry->detach(_surface);
    }
    _surface.clear();
}

void SurfaceAnchor::rebind()
{
    if (!_registry || !_surface) {
        return;
    }

    if (PortalRegistry::windowForAnchor(this)) {
        _registry->bind(_surface, this, _visibleInUI, _zPriority);
    } else {
        // Not in a window yet; remember the requested visibility until we are.
        qCDebug(lcPortal) << "anchor" << this << "not attached, deferring bind of" << _surface.data();
        _registry->setVisibilityOnly(_surface, _visibleInUI);
    }
}

bool SurfaceAnchor::event(QEvent *event)
{
    switch (event->type()) {
    case QEvent::ParentChange:
    case QEvent::Show:
        rebind();
        break;
    case QEvent::Move:
    case QEvent::Resize:
    case QEvent::Hide:
        Q_EMIT geometryChanged();
        if (_registry && _surface) {
            _registry->synchronize(this);
        }
        break;
    default:
        break;
    }
    return QWidget::event(event);
}

} // namespace Tessera

#include "moc_SurfaceAnchor.cpp"
