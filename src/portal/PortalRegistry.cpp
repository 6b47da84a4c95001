/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "portal/PortalRegistry.h"

#include "portal/HostedSurface.h"
#include "portal/PortalHost.h"

#include <QEvent>
#include <QLoggingCategory>
#include <QPointer>
#include <QTimer>
#include <QWidget>

Q_LOGGING_CATEGORY(lcPortalRegistry, "tessera.portal.registry")

namespace Tessera
{

PortalRegistry::PortalRegistry(QObject *parent)
    : QObject(parent)
{
}

PortalRegistry::~PortalRegistry()
{
    // Windows that died already removed themselves through destroyed().
    const auto windows = _hosts.keys();
    for (QWidget *window : windows) {
        removeHost(window, true);
    }
}

QWidget *PortalRegistry::windowForAnchor(const QWidget *anchor)
{
    if (!anchor || anchor->isWindow()) {
        return nullptr;
    }
    return anchor->window();
}

PortalHost *PortalRegistry::hostForWindow(QWidget *window) const
{
    return _hosts.value(window, nullptr);
}

QWidget *PortalRegistry::windowForSurface(HostedSurface *surface) const
{
    return _surfaceWindows.value(surface, nullptr);
}

QList<PortalHost *> PortalRegistry::hosts() const
{
    return _hosts.values();
}

PortalHost *PortalRegistry::hostFor(QWidget *window)
{
    if (PortalHost *existing = _hosts.value(window, nullptr)) {
        return existing;
    }

    auto *host = new PortalHost(window, this);
    _hosts.insert(window, host);

    window->installEventFilter(this);
    connect(window, &QObject::destroyed, this, [this, window]() {
        removeHost(window, false);
    });

    qCDebug(lcPortalRegistry) << "host created for" << window;
    Q_EMIT hostAdded(host);
    return host;
}

void PortalRegistry::bind(HostedSurface *surface, QWidget *anchor, bool visibleRequested, int zPriority)
{
    if (!surface) {
        return;
    }

    QWidget *window = windowForAnchor(anchor);
    if (!window) {
        qCDebug(lcPortalRegistry) << "bind skipped, anchor is not in a window" << anchor;
        return;
    }

    // A tab dragged into another window takes its surfaces along.
    QWidget *previousWindow = _surfaceWindows.value(surface, nullptr);
    if (previousWindow && previousWindow != window) {
        if (PortalHost *previousHost = _hosts.value(previousWindow, nullptr)) {
            qCDebug(lcPortalRegistry) << "moving" << surface << "from" << previousWindow << "to" << window;
            previousHost->detach(surface);
        }
    }

    PortalHost *host = hostFor(window);
    host->bind(surface, anchor, visibleRequested, zPriority);
    recordSurfaceWindow(surface, window);
    pruneSurfaceWindows(window, host);
}

void PortalRegistry::recordSurfaceWindow(HostedSurface *surface, QWidget *window)
{
    // Records are only ever dropped together with this connection.
    if (!_surfaceWindows.contains(surface)) {
        connect(surface, &QObject::destroyed, this, [this, surface]() {
            _surfaceWindows.remove(surface);
        });
    }
    _surfaceWindows.insert(surface, window);
}

void PortalRegistry::pruneSurfaceWindows(QWidget *window, const PortalHost *host)
{
    for (auto it = _surfaceWindows.begin(); it != _surfaceWindows.end();) {
        if (it.value() == window && !host->isBound(it.key())) {
            disconnect(it.key(), &QObject::destroyed, this, nullptr);
            it = _surfaceWindows.erase(it);
        } else {
            ++it;
        }
    }
}

void PortalRegistry::detach(HostedSurface *surface)
{
    QWidget *window = _surfaceWindows.take(surface);
    if (window) {
        disconnect(surface, &QObject::destroyed, this, nullptr);
    }
    if (PortalHost *host = _hosts.value(window, nullptr)) {
        host->detach(surface);
    }
}

void PortalRegistry::hide(HostedSurface *surface)
{
    if (PortalHost *host = _hosts.value(_surfaceWindows.value(surface, nullptr), nullptr)) {
        host->hide(surface);
    }
}

void PortalRegistry::setVisibilityOnly(HostedSurface *surface, bool visibleRequested)
{
    if (PortalHost *host = _hosts.value(_surfaceWindows.value(surface, nullptr), nullptr)) {
        host->setVisibilityOnly(surface, visibleRequested);
    }
}

void PortalRegistry::synchronize(QWidget *anchor)
{
    QWidget *window = windowForAnchor(anchor);
    if (!window) {
        return;
    }
    hostFor(window)->synchronize(anchor);
}

HostedSurface *PortalRegistry::hitTest(const QPoint &windowPos, QWidget *window)
{
    if (!window) {
        return nullptr;
    }
    return hostFor(window)->hitTest(windowPos);
}

QWidget *PortalRegistry::widgetAt(const QPoint &windowPos, QWidget *window)
{
    if (!window) {
        return nullptr;
    }
    return hostFor(window)->widgetAt(windowPos);
}

void PortalRegistry::removeWindow(QWidget *window)
{
    if (!window) {
        return;
    }
    removeHost(window, true);
}

void PortalRegistry::removeHost(QWidget *window, bool windowAlive)
{
    PortalHost *host = _hosts.take(window);
    if (host) {
        // The window may be half destroyed here; only its address is used.
        qCDebug(lcPortalRegistry) << "tearing down host for window" << static_cast<const void *>(window);
        host->tearDown();
        delete host;
    }

    for (auto it = _surfaceWindows.begin(); it != _surfaceWindows.end();) {
        if (it.value() == window) {
            disconnect(it.key(), &QObject::destroyed, this, nullptr);
            it = _surfaceWindows.erase(it);
        } else {
            ++it;
        }
    }

    if (windowAlive) {
        window->removeEventFilter(this);
        disconnect(window, &QObject::destroyed, this, nullptr);
    }

    if (host) {
        Q_EMIT hostRemoved(window);
    }
}

bool PortalRegistry::eventFilter(QObject *watched, QEvent *event)
{
    if (event->type() == QEvent::Close) {
        auto *window = qobject_cast<QWidget *>(watched);
        if (window && _hosts.contains(window)) {
            // The window can still reject the close; look again once it has been handled.
            QPointer<QWidget> guard(window);
            QTimer::singleShot(0, this, [this, guard]() {
                if (guard && !guard->isVisible()) {
                    removeWindow(guard);
                }
            });
        }
    }
    return QObject::eventFilter(watched, event);
}

} // namespace Tessera

#include "moc_PortalRegistry.cpp"
