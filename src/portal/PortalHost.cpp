/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "portal/PortalHost.h"

#include "portal/HostedSurface.h"
#include "portal/PortalGeometry.h"
#include "portal/PortalOverlay.h"

#include <QEvent>
#include <QLoggingCategory>
#include <QMainWindow>
#include <QRegion>
#include <QScopedValueRollback>
#include <QTimer>

#include <optional>
#include <utility>

Q_LOGGING_CATEGORY(lcPortal, "tessera.portal")

namespace Tessera
{

// The overlay goes into @p container, directly above @p reference.  For a
// QMainWindow that is the central widget; any other window is its own
// content and the overlay covers all of it.
static bool installationTarget(QWidget *window, QWidget *&container, QWidget *&reference)
{
    if (auto *mainWindow = qobject_cast<QMainWindow *>(window)) {
        container = mainWindow;
        reference = mainWindow->centralWidget();
        return reference != nullptr;
    }
    container = window;
    reference = window;
    return true;
}

PortalHost::PortalHost(QWidget *window, QObject *parent)
    : QObject(parent)
    , _window(window)
{
    installOverlayIfNeeded();
}

PortalHost::~PortalHost()
{
    tearDown();
}

QWidget *PortalHost::window() const
{
    return _window;
}

PortalOverlay *PortalHost::overlay() const
{
    return _overlay;
}

QWidget *PortalHost::contentContainer() const
{
    return _installedReference;
}

bool PortalHost::isBound(HostedSurface *surface) const
{
    return _index.contains(surface);
}

QList<HostedSurface *> PortalHost::boundSurfaces() const
{
    return _index.surfaces();
}

int PortalHost::bindingCount() const
{
    return _index.count();
}

const PortalBindingIndex &PortalHost::index() const
{
    return _index;
}

bool PortalHost::installOverlayIfNeeded()
{
    if (!_window) {
        return false;
    }

    QWidget *container = nullptr;
    QWidget *reference = nullptr;
    if (!installationTarget(_window, container, reference)) {
        return false;
    }

    if (!_overlay) {
        _overlay = new PortalOverlay(container);
        qCDebug(lcPortal) << "overlay created for" << _window.data();
    }

    if (_overlay->parentWidget() != container || _installedContainer != container || _installedReference != reference) {
        if (_installedReference && _installedReference != reference) {
            _installedReference->removeEventFilter(this);
        }
        if (_overlay->parentWidget() != container) {
            _overlay->setParent(container);
        }
        _overlay->setContentRoot(reference);
        _overlay->raise();
        reference->installEventFilter(this);

        _installedContainer = container;
        _installedReference = reference;
        qCDebug(lcPortal) << "overlay installed in" << container << "above" << reference;
    } else if (overlayNeedsRaise(container, reference)) {
        _overlay->raise();
    }

    const QRect overlayGeometry = (reference == container) ? container->rect() : reference->geometry();
    if (_overlay->geometry() != overlayGeometry) {
        _overlay->setGeometry(overlayGeometry);
    }

    if (_foregroundWidget && _foregroundWidget->parentWidget() == container) {
        const QObjectList &siblings = container->children();
        if (siblings.indexOf(_foregroundWidget.data()) < siblings.indexOf(_overlay.data())) {
            _foregroundWidget->raise();
        }
    }

    return true;
}

bool PortalHost::overlayNeedsRaise(QWidget *container, QWidget *reference) const
{
    const QObjectList &siblings = container->children();
    const int overlayIndex = siblings.indexOf(_overlay.data());

    if (reference != container) {
        return overlayIndex < siblings.indexOf(reference);
    }

    // The window is its own content: only the foreground widget may sit above the overlay.
    for (int i = overlayIndex + 1; i < siblings.size(); ++i) {
        auto *sibling = qobject_cast<QWidget *>(siblings.at(i));
        if (sibling && sibling != _foregroundWidget && !sibling->isWindow()) {
            return true;
        }
    }
    return false;
}

void PortalHost::setForegroundWidget(QWidget *widget)
{
    _foregroundWidget = widget;
    installOverlayIfNeeded();
}

void PortalHost::bind(HostedSurface *surface, QWidget *anchor, bool visibleRequested, int zPriority)
{
    if (!surface || !anchor) {
        return;
    }
    if (!installOverlayIfNeeded()) {
        qCDebug(lcPortal) << "bind skipped, missing window for" << surface;
        return;
    }

    std::optional<PortalBinding> previous;
    const PortalBinding *existing = _index.binding(surface);
    if (existing && existing->surface) {
        previous = *existing;
    }

    const std::optional<PortalBinding> displaced = _index.insert(surface, anchor, visibleRequested, zPriority);
    if (displaced) {
        qCDebug(lcPortal) << "bind replaces" << displaced->surface.data() << "on" << anchor << "with" << surface;
        releaseSurface(displaced->surface);
    }

    const bool raise = PortalGeometry::shouldRaise(previous ? &previous.value() : nullptr, visibleRequested, zPriority);
    if (!previous || previous->anchor != anchor || raise) {
        qCDebug(lcPortal) << "bind" << surface << "anchor" << anchor << "visible" << visibleRequested << "z" << zPriority
                          << "previous anchor" << (previous ? previous->anchor.data() : nullptr);
    }

    if (surface->parentWidget() != _overlay) {
        qCDebug(lcPortal) << "reparent" << surface << "from" << surface->parentWidget();
        // Appended last, so it lands on top of the overlay.
        surface->setParent(_overlay);
    } else if (raise && !_overlay->isTopmost(surface)) {
        // Anchor churn during split rebuilds must not restack: a remove/insert
        // bounce flashes the surface.
        qCDebug(lcPortal) << "raise" << surface;
        surface->raise();
    }

    {
        QScopedValueRollback<bool> guard(_synchronizing, true);
        synchronizeSurface(surface);
    }
    pruneDeadEntries();
    updateInputRegion();

    if (!_synchronizing) {
        flushPendingSynchronize();
    }
}

void PortalHost::detach(HostedSurface *surface)
{
    detachBinding(surface);
    updateInputRegion();
}

void PortalHost::detachBinding(HostedSurface *surface)
{
    const std::optional<PortalBinding> binding = _index.take(surface);
    if (!binding) {
        return;
    }
    qCDebug(lcPortal) << "detach" << binding->surface.data() << "anchor" << binding->anchor.data();
    releaseSurface(binding->surface);
}

void PortalHost::releaseSurface(HostedSurface *surface)
{
    if (surface && _overlay && surface->parentWidget() == _overlay) {
        surface->setParent(nullptr);
    }
}

void PortalHost::hide(HostedSurface *surface)
{
    PortalBinding *binding = _index.binding(surface);
    if (!binding || !binding->visibleRequested) {
        return;
    }
    binding->visibleRequested = false;
    if (binding->surface) {
        qCDebug(lcPortal) << "hide" << binding->surface.data();
        binding->surface->setHidden(true);
    }
    updateInputRegion();
}

void PortalHost::setVisibilityOnly(HostedSurface *surface, bool visibleRequested)
{
    PortalBinding *binding = _index.binding(surface);
    if (!binding) {
        return;
    }
    binding->visibleRequested = visibleRequested;
}

void PortalHost::synchronize(QWidget *anchor)
{
    if (!anchor) {
        return;
    }
    if (_synchronizing) {
        _pendingSynchronizeAnchor = anchor;
        _hasPendingSynchronize = true;
        return;
    }
    runSynchronizePasses(anchor);
}

void PortalHost::runSynchronizePasses(QWidget *anchor)
{
    QScopedValueRollback<bool> guard(_synchronizing, true);

    QPointer<QWidget> next(anchor);
    for (int passes = 1;; ++passes) {
        synchronizeAnchor(next);
        if (!_hasPendingSynchronize) {
            break;
        }
        if (passes >= MaxSynchronizePasses) {
            qCWarning(lcPortal) << "synchronize re-entered" << passes << "times in a row, leaving the rest to the deferred pass";
            _hasPendingSynchronize = false;
            _pendingSynchronizeAnchor.clear();
            break;
        }
        next = _pendingSynchronizeAnchor;
        _pendingSynchronizeAnchor.clear();
        _hasPendingSynchronize = false;
    }
}

void PortalHost::flushPendingSynchronize()
{
    if (!_hasPendingSynchronize) {
        return;
    }
    QPointer<QWidget> next = _pendingSynchronizeAnchor;
    _pendingSynchronizeAnchor.clear();
    _hasPendingSynchronize = false;
    runSynchronizePasses(next);
}

void PortalHost::synchronizeAnchor(QWidget *anchor)
{
    if (!installOverlayIfNeeded()) {
        qCDebug(lcPortal) << "synchronize skipped, missing window";
        return;
    }
    pruneDeadEntries();

    HostedSurface *primary = anchor ? _index.surfaceForAnchor(anchor) : nullptr;
    if (primary) {
        synchronizeSurface(primary);
    }

    // A single divider drag can move a sibling anchor without it ever
    // reporting a geometry change.
    synchronizeAll(primary);
    scheduleDeferredFullSync();
    updateInputRegion();
}

void PortalHost::synchronizeAll(HostedSurface *skip)
{
    const QList<HostedSurface *> surfaces = _index.surfaces();
    for (HostedSurface *surface : surfaces) {
        if (surface != skip) {
            synchronizeSurface(surface);
        }
    }
}

void PortalHost::synchronizeSurface(HostedSurface *surface)
{
    const PortalBinding *binding = _index.binding(surface);
    if (!binding) {
        return;
    }

    HostedSurface *hosted = binding->surface;
    if (!hosted) {
        qCDebug(lcPortal) << "dropping binding of a deleted surface";
        _index.take(surface);
        return;
    }

    QWidget *anchor = binding->anchor;
    if (!anchor || !_window || !_overlay) {
        const std::optional<bool> hidden = PortalGeometry::hiddenWithoutAnchor(binding->visibleRequested);
        if (hidden && hosted->isHidden() != *hidden) {
            qCDebug(lcPortal) << "hidden" << hosted << *hidden << "missing anchor or window";
            hosted->setHidden(*hidden);
        }
        return;
    }

    PortalGeometry::Placement placement;
    if (anchor->window() != _window) {
        placement = PortalGeometry::placeInOtherWindow();
    } else {
        placement = PortalGeometry::place(PortalGeometry::rectInWindow(anchor, _window),
                                          PortalGeometry::rectInWindow(_overlay, _window),
                                          PortalGeometry::isHiddenOrAncestorHidden(anchor, _window),
                                          binding->visibleRequested);
    }

    PortalGeometry::apply(hosted, placement);
}

void PortalHost::scheduleDeferredFullSync()
{
    if (_deferredFullSyncScheduled) {
        return;
    }
    _deferredFullSyncScheduled = true;
    QTimer::singleShot(0, this, &PortalHost::runDeferredFullSync);
}

void PortalHost::runDeferredFullSync()
{
    _deferredFullSyncScheduled = false;
    if (_index.isEmpty() || !installOverlayIfNeeded()) {
        return;
    }

    {
        QScopedValueRollback<bool> guard(_synchronizing, true);
        pruneDeadEntries();
        synchronizeAll(nullptr);
        updateInputRegion();
    }

    if (!_synchronizing) {
        flushPendingSynchronize();
    }
}

void PortalHost::pruneDeadEntries()
{
    QList<HostedSurface *> dead;

    const QList<HostedSurface *> surfaces = _index.surfaces();
    for (HostedSurface *surface : surfaces) {
        const PortalBinding *binding = _index.binding(surface);
        if (!binding->isAlive()) {
            dead.append(surface);
            continue;
        }

        QWidget *anchor = binding->anchor;
        if (!_window || !anchor->parentWidget() || anchor->window() != _window) {
            dead.append(surface);
            continue;
        }
        if (_installedReference && _installedReference != anchor && !_installedReference->isAncestorOf(anchor)) {
            dead.append(surface);
        }
    }

    for (HostedSurface *surface : std::as_const(dead)) {
        qCDebug(lcPortal) << "pruning stale binding";
        detachBinding(surface);
    }

    _index.dropStaleAnchors();
}

HostedSurface *PortalHost::hitTest(const QPoint &windowPos)
{
    if (!installOverlayIfNeeded()) {
        return nullptr;
    }
    if (_overlay->isSplitterHandleAt(windowPos)) {
        return nullptr;
    }

    const QPoint point = _overlay->mapFrom(_window, windowPos);

    // Only bound surfaces count; a detached one that is still alive must not take input.
    const QList<HostedSurface *> surfaces = _overlay->surfacesTopToBottom();
    for (HostedSurface *surface : surfaces) {
        if (!_index.contains(surface) || surface->isHidden()) {
            continue;
        }
        if (surface->geometry().contains(point)) {
            return surface;
        }
    }

    return nullptr;
}

QWidget *PortalHost::widgetAt(const QPoint &windowPos)
{
    HostedSurface *surface = hitTest(windowPos);
    if (!surface) {
        return nullptr;
    }
    QWidget *child = surface->childAt(surface->mapFrom(_window, windowPos));
    return child ? child : surface;
}

void PortalHost::updateInputRegion()
{
    if (!_overlay) {
        return;
    }

    QRegion visibleFrames;
    const QList<HostedSurface *> surfaces = _overlay->surfacesTopToBottom();
    for (HostedSurface *surface : surfaces) {
        if (_index.contains(surface) && !surface->isHidden()) {
            visibleFrames += surface->geometry();
        }
    }
    _overlay->updateInputRegion(visibleFrames);
}

bool PortalHost::eventFilter(QObject *watched, QEvent *event)
{
    if (watched == _installedReference) {
        switch (event->type()) {
        case QEvent::Resize:
        case QEvent::Move:
            installOverlayIfNeeded();
            if (!_index.isEmpty()) {
                scheduleDeferredFullSync();
            }
            break;
        default:
            break;
        }
    }
    return QObject::eventFilter(watched, event);
}

void PortalHost::tearDown()
{
    const QList<HostedSurface *> surfaces = _index.surfaces();
    for (HostedSurface *surface : surfaces) {
        detachBinding(surface);
    }
    _index.clear();

    if (_installedReference) {
        _installedReference->removeEventFilter(this);
    }
    delete _overlay.data();

    _installedContainer.clear();
    _installedReference.clear();
}

} // namespace Tessera

#include "moc_PortalHost.cpp"
