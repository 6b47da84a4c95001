/*
    SPDX-FileCopyrightText: 2026 Tessera contributors

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "portal/PortalBinding.h"

namespace Tessera
{

std::optional<PortalBinding> PortalBindingIndex::insert(HostedSurface *surface, QWidget *anchor, bool visibleRequested, int zPriority)
{
    std::optional<PortalBinding> displaced;

    HostedSurface *previousSurface = _surfaceByAnchor.value(anchor, nullptr);
    if (previousSurface && previousSurface != surface) {
        displaced = take(previousSurface);
    }

    if (_bindings.contains(surface)) {
        // The previous anchor may already be deleted while its key is still mapped.
        for (auto it = _surfaceByAnchor.begin(); it != _surfaceByAnchor.end();) {
            if (it.value() == surface && it.key() != anchor) {
                it = _surfaceByAnchor.erase(it);
            } else {
                ++it;
            }
        }
    }

    PortalBinding binding;
    binding.surface = surface;
    binding.anchor = anchor;
    binding.visibleRequested = visibleRequested;
    binding.zPriority = zPriority;

    _bindings.insert(surface, binding);
    _surfaceByAnchor.insert(anchor, surface);

    return displaced;
}

std::optional<PortalBinding> PortalBindingIndex::take(HostedSurface *surface)
{
    auto it = _bindings.find(surface);
    if (it == _bindings.end()) {
        return std::nullopt;
    }

    PortalBinding binding = it.value();
    _bindings.erase(it);

    for (auto anchorIt = _surfaceByAnchor.begin(); anchorIt != _surfaceByAnchor.end();) {
        if (anchorIt.value() == surface) {
            anchorIt = _surfaceByAnchor.erase(anchorIt);
        } else {
            ++anchorIt;
        }
    }

    return binding;
}

PortalBinding *PortalBindingIndex::binding(HostedSurface *surface)
{
    auto it = _bindings.find(surface);
    return it != _bindings.end() ? &it.value() : nullptr;
}

const PortalBinding *PortalBindingIndex::binding(HostedSurface *surface) const
{
    auto it = _bindings.constFind(surface);
    return it != _bindings.constEnd() ? &it.value() : nullptr;
}

HostedSurface *PortalBindingIndex::surfaceForAnchor(QWidget *anchor) const
{
    return _surfaceByAnchor.value(anchor, nullptr);
}

bool PortalBindingIndex::contains(HostedSurface *surface) const
{
    return _bindings.contains(surface);
}

QList<HostedSurface *> PortalBindingIndex::surfaces() const
{
    return _bindings.keys();
}

void PortalBindingIndex::dropStaleAnchors()
{
    for (auto it = _surfaceByAnchor.begin(); it != _surfaceByAnchor.end();) {
        const PortalBinding *mapped = binding(it.value());
        if (!mapped || mapped->anchor.isNull() || mapped->anchor.data() != it.key()) {
            it = _surfaceByAnchor.erase(it);
        } else {
            ++it;
        }
    }
}

void PortalBindingIndex::clear()
{
    _bindings.clear();
    _surfaceByAnchor.clear();
}

} // namespace Tessera
