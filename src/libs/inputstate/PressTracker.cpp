// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "inputstate/PressTracker.hpp"

#include <algorithm>
#include <utility>

namespace KeyView::InputState {

using LayoutModel::Element;
using LayoutModel::ElementKind;

std::optional<InputDomain> inputDomainFor(ElementKind kind)
{
    switch (kind) {
        case ElementKind::KeyboardKey: return InputDomain::Keyboard;
        case ElementKind::MouseKey: return InputDomain::MouseButton;
        case ElementKind::MouseScroll: return InputDomain::Scroll;
        case ElementKind::MouseSpeedIndicator: return std::nullopt;
    }
    return std::nullopt;
}

void PressTracker::rebuild(const LayoutModel::Layout& layout)
{
    QHash<ElementId, TimePoint> pendingReleases;
    for (const Tracked& t : std::as_const(m_elements)) {
        if (t.domain != InputDomain::Scroll && !t.state.chordHeld && t.state.releaseDeadline)
            pendingReleases.insert(t.id, *t.state.releaseDeadline);
    }

    m_elements.clear();
    m_indexById.clear();
    for (auto& index : m_byCode)
        index.clear();
    m_anyDirection.clear();

    for (const Element& element : layout.elements) {
        const auto domain = inputDomainFor(element.kind());
        if (!domain)
            continue;

        Tracked t;
        t.id = element.id();
        t.domain = *domain;
        for (const KeyCode code : element.common()->keyCodes)
            t.chord.insert(code);

        const int idx = m_elements.size();
        for (const KeyCode code : std::as_const(t.chord))
            m_byCode[slot(t.domain)][code].push_back(idx);
        if (t.domain == InputDomain::Scroll && t.chord.isEmpty())
            m_anyDirection.push_back(idx);

        if (t.domain == InputDomain::Scroll) {
            refreshScroll(t);
        } else {
            refreshChord(t);
            // A release still inside its minimum display time keeps counting down.
            const auto pending = pendingReleases.constFind(t.id);
            if (!t.state.chordHeld && pending != pendingReleases.cend())
                t.state.releaseDeadline = pending.value();
        }

        m_indexById.insert(t.id, idx);
        m_elements.push_back(std::move(t));
    }
}

void PressTracker::refreshChord(Tracked& t) const
{
    const QSet<KeyCode>& held = m_held[slot(t.domain)];
    t.state.heldKeyCodes.clear();
    for (const KeyCode code : std::as_const(t.chord)) {
        if (held.contains(code))
            t.state.heldKeyCodes.insert(code);
    }
    // An element without keycodes has no chord to complete.
    t.state.chordHeld = !t.chord.isEmpty() && t.state.heldKeyCodes.size() == t.chord.size();
    t.state.releaseDeadline.reset();
}

void PressTracker::refreshScroll(Tracked& t) const
{
    // A scroll element stays pressed until the earliest deadline among its directions, or
    // until the latest pulse of any direction when it lists none.
    t.state.heldKeyCodes.clear();
    t.state.chordHeld = false;
    t.state.releaseDeadline.reset();

    if (t.chord.isEmpty()) {
        for (auto it = m_scrollDeadlines.cbegin(); it != m_scrollDeadlines.cend(); ++it) {
            t.state.heldKeyCodes.insert(it.key());
            if (!t.state.releaseDeadline || *t.state.releaseDeadline < it.value())
                t.state.releaseDeadline = it.value();
        }
        return;
    }

    std::optional<TimePoint> earliest;
    for (const KeyCode direction : std::as_const(t.chord)) {
        const auto it = m_scrollDeadlines.constFind(direction);
        if (it == m_scrollDeadlines.cend())
            continue;
        t.state.heldKeyCodes.insert(direction);
        if (!earliest || it.value() < *earliest)
            earliest = it.value();
    }
    if (t.state.heldKeyCodes.size() == t.chord.size())
        t.state.releaseDeadline = earliest;
}

bool PressTracker::press(InputDomain domain, KeyCode code, TimePoint now)
{
    if (domain == InputDomain::Scroll) {
        scroll(code, now);
        return true;
    }

    QSet<KeyCode>& held = m_held[slot(domain)];
    if (held.contains(code))
        return false;
    held.insert(code);

    const QVector<int> targets = m_byCode[slot(domain)].value(code);
    if (targets.isEmpty())
        qCDebug(inputstatelog) << "Code" << code << "matches no element";

    for (const int idx : targets) {
        Tracked& t = m_elements[idx];
        t.state.heldKeyCodes.insert(code);
        if (t.state.heldKeyCodes.size() == t.chord.size()) {
            t.state.chordHeld = true;
            t.state.releaseDeadline.reset();
        }
    }
    return true;
}

bool PressTracker::release(InputDomain domain, KeyCode code, TimePoint now)
{
    if (domain == InputDomain::Scroll)
        return false;

    QSet<KeyCode>& held = m_held[slot(domain)];
    if (!held.remove(code)) {
        qCDebug(inputstatelog) << "Release of code" << code << "without a recorded press";
        return false;
    }

    for (const int idx : m_byCode[slot(domain)].value(code)) {
        Tracked& t = m_elements[idx];
        t.state.heldKeyCodes.remove(code);
        if (t.state.chordHeld) {
            t.state.chordHeld = false;
            t.state.releaseDeadline = now + m_minPressTime;
        }
    }
    return true;
}

void PressTracker::scroll(KeyCode direction, TimePoint now)
{
    const TimePoint deadline = now + m_scrollHoldTime;
    auto it = m_scrollDeadlines.find(direction);
    if (it == m_scrollDeadlines.end())
        m_scrollDeadlines.insert(direction, deadline);
    else
        it.value() = std::max(it.value(), deadline);

    const QVector<int> targets = m_byCode[slot(InputDomain::Scroll)].value(direction);
    if (targets.isEmpty() && m_anyDirection.isEmpty())
        qCDebug(inputstatelog) << "Scroll direction" << direction << "matches no element";

    for (const int idx : targets)
        refreshScroll(m_elements[idx]);
    for (const int idx : std::as_const(m_anyDirection))
        refreshScroll(m_elements[idx]);
}

bool PressTracker::tick(TimePoint now)
{
    bool changed = false;

    bool scrollExpired = false;
    for (auto it = m_scrollDeadlines.begin(); it != m_scrollDeadlines.end();) {
        if (it.value() <= now) {
            it = m_scrollDeadlines.erase(it);
            scrollExpired = true;
        } else {
            ++it;
        }
    }

    for (Tracked& t : m_elements) {
        if (t.domain == InputDomain::Scroll) {
            if (scrollExpired) {
                const bool before = t.state.isPressed(now);
                const QSet<KeyCode> heldBefore = t.state.heldKeyCodes;
                refreshScroll(t);
                changed = changed || before != t.state.isPressed(now) || heldBefore != t.state.heldKeyCodes;
            }
            continue;
        }
        if (t.state.releaseDeadline && *t.state.releaseDeadline <= now) {
            t.state.releaseDeadline.reset();
            changed = true;
        }
    }
    return changed;
}

void PressTracker::clearPressed()
{
    for (auto& held : m_held)
        held.clear();
    m_scrollDeadlines.clear();
    for (Tracked& t : m_elements)
        t.state = PressState{};
}

bool PressTracker::isPressed(ElementId id, TimePoint now) const
{
    const PressState* s = state(id);
    return s && s->isPressed(now);
}

const PressState* PressTracker::state(ElementId id) const
{
    const auto it = m_indexById.constFind(id);
    if (it == m_indexById.cend())
        return nullptr;
    return &m_elements.at(it.value()).state;
}

QVector<ElementId> PressTracker::pressedElements(TimePoint now) const
{
    QVector<ElementId> ids;
    for (const Tracked& t : m_elements) {
        if (t.state.isPressed(now))
            ids.push_back(t.id);
    }
    return ids;
}

bool PressTracker::isHeld(InputDomain domain, KeyCode code) const
{
    if (domain == InputDomain::Scroll)
        return m_scrollDeadlines.contains(code);
    return m_held[slot(domain)].contains(code);
}

QSet<KeyCode> PressTracker::heldCodes(InputDomain domain) const
{
    if (domain == InputDomain::Scroll) {
        QSet<KeyCode> codes;
        for (auto it = m_scrollDeadlines.cbegin(); it != m_scrollDeadlines.cend(); ++it)
            codes.insert(it.key());
        return codes;
    }
    return m_held[slot(domain)];
}

bool PressTracker::isScrollActive(KeyCode direction, TimePoint now) const
{
    const auto it = m_scrollDeadlines.constFind(direction);
    return it != m_scrollDeadlines.cend() && now < it.value();
}

} // namespace KeyView::InputState
