// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "engine/Session.hpp"

#include "editor/EditCommands.hpp"
#include "frame/FrameProjector.hpp"
#include "frame/StyleResolver.hpp"
#include "inputstate/SettingsJsonSerializer.hpp"
#include "layoutmodel/LayoutDocuments.hpp"

#include <QtCore/QReadLocker>
#include <QtCore/QWriteLocker>

#include <utility>

Q_LOGGING_CATEGORY(enginelog, "keyview.engine")

namespace KeyView::Engine {

using namespace InputState;
using namespace LayoutModel;

Session::Session(QObject* parent)
    : QObject(parent)
{
    m_runtime.reset(m_layout, m_settings);
    applyEditSettings();
}

Session::~Session() = default;

void Session::post(const InputEvent& event)
{
    m_queue.push(event);
}

int Session::pump(TimePoint now)
{
    const QVector<InputEvent> events = m_queue.takeAll();
    bool changed = false;
    {
        QWriteLocker locker(&m_lock);
        for (const InputEvent& event : events)
            changed = m_runtime.apply(event, m_settings, m_displays) || changed;
        changed = m_runtime.tick(now) || changed;
    }
    if (changed)
        emit stateChanged();
    return static_cast<int>(events.size());
}

Frame::FrameModel Session::frame(TimePoint now) const
{
    QReadLocker locker(&m_lock);

    Frame::FrameInputs inputs;
    inputs.layout = &m_layout;
    inputs.style = &m_style;
    inputs.tracker = &m_runtime.tracker();
    inputs.dynamics = &m_runtime.dynamics();
    inputs.modifiers = &m_runtime.modifiers();
    inputs.settings = &m_settings;
    inputs.now = now;
    inputs.edit.enabled = m_editMode;
    inputs.edit.hovered = m_edit.hoveredElement();
    inputs.edit.held = m_edit.heldElement();
    inputs.edit.selected = m_edit.selectedElement();
    return Frame::FrameProjector::project(inputs);
}

void Session::rebuildRuntime()
{
    m_runtime.reset(m_layout, m_settings);
}

void Session::applyEditSettings()
{
    m_edit.setTolerances(Editor::GrabTolerances{m_settings.vertexGrabRadius, m_settings.edgeGrabTolerance});
    m_edit.setMoveTextWithBody(m_settings.updateTextPosition);
}

void Session::warnMismatchedStyles() const
{
    const QVector<ElementId> ids = Frame::StyleResolver::mismatchedOverrides(m_layout, m_style);
    for (ElementId id : ids)
        qCWarning(enginelog) << "Style override for element" << id << "does not match its kind and is ignored";
}

void Session::loadLayout(Layout layout)
{
    {
        QWriteLocker locker(&m_lock);
        m_layout = std::move(layout);
        m_edit.reset();
        rebuildRuntime();
        warnMismatchedStyles();
        qCDebug(enginelog) << "Layout loaded with" << m_layout.elements.size() << "elements";
    }
    emit layoutChanged();
}

void Session::loadStyle(Style style)
{
    {
        QWriteLocker locker(&m_lock);
        m_style = std::move(style);
        warnMismatchedStyles();
    }
    emit styleChanged();
}

void Session::editStyle(const std::function<void(Style&)>& edit)
{
    bool changed = false;
    {
        QWriteLocker locker(&m_lock);
        Style edited = m_style;
        edit(edited);
        changed = edited != m_style;
        if (changed) {
            m_style = std::move(edited);
            warnMismatchedStyles();
        }
    }
    if (changed)
        emit styleChanged();
}

Utils::Result Session::loadLayoutFile(const QString& path, SchemaError* error)
{
    Layout layout;
    const Utils::Result r = LayoutDocuments::loadLayoutFile(path, layout, error);
    if (!r)
        return r;
    loadLayout(std::move(layout));
    return r;
}

Utils::Result Session::loadStyleFile(const QString& path, SchemaError* error)
{
    Style style;
    const Utils::Result r = LayoutDocuments::loadStyleFile(path, style, error);
    if (!r)
        return r;
    loadStyle(std::move(style));
    return r;
}

Utils::Result Session::loadSettingsFile(const QString& path)
{
    Settings settings = this->settings();
    const Utils::Result r = SettingsJsonSerializer::loadFile(path, settings);
    if (!r)
        return r;
    setSettings(settings);
    return r;
}

Utils::Result Session::saveLayoutFile(const QString& path) const
{
    QReadLocker locker(&m_lock);
    return LayoutDocuments::saveLayoutFile(path, m_layout);
}

Utils::Result Session::saveStyleFile(const QString& path) const
{
    QReadLocker locker(&m_lock);
    return LayoutDocuments::saveStyleFile(path, m_style);
}

void Session::setSettings(const Settings& settings)
{
    {
        QWriteLocker locker(&m_lock);
        m_settings = settings;
        m_runtime.applySettings(m_settings);
        applyEditSettings();
    }
    emit stateChanged();
}

void Session::setDisplays(const QVector<DisplayInfo>& displays)
{
    QWriteLocker locker(&m_lock);
    m_displays = displays;
}

Layout Session::layout() const
{
    QReadLocker locker(&m_lock);
    return m_layout;
}

Style Session::style() const
{
    QReadLocker locker(&m_lock);
    return m_style;
}

Settings Session::settings() const
{
    QReadLocker locker(&m_lock);
    return m_settings;
}

bool Session::isPressed(ElementId id, TimePoint now) const
{
    QReadLocker locker(&m_lock);
    return m_runtime.tracker().isPressed(id, now);
}

void Session::clearPressed()
{
    {
        QWriteLocker locker(&m_lock);
        m_runtime.clearPressed();
    }
    emit stateChanged();
}

void Session::setEditMode(bool enabled)
{
    {
        QWriteLocker locker(&m_lock);
        if (m_editMode == enabled)
            return;
        m_editMode = enabled;
        if (!enabled)
            m_edit.cancelGesture();
        qCDebug(enginelog) << "Edit mode" << (enabled ? "on" : "off");
    }
    emit layoutChanged();
}

bool Session::isEditMode() const
{
    QReadLocker locker(&m_lock);
    return m_editMode;
}

void Session::pointerDown(const QPointF& point)
{
    {
        QWriteLocker locker(&m_lock);
        if (!m_editMode)
            return;
        m_edit.pointerDown(point);
    }
    emit stateChanged();
}

void Session::pointerMove(const QPointF& point)
{
    bool dragging = false;
    {
        QWriteLocker locker(&m_lock);
        if (!m_editMode)
            return;
        dragging = m_edit.isDragging();
        m_edit.pointerMove(point);
    }
    if (dragging)
        emit layoutChanged();
    else
        emit stateChanged();
}

void Session::pointerUp(const QPointF& point)
{
    {
        QWriteLocker locker(&m_lock);
        if (!m_editMode || !m_edit.isDragging())
            return;
        m_edit.pointerUp(point);
    }
    emit layoutChanged();
}

bool Session::cancelGesture()
{
    bool cancelled = false;
    {
        QWriteLocker locker(&m_lock);
        cancelled = m_edit.cancelGesture();
    }
    if (cancelled)
        emit layoutChanged();
    return cancelled;
}

std::optional<ElementId> Session::hoveredElement() const
{
    QReadLocker locker(&m_lock);
    return m_edit.hoveredElement();
}

std::optional<ElementId> Session::heldElement() const
{
    QReadLocker locker(&m_lock);
    return m_edit.heldElement();
}

std::optional<ElementId> Session::selectedElement() const
{
    QReadLocker locker(&m_lock);
    return m_edit.selectedElement();
}

void Session::selectElement(std::optional<ElementId> id)
{
    {
        QWriteLocker locker(&m_lock);
        m_edit.select(id);
    }
    emit stateChanged();
}

bool Session::canUndo() const
{
    QReadLocker locker(&m_lock);
    return m_edit.commands().canUndo();
}

bool Session::canRedo() const
{
    QReadLocker locker(&m_lock);
    return m_edit.commands().canRedo();
}

bool Session::runEdit(const std::function<bool(Editor::EditSession&)>& edit)
{
    bool ok = false;
    {
        QWriteLocker locker(&m_lock);
        ok = edit(m_edit);
        // Property edits and undo can change keycodes; held keys survive the rebuild.
        if (ok)
            rebuildRuntime();
    }
    if (ok)
        emit layoutChanged();
    return ok;
}

bool Session::undo()
{
    return runEdit([](Editor::EditSession& edit) { return edit.undo(); });
}

bool Session::redo()
{
    return runEdit([](Editor::EditSession& edit) { return edit.redo(); });
}

std::optional<ElementId> Session::addElement(const Element& element)
{
    auto cmd = std::make_unique<Editor::AddElementCommand>(element);
    Editor::AddElementCommand* add = cmd.get();
    std::optional<ElementId> id;
    runEdit([&](Editor::EditSession& edit) {
        if (!edit.execute(std::move(cmd)))
            return false;
        id = add->assignedId();
        return true;
    });
    return id;
}

bool Session::removeElement(ElementId id)
{
    return applyEdit(std::make_unique<Editor::RemoveElementCommand>(id));
}

bool Session::applyEdit(std::unique_ptr<Editor::EditCommand> cmd)
{
    if (!cmd)
        return false;
    return runEdit([&](Editor::EditSession& edit) { return edit.execute(std::move(cmd)); });
}

} // namespace KeyView::Engine
