// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "engine/EngineGlobal.hpp"

#include "editor/EditCommand.hpp"
#include "editor/EditSession.hpp"
#include "frame/FrameModel.hpp"
#include "inputstate/InputEvent.hpp"
#include "inputstate/InputEventQueue.hpp"
#include "inputstate/InputRuntime.hpp"
#include "inputstate/Settings.hpp"
#include "layoutmodel/Layout.hpp"
#include "layoutmodel/SchemaError.hpp"
#include "layoutmodel/Style.hpp"
#include "utils/Result.hpp"

#include <QtCore/QObject>
#include <QtCore/QPointF>
#include <QtCore/QReadWriteLock>
#include <QtCore/QString>
#include <QtCore/QVector>

#include <functional>
#include <memory>
#include <optional>

namespace KeyView::Engine {

using LayoutModel::ElementId;

// Single owner of one visualizer's documents and runtime state.
//
// Input capture threads only call post(). Everything else is driven from the owning thread:
// pump() applies queued events under the write lock and frame() projects under the read lock,
// so a render thread may call frame() while events are being consumed elsewhere.
class ENGINE_EXPORT Session final : public QObject
{
    Q_OBJECT

public:
    explicit Session(QObject* parent = nullptr);
    ~Session() override;

    // Safe from any thread.
    void post(const InputState::InputEvent& event);

    // Applies every queued event in order, then polls release and scroll deadlines.
    // Returns the number of events applied.
    int pump(InputState::TimePoint now);

    Frame::FrameModel frame(InputState::TimePoint now) const;

    void loadLayout(LayoutModel::Layout layout);
    void loadStyle(LayoutModel::Style style);
    // Changes the current style in place, e.g. a default outline width or font family.
    // Emits styleChanged() only when the style differs afterwards.
    void editStyle(const std::function<void(LayoutModel::Style&)>& edit);
    Utils::Result loadLayoutFile(const QString& path, LayoutModel::SchemaError* error = nullptr);
    Utils::Result loadStyleFile(const QString& path, LayoutModel::SchemaError* error = nullptr);
    Utils::Result loadSettingsFile(const QString& path);
    Utils::Result saveLayoutFile(const QString& path) const;
    Utils::Result saveStyleFile(const QString& path) const;

    void setSettings(const InputState::Settings& settings);
    void setDisplays(const QVector<InputState::DisplayInfo>& displays);

    LayoutModel::Layout layout() const;
    LayoutModel::Style style() const;
    InputState::Settings settings() const;

    bool isPressed(ElementId id, InputState::TimePoint now) const;
    void clearPressed();

    void setEditMode(bool enabled);
    bool isEditMode() const;

    void pointerDown(const QPointF& point);
    void pointerMove(const QPointF& point);
    void pointerUp(const QPointF& point);
    bool cancelGesture();

    std::optional<ElementId> hoveredElement() const;
    std::optional<ElementId> heldElement() const;
    std::optional<ElementId> selectedElement() const;
    void selectElement(std::optional<ElementId> id);

    bool canUndo() const;
    bool canRedo() const;
    bool undo();
    bool redo();

    // Returns the id the element ended up with; it changes when the requested one is taken.
    std::optional<ElementId> addElement(const LayoutModel::Element& element);
    bool removeElement(ElementId id);
    bool applyEdit(std::unique_ptr<Editor::EditCommand> cmd);

signals:
    void layoutChanged();
    void styleChanged();
    void stateChanged();

private:
    // Callers hold the write lock.
    void rebuildRuntime();
    void applyEditSettings();
    void warnMismatchedStyles() const;
    bool runEdit(const std::function<bool(Editor::EditSession&)>& edit);

    mutable QReadWriteLock m_lock;
    InputState::InputEventQueue m_queue;

    LayoutModel::Layout m_layout;
    LayoutModel::Style m_style = LayoutModel::Style::defaults();
    InputState::Settings m_settings;
    QVector<InputState::DisplayInfo> m_displays;

    InputState::InputRuntime m_runtime;
    Editor::EditSession m_edit{&m_layout};
    bool m_editMode = false;
};

} // namespace KeyView::Engine
