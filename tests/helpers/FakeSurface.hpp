#pragma once

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "winorg/core/ActionError.hpp"
#include "winorg/display/WindowSurface.hpp"

namespace worg::test {

/**
 * @brief In-memory WindowSurface
 *
 * Applies commands to its own window list the way a cooperative window
 * manager would, and confirms them synchronously unless auto_confirm is
 * off, in which case the callbacks are kept for the test to fire.
 */
class FakeSurface : public WindowSurface {
public:
    struct Held {
        Command command;
        CompletionCallback done;
    };

    std::vector<WindowSnapshot> windows;
    Rect workarea{0, 0, 1920, 1080};
    int desktop{0};
    bool available{true};
    bool auto_confirm{true};
    bool apply_changes{true};

    std::vector<Command> applied;
    std::vector<Held> held;
    std::vector<EventCallback> subscribers;

    WindowSnapshot& addWindow(WindowId id, Rect geometry, int on_desktop = 0, bool active = false) {
        WindowSnapshot w;
        w.id = id;
        w.geometry = geometry;
        w.desktop = on_desktop;
        w.active = active;
        w.name = "window-" + std::to_string(id);
        w.class_name = "Fake";
        windows.push_back(w);
        return windows.back();
    }

    WindowSnapshot* find(WindowId id) {
        auto it = std::find_if(windows.begin(), windows.end(),
            [id](const WindowSnapshot& w) { return w.id == id; });
        return it != windows.end() ? &*it : nullptr;
    }

    void destroy(WindowId id) {
        windows.erase(std::remove_if(windows.begin(), windows.end(),
            [id](const WindowSnapshot& w) { return w.id == id; }), windows.end());
    }

    void setActive(WindowId id) {
        for (auto& w : windows) {
            w.active = w.id == id;
        }
    }

    bool isAvailable() const override { return available; }

    std::vector<WindowSnapshot> listWindows() override {
        if (!available) {
            throw ActionError(ErrorKind::SourceUnavailable, "fake surface offline");
        }
        return windows;
    }

    Rect getWorkarea() override {
        if (!available) {
            throw ActionError(ErrorKind::SourceUnavailable, "fake surface offline");
        }
        return workarea;
    }

    int currentDesktop() override { return desktop; }

    void applyCommand(const Command& command, CompletionCallback done) override {
        applied.push_back(command);

        WindowSnapshot* window = find(command.window);
        if (apply_changes && window) {
            if (command.state) {
                switch (command.state->mode) {
                    case StateMode::Set:
                        window->state = window->state.with(command.state->flags);
                        break;
                    case StateMode::Unset:
                        window->state = window->state.without(command.state->flags);
                        break;
                    case StateMode::Toggle:
                        window->state = window->state.toggled(command.state->flags);
                        break;
                }
            }
            if (command.geometry) {
                window->geometry = *command.geometry;
            }
            if (command.activate) {
                setActive(command.window);
            }
        }

        if (!auto_confirm) {
            held.push_back(Held{command, std::move(done)});
            return;
        }

        CommandOutcome outcome;
        outcome.window = command.window;
        outcome.generation = command.generation;
        outcome.success = window != nullptr;
        outcome.stale = window == nullptr;
        if (done) {
            done(outcome);
        }
    }

    void subscribe(EventCallback callback) override {
        subscribers.push_back(std::move(callback));
    }
};

}
