#pragma once

#include <X11/Xlib.h>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "winorg/action/Action.hpp"
#include "winorg/core/TriggerQueue.hpp"

namespace worg {

/**
 * @brief Modifier mask plus KeySym of one key binding
 */
struct KeyCombo {
    unsigned int modifiers{0};
    KeySym keysym{NoSymbol};

    bool operator==(const KeyCombo& other) const {
        return modifiers == other.modifiers && keysym == other.keysym;
    }
};

/**
 * @brief Global key grabs that feed action requests into the trigger queue
 *
 * Accepts both "SUPER, SHIFT, Left" and "Ctrl-Alt-KP_4" binding strings.
 * A key press matching a binding pushes an ActionTrigger carrying the X
 * server timestamp of the press, so a redelivered press is recognized.
 */
class KeybindManager {
public:
    // Which NumLock states keys are grabbed for
    enum class NumlockMode {
        Off = 0,
        On = 1,
        Both = 2
    };

    explicit KeybindManager(TriggerQueue& queue);

    /**
     * @brief Bind @p keybind_string to @p request
     *
     * A later binding of the same combination replaces the earlier one.
     * @return false if the string names no known key
     */
    bool registerKeybind(const std::string& keybind_string, ActionRequest request,
                         const std::string& action_text);

    void grabKeys(Display* display, Window root);

    void ungrabKeys(Display* display, Window root);

    // True if the press matched a binding
    bool handleKeyPress(const XKeyEvent& event);

    /**
     * @brief Record the keycode of every binding's keysym
     *
     * Presses are matched by keycode, so this must run again after the
     * keyboard mapping changes. grabKeys() does it with XKeysymToKeycode.
     */
    void resolveKeycodes(const std::function<KeyCode(KeySym)>& lookup);

    // Push the bound action of @p keycode under @p state, if any
    bool matchKey(KeyCode keycode, unsigned int state, Time time);

    void setNumlockMode(NumlockMode mode) { numlock_mode_ = mode; }
    NumlockMode getNumlockMode() const { return numlock_mode_; }

    void clearKeybinds() { keybinds_.clear(); }

    size_t size() const { return keybinds_.size(); }

    std::optional<std::string> findAction(const KeyCombo& combo) const;

    static std::optional<KeyCombo> parseKeybind(const std::string& keybind_string);

    // nullopt for MOD2, which is NumLock
    static std::optional<unsigned int> parseModifiers(const std::vector<std::string>& modifiers);

    static KeySym parseKey(const std::string& key);

    // Lock masks a binding is grabbed with for @p mode
    static std::vector<unsigned int> lockVariants(NumlockMode mode);

private:
    struct Keybind {
        KeyCombo combo;
        ActionRequest request;
        std::string action;
        // Resolved on grab, 0 until then
        KeyCode keycode{0};
    };

    TriggerQueue& queue_;
    std::vector<Keybind> keybinds_;
    NumlockMode numlock_mode_{NumlockMode::Both};

    void grabKeyWithLocks(Display* display, KeyCode keycode,
                          unsigned int modifiers, Window root);
};

}
