#include "winorg/window/KeybindManager.hpp"
#include <X11/keysym.h>
#include <algorithm>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace worg {

namespace {

std::string trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t");
    return text.substr(begin, end - begin + 1);
}

std::vector<std::string> split(const std::string& text, char separator) {
    std::vector<std::string> parts;
    std::istringstream ss(text);
    std::string token;
    while (std::getline(ss, token, separator)) {
        parts.push_back(trim(token));
    }
    return parts;
}

}

KeybindManager::KeybindManager(TriggerQueue& queue)
    : queue_(queue)
{
}

// ============================================================================
// Parsing
// ============================================================================

std::optional<KeyCombo> KeybindManager::parseKeybind(const std::string& keybind_string) {
    std::string text = trim(keybind_string);
    if (text.empty()) {
        return std::nullopt;
    }

    std::vector<std::string> parts;
    if (text.find(',') != std::string::npos) {
        // "SUPER, SHIFT, Left"
        parts = split(text, ',');
    } else if (text.size() > 1 && text.find('-', 1) != std::string::npos) {
        // "Ctrl-Alt-KP_4"; a trailing '-' is the minus key itself
        bool minus_key = text.back() == '-';
        parts = split(minus_key ? text.substr(0, text.size() - 1) : text, '-');
        if (minus_key) {
            if (!parts.empty() && parts.back().empty()) {
                parts.back() = "-";
            } else {
                parts.push_back("-");
            }
        }
    } else {
        parts.push_back(text);
    }

    std::string key = parts.back();
    parts.pop_back();

    if (key.empty()) {
        return std::nullopt;
    }

    // Combined modifiers such as "SUPER_SHIFT"
    std::vector<std::string> modifier_tokens;
    for (const auto& part : parts) {
        for (const auto& piece : split(part, '_')) {
            if (!piece.empty()) {
                modifier_tokens.push_back(piece);
            }
        }
    }

    auto modifiers = parseModifiers(modifier_tokens);
    if (!modifiers) {
        return std::nullopt;
    }

    KeyCombo combo;
    combo.modifiers = *modifiers;
    combo.keysym = parseKey(key);
    if (combo.keysym == NoSymbol) {
        return std::nullopt;
    }
    return combo;
}

std::optional<unsigned int> KeybindManager::parseModifiers(const std::vector<std::string>& modifiers) {
    unsigned int mask = 0;

    for (const auto& name : modifiers) {
        std::string token = name;
        std::transform(token.begin(), token.end(), token.begin(), ::toupper);

        if (token.empty()) continue;

        if (token == "SUPER" || token == "WIN" || token == "MOD4") {
            mask |= Mod4Mask;
        } else if (token == "ALT" || token == "MOD1") {
            mask |= Mod1Mask;
        } else if (token == "CTRL" || token == "CONTROL") {
            mask |= ControlMask;
        } else if (token == "SHIFT") {
            mask |= ShiftMask;
        } else if (token == "MOD2") {
            // NumLock is stripped from presses; general.numlock covers it
            std::cerr << "[Keybind] MOD2 is NumLock and cannot be bound, use general.numlock" << std::endl;
            return std::nullopt;
        } else if (token == "MOD3") {
            mask |= Mod3Mask;
        } else if (token == "MOD5") {
            mask |= Mod5Mask;
        } else {
            std::cerr << "[Keybind] Unknown modifier '" << name << "'" << std::endl;
        }
    }

    return mask;
}

KeySym KeybindManager::parseKey(const std::string& key) {
    if (key.empty()) {
        return NoSymbol;
    }

    std::string key_upper = key;
    std::transform(key_upper.begin(), key_upper.end(), key_upper.begin(), ::toupper);

    static const std::unordered_map<std::string, KeySym> key_map = {
        {"RETURN", XK_Return},
        {"ENTER", XK_Return},
        {"SPACE", XK_space},
        {"TAB", XK_Tab},
        {"ESC", XK_Escape},
        {"ESCAPE", XK_Escape},
        {"BACKSPACE", XK_BackSpace},
        {"DELETE", XK_Delete},
        {"INSERT", XK_Insert},
        {"HOME", XK_Home},
        {"END", XK_End},
        {"PAGEUP", XK_Page_Up},
        {"PAGEDOWN", XK_Page_Down},
        {"LEFT", XK_Left},
        {"RIGHT", XK_Right},
        {"UP", XK_Up},
        {"DOWN", XK_Down},
        {"GRAVE", XK_grave},
        {"COMMA", XK_comma},
        {"PERIOD", XK_period},
        {"MINUS", XK_minus},
        {"EQUAL", XK_equal},
    };

    auto it = key_map.find(key_upper);
    if (it != key_map.end()) {
        return it->second;
    }

    if (key.length() == 1) {
        static const std::unordered_map<char, KeySym> char_map = {
            {'-', XK_minus},
            {'=', XK_equal},
            {',', XK_comma},
            {'.', XK_period},
            {'/', XK_slash},
            {';', XK_semicolon},
            {'`', XK_grave},
            {'[', XK_bracketleft},
            {']', XK_bracketright},
            {'\\', XK_backslash},
            {'\'', XK_apostrophe},
        };

        auto ch = char_map.find(key[0]);
        if (ch != char_map.end()) {
            return ch->second;
        }

        // Letter keysyms are the lower-case ones
        std::string lower_key = key;
        if (key[0] >= 'A' && key[0] <= 'Z') {
            std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(), ::tolower);
        }
        KeySym ks = XStringToKeysym(lower_key.c_str());
        if (ks != NoSymbol) {
            return ks;
        }
    }

    // "KP_4", "F5", "XF86AudioPlay", ...
    KeySym ks = XStringToKeysym(key.c_str());
    if (ks != NoSymbol) {
        return ks;
    }

    std::cerr << "[Keybind] Could not parse key '" << key << "'" << std::endl;
    return NoSymbol;
}

std::vector<unsigned int> KeybindManager::lockVariants(NumlockMode mode) {
    std::vector<unsigned int> variants;
    if (mode == NumlockMode::Off || mode == NumlockMode::Both) {
        variants.push_back(0);
        variants.push_back(LockMask);
    }
    if (mode == NumlockMode::On || mode == NumlockMode::Both) {
        variants.push_back(Mod2Mask);
        variants.push_back(Mod2Mask | LockMask);
    }
    return variants;
}

// ============================================================================
// Registration
// ============================================================================

bool KeybindManager::registerKeybind(const std::string& keybind_string, ActionRequest request,
                                     const std::string& action_text) {
    auto combo = parseKeybind(keybind_string);
    if (!combo) {
        std::cerr << "[Keybind] Invalid keybind '" << keybind_string << "'" << std::endl;
        return false;
    }

    // User keybinds override earlier ones with the same combination
    keybinds_.erase(std::remove_if(keybinds_.begin(), keybinds_.end(),
        [&combo](const Keybind& existing) { return existing.combo == *combo; }),
        keybinds_.end());

    request.origin = "keybind";
    keybinds_.push_back(Keybind{*combo, std::move(request), action_text});
    return true;
}

std::optional<std::string> KeybindManager::findAction(const KeyCombo& combo) const {
    for (const auto& bind : keybinds_) {
        if (bind.combo == combo) {
            return bind.action;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Grabs
// ============================================================================

void KeybindManager::resolveKeycodes(const std::function<KeyCode(KeySym)>& lookup) {
    for (auto& bind : keybinds_) {
        bind.keycode = lookup(bind.combo.keysym);
    }
}

void KeybindManager::grabKeys(Display* display, Window root) {
    XUngrabKey(display, AnyKey, AnyModifier, root);

    resolveKeycodes([display](KeySym keysym) { return XKeysymToKeycode(display, keysym); });

    for (const auto& bind : keybinds_) {
        if (bind.keycode == 0) {
            std::cerr << "[Keybind] No keycode for '" << XKeysymToString(bind.combo.keysym)
                      << "', skipping " << bind.action << std::endl;
            continue;
        }

        grabKeyWithLocks(display, bind.keycode, bind.combo.modifiers, root);
    }

    XSync(display, False);
}

void KeybindManager::ungrabKeys(Display* display, Window root) {
    for (const auto& bind : keybinds_) {
        if (bind.keycode == 0) continue;

        for (unsigned int lock_mod : lockVariants(numlock_mode_)) {
            XUngrabKey(display, bind.keycode, bind.combo.modifiers | lock_mod, root);
        }
    }
    XFlush(display);
}

void KeybindManager::grabKeyWithLocks(Display* display, KeyCode keycode,
                                      unsigned int modifiers, Window root) {
    // Plain and with CapsLock, with and/or without NumLock
    for (unsigned int lock_mod : lockVariants(numlock_mode_)) {
        XGrabKey(display, keycode, modifiers | lock_mod, root, True,
                 GrabModeAsync, GrabModeAsync);
    }
}

bool KeybindManager::handleKeyPress(const XKeyEvent& event) {
    return matchKey(static_cast<KeyCode>(event.keycode), event.state, event.time);
}

bool KeybindManager::matchKey(KeyCode keycode, unsigned int state, Time time) {
    if (keycode == 0) {
        return false;
    }

    // Mask out lock keys (Num Lock, Caps Lock)
    unsigned int modifiers = state &
        (ShiftMask | ControlMask | Mod1Mask | Mod3Mask | Mod4Mask | Mod5Mask);

    for (const auto& bind : keybinds_) {
        // By grabbed keycode: level 0 of the KP_7 key is KP_Home
        if (bind.keycode == keycode && bind.combo.modifiers == modifiers) {
            ActionTrigger trigger;
            trigger.request = bind.request;
            trigger.request.timestamp = static_cast<uint64_t>(time);

            std::string action = bind.action;
            trigger.reply = [action](const DispatchResult& result) {
                if (!result.ok()) {
                    std::cerr << "[Keybind] " << action << ": " << result.message << std::endl;
                }
            };

            queue_.push(std::move(trigger));
            return true;
        }
    }

    return false;
}

}
