#include <gtest/gtest.h>

#include <winorg/window/KeybindManager.hpp>

#include <X11/keysym.h>

using namespace worg;

TEST(Keybind, commaSeparatedForm) {
    auto combo = KeybindManager::parseKeybind("SUPER, SHIFT, Left");
    ASSERT_TRUE(combo.has_value());
    EXPECT_EQ(combo->modifiers, Mod4Mask | ShiftMask);
    EXPECT_EQ(combo->keysym, static_cast<KeySym>(XK_Left));

    auto joined = KeybindManager::parseKeybind("SUPER_SHIFT, H");
    ASSERT_TRUE(joined.has_value());
    EXPECT_EQ(joined->modifiers, Mod4Mask | ShiftMask);
    EXPECT_EQ(joined->keysym, static_cast<KeySym>(XK_h));
}

TEST(Keybind, dashSeparatedForm) {
    auto combo = KeybindManager::parseKeybind("Ctrl-Alt-KP_4");
    ASSERT_TRUE(combo.has_value());
    EXPECT_EQ(combo->modifiers, ControlMask | Mod1Mask);
    EXPECT_EQ(combo->keysym, static_cast<KeySym>(XK_KP_4));

    auto minus = KeybindManager::parseKeybind("Ctrl--");
    ASSERT_TRUE(minus.has_value());
    EXPECT_EQ(minus->modifiers, static_cast<unsigned int>(ControlMask));
    EXPECT_EQ(minus->keysym, static_cast<KeySym>(XK_minus));
}

TEST(Keybind, bareKey) {
    auto combo = KeybindManager::parseKeybind("F5");
    ASSERT_TRUE(combo.has_value());
    EXPECT_EQ(combo->modifiers, 0u);
    EXPECT_EQ(combo->keysym, static_cast<KeySym>(XK_F5));
}

TEST(Keybind, unknownKeyIsRejected) {
    EXPECT_FALSE(KeybindManager::parseKeybind("SUPER, NoSuchKeyName").has_value());
    EXPECT_FALSE(KeybindManager::parseKeybind("   ").has_value());
}

TEST(Keybind, numlockVariants) {
    auto off = KeybindManager::lockVariants(KeybindManager::NumlockMode::Off);
    ASSERT_EQ(off.size(), 2u);
    EXPECT_EQ(off[0], 0u);
    EXPECT_EQ(off[1], static_cast<unsigned int>(LockMask));

    auto on = KeybindManager::lockVariants(KeybindManager::NumlockMode::On);
    ASSERT_EQ(on.size(), 2u);
    EXPECT_EQ(on[0], static_cast<unsigned int>(Mod2Mask));
    EXPECT_EQ(on[1], static_cast<unsigned int>(Mod2Mask | LockMask));

    EXPECT_EQ(KeybindManager::lockVariants(KeybindManager::NumlockMode::Both).size(), 4u);
}

TEST(Keybind, laterBindingReplacesEarlier) {
    TriggerQueue queue;
    KeybindManager keybinds(queue);

    EXPECT_TRUE(keybinds.registerKeybind("SUPER, Tab", ActionRequest{}, "cycle next"));
    EXPECT_TRUE(keybinds.registerKeybind("Super-Tab", ActionRequest{}, "cycle previous"));
    EXPECT_FALSE(keybinds.registerKeybind("SUPER, Bogus_Key_Name", ActionRequest{}, "reset"));

    EXPECT_EQ(keybinds.size(), 1u);
    auto combo = KeybindManager::parseKeybind("SUPER, Tab");
    ASSERT_TRUE(combo.has_value());
    EXPECT_EQ(keybinds.findAction(*combo), std::optional<std::string>("cycle previous"));
}

TEST(Keybind, mod2IsRejected) {
    EXPECT_FALSE(KeybindManager::parseKeybind("MOD2, F1").has_value());
    EXPECT_FALSE(KeybindManager::parseModifiers({"SUPER", "MOD2"}).has_value());
    EXPECT_EQ(KeybindManager::parseModifiers({"SUPER", "MOD3"}),
              std::optional<unsigned int>(Mod4Mask | Mod3Mask));
}

TEST(Keybind, keypadPressMatchesByKeycode) {
    TriggerQueue queue;
    KeybindManager keybinds(queue);

    ActionRequest request;
    request.action = GridPutAction{};
    ASSERT_TRUE(keybinds.registerKeybind("SUPER, KP_7", request, "grid 0 0"));
    ASSERT_TRUE(keybinds.registerKeybind("SUPER, KP_9", request, "grid 1 0"));

    // Keycodes of the standard evdev keymap
    keybinds.resolveKeycodes([](KeySym keysym) -> KeyCode {
        if (keysym == XK_KP_7) return 79;
        if (keysym == XK_KP_9) return 81;
        return 0;
    });

    // NumLock off: the server reports KP_Home for this key, the keycode is the same
    EXPECT_TRUE(keybinds.matchKey(79, Mod4Mask, 1000));
    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(std::holds_alternative<ActionTrigger>(*first));
    const auto& trigger = std::get<ActionTrigger>(*first);
    EXPECT_EQ(trigger.request.timestamp, 1000u);
    EXPECT_EQ(trigger.request.origin, "keybind");

    // NumLock and CapsLock do not matter
    EXPECT_TRUE(keybinds.matchKey(81, Mod4Mask | Mod2Mask | LockMask, 1001));
    EXPECT_TRUE(queue.pop().has_value());

    // Wrong modifiers or an unbound key
    EXPECT_FALSE(keybinds.matchKey(79, Mod4Mask | ShiftMask, 1002));
    EXPECT_FALSE(keybinds.matchKey(80, Mod4Mask, 1003));
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(Keybind, unresolvedKeycodeNeverMatches) {
    TriggerQueue queue;
    KeybindManager keybinds(queue);
    ASSERT_TRUE(keybinds.registerKeybind("F5", ActionRequest{}, "reset"));

    EXPECT_FALSE(keybinds.matchKey(0, 0, 1));
    EXPECT_FALSE(keybinds.matchKey(71, 0, 1));
}
