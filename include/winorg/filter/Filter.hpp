#pragma once

/**
 * @file Filter.hpp
 * @brief Composable window-selection predicates
 *
 * A Filter is an immutable expression tree shared through
 * std::shared_ptr<const Node>. Composing filters builds new nodes and
 * never touches the operands, so a Filter can be copied freely and its
 * node address serves as a stable identity for cycle bookkeeping.
 *
 * Evaluation is total: a leaf that asks for an attribute the window does
 * not have (desktop of a sticky window, class of an unnamed window)
 * evaluates to false.
 */

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "winorg/window/WindowSnapshot.hpp"

namespace worg {

struct FilterContext {
    // Desktop the user is looking at; leaves comparing against the current
    // desktop are false when unknown
    std::optional<int> current_desktop;
};

class Filter {
public:
    enum class Kind {
        MatchAll,
        And,
        Or,
        Not,
        IsActive,
        HasState,
        DesktopIs,
        DesktopIn,
        DesktopIsCurrent,
        OnCurrentDesktop,
        TypeIs,
        TypeIn,
        ContainsPoint,
        IdIs,
        ClassIs
    };

    // Matches every window
    Filter();

    static Filter always();
    static Filter isActive();
    static Filter hasState(WindowState state);
    static Filter desktopIs(int desktop);
    static Filter desktopIn(std::vector<int> desktops);
    static Filter desktopIsCurrent();
    // Current desktop or sticky
    static Filter onCurrentDesktop();
    static Filter typeIs(WindowType type);
    static Filter typeIn(std::vector<WindowType> types);
    static Filter containsPoint(int x, int y);
    static Filter idIs(WindowId id);
    static Filter classIs(std::string class_name);

    bool evaluate(const WindowSnapshot& window, const FilterContext& context = {}) const;

    std::vector<WindowSnapshot> select(const SnapshotSet& windows,
                                       const FilterContext& context = {}) const;

    Kind kind() const;

    // Same node, same identity; structurally equal filters built separately
    // have different identities
    const void* identity() const { return node_.get(); }

    std::string describe() const;

    friend Filter operator&&(const Filter& lhs, const Filter& rhs);
    friend Filter operator||(const Filter& lhs, const Filter& rhs);
    friend Filter operator!(const Filter& operand);

    // Opaque expression node
    struct Node;

private:
    explicit Filter(std::shared_ptr<const Node> node);

    static bool evaluateNode(const Node& node, const WindowSnapshot& window,
                             const FilterContext& context);
    static std::string describeNode(const Node& node);

    std::shared_ptr<const Node> node_;
};

Filter operator&&(const Filter& lhs, const Filter& rhs);
Filter operator||(const Filter& lhs, const Filter& rhs);
Filter operator!(const Filter& operand);

inline bool evaluate(const Filter& expr, const WindowSnapshot& window,
                     const FilterContext& context = {}) {
    return expr.evaluate(window, context);
}

inline std::vector<WindowSnapshot> select(const Filter& expr, const SnapshotSet& windows,
                                          const FilterContext& context = {}) {
    return expr.select(windows, context);
}

/**
 * @brief Named filter presets
 *
 * Presets are stored once and handed out by copy, so every action bound to
 * the same preset name shares one identity and therefore one cycle state.
 */
class FilterRegistry {
public:
    FilterRegistry();

    void define(const std::string& name, Filter filter);

    std::optional<Filter> find(const std::string& name) const;

    bool contains(const std::string& name) const { return presets_.count(name) > 0; }

    // Target of actions that name no filter: the active window
    const Filter& defaultFilter() const { return default_filter_; }

    std::vector<std::string> names() const;

private:
    std::map<std::string, Filter> presets_;
    Filter default_filter_;
};

}
