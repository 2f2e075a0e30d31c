/**
 * @file Filter.cpp
 * @brief Filter expression nodes and evaluation
 */

#include "winorg/filter/Filter.hpp"
#include <algorithm>
#include <sstream>

namespace worg {

struct Filter::Node {
    Kind kind{Kind::MatchAll};
    std::vector<std::shared_ptr<const Node>> children;

    int number{0};
    std::vector<int> numbers;
    WindowState state{WindowState::NoState};
    WindowType type{WindowType::Normal};
    std::vector<WindowType> types;
    int x{0};
    int y{0};
    WindowId id{NoWindow};
    std::string text;
};

namespace {

std::shared_ptr<Filter::Node> makeNode(Filter::Kind kind) {
    auto node = std::make_shared<Filter::Node>();
    node->kind = kind;
    return node;
}

}

// ============================================================================
// Construction
// ============================================================================

Filter::Filter() : node_(makeNode(Kind::MatchAll)) {}

Filter::Filter(std::shared_ptr<const Node> node) : node_(std::move(node)) {}

Filter Filter::always() {
    return Filter(makeNode(Kind::MatchAll));
}

Filter Filter::isActive() {
    return Filter(makeNode(Kind::IsActive));
}

Filter Filter::hasState(WindowState state) {
    auto node = makeNode(Kind::HasState);
    node->state = state;
    return Filter(std::move(node));
}

Filter Filter::desktopIs(int desktop) {
    auto node = makeNode(Kind::DesktopIs);
    node->number = desktop;
    return Filter(std::move(node));
}

Filter Filter::desktopIn(std::vector<int> desktops) {
    auto node = makeNode(Kind::DesktopIn);
    node->numbers = std::move(desktops);
    return Filter(std::move(node));
}

Filter Filter::desktopIsCurrent() {
    return Filter(makeNode(Kind::DesktopIsCurrent));
}

Filter Filter::onCurrentDesktop() {
    return Filter(makeNode(Kind::OnCurrentDesktop));
}

Filter Filter::typeIs(WindowType type) {
    auto node = makeNode(Kind::TypeIs);
    node->type = type;
    return Filter(std::move(node));
}

Filter Filter::typeIn(std::vector<WindowType> types) {
    auto node = makeNode(Kind::TypeIn);
    node->types = std::move(types);
    return Filter(std::move(node));
}

Filter Filter::containsPoint(int x, int y) {
    auto node = makeNode(Kind::ContainsPoint);
    node->x = x;
    node->y = y;
    return Filter(std::move(node));
}

Filter Filter::idIs(WindowId id) {
    auto node = makeNode(Kind::IdIs);
    node->id = id;
    return Filter(std::move(node));
}

Filter Filter::classIs(std::string class_name) {
    auto node = makeNode(Kind::ClassIs);
    node->text = std::move(class_name);
    return Filter(std::move(node));
}

Filter operator&&(const Filter& lhs, const Filter& rhs) {
    auto node = makeNode(Filter::Kind::And);
    node->children = {lhs.node_, rhs.node_};
    return Filter(std::move(node));
}

Filter operator||(const Filter& lhs, const Filter& rhs) {
    auto node = makeNode(Filter::Kind::Or);
    node->children = {lhs.node_, rhs.node_};
    return Filter(std::move(node));
}

Filter operator!(const Filter& operand) {
    auto node = makeNode(Filter::Kind::Not);
    node->children = {operand.node_};
    return Filter(std::move(node));
}

Filter::Kind Filter::kind() const {
    return node_->kind;
}

// ============================================================================
// Evaluation
// ============================================================================

bool Filter::evaluate(const WindowSnapshot& window, const FilterContext& context) const {
    return evaluateNode(*node_, window, context);
}

bool Filter::evaluateNode(const Node& node, const WindowSnapshot& window,
                          const FilterContext& context) {
    switch (node.kind) {
        case Kind::MatchAll:
            return true;

        case Kind::And:
            return evaluateNode(*node.children[0], window, context) &&
                   evaluateNode(*node.children[1], window, context);

        case Kind::Or:
            return evaluateNode(*node.children[0], window, context) ||
                   evaluateNode(*node.children[1], window, context);

        case Kind::Not:
            return !evaluateNode(*node.children[0], window, context);

        case Kind::IsActive:
            return window.active;

        case Kind::HasState:
            return window.state.has(node.state);

        case Kind::DesktopIs:
            return window.desktop && *window.desktop == node.number;

        case Kind::DesktopIn:
            return window.desktop &&
                   std::find(node.numbers.begin(), node.numbers.end(), *window.desktop) !=
                       node.numbers.end();

        case Kind::DesktopIsCurrent:
            return window.desktop && context.current_desktop &&
                   *window.desktop == *context.current_desktop;

        case Kind::OnCurrentDesktop:
            if (!context.current_desktop) return false;
            return !window.desktop || window.hasState(WindowState::Sticky) ||
                   *window.desktop == *context.current_desktop;

        case Kind::TypeIs:
            return window.type == node.type;

        case Kind::TypeIn:
            return std::find(node.types.begin(), node.types.end(), window.type) != node.types.end();

        case Kind::ContainsPoint:
            return window.geometry.contains(node.x, node.y);

        case Kind::IdIs:
            return window.id == node.id;

        case Kind::ClassIs:
            return !window.class_name.empty() && window.class_name == node.text;
    }
    return false;
}

std::vector<WindowSnapshot> Filter::select(const SnapshotSet& windows,
                                           const FilterContext& context) const {
    std::vector<WindowSnapshot> selected;
    for (const auto& window : windows) {
        if (evaluateNode(*node_, window, context)) {
            selected.push_back(window);
        }
    }
    return selected;
}

// ============================================================================
// Description
// ============================================================================

std::string Filter::describe() const {
    return describeNode(*node_);
}

std::string Filter::describeNode(const Node& node) {
    std::ostringstream oss;
    switch (node.kind) {
        case Kind::MatchAll:
            oss << "always";
            break;
        case Kind::And:
            oss << "(" << describeNode(*node.children[0]) << " && "
                << describeNode(*node.children[1]) << ")";
            break;
        case Kind::Or:
            oss << "(" << describeNode(*node.children[0]) << " || "
                << describeNode(*node.children[1]) << ")";
            break;
        case Kind::Not:
            oss << "!" << describeNode(*node.children[0]);
            break;
        case Kind::IsActive:
            oss << "active";
            break;
        case Kind::HasState:
            oss << "state." << windowStateToString(node.state);
            break;
        case Kind::DesktopIs:
            oss << "desktop == " << node.number;
            break;
        case Kind::DesktopIn: {
            oss << "desktop in [";
            for (size_t i = 0; i < node.numbers.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << node.numbers[i];
            }
            oss << "]";
            break;
        }
        case Kind::DesktopIsCurrent:
            oss << "desktop == current";
            break;
        case Kind::OnCurrentDesktop:
            oss << "on-current-desktop";
            break;
        case Kind::TypeIs:
            oss << "type == \"" << windowTypeToString(node.type) << "\"";
            break;
        case Kind::TypeIn: {
            oss << "type in [";
            for (size_t i = 0; i < node.types.size(); ++i) {
                if (i > 0) oss << ", ";
                oss << windowTypeToString(node.types[i]);
            }
            oss << "]";
            break;
        }
        case Kind::ContainsPoint:
            oss << "contains(" << node.x << ", " << node.y << ")";
            break;
        case Kind::IdIs:
            oss << "id == 0x" << std::hex << node.id << std::dec;
            break;
        case Kind::ClassIs:
            oss << "class == \"" << node.text << "\"";
            break;
    }
    return oss.str();
}

// ============================================================================
// FilterRegistry
// ============================================================================

FilterRegistry::FilterRegistry()
    : default_filter_(Filter::isActive()) {
    presets_.emplace("active", default_filter_);
    presets_.emplace("all", Filter::always());
    presets_.emplace("normal",
                     Filter::typeIn({WindowType::Normal, WindowType::Dialog, WindowType::Utility}) &&
                     !Filter::hasState(WindowState::Minimized));
    presets_.emplace("here",
                     Filter::onCurrentDesktop() &&
                     Filter::typeIn({WindowType::Normal, WindowType::Dialog, WindowType::Utility}) &&
                     !Filter::hasState(WindowState::Minimized));
}

void FilterRegistry::define(const std::string& name, Filter filter) {
    presets_.insert_or_assign(name, std::move(filter));
}

std::optional<Filter> FilterRegistry::find(const std::string& name) const {
    auto it = presets_.find(name);
    if (it == presets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> FilterRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(presets_.size());
    for (const auto& [name, filter] : presets_) {
        result.push_back(name);
    }
    return result;
}

}
