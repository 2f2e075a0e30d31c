#include "winorg/action/Action.hpp"
#include <sstream>
#include <type_traits>

namespace worg {

namespace {

template<typename>
inline constexpr bool always_false = false;

const char* unitSuffix(Unit unit) {
    return unit == Unit::Cells ? " cells" : " px";
}

}

std::string describeAction(const Action& action) {
    std::ostringstream oss;

    std::visit([&oss](auto&& a) {
        using T = std::decay_t<decltype(a)>;

        if constexpr (std::is_same_v<T, CycleAction>) {
            oss << "cycle " << (a.direction == CycleDirection::Next ? "next" : "previous");
        } else if constexpr (std::is_same_v<T, GridPutAction>) {
            oss << "grid ";
            if (a.direction) {
                oss << directionToString(*a.direction);
            } else if (a.cell) {
                oss << a.cell->toString();
            }
        } else if constexpr (std::is_same_v<T, MoveAction>) {
            oss << "move " << a.dx << " " << a.dy << unitSuffix(a.unit);
        } else if constexpr (std::is_same_v<T, ResizeAction>) {
            oss << "resize " << edgeToString(a.edge) << " " << a.delta << unitSuffix(a.unit);
        } else if constexpr (std::is_same_v<T, ToggleStateAction>) {
            oss << "toggle " << a.flags.toString();
        } else if constexpr (std::is_same_v<T, PlaceAction>) {
            oss << "place " << a.gravity.toString();
            if (a.width_fraction && a.height_fraction) {
                oss << " " << *a.width_fraction << "x" << *a.height_fraction;
            }
        } else if constexpr (std::is_same_v<T, ResetAction>) {
            oss << "reset";
        } else {
            static_assert(always_false<T>, "unhandled action kind");
        }
    }, action);

    return oss.str();
}

std::string ActionRequest::dedupKey() const {
    if (timestamp == 0) {
        return {};
    }
    return origin + "|" + describeAction(action) + "|" + target.describe() + "|" +
           std::to_string(timestamp);
}

}
