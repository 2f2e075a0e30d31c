#include "winorg/action/ActionParser.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace worg {

namespace {

constexpr const char* DEFAULT_CYCLE_PRESET = "here";

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool parseInt(const std::string& token, int& out) {
    if (token.empty()) return false;
    size_t consumed = 0;
    try {
        out = std::stoi(token, &consumed);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return consumed == token.size();
}

bool parseFraction(const std::string& token, double& out) {
    if (token.empty()) return false;
    size_t consumed = 0;
    try {
        out = std::stod(token, &consumed);
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
    return consumed == token.size() && out > 0.0 && out <= 1.0;
}

std::optional<StateSet> parseToggleFlag(const std::string& name) {
    if (name == "maximize" || name == "maximized") {
        return states::Maximized;
    } else if (name == "maximize-horz" || name == "maximize-horizontal") {
        return StateSet(WindowState::MaximizedHorz);
    } else if (name == "maximize-vert" || name == "maximize-vertical") {
        return StateSet(WindowState::MaximizedVert);
    } else if (name == "fullscreen") {
        return StateSet(WindowState::Fullscreen);
    } else if (name == "shade" || name == "shaded") {
        return StateSet(WindowState::Shaded);
    } else if (name == "sticky") {
        return StateSet(WindowState::Sticky);
    } else if (name == "above") {
        return StateSet(WindowState::AboveLayer);
    } else if (name == "below") {
        return StateSet(WindowState::BelowLayer);
    }
    return std::nullopt;
}

}

ActionParser::ActionParser(const FilterRegistry& filters)
    : filters_(filters) {}

std::optional<ActionRequest> ActionParser::fail(const std::string& message) {
    last_error_ = message;
    return std::nullopt;
}

std::optional<ActionRequest> ActionParser::parse(const std::string& text) {
    last_error_.clear();

    std::istringstream iss(text);
    std::vector<std::string> args;
    std::string token;
    while (iss >> token) {
        args.push_back(token);
    }

    if (args.empty()) {
        return fail("empty action");
    }

    const std::string command = toLower(args[0]);

    ActionRequest request;
    request.target = filters_.defaultFilter();

    if (command == "cycle") {
        if (args.size() < 2 || args.size() > 3) {
            return fail("usage: cycle next|previous [preset]");
        }
        std::string direction = toLower(args[1]);
        CycleAction cycle;
        if (direction == "next") {
            cycle.direction = CycleDirection::Next;
        } else if (direction == "previous" || direction == "prev") {
            cycle.direction = CycleDirection::Previous;
        } else {
            return fail("unknown cycle direction '" + args[1] + "'");
        }

        std::string preset = args.size() == 3 ? args[2] : DEFAULT_CYCLE_PRESET;
        auto filter = filters_.find(preset);
        if (!filter) {
            return fail("unknown filter preset '" + preset + "'");
        }
        request.action = cycle;
        request.target = *filter;

    } else if (command == "grid") {
        if (args.size() == 2) {
            auto direction = directionFromString(args[1]);
            if (!direction) {
                return fail("unknown grid direction '" + args[1] + "'");
            }
            GridPutAction put;
            put.direction = *direction;
            request.action = put;
        } else if (args.size() == 3 || args.size() == 5) {
            GridCell cell;
            if (!parseInt(args[1], cell.col) || !parseInt(args[2], cell.row)) {
                return fail("grid cell coordinates must be integers");
            }
            if (args.size() == 5 &&
                (!parseInt(args[3], cell.col_span) || !parseInt(args[4], cell.row_span))) {
                return fail("grid spans must be integers");
            }
            GridPutAction put;
            put.cell = cell;
            request.action = put;
        } else {
            return fail("usage: grid <col> <row> [<colspan> <rowspan>] | grid left|right|up|down");
        }

    } else if (command == "move" || command == "move-cells") {
        MoveAction move;
        if (args.size() != 3 || !parseInt(args[1], move.dx) || !parseInt(args[2], move.dy)) {
            return fail("usage: " + command + " <dx> <dy>");
        }
        move.unit = command == "move-cells" ? Unit::Cells : Unit::Pixels;
        request.action = move;

    } else if (command == "resize" || command == "resize-cells") {
        if (args.size() != 3) {
            return fail("usage: " + command + " <edge> <delta>");
        }
        auto edge = edgeFromString(args[1]);
        if (!edge) {
            return fail("unknown edge '" + args[1] + "'");
        }
        ResizeAction resize;
        resize.edge = *edge;
        if (!parseInt(args[2], resize.delta)) {
            return fail("resize delta must be an integer");
        }
        resize.unit = command == "resize-cells" ? Unit::Cells : Unit::Pixels;
        request.action = resize;

    } else if (command == "toggle") {
        if (args.size() != 2) {
            return fail("usage: toggle <state>");
        }
        auto flags = parseToggleFlag(toLower(args[1]));
        if (!flags) {
            return fail("unknown state '" + args[1] + "'");
        }
        request.action = ToggleStateAction{*flags};

    } else if (command == "place") {
        if (args.size() != 2 && args.size() != 4) {
            return fail("usage: place <gravity> [<wfrac> <hfrac>]");
        }
        auto gravity = Gravity::parse(args[1]);
        if (!gravity) {
            return fail("unknown gravity '" + args[1] + "'");
        }
        PlaceAction place;
        place.gravity = *gravity;
        if (args.size() == 4) {
            double wfrac = 0.0;
            double hfrac = 0.0;
            if (!parseFraction(args[2], wfrac) || !parseFraction(args[3], hfrac)) {
                return fail("place fractions must lie in (0, 1]");
            }
            place.width_fraction = wfrac;
            place.height_fraction = hfrac;
        }
        request.action = place;

    } else if (command == "reset") {
        if (args.size() != 1) {
            return fail("reset takes no arguments");
        }
        request.action = ResetAction{};

    } else {
        return fail("unknown action '" + args[0] + "'");
    }

    return request;
}

}
