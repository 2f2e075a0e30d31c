#pragma once

#include <optional>
#include <string>

#include "winorg/action/Action.hpp"
#include "winorg/filter/Filter.hpp"

namespace worg {

/**
 * @brief Parses action strings from keybinds, the config and D-Bus
 *
 * Grammar (whitespace separated, case-insensitive keywords):
 *
 *   cycle next|previous [preset]
 *   grid <col> <row> [<colspan> <rowspan>]
 *   grid left|right|up|down
 *   move <dx> <dy>
 *   move-cells <dx> <dy>
 *   resize <edge> <delta>
 *   resize-cells <edge> <delta>
 *   toggle maximize|maximize-horz|maximize-vert|fullscreen|shade|sticky|above|below
 *   place <gravity> [<wfrac> <hfrac>]
 *   reset
 *
 * Every action except cycle targets the registry's default filter (the
 * active window); cycle targets the named preset, "here" when omitted.
 */
class ActionParser {
public:
    explicit ActionParser(const FilterRegistry& filters);

    std::optional<ActionRequest> parse(const std::string& text);

    const std::string& getLastError() const { return last_error_; }

private:
    const FilterRegistry& filters_;
    std::string last_error_;

    std::optional<ActionRequest> fail(const std::string& message);
};

}
