#include <winorg/config/ConfigParser.hpp>
#include <winorg/action/ActionParser.hpp>

#include <gtest/gtest.h>

#include <algorithm>

using namespace worg;

namespace {

WindowSnapshot window(WindowId id, std::optional<int> desktop, bool active = false) {
    WindowSnapshot w;
    w.id = id;
    w.geometry = Rect{0, 0, 640, 480};
    w.desktop = desktop;
    w.active = active;
    return w;
}

bool hasError(const ConfigParser& parser, const std::string& needle) {
    const auto& errors = parser.getErrors();
    return std::any_of(errors.begin(), errors.end(),
        [&needle](const std::string& e) { return e.find(needle) != std::string::npos; });
}

}

TEST(ConfigParser, gridAndGeneralSettings) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString(R"(
winorg: {
    grid: {
        columns: 3
        rows: 2
        inner_gap: 8
        outer_gap: 4
        top_gap: 30
        span_grow: false
    }
    general: {
        numlock: 0
        confirm_timeout_ms: 250
        verbose: true
    }
}
)"));

    EXPECT_TRUE(parser.getErrors().empty());

    const Config& config = parser.getConfig();
    EXPECT_EQ(config.grid.columns, 3);
    EXPECT_EQ(config.grid.rows, 2);
    EXPECT_EQ(config.grid.gaps.getInnerGap(), 8);
    EXPECT_EQ(config.grid.gaps.getTopGap(), 30);
    EXPECT_EQ(config.grid.gaps.getLeftGap(), 4);
    EXPECT_FALSE(config.grid.span_grow);

    EXPECT_EQ(config.general.numlock, 0);
    EXPECT_EQ(config.general.confirm_timeout_ms, 250);
    EXPECT_EQ(config.general.dedup_capacity, 256);
    EXPECT_TRUE(config.general.verbose);
    EXPECT_TRUE(config.general.dbus);
}

TEST(ConfigParser, variablesAndConditionals) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString(R"(
let gap = 6;
let wide = true;

grid: {
    inner_gap: gap * 2
    if (wide) {
        columns: 4
    } else {
        columns: 2
    }
}
)"));

    EXPECT_TRUE(parser.getErrors().empty());
    EXPECT_EQ(parser.getConfig().grid.gaps.getInnerGap(), 12);
    EXPECT_EQ(parser.getConfig().grid.columns, 4);
}

TEST(ConfigParser, filterCombinesActiveAndDesktop) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString(R"(
filters: {
    focused_two: active && desktop == 2
}
)"));

    auto filter = parser.getConfig().filters.find("focused_two");
    ASSERT_TRUE(filter.has_value());

    SnapshotSet windows({
        window(3, 2),
        window(5, 1),
        window(7, 2, true),
        window(9, std::nullopt),
        window(11, 0),
    });

    auto selected = filter->select(windows);
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0].id, 7u);
}

TEST(ConfigParser, filterListsStatesAndPresets) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString(R"(
filters: {
    panels: type == ["dock", "toolbar"]
    terms: class == "XTerm" && !state.minimized
    anywhere: panels || terms
    early: desktop == [0, 1]
    big: state.maximized
}
)"));
    EXPECT_TRUE(parser.getErrors().empty());

    const auto& filters = parser.getConfig().filters;

    WindowSnapshot dock = window(1, 0);
    dock.type = WindowType::Dock;
    WindowSnapshot term = window(2, 3);
    term.class_name = "XTerm";
    WindowSnapshot hidden = term;
    hidden.id = 3;
    hidden.state = StateSet(WindowState::Minimized);
    WindowSnapshot maxed = window(4, 1);
    maxed.state = states::Maximized;
    WindowSnapshot half = window(5, 1);
    half.state = StateSet(WindowState::MaximizedHorz);

    auto anywhere = filters.find("anywhere");
    ASSERT_TRUE(anywhere.has_value());
    EXPECT_TRUE(anywhere->evaluate(dock));
    EXPECT_TRUE(anywhere->evaluate(term));
    EXPECT_FALSE(anywhere->evaluate(hidden));

    auto early = filters.find("early");
    ASSERT_TRUE(early.has_value());
    EXPECT_TRUE(early->evaluate(dock));
    EXPECT_FALSE(early->evaluate(term));

    auto big = filters.find("big");
    ASSERT_TRUE(big.has_value());
    EXPECT_TRUE(big->evaluate(maxed));
    EXPECT_FALSE(big->evaluate(half));
}

TEST(ConfigParser, filterErrorsAreReported) {
    ConfigParser parser;
    EXPECT_TRUE(parser.loadFromString(R"(
filters: {
    broken: type == "spaceship"
    unknown: later_preset
    odd: desktop > 1
}
)"));

    EXPECT_FALSE(parser.getConfig().filters.contains("broken"));
    EXPECT_FALSE(parser.getConfig().filters.contains("unknown"));
    EXPECT_FALSE(parser.getConfig().filters.contains("odd"));
    EXPECT_TRUE(hasError(parser, "Line 3: Filter 'broken'"));
    EXPECT_TRUE(hasError(parser, "Line 4: Filter 'unknown'"));
    EXPECT_TRUE(hasError(parser, "Line 5: Filter 'odd'"));
}

TEST(ConfigParser, bindsKeepSourceOrder) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString(R"(
binds: {
    "SUPER, Tab": "cycle next"
    "SUPER, M": "toggle maximize"
    "SUPER, F": 42
}
)"));

    const auto& binds = parser.getConfig().keybinds;
    ASSERT_EQ(binds.size(), 2u);
    EXPECT_EQ(binds[0].keys, "SUPER, Tab");
    EXPECT_EQ(binds[0].action, "cycle next");
    EXPECT_EQ(binds[0].line, 3);
    EXPECT_EQ(binds[1].keys, "SUPER, M");
    EXPECT_EQ(binds[1].action, "toggle maximize");
    EXPECT_TRUE(hasError(parser, "Line 5: Action of 'SUPER, F' must be a string"));
}

TEST(ConfigParser, syntaxErrorIsFatalAndCarriesLine) {
    ConfigParser parser;
    EXPECT_FALSE(parser.loadFromString(R"(
grid: {
    columns: * 3
}
)"));

    EXPECT_TRUE(hasError(parser, "Line 3: Expected expression"));
}

TEST(ConfigParser, lexerErrorIsFatal) {
    ConfigParser parser;
    EXPECT_FALSE(parser.loadFromString("grid: { columns: 2 @ }\n"));
    EXPECT_TRUE(hasError(parser, "Unexpected character: @"));

    ConfigParser unterminated;
    EXPECT_FALSE(unterminated.loadFromString("binds: { \"SUPER, M\": \"toggle }"));
    EXPECT_TRUE(hasError(unterminated, "Unterminated string"));
}

TEST(ConfigParser, invalidValuesKeepDefaults) {
    ConfigParser parser;
    EXPECT_TRUE(parser.loadFromString(R"(
grid: {
    columns: 0
    rows: "two"
    inner_gap: -3
    diagonal: 1
}
general: {
    numlock: 7
    dedup_capacity: 0
}
layout: {
    mode: 1
}
)"));

    const Config& config = parser.getConfig();
    EXPECT_EQ(config.grid.columns, 2);
    EXPECT_EQ(config.grid.rows, 2);
    EXPECT_EQ(config.grid.gaps.getInnerGap(), 0);
    EXPECT_EQ(config.general.numlock, 2);
    EXPECT_EQ(config.general.dedup_capacity, 256);

    EXPECT_TRUE(hasError(parser, "Line 3: grid.columns must be positive"));
    EXPECT_TRUE(hasError(parser, "Line 4: grid.rows expects a number"));
    EXPECT_TRUE(hasError(parser, "Line 5: grid.inner_gap must not be negative"));
    EXPECT_TRUE(hasError(parser, "Line 6: Unknown setting 'grid.diagonal'"));
    EXPECT_TRUE(hasError(parser, "Line 9: general.numlock must be 0, 1 or 2"));
    EXPECT_TRUE(hasError(parser, "Line 10: general.dedup_capacity must be positive"));
    EXPECT_TRUE(hasError(parser, "Line 12: Unknown block 'layout'"));
}

TEST(ConfigParser, integerOverflowIsReported) {
    ConfigParser parser;
    EXPECT_TRUE(parser.loadFromString(R"(
let big = 100000 * 100000;
grid: {
    columns: big
    inner_gap: 2147483647 + 1
    outer_gap: -(0 - 2147483647 - 1)
    rows: 3 * 2
}
)"));

    const Config& config = parser.getConfig();
    EXPECT_EQ(config.grid.columns, 2);
    EXPECT_EQ(config.grid.gaps.getInnerGap(), 0);
    EXPECT_EQ(config.grid.gaps.getOuterGap(), 0);
    EXPECT_EQ(config.grid.rows, 6);

    EXPECT_TRUE(hasError(parser, "Line 4: grid.columns is out of range"));
    EXPECT_TRUE(hasError(parser, "Line 5: grid.inner_gap is out of range"));
    EXPECT_TRUE(hasError(parser, "Line 6: grid.outer_gap is out of range"));
}

TEST(ConfigParser, missingFileIsReported) {
    ConfigParser parser;
    EXPECT_FALSE(parser.load("/nonexistent/winorg/winorg.wmi"));
    EXPECT_TRUE(hasError(parser, "Config file not found"));
}

TEST(ConfigParser, embeddedConfigIsComplete) {
    ConfigParser parser;
    ASSERT_TRUE(parser.loadFromString(ConfigParser::getEmbeddedConfig()));
    EXPECT_TRUE(parser.getErrors().empty());

    const Config& config = parser.getConfig();
    EXPECT_EQ(config.grid.columns, 2);
    EXPECT_EQ(config.grid.rows, 2);
    EXPECT_FALSE(config.keybinds.empty());

    ActionParser actions(config.filters);
    for (const auto& bind : config.keybinds) {
        EXPECT_TRUE(actions.parse(bind.action).has_value())
            << bind.keys << " -> " << bind.action << ": " << actions.getLastError();
    }

    auto here = config.filters.find("here");
    ASSERT_TRUE(here.has_value());
    FilterContext context{1};

    WindowSnapshot visible = window(1, 1);
    WindowSnapshot elsewhere = window(2, 0);
    WindowSnapshot sticky = window(3, std::nullopt);
    sticky.state = StateSet(WindowState::Sticky);
    WindowSnapshot minimized = window(4, 1);
    minimized.state = StateSet(WindowState::Minimized);

    EXPECT_TRUE(here->evaluate(visible, context));
    EXPECT_FALSE(here->evaluate(elsewhere, context));
    EXPECT_TRUE(here->evaluate(sticky, context));
    EXPECT_FALSE(here->evaluate(minimized, context));
}
