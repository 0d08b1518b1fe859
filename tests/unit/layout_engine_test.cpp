#include <axial/core/diagnostics.h>
#include <axial/layout/errors.h>
#include <axial/layout/layout_engine.h>

#include <gtest/gtest.h>

#include <map>
#include <vector>

using namespace axial::layout;
using axial::core::DiagnosticEmitter;
using axial::core::Severity;

namespace {

// Host stand-in: intrinsic sizes looked up from plain maps.
struct FakeHost {
    std::map<ChildId, Size> preferred;
    std::map<ChildId, Size> minimum;
    int preferred_queries = 0;

    void attach(LayoutEngine& engine) {
        engine.set_intrinsic_preferred_size([this](ChildId id) {
            ++preferred_queries;
            auto it = preferred.find(id);
            return it == preferred.end() ? Size{} : it->second;
        });
        engine.set_intrinsic_minimum_size([this](ChildId id) {
            auto it = minimum.find(id);
            return it == minimum.end() ? Size{} : it->second;
        });
    }
};

Constraint spec(const SizeSpec& width, const SizeSpec& height,
                const Margins& margins = Margins{}, Alignment alignment = Alignment::Center) {
    return Constraint(alignment, margins, width, height);
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Pass 1: Percent and Absolute
// ---------------------------------------------------------------------------
TEST(ResolveSizeTest, AbsoluteReturnsExactValue) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::absolute(30), SizeSpec::absolute(40)));
    EXPECT_EQ(engine.resolve_size(1, {200, 200}), (Size{30, 40}));
}

TEST(ResolveSizeTest, AbsoluteIsNeverClampedByMax) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::absolute(150, 100), SizeSpec::absolute(90, 10)));
    EXPECT_EQ(engine.resolve_size(1, {200, 200}), (Size{150, 90}));
}

TEST(ResolveSizeTest, PercentOfParentExtent) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::percent(50), SizeSpec::percent(25)));
    EXPECT_EQ(engine.resolve_size(1, {200, 80}), (Size{100, 20}));
}

TEST(ResolveSizeTest, PercentIsClampedByMax) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::percent(50, 60), SizeSpec::percent(100, 35)));
    EXPECT_EQ(engine.resolve_size(1, {200, 80}), (Size{60, 35}));
}

TEST(ResolveSizeTest, FractionalExtentsAreTruncated) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::percent(33.3), SizeSpec::absolute(19.99)));
    EXPECT_EQ(engine.resolve_size(1, {100, 100}), (Size{33, 19}));
}

TEST(ResolveSizeTest, NegativeAbsoluteFallsBackToIntrinsicPreferred) {
    LayoutEngine engine;
    FakeHost host;
    host.preferred[1] = {33, 44};
    host.attach(engine);
    engine.add(1, spec(SizeSpec::intrinsic(), SizeSpec::intrinsic()));

    EXPECT_EQ(engine.resolve_size(1, {200, 200}), (Size{33, 44}));
    EXPECT_EQ(host.preferred_queries, 1);
}

TEST(ResolveSizeTest, MissingIntrinsicCallbackMeansZero) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::intrinsic(), SizeSpec::absolute(5)));
    EXPECT_EQ(engine.resolve_size(1, {200, 200}), (Size{0, 5}));
}

// ---------------------------------------------------------------------------
// 2. Pass 2: Square and Ratio
// ---------------------------------------------------------------------------
TEST(ResolveSizeTest, SquareWidthCopiesHeight) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::square(), SizeSpec::absolute(40)));
    EXPECT_EQ(engine.resolve_size(1, {200, 200}), (Size{40, 40}));
}

TEST(ResolveSizeTest, SquareHeightCopiesPercentWidth) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::percent(50), SizeSpec::square()));
    EXPECT_EQ(engine.resolve_size(1, {300, 100}), (Size{150, 150}));
}

TEST(ResolveSizeTest, RatioHeightScalesWidth) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::absolute(100), SizeSpec::ratio(1.5)));
    EXPECT_EQ(engine.resolve_size(1, {300, 300}), (Size{100, 150}));
}

TEST(ResolveSizeTest, RatioWidthScalesPercentHeight) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::ratio(2), SizeSpec::percent(10)));
    EXPECT_EQ(engine.resolve_size(1, {300, 400}), (Size{80, 40}));
}

TEST(ResolveSizeTest, SquareAndRatioIgnoreMax) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::absolute(100), SizeSpec::ratio(2, 50)));
    EXPECT_EQ(engine.resolve_size(1, {300, 300}), (Size{100, 200}));
}

TEST(ResolveSizeTest, BothAxesCoupledResolveToZero) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::square(), SizeSpec::square()));
    engine.add(2, spec(SizeSpec::ratio(2), SizeSpec::ratio(3)));
    engine.add(3, spec(SizeSpec::ratio(2), SizeSpec::square()));
    EXPECT_EQ(engine.resolve_size(1, {300, 300}), (Size{0, 0}));
    EXPECT_EQ(engine.resolve_size(2, {300, 300}), (Size{0, 0}));
    EXPECT_EQ(engine.resolve_size(3, {300, 300}), (Size{0, 0}));
}

// Square and Ratio run before Rest, so they see a Rest axis as 0.
TEST(ResolveSizeTest, SquareAgainstRestAxisSeesZero) {
    LayoutEngine engine(Orientation::Vertical, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::square(), SizeSpec::rest()));
    EXPECT_EQ(engine.resolve_size(1, {300, 200}), (Size{0, 200}));
}

// ---------------------------------------------------------------------------
// 3. Pass 3: Rest
// ---------------------------------------------------------------------------
TEST(ResolveRestTest, RestWidthTakesWhatSiblingsLeave) {
    LayoutEngine engine(Orientation::Horizontal, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::absolute(50), SizeSpec::absolute(20), Margins{5, 5, 0, 0}));
    engine.add(2, spec(SizeSpec::rest(), SizeSpec::absolute(20), Margins{10, 10, 0, 0}));
    engine.add(3, spec(SizeSpec::percent(10), SizeSpec::absolute(20)));

    // 300 - (50 + 10) - 30 - 20
    EXPECT_EQ(engine.resolve_size(2, {300, 100}), (Size{190, 20}));
}

TEST(ResolveRestTest, RestIsClampedByMax) {
    LayoutEngine engine(Orientation::Horizontal, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::absolute(50), SizeSpec::absolute(20)));
    engine.add(2, spec(SizeSpec::rest(100), SizeSpec::absolute(20)));
    EXPECT_EQ(engine.resolve_size(2, {300, 100}).width, 100);
}

TEST(ResolveRestTest, RestNeverGoesNegative) {
    LayoutEngine engine(Orientation::Horizontal, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::absolute(500), SizeSpec::absolute(20)));
    engine.add(2, spec(SizeSpec::rest(), SizeSpec::absolute(20)));
    EXPECT_EQ(engine.resolve_size(2, {300, 100}).width, 0);
}

TEST(ResolveRestTest, RestCountsSiblingsResolvedThroughSquare) {
    LayoutEngine engine(Orientation::Horizontal, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::square(), SizeSpec::percent(50)));
    engine.add(2, spec(SizeSpec::rest(), SizeSpec::absolute(10)));
    // sibling is 50x50 in a 300x100 parent
    EXPECT_EQ(engine.resolve_size(2, {300, 100}).width, 250);
}

TEST(ResolveRestTest, SecondRestOnPrimaryAxisThrows) {
    LayoutEngine engine(Orientation::Horizontal, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::rest(), SizeSpec::absolute(20)));
    engine.add(2, spec(SizeSpec::rest(), SizeSpec::absolute(20)));
    EXPECT_THROW(engine.resolve_size(1, {300, 100}), MultipleRestError);
    EXPECT_THROW(engine.preferred_size({300, 100}), MultipleRestError);
}

TEST(ResolveRestTest, SecondRestOnVerticalPrimaryAxisThrows) {
    LayoutEngine engine(Orientation::Vertical, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::absolute(20), SizeSpec::rest()));
    engine.add(2, spec(SizeSpec::absolute(20), SizeSpec::rest()));
    EXPECT_THROW(engine.resolve_size(2, {100, 300}), MultipleRestError);
}

// Known quirk: duplicate Rest on the cross axis is accepted. Each child
// subtracts only the other's margins, so both claim the same span.
TEST(ResolveRestTest, DuplicateRestOnCrossAxisIsTolerated) {
    LayoutEngine engine(Orientation::Vertical, SpacingPolicy::PackStart);
    DiagnosticEmitter diagnostics;
    engine.set_diagnostics(&diagnostics);
    engine.add(1, spec(SizeSpec::rest(), SizeSpec::absolute(10), Margins{10, 10, 0, 0}));
    engine.add(2, spec(SizeSpec::rest(), SizeSpec::absolute(10)));
    engine.add(3, spec(SizeSpec::absolute(50), SizeSpec::absolute(10)));

    EXPECT_EQ(engine.resolve_size(1, {200, 300}).width, 130);
    EXPECT_EQ(engine.resolve_size(2, {200, 300}).width, 130);
    EXPECT_EQ(diagnostics.count(Severity::Warning), 0u);
}

TEST(ResolveRestTest, DuplicateCrossAxisRestWarnsOncePerLayout) {
    LayoutEngine engine(Orientation::Vertical, SpacingPolicy::PackStart);
    DiagnosticEmitter diagnostics;
    engine.set_diagnostics(&diagnostics);
    engine.add(1, spec(SizeSpec::rest(), SizeSpec::absolute(10)));
    engine.add(2, spec(SizeSpec::rest(), SizeSpec::absolute(10)));
    engine.add(3, spec(SizeSpec::rest(), SizeSpec::absolute(10)));

    LayoutRegion region;
    region.width = 200;
    region.height = 300;
    engine.preferred_size(region);
    engine.layout(region);

    auto warnings = diagnostics.events_by_severity(Severity::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(warnings[0].stage, "resolve");
    EXPECT_EQ(warnings[0].message,
              "child #1, child #2, child #3 share the remaining space on the cross axis");

    engine.layout(region);
    EXPECT_EQ(diagnostics.count(Severity::Warning), 2u);
}

// Cross-axis Rest subtracts every sibling, even ones laid out beside it.
TEST(ResolveRestTest, CrossAxisRestSubtractsAllSiblings) {
    LayoutEngine engine(Orientation::Horizontal, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::absolute(40), SizeSpec::rest(), Margins{0, 0, 5, 5}));
    engine.add(2, spec(SizeSpec::absolute(40), SizeSpec::absolute(30)));
    EXPECT_EQ(engine.resolve_size(1, {300, 100}).height, 60);
}

TEST(ResolveRestTest, RestOnBothAxesOfDifferentChildrenResolves) {
    LayoutEngine engine(Orientation::Vertical, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::rest(), SizeSpec::absolute(50)));
    engine.add(2, spec(SizeSpec::absolute(40), SizeSpec::rest()));

    EXPECT_EQ(engine.resolve_size(1, {200, 300}), (Size{160, 50}));
    EXPECT_EQ(engine.resolve_size(2, {200, 300}), (Size{40, 250}));
}

// ---------------------------------------------------------------------------
// 4. Minimum and margin-inclusive sizes
// ---------------------------------------------------------------------------
TEST(ResolveMinimumSizeTest, AbsoluteValueOtherwiseIntrinsicMinimum) {
    LayoutEngine engine;
    FakeHost host;
    host.minimum[1] = {12, 7};
    host.minimum[2] = {3, 4};
    host.attach(engine);
    engine.add(1, spec(SizeSpec::percent(50), SizeSpec::absolute(20)));
    engine.add(2, spec(SizeSpec::intrinsic(), SizeSpec::rest()));

    EXPECT_EQ(engine.resolve_minimum_size(1), (Size{12, 20}));
    EXPECT_EQ(engine.resolve_minimum_size(2), (Size{0, 4}));
}

// The minimum never consults the intrinsic size for Absolute, even for the
// negative "intrinsic" marker; the value is clamped to 0 instead.
TEST(ResolveMinimumSizeTest, NegativeAbsoluteClampsToZero) {
    LayoutEngine engine;
    FakeHost host;
    host.minimum[1] = {30, 40};
    host.attach(engine);
    engine.add(1, spec(SizeSpec::absolute(-5), SizeSpec::intrinsic()));
    EXPECT_EQ(engine.resolve_minimum_size(1), (Size{0, 0}));
}

TEST(ResolveMinimumSizeTest, IgnoresDuplicateRest) {
    LayoutEngine engine(Orientation::Vertical, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::absolute(5), SizeSpec::rest()));
    engine.add(2, spec(SizeSpec::absolute(5), SizeSpec::rest()));
    EXPECT_NO_THROW(engine.minimum_size({100, 100}));
}

TEST(ResolveSizeWithMarginsTest, RoundsFractionalMarginsUp) {
    LayoutEngine engine;
    engine.add(1, spec(SizeSpec::absolute(10), SizeSpec::absolute(10), Margins{0.3, 0.3, 2, 2}));
    EXPECT_EQ(engine.resolve_size_with_margins(1, {100, 100}), (Size{11, 14}));
}

// ---------------------------------------------------------------------------
// 5. Unknown children
// ---------------------------------------------------------------------------
TEST(UnknownChildTest, ResolversThrow) {
    LayoutEngine engine;
    engine.add(1, Constraint::fixed(5, 5));
    EXPECT_THROW(engine.resolve_size(99, {100, 100}), UnknownChildError);
    EXPECT_THROW(engine.resolve_minimum_size(99), UnknownChildError);
    EXPECT_THROW(engine.resolve_size_with_margins(99, {100, 100}), UnknownChildError);
}

TEST(UnknownChildTest, LookupsReturnNothing) {
    LayoutEngine engine;
    EXPECT_FALSE(engine.get(99).has_value());
    EXPECT_FALSE(engine.contains(99));
    engine.remove(99);
    EXPECT_TRUE(engine.empty());
}

// ---------------------------------------------------------------------------
// 6. Registration
// ---------------------------------------------------------------------------
TEST(RegistrationTest, ReAddReplacesInPlace) {
    LayoutEngine engine;
    engine.add(1, Constraint::fixed(1, 1));
    engine.add(2, Constraint::fixed(2, 2));
    engine.add(3, Constraint::fixed(3, 3));
    engine.add(2, Constraint::fixed(20, 20));

    EXPECT_EQ(engine.children(), (std::vector<ChildId>{1, 2, 3}));
    EXPECT_EQ(*engine.get(2), Constraint::fixed(20, 20));
}

TEST(RegistrationTest, AddParsesConstraintText) {
    LayoutEngine engine;
    engine.add(7, "RIGHT 1 2 3 4 PERCENT REST 50 0 2147483647 2147483647");
    ASSERT_TRUE(engine.contains(7));
    EXPECT_EQ(engine.get(7)->alignment(), Alignment::End);
    EXPECT_EQ(engine.get(7)->height().type, SizeType::Rest);
}

TEST(RegistrationTest, MalformedTextIsNotAdded) {
    LayoutEngine engine;
    DiagnosticEmitter diagnostics;
    engine.set_diagnostics(&diagnostics);

    EXPECT_THROW(engine.add(1, "CENTER 0 0 0 0 ABSOLUTE ABSOLUTE 10"), MalformedSpecError);
    EXPECT_FALSE(engine.contains(1));
    EXPECT_EQ(engine.size(), 0u);
    EXPECT_EQ(diagnostics.events_by_stage("register").size(), 1u);
}

TEST(RegistrationTest, MalformedTextKeepsPreviousConstraint) {
    LayoutEngine engine;
    engine.add(1, Constraint::fixed(10, 10));
    EXPECT_THROW(engine.add(1, "TOP 0 0 0 0 ABSOLUTE ABSOLUTE 1 1 1 1"), MalformedSpecError);
    EXPECT_EQ(*engine.get(1), Constraint::fixed(10, 10));
}

TEST(RegistrationTest, EmptyTextRegistersIntrinsicSize) {
    LayoutEngine engine;
    FakeHost host;
    host.preferred[4] = {25, 35};
    host.attach(engine);
    engine.add(4, "");
    EXPECT_EQ(*engine.get(4), Constraint::fixed(25, 35));
}

TEST(RegistrationTest, DefaultConstraintCapturesIntrinsicSizeOnce) {
    LayoutEngine engine;
    FakeHost host;
    host.preferred[4] = {25, 35};
    host.attach(engine);
    engine.add(4);
    host.preferred[4] = {80, 80};
    EXPECT_EQ(engine.resolve_size(4, {200, 200}), (Size{25, 35}));
}

TEST(RegistrationTest, SpacerIsCenteredWithoutMargins) {
    LayoutEngine engine;
    engine.add_spacer(9, SizeSpec::percent(10), SizeSpec::absolute(4));
    const Constraint c = *engine.get(9);
    EXPECT_EQ(c.alignment(), Alignment::Center);
    EXPECT_EQ(c.margins(), Margins{});
    EXPECT_EQ(engine.resolve_size(9, {300, 100}), (Size{30, 4}));
}

TEST(RegistrationTest, RemoveKeepsOrderOfOthers) {
    LayoutEngine engine;
    for (ChildId id : {5, 6, 7, 8}) engine.add(id, Constraint::fixed(1, 1));
    engine.remove(6);
    EXPECT_EQ(engine.children(), (std::vector<ChildId>{5, 7, 8}));
    engine.clear();
    EXPECT_TRUE(engine.empty());
}

TEST(RegistrationTest, DefaultEngineIsVerticalPackCenter) {
    LayoutEngine engine;
    EXPECT_EQ(engine.orientation(), Orientation::Vertical);
    EXPECT_EQ(engine.spacing(), SpacingPolicy::PackCenter);
}

TEST(RegistrationTest, PolicyNamesReadBack) {
    for (SpacingPolicy p : {SpacingPolicy::SpaceAround, SpacingPolicy::SpaceBetween,
                            SpacingPolicy::PackStart, SpacingPolicy::PackCenter,
                            SpacingPolicy::PackEnd}) {
        EXPECT_EQ(parse_spacing_policy(spacing_policy_name(p)), p);
    }
    EXPECT_EQ(parse_orientation("HORIZONTAL"), Orientation::Horizontal);
    EXPECT_FALSE(parse_orientation("DIAGONAL").has_value());
}

// ---------------------------------------------------------------------------
// 7. Aggregate size queries
// ---------------------------------------------------------------------------
TEST(AggregateSizeTest, VerticalSumsHeightsAndTakesWidestWidth) {
    LayoutEngine engine(Orientation::Vertical, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::absolute(50), SizeSpec::absolute(20), Margins{2, 3, 5, 5}));
    engine.add(2, spec(SizeSpec::absolute(80), SizeSpec::absolute(30)));
    EXPECT_EQ(engine.preferred_size({400, 400}), (Size{80, 60}));
}

TEST(AggregateSizeTest, HorizontalSumsWidthsAndTakesTallestHeight) {
    LayoutEngine engine(Orientation::Horizontal, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::absolute(50), SizeSpec::absolute(20), Margins{2, 3, 5, 5}));
    engine.add(2, spec(SizeSpec::absolute(80), SizeSpec::absolute(30)));
    EXPECT_EQ(engine.preferred_size({400, 400}), (Size{135, 30}));
}

TEST(AggregateSizeTest, PreferredResolvesAgainstRegion) {
    LayoutEngine engine(Orientation::Vertical, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::percent(50), SizeSpec::percent(10)));
    EXPECT_EQ(engine.preferred_size({200, 300}), (Size{100, 30}));
}

TEST(AggregateSizeTest, MinimumUsesMinimumResolver) {
    LayoutEngine engine(Orientation::Vertical, SpacingPolicy::PackStart);
    FakeHost host;
    host.minimum[1] = {12, 7};
    host.attach(engine);
    engine.add(1, spec(SizeSpec::percent(50), SizeSpec::absolute(20), Margins{1, 1, 1, 1}));
    engine.add(2, spec(SizeSpec::absolute(4), SizeSpec::absolute(4)));
    EXPECT_EQ(engine.minimum_size({200, 200}), (Size{14, 26}));
}

TEST(AggregateSizeTest, MaximumSumsBothAxes) {
    LayoutEngine engine(Orientation::Vertical, SpacingPolicy::PackStart);
    engine.add(1, spec(SizeSpec::absolute(50), SizeSpec::absolute(20), Margins{2, 3, 5, 5}));
    engine.add(2, spec(SizeSpec::absolute(80), SizeSpec::absolute(30)));
    EXPECT_EQ(engine.maximum_size({400, 400}), (Size{135, 60}));
}

TEST(AggregateSizeTest, EmptyLayoutIsZero) {
    LayoutEngine engine;
    EXPECT_EQ(engine.preferred_size({100, 100}), (Size{0, 0}));
    EXPECT_EQ(engine.minimum_size({100, 100}), (Size{0, 0}));
    EXPECT_EQ(engine.maximum_size({100, 100}), (Size{0, 0}));
}
