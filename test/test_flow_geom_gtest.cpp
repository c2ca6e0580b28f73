// test_flow_geom_gtest.cpp - Unit tests for flow geometry, style and bookkeeping
//
// Tests:
// - Length fitting and relative lengths
// - Region sequences
// - Style defaults and configuration parsing
// - Diagnostics sink
// - Skip set sharing
// - Flow configuration

#include <gtest/gtest.h>
#include "quire/flow/flow_geom.hpp"
#include "quire/flow/flow_style.hpp"
#include "quire/flow/flow_diag.hpp"
#include "quire/flow/flow_internal.hpp"
#include "lib/arena.h"
#include "lib/mempool.h"
#include "lib/log.h"
#include <cstdio>

using namespace quire;

// ============================================================================
// Test Fixture
// ============================================================================

class FlowGeomTest : public ::testing::Test {
protected:
    Pool* pool;
    Arena* arena;

    void SetUp() override {
        pool = pool_create();
        arena = arena_create_default(pool);
    }

    void TearDown() override {
        arena_destroy(arena);
        pool_destroy(pool);
    }
};

// ============================================================================
// Lengths
// ============================================================================

TEST_F(FlowGeomTest, FitsAcceptsExactBoundary) {
    EXPECT_TRUE(fits(100.0f, 100.0f));
    EXPECT_TRUE(fits(100.0f, 100.00005f));
    EXPECT_FALSE(fits(100.0f, 100.01f));
    EXPECT_TRUE(fits(UNBOUNDED, 1e9f));
    EXPECT_FALSE(fits(-1.0f, 0.0f));
}

TEST_F(FlowGeomTest, RelativeLengths) {
    EXPECT_FLOAT_EQ(Rel::absolute(12).relative_to(500), 12.0f);
    EXPECT_FLOAT_EQ(Rel::relative(0.5f).relative_to(300), 150.0f);
    Rel mixed{10, 0.1f};
    EXPECT_FLOAT_EQ(mixed.relative_to(200), 30.0f);
    EXPECT_FLOAT_EQ(Rel::zero().relative_to(UNBOUNDED), 0.0f);
}

TEST_F(FlowGeomTest, AlignmentPositions) {
    EXPECT_FLOAT_EQ(align_position(Align::Start, 40), 0.0f);
    EXPECT_FLOAT_EQ(align_position(Align::Center, 40), 20.0f);
    EXPECT_FLOAT_EQ(align_position(Align::End, 40), 40.0f);
    EXPECT_EQ(align_inv(Align::Start), Align::End);
    EXPECT_EQ(align_inv(Align::Center), Align::Center);
    EXPECT_EQ(align_resolve(Align::Start, Dir::RTL), Align::End);
    EXPECT_EQ(align_resolve(Align::Start, Dir::LTR), Align::Start);
}

// ============================================================================
// Regions
// ============================================================================

TEST_F(FlowGeomTest, SingleRegionCannotProgress) {
    Regions r = Regions::one(Size{200, 100}, Expand{true, true});
    EXPECT_FALSE(r.may_progress());
    EXPECT_FALSE(r.is_full());

    float h = 0;
    EXPECT_TRUE(r.nth_height(0, &h));
    EXPECT_FLOAT_EQ(h, 100.0f);
    EXPECT_FALSE(r.nth_height(1, &h));
}

TEST_F(FlowGeomTest, RepeatingRegionProgressesOnlyWhenUsed) {
    Regions r = Regions::repeat(Size{200, 100}, Expand{true, true});
    EXPECT_FALSE(r.may_progress());

    r.size.y = 40;
    EXPECT_TRUE(r.may_progress());
    EXPECT_FALSE(r.is_full());

    r.size.y = 0;
    EXPECT_TRUE(r.is_full());

    r.next();
    EXPECT_FLOAT_EQ(r.size.y, 100.0f);
    EXPECT_FLOAT_EQ(r.full, 100.0f);
}

TEST_F(FlowGeomTest, BacklogIsConsumedInOrder) {
    float backlog[] = {50, 70};
    Regions r = Regions::one(Size{200, 30}, Expand{true, false});
    r.backlog = backlog;
    r.backlog_len = 2;

    float h = 0;
    EXPECT_TRUE(r.nth_height(2, &h));
    EXPECT_FLOAT_EQ(h, 70.0f);
    EXPECT_FALSE(r.nth_height(3, &h));
    EXPECT_TRUE(r.may_progress());

    r.next();
    EXPECT_FLOAT_EQ(r.size.y, 50.0f);
    EXPECT_EQ(r.backlog_len, 1);
    r.next();
    EXPECT_FLOAT_EQ(r.size.y, 70.0f);
    EXPECT_FALSE(r.may_progress());

    // past the end the region stays put
    r.next();
    EXPECT_FLOAT_EQ(r.size.y, 70.0f);
}

TEST_F(FlowGeomTest, BaseUsesFullHeight) {
    Regions r = Regions::one(Size{200, 100}, Expand{true, true});
    r.size.y = 25;
    Size base = r.base();
    EXPECT_FLOAT_EQ(base.x, 200.0f);
    EXPECT_FLOAT_EQ(base.y, 100.0f);
}

// ============================================================================
// Style
// ============================================================================

TEST_F(FlowGeomTest, StyleDefaults) {
    FlowStyle s = FlowStyle::defaults();
    EXPECT_EQ(s.dir, Dir::LTR);
    EXPECT_FLOAT_EQ(s.font_size, 11.0f);
    EXPECT_FLOAT_EQ(s.spacing_above(), s.par_spacing);
    EXPECT_TRUE(s.orphan_prevention);
    EXPECT_EQ(s.line_numbering_scope, LineNumberingScope::Document);
    EXPECT_LT(s.line_number_clearance, 0.0f);
}

TEST_F(FlowGeomTest, StyleParseAppliesValues) {
    FlowStyle s = FlowStyle::defaults();
    const char* text =
        "# flow configuration\n"
        "dir = rtl\n"
        "font_size = 10pt\n"
        "leading = 0.5em\n"
        "block_above = 1cm\n"
        "block_below = auto\n"
        "widow_prevention = no\n"
        "footnote_gap = 2mm   # trailing comment\n"
        "line_numbering_scope = page\n"
        "line_number_clearance = 1in\n";
    EXPECT_EQ(flow_style_parse(&s, text), 0);

    EXPECT_EQ(s.dir, Dir::RTL);
    EXPECT_FLOAT_EQ(s.font_size, 10.0f);
    EXPECT_FLOAT_EQ(s.leading, 5.0f);
    EXPECT_NEAR(s.block_above, 28.3465f, 1e-3);
    EXPECT_FLOAT_EQ(s.block_below, -1.0f);
    EXPECT_FALSE(s.widow_prevention);
    EXPECT_NEAR(s.footnote_gap, 5.6693f, 1e-3);
    EXPECT_EQ(s.line_numbering_scope, LineNumberingScope::Page);
    EXPECT_FLOAT_EQ(s.line_number_clearance, 72.0f);
}

TEST_F(FlowGeomTest, StyleParseRejectsBadLines) {
    FlowStyle s = FlowStyle::defaults();
    const char* text =
        "leading = 4pt\n"
        "no equals sign\n"
        "unknown_key = 3pt\n"
        "font_size = -2pt\n"
        "par_spacing = 3furlongs\n";
    EXPECT_EQ(flow_style_parse(&s, text), 4);
    EXPECT_FLOAT_EQ(s.leading, 4.0f);
    EXPECT_FLOAT_EQ(s.font_size, 11.0f);
}

TEST_F(FlowGeomTest, StyleLoadFromFile) {
    const char* path = "test_flow_style.conf";
    FILE* f = fopen(path, "w");
    ASSERT_NE(f, nullptr);
    fputs("par_spacing = 8pt\nfloat_clearance = 12pt\n", f);
    fclose(f);

    FlowStyle s = FlowStyle::defaults();
    EXPECT_TRUE(flow_style_load(&s, path));
    EXPECT_FLOAT_EQ(s.par_spacing, 8.0f);
    EXPECT_FLOAT_EQ(s.float_clearance, 12.0f);
    remove(path);

    EXPECT_FALSE(flow_style_load(&s, "does/not/exist.conf"));
}

// ============================================================================
// Diagnostics
// ============================================================================

TEST_F(FlowGeomTest, DiagnosticsAccumulateInOrder) {
    Diagnostics d;
    d.init(arena);
    SourceLoc a{0, 5, 1, 1};
    SourceLoc b{10, 12, 2, 3};

    d.add_warning(a, "first");
    d.add_error(b, "second", "a hint");
    d.add_warning(b, "third");

    ASSERT_EQ(d.count, 3);
    EXPECT_STREQ(d.items[0].message, "first");
    EXPECT_STREQ(d.items[1].message, "second");
    EXPECT_STREQ(d.items[1].hint, "a hint");
    EXPECT_EQ(d.error_count(), 1);
    EXPECT_EQ(d.warning_count(), 2);
    EXPECT_TRUE(d.has_errors());
}

TEST_F(FlowGeomTest, DiagnosticsDeduplicateWarnings) {
    Diagnostics d;
    d.init(arena);
    SourceLoc a{0, 5, 1, 1};

    d.add_warning(a, "overflow");
    d.add_warning(a, "overflow");
    d.add_warning(SourceLoc{6, 9, 1, 7}, "overflow");
    EXPECT_EQ(d.warning_count(), 2);

    // replaying a recorded warning does not duplicate it
    Diagnostic copy = d.items[0];
    d.replay(copy);
    EXPECT_EQ(d.count, 2);
}

TEST_F(FlowGeomTest, DiagnosticsGrowPastInitialCapacity) {
    Diagnostics d;
    d.init(arena);
    for (int i = 0; i < 40; i++) {
        d.add_warning(SourceLoc{(uint32_t)i, (uint32_t)i + 1, 1, 1}, "many");
    }
    EXPECT_EQ(d.count, 40);
    EXPECT_EQ(d.items[39].loc.start, 39u);
}

// ============================================================================
// Skip Set
// ============================================================================

TEST_F(FlowGeomTest, SkipSetCopiesShareUntilWritten) {
    FlowNode* x = make_tag(arena, 1);
    FlowNode* y = make_tag(arena, 2);

    SkipSet a;
    EXPECT_EQ(a.size(), 0u);
    a.insert(x);

    SkipSet b = a;
    EXPECT_TRUE(b.shares_storage(a));
    EXPECT_TRUE(b.contains(x));

    b.insert(y);
    EXPECT_FALSE(b.shares_storage(a));
    EXPECT_TRUE(b.contains(y));
    EXPECT_FALSE(a.contains(y));
    EXPECT_EQ(a.size(), 1u);
    EXPECT_EQ(b.size(), 2u);
}

TEST_F(FlowGeomTest, SkipSetInsertIsIdempotent) {
    FlowNode* x = make_tag(arena, 1);
    SkipSet a;
    a.insert(x);
    SkipSet b = a;

    // re-inserting a known key keeps the storage shared
    b.insert(x);
    EXPECT_TRUE(b.shares_storage(a));
    b.extend(std::vector<const FlowNode*>{x});
    EXPECT_TRUE(b.shares_storage(a));
    EXPECT_EQ(b.size(), 1u);
}

// ============================================================================
// Flow Configuration
// ============================================================================

TEST_F(FlowGeomTest, ConfigDividesColumns) {
    FlowStyle s = FlowStyle::defaults();
    Regions r = Regions::one(Size{410, 300}, Expand{true, true});
    Config c = flow_config(&s, r, 2, Rel::absolute(10), FlowMode::Root);

    EXPECT_EQ(c.columns.count, 2);
    EXPECT_FLOAT_EQ(c.columns.gutter, 10.0f);
    EXPECT_FLOAT_EQ(c.columns.width, 200.0f);
    EXPECT_TRUE(c.root());
    EXPECT_TRUE(c.has_line_numbers);
    EXPECT_TRUE(c.footnote.expand);
}

TEST_F(FlowGeomTest, ConfigRelativeGutter) {
    FlowStyle s = FlowStyle::defaults();
    Regions r = Regions::one(Size{400, 300}, Expand{true, true});
    Config c = flow_config(&s, r, 3, Rel::relative(0.05f), FlowMode::Block);

    EXPECT_FLOAT_EQ(c.columns.gutter, 20.0f);
    EXPECT_NEAR(c.columns.width, 120.0f, 1e-4);
    EXPECT_FALSE(c.has_line_numbers);
}

TEST_F(FlowGeomTest, ConfigUnboundedWidthHasOneColumn) {
    FlowStyle s = FlowStyle::defaults();
    Regions r = Regions::one(Size{UNBOUNDED, 300}, Expand{false, false});
    Config c = flow_config(&s, r, 3, Rel::absolute(10), FlowMode::Block);
    EXPECT_EQ(c.columns.count, 1);
    EXPECT_FLOAT_EQ(c.columns.gutter, 0.0f);
}

TEST_F(FlowGeomTest, ConfigLineNumberClearance) {
    FlowStyle s = FlowStyle::defaults();
    Regions r = Regions::one(Size{400, 300}, Expand{true, true});

    // 2.6% of an A4 page lies between 0.75em and 2.5em
    Config c = flow_config(&s, r, 1, Rel::zero(), FlowMode::Root);
    EXPECT_NEAR(c.line_numbers.clearance, 0.026f * 595.28f, 1e-3);

    s.page_width = 2000;
    c = flow_config(&s, r, 1, Rel::zero(), FlowMode::Root);
    EXPECT_FLOAT_EQ(c.line_numbers.clearance, 27.5f);

    s.page_width = 100;
    c = flow_config(&s, r, 1, Rel::zero(), FlowMode::Root);
    EXPECT_FLOAT_EQ(c.line_numbers.clearance, 8.25f);

    s.line_number_clearance = 4;
    c = flow_config(&s, r, 1, Rel::zero(), FlowMode::Root);
    EXPECT_FLOAT_EQ(c.line_numbers.clearance, 4.0f);
}

int main(int argc, char** argv) {
    log_init("log.conf");
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
