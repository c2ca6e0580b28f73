// test_flow_block_gtest.cpp - Unit tests for block, line and placed layout
//
// Tests the flow_block.hpp implementation:
// - Single blocks with and without bodies
// - Footnote markers carried into block and line frames
// - Slicing of breakable blocks along the region sequence
// - Spill continuation across regions
// - Nested columns

#include <gtest/gtest.h>
#include "quire/flow/flow_block.hpp"
#include "quire/flow/flow_layout.hpp"
#include "lib/arena.h"
#include "lib/mempool.h"
#include "lib/log.h"

using namespace quire;

// ============================================================================
// Test Fixture
// ============================================================================

class FlowBlockTest : public ::testing::Test {
protected:
    Pool* pool;
    Arena* arena;
    FlowContext* ctx;
    FlowStyle style;

    void SetUp() override {
        pool = pool_create();
        arena = arena_create_default(pool);
        ctx = flow_context_create(pool);
        style = FlowStyle::defaults();
        style.par_spacing = 0;
        style.leading = 0;
    }

    void TearDown() override {
        flow_context_destroy(ctx);
        arena_destroy(arena);
        pool_destroy(pool);
    }

    SingleChild single_of(const FlowNode* block) {
        SingleChild s;
        s.block = block;
        s.style = &style;
        s.align = Align::Start;
        s.sticky = false;
        s.fr = block->node_class == NodeClass::Block ? block->content.block.fr : 0;
        return s;
    }

    MultiChild multi_of(const FlowNode* block) {
        MultiChild m;
        m.block = block;
        m.style = &style;
        m.align = Align::Start;
        m.sticky = false;
        return m;
    }

    static int count_class(const FlowNode* frame, NodeClass nc) {
        int n = 0;
        traverse_preorder(frame, [&](const FlowNode* node) {
            if (node->node_class == nc) n++;
        });
        return n;
    }
};

// ============================================================================
// Single Blocks
// ============================================================================

TEST_F(FlowBlockTest, LeafBlockKeepsItsSize) {
    FlowNode* block = make_block(arena, 120, 30);
    FlowNode* frame = nullptr;
    ASSERT_TRUE(layout_single(*ctx, single_of(block), Region{Size{200, 100}, Expand{true, true}}, &frame));
    EXPECT_FLOAT_EQ(frame->width, 120.0f);
    EXPECT_FLOAT_EQ(frame->height, 30.0f);
    EXPECT_EQ(frame->src, block);
}

TEST_F(FlowBlockTest, AutoWidthTakesRegionWidth) {
    FlowNode* block = make_block(arena, -1, 30);
    FlowNode* frame = nullptr;
    ASSERT_TRUE(layout_single(*ctx, single_of(block), Region{Size{200, 100}, Expand{true, true}}, &frame));
    EXPECT_FLOAT_EQ(frame->width, 200.0f);
}

TEST_F(FlowBlockTest, BodyBlockMeasuresItsContent) {
    FlowNode* body = make_sequence(arena);
    body->append_child(make_block(arena, 80, 20));
    body->append_child(make_block(arena, 80, 25));
    FlowNode* block = make_block(arena, 100, -1, false, body);

    FlowNode* frame = nullptr;
    ASSERT_TRUE(layout_single(*ctx, single_of(block), Region{Size{200, 300}, Expand{true, true}}, &frame));
    EXPECT_FLOAT_EQ(frame->width, 100.0f);
    EXPECT_FLOAT_EQ(frame->height, 45.0f);
    EXPECT_EQ(count_class(frame, NodeClass::Frame), 4);  // block, inner flow, two children
}

TEST_F(FlowBlockTest, FractionalBlockTakesRegionHeight) {
    FlowNode* block = make_block(arena, -1, -1);
    block->content.block.fr = 1;
    FlowNode* frame = nullptr;
    ASSERT_TRUE(layout_single(*ctx, single_of(block), Region{Size{200, 70}, Expand{true, true}}, &frame));
    EXPECT_FLOAT_EQ(frame->height, 70.0f);
}

TEST_F(FlowBlockTest, RuleFrame) {
    FlowNode* rule = make_rule(arena, -1, 2);
    FlowNode* frame = nullptr;
    ASSERT_TRUE(layout_single(*ctx, single_of(rule), Region{Size{150, 100}, Expand{true, true}}, &frame));
    EXPECT_FLOAT_EQ(frame->width, 150.0f);
    EXPECT_FLOAT_EQ(frame->height, 2.0f);
    EXPECT_EQ(count_class(frame, NodeClass::Rule), 1);
}

TEST_F(FlowBlockTest, BlockCarriesFootnoteMarker) {
    FlowNode* block = make_block(arena, 100, 40);
    FlowNode* note = make_footnote(arena, make_block(arena, 100, 10));
    note->y = 15;
    block->append_child(note);

    FlowNode* frame = nullptr;
    ASSERT_TRUE(layout_single(*ctx, single_of(block), Region{Size{200, 100}, Expand{true, true}}, &frame));
    ASSERT_EQ(count_class(frame, NodeClass::FootnoteRef), 1);
    const FlowNode* marker = frame->first_child;
    EXPECT_EQ(marker->content.fnref.note, note);
    EXPECT_FLOAT_EQ(marker->y, 15.0f);
}

// ============================================================================
// Lines
// ============================================================================

TEST_F(FlowBlockTest, LineFrameCopiesGeometryAndMarkers) {
    FlowNode* line = make_line(arena, 90, 12);
    FlowNode* note = make_footnote(arena, make_block(arena, 100, 10));
    note->x = 40;
    line->append_child(note);

    LineChild lc{line, Align::Center, 12, true};
    FlowNode* out = line_frame(arena, lc);
    EXPECT_EQ(out->node_class, NodeClass::Line);
    EXPECT_EQ(out->src, line);
    EXPECT_TRUE(out->is_numbered());
    EXPECT_FLOAT_EQ(out->width, 90.0f);
    EXPECT_FLOAT_EQ(out->height, 12.0f);
    ASSERT_NE(out->first_child, nullptr);
    EXPECT_FLOAT_EQ(out->first_child->x, 40.0f);
}

TEST_F(FlowBlockTest, LoneMarkerLineIsZeroSized) {
    FlowNode* note = make_footnote(arena, make_block(arena, 100, 10));
    LineChild lc{note, Align::Start, 0, false};
    FlowNode* out = line_frame(arena, lc);
    EXPECT_FLOAT_EQ(out->width, 0.0f);
    EXPECT_FLOAT_EQ(out->height, 0.0f);
    EXPECT_EQ(count_class(out, NodeClass::FootnoteRef), 1);
    EXPECT_TRUE(frame_has_content(out));
}

// ============================================================================
// Breakable Blocks
// ============================================================================

TEST_F(FlowBlockTest, LeafBlockIsSlicedAlongBacklog) {
    float backlog[] = {50};
    Regions regions = Regions::one(Size{200, 30}, Expand{true, false});
    regions.backlog = backlog;
    regions.backlog_len = 1;

    FlowNode* block = make_block(arena, -1, 100, true);
    Fragment fragment;
    ASSERT_TRUE(layout_multi_block(*ctx, multi_of(block), regions, &fragment));
    ASSERT_EQ(fragment.frame_count, 3);
    EXPECT_FLOAT_EQ(fragment.frames[0]->height, 30.0f);
    EXPECT_FLOAT_EQ(fragment.frames[1]->height, 50.0f);
    EXPECT_FLOAT_EQ(fragment.frames[2]->height, 20.0f);
    EXPECT_FLOAT_EQ(fragment.frames[1]->content.frame.offset, 30.0f);
    EXPECT_FLOAT_EQ(fragment.frames[2]->content.frame.offset, 80.0f);
}

TEST_F(FlowBlockTest, SliceMarkersFollowTheirSlice) {
    Regions regions = Regions::repeat(Size{200, 50}, Expand{true, false});
    FlowNode* block = make_block(arena, -1, 100, true);
    FlowNode* note = make_footnote(arena, make_block(arena, 100, 10));
    note->y = 70;
    block->append_child(note);

    Fragment fragment;
    ASSERT_TRUE(layout_multi_block(*ctx, multi_of(block), regions, &fragment));
    ASSERT_EQ(fragment.frame_count, 2);
    EXPECT_EQ(count_class(fragment.frames[0], NodeClass::FootnoteRef), 0);
    ASSERT_EQ(count_class(fragment.frames[1], NodeClass::FootnoteRef), 1);
    EXPECT_FLOAT_EQ(fragment.frames[1]->first_child->y, 20.0f);
}

TEST_F(FlowBlockTest, SpillContinuesAcrossRegions) {
    Regions regions = Regions::repeat(Size{200, 100}, Expand{true, true});
    FlowNode* block = make_block(arena, -1, 250, true);
    MultiChild multi = multi_of(block);

    FlowNode* frame = nullptr;
    MultiSpill spill;
    bool has_spill = false;
    bool spill_has_content = false;
    ASSERT_TRUE(multi_child_layout(*ctx, &multi, regions, &frame, &spill, &has_spill,
                                   &spill_has_content));
    EXPECT_FLOAT_EQ(frame->height, 100.0f);
    ASSERT_TRUE(has_spill);
    EXPECT_TRUE(spill_has_content);
    EXPECT_EQ(spill.min_backlog_len, 0);

    regions.next();
    bool more = false;
    ASSERT_TRUE(multi_spill_layout(*ctx, &spill, regions, &frame, &more));
    EXPECT_FLOAT_EQ(frame->content.frame.offset, 100.0f);
    EXPECT_FLOAT_EQ(frame->height, 100.0f);
    EXPECT_TRUE(more);

    regions.next();
    ASSERT_TRUE(multi_spill_layout(*ctx, &spill, regions, &frame, &more));
    EXPECT_FLOAT_EQ(frame->content.frame.offset, 200.0f);
    EXPECT_FLOAT_EQ(frame->height, 50.0f);
    EXPECT_FALSE(more);
}

TEST_F(FlowBlockTest, BlockThatFitsHasNoSpill) {
    Regions regions = Regions::repeat(Size{200, 100}, Expand{true, true});
    FlowNode* block = make_block(arena, -1, 60, true);
    MultiChild multi = multi_of(block);

    FlowNode* frame = nullptr;
    MultiSpill spill;
    bool has_spill = true;
    bool spill_has_content = true;
    ASSERT_TRUE(multi_child_layout(*ctx, &multi, regions, &frame, &spill, &has_spill,
                                   &spill_has_content));
    EXPECT_FALSE(has_spill);
    EXPECT_FALSE(spill_has_content);
    EXPECT_FLOAT_EQ(frame->height, 60.0f);
}

TEST_F(FlowBlockTest, NestedColumnsShareOneFrame) {
    FlowNode* body = make_sequence(arena);
    body->append_child(make_block(arena, -1, 150, true));
    FlowNode* columns = make_columns(arena, 2, Rel::absolute(10), body);

    Regions regions = Regions::repeat(Size{410, 100}, Expand{true, false});
    Fragment fragment;
    ASSERT_TRUE(layout_multi_block(*ctx, multi_of(columns), regions, &fragment));
    ASSERT_EQ(fragment.frame_count, 1);
    EXPECT_FLOAT_EQ(fragment.frames[0]->width, 410.0f);
    EXPECT_FLOAT_EQ(fragment.frames[0]->height, 100.0f);
}

// ============================================================================
// Placed Elements
// ============================================================================

TEST_F(FlowBlockTest, PlacedBodyIsMeasured) {
    FlowNode* place = make_place(arena, make_block(arena, 50, 20), true, PlaceY::Start);
    PlacedChild placed;
    placed.place = place;
    placed.style = &style;
    placed.align_x = Align::Center;
    placed.align_y = PlaceY::Start;
    placed.scope = PlacementScope::Column;
    placed.floating = true;
    placed.clearance = 10;
    placed.delta = Point{0, 0};

    FlowNode* frame = nullptr;
    ASSERT_TRUE(layout_placed(*ctx, placed, Size{200, 300}, &frame));
    EXPECT_EQ(frame->src, place);
    EXPECT_FLOAT_EQ(frame->width, 50.0f);
    EXPECT_FLOAT_EQ(frame->height, 20.0f);
}

TEST_F(FlowBlockTest, FrameContent) {
    FlowNode* empty = make_frame(arena, Size{10, 10});
    EXPECT_FALSE(frame_has_content(empty));

    frame_push(arena, empty, Point{0, 0}, make_tag(arena, 3));
    EXPECT_FALSE(frame_has_content(empty));

    FlowNode* slice = make_frame(arena, Size{10, 10});
    slice->src = make_block(arena, 10, 10);
    EXPECT_TRUE(frame_has_content(slice));

    FlowNode* zero = make_frame(arena, Size{10, 0});
    zero->src = slice->src;
    EXPECT_FALSE(frame_has_content(zero));
}

int main(int argc, char** argv) {
    log_init("log.conf");
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
