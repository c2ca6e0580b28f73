// flow_block.hpp - Layout of blocks, lines and placed elements
//
// Unbreakable blocks produce one frame in one region. Breakable blocks are
// laid out into a region sequence; the distributor takes one frame per region
// and carries the rest as a MultiSpill.

#ifndef QUIRE_FLOW_BLOCK_HPP
#define QUIRE_FLOW_BLOCK_HPP

#include "flow_internal.hpp"

namespace quire {

// Output frame of a paragraph line (or of a lone footnote marker)
FlowNode* line_frame(Arena* arena, const LineChild& line);

// Lay out an unbreakable block (or rule) into one region
bool layout_single(FlowContext& ctx, const SingleChild& single, Region region, FlowNode** out);

// Lay out a breakable block into a region sequence, one frame per region
bool layout_multi_block(FlowContext& ctx, const MultiChild& multi, const Regions& regions,
                        Fragment* out);

// First slice of a breakable block. When more frames remain, `spill` is
// filled in, `*has_spill` is set and `*spill_has_content` tells whether any
// of the remaining frames carries visible content.
bool multi_child_layout(FlowContext& ctx, const MultiChild* multi, const Regions& regions,
                        FlowNode** frame, MultiSpill* spill, bool* has_spill,
                        bool* spill_has_content);

// Next slice of a spilled breakable block in the current region.
// `*has_more` is set when further slices remain.
bool multi_spill_layout(FlowContext& ctx, MultiSpill* spill, const Regions& regions,
                        FlowNode** frame, bool* has_more);

// Lay out the body of a placed element against the base size of its scope
bool layout_placed(FlowContext& ctx, const PlacedChild& placed, Size base, FlowNode** out);

// Whether a frame carries anything besides tags and empty frames
bool frame_has_content(const FlowNode* frame);

} // namespace quire

#endif // QUIRE_FLOW_BLOCK_HPP
