// flow_style.hpp - Resolved style values used by flow layout
//
// Style resolution happens outside of flow layout. This header only defines
// the flow-relevant values that the resolver hands over, their defaults, and
// a small `key = value` configuration format for overriding them.

#ifndef QUIRE_FLOW_STYLE_HPP
#define QUIRE_FLOW_STYLE_HPP

#include "flow_geom.hpp"
#include <cstdint>

namespace quire {

struct FlowNode;

// ============================================================================
// Units
// ============================================================================

constexpr float PT_PER_INCH = 72.0f;

// Convert a length with unit suffix to points. Unknown units are treated as
// points.
inline float flow_unit_to_pt(float value, const char* unit, float em_size) {
    if (!unit || unit[0] == '\0') return value;

    if (unit[0] == 'p' && unit[1] == 't') return value;
    if (unit[0] == 'i' && unit[1] == 'n') return value * PT_PER_INCH;
    if (unit[0] == 'c' && unit[1] == 'm') return value * PT_PER_INCH / 2.54f;
    if (unit[0] == 'm' && unit[1] == 'm') return value * PT_PER_INCH / 25.4f;
    if (unit[0] == 'e' && unit[1] == 'm') return value * em_size;

    return value;
}

// ============================================================================
// Style
// ============================================================================

enum class LineNumberingScope : uint8_t {
    Document,       // Numbers run through the whole document
    Page,           // Numbers restart on every page
};

struct FlowStyle {
    // Text
    Dir dir;
    float font_size;

    // Paragraphs
    float leading;                // Space between lines
    float par_spacing;            // Space between paragraphs
    bool orphan_prevention;
    bool widow_prevention;

    // Blocks (< 0 = paragraph spacing)
    float block_above;
    float block_below;

    // Placed elements
    float float_clearance;

    // Footnotes
    const FlowNode* footnote_separator;   // null = default rule
    float footnote_clearance;
    float footnote_gap;

    // Line numbering
    LineNumberingScope line_numbering_scope;
    float line_number_clearance;  // < 0 = derived from the page width
    float line_number_digit_width;

    // Page
    float page_width;

    // Create with default values (11pt text on A4)
    static FlowStyle defaults() {
        FlowStyle s = {};
        s.dir = Dir::LTR;
        s.font_size = 11.0f;

        s.leading = 0.65f * 11.0f;
        s.par_spacing = 1.2f * 11.0f;
        s.orphan_prevention = true;
        s.widow_prevention = true;

        s.block_above = -1;
        s.block_below = -1;

        s.float_clearance = 1.5f * 11.0f;

        s.footnote_separator = nullptr;
        s.footnote_clearance = 1.0f * 11.0f;
        s.footnote_gap = 0.5f * 11.0f;

        s.line_numbering_scope = LineNumberingScope::Document;
        s.line_number_clearance = -1;
        s.line_number_digit_width = 0.5f * 11.0f;

        s.page_width = 595.28f;
        return s;
    }

    float spacing_above() const { return block_above < 0 ? par_spacing : block_above; }
    float spacing_below() const { return block_below < 0 ? par_spacing : block_below; }
};

// ============================================================================
// Configuration
// ============================================================================
//
// Format: one `key = value` pair per line, '#' starts a comment. Lengths
// accept the suffixes pt, mm, cm, in and em; `em` is relative to the font
// size in effect at that line. Keys:
//
//   dir                      ltr | rtl
//   font_size                length
//   leading, par_spacing     length
//   block_above, block_below length | auto
//   orphan_prevention        true | false
//   widow_prevention         true | false
//   float_clearance          length
//   footnote_clearance       length
//   footnote_gap             length
//   line_numbering_scope     document | page
//   line_number_clearance    length | auto
//   line_number_digit_width  length
//   page_width               length

// Apply configuration text to `style`. Returns the number of rejected lines;
// valid lines are applied even when others are rejected.
int flow_style_parse(FlowStyle* style, const char* text);

// Load a configuration file. Returns false if the file cannot be read or
// contains rejected lines.
bool flow_style_load(FlowStyle* style, const char* path);

} // namespace quire

#endif // QUIRE_FLOW_STYLE_HPP
