// flow_geom.hpp - Geometry for Flow Layout
//
// Sizes, points, alignments and the region sequence that flow layout fills.
// All lengths are in points (1/72 inch). An unbounded axis is represented
// by an infinite length.

#ifndef QUIRE_FLOW_GEOM_HPP
#define QUIRE_FLOW_GEOM_HPP

#include <cmath>
#include <cstdint>
#include <limits>

namespace quire {

// ============================================================================
// Lengths
// ============================================================================

constexpr float ABS_EPS = 1e-4f;
constexpr float UNBOUNDED = std::numeric_limits<float>::infinity();

// Whether `need` fits into `available`. A length that is exactly at the
// boundary fits.
inline bool fits(float available, float need) {
    return available + ABS_EPS >= need;
}

inline bool approx_eq(float a, float b) {
    return std::fabs(a - b) < ABS_EPS;
}

inline bool is_finite(float v) { return std::isfinite(v); }

// Relative length: an absolute part plus a ratio of some base length
struct Rel {
    float abs;
    float ratio;

    static Rel zero() { return Rel{0, 0}; }
    static Rel absolute(float v) { return Rel{v, 0}; }
    static Rel relative(float r) { return Rel{0, r}; }

    float relative_to(float base) const {
        return ratio == 0 ? abs : abs + ratio * base;
    }
};

// ============================================================================
// Size / Point / Axes
// ============================================================================

struct Size {
    float x;
    float y;

    static Size zero() { return Size{0, 0}; }
    bool is_zero() const { return x == 0 && y == 0; }
};

struct Point {
    float x;
    float y;
};

struct Expand {
    bool x;
    bool y;
};

// ============================================================================
// Direction and Alignment
// ============================================================================

enum class Dir : uint8_t {
    LTR,
    RTL,
};

enum class Align : uint8_t {
    Start,
    Center,
    End,
};

// Offset of an item of free space `extent` with this alignment
inline float align_position(Align align, float extent) {
    switch (align) {
        case Align::Start:  return 0;
        case Align::Center: return extent / 2;
        case Align::End:    return extent;
    }
    return 0;
}

inline Align align_inv(Align a) {
    switch (a) {
        case Align::Start: return Align::End;
        case Align::End:   return Align::Start;
        default:           return a;
    }
}

// Resolve a start/end alignment against the text direction
inline Align align_resolve(Align a, Dir dir) {
    return dir == Dir::RTL ? align_inv(a) : a;
}

// ============================================================================
// Regions
// ============================================================================

// A single region to lay out into
struct Region {
    Size size;
    Expand expand;
};

// A sequence of regions: the current one, a backlog of following heights and
// optionally a last height that repeats forever.
//
// `backlog` is not owned; the caller keeps the heights alive for as long as
// the regions are in use.
struct Regions {
    Size size;              // remaining space in the current region
    float full;             // full height of the current region
    const float* backlog;   // heights of the following regions
    int backlog_len;
    float last;             // height of the repeating last region
    bool has_last;
    Expand expand;

    // Just one region
    static Regions one(Size size, Expand expand);

    // The same region repeated forever
    static Regions repeat(Size size, Expand expand);

    // The base size of the current region (full height)
    Size base() const { return Size{size.x, full}; }

    // Whether a following region could offer more space than the current
    bool may_progress() const {
        return backlog_len > 0 || (has_last && !approx_eq(size.y, last));
    }

    // Whether the current region is full and a region break is called for
    bool is_full() const {
        return fits(0, size.y) && may_progress();
    }

    // Height of the `n`-th region (0 = current). Returns false past the end.
    bool nth_height(int n, float* out) const;

    // Advance to the next region if there is one
    void next();

    Region first() const { return Region{size, expand}; }
};

} // namespace quire

#endif // QUIRE_FLOW_GEOM_HPP
