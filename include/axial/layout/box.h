#pragma once
#include <cstdint>

namespace axial::layout {

struct Size {
    int width = 0;
    int height = 0;
};

inline bool operator==(const Size& a, const Size& b) {
    return a.width == b.width && a.height == b.height;
}
inline bool operator!=(const Size& a, const Size& b) { return !(a == b); }

// Space reserved by the container along its own edges.
struct EdgeInsets {
    int top = 0, left = 0, bottom = 0, right = 0;
};

// Placed content box of a child, in the container's coordinate space.
struct Bounds {
    int x = 0, y = 0;
    int width = 0, height = 0;

    int right() const { return x + width; }
    int bottom() const { return y + height; }
};

inline bool operator==(const Bounds& a, const Bounds& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}
inline bool operator!=(const Bounds& a, const Bounds& b) { return !(a == b); }

// The container region handed to a layout pass. Sizes are resolved against
// the full width/height; placement happens between the inset edges.
struct LayoutRegion {
    int width = 0;
    int height = 0;
    EdgeInsets insets;

    Size size() const { return {width, height}; }
};

// Opaque, host-owned identity of a laid-out child.
using ChildId = std::uint64_t;

struct Placement {
    ChildId id = 0;
    Bounds bounds;
};

} // namespace axial::layout
