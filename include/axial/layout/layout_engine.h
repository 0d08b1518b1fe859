#pragma once
#include <axial/layout/box.h>
#include <axial/layout/constraint.h>

#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace axial::core {
class DiagnosticEmitter;
}

namespace axial::layout {

enum class Orientation {
    Vertical,
    Horizontal
};

// How the space left over on the primary axis is used.
//   SpaceAround:  split into n + 1 gaps, one before, between and after children.
//   SpaceBetween: split into n - 1 gaps between children only.
//   Pack*:        children packed flush at the start, centre or end, no gaps.
enum class SpacingPolicy {
    SpaceAround,
    SpaceBetween,
    PackStart,
    PackCenter,
    PackEnd
};

const char* orientation_name(Orientation orientation);
const char* spacing_policy_name(SpacingPolicy spacing);
std::optional<Orientation> parse_orientation(std::string_view name);
std::optional<SpacingPolicy> parse_spacing_policy(std::string_view name);

// Intrinsic (preferred or minimum) size of a child, supplied by the host.
using IntrinsicSizeFn = std::function<Size(ChildId child)>;

// Receives the bounds of every child once a placement pass has succeeded.
using BoundsSink = std::function<void(ChildId child, const Bounds& bounds)>;

class LayoutEngine {
public:
    LayoutEngine();
    LayoutEngine(Orientation orientation, SpacingPolicy spacing);

    LayoutEngine(const LayoutEngine&) = delete;
    LayoutEngine& operator=(const LayoutEngine&) = delete;

    Orientation orientation() const { return orientation_; }
    SpacingPolicy spacing() const { return spacing_; }

    // --- host wiring ---
    void set_intrinsic_preferred_size(IntrinsicSizeFn fn);
    void set_intrinsic_minimum_size(IntrinsicSizeFn fn);
    void set_bounds_sink(BoundsSink sink);
    // The emitter must outlive the engine, or be detached with nullptr.
    void set_diagnostics(core::DiagnosticEmitter* diagnostics);

    // --- registration ---
    // Re-adding an existing child replaces its constraint in place; the
    // child keeps its position in placement order.
    void add(ChildId child, const Constraint& constraint);
    // Empty text registers the default constraint. Throws MalformedSpecError
    // and leaves the registry untouched when the text does not parse.
    void add(ChildId child, std::string_view constraint_text);
    // Centered, no margins, fixed at the child's current intrinsic size.
    void add(ChildId child);
    // Invisible filler occupying the given width and height.
    void add_spacer(ChildId child, const SizeSpec& width, const SizeSpec& height);
    void remove(ChildId child);
    void clear();

    std::optional<Constraint> get(ChildId child) const;
    bool contains(ChildId child) const;
    std::size_t size() const;
    bool empty() const;
    std::vector<ChildId> children() const;

    // --- resolution ---
    // Content box of a child in a parent of the given size, margins excluded.
    // Throws UnknownChildError or MultipleRestError.
    Size resolve_size(ChildId child, const Size& parent) const;
    Size resolve_size_with_margins(ChildId child, const Size& parent) const;
    Size resolve_minimum_size(ChildId child) const;

    // --- aggregate queries ---
    Size preferred_size(const LayoutRegion& region) const;
    Size minimum_size(const LayoutRegion& region) const;
    // Sum of margin-inclusive sizes on both axes, regardless of orientation.
    Size maximum_size(const LayoutRegion& region) const;

    // Places every child in the region. All bounds are resolved before any
    // of them reaches the bounds sink, so a failing pass pushes nothing.
    std::vector<Placement> layout(const LayoutRegion& region);

private:
    enum class Axis { Horizontal, Vertical };

    struct Entry {
        ChildId id;
        Constraint constraint;
    };

    struct Extents {
        double width = 0;
        double height = 0;
    };

    Axis primary_axis() const;
    const Entry* find(ChildId child) const;
    std::size_t index_of(ChildId child) const;

    Size intrinsic_preferred(ChildId child) const;
    Size intrinsic_minimum(ChildId child) const;

    Extents coupled_extents(const Entry& entry, const Size& parent) const;
    double rest_extent(std::size_t index, Axis axis, const Size& parent) const;
    int resolve_axis(std::size_t index, Axis axis, const Size& parent) const;
    Size resolve_entry(std::size_t index, const Size& parent) const;
    Size resolve_entry_minimum(const Entry& entry) const;

    Size aggregate(const std::vector<Size>& sizes) const;
    std::vector<Placement> place(const LayoutRegion& region) const;
    // Warns once per pass when several children use Rest on the cross axis.
    void check_cross_axis_rest() const;

    void log_info(const char* stage, const std::string& message) const;
    void log_warning(const char* stage, const std::string& message) const;
    void log_error(const char* stage, const std::string& message) const;

    const Orientation orientation_;
    const SpacingPolicy spacing_;

    std::vector<Entry> entries_;
    IntrinsicSizeFn intrinsic_preferred_;
    IntrinsicSizeFn intrinsic_minimum_;
    BoundsSink bounds_sink_;
    core::DiagnosticEmitter* diagnostics_ = nullptr;

    // Serializes registry mutations and passes; recursive so host callbacks
    // may query the engine while a pass is running.
    mutable std::recursive_mutex mutex_;
};

} // namespace axial::layout
