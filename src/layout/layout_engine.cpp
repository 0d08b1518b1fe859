#include <axial/layout/layout_engine.h>
#include <axial/layout/errors.h>
#include <axial/core/diagnostics.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace axial::layout {

namespace {

constexpr const char kModule[] = "layout";

// Truncates toward zero after clamping negative extents to 0.
int to_pixels(double extent) {
    if (!(extent > 0)) return 0;
    if (extent >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(extent);
}

int ceil_to_pixels(double extent) {
    return to_pixels(std::ceil(extent));
}

// Truncates a position toward zero, saturating at the int range.
int to_coordinate(double position) {
    if (std::isnan(position)) return 0;
    if (position >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    if (position <= static_cast<double>(std::numeric_limits<int>::min())) {
        return std::numeric_limits<int>::min();
    }
    return static_cast<int>(position);
}

std::string describe(ChildId child) {
    return "child #" + std::to_string(child);
}

std::string describe(const Size& size) {
    return std::to_string(size.width) + "x" + std::to_string(size.height);
}

} // namespace

const char* orientation_name(Orientation orientation) {
    switch (orientation) {
        case Orientation::Vertical:   return "VERTICAL";
        case Orientation::Horizontal: return "HORIZONTAL";
    }
    return "VERTICAL";
}

const char* spacing_policy_name(SpacingPolicy spacing) {
    switch (spacing) {
        case SpacingPolicy::SpaceAround:  return "SPACE_AROUND";
        case SpacingPolicy::SpaceBetween: return "SPACE_BETWEEN";
        case SpacingPolicy::PackStart:    return "PACK_START";
        case SpacingPolicy::PackCenter:   return "PACK_CENTER";
        case SpacingPolicy::PackEnd:      return "PACK_END";
    }
    return "PACK_CENTER";
}

std::optional<Orientation> parse_orientation(std::string_view name) {
    if (name == "VERTICAL") return Orientation::Vertical;
    if (name == "HORIZONTAL") return Orientation::Horizontal;
    return std::nullopt;
}

std::optional<SpacingPolicy> parse_spacing_policy(std::string_view name) {
    if (name == "SPACE_AROUND") return SpacingPolicy::SpaceAround;
    if (name == "SPACE_BETWEEN") return SpacingPolicy::SpaceBetween;
    if (name == "PACK_START") return SpacingPolicy::PackStart;
    if (name == "PACK_CENTER") return SpacingPolicy::PackCenter;
    if (name == "PACK_END") return SpacingPolicy::PackEnd;
    return std::nullopt;
}

LayoutEngine::LayoutEngine() : LayoutEngine(Orientation::Vertical, SpacingPolicy::PackCenter) {}

LayoutEngine::LayoutEngine(Orientation orientation, SpacingPolicy spacing)
    : orientation_(orientation), spacing_(spacing) {}

// ---------------------------------------------------------------------------
// Host wiring
// ---------------------------------------------------------------------------

void LayoutEngine::set_intrinsic_preferred_size(IntrinsicSizeFn fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    intrinsic_preferred_ = std::move(fn);
}

void LayoutEngine::set_intrinsic_minimum_size(IntrinsicSizeFn fn) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    intrinsic_minimum_ = std::move(fn);
}

void LayoutEngine::set_bounds_sink(BoundsSink sink) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    bounds_sink_ = std::move(sink);
}

void LayoutEngine::set_diagnostics(core::DiagnosticEmitter* diagnostics) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    diagnostics_ = diagnostics;
}

Size LayoutEngine::intrinsic_preferred(ChildId child) const {
    return intrinsic_preferred_ ? intrinsic_preferred_(child) : Size{};
}

Size LayoutEngine::intrinsic_minimum(ChildId child) const {
    return intrinsic_minimum_ ? intrinsic_minimum_(child) : Size{};
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void LayoutEngine::add(ChildId child, const Constraint& constraint) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (auto& entry : entries_) {
        if (entry.id == child) {
            entry.constraint = constraint;
            return;
        }
    }
    entries_.push_back({child, constraint});
}

void LayoutEngine::add(ChildId child, std::string_view constraint_text) {
    if (constraint_text.empty()) {
        add(child);
        return;
    }
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    try {
        add(child, Constraint::parse(constraint_text));
    } catch (const MalformedSpecError& e) {
        log_error("register", "rejected " + describe(child) + ": " + e.what());
        throw;
    }
}

void LayoutEngine::add(ChildId child) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Size intrinsic = intrinsic_preferred(child);
    add(child, Constraint::fixed(intrinsic.width, intrinsic.height));
}

void LayoutEngine::add_spacer(ChildId child, const SizeSpec& width, const SizeSpec& height) {
    add(child, Constraint(Alignment::Center, Margins{}, width, height));
}

void LayoutEngine::remove(ChildId child) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                  [child](const Entry& e) { return e.id == child; }),
                   entries_.end());
}

void LayoutEngine::clear() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    entries_.clear();
}

std::optional<Constraint> LayoutEngine::get(ChildId child) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const Entry* entry = find(child);
    if (!entry) return std::nullopt;
    return entry->constraint;
}

bool LayoutEngine::contains(ChildId child) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return find(child) != nullptr;
}

std::size_t LayoutEngine::size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return entries_.size();
}

bool LayoutEngine::empty() const {
    return size() == 0;
}

std::vector<ChildId> LayoutEngine::children() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<ChildId> ids;
    ids.reserve(entries_.size());
    for (const auto& entry : entries_) ids.push_back(entry.id);
    return ids;
}

const LayoutEngine::Entry* LayoutEngine::find(ChildId child) const {
    for (const auto& entry : entries_) {
        if (entry.id == child) return &entry;
    }
    return nullptr;
}

std::size_t LayoutEngine::index_of(ChildId child) const {
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].id == child) return i;
    }
    throw UnknownChildError(describe(child) + " is not registered with this layout");
}

LayoutEngine::Axis LayoutEngine::primary_axis() const {
    return orientation_ == Orientation::Vertical ? Axis::Vertical : Axis::Horizontal;
}

// ---------------------------------------------------------------------------
// Dimension resolution
// ---------------------------------------------------------------------------

// Percent and Absolute first, each axis on its own; then Square and Ratio,
// always in the order width-square, height-square, width-ratio, height-ratio.
// Rest axes are left at 0 here.
LayoutEngine::Extents LayoutEngine::coupled_extents(const Entry& entry, const Size& parent) const {
    const SizeSpec& w = entry.constraint.width();
    const SizeSpec& h = entry.constraint.height();
    Extents e;
    std::optional<Size> intrinsic;

    if (w.type == SizeType::Percent) {
        e.width = std::min(parent.width * w.value / 100.0, static_cast<double>(w.max_value));
    } else if (w.type == SizeType::Absolute) {
        e.width = w.value;
        if (e.width < 0) {
            intrinsic = intrinsic_preferred(entry.id);
            e.width = intrinsic->width;
        }
    }

    if (h.type == SizeType::Percent) {
        e.height = std::min(parent.height * h.value / 100.0, static_cast<double>(h.max_value));
    } else if (h.type == SizeType::Absolute) {
        e.height = h.value;
        if (e.height < 0) {
            if (!intrinsic) intrinsic = intrinsic_preferred(entry.id);
            e.height = intrinsic->height;
        }
    }

    if (w.type == SizeType::Square) e.width = e.height;
    if (h.type == SizeType::Square) e.height = e.width;
    if (w.type == SizeType::Ratio) e.width = e.height * w.value;
    if (h.type == SizeType::Ratio) e.height = e.width * h.value;
    return e;
}

// Parent extent minus every sibling's resolved extent and margins on the
// axis, minus the child's own margins, capped by its max value.
double LayoutEngine::rest_extent(std::size_t index, Axis axis, const Size& parent) const {
    const bool horizontal = axis == Axis::Horizontal;
    const Entry& self = entries_[index];
    const Margins& own = self.constraint.margins();
    double used = horizontal ? own.horizontal() : own.vertical();

    for (std::size_t j = 0; j < entries_.size(); ++j) {
        if (j == index) continue;
        const Entry& sibling = entries_[j];
        const SizeSpec& spec = horizontal ? sibling.constraint.width() : sibling.constraint.height();
        const Margins& m = sibling.constraint.margins();
        const double margins = horizontal ? m.horizontal() : m.vertical();

        if (spec.type == SizeType::Rest) {
            if (axis == primary_axis()) {
                const std::string message = describe(self.id) + " and " + describe(sibling.id) +
                                            " both take the remaining space on the primary axis";
                log_error("resolve", message);
                throw MultipleRestError(message);
            }
            // Cross axis: the sibling's own extent is itself unresolved, so
            // only its margins count against this child.
            used += margins;
            continue;
        }
        used += resolve_axis(j, axis, parent) + margins;
    }

    const SizeSpec& spec = horizontal ? self.constraint.width() : self.constraint.height();
    const double parent_extent = horizontal ? parent.width : parent.height;
    return std::min(parent_extent - used, static_cast<double>(spec.max_value));
}

int LayoutEngine::resolve_axis(std::size_t index, Axis axis, const Size& parent) const {
    const Entry& entry = entries_[index];
    const SizeSpec& spec = axis == Axis::Horizontal ? entry.constraint.width()
                                                    : entry.constraint.height();
    if (spec.type == SizeType::Rest) {
        return to_pixels(rest_extent(index, axis, parent));
    }
    const Extents e = coupled_extents(entry, parent);
    return to_pixels(axis == Axis::Horizontal ? e.width : e.height);
}

Size LayoutEngine::resolve_entry(std::size_t index, const Size& parent) const {
    const Entry& entry = entries_[index];
    const Extents e = coupled_extents(entry, parent);
    const double width = entry.constraint.width().type == SizeType::Rest
                             ? rest_extent(index, Axis::Horizontal, parent)
                             : e.width;
    const double height = entry.constraint.height().type == SizeType::Rest
                              ? rest_extent(index, Axis::Vertical, parent)
                              : e.height;
    return {to_pixels(width), to_pixels(height)};
}

Size LayoutEngine::resolve_entry_minimum(const Entry& entry) const {
    const SizeSpec& w = entry.constraint.width();
    const SizeSpec& h = entry.constraint.height();
    const bool fixed_width = w.type == SizeType::Absolute;
    const bool fixed_height = h.type == SizeType::Absolute;

    Size intrinsic;
    if (!fixed_width || !fixed_height) intrinsic = intrinsic_minimum(entry.id);
    return {fixed_width ? to_pixels(w.value) : std::max(intrinsic.width, 0),
            fixed_height ? to_pixels(h.value) : std::max(intrinsic.height, 0)};
}

Size LayoutEngine::resolve_size(ChildId child, const Size& parent) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return resolve_entry(index_of(child), parent);
}

Size LayoutEngine::resolve_size_with_margins(ChildId child, const Size& parent) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    const std::size_t index = index_of(child);
    const Size content = resolve_entry(index, parent);
    const Margins& m = entries_[index].constraint.margins();
    return {ceil_to_pixels(content.width + m.horizontal()),
            ceil_to_pixels(content.height + m.vertical())};
}

Size LayoutEngine::resolve_minimum_size(ChildId child) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return resolve_entry_minimum(entries_[index_of(child)]);
}

// ---------------------------------------------------------------------------
// Aggregate queries
// ---------------------------------------------------------------------------

// Sums margin-inclusive extents along the primary axis and takes the widest
// margin-inclusive extent across it. `sizes` is parallel to entries_.
Size LayoutEngine::aggregate(const std::vector<Size>& sizes) const {
    double primary = 0;
    double cross = 0;
    const bool vertical = orientation_ == Orientation::Vertical;
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const Margins& m = entries_[i].constraint.margins();
        if (vertical) {
            cross = std::max(cross, m.horizontal() + sizes[i].width);
            primary += m.vertical() + sizes[i].height;
        } else {
            cross = std::max(cross, m.vertical() + sizes[i].height);
            primary += m.horizontal() + sizes[i].width;
        }
    }
    return vertical ? Size{to_pixels(cross), to_pixels(primary)}
                    : Size{to_pixels(primary), to_pixels(cross)};
}

Size LayoutEngine::preferred_size(const LayoutRegion& region) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<Size> sizes;
    sizes.reserve(entries_.size());
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        sizes.push_back(resolve_entry(i, region.size()));
    }
    return aggregate(sizes);
}

Size LayoutEngine::minimum_size(const LayoutRegion&) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<Size> sizes;
    sizes.reserve(entries_.size());
    for (const auto& entry : entries_) {
        sizes.push_back(resolve_entry_minimum(entry));
    }
    return aggregate(sizes);
}

Size LayoutEngine::maximum_size(const LayoutRegion& region) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    long long width = 0;
    long long height = 0;
    for (const auto& entry : entries_) {
        const Size s = resolve_size_with_margins(entry.id, region.size());
        width += s.width;
        height += s.height;
    }
    const long long cap = std::numeric_limits<int>::max();
    return {static_cast<int>(std::min(width, cap)), static_cast<int>(std::min(height, cap))};
}

// ---------------------------------------------------------------------------
// Placement
// ---------------------------------------------------------------------------

std::vector<Placement> LayoutEngine::place(const LayoutRegion& region) const {
    const Size parent = region.size();
    const std::size_t count = entries_.size();

    std::vector<Size> sizes;
    sizes.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        sizes.push_back(resolve_entry(i, parent));
    }
    const Size preferred = aggregate(sizes);

    const bool vertical = orientation_ == Orientation::Vertical;
    // Edges are kept in double so that huge regions, extents or margins
    // cannot overflow before the final saturating conversion.
    const EdgeInsets& in = region.insets;
    const double width = region.width;
    const double height = region.height;
    const double lead_edge = vertical ? in.top : in.left;
    const double trail_edge = vertical ? height - in.bottom : width - in.right;
    const double cross_start = vertical ? in.left : in.top;
    const double cross_end = vertical ? width - in.right : height - in.bottom;
    const double parent_primary = vertical ? height : width;
    const double preferred_primary = vertical ? preferred.height : preferred.width;
    const double excess = std::max(parent_primary - preferred_primary, 0.0);

    double cursor = lead_edge;
    double gap = 0;
    bool packed = false;
    switch (spacing_) {
        case SpacingPolicy::SpaceAround:
            gap = excess / static_cast<double>(count + 1);
            cursor += gap;
            break;
        case SpacingPolicy::SpaceBetween:
            if (count > 1) {
                gap = excess / static_cast<double>(count - 1);
            } else if (count == 1) {
                log_warning("place", "SPACE_BETWEEN with a single child; placing it at the start");
            }
            break;
        case SpacingPolicy::PackStart:
            packed = true;
            break;
        case SpacingPolicy::PackCenter:
            packed = true;
            cursor = std::trunc((lead_edge + trail_edge) / 2) - preferred_primary / 2.0;
            break;
        case SpacingPolicy::PackEnd:
            packed = true;
            cursor = trail_edge - preferred_primary;
            break;
    }

    std::vector<Placement> placements;
    placements.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const Entry& entry = entries_[i];
        const Margins& m = entry.constraint.margins();
        const Size& s = sizes[i];

        const double lead_margin = vertical ? m.top : m.left;
        const double trail_margin = vertical ? m.bottom : m.right;
        const double cross_lead_margin = vertical ? m.left : m.top;
        const double cross_trail_margin = vertical ? m.right : m.bottom;
        const double primary_extent = vertical ? s.height : s.width;
        const double cross_extent = vertical ? s.width : s.height;

        cursor += lead_margin;

        double cross = cross_start;
        switch (entry.constraint.alignment()) {
            case Alignment::Start:
                cross = cross_start + std::trunc(cross_lead_margin);
                break;
            case Alignment::End:
                cross = cross_end - std::trunc(cross_trail_margin) - cross_extent;
                break;
            case Alignment::Center: {
                // The margin box is centred, not the content box.
                const double center = std::trunc((cross_start + cross_end) / 2);
                const double margin_box = cross_extent + cross_lead_margin + cross_trail_margin;
                cross = packed ? center - margin_box / 2
                               : center - std::trunc(margin_box / 2);
                break;
            }
        }

        const int x = to_coordinate(vertical ? cross : cursor);
        const int y = to_coordinate(vertical ? cursor : cross);
        Placement placement;
        placement.id = entry.id;
        placement.bounds = Bounds{x, y, s.width, s.height};
        placements.push_back(placement);

        cursor += trail_margin + primary_extent + gap;
    }
    return placements;
}

void LayoutEngine::check_cross_axis_rest() const {
    const bool vertical = orientation_ == Orientation::Vertical;
    std::vector<ChildId> rest;
    for (const auto& entry : entries_) {
        const SizeSpec& cross = vertical ? entry.constraint.width() : entry.constraint.height();
        if (cross.type == SizeType::Rest) rest.push_back(entry.id);
    }
    if (rest.size() < 2) return;

    std::string names;
    for (ChildId id : rest) {
        if (!names.empty()) names += ", ";
        names += describe(id);
    }
    log_warning("resolve", names + " share the remaining space on the cross axis");
}

std::vector<Placement> LayoutEngine::layout(const LayoutRegion& region) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    check_cross_axis_rest();
    std::vector<Placement> placements = place(region);

    log_info("place", "placed " + std::to_string(placements.size()) + " children in " +
                          describe(region.size()) + " (" + orientation_name(orientation_) +
                          ", " + spacing_policy_name(spacing_) + ")");

    if (bounds_sink_) {
        for (const auto& placement : placements) {
            bounds_sink_(placement.id, placement.bounds);
        }
    }
    return placements;
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

void LayoutEngine::log_info(const char* stage, const std::string& message) const {
    if (diagnostics_) diagnostics_->emit(core::Severity::Info, kModule, stage, message);
}

void LayoutEngine::log_warning(const char* stage, const std::string& message) const {
    if (diagnostics_) diagnostics_->emit(core::Severity::Warning, kModule, stage, message);
}

void LayoutEngine::log_error(const char* stage, const std::string& message) const {
    if (diagnostics_) diagnostics_->emit(core::Severity::Error, kModule, stage, message);
}

} // namespace axial::layout
