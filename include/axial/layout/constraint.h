#pragma once
#include <axial/core/config.h>

#include <optional>
#include <string>
#include <string_view>

namespace axial::layout {

// Cross-axis position of a child inside the span it is given.
// Wire names: LEFT, CENTER, RIGHT.
enum class Alignment {
    Start,
    Center,
    End
};

// How a width or height value is interpreted.
//   Percent:  value is a percentage of the parent extent on the same axis.
//   Absolute: value is in pixels; a negative value means "intrinsic size".
//   Square:   copies the other axis.
//   Ratio:    other axis multiplied by value.
//   Rest:     whatever the siblings leave over.
enum class SizeType {
    Percent,
    Absolute,
    Square,
    Ratio,
    Rest
};

constexpr int kUnboundedExtent = core::config::kUnboundedExtent;

struct SizeSpec {
    SizeType type = SizeType::Absolute;
    double value = 0;
    int max_value = kUnboundedExtent;

    static SizeSpec percent(double p, int max = kUnboundedExtent) { return {SizeType::Percent, p, max}; }
    static SizeSpec absolute(double px, int max = kUnboundedExtent) { return {SizeType::Absolute, px, max}; }
    static SizeSpec intrinsic(int max = kUnboundedExtent) { return {SizeType::Absolute, -1, max}; }
    static SizeSpec square(int max = kUnboundedExtent) { return {SizeType::Square, 0, max}; }
    static SizeSpec ratio(double r, int max = kUnboundedExtent) { return {SizeType::Ratio, r, max}; }
    static SizeSpec rest(int max = kUnboundedExtent) { return {SizeType::Rest, 0, max}; }

    bool is_bounded() const { return max_value != kUnboundedExtent; }
};

bool operator==(const SizeSpec& a, const SizeSpec& b);
inline bool operator!=(const SizeSpec& a, const SizeSpec& b) { return !(a == b); }

// Absolute blank space around a child. Never percentages.
struct Margins {
    double left = 0, right = 0, top = 0, bottom = 0;

    double horizontal() const { return left + right; }
    double vertical() const { return top + bottom; }
};

bool operator==(const Margins& a, const Margins& b);
inline bool operator!=(const Margins& a, const Margins& b) { return !(a == b); }

// Sizing, alignment and margin specification of one child. Immutable once
// built; a re-registered child gets a whole new Constraint.
class Constraint {
public:
    Constraint() = default;
    Constraint(Alignment alignment, const Margins& margins,
               const SizeSpec& width, const SizeSpec& height);

    // Constraint from the 11-token wire format
    //   ALIGN LEFT RIGHT TOP BOT WIDTHTYPE HEIGHTTYPE WIDTH HEIGHT MAXW MAXH
    // Throws MalformedSpecError on any deviation; nothing is partially parsed.
    static Constraint parse(std::string_view text);

    static Constraint build(Alignment alignment, double left, double right,
                            double top, double bottom,
                            SizeType width_type, SizeType height_type,
                            double width, double height,
                            int max_width = kUnboundedExtent,
                            int max_height = kUnboundedExtent);

    // Centered, margin-less, fixed at the given size.
    static Constraint fixed(double width, double height);

    Alignment alignment() const { return alignment_; }
    const Margins& margins() const { return margins_; }
    const SizeSpec& width() const { return width_; }
    const SizeSpec& height() const { return height_; }

    Constraint clone() const { return *this; }

private:
    Alignment alignment_ = Alignment::Center;
    Margins margins_;
    SizeSpec width_;
    SizeSpec height_;
};

bool operator==(const Constraint& a, const Constraint& b);
inline bool operator!=(const Constraint& a, const Constraint& b) { return !(a == b); }

// Inverse of Constraint::parse.
std::string to_text(const Constraint& constraint);

std::string constraint_text(Alignment alignment, double left, double right,
                            double top, double bottom,
                            SizeType width_type, SizeType height_type,
                            double width, double height,
                            int max_width = kUnboundedExtent,
                            int max_height = kUnboundedExtent);

const char* alignment_name(Alignment alignment);
const char* size_type_name(SizeType type);
std::optional<Alignment> parse_alignment(std::string_view name);
std::optional<SizeType> parse_size_type(std::string_view name);

} // namespace axial::layout
