#include <axial/layout/constraint.h>
#include <axial/layout/errors.h>

#include <array>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace axial::layout {

namespace {

constexpr std::size_t kConstraintTokenCount = 11;

bool parse_double(const std::string& token, double& out) {
    if (token.empty()) return false;
    const char* begin = token.c_str();
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(begin, &end);
    if (end != begin + token.size() || errno == ERANGE) return false;
    out = value;
    return true;
}

bool parse_int(const std::string& token, int& out) {
    std::string_view digits(token);
    if (!digits.empty() && digits.front() == '+') {
        digits.remove_prefix(1);
        if (!digits.empty() && (digits.front() == '+' || digits.front() == '-')) return false;
    }
    if (digits.empty()) return false;

    int value = 0;
    const char* begin = digits.data();
    const char* end = begin + digits.size();
    const std::from_chars_result result = std::from_chars(begin, end, value);
    if (result.ec != std::errc() || result.ptr != end) return false;
    out = value;
    return true;
}

// Shortest decimal form that reads back to the same double.
std::string format_double(double value) {
    for (int precision : {15, 17}) {
        std::ostringstream oss;
        oss << std::setprecision(precision) << value;
        double round_trip = 0;
        if (precision == 17 || (parse_double(oss.str(), round_trip) && round_trip == value)) {
            return oss.str();
        }
    }
    return {};
}

[[noreturn]] void malformed(const std::string& detail) {
    throw MalformedSpecError("malformed constraint text: " + detail);
}

} // namespace

bool operator==(const SizeSpec& a, const SizeSpec& b) {
    return a.type == b.type && a.value == b.value && a.max_value == b.max_value;
}

bool operator==(const Margins& a, const Margins& b) {
    return a.left == b.left && a.right == b.right && a.top == b.top && a.bottom == b.bottom;
}

bool operator==(const Constraint& a, const Constraint& b) {
    return a.alignment() == b.alignment() && a.margins() == b.margins() &&
           a.width() == b.width() && a.height() == b.height();
}

Constraint::Constraint(Alignment alignment, const Margins& margins,
                       const SizeSpec& width, const SizeSpec& height)
    : alignment_(alignment), margins_(margins), width_(width), height_(height) {}

Constraint Constraint::build(Alignment alignment, double left, double right,
                             double top, double bottom,
                             SizeType width_type, SizeType height_type,
                             double width, double height,
                             int max_width, int max_height) {
    return Constraint(alignment, Margins{left, right, top, bottom},
                      SizeSpec{width_type, width, max_width},
                      SizeSpec{height_type, height, max_height});
}

Constraint Constraint::fixed(double width, double height) {
    return Constraint(Alignment::Center, Margins{},
                      SizeSpec::absolute(width), SizeSpec::absolute(height));
}

Constraint Constraint::parse(std::string_view text) {
    std::vector<std::string> tokens;
    std::istringstream stream{std::string(text)};
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    if (tokens.size() != kConstraintTokenCount) {
        malformed("expected " + std::to_string(kConstraintTokenCount) + " tokens, got " +
                  std::to_string(tokens.size()));
    }

    const auto alignment = parse_alignment(tokens[0]);
    if (!alignment) malformed("unknown alignment '" + tokens[0] + "'");

    std::array<double, 4> margins{};
    for (std::size_t i = 0; i < margins.size(); ++i) {
        if (!parse_double(tokens[1 + i], margins[i])) {
            malformed("bad margin '" + tokens[1 + i] + "'");
        }
    }

    const auto width_type = parse_size_type(tokens[5]);
    if (!width_type) malformed("unknown width type '" + tokens[5] + "'");
    const auto height_type = parse_size_type(tokens[6]);
    if (!height_type) malformed("unknown height type '" + tokens[6] + "'");

    double width = 0;
    double height = 0;
    if (!parse_double(tokens[7], width)) malformed("bad width '" + tokens[7] + "'");
    if (!parse_double(tokens[8], height)) malformed("bad height '" + tokens[8] + "'");

    int max_width = 0;
    int max_height = 0;
    if (!parse_int(tokens[9], max_width)) malformed("bad max width '" + tokens[9] + "'");
    if (!parse_int(tokens[10], max_height)) malformed("bad max height '" + tokens[10] + "'");

    return build(*alignment, margins[0], margins[1], margins[2], margins[3],
                 *width_type, *height_type, width, height, max_width, max_height);
}

std::string to_text(const Constraint& constraint) {
    const Margins& m = constraint.margins();
    std::string out;
    out += alignment_name(constraint.alignment());
    for (double margin : {m.left, m.right, m.top, m.bottom}) {
        out += ' ';
        out += format_double(margin);
    }
    out += ' ';
    out += size_type_name(constraint.width().type);
    out += ' ';
    out += size_type_name(constraint.height().type);
    out += ' ';
    out += format_double(constraint.width().value);
    out += ' ';
    out += format_double(constraint.height().value);
    out += ' ';
    out += std::to_string(constraint.width().max_value);
    out += ' ';
    out += std::to_string(constraint.height().max_value);
    return out;
}

std::string constraint_text(Alignment alignment, double left, double right,
                            double top, double bottom,
                            SizeType width_type, SizeType height_type,
                            double width, double height,
                            int max_width, int max_height) {
    return to_text(Constraint::build(alignment, left, right, top, bottom, width_type,
                                     height_type, width, height, max_width, max_height));
}

const char* alignment_name(Alignment alignment) {
    switch (alignment) {
        case Alignment::Start:  return "LEFT";
        case Alignment::Center: return "CENTER";
        case Alignment::End:    return "RIGHT";
    }
    return "CENTER";
}

const char* size_type_name(SizeType type) {
    switch (type) {
        case SizeType::Percent:  return "PERCENT";
        case SizeType::Absolute: return "ABSOLUTE";
        case SizeType::Square:   return "SQUARE";
        case SizeType::Ratio:    return "RATIO";
        case SizeType::Rest:     return "REST";
    }
    return "ABSOLUTE";
}

std::optional<Alignment> parse_alignment(std::string_view name) {
    if (name == "LEFT") return Alignment::Start;
    if (name == "CENTER") return Alignment::Center;
    if (name == "RIGHT") return Alignment::End;
    return std::nullopt;
}

std::optional<SizeType> parse_size_type(std::string_view name) {
    if (name == "PERCENT") return SizeType::Percent;
    if (name == "ABSOLUTE") return SizeType::Absolute;
    if (name == "SQUARE") return SizeType::Square;
    if (name == "RATIO") return SizeType::Ratio;
    if (name == "REST") return SizeType::Rest;
    return std::nullopt;
}

} // namespace axial::layout
