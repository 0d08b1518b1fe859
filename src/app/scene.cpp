#include <axial/app/scene.h>
#include <axial/core/config.h>
#include <axial/core/diagnostics.h>
#include <axial/layout/errors.h>

#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace axial::app {

namespace {

std::vector<std::string> split_tokens(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

std::string strip_comment(const std::string& line) {
    const std::size_t hash = line.find('#');
    return hash == std::string::npos ? line : line.substr(0, hash);
}

int parse_int_token(const std::string& token, int line, const char* what) {
    int value = 0;
    const char* begin = token.data();
    const char* end = begin + token.size();
    const std::from_chars_result result = std::from_chars(begin, end, value);
    if (token.empty() || result.ec != std::errc() || result.ptr != end) {
        throw SceneError(line, std::string("invalid ") + what + " '" + token + "'");
    }
    return value;
}

double parse_double_token(const std::string& token, int line, const char* what) {
    char* end = nullptr;
    errno = 0;
    const double value = std::strtod(token.c_str(), &end);
    if (token.empty() || end != token.c_str() + token.size() || errno == ERANGE) {
        throw SceneError(line, std::string("invalid ") + what + " '" + token + "'");
    }
    return value;
}

layout::SizeType parse_size_type_token(const std::string& token, int line) {
    const auto type = layout::parse_size_type(token);
    if (!type) throw SceneError(line, "unknown size type '" + token + "'");
    return *type;
}

void expect_arity(const std::vector<std::string>& tokens, std::size_t min, std::size_t max,
                  int line) {
    if (tokens.size() < min || tokens.size() > max) {
        throw SceneError(line, "wrong number of arguments for '" + tokens[0] + "'");
    }
}

std::string join(const std::vector<std::string>& tokens, std::size_t from) {
    std::string out;
    for (std::size_t i = from; i < tokens.size(); ++i) {
        if (!out.empty()) out += ' ';
        out += tokens[i];
    }
    return out;
}

} // namespace

SceneError::SceneError(int line, const std::string& message)
    : std::runtime_error("line " + std::to_string(line) + ": " + message), line_(line) {}

const SceneChild* Scene::find(layout::ChildId id) const {
    for (const auto& child : children) {
        if (child.id == id) return &child;
    }
    return nullptr;
}

Scene parse_scene(std::string_view text) {
    Scene scene;
    scene.orientation = *layout::parse_orientation(core::config::kDefaultOrientation);
    scene.spacing = *layout::parse_spacing_policy(core::config::kDefaultSpacing);
    scene.region.width = static_cast<int>(core::config::kDefaultRegionWidth);
    scene.region.height = static_cast<int>(core::config::kDefaultRegionHeight);

    std::unordered_map<std::string, std::size_t> by_name;
    layout::ChildId next_id = 1;

    std::istringstream stream{std::string(text)};
    std::string raw;
    int line = 0;
    while (std::getline(stream, raw)) {
        ++line;
        const std::vector<std::string> tokens = split_tokens(strip_comment(raw));
        if (tokens.empty()) continue;
        const std::string& keyword = tokens[0];

        if (keyword == "layout") {
            expect_arity(tokens, 3, 3, line);
            const auto orientation = layout::parse_orientation(tokens[1]);
            if (!orientation) throw SceneError(line, "unknown orientation '" + tokens[1] + "'");
            const auto spacing = layout::parse_spacing_policy(tokens[2]);
            if (!spacing) throw SceneError(line, "unknown spacing '" + tokens[2] + "'");
            scene.orientation = *orientation;
            scene.spacing = *spacing;
        } else if (keyword == "region") {
            if (tokens.size() != 3 && tokens.size() != 7) {
                throw SceneError(line, "wrong number of arguments for 'region'");
            }
            scene.region.width = parse_int_token(tokens[1], line, "region width");
            scene.region.height = parse_int_token(tokens[2], line, "region height");
            if (tokens.size() == 7) {
                scene.region.insets.top = parse_int_token(tokens[3], line, "inset");
                scene.region.insets.left = parse_int_token(tokens[4], line, "inset");
                scene.region.insets.bottom = parse_int_token(tokens[5], line, "inset");
                scene.region.insets.right = parse_int_token(tokens[6], line, "inset");
            }
        } else if (keyword == "child" || keyword == "spacer") {
            SceneChild child;
            child.name = tokens.size() > 1 ? tokens[1] : std::string();
            child.line = line;
            if (keyword == "child") {
                if (tokens.size() < 6) {
                    throw SceneError(line, "wrong number of arguments for 'child'");
                }
                child.preferred = {parse_int_token(tokens[2], line, "preferred width"),
                                   parse_int_token(tokens[3], line, "preferred height")};
                child.minimum = {parse_int_token(tokens[4], line, "minimum width"),
                                 parse_int_token(tokens[5], line, "minimum height")};
                child.constraint_text = join(tokens, 6);
            } else {
                expect_arity(tokens, 6, 6, line);
                child.spacer = true;
                child.spacer_width = {parse_size_type_token(tokens[2], line),
                                      parse_double_token(tokens[3], line, "spacer width"),
                                      layout::kUnboundedExtent};
                child.spacer_height = {parse_size_type_token(tokens[4], line),
                                       parse_double_token(tokens[5], line, "spacer height"),
                                       layout::kUnboundedExtent};
            }

            auto it = by_name.find(child.name);
            if (it != by_name.end()) {
                child.id = scene.children[it->second].id;
                scene.children[it->second] = child;
            } else {
                child.id = next_id++;
                by_name.emplace(child.name, scene.children.size());
                scene.children.push_back(child);
            }
        } else {
            throw SceneError(line, "unknown directive '" + keyword + "'");
        }
    }
    return scene;
}

Scene load_scene(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw SceneError(0, "cannot open scene file '" + path + "'");
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    return parse_scene(contents.str());
}

std::unique_ptr<layout::LayoutEngine> build_engine(const Scene& scene,
                                                   core::DiagnosticEmitter* diagnostics) {
    auto engine = std::make_unique<layout::LayoutEngine>(scene.orientation, scene.spacing);
    engine->set_diagnostics(diagnostics);

    std::unordered_map<layout::ChildId, std::pair<layout::Size, layout::Size>> intrinsic;
    for (const auto& child : scene.children) {
        intrinsic[child.id] = {child.preferred, child.minimum};
    }
    engine->set_intrinsic_preferred_size([intrinsic](layout::ChildId id) {
        auto it = intrinsic.find(id);
        return it == intrinsic.end() ? layout::Size{} : it->second.first;
    });
    engine->set_intrinsic_minimum_size([intrinsic](layout::ChildId id) {
        auto it = intrinsic.find(id);
        return it == intrinsic.end() ? layout::Size{} : it->second.second;
    });

    for (const auto& child : scene.children) {
        if (child.spacer) {
            engine->add_spacer(child.id, child.spacer_width, child.spacer_height);
            continue;
        }
        try {
            engine->add(child.id, child.constraint_text);
        } catch (const layout::MalformedSpecError& e) {
            throw SceneError(child.line, "child '" + child.name + "': " + e.what());
        }
    }
    return engine;
}

SceneReport run_scene(const Scene& scene, core::DiagnosticEmitter* diagnostics) {
    auto engine = build_engine(scene, diagnostics);

    SceneReport report;
    report.preferred = engine->preferred_size(scene.region);
    report.minimum = engine->minimum_size(scene.region);
    report.maximum = engine->maximum_size(scene.region);

    for (const auto& placement : engine->layout(scene.region)) {
        const SceneChild* child = scene.find(placement.id);
        report.placed.push_back({child ? child->name : std::to_string(placement.id),
                                 placement.bounds});
    }
    return report;
}

std::string format_report(const SceneReport& report) {
    std::ostringstream oss;
    oss << "preferred " << report.preferred.width << " " << report.preferred.height << "\n";
    oss << "minimum " << report.minimum.width << " " << report.minimum.height << "\n";
    oss << "maximum " << report.maximum.width << " " << report.maximum.height << "\n";
    for (const auto& placed : report.placed) {
        oss << placed.name << " " << placed.bounds.x << " " << placed.bounds.y << " "
            << placed.bounds.width << " " << placed.bounds.height << "\n";
    }
    return oss.str();
}

} // namespace axial::app
