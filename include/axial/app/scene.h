#pragma once

#include <axial/layout/box.h>
#include <axial/layout/layout_engine.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace axial::core {
class DiagnosticEmitter;
}

namespace axial::app {

class SceneError : public std::runtime_error {
public:
    SceneError(int line, const std::string& message);

    int line() const { return line_; }

private:
    int line_;
};

struct SceneChild {
    std::string name;
    layout::ChildId id = 0;
    layout::Size preferred;
    layout::Size minimum;
    // Raw constraint text; empty means the default constraint.
    std::string constraint_text;
    bool spacer = false;
    layout::SizeSpec spacer_width;
    layout::SizeSpec spacer_height;
    int line = 0;
};

// A container description for the command-line host:
//
//   layout VERTICAL PACK_CENTER
//   region 300 200 [top left bottom right]
//   child <name> <prefW> <prefH> <minW> <minH> [<11-token constraint>]
//   spacer <name> <WIDTHTYPE> <width> <HEIGHTTYPE> <height>
//
// '#' starts a comment. A repeated child name re-registers that child.
struct Scene {
    layout::Orientation orientation = layout::Orientation::Vertical;
    layout::SpacingPolicy spacing = layout::SpacingPolicy::PackCenter;
    layout::LayoutRegion region;
    std::vector<SceneChild> children;

    const SceneChild* find(layout::ChildId id) const;
};

Scene parse_scene(std::string_view text);
Scene load_scene(const std::string& path);

// Engine configured from the scene, with the scene's intrinsic sizes wired in
// and every child registered. Constraint text errors become SceneError.
std::unique_ptr<layout::LayoutEngine> build_engine(const Scene& scene,
                                                   core::DiagnosticEmitter* diagnostics = nullptr);

struct PlacedChild {
    std::string name;
    layout::Bounds bounds;
};

struct SceneReport {
    layout::Size preferred;
    layout::Size minimum;
    layout::Size maximum;
    std::vector<PlacedChild> placed;
};

SceneReport run_scene(const Scene& scene, core::DiagnosticEmitter* diagnostics = nullptr);

std::string format_report(const SceneReport& report);

} // namespace axial::app
