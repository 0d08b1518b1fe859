#include "axial/app/scene.h"
#include "axial/core/config.h"
#include "axial/core/diagnostics.h"
#include "axial/layout/errors.h"

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

constexpr const char kProgramName[] = "axial_layout";

void print_usage(std::ostream& stream) {
  stream << "usage: " << kProgramName
         << " <scene-file> [--size=WIDTHxHEIGHT] [--verbose]\n";
}

bool is_help_flag(std::string_view text) {
  return text == "-h" || text == "--help";
}

bool is_version_flag(std::string_view text) {
  return text == "-V" || text == "--version";
}

bool starts_with(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

bool parse_positive_int(std::string_view text, int& value) {
  if (text.empty()) {
    return false;
  }

  int parsed = 0;
  const char* begin = text.data();
  const char* end = begin + text.size();
  const std::from_chars_result result = std::from_chars(begin, end, parsed);
  if (result.ec != std::errc() || result.ptr != end || parsed <= 0) {
    return false;
  }

  value = parsed;
  return true;
}

bool parse_size_flag(std::string_view text, int& width, int& height) {
  constexpr std::string_view kSizePrefix = "--size=";
  if (!starts_with(text, kSizePrefix)) {
    return false;
  }

  const std::string_view dimensions = text.substr(kSizePrefix.size());
  const std::size_t separator = dimensions.find('x');
  if (separator == std::string_view::npos ||
      dimensions.find('x', separator + 1) != std::string_view::npos) {
    return false;
  }

  int parsed_width = 0;
  int parsed_height = 0;
  if (!parse_positive_int(dimensions.substr(0, separator), parsed_width) ||
      !parse_positive_int(dimensions.substr(separator + 1), parsed_height)) {
    return false;
  }

  width = parsed_width;
  height = parsed_height;
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc == 2 && is_help_flag(argv[1])) {
    print_usage(std::cout);
    return 0;
  }
  if (argc == 2 && is_version_flag(argv[1])) {
    std::cout << axial::core::config::kVersionString << "\n";
    return 0;
  }

  std::vector<std::string_view> positional_args;
  bool verbose = false;
  bool has_size_flag = false;
  int width = 0;
  int height = 0;

  for (int index = 1; index < argc; ++index) {
    const std::string_view argument(argv[index] != nullptr ? argv[index] : "");
    if (argument == "--verbose" || argument == "-v") {
      verbose = true;
      continue;
    }
    if (argument == "--size" || starts_with(argument, "--size=")) {
      if (has_size_flag) {
        std::cerr << "Invalid --size: duplicate flag '" << argument << "'\n";
        print_usage(std::cerr);
        return 1;
      }
      if (!parse_size_flag(argument, width, height)) {
        std::cerr << "Invalid --size: '" << argument
                  << "' (expected --size=WIDTHxHEIGHT with positive integers)\n";
        print_usage(std::cerr);
        return 1;
      }
      has_size_flag = true;
      continue;
    }
    positional_args.push_back(argument);
  }

  if (positional_args.size() != 1) {
    print_usage(std::cerr);
    return 1;
  }

  axial::core::DiagnosticEmitter diagnostics;
  if (verbose) {
    diagnostics.add_observer([](const axial::core::DiagnosticEvent& event) {
      std::cerr << axial::core::format_diagnostic(event) << "\n";
    });
  } else {
    diagnostics.set_min_severity(axial::core::Severity::Error);
  }

  try {
    axial::app::Scene scene = axial::app::load_scene(std::string(positional_args[0]));
    if (has_size_flag) {
      scene.region.width = width;
      scene.region.height = height;
    }
    const axial::app::SceneReport report = axial::app::run_scene(scene, &diagnostics);
    std::cout << axial::app::format_report(report);
  } catch (const axial::app::SceneError& e) {
    std::cerr << positional_args[0] << ": " << e.what() << "\n";
    return 1;
  } catch (const axial::layout::LayoutError& e) {
    std::cerr << "layout failed: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
