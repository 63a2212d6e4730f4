#include "internal/render/path_renderer.hpp"

namespace heritage::render {

using heritage::model::AncestryPath;
using heritage::model::PathStep;

std::string PathRenderer::FormatPerson(const PathStep& step) {
  const std::string annotation = step.age ? std::to_string(*step.age) : step.id;
  return step.name + "(" + annotation + ")";
}

std::string PathRenderer::FormatRelation(const std::string& kind) {
  static const std::string kSuffix = " of";

  // "Father" and "Father of" both read as "is Father of"
  if (kind.size() >= kSuffix.size() && kind.compare(kind.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0)
    return "is " + kind;
  return "is " + kind + kSuffix;
}

std::vector<std::string> PathRenderer::Render(const AncestryPath& path) {
  std::vector<std::string> lines;
  lines.reserve(path.steps.size());

  for (const auto& step : path.steps) {
    auto line = FormatPerson(step);
    if (step.kind)
      line += " " + FormatRelation(*step.kind);
    lines.push_back(std::move(line));
  }

  return lines;
}

void PathRenderer::Write(const AncestryPath& path, std::ostream& out) {
  for (const auto& line : Render(path)) {
    out << line << '\n';
  }
}

} // namespace heritage::render
