#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "internal/model/ancestry_path.hpp"

namespace heritage::render {

/*
  Text form of an ancestry path.

  One "<person> is <Kind> of" line per hop, then the last person alone.
  <person> is "<Name>(<annotation>)" where the annotation is the age when
  known and the identifier otherwise; unnamed persons render as
  "(<annotation>)".
*/
class PathRenderer {
 public:
  static std::vector<std::string> Render(const model::AncestryPath& path);

  static void Write(const model::AncestryPath& path, std::ostream& out);

  static std::string FormatPerson(const model::PathStep& step);
  static std::string FormatRelation(const std::string& kind);
};

} // namespace heritage::render
