#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/relationship.hpp"

namespace heritage::dataset {

enum class Column : std::size_t {
  kSourceId = 0,
  kSourceName,
  kSourceAge,
  kKind,
  kTargetId,
  kTargetName,
  kTargetAge,
};

inline constexpr std::size_t kColumnCount = 7;

// Logical name, as used in dataset.column_order.
std::string_view ColumnName(Column column);
std::optional<Column> ColumnFromName(std::string_view name);
bool IsRequired(Column column);

// Header name per logical column, indexed by Column.
using HeaderNames = std::array<std::string, kColumnCount>;

/*
  Where each logical column sits in a row.

  Built from a header row or from an explicit positional order; the parser
  itself never assumes a layout.
*/
class ColumnMapping {
 public:
  // Throws MalformedRecord at header_line when a required column is absent
  // or a mapped header name repeats.
  static ColumnMapping FromHeader(const std::vector<std::string>& header,
                                  const HeaderNames& names,
                                  std::size_t header_line);

  // Throws std::invalid_argument on unknown or repeated names.
  static ColumnMapping FromOrder(const std::vector<std::string>& logical_names);

  std::optional<std::size_t> IndexOf(Column column) const {
    return index_[static_cast<std::size_t>(column)];
  }

  // Number of fields every row must have.
  std::size_t width() const {
    return width_;
  }

 private:
  std::array<std::optional<std::size_t>, kColumnCount> index_{};
  std::size_t width_ = 0;
};

/*
  Splits one line on delimiter honouring double-quoted fields. Fields are
  returned unquoted and trimmed of surrounding ASCII whitespace.
*/
std::vector<std::string> SplitFields(std::string_view line, char delimiter, std::size_t line_number);

/*
  Parses one data row. Pure; throws MalformedRecord, MissingField or
  InvalidMetadata carrying line_number.
*/
model::RelationshipRecord ParseRecord(std::string_view line,
                                      std::size_t line_number,
                                      char delimiter,
                                      const ColumnMapping& mapping);

} // namespace heritage::dataset
