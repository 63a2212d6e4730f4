#include "internal/dataset/record_parser.hpp"

#include <limits>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/utf8.hpp"

namespace heritage::dataset {

using heritage::model::RelationshipRecord;
using heritage::util::InvalidMetadata;
using heritage::util::MalformedRecord;
using heritage::util::MissingField;

namespace {

constexpr std::array<std::string_view, kColumnCount> kColumnNames = {
    "source_id", "source_name", "source_age", "kind", "target_id", "target_name", "target_age",
};

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string Trim(std::string_view s) {
  std::size_t begin = 0;
  std::size_t end   = s.size();
  while (begin < end && IsSpace(s[begin]))
    ++begin;
  while (end > begin && IsSpace(s[end - 1]))
    --end;
  return std::string(s.substr(begin, end - begin));
}

std::optional<std::uint32_t> ParseAge(const std::string& value, Column column, std::size_t line_number) {
  if (value.empty())
    return std::nullopt;

  std::uint64_t result = 0;
  for (char c : value) {
    if (c < '0' || c > '9')
      throw InvalidMetadata(line_number, std::string(ColumnName(column)), value);

    result = result * 10 + static_cast<std::uint64_t>(c - '0');
    if (result > std::numeric_limits<std::uint32_t>::max())
      throw InvalidMetadata(line_number, std::string(ColumnName(column)), value);
  }
  return static_cast<std::uint32_t>(result);
}

} // namespace

// ------------------------------------------------------------
// Columns
// ------------------------------------------------------------

std::string_view ColumnName(Column column) {
  return kColumnNames[static_cast<std::size_t>(column)];
}

std::optional<Column> ColumnFromName(std::string_view name) {
  for (std::size_t i = 0; i < kColumnCount; ++i) {
    if (kColumnNames[i] == name)
      return static_cast<Column>(i);
  }
  return std::nullopt;
}

bool IsRequired(Column column) {
  return column == Column::kSourceId || column == Column::kKind || column == Column::kTargetId;
}

ColumnMapping ColumnMapping::FromHeader(const std::vector<std::string>& header,
                                        const HeaderNames& names,
                                        std::size_t header_line) {
  ColumnMapping mapping;
  mapping.width_ = header.size();

  for (std::size_t c = 0; c < kColumnCount; ++c) {
    const auto column = static_cast<Column>(c);

    for (std::size_t i = 0; i < header.size(); ++i) {
      if (header[i] != names[c])
        continue;

      if (mapping.index_[c]) {
        throw MalformedRecord(header_line, "header column '" + names[c] + "' appears more than once");
      }
      mapping.index_[c] = i;
    }

    if (!mapping.index_[c] && IsRequired(column)) {
      throw MalformedRecord(header_line, "header lacks required column '" + names[c] + "'");
    }
  }

  return mapping;
}

ColumnMapping ColumnMapping::FromOrder(const std::vector<std::string>& logical_names) {
  ColumnMapping mapping;
  mapping.width_ = logical_names.size();

  for (std::size_t i = 0; i < logical_names.size(); ++i) {
    const auto column = ColumnFromName(logical_names[i]);
    if (!column)
      throw std::invalid_argument("unknown column '" + logical_names[i] + "'");

    auto& slot = mapping.index_[static_cast<std::size_t>(*column)];
    if (slot)
      throw std::invalid_argument("column '" + logical_names[i] + "' listed twice");
    slot = i;
  }

  for (std::size_t c = 0; c < kColumnCount; ++c) {
    if (!mapping.index_[c] && IsRequired(static_cast<Column>(c)))
      throw std::invalid_argument("column order lacks '" + std::string(kColumnNames[c]) + "'");
  }

  return mapping;
}

// ------------------------------------------------------------
// Splitting
// ------------------------------------------------------------

std::vector<std::string> SplitFields(std::string_view line, char delimiter, std::size_t line_number) {
  std::vector<std::string> fields;
  std::string              current;

  std::size_t i = 0;
  while (true) {
    // skip whitespace in front of a possible opening quote
    std::size_t j = i;
    while (j < line.size() && line[j] != delimiter && IsSpace(line[j]))
      ++j;

    if (j < line.size() && line[j] == '"') {
      current.clear();
      std::size_t k      = j + 1;
      bool        closed = false;
      while (k < line.size()) {
        if (line[k] == '"') {
          if (k + 1 < line.size() && line[k + 1] == '"') {
            current.push_back('"');
            k += 2;
            continue;
          }
          closed = true;
          ++k;
          break;
        }
        current.push_back(line[k++]);
      }
      if (!closed)
        throw MalformedRecord(line_number, "unterminated quoted field");

      while (k < line.size() && line[k] != delimiter && IsSpace(line[k]))
        ++k;
      if (k < line.size() && line[k] != delimiter)
        throw MalformedRecord(line_number, "unexpected text after closing quote");

      fields.push_back(Trim(current));
      i = k;
    } else {
      auto end = line.find(delimiter, i);
      if (end == std::string_view::npos)
        end = line.size();

      const auto raw = line.substr(i, end - i);
      if (raw.find('"') != std::string_view::npos)
        throw MalformedRecord(line_number, "stray quote in unquoted field");

      fields.push_back(Trim(raw));
      i = end;
    }

    if (i >= line.size())
      break;
    ++i; // delimiter
    if (i == line.size()) {
      fields.emplace_back(); // trailing empty field
      break;
    }
  }

  return fields;
}

// ------------------------------------------------------------
// Records
// ------------------------------------------------------------

RelationshipRecord ParseRecord(std::string_view line,
                               std::size_t line_number,
                               char delimiter,
                               const ColumnMapping& mapping) {
  if (!heritage::util::IsValidUtf8(line))
    throw MalformedRecord(line_number, "invalid UTF-8 byte sequence");

  const auto fields = SplitFields(line, delimiter, line_number);
  if (fields.size() != mapping.width()) {
    throw MalformedRecord(line_number, "expected " + std::to_string(mapping.width()) + " fields, found " +
                                           std::to_string(fields.size()));
  }

  auto field = [&](Column column) -> std::string {
    const auto index = mapping.IndexOf(column);
    if (!index)
      return {};
    return fields[*index];
  };

  auto required = [&](Column column) -> std::string {
    auto value = field(column);
    if (value.empty())
      throw MissingField(line_number, std::string(ColumnName(column)));
    return value;
  };

  RelationshipRecord record;
  record.line        = line_number;
  record.source_id   = required(Column::kSourceId);
  record.source_name = field(Column::kSourceName);
  record.source_age  = ParseAge(field(Column::kSourceAge), Column::kSourceAge, line_number);
  record.kind        = required(Column::kKind);
  record.target_id   = required(Column::kTargetId);
  record.target_name = field(Column::kTargetName);
  record.target_age  = ParseAge(field(Column::kTargetAge), Column::kTargetAge, line_number);

  if (record.source_id == record.target_id)
    throw MalformedRecord(line_number, "person " + record.source_id + " is related to itself");

  return record;
}

} // namespace heritage::dataset
