#include "internal/dataset/dataset_reader.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <optional>
#include <stdexcept>

#include "internal/dataset/record_parser.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/utf8.hpp"

namespace heritage::dataset {

using heritage::model::RelationshipRecord;
using heritage::observability::BoolField;
using heritage::observability::IntField;
using heritage::observability::StringField;

namespace {

bool IsBlank(const std::string& line) {
  return line.find_first_not_of(" \t\f\v") == std::string::npos;
}

HeaderNames ToHeaderNames(const heritage::runtime::config::ColumnNames& columns) {
  HeaderNames names;
  names[static_cast<std::size_t>(Column::kSourceId)]   = columns.source_id();
  names[static_cast<std::size_t>(Column::kSourceName)] = columns.source_name();
  names[static_cast<std::size_t>(Column::kSourceAge)]  = columns.source_age();
  names[static_cast<std::size_t>(Column::kKind)]       = columns.kind();
  names[static_cast<std::size_t>(Column::kTargetId)]   = columns.target_id();
  names[static_cast<std::size_t>(Column::kTargetName)] = columns.target_name();
  names[static_cast<std::size_t>(Column::kTargetAge)]  = columns.target_age();
  return names;
}

} // namespace

DatasetReader::DatasetReader(const heritage::runtime::config::DatasetConfig& config) : config_(config) {
  if (config_.delimiter().size() != 1)
    throw std::invalid_argument("dataset delimiter must be a single character");
  delimiter_ = config_.delimiter().front();
}

std::vector<RelationshipRecord> DatasetReader::Read(std::istream& in) const {
  std::vector<RelationshipRecord> records;
  std::optional<ColumnMapping>    mapping;

  if (config_.headerless()) {
    mapping = ColumnMapping::FromOrder(
        std::vector<std::string>(config_.column_order().begin(), config_.column_order().end()));
  }

  std::string line;
  std::size_t line_number = 0;

  while (std::getline(in, line)) {
    ++line_number;

    if (!line.empty() && line.back() == '\r')
      line.pop_back();

    if (line_number == 1)
      line.erase(0, heritage::util::ByteOrderMarkLength(line));

    if (IsBlank(line))
      continue;

    if (!mapping) {
      if (!heritage::util::IsValidUtf8(line))
        throw heritage::util::MalformedRecord(line_number, "invalid UTF-8 byte sequence in header");

      const auto header = SplitFields(line, delimiter_, line_number);
      mapping = ColumnMapping::FromHeader(header, ToHeaderNames(config_.columns()), line_number);

      HERITAGE_LOG_DEBUG("Dataset header parsed",
                         {IntField("line", static_cast<std::int64_t>(line_number)),
                          IntField("columns", static_cast<std::int64_t>(header.size()))});
      continue;
    }

    records.push_back(ParseRecord(line, line_number, delimiter_, *mapping));
  }

  if (in.bad())
    throw heritage::util::DatasetIoError("read failed after line " + std::to_string(line_number));

  if (records.empty()) {
    HERITAGE_LOG_WARN("Dataset has no records", {IntField("lines", static_cast<std::int64_t>(line_number))});
  }

  return records;
}

std::vector<RelationshipRecord> DatasetReader::ReadFile(const std::string& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw heritage::util::DatasetIoError("cannot open dataset '" + path + "': " + std::strerror(errno));
  }

  HERITAGE_LOG_DEBUG("Reading dataset",
                     {StringField("path", path), BoolField("headerless", config_.headerless())});
  return Read(in);
}

} // namespace heritage::dataset
