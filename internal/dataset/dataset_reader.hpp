#pragma once

#include <istream>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/relationship.hpp"

namespace heritage::dataset {

/*
  Turns a relationship dataset into records.

  Line numbers are 1-based physical lines, the header included. Blank lines
  are skipped. The first bad line aborts the read: callers either get every
  record or an exception.
*/
class DatasetReader {
 public:
  explicit DatasetReader(const heritage::runtime::config::DatasetConfig& config);

  std::vector<model::RelationshipRecord> Read(std::istream& in) const;

  // Throws DatasetIoError when the file cannot be opened or read.
  std::vector<model::RelationshipRecord> ReadFile(const std::string& path) const;

 private:
  heritage::runtime::config::DatasetConfig config_;
  char delimiter_;
};

} // namespace heritage::dataset
