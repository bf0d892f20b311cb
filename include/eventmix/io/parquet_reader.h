#pragma once

#include <arrow/api.h>

#include <memory>
#include <string>
#include <vector>

namespace eventmix::io {

class ParquetReader {
 public:
  // Reads one file. An empty `columns` reads every column; otherwise a named
  // column absent from the file is skipped with a warning.
  std::shared_ptr<arrow::Table> ReadTable(const std::string& path,
                                          const std::vector<std::string>& columns = {}) const;

  // Reads every file and concatenates them by rows into single-chunk columns.
  std::shared_ptr<arrow::Table> ReadTables(const std::vector<std::string>& paths,
                                           const std::vector<std::string>& columns = {}) const;
};

}  // namespace eventmix::io
