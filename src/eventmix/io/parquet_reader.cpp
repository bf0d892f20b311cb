#include "eventmix/io/parquet_reader.h"

#include <arrow/io/file.h>
#include <parquet/arrow/reader.h>

#include <stdexcept>
#include <unordered_map>

#include <spdlog/spdlog.h>

#include "eventmix/utils/parquet/parquet_utils.h"
#include "eventmix/utils/timing/timer.h"

namespace eventmix::io {

std::shared_ptr<arrow::Table> ParquetReader::ReadTable(
    const std::string& path,
    const std::vector<std::string>& columns) const {
  utils::timing::ScopedTimer total_timer("parquet.read_table");
  auto open_result = arrow::io::ReadableFile::Open(path);
  if (!open_result.ok()) {
    throw std::runtime_error(open_result.status().ToString());
  }
  std::shared_ptr<arrow::io::ReadableFile> infile = open_result.ValueOrDie();

  auto reader_result = parquet::arrow::OpenFile(infile, arrow::default_memory_pool());
  if (!reader_result.ok()) {
    throw std::runtime_error(reader_result.status().ToString());
  }
  std::unique_ptr<parquet::arrow::FileReader> reader = std::move(reader_result).ValueOrDie();

  std::shared_ptr<arrow::Table> table;
  arrow::Status status;
  if (columns.empty()) {
    status = reader->ReadTable(&table);
  } else {
    std::shared_ptr<arrow::Schema> schema;
    status = reader->GetSchema(&schema);
    if (!status.ok()) {
      throw std::runtime_error(status.ToString());
    }
    std::unordered_map<std::string, int> index_by_name;
    index_by_name.reserve(static_cast<size_t>(schema->num_fields()));
    for (int i = 0; i < schema->num_fields(); ++i) {
      index_by_name.emplace(schema->field(i)->name(), i);
    }
    std::vector<int> column_indices;
    std::vector<std::string> skipped;
    for (const auto& name : columns) {
      auto it = index_by_name.find(name);
      if (it == index_by_name.end()) {
        skipped.push_back(name);
        continue;
      }
      column_indices.push_back(it->second);
    }
    if (!skipped.empty()) {
      spdlog::warn("[ParquetReader] {} has no column(s): {}", path,
                   utils::parquet::JoinNames(skipped));
    }
    status = reader->ReadTable(column_indices, &table);
  }
  if (!status.ok()) {
    throw std::runtime_error(status.ToString());
  }
  spdlog::debug("[ParquetReader] Read {} rows x {} columns from {}", table->num_rows(),
                table->num_columns(), path);
  return table;
}

std::shared_ptr<arrow::Table> ParquetReader::ReadTables(
    const std::vector<std::string>& paths,
    const std::vector<std::string>& columns) const {
  if (paths.empty()) {
    throw std::runtime_error("No parquet paths provided.");
  }
  std::vector<std::shared_ptr<arrow::Table>> tables;
  tables.reserve(paths.size());
  for (const auto& path : paths) {
    tables.push_back(ReadTable(path, columns));
  }
  return utils::parquet::ConcatenateTablesByRows(tables);
}

}  // namespace eventmix::io
