#pragma once
#include "lc/document/DocumentMeta.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace lc {

// Reads EXIF-like fields for a file. Called from the decode worker.
class MetadataExtractor {
public:
  virtual ~MetadataExtractor() = default;
  virtual std::optional<ExifFields> extract(const std::string& path) const = 0;
};

// Fixed path -> fields table. Populate before handing it to a decoder.
class TableMetadataExtractor : public MetadataExtractor {
public:
  void set(const std::string& path, ExifFields fields) { table_[path] = std::move(fields); }

  std::optional<ExifFields> extract(const std::string& path) const override {
    auto it = table_.find(path);
    if (it == table_.end()) return std::nullopt;
    return it->second;
  }

private:
  std::unordered_map<std::string, ExifFields> table_;
};

} // namespace lc
