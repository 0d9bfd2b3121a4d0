#include "lc/document/DocumentMeta.hpp"

#include <cstdio>

namespace lc {

std::string formatFileSize(std::uint64_t bytes) {
  constexpr std::uint64_t KB = 1024;
  constexpr std::uint64_t MB = KB * 1024;
  constexpr std::uint64_t GB = MB * 1024;

  char buf[64];
  if (bytes >= GB) {
    std::snprintf(buf, sizeof(buf), "%.2f GB",
                  static_cast<double>(bytes) / static_cast<double>(GB));
  } else if (bytes >= MB) {
    std::snprintf(buf, sizeof(buf), "%.2f MB",
                  static_cast<double>(bytes) / static_cast<double>(MB));
  } else if (bytes >= KB) {
    std::snprintf(buf, sizeof(buf), "%.1f KB",
                  static_cast<double>(bytes) / static_cast<double>(KB));
  } else {
    std::snprintf(buf, sizeof(buf), "%llu B",
                  static_cast<unsigned long long>(bytes));
  }
  return buf;
}

std::string MetadataSnapshot::fileSizeDisplay() const {
  return formatFileSize(fileSize);
}

std::string MetadataSnapshot::resolutionDisplay() const {
  return std::to_string(width) + " x " + std::to_string(height);
}

std::optional<std::string> ExifFields::cameraDisplay() const {
  if (cameraMake && cameraModel) {
    if (cameraModel->rfind(*cameraMake, 0) == 0) return *cameraModel;
    return *cameraMake + " " + *cameraModel;
  }
  if (cameraMake) return *cameraMake;
  if (cameraModel) return *cameraModel;
  return std::nullopt;
}

std::optional<std::string> ExifFields::gpsDisplay() const {
  if (!gpsLatitude || !gpsLongitude) return std::nullopt;
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.5f, %.5f", *gpsLatitude, *gpsLongitude);
  return std::string(buf);
}

} // namespace lc
