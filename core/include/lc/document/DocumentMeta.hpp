#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace lc {

// EXIF-like fields, mainly present for JPEG/TIFF sources.
struct ExifFields {
  std::optional<std::string> cameraMake;
  std::optional<std::string> cameraModel;
  std::optional<std::string> dateTime;
  std::optional<std::string> exposureTime;
  std::optional<std::string> fNumber;
  std::optional<std::uint32_t> iso;
  std::optional<std::string> focalLength;
  std::optional<double> gpsLatitude;
  std::optional<double> gpsLongitude;

  // "Make Model", or just the model when it already starts with the make.
  std::optional<std::string> cameraDisplay() const;
  // "lat, lon" with 5 decimals; empty unless both are known.
  std::optional<std::string> gpsDisplay() const;
};

struct MetadataSnapshot {
  std::string fileName;
  std::string filePath;
  std::string format;     // e.g. "PNG", "SVG", "PDF"
  std::uint32_t width{0};  // native, before transforms
  std::uint32_t height{0};
  std::uint64_t fileSize{0};
  std::string colorType;  // e.g. "RGBA8"
  std::uint32_t pageCount{1};
  std::optional<ExifFields> exif;

  std::string fileSizeDisplay() const;
  std::string resolutionDisplay() const;
};

// Human readable byte count: "512 B", "12.5 KB", "3.20 MB", "1.05 GB".
std::string formatFileSize(std::uint64_t bytes);

} // namespace lc
