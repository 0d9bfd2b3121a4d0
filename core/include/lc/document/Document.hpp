#pragma once
#include "lc/core/Result.hpp"
#include "lc/document/DocumentMeta.hpp"
#include "lc/geom/Types.hpp"
#include "lc/transform/TransformModel.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace lc {

// Order matches the alternatives of Document::Content.
enum class DocumentKind : std::uint8_t { Raster = 0, Vector, Paginated };

inline const char* toString(DocumentKind k) {
  switch (k) {
    case DocumentKind::Raster: return "raster";
    case DocumentKind::Vector: return "vector";
    case DocumentKind::Paginated: return "paginated";
    default: return "unknown";
  }
}

// Detect kind from the file extension (case-insensitive).
std::optional<DocumentKind> documentKindFromPath(const std::string& path);

struct DocumentCapabilities {
  bool transformable{false};
  bool multiPage{false};
};

// One row per DocumentKind. Callers query this instead of switching on kind.
const DocumentCapabilities& capabilitiesOf(DocumentKind kind);

// Decoded RGBA8 pixels, row-major, width * height * 4 bytes.
using PixelBuffer = std::vector<std::uint8_t>;

struct RasterContent {
  std::uint32_t width{0}, height{0};
  std::string colorType{"RGBA8"};
  std::shared_ptr<const PixelBuffer> pixels;
};

struct VectorContent {
  std::string scene;  // opaque scene description handed to the renderer
  double viewBoxWidth{0}, viewBoxHeight{0};
};

struct PageInfo {
  double width{0}, height{0};
};

struct PaginatedContent {
  std::vector<PageInfo> pages;  // only pages[0] is addressable
};

// What the decoder knows about the file, independent of format.
struct DocumentSource {
  std::string path;
  std::string format;  // "PNG", "SVG", "PDF", ...
  std::uint64_t fileSize{0};
  std::optional<ExifFields> exif;
};

// Transform parameters plus, for raster documents, the transformed pixels.
struct RenderSurface {
  DocumentKind kind{DocumentKind::Raster};
  std::uint32_t width{0}, height{0};  // after transform
  int rotationDegrees{0};
  bool flipHorizontal{false};
  bool flipVertical{false};
  std::uint32_t pageIndex{0};
  std::shared_ptr<const PixelBuffer> pixels;  // null for vector / paginated
};

class Document {
public:
  using Content = std::variant<RasterContent, VectorContent, PaginatedContent>;

  // Validates the non-zero size invariant. On failure returns nullptr and
  // fills `err` (DecodeError).
  static std::unique_ptr<Document> create(Content content, DocumentSource source,
                                          ViewerError* err = nullptr);

  DocumentKind kind() const;
  const DocumentCapabilities& capabilities() const { return capabilitiesOf(kind()); }

  Size intrinsicSize() const;
  bool supportsTransform() const { return capabilities().transformable; }
  std::size_t pageCount() const;

  const std::string& sourcePath() const { return source_.path; }
  const DocumentSource& source() const { return source_; }

  MetadataSnapshot metadata() const;

  // Produces the surface for `t`. Raster pixels are rotated/flipped
  // losslessly; identity shares the decoded buffer.
  RenderSurface render(const TransformState& t) const;

  template <typename T>
  const T* contentAs() const { return std::get_if<T>(&content_); }

private:
  Document(Content content, DocumentSource source);

  Content content_;
  DocumentSource source_;
};

} // namespace lc
