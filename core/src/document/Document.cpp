#include "lc/document/Document.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <filesystem>

namespace lc {

static_assert(std::variant_size_v<Document::Content> == 3,
              "DocumentKind and Document::Content must stay in sync");

namespace {

constexpr std::array<DocumentCapabilities, 3> kCapabilities{{
  /* Raster    */ {true,  false},
  /* Vector    */ {false, false},
  /* Paginated */ {false, true},
}};

const char* const kRasterExtensions[] = {
  "png", "jpg", "jpeg", "gif", "bmp", "webp", "tif", "tiff", "ico",
  "tga", "pnm", "pbm", "pgm", "ppm", "hdr", "exr", "qoi", "avif"
};

std::string lowerExtension(const std::string& path) {
  auto dot = path.find_last_of('.');
  auto sep = path.find_last_of("/\\");
  if (dot == std::string::npos) return {};
  if (sep != std::string::npos && dot < sep) return {};
  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

struct IntrinsicSizeOf {
  Size operator()(const RasterContent& c) const {
    return Size{static_cast<double>(c.width), static_cast<double>(c.height)};
  }
  Size operator()(const VectorContent& c) const {
    return Size{c.viewBoxWidth, c.viewBoxHeight};
  }
  Size operator()(const PaginatedContent& c) const {
    if (c.pages.empty()) return Size{};
    return Size{c.pages[0].width, c.pages[0].height};
  }
};

struct PageCountOf {
  std::size_t operator()(const RasterContent&) const { return 1; }
  std::size_t operator()(const VectorContent&) const { return 1; }
  std::size_t operator()(const PaginatedContent& c) const { return c.pages.size(); }
};

struct ColorTypeOf {
  std::string operator()(const RasterContent& c) const { return c.colorType; }
  std::string operator()(const VectorContent&) const { return "RGBA8"; }
  std::string operator()(const PaginatedContent&) const { return "RGB8"; }
};

std::uint32_t pixelExtent(double v) {
  return static_cast<std::uint32_t>(std::max(1.0, std::ceil(v)));
}

std::shared_ptr<const PixelBuffer> transformPixels(const RasterContent& c,
                                                   const TransformState& t) {
  if (t.isIdentity() || !c.pixels) return c.pixels;

  const std::uint32_t w = c.width;
  const std::uint32_t h = c.height;
  const std::uint32_t outW = t.swapsAxes() ? h : w;

  auto out = std::make_shared<PixelBuffer>(c.pixels->size());
  const std::uint8_t* src = c.pixels->data();
  std::uint8_t* dst = out->data();

  for (std::uint32_t y = 0; y < h; y++) {
    for (std::uint32_t x = 0; x < w; x++) {
      PixelPos p = TransformModel::mapPixel(t, x, y, w, h);
      std::size_t si = (static_cast<std::size_t>(y) * w + x) * 4;
      std::size_t di = (static_cast<std::size_t>(p.y) * outW + p.x) * 4;
      dst[di + 0] = src[si + 0];
      dst[di + 1] = src[si + 1];
      dst[di + 2] = src[si + 2];
      dst[di + 3] = src[si + 3];
    }
  }
  return out;
}

} // namespace

std::optional<DocumentKind> documentKindFromPath(const std::string& path) {
  const std::string ext = lowerExtension(path);
  if (ext.empty()) return std::nullopt;
  if (ext == "svg" || ext == "svgz") return DocumentKind::Vector;
  if (ext == "pdf") return DocumentKind::Paginated;
  for (const char* r : kRasterExtensions) {
    if (ext == r) return DocumentKind::Raster;
  }
  return std::nullopt;
}

const DocumentCapabilities& capabilitiesOf(DocumentKind kind) {
  return kCapabilities[static_cast<std::size_t>(kind)];
}

Document::Document(Content content, DocumentSource source)
  : content_(std::move(content)), source_(std::move(source)) {}

std::unique_ptr<Document> Document::create(Content content, DocumentSource source,
                                           ViewerError* err) {
  auto reject = [&](const std::string& msg) -> std::unique_ptr<Document> {
    if (err) {
      err->code = ErrorCode::DecodeError;
      err->message = msg;
    }
    return nullptr;
  };

  Size s = std::visit(IntrinsicSizeOf{}, content);
  if (s.isEmpty()) {
    return reject("document has no usable intrinsic size: " + source.path);
  }

  if (const auto* r = std::get_if<RasterContent>(&content)) {
    std::size_t expected = static_cast<std::size_t>(r->width) * r->height * 4;
    if (!r->pixels || r->pixels->size() != expected) {
      return reject("raster pixel buffer does not match " +
                    std::to_string(r->width) + "x" + std::to_string(r->height) +
                    ": " + source.path);
    }
  }

  return std::unique_ptr<Document>(new Document(std::move(content), std::move(source)));
}

DocumentKind Document::kind() const {
  return static_cast<DocumentKind>(content_.index());
}

Size Document::intrinsicSize() const {
  return std::visit(IntrinsicSizeOf{}, content_);
}

std::size_t Document::pageCount() const {
  return std::visit(PageCountOf{}, content_);
}

MetadataSnapshot Document::metadata() const {
  MetadataSnapshot m;
  m.filePath = source_.path;
  m.fileName = std::filesystem::path(source_.path).filename().string();
  if (m.fileName.empty()) m.fileName = "unknown";
  m.format = source_.format;
  Size s = intrinsicSize();
  m.width = pixelExtent(s.width);
  m.height = pixelExtent(s.height);
  m.fileSize = source_.fileSize;
  m.colorType = std::visit(ColorTypeOf{}, content_);
  m.pageCount = static_cast<std::uint32_t>(pageCount());
  m.exif = source_.exif;
  return m;
}

RenderSurface Document::render(const TransformState& t) const {
  RenderSurface surf;
  surf.kind = kind();
  Size eff = TransformModel::effectiveSize(t, intrinsicSize());
  surf.width = pixelExtent(eff.width);
  surf.height = pixelExtent(eff.height);
  surf.rotationDegrees = toDegrees(t.rotation);
  surf.flipHorizontal = t.flipHorizontal;
  surf.flipVertical = t.flipVertical;
  surf.pageIndex = 0;

  if (const auto* r = std::get_if<RasterContent>(&content_)) {
    surf.pixels = transformPixels(*r, t);
  }
  return surf;
}

} // namespace lc
