#include "lc/decode/FakeDocumentDecoder.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <system_error>

namespace lc {

namespace {

std::string formatFromPath(const std::string& path) {
  std::string ext = std::filesystem::path(path).extension().string();
  if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  if (ext == "JPG") ext = "JPEG";
  if (ext == "TIF") ext = "TIFF";
  return ext;
}

DecodeResult failure(const DecodeRequest& req, const std::string& message) {
  DecodeResult r;
  r.generation = req.generation;
  r.path = req.path;
  r.err.code = ErrorCode::DecodeError;
  r.err.message = message;
  return r;
}

} // namespace

FakeDocumentDecoder::FakeDocumentDecoder(const FakeDecoderConfig& config)
    : config_(config) {
  if (config_.defaultWidth == 0) config_.defaultWidth = 64;
  if (config_.defaultHeight == 0) config_.defaultHeight = 48;
  if (config_.latencyMs < 0) config_.latencyMs = 0;
}

FakeDocumentDecoder::~FakeDocumentDecoder() { stop(); }

void FakeDocumentDecoder::start() {
  if (running_.load()) return;
  running_.store(true);
  if (config_.threaded) {
    thread_ = std::thread(&FakeDocumentDecoder::workerLoop, this);
  }
}

void FakeDocumentDecoder::stop() {
  {
    std::lock_guard<std::mutex> lock(reqMtx_);
    running_.store(false);
  }
  reqCv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

bool FakeDocumentDecoder::isRunning() const { return running_.load(); }

void FakeDocumentDecoder::request(const DecodeRequest& req) {
  if (!running_.load()) {
    std::fprintf(stderr, "FakeDocumentDecoder::request: decoder not running, dropped '%s'\n",
                 req.path.c_str());
    return;
  }

  if (!config_.threaded) {
    results_.push(decode(req));
    decoded_.fetch_add(1);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(reqMtx_);
    requests_.push_back(req);
  }
  reqCv_.notify_one();
}

void FakeDocumentDecoder::cancel(Generation upTo) {
  Generation prev = cancelledUpTo_.load();
  while (upTo > prev && !cancelledUpTo_.compare_exchange_weak(prev, upTo)) {
  }

  {
    std::lock_guard<std::mutex> lock(reqMtx_);
    requests_.erase(std::remove_if(requests_.begin(), requests_.end(),
                                   [upTo](const DecodeRequest& r) {
                                     return r.generation <= upTo;
                                   }),
                    requests_.end());
  }
  results_.removeIf([upTo](const DecodeResult& r) { return r.generation <= upTo; });
}

bool FakeDocumentDecoder::poll(DecodeResult& out) {
  return results_.pop(out);
}

void FakeDocumentDecoder::registerRaster(const std::string& path, std::uint32_t w,
                                         std::uint32_t h, std::uint64_t fileSize) {
  Entry e;
  RasterContent rc;
  rc.width = w;
  rc.height = h;
  rc.pixels = patternPixels(w, h);
  e.content = std::move(rc);
  e.format = formatFromPath(path);
  e.fileSize = fileSize ? fileSize : static_cast<std::uint64_t>(w) * h * 4;
  std::lock_guard<std::mutex> lock(entriesMtx_);
  entries_[path] = std::move(e);
}

void FakeDocumentDecoder::registerVector(const std::string& path, double w, double h,
                                         std::uint64_t fileSize) {
  Entry e;
  VectorContent vc;
  vc.viewBoxWidth = w;
  vc.viewBoxHeight = h;
  vc.scene = "<svg viewBox=\"0 0 " + std::to_string(w) + " " + std::to_string(h) + "\"/>";
  e.fileSize = fileSize ? fileSize : vc.scene.size();
  e.content = std::move(vc);
  e.format = formatFromPath(path);
  std::lock_guard<std::mutex> lock(entriesMtx_);
  entries_[path] = std::move(e);
}

void FakeDocumentDecoder::registerPaginated(const std::string& path,
                                            std::vector<PageInfo> pages,
                                            std::uint64_t fileSize) {
  Entry e;
  PaginatedContent pc;
  pc.pages = std::move(pages);
  e.content = std::move(pc);
  e.format = formatFromPath(path);
  e.fileSize = fileSize;
  std::lock_guard<std::mutex> lock(entriesMtx_);
  entries_[path] = std::move(e);
}

void FakeDocumentDecoder::registerFailure(const std::string& path, const std::string& message) {
  Entry e;
  e.fail = true;
  e.failMessage = message;
  std::lock_guard<std::mutex> lock(entriesMtx_);
  entries_[path] = std::move(e);
}

std::shared_ptr<const PixelBuffer> FakeDocumentDecoder::patternPixels(std::uint32_t w,
                                                                      std::uint32_t h) {
  auto buf = std::make_shared<PixelBuffer>(static_cast<std::size_t>(w) * h * 4);
  std::uint8_t* p = buf->data();
  for (std::uint32_t y = 0; y < h; y++) {
    for (std::uint32_t x = 0; x < w; x++) {
      *p++ = static_cast<std::uint8_t>(x & 0xFF);
      *p++ = static_cast<std::uint8_t>(y & 0xFF);
      *p++ = static_cast<std::uint8_t>((x + y) & 0xFF);
      *p++ = 255;
    }
  }
  return buf;
}

void FakeDocumentDecoder::workerLoop() {
  while (true) {
    DecodeRequest req;
    {
      std::unique_lock<std::mutex> lock(reqMtx_);
      reqCv_.wait(lock, [this] { return !running_.load() || !requests_.empty(); });
      if (!running_.load()) break;
      req = std::move(requests_.front());
      requests_.pop_front();
    }

    if (config_.latencyMs > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(config_.latencyMs));
    }
    if (req.generation <= cancelledUpTo_.load()) continue;

    DecodeResult result = decode(req);
    decoded_.fetch_add(1);
    if (req.generation <= cancelledUpTo_.load()) continue;
    results_.push(std::move(result));
  }
}

bool FakeDocumentDecoder::lookup(const std::string& path, Entry& out) const {
  {
    std::lock_guard<std::mutex> lock(entriesMtx_);
    auto it = entries_.find(path);
    if (it != entries_.end()) {
      out = it->second;
      return true;
    }
  }
  if (!config_.synthesizeUnknown) return false;

  auto kind = documentKindFromPath(path);
  if (!kind) return false;

  out = Entry{};
  out.format = formatFromPath(path);
  const std::uint32_t w = config_.defaultWidth;
  const std::uint32_t h = config_.defaultHeight;
  switch (*kind) {
    case DocumentKind::Raster: {
      RasterContent rc;
      rc.width = w;
      rc.height = h;
      rc.pixels = patternPixels(w, h);
      out.content = std::move(rc);
      break;
    }
    case DocumentKind::Vector: {
      VectorContent vc;
      vc.viewBoxWidth = w;
      vc.viewBoxHeight = h;
      out.content = std::move(vc);
      break;
    }
    case DocumentKind::Paginated: {
      PaginatedContent pc;
      pc.pages.push_back(PageInfo{static_cast<double>(w), static_cast<double>(h)});
      out.content = std::move(pc);
      break;
    }
  }

  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  out.fileSize = ec ? 0 : static_cast<std::uint64_t>(size);
  return true;
}

DecodeResult FakeDocumentDecoder::decode(const DecodeRequest& req) const {
  Entry entry;
  if (!lookup(req.path, entry)) {
    return failure(req, "unsupported or unknown document: " + req.path);
  }
  if (entry.fail) {
    return failure(req, entry.failMessage.empty() ? "decode failed: " + req.path
                                                  : entry.failMessage);
  }

  DocumentSource src;
  src.path = req.path;
  src.format = entry.format;
  src.fileSize = entry.fileSize;
  if (extractor_) src.exif = extractor_->extract(req.path);

  DecodeResult r;
  r.generation = req.generation;
  r.path = req.path;
  r.document = Document::create(std::move(entry.content), std::move(src), &r.err);
  return r;
}

} // namespace lc
