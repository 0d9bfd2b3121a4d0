#pragma once
#include "lc/decode/DocumentDecoder.hpp"
#include "lc/decode/MetadataExtractor.hpp"
#include "lc/decode/ThreadSafeQueue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace lc {

struct FakeDecoderConfig {
  bool threaded{true};           // false: request() decodes inline
  int latencyMs{0};              // simulated decode time per request
  bool synthesizeUnknown{true};  // unregistered paths with a known extension decode
  std::uint32_t defaultWidth{64};
  std::uint32_t defaultHeight{48};
};

// Stand-in decoder producing in-memory documents. Paths are registered
// up front; synthesized raster pixels follow a fixed pattern
// (r = x, g = y, b = x + y, a = 255, each mod 256).
class FakeDocumentDecoder : public DocumentDecoder {
public:
  explicit FakeDocumentDecoder(const FakeDecoderConfig& config = {});
  ~FakeDocumentDecoder() override;

  void start() override;
  void stop() override;
  void request(const DecodeRequest& req) override;
  void cancel(Generation upTo) override;
  bool poll(DecodeResult& out) override;
  bool isRunning() const override;

  void setMetadataExtractor(const MetadataExtractor* extractor) { extractor_ = extractor; }

  void registerRaster(const std::string& path, std::uint32_t w, std::uint32_t h,
                      std::uint64_t fileSize = 0);
  void registerVector(const std::string& path, double w, double h,
                      std::uint64_t fileSize = 0);
  void registerPaginated(const std::string& path, std::vector<PageInfo> pages,
                         std::uint64_t fileSize = 0);
  void registerFailure(const std::string& path, const std::string& message);

  std::uint64_t decodedCount() const { return decoded_.load(); }
  static std::shared_ptr<const PixelBuffer> patternPixels(std::uint32_t w, std::uint32_t h);

private:
  struct Entry {
    bool fail{false};
    std::string failMessage;
    Document::Content content;
    std::string format;
    std::uint64_t fileSize{0};
  };

  void workerLoop();
  DecodeResult decode(const DecodeRequest& req) const;
  bool lookup(const std::string& path, Entry& out) const;

  FakeDecoderConfig config_;
  const MetadataExtractor* extractor_{nullptr};

  mutable std::mutex entriesMtx_;
  std::unordered_map<std::string, Entry> entries_;

  std::mutex reqMtx_;
  std::condition_variable reqCv_;
  std::deque<DecodeRequest> requests_;

  ThreadSafeQueue<DecodeResult> results_{64};
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<Generation> cancelledUpTo_{kNoGeneration};
  std::atomic<std::uint64_t> decoded_{0};
};

} // namespace lc
