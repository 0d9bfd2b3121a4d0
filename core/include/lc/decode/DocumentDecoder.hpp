#pragma once
#include "lc/core/Result.hpp"
#include "lc/document/Document.hpp"
#include "lc/ids/Id.hpp"

#include <memory>
#include <string>

namespace lc {

struct DecodeRequest {
  Generation generation{kNoGeneration};
  std::string path;
};

struct DecodeResult {
  Generation generation{kNoGeneration};
  std::string path;
  std::unique_ptr<Document> document;  // null on failure
  ViewerError err;                      // DecodeError on failure

  bool ok() const { return document != nullptr; }
};

// Asynchronous document decoder. Requests are tagged with a generation;
// results come back through poll() on the caller's thread.
class DocumentDecoder {
public:
  virtual ~DocumentDecoder() = default;
  virtual void start() = 0;
  virtual void stop() = 0;
  virtual void request(const DecodeRequest& req) = 0;
  // Drops every pending request and undelivered result with
  // generation <= upTo. Work already in progress may still finish.
  virtual void cancel(Generation upTo) = 0;
  virtual bool poll(DecodeResult& out) = 0;
  virtual bool isRunning() const = 0;
};

} // namespace lc
