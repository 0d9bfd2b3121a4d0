#pragma once
#include "lc/core/Result.hpp"
#include "lc/decode/DocumentDecoder.hpp"
#include "lc/document/Document.hpp"
#include "lc/ids/Id.hpp"
#include "lc/navigation/FolderScanner.hpp"
#include "lc/navigation/NavigationIndex.hpp"
#include "lc/settings/ViewerSettings.hpp"
#include "lc/transform/TransformModel.hpp"
#include "lc/viewport/InputReconciler.hpp"
#include "lc/viewport/KeyMap.hpp"
#include "lc/viewport/ViewportState.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace lc {

// Reserved editing tools. Toggling only changes the mode.
enum class ToolMode : std::uint8_t { None = 0, Crop, Scale };

inline const char* toString(ToolMode m) {
  switch (m) {
    case ToolMode::None: return "none";
    case ToolMode::Crop: return "crop";
    case ToolMode::Scale: return "scale";
    default: return "unknown";
  }
}

struct ViewerSessionConfig {
  ViewportConfig viewport;
  InputReconcilerConfig input;
  NavigationConfig navigation;
};

// What the status bar shows.
struct StatusInfo {
  std::string zoomDisplay;    // "Fit" or "150%"; empty without a document
  std::string positionLabel;  // "3 / 10"; empty when the folder is empty
  std::string dimensions;     // "1920 x 1080" (native); empty without a document
};

struct FrameResult {
  bool documentChanged{false};
  bool decodeFailed{false};
  std::uint32_t staleDiscarded{0};
};

// Event-thread owner of all viewer state: the resident document, its
// transform, the viewport, navigation and user settings. Decoding happens
// on the decoder's side; results are applied in update().
class ViewerSession {
public:
  ViewerSession(DocumentDecoder& decoder, FolderScanner& scanner,
                SettingsStore* settingsStore = nullptr);

  void setConfig(const ViewerSessionConfig& cfg);

  // Reads settings from the store. Keeps defaults if nothing is stored.
  bool loadSettings();

  // Scans the file's folder and requests the file. The navigation cursor
  // moves at once; the document is replaced when the decode arrives.
  // Relative paths resolve against the working directory.
  OpResult open(const std::string& path);
  // Scans `folder` and requests its first document.
  OpResult openDirectory(const std::string& folder);

  // Drains decode results. Call once per frame on the event thread.
  FrameResult update();

  OpResult handleCommand(ViewerCommand cmd);
  OpResult setZoom(double factor);  // Custom mode
  bool handlePointer(const PointerEvent& ev);
  // Unmapped keys are ignored and report success.
  OpResult handleKey(const KeyEvent& ev);

  // Non-positive sizes leave the viewport not laid out and return false.
  bool setViewportSize(Size size);

  const Document* document() const { return document_.get(); }
  bool hasDocument() const { return document_ != nullptr; }
  const TransformModel& transform() const { return transform_; }
  const ViewportState& viewport() const { return viewport_; }
  const NavigationIndex& navigation() const { return nav_; }
  const ViewerSettings& settings() const { return settings_; }
  ToolMode toolMode() const { return toolMode_; }

  bool isLoading() const { return pendingGen_ != kNoGeneration; }
  Generation pendingGeneration() const { return pendingGen_; }
  const std::string& pendingPath() const { return pendingPath_; }

  // Built on first access after a change; null without a document.
  const RenderSurface* renderSurface();
  const MetadataSnapshot* metadata();

  StatusInfo status() const;

  const std::optional<ViewerError>& lastError() const { return lastError_; }
  void clearError() { lastError_.reset(); }

private:
  OpResult navigate(bool forward);
  OpResult applyTransform(ViewerCommand cmd);
  void requestDecode(const std::string& path);
  void installDocument(std::unique_ptr<Document> doc);
  void restoreCursor();
  void syncContentSize();
  void persistSettings();
  OpResult fail(ErrorCode code, const std::string& message);

  DocumentDecoder& decoder_;
  FolderScanner& scanner_;
  SettingsStore* settingsStore_{nullptr};

  ViewerSessionConfig config_;
  ViewportState viewport_;
  InputReconciler input_;
  KeyMap keyMap_;
  NavigationIndex nav_;
  TransformModel transform_;
  ViewerSettings settings_;
  ToolMode toolMode_{ToolMode::None};

  std::unique_ptr<Document> document_;
  std::optional<RenderSurface> render_;
  std::optional<MetadataSnapshot> metadata_;

  Generation nextGen_{kNoGeneration};
  Generation pendingGen_{kNoGeneration};
  std::string pendingPath_;

  std::optional<ViewerError> lastError_;
};

} // namespace lc
