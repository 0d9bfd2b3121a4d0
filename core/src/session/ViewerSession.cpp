#include "lc/session/ViewerSession.hpp"

#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace lc {

ViewerSession::ViewerSession(DocumentDecoder& decoder, FolderScanner& scanner,
                             SettingsStore* settingsStore)
    : decoder_(decoder), scanner_(scanner), settingsStore_(settingsStore) {}

void ViewerSession::setConfig(const ViewerSessionConfig& cfg) {
  config_ = cfg;
  viewport_.setConfig(cfg.viewport);
  input_.setConfig(cfg.input);
  input_.reanchor(viewport_);
  nav_.setConfig(cfg.navigation);
}

bool ViewerSession::loadSettings() {
  if (!settingsStore_) return false;
  ViewerSettings s = settings_;
  if (!settingsStore_->load(s)) return false;
  settings_ = s;
  return true;
}

// ---- Opening ----

OpResult ViewerSession::open(const std::string& path) {
  if (!documentKindFromPath(path)) {
    return fail(ErrorCode::DecodeError, "unsupported document type: " + path);
  }

  // Scanner entries are spelled from the folder ("./b.png" for "b.png"),
  // so match on the normalized form and keep the scanner's spelling.
  const std::filesystem::path target = std::filesystem::path(path).lexically_normal();
  std::string folder = target.parent_path().string();
  if (folder.empty()) folder = ".";

  std::vector<std::string> paths;
  std::string current = path;
  bool listed = false;
  if (scanner_.scan(folder, paths)) {
    auto it = std::find_if(paths.begin(), paths.end(), [&](const std::string& p) {
      return std::filesystem::path(p).lexically_normal() == target;
    });
    if (it != paths.end()) {
      current = *it;
      listed = true;
    }
  }
  if (!listed) paths.assign(1, path);
  nav_.rebuild(std::move(paths), current);
  requestDecode(current);
  return OpResult::success();
}

OpResult ViewerSession::openDirectory(const std::string& folder) {
  std::vector<std::string> paths;
  if (!scanner_.scan(folder, paths)) {
    return fail(ErrorCode::InvalidConfiguration, "cannot read folder: " + folder);
  }
  if (paths.empty()) {
    return fail(ErrorCode::NoDocument, "no documents in folder: " + folder);
  }
  nav_.rebuild(std::move(paths));
  requestDecode(*nav_.currentPath());
  return OpResult::success();
}

void ViewerSession::requestDecode(const std::string& path) {
  if (pendingGen_ != kNoGeneration) decoder_.cancel(pendingGen_);
  pendingGen_ = ++nextGen_;
  pendingPath_ = path;
  decoder_.request(DecodeRequest{pendingGen_, path});
}

// ---- Frame update ----

FrameResult ViewerSession::update() {
  FrameResult fr;
  DecodeResult r;
  while (decoder_.poll(r)) {
    if (pendingGen_ == kNoGeneration || r.generation != pendingGen_) {
      fr.staleDiscarded++;
      continue;
    }
    pendingGen_ = kNoGeneration;
    pendingPath_.clear();

    if (r.ok()) {
      installDocument(std::move(r.document));
      lastError_.reset();
      fr.documentChanged = true;
    } else {
      std::fprintf(stderr, "ViewerSession::update: decode failed for '%s': %s\n",
                   r.path.c_str(), r.err.message.c_str());
      lastError_ = r.err;
      restoreCursor();
      fr.decodeFailed = true;
    }
  }
  return fr;
}

void ViewerSession::installDocument(std::unique_ptr<Document> doc) {
  document_ = std::move(doc);
  transform_.reset();
  render_.reset();
  metadata_.reset();
  input_.cancelDrag();
  syncContentSize();
  viewport_.setFit();
}

void ViewerSession::restoreCursor() {
  if (!document_) return;
  if (auto i = nav_.indexOf(document_->sourcePath())) nav_.setCursor(*i);
}

void ViewerSession::syncContentSize() {
  if (!document_) {
    viewport_.clearContent();
    return;
  }
  viewport_.setContentSize(transform_.effectiveSize(document_->intrinsicSize()));
}

// ---- Commands ----

OpResult ViewerSession::handleCommand(ViewerCommand cmd) {
  switch (cmd) {
    case ViewerCommand::PreviousDocument:
      return navigate(false);
    case ViewerCommand::NextDocument:
      return navigate(true);

    case ViewerCommand::FlipHorizontal:
    case ViewerCommand::FlipVertical:
    case ViewerCommand::RotateCW:
    case ViewerCommand::RotateCCW:
      return applyTransform(cmd);

    case ViewerCommand::ToggleCropMode:
      toolMode_ = toolMode_ == ToolMode::Crop ? ToolMode::None : ToolMode::Crop;
      return OpResult::success();
    case ViewerCommand::ToggleScaleMode:
      toolMode_ = toolMode_ == ToolMode::Scale ? ToolMode::None : ToolMode::Scale;
      return OpResult::success();

    case ViewerCommand::ToggleNavBar:
      settings_.navBarVisible = !settings_.navBarVisible;
      persistSettings();
      return OpResult::success();
    case ViewerCommand::ToggleContextDrawer:
      settings_.contextDrawerVisible = !settings_.contextDrawerVisible;
      persistSettings();
      return OpResult::success();

    default:
      break;
  }

  if (!document_) return fail(ErrorCode::NoDocument, std::string(toString(cmd)) + ": no document");
  input_.applyCommand(cmd, viewport_);
  return OpResult::success();
}

OpResult ViewerSession::navigate(bool forward) {
  NavResult r = forward ? nav_.next() : nav_.previous();
  switch (r.status) {
    case NavStatus::Moved:
      requestDecode(r.path);
      return OpResult::success();
    case NavStatus::AtBoundary:
      return OpResult::success();
    case NavStatus::Empty:
    default:
      return fail(ErrorCode::NoDocument, "no documents to navigate");
  }
}

OpResult ViewerSession::applyTransform(ViewerCommand cmd) {
  if (!document_) return fail(ErrorCode::NoDocument, std::string(toString(cmd)) + ": no document");
  if (!document_->supportsTransform()) {
    return fail(ErrorCode::UnsupportedOperation,
                std::string(toString(cmd)) + " is not supported for " +
                toString(document_->kind()) + " documents");
  }

  switch (cmd) {
    case ViewerCommand::FlipHorizontal: transform_.applyFlipHorizontal(); break;
    case ViewerCommand::FlipVertical: transform_.applyFlipVertical(); break;
    case ViewerCommand::RotateCW: transform_.applyRotateClockwise(); break;
    case ViewerCommand::RotateCCW: transform_.applyRotateCounterClockwise(); break;
    default: break;
  }
  render_.reset();
  syncContentSize();
  input_.reanchor(viewport_);
  return OpResult::success();
}

OpResult ViewerSession::setZoom(double factor) {
  if (!(factor > 0.0)) {
    return fail(ErrorCode::InvalidConfiguration, "setZoom: factor must be positive");
  }
  if (!document_) return fail(ErrorCode::NoDocument, "setZoom: no document");
  viewport_.setZoom(factor);
  input_.reanchor(viewport_);
  return OpResult::success();
}

bool ViewerSession::handlePointer(const PointerEvent& ev) {
  if (!document_) return false;
  return input_.processPointer(ev, viewport_);
}

OpResult ViewerSession::handleKey(const KeyEvent& ev) {
  auto cmd = keyMap_.lookup(ev);
  if (!cmd) return OpResult::success();
  return handleCommand(*cmd);
}

bool ViewerSession::setViewportSize(Size size) {
  bool laidOut = viewport_.setViewportSize(size);
  input_.reanchor(viewport_);
  if (!laidOut) {
    std::fprintf(stderr, "ViewerSession::setViewportSize: ignoring %gx%g, viewport not laid out\n",
                 size.width, size.height);
    return false;
  }
  return true;
}

// ---- Outputs ----

const RenderSurface* ViewerSession::renderSurface() {
  if (!document_) return nullptr;
  if (!render_) render_ = document_->render(transform_.state());
  return &*render_;
}

const MetadataSnapshot* ViewerSession::metadata() {
  if (!document_) return nullptr;
  if (!metadata_) metadata_ = document_->metadata();
  return &*metadata_;
}

StatusInfo ViewerSession::status() const {
  StatusInfo s;
  s.positionLabel = nav_.positionLabel();
  if (document_) {
    s.zoomDisplay = viewport_.zoomLabel();
    s.dimensions = document_->metadata().resolutionDisplay();
  }
  return s;
}

// ---- Internals ----

void ViewerSession::persistSettings() {
  if (!settingsStore_) return;
  if (!settingsStore_->save(settings_)) {
    std::fprintf(stderr, "ViewerSession::persistSettings: settings not saved\n");
  }
}

OpResult ViewerSession::fail(ErrorCode code, const std::string& message) {
  OpResult r = OpResult::fail(code, message);
  lastError_ = r.err;
  return r;
}

} // namespace lc
