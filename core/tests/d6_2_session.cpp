// D6.2 — Viewer session test
// Tests: open + update installs the document in Fit, navigation moves the
// cursor before the decode lands, rotate updates effective size, vector
// transform is rejected, decode failure keeps the document and cursor,
// stale generations discarded, panel toggles persist settings, drag stays
// continuous across setZoom / rotate / resize, relative paths keep the folder.

#include "lc/decode/FakeDocumentDecoder.hpp"
#include "lc/navigation/FolderScanner.hpp"
#include "lc/session/ViewerSession.hpp"
#include "lc/settings/ViewerSettings.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <deque>
#include <map>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireNear(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

// Fixed folder listings.
class ListScanner : public lc::FolderScanner {
public:
  std::map<std::string, std::vector<std::string>> folders;

  bool scan(const std::string& folder, std::vector<std::string>& out) override {
    out.clear();
    auto it = folders.find(folder);
    if (it == folders.end()) return false;
    out = it->second;
    return true;
  }
};

// Decoder whose results are handed over by the test, in any order.
class ManualDecoder : public lc::DocumentDecoder {
public:
  std::vector<lc::DecodeRequest> requests;
  std::vector<lc::Generation> cancelled;
  std::deque<lc::DecodeResult> ready;
  bool running{false};

  void start() override { running = true; }
  void stop() override { running = false; }
  void request(const lc::DecodeRequest& req) override { requests.push_back(req); }
  void cancel(lc::Generation upTo) override { cancelled.push_back(upTo); }
  bool poll(lc::DecodeResult& out) override {
    if (ready.empty()) return false;
    out = std::move(ready.front());
    ready.pop_front();
    return true;
  }
  bool isRunning() const override { return running; }

  void deliver(const lc::DecodeRequest& req, std::uint32_t w, std::uint32_t h) {
    lc::RasterContent rc;
    rc.width = w;
    rc.height = h;
    rc.pixels = lc::FakeDocumentDecoder::patternPixels(w, h);
    lc::DocumentSource src;
    src.path = req.path;
    src.format = "PNG";
    lc::DecodeResult r;
    r.generation = req.generation;
    r.path = req.path;
    r.document = lc::Document::create(std::move(rc), std::move(src), &r.err);
    ready.push_back(std::move(r));
  }
};

static lc::FakeDocumentDecoder makeDecoder() {
  lc::FakeDecoderConfig cfg;
  cfg.threaded = false;
  cfg.synthesizeUnknown = false;
  return lc::FakeDocumentDecoder(cfg);
}

static void registerFolder(lc::FakeDocumentDecoder& dec, ListScanner& scanner) {
  dec.registerRaster("/pics/a.png", 1600, 1200);
  dec.registerRaster("/pics/b.png", 400, 300);
  dec.registerVector("/pics/c.svg", 1000, 500);
  scanner.folders["/pics"] = {"/pics/a.png", "/pics/b.png", "/pics/c.svg"};
}

int main() {
  // --- Test 1: open, then update installs in Fit ---
  {
    lc::FakeDocumentDecoder dec = makeDecoder();
    ListScanner scanner;
    registerFolder(dec, scanner);
    dec.start();

    lc::ViewerSession s(dec, scanner);
    s.setViewportSize(lc::Size{800, 600});
    requireTrue(s.open("/pics/a.png").ok, "open ok");
    requireTrue(s.isLoading(), "loading until update");
    requireTrue(!s.hasDocument(), "not installed yet");
    requireTrue(s.status().positionLabel == "1 / 3", "cursor already placed");

    lc::FrameResult fr = s.update();
    requireTrue(fr.documentChanged, "document changed");
    requireTrue(!s.isLoading(), "no longer loading");
    requireTrue(s.document()->sourcePath() == "/pics/a.png", "a installed");
    requireTrue(s.viewport().mode() == lc::ViewMode::Fit, "Fit");
    requireNear(s.viewport().zoom(), 0.5, 1e-12, "fit 0.5");

    lc::StatusInfo st = s.status();
    requireTrue(st.zoomDisplay == "Fit", "status zoom");
    requireTrue(st.dimensions == "1600 x 1200", "status dimensions");
    requireTrue(s.metadata()->fileName == "a.png", "metadata");
    std::printf("  Test 1 (open + update) PASS\n");
  }

  // --- Test 2: navigation resets transform and zoom ---
  {
    lc::FakeDocumentDecoder dec = makeDecoder();
    ListScanner scanner;
    registerFolder(dec, scanner);
    dec.start();
    lc::ViewerSession s(dec, scanner);
    s.setViewportSize(lc::Size{800, 600});
    s.open("/pics/a.png");
    s.update();

    s.handleCommand(lc::ViewerCommand::RotateCW);
    s.setZoom(3.0);
    requireTrue(s.handleCommand(lc::ViewerCommand::NextDocument).ok, "next ok");
    requireTrue(s.status().positionLabel == "2 / 3", "cursor moved immediately");
    requireTrue(s.document()->sourcePath() == "/pics/a.png", "old doc until update");

    s.update();
    requireTrue(s.document()->sourcePath() == "/pics/b.png", "b installed");
    requireTrue(s.transform().state().isIdentity(), "transform reset");
    requireTrue(s.viewport().mode() == lc::ViewMode::Fit, "mode reset to Fit");
    requireNear(s.viewport().zoom(), 2.0, 1e-12, "400x300 fits at 2.0");
    requireNear(s.viewport().panOffset().x, 0, 1e-12, "pan reset");

    s.handleCommand(lc::ViewerCommand::PreviousDocument);
    s.handleCommand(lc::ViewerCommand::PreviousDocument);
    requireTrue(s.status().positionLabel == "1 / 3", "boundary keeps cursor at 1");
    std::printf("  Test 2 (navigation) PASS\n");
  }

  // --- Test 3: rotate updates effective size and render ---
  {
    lc::FakeDocumentDecoder dec = makeDecoder();
    ListScanner scanner;
    registerFolder(dec, scanner);
    dec.start();
    lc::ViewerSession s(dec, scanner);
    s.setViewportSize(lc::Size{800, 600});
    s.open("/pics/a.png");
    s.update();

    const lc::RenderSurface* before = s.renderSurface();
    requireTrue(before && before->width == 1600, "initial surface");

    requireTrue(s.handleCommand(lc::ViewerCommand::RotateCW).ok, "rotate ok");
    requireTrue(s.viewport().contentSize() == lc::Size{1200, 1600}, "content swapped");
    requireNear(s.viewport().zoom(), 0.375, 1e-12, "fit recomputed");
    const lc::RenderSurface* surf = s.renderSurface();
    requireTrue(surf->width == 1200 && surf->height == 1600, "surface rotated");
    requireTrue(surf->rotationDegrees == 90, "rotation in surface");
    requireTrue(s.status().dimensions == "1600 x 1200", "status shows native size");

    requireTrue(s.handleKey(lc::KeyEvent{lc::NamedKey::None, 'r', lc::Modifiers{false, true, false, false}}).ok,
                "shift+r");
    requireTrue(s.transform().state().isIdentity(), "CCW undoes CW");
    std::printf("  Test 3 (rotate) PASS\n");
  }

  // --- Test 4: vector rejects transforms ---
  {
    lc::FakeDocumentDecoder dec = makeDecoder();
    ListScanner scanner;
    registerFolder(dec, scanner);
    dec.start();
    lc::ViewerSession s(dec, scanner);
    s.setViewportSize(lc::Size{800, 600});
    s.open("/pics/c.svg");
    s.update();

    lc::OpResult r = s.handleCommand(lc::ViewerCommand::FlipHorizontal);
    requireTrue(!r.ok, "flip fails");
    requireTrue(r.err.code == lc::ErrorCode::UnsupportedOperation, "UnsupportedOperation");
    requireTrue(s.transform().state().isIdentity(), "state unchanged");
    requireTrue(s.lastError() && s.lastError()->code == lc::ErrorCode::UnsupportedOperation,
                "error reported");
    requireTrue(s.handleCommand(lc::ViewerCommand::ZoomIn).ok, "zoom still works");
    requireTrue(s.renderSurface()->pixels == nullptr, "vector surface has no pixels");
    std::printf("  Test 4 (vector transform rejected) PASS\n");
  }

  // --- Test 5: decode failure keeps document and cursor ---
  {
    lc::FakeDocumentDecoder dec = makeDecoder();
    ListScanner scanner;
    registerFolder(dec, scanner);
    dec.registerFailure("/pics/b.png", "truncated file");
    dec.start();
    lc::ViewerSession s(dec, scanner);
    s.setViewportSize(lc::Size{800, 600});
    s.open("/pics/a.png");
    s.update();
    s.setZoom(2.0);

    s.handleCommand(lc::ViewerCommand::NextDocument);
    lc::FrameResult fr = s.update();
    requireTrue(fr.decodeFailed, "decode failed");
    requireTrue(s.document()->sourcePath() == "/pics/a.png", "previous document kept");
    requireTrue(s.navigation().cursor() == 0, "cursor restored");
    requireTrue(s.lastError() && s.lastError()->code == lc::ErrorCode::DecodeError, "DecodeError");
    requireNear(s.viewport().zoom(), 2.0, 1e-12, "viewport untouched");
    s.clearError();
    requireTrue(!s.lastError(), "error cleared");
    std::printf("  Test 5 (decode failure) PASS\n");
  }

  // --- Test 6: stale results are discarded ---
  {
    ManualDecoder dec;
    ListScanner scanner;
    scanner.folders["/pics"] = {"/pics/a.png", "/pics/b.png", "/pics/c.png"};
    dec.start();
    lc::ViewerSession s(dec, scanner);
    s.setViewportSize(lc::Size{800, 600});

    s.open("/pics/a.png");
    s.handleCommand(lc::ViewerCommand::NextDocument);
    s.handleCommand(lc::ViewerCommand::NextDocument);
    requireTrue(dec.requests.size() == 3, "three requests");
    requireTrue(dec.cancelled.size() == 2, "two supersessions cancelled");
    requireTrue(dec.cancelled[0] == dec.requests[0].generation, "cancel gen 1");
    requireTrue(s.pendingGeneration() == dec.requests[2].generation, "pending is latest");

    dec.deliver(dec.requests[1], 100, 100);
    dec.deliver(dec.requests[0], 100, 100);
    lc::FrameResult fr = s.update();
    requireTrue(fr.staleDiscarded == 2, "both stale");
    requireTrue(!s.hasDocument(), "nothing installed");
    requireTrue(s.isLoading(), "still loading latest");

    dec.deliver(dec.requests[2], 300, 200);
    fr = s.update();
    requireTrue(fr.documentChanged, "latest installed");
    requireTrue(s.document()->sourcePath() == "/pics/c.png", "c resident");

    dec.deliver(dec.requests[1], 100, 100);
    fr = s.update();
    requireTrue(fr.staleDiscarded == 1 && !fr.documentChanged, "late result ignored");
    requireTrue(s.document()->sourcePath() == "/pics/c.png", "c still resident");
    std::printf("  Test 6 (stale generations) PASS\n");
  }

  // --- Test 7: no document, tool modes, panel settings ---
  {
    lc::FakeDocumentDecoder dec = makeDecoder();
    ListScanner scanner;
    lc::MemorySettingsStore store;
    dec.start();
    lc::ViewerSession s(dec, scanner, &store);

    requireTrue(s.handleCommand(lc::ViewerCommand::ZoomIn).err.code == lc::ErrorCode::NoDocument,
                "zoom needs a document");
    requireTrue(s.handleCommand(lc::ViewerCommand::NextDocument).err.code == lc::ErrorCode::NoDocument,
                "navigation with empty folder");
    requireTrue(!s.handlePointer(lc::PointerEvent{}), "pointer ignored");
    requireTrue(s.status().zoomDisplay.empty() && s.status().positionLabel.empty(), "empty status");
    requireTrue(s.renderSurface() == nullptr, "no surface");

    s.handleCommand(lc::ViewerCommand::ToggleCropMode);
    requireTrue(s.toolMode() == lc::ToolMode::Crop, "crop on");
    s.handleCommand(lc::ViewerCommand::ToggleScaleMode);
    requireTrue(s.toolMode() == lc::ToolMode::Scale, "scale replaces crop");
    s.handleCommand(lc::ViewerCommand::ToggleScaleMode);
    requireTrue(s.toolMode() == lc::ToolMode::None, "scale off");

    s.handleCommand(lc::ViewerCommand::ToggleNavBar);
    requireTrue(s.settings().navBarVisible, "nav bar shown");
    requireTrue(store.saveCount() == 1, "saved on change");
    s.handleCommand(lc::ViewerCommand::ToggleContextDrawer);
    requireTrue(store.saveCount() == 2, "saved again");

    lc::ViewerSession s2(dec, scanner, &store);
    requireTrue(s2.loadSettings(), "settings loaded");
    requireTrue(s2.settings().navBarVisible && s2.settings().contextDrawerVisible, "restored");
    std::printf("  Test 7 (no document + settings) PASS\n");
  }

  // --- Test 8: openDirectory and unsupported open ---
  {
    lc::FakeDocumentDecoder dec = makeDecoder();
    ListScanner scanner;
    registerFolder(dec, scanner);
    scanner.folders["/empty"] = {};
    dec.start();
    lc::ViewerSession s(dec, scanner);
    s.setViewportSize(lc::Size{800, 600});

    requireTrue(s.open("/pics/notes.txt").err.code == lc::ErrorCode::DecodeError, "txt rejected");
    requireTrue(s.openDirectory("/missing").err.code == lc::ErrorCode::InvalidConfiguration,
                "unreadable folder");
    requireTrue(s.openDirectory("/empty").err.code == lc::ErrorCode::NoDocument, "empty folder");
    requireTrue(s.openDirectory("/pics").ok, "folder ok");
    s.update();
    requireTrue(s.document()->sourcePath() == "/pics/a.png", "first document");
    requireTrue(!s.setViewportSize(lc::Size{0, 0}), "zero viewport rejected");
    std::printf("  Test 8 (openDirectory) PASS\n");
  }

  // --- Test 9: drag stays continuous across setZoom, rotate and resize ---
  {
    lc::FakeDocumentDecoder dec = makeDecoder();
    ListScanner scanner;
    registerFolder(dec, scanner);
    dec.start();
    lc::ViewerSession s(dec, scanner);
    s.setViewportSize(lc::Size{800, 600});
    s.open("/pics/a.png");
    s.update();
    requireTrue(s.setZoom(1.0).ok, "setZoom 1");

    lc::PointerEvent ev;
    ev.kind = lc::PointerKind::DragStart;
    ev.x = 400;
    ev.y = 300;
    s.handlePointer(ev);
    ev.kind = lc::PointerKind::DragMove;
    ev.x = 300;
    s.handlePointer(ev);
    requireNear(s.viewport().panOffset().x, 100, 1e-9, "dragged 100");

    requireTrue(s.setZoom(4.0).ok, "setZoom 4 mid-drag");
    ev.x = 299;
    s.handlePointer(ev);
    requireNear(s.viewport().panOffset().x, 100.25, 1e-9, "no jump after setZoom");

    requireTrue(s.handleCommand(lc::ViewerCommand::RotateCW).ok, "rotate mid-drag");
    requireNear(s.viewport().panOffset().x, 100.25, 1e-9, "pan inside new limits");
    ev.x = 295;
    s.handlePointer(ev);
    requireNear(s.viewport().panOffset().x, 101.25, 1e-9, "no jump after rotate");

    requireTrue(s.setViewportSize(lc::Size{400, 600}), "resize mid-drag");
    ev.x = 291;
    s.handlePointer(ev);
    requireNear(s.viewport().panOffset().x, 102.25, 1e-9, "no jump after resize");
    std::printf("  Test 9 (drag across external changes) PASS\n");
  }

  // --- Test 10: relative and unnormalized paths keep the folder ---
  {
    lc::FakeDocumentDecoder dec = makeDecoder();
    ListScanner scanner;
    registerFolder(dec, scanner);
    dec.registerRaster("./a.png", 40, 30);
    dec.registerRaster("./b.png", 40, 30);
    dec.registerRaster("./c.png", 40, 30);
    scanner.folders["."] = {"./a.png", "./b.png", "./c.png"};
    dec.start();
    lc::ViewerSession s(dec, scanner);
    s.setViewportSize(lc::Size{800, 600});

    requireTrue(s.open("b.png").ok, "bare filename ok");
    requireTrue(s.navigation().size() == 3, "whole folder listed");
    requireTrue(s.status().positionLabel == "2 / 3", "cursor on b");
    requireTrue(s.pendingPath() == "./b.png", "scanner spelling requested");
    s.update();
    requireTrue(s.document()->sourcePath() == "./b.png", "b installed");
    requireTrue(s.handleCommand(lc::ViewerCommand::NextDocument).ok, "next");
    requireTrue(s.pendingPath() == "./c.png", "moved to c");

    requireTrue(s.open("/pics/./b.png").ok, "unnormalized absolute ok");
    requireTrue(s.status().positionLabel == "2 / 3", "cursor on /pics/b.png");
    requireTrue(s.pendingPath() == "/pics/b.png", "normalized entry requested");

    requireTrue(s.open("/elsewhere/z.png").ok, "unlisted folder ok");
    requireTrue(s.status().positionLabel == "1 / 1", "falls back to the file alone");
    std::printf("  Test 10 (relative paths) PASS\n");
  }

  std::printf("D6.2 session: ALL PASS\n");
  return 0;
}
