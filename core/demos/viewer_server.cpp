// Line-oriented host for the Lucent viewer core.
// Protocol:
//   stdin:  newline-delimited JSON commands ({"cmd":"open","path":...}, ...)
//   stdout: one JSON line per input line: {"result":{...},"status":{...}}
//
// Usage: viewer_server [settings.json] [file-or-folder]

#include "lc/commands/CommandProcessor.hpp"
#include "lc/decode/FakeDocumentDecoder.hpp"
#include "lc/navigation/FolderScanner.hpp"
#include "lc/session/ViewerSession.hpp"
#include "lc/settings/ViewerSettings.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

static bool readLine(std::string& line) {
  line.clear();
  int c;
  while ((c = std::fgetc(stdin)) != EOF && c != '\n') {
    line += static_cast<char>(c);
  }
  return !(c == EOF && line.empty());
}

// Pump decode results until the pending request lands or `timeoutMs` passes.
static void settle(lc::ViewerSession& session, int timeoutMs) {
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
  session.update();
  while (session.isLoading() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    session.update();
  }
}

static void writeLine(const lc::CmdResult& r, const lc::CommandProcessor& cp) {
  std::string out = "{\"result\":" + lc::CommandProcessor::resultJson(r) +
                    ",\"status\":" + cp.statusJson() + "}\n";
  std::fwrite(out.data(), 1, out.size(), stdout);
  std::fflush(stdout);
}

int main(int argc, char** argv) {
  std::string settingsPath = argc > 1 ? argv[1] : "lucent_settings.json";
  std::string startPath = argc > 2 ? argv[2] : "";

  lc::FakeDecoderConfig decCfg;
  decCfg.threaded = true;
  decCfg.defaultWidth = 1600;
  decCfg.defaultHeight = 1200;
  lc::FakeDocumentDecoder decoder(decCfg);
  lc::DirectoryScanner scanner;
  lc::JsonFileSettingsStore store(settingsPath);

  lc::ViewerSession session(decoder, scanner, &store);
  session.setConfig(lc::ViewerSessionConfig{});
  session.loadSettings();
  session.setViewportSize(lc::Size{800, 600});

  decoder.start();

  if (startPath.empty()) startPath = session.settings().defaultDirectory;
  if (!startPath.empty()) {
    std::error_code ec;
    lc::OpResult r = std::filesystem::is_directory(startPath, ec)
                         ? session.openDirectory(startPath)
                         : session.open(startPath);
    if (!r.ok) {
      std::fprintf(stderr, "viewer_server: %s: %s\n", lc::toString(r.err.code),
                   r.err.message.c_str());
    }
    settle(session, 2000);
  }

  lc::CommandProcessor cp(session);
  std::string line;
  while (readLine(line)) {
    if (line.empty()) continue;
    lc::CmdResult r = cp.applyJsonText(line);
    settle(session, 2000);
    writeLine(r, cp);
  }

  decoder.stop();
  return 0;
}
