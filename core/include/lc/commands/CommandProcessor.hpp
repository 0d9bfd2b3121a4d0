#pragma once
#include "lc/core/Result.hpp"

#include <string>

#include <rapidjson/document.h>

namespace lc {

class ViewerSession;

struct CmdError {
  std::string code;     // e.g. "BAD_COMMAND", "UNSUPPORTED_OPERATION"
  std::string message;  // human text
};

struct CmdResult {
  bool ok{true};
  CmdError err{};
};

// JSON front end for a ViewerSession. One object per command:
//   {"cmd":"open","path":"/photos/a.png"}
//   {"cmd":"resize","width":800,"height":600}
//   {"cmd":"wheel","x":400,"y":300,"amount":1}
//   {"cmd":"key","key":"ctrl+left"}
//   {"cmd":"rotateCW"}
class CommandProcessor {
public:
  explicit CommandProcessor(ViewerSession& session);

  // Apply a single JSON command object.
  CmdResult applyJson(const rapidjson::Value& obj);

  // Convenience: parse string then apply.
  CmdResult applyJsonText(const std::string& jsonText);

  // Status line, mode, zoom, pan, transform and the active document.
  std::string statusJson() const;

  // {"ok":true} or {"ok":false,"code":...,"message":...}
  static std::string resultJson(const CmdResult& r);

private:
  ViewerSession& session_;

  // ---- handlers ----
  CmdResult cmdOpen(const rapidjson::Value& obj);
  CmdResult cmdOpenDirectory(const rapidjson::Value& obj);
  CmdResult cmdResize(const rapidjson::Value& obj);
  CmdResult cmdSetZoom(const rapidjson::Value& obj);
  CmdResult cmdPointer(const rapidjson::Value& obj, const std::string& cmd);
  CmdResult cmdKey(const rapidjson::Value& obj);

  // helpers
  static const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);
  static bool getNumber(const rapidjson::Value& obj, const char* key, double& out);
  static CmdResult fail(const std::string& code, const std::string& message);
  static CmdResult fromOp(const OpResult& r);
};

} // namespace lc
