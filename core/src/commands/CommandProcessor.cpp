#include "lc/commands/CommandProcessor.hpp"

#include "lc/session/ViewerSession.hpp"
#include "lc/viewport/KeyMap.hpp"

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <string>

namespace lc {

CommandProcessor::CommandProcessor(ViewerSession& session)
  : session_(session) {}

CmdResult CommandProcessor::fail(const std::string& code, const std::string& message) {
  CmdResult r;
  r.ok = false;
  r.err.code = code;
  r.err.message = message;
  return r;
}

CmdResult CommandProcessor::fromOp(const OpResult& r) {
  if (r.ok) return CmdResult{};
  return fail(toString(r.err.code), r.err.message);
}

const rapidjson::Value* CommandProcessor::getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd()) return nullptr;
  return &it->value;
}

bool CommandProcessor::getNumber(const rapidjson::Value& obj, const char* key, double& out) {
  const auto* v = getMember(obj, key);
  if (!v || !v->IsNumber()) return false;
  out = v->GetDouble();
  return true;
}

CmdResult CommandProcessor::applyJsonText(const std::string& jsonText) {
  rapidjson::Document d;
  d.Parse(jsonText.c_str());

  if (d.HasParseError() || !d.IsObject()) {
    return fail("BAD_COMMAND", "CommandProcessor: invalid JSON object");
  }

  return applyJson(d);
}

CmdResult CommandProcessor::applyJson(const rapidjson::Value& obj) {
  const auto* cmdV = getMember(obj, "cmd");
  if (!cmdV || !cmdV->IsString()) {
    return fail("BAD_COMMAND", "Missing string field: cmd");
  }

  const std::string cmd = cmdV->GetString();

  if (cmd == "open") return cmdOpen(obj);
  if (cmd == "openDirectory") return cmdOpenDirectory(obj);
  if (cmd == "resize") return cmdResize(obj);
  if (cmd == "setZoom") return cmdSetZoom(obj);
  if (cmd == "wheel" || cmd == "dragStart" || cmd == "dragMove" || cmd == "dragEnd")
    return cmdPointer(obj, cmd);
  if (cmd == "key") return cmdKey(obj);
  if (cmd == "status") return CmdResult{};

  if (auto vc = commandFromString(cmd)) {
    return fromOp(session_.handleCommand(*vc));
  }

  return fail("UNKNOWN_COMMAND", "Unknown cmd: " + cmd);
}

// -------------------- handlers --------------------

CmdResult CommandProcessor::cmdOpen(const rapidjson::Value& obj) {
  const auto* p = getMember(obj, "path");
  if (!p || !p->IsString() || p->GetStringLength() == 0) {
    return fail("BAD_COMMAND", "open: missing string field: path");
  }
  return fromOp(session_.open(p->GetString()));
}

CmdResult CommandProcessor::cmdOpenDirectory(const rapidjson::Value& obj) {
  const auto* p = getMember(obj, "path");
  if (!p || !p->IsString() || p->GetStringLength() == 0) {
    return fail("BAD_COMMAND", "openDirectory: missing string field: path");
  }
  return fromOp(session_.openDirectory(p->GetString()));
}

CmdResult CommandProcessor::cmdResize(const rapidjson::Value& obj) {
  double w = 0, h = 0;
  if (!getNumber(obj, "width", w) || !getNumber(obj, "height", h)) {
    return fail("BAD_COMMAND", "resize: width and height required");
  }
  if (!session_.setViewportSize(Size{w, h})) {
    return fail("INVALID_CONFIGURATION", "resize: viewport size must be positive");
  }
  return CmdResult{};
}

CmdResult CommandProcessor::cmdSetZoom(const rapidjson::Value& obj) {
  double f = 0;
  if (!getNumber(obj, "factor", f)) {
    return fail("BAD_COMMAND", "setZoom: missing number field: factor");
  }
  return fromOp(session_.setZoom(f));
}

CmdResult CommandProcessor::cmdPointer(const rapidjson::Value& obj, const std::string& cmd) {
  PointerEvent ev;
  if (cmd == "wheel") ev.kind = PointerKind::Wheel;
  else if (cmd == "dragStart") ev.kind = PointerKind::DragStart;
  else if (cmd == "dragMove") ev.kind = PointerKind::DragMove;
  else ev.kind = PointerKind::DragEnd;

  if (ev.kind != PointerKind::DragEnd) {
    if (!getNumber(obj, "x", ev.x) || !getNumber(obj, "y", ev.y)) {
      return fail("BAD_COMMAND", cmd + ": x and y required");
    }
  }
  if (ev.kind == PointerKind::Wheel && !getNumber(obj, "amount", ev.amount)) {
    return fail("BAD_COMMAND", "wheel: missing number field: amount");
  }

  if (!session_.hasDocument()) return fail("NO_DOCUMENT", cmd + ": no document");
  session_.handlePointer(ev);
  return CmdResult{};
}

CmdResult CommandProcessor::cmdKey(const rapidjson::Value& obj) {
  const auto* k = getMember(obj, "key");
  if (!k || !k->IsString()) {
    return fail("BAD_COMMAND", "key: missing string field: key");
  }
  KeyEvent ev;
  if (!parseKeyChord(k->GetString(), ev)) {
    return fail("BAD_COMMAND", std::string("key: cannot parse '") + k->GetString() + "'");
  }
  return fromOp(session_.handleKey(ev));
}

// -------------------- output --------------------

std::string CommandProcessor::statusJson() const {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);

  StatusInfo st = session_.status();
  const ViewportState& vp = session_.viewport();
  const TransformState& t = session_.transform().state();

  w.StartObject();
  w.Key("zoomDisplay"); w.String(st.zoomDisplay.c_str());
  w.Key("positionLabel"); w.String(st.positionLabel.c_str());
  w.Key("dimensions"); w.String(st.dimensions.c_str());
  w.Key("mode"); w.String(toString(vp.mode()));
  w.Key("zoom"); w.Double(vp.zoom());
  w.Key("panX"); w.Double(vp.panOffset().x);
  w.Key("panY"); w.Double(vp.panOffset().y);
  w.Key("rotation"); w.Int(toDegrees(t.rotation));
  w.Key("flipH"); w.Bool(t.flipHorizontal);
  w.Key("flipV"); w.Bool(t.flipVertical);
  w.Key("tool"); w.String(toString(session_.toolMode()));
  w.Key("loading"); w.Bool(session_.isLoading());
  w.Key("document");
  if (const Document* d = session_.document()) {
    w.String(d->sourcePath().c_str());
  } else {
    w.Null();
  }
  w.Key("error");
  if (const auto& e = session_.lastError()) {
    w.String(toString(e->code));
  } else {
    w.Null();
  }
  w.EndObject();
  return sb.GetString();
}

std::string CommandProcessor::resultJson(const CmdResult& r) {
  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> w(sb);
  w.StartObject();
  w.Key("ok"); w.Bool(r.ok);
  if (!r.ok) {
    w.Key("code"); w.String(r.err.code.c_str());
    w.Key("message"); w.String(r.err.message.c_str());
  }
  w.EndObject();
  return sb.GetString();
}

} // namespace lc
