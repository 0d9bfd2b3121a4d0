#include "lc/settings/ViewerSettings.hpp"

#include <rapidjson/document.h>
#include <rapidjson/writer.h>
#include <rapidjson/stringbuffer.h>

#include <cstdio>

namespace lc {

std::string serializeViewerSettings(const ViewerSettings& s) {
  rapidjson::Document doc(rapidjson::kObjectType);
  auto& alloc = doc.GetAllocator();

  doc.AddMember("version", s.version, alloc);
  doc.AddMember("defaultDirectory",
                rapidjson::Value(s.defaultDirectory.c_str(), alloc), alloc);
  doc.AddMember("navBarVisible", s.navBarVisible, alloc);
  doc.AddMember("contextDrawerVisible", s.contextDrawerVisible, alloc);

  rapidjson::StringBuffer sb;
  rapidjson::Writer<rapidjson::StringBuffer> writer(sb);
  doc.Accept(writer);
  return sb.GetString();
}

bool deserializeViewerSettings(const std::string& json, ViewerSettings& out) {
  rapidjson::Document doc;
  doc.Parse(json.c_str());
  if (doc.HasParseError() || !doc.IsObject()) return false;

  ViewerSettings s = out;
  if (doc.HasMember("version")) {
    if (!doc["version"].IsInt()) return false;
    s.version = doc["version"].GetInt();
  }
  if (doc.HasMember("defaultDirectory") && doc["defaultDirectory"].IsString())
    s.defaultDirectory = doc["defaultDirectory"].GetString();
  if (doc.HasMember("navBarVisible") && doc["navBarVisible"].IsBool())
    s.navBarVisible = doc["navBarVisible"].GetBool();
  if (doc.HasMember("contextDrawerVisible") && doc["contextDrawerVisible"].IsBool())
    s.contextDrawerVisible = doc["contextDrawerVisible"].GetBool();

  out = s;
  return true;
}

// ---- MemorySettingsStore ----

bool MemorySettingsStore::load(ViewerSettings& out) {
  if (json_.empty()) return false;
  return deserializeViewerSettings(json_, out);
}

bool MemorySettingsStore::save(const ViewerSettings& s) {
  json_ = serializeViewerSettings(s);
  saveCount_++;
  return true;
}

// ---- JsonFileSettingsStore ----

bool JsonFileSettingsStore::load(ViewerSettings& out) {
  std::FILE* f = std::fopen(path_.c_str(), "rb");
  if (!f) return false;

  std::string json;
  char buf[4096];
  std::size_t n;
  while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0) json.append(buf, n);
  bool readError = std::ferror(f) != 0;
  std::fclose(f);

  if (readError) {
    std::fprintf(stderr, "JsonFileSettingsStore::load: read error on '%s'\n", path_.c_str());
    return false;
  }
  if (!deserializeViewerSettings(json, out)) {
    std::fprintf(stderr, "JsonFileSettingsStore::load: invalid settings in '%s'\n",
                 path_.c_str());
    return false;
  }
  return true;
}

bool JsonFileSettingsStore::save(const ViewerSettings& s) {
  std::string json = serializeViewerSettings(s);
  std::FILE* f = std::fopen(path_.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "JsonFileSettingsStore::save: cannot open '%s'\n", path_.c_str());
    return false;
  }
  bool ok = std::fwrite(json.data(), 1, json.size(), f) == json.size();
  ok = (std::fclose(f) == 0) && ok;
  if (!ok) {
    std::fprintf(stderr, "JsonFileSettingsStore::save: write failed on '%s'\n", path_.c_str());
  }
  return ok;
}

} // namespace lc
