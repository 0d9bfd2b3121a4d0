#pragma once
#include <string>
#include <utility>

namespace lc {

// User preferences persisted between runs.
struct ViewerSettings {
  int version{1};
  std::string defaultDirectory;  // empty = none
  bool navBarVisible{false};
  bool contextDrawerVisible{false};
};

inline bool operator==(const ViewerSettings& a, const ViewerSettings& b) {
  return a.version == b.version && a.defaultDirectory == b.defaultDirectory &&
         a.navBarVisible == b.navBarVisible &&
         a.contextDrawerVisible == b.contextDrawerVisible;
}
inline bool operator!=(const ViewerSettings& a, const ViewerSettings& b) { return !(a == b); }

// Serialize ViewerSettings to a JSON string.
std::string serializeViewerSettings(const ViewerSettings& s);

// Deserialize a JSON string into ViewerSettings. Missing fields keep the
// value already in `out`. Returns false on error.
bool deserializeViewerSettings(const std::string& json, ViewerSettings& out);

// Persistence back-end. Read once at startup, written on every change.
class SettingsStore {
public:
  virtual ~SettingsStore() = default;
  // Returns false if nothing could be loaded; `out` is left untouched.
  virtual bool load(ViewerSettings& out) = 0;
  virtual bool save(const ViewerSettings& s) = 0;
};

// Keeps the serialized JSON in memory.
class MemorySettingsStore : public SettingsStore {
public:
  bool load(ViewerSettings& out) override;
  bool save(const ViewerSettings& s) override;

  const std::string& json() const { return json_; }
  int saveCount() const { return saveCount_; }

private:
  std::string json_;
  int saveCount_{0};
};

// One JSON file on disk.
class JsonFileSettingsStore : public SettingsStore {
public:
  explicit JsonFileSettingsStore(std::string path) : path_(std::move(path)) {}

  bool load(ViewerSettings& out) override;
  bool save(const ViewerSettings& s) override;

  const std::string& path() const { return path_; }

private:
  std::string path_;
};

} // namespace lc
