#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace lc {

enum class NavStatus : std::uint8_t { Moved = 0, AtBoundary, Empty };

inline const char* toString(NavStatus s) {
  switch (s) {
    case NavStatus::Moved: return "moved";
    case NavStatus::AtBoundary: return "atBoundary";
    case NavStatus::Empty: return "empty";
    default: return "unknown";
  }
}

struct NavResult {
  NavStatus status{NavStatus::Empty};
  std::string path;  // set when Moved
};

struct NavigationConfig {
  bool wrapAround{false};
};

// 1-based position for display.
struct NavPosition {
  std::size_t current{0};
  std::size_t total{0};
};

// Ordered document paths of the current folder plus a cursor.
// When non-empty the cursor is always in [0, size() - 1].
class NavigationIndex {
public:
  void setConfig(const NavigationConfig& cfg) { config_ = cfg; }
  const NavigationConfig& config() const { return config_; }

  // Replaces the list. The cursor lands on `current` if present, else 0.
  void rebuild(std::vector<std::string> paths, const std::string& current = {});

  NavResult next();
  NavResult previous();

  bool setCursor(std::size_t i);
  std::optional<std::size_t> indexOf(const std::string& path) const;

  NavPosition position() const;
  std::string positionLabel() const;  // "3 / 10", empty when no documents

  bool empty() const { return paths_.empty(); }
  std::size_t size() const { return paths_.size(); }
  std::size_t cursor() const { return cursor_; }
  const std::string* currentPath() const;
  const std::vector<std::string>& paths() const { return paths_; }

private:
  NavResult moveTo(std::size_t i);

  NavigationConfig config_;
  std::vector<std::string> paths_;
  std::size_t cursor_{0};
};

} // namespace lc
