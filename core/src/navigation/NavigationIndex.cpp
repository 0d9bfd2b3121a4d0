#include "lc/navigation/NavigationIndex.hpp"

#include <algorithm>

namespace lc {

void NavigationIndex::rebuild(std::vector<std::string> paths, const std::string& current) {
  paths_ = std::move(paths);
  cursor_ = 0;
  if (!current.empty()) {
    if (auto i = indexOf(current)) cursor_ = *i;
  }
}

NavResult NavigationIndex::next() {
  if (paths_.empty()) return NavResult{NavStatus::Empty, {}};
  if (cursor_ + 1 < paths_.size()) return moveTo(cursor_ + 1);
  if (config_.wrapAround && paths_.size() > 1) return moveTo(0);
  return NavResult{NavStatus::AtBoundary, {}};
}

NavResult NavigationIndex::previous() {
  if (paths_.empty()) return NavResult{NavStatus::Empty, {}};
  if (cursor_ > 0) return moveTo(cursor_ - 1);
  if (config_.wrapAround && paths_.size() > 1) return moveTo(paths_.size() - 1);
  return NavResult{NavStatus::AtBoundary, {}};
}

bool NavigationIndex::setCursor(std::size_t i) {
  if (i >= paths_.size()) return false;
  cursor_ = i;
  return true;
}

std::optional<std::size_t> NavigationIndex::indexOf(const std::string& path) const {
  auto it = std::find(paths_.begin(), paths_.end(), path);
  if (it == paths_.end()) return std::nullopt;
  return static_cast<std::size_t>(it - paths_.begin());
}

NavPosition NavigationIndex::position() const {
  if (paths_.empty()) return NavPosition{};
  return NavPosition{cursor_ + 1, paths_.size()};
}

std::string NavigationIndex::positionLabel() const {
  if (paths_.empty()) return {};
  NavPosition p = position();
  return std::to_string(p.current) + " / " + std::to_string(p.total);
}

const std::string* NavigationIndex::currentPath() const {
  if (paths_.empty()) return nullptr;
  return &paths_[cursor_];
}

NavResult NavigationIndex::moveTo(std::size_t i) {
  cursor_ = i;
  return NavResult{NavStatus::Moved, paths_[i]};
}

} // namespace lc
