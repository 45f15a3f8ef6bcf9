#include "state_store.hpp"

NavigatorState& StateStore::get_or_create(const std::string& path) {
  auto it = map_.find(path);
  if (it != map_.end()) return it->second;
  NavigatorState st;
  st.page_size = default_page_size_;
  return map_.emplace(path, std::move(st)).first->second;
}

const NavigatorState* StateStore::find(const std::string& path) const {
  auto it = map_.find(path);
  return it == map_.end() ? nullptr : &it->second;
}
