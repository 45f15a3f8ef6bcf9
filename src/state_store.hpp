#pragma once
/*
 * StateStore
 *
 * Purpose: path -> NavigatorState table, one entry per distinct path string.
 * Note: entries are created on first reference and never evicted; the owner
 *       (a session) decides the lifetime of the whole table.
 */
#include <cstddef>
#include <string>
#include <unordered_map>
#include "types.hpp"
#include "config.hpp"

class StateStore {
public:
  explicit StateStore(int default_page_size = FNAV_DEFAULT_PAGE_SIZE)
    : default_page_size_(default_page_size < 1 ? FNAV_DEFAULT_PAGE_SIZE : default_page_size) {}

  NavigatorState& get_or_create(const std::string& path);
  const NavigatorState* find(const std::string& path) const;
  bool contains(const std::string& path) const { return map_.count(path) != 0; }
  size_t size() const { return map_.size(); }
  int default_page_size() const { return default_page_size_; }

private:
  int default_page_size_;
  std::unordered_map<std::string, NavigatorState> map_;
};
