#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch the pager's ':' commands.
 * Design: name -> (usage, handler); "set <opt>" is registered as one name.
 *         A handler returns the text for the status row (empty clears it).
 */
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<std::string(const std::vector<std::string>&)>;

  void register_command(const std::string& name, std::string usage, Handler h) {
    map_[name] = Entry{std::move(usage), std::move(h)};
  }

  // nullopt when no command of that name exists
  std::optional<std::string> execute(const std::string& name, const std::vector<std::string>& args) const {
    auto it = map_.find(name);
    if (it == map_.end()) return std::nullopt;
    return it->second.handler(args);
  }

  // ":name usage" for every command, in name order
  std::string help() const {
    std::string out;
    for (const auto& [name, e] : map_) {
      if (!out.empty()) out += "  ";
      out += ":" + name;
      if (!e.usage.empty()) out += " " + e.usage;
    }
    return out;
  }

private:
  struct Entry {
    std::string usage;
    Handler handler;
  };
  std::map<std::string, Entry> map_;
};
