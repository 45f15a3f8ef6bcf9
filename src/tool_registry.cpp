#include "tool_registry.hpp"
#include "navigator.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <optional>
#include <unistd.h>

const char* param_type_name(ParamType t) {
  switch (t) {
    case ParamType::String: return "string";
    case ParamType::Integer: return "integer";
    case ParamType::Boolean: return "boolean";
  }
  return "string";
}

bool parse_int_arg(const std::string& s, long& out) {
  if (s.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long v = std::strtol(s.c_str(), &end, 10);
  if (errno == ERANGE || end == s.c_str() || *end != '\0') return false;
  if (std::isspace(static_cast<unsigned char>(s[0]))) return false;
  out = v;
  return true;
}

bool parse_bool_arg(const std::string& s, bool& out) {
  std::string v = s;
  for (auto& c : v) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (v == "true" || v == "1" || v == "yes") { out = true; return true; }
  if (v == "false" || v == "0" || v == "no") { out = false; return true; }
  return false;
}

void ToolRegistry::register_tool(ToolDescriptor desc, Handler h) {
  std::string name = desc.name;
  if (map_.find(name) == map_.end()) order_.push_back(name);
  map_[name] = Entry{std::move(desc), std::move(h)};
}

NavResult ToolRegistry::call(const std::string& name, const ToolArgs& args) const {
  auto it = map_.find(name);
  if (it == map_.end()) return NavResult::failure(ResultKind::UnknownTool, "Unknown tool: " + name);
  const Entry& e = it->second;

  for (const auto& p : e.desc.params) {
    auto a = args.find(p.name);
    if (a == args.end()) {
      if (p.required) return NavResult::failure(ResultKind::InvalidArgument, "Missing required argument: " + p.name);
      continue;
    }
    long n = 0;
    bool b = false;
    if (p.type == ParamType::Integer && !parse_int_arg(a->second, n))
      return NavResult::failure(ResultKind::InvalidArgument, "Argument " + p.name + " must be an integer: " + a->second);
    if (p.type == ParamType::Boolean && !parse_bool_arg(a->second, b))
      return NavResult::failure(ResultKind::InvalidArgument, "Argument " + p.name + " must be a boolean: " + a->second);
  }

  auto f = args.find("filename");
  if (f != args.end()) {
    if (f->second.empty() || ::access(f->second.c_str(), R_OK) != 0)
      return NavResult::failure(ResultKind::InvalidArgument, "File not found: " + f->second);
  }
  return e.handler(args);
}

std::vector<ToolDescriptor> ToolRegistry::list() const {
  std::vector<ToolDescriptor> out;
  out.reserve(order_.size());
  for (const auto& n : order_) out.push_back(map_.at(n).desc);
  return out;
}

std::string ToolRegistry::describe() const {
  std::string out;
  for (const auto& n : order_) {
    const ToolDescriptor& d = map_.at(n).desc;
    if (!out.empty()) out += "\n";
    out += d.name + " - " + d.description;
    for (const auto& p : d.params) {
      out += "\n  " + p.name + " (" + param_type_name(p.type);
      if (p.required) out += ", required";
      else if (!p.default_value.empty()) out += ", default " + p.default_value;
      out += "): " + p.description;
    }
  }
  return out;
}

void register_navigator_tools(ToolRegistry& registry, Navigator& nav) {
  const ToolParam file_param{"filename", ParamType::String, true, "Path to the file", ""};
  const std::string default_height = std::to_string(nav.store().default_page_size());

  registry.register_tool(
    {"go_to_line", "Navigate to a specific line number in the file",
     {{"filename", ParamType::String, true, "Path to the file to navigate", ""},
      {"line", ParamType::Integer, true, "Line number to navigate to (1-based)", ""},
      {"screen_height", ParamType::Integer, false, "Number of lines to display", default_height}}},
    [&nav](const ToolArgs& args) {
      long line = 1;
      if (!parse_int_arg(args.at("line"), line))
        return NavResult::failure(ResultKind::InvalidArgument, "Argument line must be an integer");
      std::optional<int> height;
      auto h = args.find("screen_height");
      if (h != args.end()) {
        long v = 0;
        if (!parse_int_arg(h->second, v) || v < 1 || v > 100000)
          return NavResult::failure(ResultKind::InvalidArgument, "Argument screen_height must be in 1..100000: " + h->second);
        height = static_cast<int>(v);
      }
      return nav.go_to_line(args.at("filename"), line, height);
    });

  registry.register_tool(
    {"find", "Search for a string or regex pattern in the file",
     {{"filename", ParamType::String, true, "Path to the file to search", ""},
      {"pattern", ParamType::String, true, "String or regex pattern to search for", ""},
      {"is_regex", ParamType::Boolean, false, "Whether to treat pattern as regex", "false"}}},
    [&nav](const ToolArgs& args) {
      bool is_regex = false;
      auto r = args.find("is_regex");
      if (r != args.end() && !parse_bool_arg(r->second, is_regex))
        return NavResult::failure(ResultKind::InvalidArgument, "Argument is_regex must be a boolean");
      return nav.find(args.at("filename"), args.at("pattern"), is_regex);
    });

  registry.register_tool({"next_match", "Navigate to the next search match", {file_param}},
                         [&nav](const ToolArgs& args) { return nav.next_match(args.at("filename")); });
  registry.register_tool({"prev_match", "Navigate to the previous search match", {file_param}},
                         [&nav](const ToolArgs& args) { return nav.prev_match(args.at("filename")); });
  registry.register_tool({"page_up", "Move up one screen height", {file_param}},
                         [&nav](const ToolArgs& args) { return nav.page_up(args.at("filename")); });
  registry.register_tool({"page_down", "Move down one screen height", {file_param}},
                         [&nav](const ToolArgs& args) { return nav.page_down(args.at("filename")); });
}
