#pragma once
/*
 * ToolRegistry
 *
 * Purpose: register and dispatch navigator tools by name.
 * Design: name -> (descriptor, handler); arguments arrive as string pairs and
 *         are validated against the descriptor before the handler runs.
 */
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include "types.hpp"

class Navigator;

using ToolArgs = std::unordered_map<std::string, std::string>;

enum class ParamType { String, Integer, Boolean };

struct ToolParam {
  std::string name;
  ParamType type = ParamType::String;
  bool required = false;
  std::string description;
  std::string default_value;
};

struct ToolDescriptor {
  std::string name;
  std::string description;
  std::vector<ToolParam> params;
};

class ToolRegistry {
public:
  using Handler = std::function<NavResult(const ToolArgs&)>;

  void register_tool(ToolDescriptor desc, Handler h);
  // validates args, checks that "filename" is readable, then runs the handler
  NavResult call(const std::string& name, const ToolArgs& args) const;
  bool contains(const std::string& name) const { return map_.count(name) != 0; }
  std::vector<ToolDescriptor> list() const;
  std::string describe() const;

private:
  struct Entry {
    ToolDescriptor desc;
    Handler handler;
  };
  std::vector<std::string> order_;
  std::unordered_map<std::string, Entry> map_;
};

bool parse_int_arg(const std::string& s, long& out);
bool parse_bool_arg(const std::string& s, bool& out);
const char* param_type_name(ParamType t);

void register_navigator_tools(ToolRegistry& registry, Navigator& nav);
