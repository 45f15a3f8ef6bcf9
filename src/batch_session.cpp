#include "batch_session.hpp"
#include "request_parser.hpp"
#include <spdlog/spdlog.h>

BatchSession::BatchSession(const NavConfig& cfg)
  : store_(cfg.page_size), nav_(store_, cfg.chunk_size) {
  register_navigator_tools(registry_, nav_);
}

void write_response(std::ostream& out, const NavResult& r) {
  out << (r.ok() ? "ok " : "err ") << result_kind_name(r.kind) << ' ' << r.text.size() << '\n'
      << r.text << '\n';
  out.flush();
}

NavResult BatchSession::handle_line(const std::string& line) {
  Request req;
  std::string msg;
  if (!parse_request(line, req, msg)) {
    spdlog::warn("malformed request: {}", msg);
    return NavResult::failure(ResultKind::InvalidArgument, "Invalid request: " + msg);
  }
  if (req.tool == "list_tools") return NavResult::info(registry_.describe());

  auto f = req.args.find("filename");
  spdlog::debug("call {} filename={}", req.tool, f == req.args.end() ? std::string("-") : f->second);
  NavResult r = registry_.call(req.tool, req.args);
  if (!r.ok()) spdlog::warn("{} failed ({}): {}", req.tool, result_kind_name(r.kind), r.text);
  return r;
}

int BatchSession::run(std::istream& in, std::ostream& out) {
  int failures = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (is_skippable_request(line)) continue;
    if (line == "quit") break;
    NavResult r = handle_line(line);
    if (!r.ok()) ++failures;
    write_response(out, r);
  }
  spdlog::info("session closed, {} file state(s), {} failed request(s)", store_.size(), failures);
  return failures;
}
