#include "line_stream.hpp"
#include "test_util.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::vector<std::string> drain(LineStream& s) {
  std::vector<std::string> out;
  std::string line;
  while (s.next(line)) out.push_back(line);
  return out;
}

int main() {
  TempDir dir;

  // final line without newline is still yielded
  {
    LineStream s(write_file(dir, "a.txt", "one\ntwo\nthree"));
    assert(s.state() == LineStream::State::Fresh);
    auto lines = drain(s);
    assert((lines == std::vector<std::string>{"one", "two", "three"}));
    assert(s.state() == LineStream::State::Exhausted);
    assert(s.line_number() == 3);
    assert(!s.failed());
  }
  // trailing newline does not add an empty line, inner blank lines are kept
  {
    LineStream s(write_file(dir, "b.txt", "one\n\nthree\n"));
    auto lines = drain(s);
    assert((lines == std::vector<std::string>{"one", "", "three"}));
  }
  // empty file yields nothing
  {
    LineStream s(write_file(dir, "empty.txt", ""));
    std::string line;
    assert(!s.next(line));
    assert(s.state() == LineStream::State::Exhausted);
    assert(s.line_number() == 0);
  }
  // bytes are verbatim: CR stays in the line
  {
    LineStream s(write_file(dir, "crlf.txt", "a\r\nb\r\n"));
    auto lines = drain(s);
    assert((lines == std::vector<std::string>{"a\r", "b\r"}));
  }
  // lines longer than the read buffer are stitched together
  {
    std::string long_line(10000, 'x');
    std::string path = write_file(dir, "long.txt", "short\n" + long_line + "\nend");
    LineStream s(path, 512);
    auto lines = drain(s);
    assert(lines.size() == 3);
    assert(lines[1] == long_line);
    assert(lines[2] == "end");
  }
  // newline exactly at a chunk boundary
  {
    std::string path = write_file(dir, "edge.txt", "abc\ndefg\nhi");
    LineStream s(path, 4);
    auto lines = drain(s);
    assert((lines == std::vector<std::string>{"abc", "defg", "hi"}));
  }
  // missing file fails on first consumption, not on construction
  {
    LineStream s(dir.file("missing.txt"));
    assert(s.state() == LineStream::State::Fresh);
    std::string line;
    assert(!s.next(line));
    assert(s.failed());
    assert(s.error() == "File not found: " + dir.file("missing.txt"));
    assert(!s.next(line));
  }
  // each stream is an independent pass
  {
    std::string path = write_file(dir, "c.txt", "1\n2\n3\n");
    LineStream a(path);
    LineStream b(path);
    std::string la, lb;
    assert(a.next(la) && a.next(la));
    assert(b.next(lb));
    assert(la == "2" && lb == "1");
  }
  // early close ends the pass
  {
    LineStream s(write_file(dir, "d.txt", "1\n2\n3\n"));
    std::string line;
    assert(s.next(line));
    s.close();
    assert(s.state() == LineStream::State::Closed);
    assert(!s.next(line));
  }
  return 0;
}
