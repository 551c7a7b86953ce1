#pragma once
#include "mbox_nav/mustache_renderer.hpp"
#include "mbox_nav/session.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mn {

enum class Command { List, Next, Prev, Cols, Show, Search, Save, Info, Sort, Help, Quit, Exit, Eof };

std::optional<Command> parse_command(std::string_view verb);
const char* to_string(Command c) noexcept;

// Line-oriented command loop over a Session. Output goes to `out`; bad
// arguments print a usage line and never end the loop.
class Navigator {
public:
  Navigator(Session& session, std::ostream& out, MustacheRenderer& renderer);

  // Runs one command line. Returns false when the loop should stop.
  bool execute(std::string_view line);

  // Prompt/read/execute until quit, exit, end of input or SIGINT.
  void run(std::istream& in, bool show_prompt = true);

  std::size_t width() const noexcept { return width_; }
  void set_width(std::size_t w) noexcept { width_ = w; }

private:
  using Handler = bool (Navigator::*)(std::string_view);
  static Handler handler_for(Command c) noexcept;

  bool do_list(std::string_view arg);
  bool do_prev(std::string_view arg);
  bool do_cols(std::string_view arg);
  bool do_show(std::string_view arg);
  bool do_search(std::string_view arg);
  bool do_save(std::string_view arg);
  bool do_info(std::string_view arg);
  bool do_sort(std::string_view arg);
  bool do_help(std::string_view arg);
  bool do_quit(std::string_view arg);

  void print_rows(const std::vector<std::size_t>& positions, const std::string& title);
  void print_page(const PageResult& page);
  void report(const Error& err);

  Session& session_;
  std::ostream& out_;
  MustacheRenderer& renderer_;
  std::size_t width_;
};

// Greedy word wrap of each line to `width` code points. Existing line
// breaks are kept.
std::string wrap_text(std::string_view text, std::size_t width);

}
