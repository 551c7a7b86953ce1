#include "mbox_nav/commands.hpp"
#include "mbox_nav/interrupt.hpp"
#include "mbox_nav/parse_policy.hpp"
#include "mbox_nav/table_render.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <iostream>
#include <sstream>

namespace mn {

namespace {

struct CommandSpec {
  std::string_view name;
  Command cmd;
  const char* usage;   // null: not listed by help
};

constexpr std::array<CommandSpec, 13> kCommands = {{
  {"ls",     Command::List,   "ls [N]                 list the next N messages"},
  {"next",   Command::Next,   "next [N]               alias for ls"},
  {"prev",   Command::Prev,   "prev [N]               page backward by N"},
  {"cols",   Command::Cols,   "cols <c1,c2,...>       set display columns (from,date,subject,to)"},
  {"show",   Command::Show,   "show <index>           display the full message at that index"},
  {"search", Command::Search, "search <text>          case-insensitive search in From / Subject"},
  {"save",   Command::Save,   "save <index> <file>    save the raw message to disk"},
  {"info",   Command::Info,   "info [json]            show mailbox statistics"},
  {"sort",   Command::Sort,   "sort <field> [desc]    sort by from, date or subject"},
  {"help",   Command::Help,   "help                   this list"},
  {"quit",   Command::Quit,   "quit                   leave the navigator"},
  {"exit",   Command::Exit,   "exit                   leave the navigator"},
  {"EOF",    Command::Eof,    nullptr},
}};

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

std::vector<std::string_view> split_words(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    std::size_t start = i;
    while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    if (i > start) out.push_back(s.substr(start, i - start));
  }
  return out;
}

std::string join_columns(const std::vector<Column>& cols) {
  std::string out;
  for (std::size_t i = 0; i < cols.size(); ++i) {
    if (i) out.push_back(',');
    out += to_string(cols[i]);
  }
  return out;
}

// "1,234,567"
std::string grouped(std::uint64_t v) {
  std::string digits = std::to_string(v);
  std::string out;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if (i && (digits.size() - i) % 3 == 0) out.push_back(',');
    out.push_back(digits[i]);
  }
  return out;
}

std::string fixed2(double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%.2f", v);
  return buf;
}

}

std::optional<Command> parse_command(std::string_view verb) {
  for (const auto& spec : kCommands)
    if (spec.name == verb) return spec.cmd;
  return std::nullopt;
}

const char* to_string(Command c) noexcept {
  for (const auto& spec : kCommands)
    if (spec.cmd == c) return spec.name.data();
  return "?";
}

std::string wrap_text(std::string_view text, std::size_t width) {
  if (width == 0) return std::string(text);
  std::string out;
  out.reserve(text.size() + text.size() / width + 1);
  std::size_t pos = 0;
  while (pos <= text.size()) {
    std::size_t nl = text.find('\n', pos);
    std::string_view line = text.substr(pos, (nl == std::string_view::npos ? text.size() : nl) - pos);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    std::size_t col = 0;
    for (auto word : split_words(line)) {
      const std::size_t w = display_width(word);
      if (col > 0 && col + 1 + w > width) { out.push_back('\n'); col = 0; }
      if (col > 0) { out.push_back(' '); ++col; }
      out.append(word);
      col += w;
    }
    if (nl == std::string_view::npos) break;
    out.push_back('\n');
    pos = nl + 1;
  }
  return out;
}

Navigator::Navigator(Session& session, std::ostream& out, MustacheRenderer& renderer)
  : session_(session), out_(out), renderer_(renderer), width_(session.config().wrap_width) {}

Navigator::Handler Navigator::handler_for(Command c) noexcept {
  switch (c) {
    case Command::List:
    case Command::Next:   return &Navigator::do_list;
    case Command::Prev:   return &Navigator::do_prev;
    case Command::Cols:   return &Navigator::do_cols;
    case Command::Show:   return &Navigator::do_show;
    case Command::Search: return &Navigator::do_search;
    case Command::Save:   return &Navigator::do_save;
    case Command::Info:   return &Navigator::do_info;
    case Command::Sort:   return &Navigator::do_sort;
    case Command::Help:   return &Navigator::do_help;
    case Command::Quit:
    case Command::Exit:
    case Command::Eof:    return &Navigator::do_quit;
  }
  return nullptr;
}

bool Navigator::execute(std::string_view line) {
  line = trim(line);
  if (line.empty()) return true;

  std::size_t sp = 0;
  while (sp < line.size() && !std::isspace(static_cast<unsigned char>(line[sp]))) ++sp;
  std::string_view verb = line.substr(0, sp);
  std::string_view arg = trim(line.substr(sp));

  auto cmd = parse_command(verb);
  Handler h = cmd ? handler_for(*cmd) : nullptr;
  if (!h) {
    out_ << "*** Unknown syntax: " << line << "\n";
    return true;
  }
  return (this->*h)(arg);
}

void Navigator::run(std::istream& in, bool show_prompt) {
  out_ << "\nType 'help' for command list, 'quit' to exit\n";
  std::string line;
  while (true) {
    if (show_prompt) out_ << "(mbox) " << std::flush;
    if (!std::getline(in, line)) {
      if (interrupt_requested()) { out_ << "\nInterrupted. Bye!\n"; return; }
      out_ << "\n";
      do_quit({});
      return;
    }
    if (!execute(line)) return;
    if (interrupt_requested()) { out_ << "\nInterrupted. Bye!\n"; return; }
  }
}

void Navigator::report(const Error& err) {
  if (err.kind == ErrorKind::OutOfRange || err.kind == ErrorKind::NotFound) out_ << "Index out of range.\n";
  else out_ << "Error: " << err.message << "\n";
}

void Navigator::print_rows(const std::vector<std::size_t>& positions, const std::string& title) {
  const auto& cfg = session_.config();
  TableStyle style;
  style.from_width = cfg.from_width;
  style.subject_width = width_ > 60 ? width_ - 60 : 20;
  if (!title.empty()) out_ << "\n" << title << "\n";
  out_ << render_table(session_.table(), positions, session_.columns(), style);
}

void Navigator::print_page(const PageResult& page) {
  if (page.rows.empty()) {
    out_ << "No messages.\n";
    return;
  }
  std::vector<std::size_t> positions;
  positions.reserve(page.rows.size());
  for (std::size_t i = page.rows.begin; i < page.rows.end; ++i) positions.push_back(i);
  print_rows(positions, "Messages " + std::to_string(page.rows.begin) + " to " + std::to_string(page.rows.end - 1));
}

bool Navigator::do_list(std::string_view arg) {
  // a bad count falls back to the page size
  auto n = arg.empty() ? std::nullopt : parse_count(arg);
  if (n && *n == 0) n.reset();
  print_page(session_.list(n));
  return true;
}

bool Navigator::do_prev(std::string_view arg) {
  auto n = arg.empty() ? std::nullopt : parse_count(arg);
  if (n && *n == 0) n.reset();
  print_page(session_.prev(n));
  return true;
}

bool Navigator::do_cols(std::string_view arg) {
  if (arg.empty()) {
    out_ << "Current display columns: " << join_columns(session_.columns()) << "\n";
    out_ << "Available columns: from,date,subject,to\n";
    return true;
  }
  if (!session_.set_display_columns(arg)) {
    out_ << "No valid columns specified. Available columns: from,date,subject,to\n";
    return true;
  }
  out_ << "Display columns set to: " << join_columns(session_.columns()) << "\n";
  print_page(session_.list());
  return true;
}

bool Navigator::do_show(std::string_view arg) {
  auto idx = parse_count(arg);
  if (!idx) {
    out_ << "Usage: show <index>\n";
    return true;
  }
  Error err;
  auto view = session_.show(*idx, &err);
  if (!view) { report(err); return true; }

  TemplateData d;
  d.set("rule", std::string(width_, '='));
  d.set("thin_rule", std::string(width_, '-'));
  d.set("from", view->headers.from);
  d.set("to", view->headers.to);
  d.set("cc", view->headers.cc);
  d.set("date", view->headers.date);
  d.set("subject", view->headers.subject);
  d.set("body", wrap_text(view->body, width_));

  auto text = renderer_.render("show", d);
  if (!text) {
    std::cerr << "[nav] template error: " << renderer_.last_error() << "\n";
    return true;
  }
  out_ << *text;
  return true;
}

bool Navigator::do_search(std::string_view arg) {
  auto hits = session_.search(arg);
  if (!hits) {
    out_ << "search <text>\n";
    return true;
  }
  if (hits->total == 0) {
    out_ << "No matches found\n";
    return true;
  }
  const std::size_t limit = session_.config().search_limit;
  std::vector<std::size_t> shown(hits->positions.begin(),
                                 hits->positions.begin() + std::min(limit, hits->positions.size()));
  print_rows(shown, "Found " + std::to_string(hits->total) + " matches (showing first " +
                        std::to_string(limit) + ")");
  return true;
}

bool Navigator::do_save(std::string_view arg) {
  auto words = split_words(arg);
  std::optional<std::size_t> idx;
  if (words.size() == 2) idx = parse_count(words[0]);
  if (!idx) {
    out_ << "Usage: save <index> <outfile.eml>\n";
    return true;
  }
  const std::string path(words[1]);
  Error err;
  if (!session_.save(*idx, path, &err)) { report(err); return true; }
  out_ << "Saved \xE2\x86\x92 " << path << "\n";
  return true;
}

bool Navigator::do_info(std::string_view arg) {
  if (arg == "json") {
    out_ << session_.stats_json() << "\n";
    return true;
  }
  ArchiveStats s = session_.stats();

  TemplateData d;
  d.set("path", s.path);
  d.set("messages", grouped(s.messages));
  d.set("size_mb", fixed2(s.size_mb));
  if (s.earliest && s.latest) {
    d.set("has_range", "yes");
    d.set("earliest", *s.earliest);
    d.set("latest", *s.latest);
  }
  for (const auto& dom : s.top_domains)
    d.add_item("domains", {{"domain", dom.first}, {"count", std::to_string(dom.second)}});

  auto text = renderer_.render("info", d);
  if (!text) {
    std::cerr << "[nav] template error: " << renderer_.last_error() << "\n";
    return true;
  }
  out_ << *text;
  return true;
}

bool Navigator::do_sort(std::string_view arg) {
  auto words = split_words(arg);
  auto field = words.empty() ? std::nullopt : parse_sort_field(words[0]);
  if (!field) {
    out_ << "Usage: sort <field> [desc] - where field is one of: from, date, subject\n";
    return true;
  }
  bool ascending = true;
  if (words.size() >= 2) {
    std::string dir(words[1]);
    for (auto& c : dir) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    ascending = (dir != "desc");
  }
  session_.sort(*field, ascending);
  out_ << "Sorted by " << to_string(*field) << " " << (ascending ? "ascending" : "descending") << "\n";
  print_page(session_.list());
  return true;
}

bool Navigator::do_help(std::string_view) {
  out_ << "\nCommands:\n";
  for (const auto& spec : kCommands)
    if (spec.usage) out_ << "  " << spec.usage << "\n";
  return true;
}

bool Navigator::do_quit(std::string_view) {
  out_ << "Good-bye!\n";
  return false;
}

}
