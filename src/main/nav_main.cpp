#include "mbox_nav/commands.hpp"
#include "mbox_nav/interrupt.hpp"
#include "mbox_nav/mustache_renderer.hpp"
#include "mbox_nav/nav_config.hpp"
#include "mbox_nav/parse_policy.hpp"
#include "mbox_nav/session.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <unistd.h>

namespace {

struct Cli {
  std::string mbox;
  std::string config_path;
  std::string template_dir;
  std::string page_size;
  bool ok = true;
};

void usage(std::ostream& o) {
  o << "Usage: mbox-nav <mailbox.mbox> [--config=FILE.json] [--page-size=N]\n"
       "                [--templates=DIR]\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    if (eat("--config=", &c.config_path)) continue;
    if (eat("--page-size=", &c.page_size)) continue;
    if (eat("--templates=", &c.template_dir)) continue;
    if (a == "-h" || a == "--help") {
      usage(std::cout);
      std::exit(0);
    }
    if (a.rfind("--", 0) == 0 || !c.mbox.empty()) { c.ok = false; continue; }
    c.mbox = a;
  }
  if (c.mbox.empty()) c.ok = false;
  return c;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (!cli.ok) {
    usage(std::cerr);
    return 1;
  }

  mn::NavConfig cfg;
  if (!cli.config_path.empty()) {
    mn::Error err;
    if (!mn::load_nav_config(cli.config_path, cfg, &err))
      std::cerr << "[nav] " << err.message << " (using defaults)\n";
  }
  if (!cli.page_size.empty()) {
    auto n = mn::parse_count(cli.page_size);
    if (!n || *n == 0) {
      std::cerr << "[nav] --page-size must be a positive integer\n";
      return 1;
    }
    cfg.page_size = *n;
  }
  cfg.wrap_width = mn::terminal_width(cfg.wrap_width);

  std::error_code ec;
  if (!std::filesystem::exists(cli.mbox, ec)) {
    std::cerr << "File not found: " << cli.mbox << "\n";
    return 1;
  }

  mn::InterruptGuard guard;
  mn::Session session(cfg);
  mn::Error err;
  if (!session.open(cli.mbox, &err)) {
    if (err.kind == mn::ErrorKind::Interrupted) {
      std::cout << "\nInterrupted. Bye!\n";
      return 0;
    }
    std::cerr << "[nav] " << err.message << "\n";
    return 2;
  }

  mn::MustacheRenderer renderer = cli.template_dir.empty()
      ? mn::MustacheRenderer()
      : mn::MustacheRenderer(mn::MustacheRenderer::Config{cli.template_dir});
  mn::Navigator nav(session, std::cout, renderer);
  nav.run(std::cin, ::isatty(STDIN_FILENO) != 0);
  return 0;
}
