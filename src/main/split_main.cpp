#include "mbox_nav/interrupt.hpp"
#include "mbox_nav/parse_policy.hpp"
#include "mbox_nav/partitioner.hpp"
#include "mbox_nav/path_utils.hpp"
#include "mbox_nav/run_json.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Cli {
  mn::SplitJob job;
  std::string sample;
  std::string report_path;
  std::string error;
};

void usage(std::ostream& o) {
  o << "Usage: mbox-split <source.mbox> <year> <output.mbox> [--debug] [--sample=N]\n"
       "                  [--report=FILE.json]\n"
       "Example: mbox-split full.mbox 2024 split-2024.mbox\n";
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    if (eat("--sample=", &c.sample)) continue;
    if (a == "--sample" && i + 1 < argc) { c.sample = argv[++i]; continue; }
    if (eat("--report=", &c.report_path)) continue;
    if (a == "--debug") { c.job.debug = true; continue; }
    if (a == "-h" || a == "--help") {
      usage(std::cout);
      std::exit(0);
    }
    if (a.rfind("--", 0) == 0) { c.error = "unknown option " + a; continue; }
    positional.push_back(a);
  }

  if (c.error.empty() && positional.size() != 3) c.error = "expected <source> <year> <output>";
  if (positional.size() == 3) {
    c.job.source = positional[0];
    c.job.year = positional[1];
    c.job.output = positional[2];
  }
  if (c.error.empty() && !c.sample.empty()) {
    auto n = mn::parse_count(c.sample);
    if (!n) c.error = "--sample expects a non-negative integer";
    else c.job.sample_count = *n;
  }
  return c;
}

}

int main(int argc, char** argv) {
  auto cli = parse_cli(argc, argv);
  if (!cli.error.empty()) {
    std::cerr << "mbox-split: " << cli.error << "\n";
    usage(std::cerr);
    return 1;
  }
  if (!mn::is_year_label(cli.job.year))
    std::cerr << "[split] warning: year '" << cli.job.year << "' is not four digits; nothing will match\n";

  std::error_code ec;
  if (!std::filesystem::exists(cli.job.source, ec)) {
    std::cerr << "Error: Source file '" << cli.job.source << "' not found.\n";
    return 1;
  }

  mn::InterruptGuard guard;
  mn::Error err;
  auto report = mn::partition_file(cli.job, std::cout, &err);
  if (!report) {
    std::cout << "Error: " << err.message << "\n";
    std::cout << "Done.\n";
    return 2;
  }

  if (!cli.report_path.empty() && cli.job.sample_count == 0) {
    mn::Error werr;
    if (!mn::write_file(cli.report_path, mn::RunJsonWriter::to_json(*report), &werr))
      std::cerr << "[split] report not written: " << werr.message << "\n";
    else
      std::cerr << "[split] report: " << cli.report_path << "\n";
  }

  std::cout << "Done.\n";
  return 0;
}
