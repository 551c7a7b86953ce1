#include <chrono>
#include <cstdio>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "mbox_nav/date_parse.hpp"
#include "mbox_nav/parse_policy.hpp"
#include "mbox_nav/year_classifier.hpp"

using clk = std::chrono::steady_clock;

// Mix of shapes seen in real archives: most hit the pattern step, a few
// fall through to the layouts or to nothing at all.
static std::vector<std::string> make_dates(size_t n) {
  static const char* days[] = {"Mon","Tue","Wed","Thu","Fri","Sat","Sun"};
  static const char* months[] = {"Jan","Feb","Mar","Apr","May","Jun","Jul","Aug","Sep","Oct","Nov","Dec"};
  std::vector<std::string> v; v.reserve(n);
  std::mt19937 rng(123);
  std::uniform_int_distribution<int> y(1990, 2025), d(1, 28), shape(0, 9);
  for (size_t i=0;i<n;++i) {
    char buf[96];
    int Y = y(rng), D = d(rng), M = int(i%12);
    switch (shape(rng)) {
      case 0:  std::snprintf(buf, sizeof(buf), "%d %s %d", D, months[M], 1800 + Y % 100); break;
      case 1:  std::snprintf(buf, sizeof(buf), "%s %s %d 10:11:12 %d", days[i%7], months[M], D, Y); break;
      case 2:  std::snprintf(buf, sizeof(buf), "someday, maybe"); break;
      default: std::snprintf(buf, sizeof(buf), "%s, %02d %s %d 08:%02d:00 -0700", days[i%7], D, months[M], Y, int(i%60));
    }
    v.emplace_back(buf);
  }
  return v;
}

template <class F>
static void run(const char* tag, const std::vector<std::string>& data, int iters, F&& fn) {
  std::cout << "\n[" << tag << "] samples=" << data.size() << " iters=" << iters << "\n";
  for (int k=1;k<=iters;++k) {
    std::size_t ok=0;
    auto t0 = clk::now();
    for (auto& s: data) if (fn(s)) ++ok;
    auto t1 = clk::now();
    double sec = std::chrono::duration<double>(t1-t0).count();
    std::cout << "  iter " << k << ": ok=" << ok
              << " time=" << sec << "s  rate=" << (data.size()/sec)/1e6 << " M/s\n";
  }
}

int main(int argc, char** argv){
  size_t n = 200'000;
  int iters = 3;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto k = s.substr(0,eq); auto v = (eq==std::string::npos)?"":s.substr(eq+1);
    if (k=="--n") { if (auto x = mn::parse_count(v)) n = *x; }
    else if (k=="--iters") { if (auto x = mn::parse_count(v)) iters = int(*x); }
    else if (k=="--help"||k=="-h"){
      std::cout << "Usage: classifier_bench [--n=200000] [--iters=3]\n";
      return 0;
    }
  }
  auto data = make_dates(n);
  run("classify_year", data, iters, [](const std::string& s){ return mn::classify_year(s).has_value(); });
  run("parse_mail_date", data, iters, [](const std::string& s){ return mn::parse_mail_date(s).has_value(); });
  return 0;
}
