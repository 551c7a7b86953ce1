#include "mbox_nav/headers.hpp"
#include "mbox_nav/header_decode.hpp"
#include "mbox_nav/metrics.hpp"
#include <cctype>

namespace mn {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  return true;
}

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// Position of the empty line ending the header block and the length of
// that separator ("\n" or "\r\n").
static std::size_t header_end(std::string_view m, std::size_t* sep_len) {
  if (!m.empty() && m[0] == '\n') { *sep_len = 1; return 0; }
  if (m.size() >= 2 && m[0] == '\r' && m[1] == '\n') { *sep_len = 2; return 0; }
  std::size_t pos = 0;
  while ((pos = m.find('\n', pos)) != std::string_view::npos) {
    std::size_t next = pos + 1;
    if (next < m.size() && m[next] == '\n') { *sep_len = 1; return next; }
    if (next + 1 < m.size() && m[next] == '\r' && m[next + 1] == '\n') { *sep_len = 2; return next; }
    pos = next;
  }
  *sep_len = 0;
  return m.size();
}

std::string_view header_block(std::string_view message) {
  std::size_t sep = 0;
  return message.substr(0, header_end(message, &sep));
}

std::string_view message_body(std::string_view message) {
  std::size_t sep = 0;
  std::size_t end = header_end(message, &sep);
  return end >= message.size() ? std::string_view{} : message.substr(end + sep);
}

std::optional<std::string> find_header(std::string_view message, std::string_view name) {
  std::string_view block = header_block(message);
  std::size_t pos = 0;
  while (pos < block.size()) {
    std::size_t nl = block.find('\n', pos);
    std::string_view line = block.substr(pos, (nl == std::string_view::npos ? block.size() : nl) - pos);
    pos = (nl == std::string_view::npos) ? block.size() : nl + 1;

    std::size_t colon = line.find(':');
    if (colon == std::string_view::npos || line.empty() || line[0] == ' ' || line[0] == '\t') continue;
    if (!ieq(trim(line.substr(0, colon)), name)) continue;

    std::string value(trim(line.substr(colon + 1)));
    // continuation lines
    while (pos < block.size() && (block[pos] == ' ' || block[pos] == '\t')) {
      std::size_t cnl = block.find('\n', pos);
      std::string_view cont = block.substr(pos, (cnl == std::string_view::npos ? block.size() : cnl) - pos);
      pos = (cnl == std::string_view::npos) ? block.size() : cnl + 1;
      cont = trim(cont);
      if (cont.empty()) continue;
      if (!value.empty()) value.push_back(' ');
      value.append(cont);
    }
    return value;
  }
  return std::nullopt;
}

HeaderSet read_headers(std::string_view message, MetricsRegistry* metrics) {
  HeaderSet h;
  auto field = [&](const char* name, std::string& out) {
    bool fell_back = false;
    out = decode_header(find_header(message, name), &fell_back);
    if (fell_back && metrics) metrics->add_decode_fallback(name);
  };
  field("From", h.from);
  field("To", h.to);
  field("Cc", h.cc);
  field("Date", h.date);
  field("Subject", h.subject);
  return h;
}

std::optional<std::string> header_param(std::string_view value, std::string_view param) {
  std::size_t pos = value.find(';');
  while (pos != std::string_view::npos) {
    std::size_t next = value.find(';', pos + 1);
    std::string_view item = trim(value.substr(pos + 1, (next == std::string_view::npos ? value.size() : next) - pos - 1));
    pos = next;

    std::size_t eq = item.find('=');
    if (eq == std::string_view::npos || !ieq(trim(item.substr(0, eq)), param)) continue;
    std::string_view v = trim(item.substr(eq + 1));
    if (v.size() >= 2 && v.front() == '"') {
      std::size_t close = v.find('"', 1);
      v = v.substr(1, (close == std::string_view::npos ? v.size() : close) - 1);
    }
    return std::string(v);
  }
  return std::nullopt;
}

}
