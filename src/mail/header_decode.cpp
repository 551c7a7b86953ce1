#include "mbox_nav/header_decode.hpp"
#include <cctype>
#include <cerrno>
#include <iconv.h>
#include <string>
#include <vector>

namespace mn {

static int b64_value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

static std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

bool decode_base64(std::string_view in, std::string& out, bool strict) {
  out.clear();
  out.reserve(in.size() * 3 / 4);
  unsigned acc = 0;
  int bits = 0;
  bool padding = false;
  for (char c : in) {
    if (c == '=') { padding = true; continue; }
    if (c == '\r' || c == '\n' || c == ' ' || c == '\t') continue;
    int v = b64_value(c);
    if (v < 0 || (padding && strict)) {
      if (strict) return false;
      continue;
    }
    acc = (acc << 6) | static_cast<unsigned>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((acc >> bits) & 0xFFu));
    }
  }
  // six leftover bits cannot encode a byte
  return !strict || bits < 6;
}

bool decode_q_word(std::string_view in, std::string& out) {
  out.clear();
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    char c = in[i];
    if (c == '_') { out.push_back(' '); continue; }
    if (c != '=') { out.push_back(c); continue; }
    if (i + 2 >= in.size()) return false;
    int hi = hex_value(in[i + 1]), lo = hex_value(in[i + 2]);
    if (hi < 0 || lo < 0) return false;
    out.push_back(static_cast<char>(hi * 16 + lo));
    i += 2;
  }
  return true;
}

std::string decode_quoted_printable(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    char c = in[i];
    if (c != '=') { out.push_back(c); continue; }
    // soft line break
    if (i + 1 < in.size() && in[i + 1] == '\n') { i += 1; continue; }
    if (i + 2 < in.size() && in[i + 1] == '\r' && in[i + 2] == '\n') { i += 2; continue; }
    if (i + 2 < in.size()) {
      int hi = hex_value(in[i + 1]), lo = hex_value(in[i + 2]);
      if (hi >= 0 && lo >= 0) {
        out.push_back(static_cast<char>(hi * 16 + lo));
        i += 2;
        continue;
      }
    }
    out.push_back(c);   // stray '=' kept literally
  }
  return out;
}

namespace {

struct IconvHandle {
  iconv_t cd;
  explicit IconvHandle(const char* to, const char* from) : cd(::iconv_open(to, from)) {}
  ~IconvHandle() { if (ok()) ::iconv_close(cd); }
  IconvHandle(const IconvHandle&) = delete;
  IconvHandle& operator=(const IconvHandle&) = delete;
  bool ok() const { return cd != reinterpret_cast<iconv_t>(-1); }
};

}

bool convert_to_utf8(std::string_view charset, std::string_view bytes, std::string& out) {
  std::string cs = lower(charset);
  if (auto star = cs.find('*'); star != std::string::npos) cs.resize(star);  // RFC 2231 language
  if (cs.empty() || cs == "utf-8" || cs == "utf8" || cs == "us-ascii" || cs == "ascii") {
    out.assign(bytes.data(), bytes.size());
    return true;
  }

  IconvHandle h("UTF-8", cs.c_str());
  if (!h.ok()) return false;

  out.clear();
  std::vector<char> buf(bytes.size() * 4 + 16);
  char* in_p = const_cast<char*>(bytes.data());
  std::size_t in_left = bytes.size();
  while (true) {
    char* out_p = buf.data();
    std::size_t out_left = buf.size();
    std::size_t rc = ::iconv(h.cd, in_left ? &in_p : nullptr, &in_left, &out_p, &out_left);
    out.append(buf.data(), buf.size() - out_left);
    if (rc != static_cast<std::size_t>(-1)) {
      if (in_left == 0) {
        // flush shift state
        out_p = buf.data(); out_left = buf.size();
        ::iconv(h.cd, nullptr, nullptr, &out_p, &out_left);
        out.append(buf.data(), buf.size() - out_left);
        return true;
      }
      continue;
    }
    if (errno != E2BIG) return false;   // EILSEQ / EINVAL
  }
}

namespace {

struct EncodedWord {
  std::string_view charset;
  char encoding = 'Q';
  std::string_view text;
  std::size_t end = 0;   // one past "?="
};

// Parses "=?charset?X?text?=" starting at `pos`.
bool parse_encoded_word(std::string_view s, std::size_t pos, EncodedWord& w) {
  if (s.compare(pos, 2, "=?") != 0) return false;
  std::size_t cs_begin = pos + 2;
  std::size_t q1 = s.find('?', cs_begin);
  if (q1 == std::string_view::npos || q1 == cs_begin || q1 + 2 >= s.size()) return false;
  for (std::size_t i = cs_begin; i < q1; ++i)
    if (std::isspace(static_cast<unsigned char>(s[i]))) return false;
  char enc = static_cast<char>(std::toupper(static_cast<unsigned char>(s[q1 + 1])));
  if ((enc != 'B' && enc != 'Q') || s[q1 + 2] != '?') return false;
  std::size_t text_begin = q1 + 3;
  std::size_t close = s.find("?=", text_begin);
  if (close == std::string_view::npos) return false;
  if (s.substr(text_begin, close - text_begin).find('\n') != std::string_view::npos) return false;
  w.charset = s.substr(cs_begin, q1 - cs_begin);
  w.encoding = enc;
  w.text = s.substr(text_begin, close - text_begin);
  w.end = close + 2;
  return true;
}

bool all_space(std::string_view s) {
  for (char c : s)
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  return true;
}

}

std::string decode_header(std::string_view raw, bool* fell_back) {
  if (fell_back) *fell_back = false;
  if (raw.find("=?") == std::string_view::npos) return std::string(raw);

  auto give_up = [&]() {
    if (fell_back) *fell_back = true;
    return std::string(raw);
  };

  std::string out;
  out.reserve(raw.size());
  std::size_t pos = 0;
  bool last_was_word = false;

  while (pos < raw.size()) {
    std::size_t start = raw.find("=?", pos);
    std::string_view gap = raw.substr(pos, (start == std::string_view::npos ? raw.size() : start) - pos);
    if (start == std::string_view::npos) { out.append(gap); break; }

    EncodedWord w;
    if (!parse_encoded_word(raw, start, w)) {
      // a literal "=?" that does not open an encoded word
      out.append(gap);
      out.append("=?");
      pos = start + 2;
      last_was_word = false;
      continue;
    }

    // whitespace between adjacent encoded words is not displayed
    if (!(last_was_word && all_space(gap))) out.append(gap);

    std::string bytes;
    bool ok = (w.encoding == 'B') ? decode_base64(w.text, bytes) : decode_q_word(w.text, bytes);
    if (!ok) return give_up();

    std::string utf8;
    if (!convert_to_utf8(w.charset, bytes, utf8)) return give_up();
    out += utf8;

    last_was_word = true;
    pos = w.end;
  }
  return out;
}

std::string decode_header(const std::optional<std::string>& raw, bool* fell_back) {
  if (!raw) {
    if (fell_back) *fell_back = false;
    return std::string();
  }
  return decode_header(std::string_view(*raw), fell_back);
}

}
