#include "mbox_nav/message_body.hpp"
#include "mbox_nav/header_decode.hpp"
#include "mbox_nav/headers.hpp"
#include <cctype>
#include <optional>
#include <vector>

namespace mn {

namespace {

constexpr int kMaxDepth = 8;  // nested multipart guard

std::string lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

std::string media_type(std::string_view part) {
  auto ct = find_header(part, "Content-Type");
  if (!ct) return "text/plain";
  std::string_view v(*ct);
  auto semi = v.find(';');
  if (semi != std::string_view::npos) v = v.substr(0, semi);
  while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) v.remove_suffix(1);
  return lower(v);
}

std::string decode_part_body(std::string_view part) {
  std::string_view body = message_body(part);
  std::string cte = lower(find_header(part, "Content-Transfer-Encoding").value_or(""));

  std::string bytes;
  if (cte == "base64") {
    decode_base64(body, bytes, /*strict=*/false);
  } else if (cte == "quoted-printable") {
    bytes = decode_quoted_printable(body);
  } else {
    bytes.assign(body.data(), body.size());
  }

  std::string charset = "utf-8";
  if (auto ct = find_header(part, "Content-Type"))
    if (auto cs = header_param(*ct, "charset")) charset = *cs;

  std::string text;
  if (convert_to_utf8(charset, bytes, text)) return text;
  return bytes;
}

// Splits a multipart body on "--boundary" delimiter lines.
std::vector<std::string_view> split_parts(std::string_view body, const std::string& boundary) {
  std::vector<std::string_view> parts;
  const std::string delim = "--" + boundary;
  std::size_t pos = 0;
  std::optional<std::size_t> part_start;

  while (pos <= body.size()) {
    std::size_t nl = body.find('\n', pos);
    std::size_t line_end = (nl == std::string_view::npos) ? body.size() : nl;
    std::string_view line = body.substr(pos, line_end - pos);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);

    if (line.compare(0, delim.size(), delim) == 0) {
      std::string_view rest = line.substr(delim.size());
      if (part_start) {
        std::size_t end = pos;
        // the line break before the delimiter belongs to the delimiter
        if (end > *part_start && body[end - 1] == '\n') --end;
        if (end > *part_start && body[end - 1] == '\r') --end;
        parts.push_back(body.substr(*part_start, end - *part_start));
        part_start.reset();
      }
      if (rest.compare(0, 2, "--") == 0) break;  // closing delimiter
      part_start = (nl == std::string_view::npos) ? body.size() : nl + 1;
    }
    if (nl == std::string_view::npos) break;
    pos = nl + 1;
  }
  if (part_start && *part_start < body.size()) parts.push_back(body.substr(*part_start));
  return parts;
}

std::optional<std::string> first_plain_part(std::string_view part, int depth) {
  std::string type = media_type(part);
  if (type.compare(0, 10, "multipart/") == 0) {
    if (depth >= kMaxDepth) return std::nullopt;
    auto ct = find_header(part, "Content-Type");
    auto boundary = ct ? header_param(*ct, "boundary") : std::nullopt;
    if (!boundary || boundary->empty()) return std::nullopt;
    for (auto sub : split_parts(message_body(part), *boundary)) {
      if (auto text = first_plain_part(sub, depth + 1)) return text;
    }
    return std::nullopt;
  }
  if (type != "text/plain") return std::nullopt;
  std::string disp = lower(find_header(part, "Content-Disposition").value_or(""));
  if (disp.find("attachment") != std::string::npos) return std::nullopt;
  return decode_part_body(part);
}

}

std::string extract_plain_body(std::string_view message) {
  if (media_type(message).compare(0, 10, "multipart/") == 0) {
    if (auto text = first_plain_part(message, 0)) return *text;
    return std::string(kNoPlainTextBody);
  }
  return decode_part_body(message);
}

}
