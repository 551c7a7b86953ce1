#include "mbox_nav/path_utils.hpp"
#include <cstring>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>
#include <openssl/evp.h>

namespace mn {

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

bool write_file(const std::filesystem::path& path, std::string_view bytes, Error* err) {
  if (!ensure_parent_dirs(path)) {
    set_error(err, ErrorKind::Io, "cannot create directories for " + path.string());
    return false;
  }
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    set_error(err, ErrorKind::Io, "cannot open " + path.string() + " for writing");
    return false;
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  out.flush();
  if (!out) {
    set_error(err, ErrorKind::Io, "write failed: " + path.string());
    return false;
  }
  return true;
}

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* c) const { EVP_MD_CTX_free(c); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

std::string to_hex(const unsigned char* md, unsigned int len) {
  std::ostringstream o;
  for (unsigned int i = 0; i < len; ++i)
    o << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(md[i]);
  return o.str();
}

}

std::optional<std::string> sha256_file_hex(const std::filesystem::path& p, Error* err) {
  std::ifstream in(p, std::ios::binary);
  if (!in) {
    set_error(err, ErrorKind::Io, "cannot open " + p.string());
    return std::nullopt;
  }
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    set_error(err, ErrorKind::Io, "sha256 init failed");
    return std::nullopt;
  }
  std::vector<char> buf(256 * 1024);
  while (in) {
    in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    std::streamsize n = in.gcount();
    if (n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<std::size_t>(n)) != 1) {
      set_error(err, ErrorKind::Io, "sha256 update failed");
      return std::nullopt;
    }
  }
  if (in.bad()) {
    set_error(err, ErrorKind::Io, "read failed: " + p.string());
    return std::nullopt;
  }
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx.get(), md, &len) != 1) {
    set_error(err, ErrorKind::Io, "sha256 final failed");
    return std::nullopt;
  }
  return to_hex(md, len);
}

}
