#include "mbox_nav/mustache_renderer.hpp"

#if __has_include(<kainjow/mustache.hpp>)
  #include <kainjow/mustache.hpp>
#elif __has_include(<mustache.hpp>)
  #include <mustache.hpp>
#else
  #error "kainjow/Mustache header not found"
#endif

#include <filesystem>
#include <fstream>
#include <sstream>

namespace mn {

MustacheRenderer::MustacheRenderer() : cfg_{} {
#ifdef MN_DEFAULT_TEMPLATE_DIR
  cfg_.template_dir = MN_DEFAULT_TEMPLATE_DIR;
#endif
}

MustacheRenderer::MustacheRenderer(Config cfg) : cfg_(std::move(cfg)) {}

static bool read_file(const std::string& path, std::string& out, std::string& err) {
  std::ifstream in(path, std::ios::binary);
  if (!in) { err = "open failed: " + path; return false; }
  std::ostringstream ss; ss << in.rdbuf();
  out = ss.str();
  return true;
}

std::optional<std::string> MustacheRenderer::render(std::string_view template_name,
                                                    const TemplateData& data) {
  err_.clear();
  const std::string name(template_name);

  auto it = cache_.find(name);
  if (it == cache_.end()) {
    const auto path = (std::filesystem::path(cfg_.template_dir) / (name + ".mustache")).string();
    std::string tpl;
    if (!read_file(path, tpl, err_)) return std::nullopt;
    it = cache_.emplace(name, std::move(tpl)).first;
  }

  kainjow::mustache::mustache view(it->second);
  if (!view.is_valid()) { err_ = view.error_message(); return std::nullopt; }
  view.set_custom_escape([](const std::string& s){ return s; });

  kainjow::mustache::data ctx;
  for (const auto& kv : data.values()) ctx.set(kv.first, kv.second);
  for (const auto& list : data.lists()) {
    kainjow::mustache::data items{kainjow::mustache::data::type::list};
    for (const auto& item : list.second) {
      kainjow::mustache::data obj;
      for (const auto& kv : item) obj.set(kv.first, kv.second);
      items.push_back(obj);
    }
    ctx.set(list.first, items);
  }

  std::string rendered = view.render(ctx);
  if (!view.is_valid()) { err_ = view.error_message(); return std::nullopt; }
  return rendered;
}

}
