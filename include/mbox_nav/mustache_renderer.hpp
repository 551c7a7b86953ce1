#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mn {

// Flat context handed to a template: scalar values plus named lists of
// flat items ({{#list}}...{{/list}}).
class TemplateData {
public:
  using Item = std::map<std::string, std::string>;

  void set(std::string key, std::string value) { values_[std::move(key)] = std::move(value); }
  void add_item(const std::string& list, Item item) { lists_[list].push_back(std::move(item)); }

  const std::map<std::string, std::string>& values() const noexcept { return values_; }
  const std::map<std::string, std::vector<Item>>& lists() const noexcept { return lists_; }

private:
  std::map<std::string, std::string> values_;
  std::map<std::string, std::vector<Item>> lists_;
};

// Renders plain-text views from kainjow/mustache templates in a
// directory. No HTML escaping: output goes to a terminal.
class MustacheRenderer {
public:
  struct Config {
    std::string template_dir = "templates";
  };

  MustacheRenderer();
  explicit MustacheRenderer(Config cfg);

  std::optional<std::string> render(std::string_view template_name, const TemplateData& data);

  const std::string& last_error() const noexcept { return err_; }

private:
  Config cfg_;
  std::map<std::string, std::string> cache_;
  std::string err_;
};

}
