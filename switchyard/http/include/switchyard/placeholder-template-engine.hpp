#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "switchyard/template-engine.hpp"

namespace switchyard {

// Template engine substituting "{{key}}" placeholders (surrounding spaces allowed) with values of the
// template data. "{{{key}}}" inserts the value as is, "{{key}}" escapes it for HTML.
// "{{> name}}" inserts the registered template (or partial) 'name', rendered with the same data.
// Templates are registered at startup, rendering is then read-only.
class PlaceholderTemplateEngine final : public TemplateEngine {
 public:
  static constexpr int kMaxPartialDepth = 16;

  // Registers (or replaces) template 'name'.
  void registerTemplate(std::string name, std::string content);

  // Registers every file of 'directory' with extension 'extension' under its stem
  // (views/index.hbs -> "index"), then the ones of its "partials" subdirectory if it exists
  // (views/partials/header.hbs -> "header"). Returns the number of registered templates.
  // Throws std::filesystem::filesystem_error if a directory cannot be listed.
  std::size_t registerDirectory(const std::filesystem::path& directory, std::string_view extension = ".hbs");

  // Throws TemplateRenderError for unknown templates or partials, missing keys, unterminated placeholders or
  // partials nested deeper than kMaxPartialDepth (recursive inclusion).
  [[nodiscard]] std::string render(std::string_view name, const TemplateData& data) const override;

  [[nodiscard]] bool contains(std::string_view name) const { return _templates.contains(name); }

 private:
  std::size_t registerFiles(const std::filesystem::path& directory, std::string_view extension);

  void renderInto(std::string& out, std::string_view name, const TemplateData& data, int depth) const;

  std::map<std::string, std::string, std::less<>> _templates;
};

}  // namespace switchyard
