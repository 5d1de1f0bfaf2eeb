#include "switchyard/placeholder-template-engine.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "switchyard/log.hpp"
#include "switchyard/string-trim.hpp"
#include "switchyard/template-engine.hpp"

namespace switchyard {

namespace {

void AppendHtmlEscaped(std::string& out, std::string_view value) {
  for (char ch : value) {
    switch (ch) {
      case '&':
        out.append("&amp;");
        break;
      case '<':
        out.append("&lt;");
        break;
      case '>':
        out.append("&gt;");
        break;
      case '"':
        out.append("&quot;");
        break;
      case '\'':
        out.append("&#39;");
        break;
      default:
        out.push_back(ch);
        break;
    }
  }
}

}  // namespace

void PlaceholderTemplateEngine::registerTemplate(std::string name, std::string content) {
  log::debug("Registered template '{}' ({} bytes)", name, content.size());
  _templates.insert_or_assign(std::move(name), std::move(content));
}

std::size_t PlaceholderTemplateEngine::registerDirectory(const std::filesystem::path& directory,
                                                         std::string_view extension) {
  std::size_t nbRegistered = registerFiles(directory, extension);
  const auto partialsDir = directory / "partials";
  if (std::filesystem::is_directory(partialsDir)) {
    nbRegistered += registerFiles(partialsDir, extension);
  }
  return nbRegistered;
}

std::size_t PlaceholderTemplateEngine::registerFiles(const std::filesystem::path& directory,
                                                     std::string_view extension) {
  std::size_t nbRegistered = 0;
  for (const auto& entry : std::filesystem::directory_iterator(directory)) {
    if (!entry.is_regular_file() || entry.path().extension() != extension) {
      continue;
    }
    std::ifstream file(entry.path(), std::ios::binary);
    std::ostringstream content;
    content << file.rdbuf();
    registerTemplate(entry.path().stem().string(), std::move(content).str());
    ++nbRegistered;
  }
  return nbRegistered;
}

std::string PlaceholderTemplateEngine::render(std::string_view name, const TemplateData& data) const {
  std::string out;
  renderInto(out, name, data, 0);
  return out;
}

void PlaceholderTemplateEngine::renderInto(std::string& out, std::string_view name, const TemplateData& data,
                                           int depth) const {
  const auto templateIt = _templates.find(name);
  if (templateIt == _templates.end()) {
    throw TemplateRenderError("Unknown template '" + std::string(name) + "'");
  }
  std::string_view content = templateIt->second;

  out.reserve(out.size() + content.size());
  while (!content.empty()) {
    const auto openPos = content.find("{{");
    out.append(content.substr(0, openPos));
    if (openPos == std::string_view::npos) {
      break;
    }
    content.remove_prefix(openPos);

    const bool raw = content.starts_with("{{{");
    const std::string_view opening = raw ? "{{{" : "{{";
    const std::string_view closing = raw ? "}}}" : "}}";
    const auto closePos = content.find(closing, opening.size());
    if (closePos == std::string_view::npos) {
      throw TemplateRenderError("Unterminated placeholder in template '" + std::string(name) + "'");
    }
    const std::string_view key = TrimOws(content.substr(opening.size(), closePos - opening.size()));
    content.remove_prefix(closePos + closing.size());

    if (!raw && key.starts_with('>')) {
      const std::string_view partialName = TrimOws(key.substr(1));
      if (depth >= kMaxPartialDepth) {
        throw TemplateRenderError("Partial '" + std::string(partialName) + "' nested too deeply in template '" +
                                  std::string(name) + "'");
      }
      renderInto(out, partialName, data, depth + 1);
      continue;
    }
    const auto valueIt = data.find(key);
    if (valueIt == data.end()) {
      throw TemplateRenderError("Missing value '" + std::string(key) + "' for template '" + std::string(name) + "'");
    }
    if (raw) {
      out.append(valueIt->second);
    } else {
      AppendHtmlEscaped(out, valueIt->second);
    }
  }
}

}  // namespace switchyard
