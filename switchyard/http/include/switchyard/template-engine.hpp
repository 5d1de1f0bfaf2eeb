#pragma once

#include <functional>
#include <map>
#include <stdexcept>
#include <string>
#include <string_view>

namespace switchyard {

// Key ordered data given to a template.
using TemplateData = std::map<std::string, std::string, std::less<>>;

class TemplateRenderError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Renders named templates. Implementations must be safe to call concurrently from several worker threads.
class TemplateEngine {
 public:
  virtual ~TemplateEngine() = default;

  // Throws TemplateRenderError if the template is unknown or cannot be rendered with 'data'.
  [[nodiscard]] virtual std::string render(std::string_view name, const TemplateData& data) const = 0;
};

}  // namespace switchyard
