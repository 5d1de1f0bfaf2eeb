#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>

namespace switchyard {

// Produces the application instance handed to each request.
//  - Fresh:   a default constructed instance per request, no state leaks from one request to another.
//  - Cloning: a copy of a seed instance built once at startup. Suited to applications made of shared handles
//             (std::shared_ptr to atomics, connection pools...) that every request must see.
// create() is called concurrently from worker threads: the seed is only read.
template <class App>
class ApplicationFactory {
 public:
  enum class Mode : uint8_t { Fresh, Cloning };

  static ApplicationFactory Fresh()
    requires std::default_initializable<App>
  {
    return ApplicationFactory(nullptr);
  }

  static ApplicationFactory Cloning(App seed)
    requires std::copy_constructible<App>
  {
    return ApplicationFactory(std::make_shared<const App>(std::move(seed)));
  }

  // Exceptions thrown by the application constructors propagate to the caller.
  [[nodiscard]] App create() const {
    if constexpr (std::copy_constructible<App>) {
      if (_seed) {
        return App(*_seed);
      }
    }
    if constexpr (std::default_initializable<App>) {
      return App();
    } else {
      throw std::logic_error("Application type cannot be default constructed, start the server with a seed");
    }
  }

  [[nodiscard]] Mode mode() const noexcept { return _seed ? Mode::Cloning : Mode::Fresh; }

 private:
  explicit ApplicationFactory(std::shared_ptr<const App> seed) noexcept : _seed(std::move(seed)) {}

  std::shared_ptr<const App> _seed;
};

}  // namespace switchyard
