#pragma once

#include <functional>
#include <variant>

#include "switchyard/http-request.hpp"
#include "switchyard/http-response-writer.hpp"

namespace switchyard {

// Handler bound to the application type of the server. It receives the application instance created for
// the request. Member functions 'void App::f(const HttpRequest&, HttpResponseWriter&)' convert to it.
template <class App>
using InstanceHandler = std::function<void(App&, const HttpRequest&, HttpResponseWriter&)>;

// Handler without application instance, typically serving files of a mount point.
using StaticHandler = std::function<void(const HttpRequest&, HttpResponseWriter&)>;

// Hook called on the application instance before the route handler, with a mutable request.
// It may derive request attributes, but answering is left to the handler.
template <class App>
using Middleware = std::function<void(App&, HttpRequest&)>;

template <class App>
using HandlerDescriptor = std::variant<InstanceHandler<App>, StaticHandler>;

}  // namespace switchyard
