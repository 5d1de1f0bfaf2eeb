#pragma once

#include <functional>

#include "switchyard/http-request.hpp"
#include "switchyard/http-response-writer.hpp"

namespace switchyard {

// Work to execute on a worker thread for one routed request.
using DispatchTask = std::function<void(HttpRequest&, HttpResponseWriter&)>;

// Called by listener threads for each parsed request: binds the path parameters of the matched route into
// the request and returns the task serving it, or an empty task for a routing miss.
using RequestResolver = std::function<DispatchTask(HttpRequest&)>;

// Runs 'task', turning what escapes from it into a response as long as nothing was sent yet:
//   - HttpError: its status with the message as plain text body,
//   - any other std::exception: 500, logged.
// Once the response started, errors are only logged. A response left unsent by the task is committed here.
void RunDispatchTask(const DispatchTask& task, HttpRequest& request, HttpResponseWriter& writer) noexcept;

}  // namespace switchyard
