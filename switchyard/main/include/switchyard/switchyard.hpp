#pragma once

// Convenience header for applications.

#include "switchyard/cookie.hpp"
#include "switchyard/form-data.hpp"
#include "switchyard/http-constants.hpp"
#include "switchyard/http-error.hpp"
#include "switchyard/http-method.hpp"
#include "switchyard/http-request.hpp"
#include "switchyard/http-response-stream.hpp"
#include "switchyard/http-response-writer.hpp"
#include "switchyard/http-status-code.hpp"
#include "switchyard/log.hpp"
#include "switchyard/path-handlers.hpp"
#include "switchyard/placeholder-template-engine.hpp"
#include "switchyard/router-config.hpp"
#include "switchyard/router.hpp"
#include "switchyard/server-config.hpp"
#include "switchyard/server.hpp"
#include "switchyard/signal-handler.hpp"
#include "switchyard/static-file-handler.hpp"
#include "switchyard/template-engine.hpp"
