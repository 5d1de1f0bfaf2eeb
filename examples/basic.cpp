#include <atomic>
#include <charconv>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

#include "switchyard/switchyard.hpp"

using namespace switchyard;

namespace {

// One instance per request, copied from the seed given to startWith(): the visit counter is shared,
// the user name is per request.
class DemoApp {
 public:
  DemoApp() : _visits(std::make_shared<std::atomic<uint64_t>>(0)) {}

  void identify(HttpRequest& request) {
    _visitNumber = ++*_visits;
    _user = request.cookie("user").value_or("stranger");
    request.setAttribute("visit", std::to_string(_visitNumber));
  }

  void home(const HttpRequest&, HttpResponseWriter& writer) {
    writer.contentType(http::ContentTypeTextPlain).send("Hello " + _user + ", visit #" + std::to_string(_visitNumber));
  }

  void hello(const HttpRequest& request, HttpResponseWriter& writer) {
    writer.render("greeting", {{"first_name", std::string(request.pathParam("first_name").value_or(""))},
                               {"last_name", std::string(request.pathParam("last_name").value_or(""))},
                               {"visits", std::to_string(_visitNumber)}});
  }

  void greet(const HttpRequest& request, HttpResponseWriter& writer) {
    const FormData form = request.form();
    const auto firstName = form.value("first_name");
    if (!firstName || firstName->empty()) {
      throw HttpError(http::StatusCodeBadRequest, "first_name is required");
    }
    writer.cookie(Cookie{.name = "user", .value = std::string(*firstName), .path = "/", .httpOnly = true});
    writer.redirect("/hello/" + std::string(*firstName) + "/" + std::string(form.value("last_name").value_or("")),
                    http::StatusCodeSeeOther);
  }

  void logout(const HttpRequest&, HttpResponseWriter& writer) {
    writer.cookie(Cookie{.name = "user", .value = "", .path = "/", .maxAge = std::chrono::seconds{0}});
    writer.redirect("/");
  }

  // Body parts are sent as soon as they are produced.
  void stream(const HttpRequest&, HttpResponseWriter& writer) {
    writer.contentType(http::ContentTypeTextPlain);
    HttpResponseStream out = writer.stream();
    for (std::string_view part : {"toto\n", "tata\n", "titi\n"}) {
      if (!out.append(part)) {
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{500});
    }
  }

  // The response is completed by another thread after the handler returned.
  void later(const HttpRequest&, HttpResponseWriter& writer) {
    std::thread([writer = std::move(writer)]() mutable {
      std::this_thread::sleep_for(std::chrono::seconds{1});
      writer.contentType(http::ContentTypeTextPlain).send("answered one second later\n");
    }).detach();
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> _visits;
  std::string _user;
  uint64_t _visitNumber{};
};

}  // namespace

int main(int argc, char** argv) {
  uint16_t port = 8080;
  std::filesystem::path resourceDir = ".";
  if (argc > 1) {
    const auto [ptr, errc] = std::from_chars(argv[1], argv[1] + std::strlen(argv[1]), port);
    if (errc != std::errc{} || ptr != argv[1] + std::strlen(argv[1])) {
      std::cerr << "Invalid port number: " << argv[1] << '\n';
      return EXIT_FAILURE;
    }
  }
  if (argc > 2) {
    resourceDir = argv[2];
  }

  log::set_level(log::level::info);
  SignalHandler::Enable();

  try {
    Router<DemoApp> router;
    router.setMiddleware(&DemoApp::identify)
        .get("/", &DemoApp::home)
        .get("/hello/:first_name/:last_name", &DemoApp::hello)
        .post("/greet", &DemoApp::greet)
        .get("/logout", &DemoApp::logout)
        .get("/stream", &DemoApp::stream)
        .get("/later", &DemoApp::later)
        .mountStatic("/static", StaticFileHandler(resourceDir / "web"));

    auto templates = std::make_shared<PlaceholderTemplateEngine>();
    templates->registerDirectory(resourceDir / "views");

    Server<DemoApp> server(ServerConfig{}.withPort(port), std::move(router));
    server.setTemplateEngine(std::move(templates));

    log::info("Serving on port {} with resources from {}", server.port(), resourceDir.string());
    server.startWith(DemoApp{});  // blocks until Ctrl+C
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
