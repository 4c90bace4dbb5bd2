#include <junction/dispatch-result.hpp>
#include <junction/endpoint-error.hpp>
#include <junction/http-method.hpp>
#include <junction/http-request.hpp>
#include <junction/http-response.hpp>
#include <junction/http-response-dispatch.hpp>
#include <junction/http-status-code.hpp>
#include <junction/log.hpp>
#include <junction/request-body.hpp>
#include <junction/request-task.hpp>
#include <junction/router.hpp>
#include <junction/trace-middleware.hpp>
#include <junction/transport-request.hpp>

#include <atomic>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

using namespace junction;

namespace {

struct AppState {
  std::atomic<int> created{0};
};

}  // namespace

// Reads "METHOD target [body]" lines on stdin and prints the response of each one.
int main() {
  log::set_level(log::level::debug);

  try {
    Router<AppState> router;
    router.with(TraceMiddleware<AppState>());

    router.at("/").get([]() { return HttpResponse("Hello from junction minimal example!\n"); });

    auto users = router.at("/users");
    users.get([]() { return HttpResponse("[]"); })
        .post([](Request<AppState>& req) -> RequestTask<HttpResponse> {
          std::string name = co_await req.body().text();
          const int id = ++req.state().created;
          co_return HttpResponse(http::StatusCodeCreated).body("created " + name + " with id " + std::to_string(id));
        });
    users.at("/{id}").get([](Request<AppState>& req) {
      const auto id = req.param<int>("id");
      if (!id) {
        throw EndpointError("user id must be an integer", http::StatusCodeBadRequest);
      }
      return HttpResponse("user " + std::to_string(*id));
    });

    router.at("/files/*").get([](Request<AppState>& req) { return HttpResponse(std::string(req.remainder())); });

    // "GET /reports/2024.csv" binds year=2024 and fmt=csv, "GET /reports/last" is a 404
    router.at("/reports/{year:uint}{fmt:oext}").get([](Request<AppState>& req) {
      return HttpResponse("report " + std::string(req.param("year").value_or("")) + " as " +
                          std::string(req.param("fmt").value_or("html")));
    });

    // served for any method token, PROPFIND or MKCOL included
    router.at("/dav/{resource:path}").all([](Request<AppState>& req) {
      return HttpResponse(std::string(req.methodToken()) + " on " + std::string(req.param("resource").value_or("")));
    });

    const auto frozen = std::move(router).build();
    auto state = std::make_shared<AppState>();

    std::string line;
    while (std::getline(std::cin, line)) {
      std::istringstream iss(line);
      TransportRequest request;
      std::string body;
      if (!(iss >> request.methodToken >> request.target)) {
        continue;
      }
      std::getline(iss >> std::ws, body);
      request.body = RequestBody(std::move(body));

      DispatchResult result = frozen.handle(std::move(request), state).runSynchronously();
      std::cout << result.response.status() << ' ' << result.response.reason() << " ("
                << OutcomeToStr(result.outcome) << ")\n"
                << result.response.bodyInMemory() << '\n';
    }
  } catch (const std::exception& ex) {
    log::critical("minimal example failed: {}", ex.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
