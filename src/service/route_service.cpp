#include "service/route_service.hpp"

#include <exception>
#include <iostream>
#include <utility>

#include "io/output_writer.hpp"
#include "io/request_io.hpp"

namespace searoute {

RouteService::RouteService(RouterConfig config, Pipeline::Dependencies deps)
    : config_(std::move(config)), pipeline_(deps) {}

RouteContext RouteService::Optimize(const RouteRequest& request) {
  RouteContext ctx;
  ctx.request = request;
  ctx.config = config_;
  pipeline_.Run(ctx);
  return ctx;
}

ServiceResponse RouteService::Handle(const nlohmann::json& request_body) {
  ServiceResponse resp;

  RouteRequest req;
  try {
    req = io::RequestIO::ParseRequest(request_body);
  } catch (const io::RequestError& e) {
    std::cerr << "[service] rejected request: " << e.what() << "\n";
    resp.status = 400;
    resp.body = io::OutputWriter::BuildError(e.what());
    return resp;
  }

  try {
    const RouteContext ctx = Optimize(req);
    resp.status = 200;
    resp.body = io::OutputWriter::BuildResponse(ctx);
  } catch (const std::exception& e) {
    std::cerr << "[service] route optimization failed: " << e.what() << "\n";
    resp.status = 500;
    resp.body = io::OutputWriter::BuildError("Failed to optimize route");
  }
  return resp;
}

} // namespace searoute
