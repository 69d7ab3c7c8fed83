#include <cmath>
#include <iostream>
#include <string>

#include "io/config_loader.hpp"
#include "io/output_writer.hpp"
#include "io/request_io.hpp"
#include "landmask/land_mask.hpp"
#include "net/http_client.hpp"
#include "service/route_service.hpp"

int main(int argc, char** argv) {
  // 用法：
  //   ./searoute_cli request.json
  //   ./searoute_cli request.json out/ config.json
  // 默认输出到 output/，配置缺省时用内置默认值
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <request.json> [output_dir] [config.json]\n";
    return 2;
  }

  const std::string request_path = argv[1];
  std::string output_dir = "output";
  if (argc >= 3) output_dir = argv[2];

  try {
    const searoute::net::CurlGlobal curl_global;

    // 1) 配置 + 请求
    searoute::RouterConfig cfg;
    if (argc >= 4) cfg = searoute::io::ConfigLoader::Load(argv[3]);

    searoute::RouteRequest req;
    try {
      req = searoute::io::RequestIO::ParseRequest(searoute::io::RequestIO::LoadRequestFile(request_path));
    } catch (const searoute::io::RequestError& e) {
      std::cerr << "ERROR (400): " << e.what() << "\n";
      std::cout << searoute::io::OutputWriter::BuildError(e.what()).dump() << "\n";
      return 2;
    }

    // 2) 跑完整流程（陆地掩膜 -> 天气 -> 搜索 -> 指标）
    searoute::net::CurlHttpClient http;
    searoute::Pipeline::Dependencies deps;
    deps.land_mask = &searoute::LandMaskProvider::Instance();
    deps.http = &http;

    searoute::RouteService service(cfg, deps);
    const searoute::RouteContext ctx = service.Optimize(req);

    // 3) 输出（output.json + route.csv）
    searoute::io::OutputWriter::WriteAll(ctx, output_dir);

    std::cout << "Done. " << ctx.result.points.size() << " route points, "
              << std::lround(ctx.result.distance_nm) << " nm. Output written to: "
              << output_dir << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
