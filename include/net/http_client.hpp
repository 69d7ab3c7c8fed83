#pragma once
#include <string>

namespace searoute::net {

// 一次 GET 的结果。error 非空表示传输层失败（超时 / DNS / 连接），
// 此时 status 没有意义。
struct HttpResponse {
  long status{0};
  std::string body;
  std::string error;

  bool ok() const { return error.empty() && status >= 200 && status < 300; }
};

// 外部数据（海岸线数据集、海况预报）都通过这个接口获取，测试里用假实现替换。
class IHttpClient {
public:
  virtual ~IHttpClient() = default;
  virtual HttpResponse Get(const std::string& url, long timeout_s) = 0;
};

// libcurl 进程级初始化 / 清理，不是线程安全的：在 main 里、起任何线程之前构造一次，
// 活到所有 CurlHttpClient 用完为止
class CurlGlobal {
public:
  CurlGlobal();
  ~CurlGlobal();

  CurlGlobal(const CurlGlobal&) = delete;
  CurlGlobal& operator=(const CurlGlobal&) = delete;
};

// 每次 Get 用独立的 easy handle，多个实例 / 多线程并发调用互不影响
class CurlHttpClient final : public IHttpClient {
public:
  CurlHttpClient() = default;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;

  HttpResponse Get(const std::string& url, long timeout_s) override;

private:
  std::string user_agent_{"searoute/1.0"};
};

} // namespace searoute::net
