#pragma once
#include <string>
#include <unordered_map>
#include <memory>

struct HttpResponse {
  long status = 0;
  std::string body;
  std::string error; // transport error, empty on success
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse Post(const std::string& url,
                            const std::string& body,
                            const std::unordered_map<std::string, std::string>& headers,
                            int timeout_ms) = 0;
};

// libcurl-backed client. One easy handle per request.
std::unique_ptr<HttpClient> CreateCurlHttpClient();
