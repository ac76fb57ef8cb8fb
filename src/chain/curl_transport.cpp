#include <glyphvault/chain/json_rpc.hpp>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include <spdlog/fmt/fmt.h>

#include <memory>
#include <mutex>

namespace glyphvault::chain {

namespace {

using curl_ptr = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using curl_slist_ptr =
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::once_flag curl_init_flag;

size_t write_callback(char* data, size_t size, size_t count, void* user) {
  auto* out = static_cast<std::string*>(user);
  out->append(data, size * count);
  return size * count;
}

}  // namespace

curl_transport::curl_transport(std::string url,
                               const std::chrono::milliseconds timeout)
    : url_(std::move(url)), timeout_(timeout) {
  std::call_once(curl_init_flag, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      spdlog::error("curl_global_init failed");
    }
  });
}

std::string curl_transport::post(const std::string& body) {
  auto curl = curl_ptr{curl_easy_init(), curl_easy_cleanup};
  if (!curl) {
    throw transport_error("curl_easy_init failed");
  }
  auto headers = curl_slist_ptr{
      curl_slist_append(nullptr, "Content-Type: application/json"),
      curl_slist_free_all};

  auto response = std::string{};
  curl_easy_setopt(curl.get(), CURLOPT_URL, url_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                   static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

  auto code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    throw transport_error(fmt::format("POST {} failed: {}", url_,
                                      curl_easy_strerror(code)));
  }
  auto status = long{};
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  if (status < 200 || status >= 300) {
    throw transport_error(
        fmt::format("POST {} returned HTTP {}", url_, status));
  }
  return response;
}

}  // namespace glyphvault::chain
