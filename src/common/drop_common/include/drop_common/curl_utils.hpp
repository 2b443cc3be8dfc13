#pragma once

#include <curl/curl.h>

#include <cstddef>
#include <string>
#include <vector>

namespace drop_common
{

/// HTTP 요청 한 번의 결과.
/// status line을 받기 전에 libcurl이 실패하면 transport_ok는 false.
struct HttpReply
{
  bool transport_ok = false;
  bool timed_out = false;
  long status = 0;
  std::string body;
  std::string error;
};

/// 받은 바이트를 userp로 넘어온 std::string 뒤에 붙인다
inline size_t append_to_string(void * contents, size_t size, size_t nmemb, void * userp)
{
  const size_t total = size * nmemb;
  auto * buffer = static_cast<std::string *>(userp);
  buffer->append(static_cast<const char *>(contents), total);
  return total;
}

/// curl_global_init/cleanup 담당, 프로세스당 static 인스턴스 하나
class CurlGlobalGuard
{
public:
  CurlGlobalGuard()
  {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }

  ~CurlGlobalGuard()
  {
    curl_global_cleanup();
  }

  CurlGlobalGuard(const CurlGlobalGuard &) = delete;
  CurlGlobalGuard & operator=(const CurlGlobalGuard &) = delete;
};

/// JSON body를 POST한다. 예외를 던지지 않고 모든 실패는 reply에 담긴다.
inline HttpReply post_json(
  const std::string & url,
  const std::vector<std::string> & header_lines,
  const std::string & body,
  long timeout_sec)
{
  HttpReply reply;

  CURL * curl = curl_easy_init();
  if (!curl) {
    reply.error = "curl_init_failed";
    return reply;
  }

  struct curl_slist * headers = nullptr;
  for (const auto & h : header_lines) {
    headers = curl_slist_append(headers, h.c_str());
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_to_string);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &reply.body);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_sec);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  const CURLcode rc = curl_easy_perform(curl);
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &reply.status);

  if (rc != CURLE_OK) {
    reply.timed_out = rc == CURLE_OPERATION_TIMEDOUT;
    reply.error = std::string("curl_error:") + curl_easy_strerror(rc);
  } else {
    reply.transport_ok = true;
  }

  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);
  return reply;
}

}  // namespace drop_common
