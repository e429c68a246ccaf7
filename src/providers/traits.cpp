#include "ollacode/providers/traits.hpp"

#include "ollacode/common/fs.hpp"
#include "ollacode/common/json_util.hpp"

#include <curl/curl.h>

#include <sstream>

namespace ollacode::providers {

namespace {

constexpr const char *USER_AGENT = "ollacode/0.1";
constexpr const char *CANCELLED_TAG = "Provider error [cancelled]";

struct WriteContext {
  std::string *output = nullptr;
  const StreamChunkCallback *on_chunk = nullptr;
  bool aborted = false;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<WriteContext *>(userdata);
  context->output->append(ptr, total);
  if (context->on_chunk != nullptr && *context->on_chunk) {
    if (!(*context->on_chunk)(std::string_view(ptr, total))) {
      context->aborted = true;
      return 0;
    }
  }
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  const std::string header(buffer, total);
  auto *headers = static_cast<Headers *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    (*headers)[common::to_lower(common::trim(header.substr(0, separator)))] =
        common::trim(header.substr(separator + 1));
  }
  return total;
}

HttpResponse execute_request(const std::string &url, const Headers &headers,
                             const std::optional<std::string> &body,
                             const std::uint64_t timeout_ms,
                             const StreamChunkCallback *on_chunk = nullptr) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  WriteContext context{.output = &response.body, .on_chunk = on_chunk};
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);

  if (body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body->size()));
  } else {
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  if (context.aborted) {
    response.aborted = true;
  } else if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

std::string error_detail(const HttpResponse &response) {
  if (const auto parsed = common::json_parse_object(response.body); parsed.has_value()) {
    if (const auto it = parsed->find("error"); it != parsed->end() && !it->second.empty()) {
      return it->second;
    }
  }
  return common::trim(response.body);
}

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "Provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  case ProviderErrorCode::Cancelled:
    stream << "cancelled";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

double ChatStats::tokens_per_second() const {
  if (eval_duration == 0) {
    return 0.0;
  }
  return static_cast<double>(eval_count) / (static_cast<double>(eval_duration) / 1e9);
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const Headers &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return execute_request(url, headers, body, timeout_ms);
}

HttpResponse CurlHttpClient::post_json_stream(const std::string &url, const Headers &headers,
                                              const std::string &body,
                                              const std::uint64_t timeout_ms,
                                              const StreamChunkCallback &on_chunk) {
  return execute_request(url, headers, body, timeout_ms, &on_chunk);
}

HttpResponse CurlHttpClient::get(const std::string &url, const Headers &headers,
                                 const std::uint64_t timeout_ms) {
  return execute_request(url, headers, std::nullopt, timeout_ms);
}

common::Status validate_response_status(const HttpResponse &response) {
  if (response.aborted) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::Cancelled, .message = "request cancelled"}
            .to_string());
  }
  if (response.timeout) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"}
            .to_string());
  }
  if (response.network_error) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::NetworkError,
                                               .message = response.network_error_message}
                                     .to_string());
  }
  if (response.status == 404) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::ModelNotFound,
                                               .status = response.status,
                                               .message = error_detail(response)}
                                     .to_string());
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::ApiError,
                                               .status = response.status,
                                               .message = error_detail(response)}
                                     .to_string());
  }
  return common::Status::success();
}

bool is_cancellation_error(const std::string &error) {
  return common::starts_with(error, CANCELLED_TAG);
}

} // namespace ollacode::providers
