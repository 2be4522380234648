#include "lucid_core/llm/openai_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>

#include "lucid_core/errors.hpp"

namespace lucid_core {

namespace {

using json = nlohmann::json;

class CurlGlobal {
 public:
  CurlGlobal() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
  }
  ~CurlGlobal() {
    curl_global_cleanup();
  }
};

void ensure_curl_global() {
  static CurlGlobal global;
}

struct CurlDeleter {
  void operator()(CURL* handle) const {
    curl_easy_cleanup(handle);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const {
    curl_slist_free_all(list);
  }
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
  userp->append(static_cast<char*>(contents), size * nmemb);
  return size * nmemb;
}

// Non-zero return aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto* context = static_cast<const RequestContext*>(clientp);
  return context->is_cancelled() ? 1 : 0;
}

// "OpenAI API error: <message> (type: <type>)" when the body carries one.
std::string api_error_message(long status, const std::string& body) {
  json parsed = json::parse(body, nullptr, false);
  if (!parsed.is_discarded() && parsed.is_object() && parsed.contains("error") &&
      parsed["error"].is_object()) {
    const auto& error = parsed["error"];
    std::string message = error.value("message", "");
    if (!message.empty()) {
      std::string type = error.contains("type") && error["type"].is_string()
                             ? error["type"].get<std::string>()
                             : "";
      return "OpenAI API error: " + message + " (type: " + type + ")";
    }
  }
  return "OpenAI API error: status " + std::to_string(status);
}

json parse_body(const std::string& body) {
  try {
    return json::parse(body);
  } catch (const json::parse_error& e) {
    throw ProviderError(std::string("failed to unmarshal response: ") + e.what());
  }
}

}  // namespace

OpenAIClient::OpenAIClient(std::string api_key,
                           std::string base_url,
                           std::chrono::milliseconds timeout)
    : api_key_(std::move(api_key)),
      base_url_(base_url.empty() ? DEFAULT_BASE_URL : std::move(base_url)),
      timeout_(timeout) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

std::string OpenAIClient::build_embedding_request(const std::string& text,
                                                  const std::string& model) {
  json request = {{"model", model.empty() ? DEFAULT_EMBEDDING_MODEL : model}, {"input", text}};
  return request.dump();
}

std::string OpenAIClient::build_chat_request(const std::vector<ChatMessage>& messages,
                                             const std::string& model,
                                             const std::optional<CompletionOptions>& options) {
  json wire_messages = json::array();
  for (const auto& message : messages) {
    wire_messages.push_back({{"role", message.role}, {"content", message.content}});
  }

  json request = {{"model", model.empty() ? DEFAULT_CHAT_MODEL : model},
                  {"messages", wire_messages}};
  // Zero values are left out so the API applies its own defaults.
  if (options) {
    if (options->temperature != 0.0f) {
      request["temperature"] = options->temperature;
    }
    if (options->max_tokens != 0) {
      request["max_tokens"] = options->max_tokens;
    }
  }
  return request.dump();
}

std::vector<float> OpenAIClient::parse_embedding_response(long status, const std::string& body) {
  if (status != 200) {
    throw ProviderError(api_error_message(status, body));
  }
  json parsed = parse_body(body);
  try {
    if (!parsed.contains("data") || !parsed["data"].is_array() || parsed["data"].empty()) {
      throw ProviderError("no embedding returned");
    }
    auto embedding = parsed["data"][0].at("embedding").get<std::vector<float>>();
    if (embedding.empty()) {
      throw ProviderError("no embedding returned");
    }
    return embedding;
  } catch (const json::exception& e) {
    throw ProviderError(std::string("failed to unmarshal response: ") + e.what());
  }
}

std::string OpenAIClient::parse_chat_response(long status, const std::string& body) {
  if (status != 200) {
    throw ProviderError(api_error_message(status, body));
  }
  json parsed = parse_body(body);
  try {
    if (!parsed.contains("choices") || !parsed["choices"].is_array() ||
        parsed["choices"].empty()) {
      throw ProviderError("no completion returned");
    }
    return parsed["choices"][0].at("message").at("content").get<std::string>();
  } catch (const json::exception& e) {
    throw ProviderError(std::string("failed to unmarshal response: ") + e.what());
  }
}

std::vector<float> OpenAIClient::create_embedding(const std::string& text,
                                                  const std::string& model_name,
                                                  const RequestContext& context) {
  auto result = post_json("/embeddings", build_embedding_request(text, model_name), context);
  return parse_embedding_response(result.status, result.body);
}

std::string OpenAIClient::create_chat_completion(const std::vector<ChatMessage>& messages,
                                                 const std::string& model_name,
                                                 const std::optional<CompletionOptions>& options,
                                                 const RequestContext& context) {
  auto result =
      post_json("/chat/completions", build_chat_request(messages, model_name, options), context);
  return parse_chat_response(result.status, result.body);
}

OpenAIClient::HttpResult OpenAIClient::post_json(const std::string& path,
                                                 const std::string& body,
                                                 const RequestContext& context) const {
  context.check("openai " + path);
  ensure_curl_global();

  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw ProviderError("failed to create request: curl_easy_init failed");
  }

  const auto timeout = std::min(timeout_, context.remaining());
  const std::string url = base_url_ + path;
  const std::string auth = "Authorization: Bearer " + api_key_;

  curl_slist* raw_headers = curl_slist_append(nullptr, "Content-Type: application/json");
  raw_headers = curl_slist_append(raw_headers, auth.c_str());
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_headers);

  std::string response_body;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_body);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS,
                   static_cast<long>(std::max<int64_t>(1, timeout.count())));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, progress_callback);
  curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &context);

  CURLcode res = curl_easy_perform(curl.get());
  if (res == CURLE_ABORTED_BY_CALLBACK) {
    throw DeadlineExceededError("openai " + path + ": request cancelled");
  }
  if (res == CURLE_OPERATION_TIMEDOUT && context.expired()) {
    throw DeadlineExceededError("openai " + path + ": deadline exceeded");
  }
  if (res != CURLE_OK) {
    throw ProviderError(std::string("failed to send request: ") + curl_easy_strerror(res));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  return HttpResult{status, std::move(response_body)};
}

}  // namespace lucid_core
