/*
 * openai_embedding_client.cpp
 *
 * Notes
 * - POSTs to {base_url}/embeddings with a bearer token using the libcurl easy API.
 * - One easy handle per call; the handle is not shared across threads.
 * - Provider results carry a positional index and may arrive out of order; callers always
 *   receive vectors in input order.
 */

#include <simcache/genai/embedding_client.h>

#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace simcache::genai {

namespace {

std::once_flag g_curlInitFlag;

void ensureCurlGlobalInit() {
    std::call_once(g_curlInitFlag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

// Map CURLcode to Error
Error makeCurlError(CURLcode code, std::string_view where) {
    Error err;
    err.message = std::string(where) + ": " + curl_easy_strerror(code);
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
            err.code = ErrorCode::Timeout;
            break;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_PEER_FAILED_VERIFICATION:
            err.code = ErrorCode::NetworkError;
            break;
        default:
            err.code = ErrorCode::Unknown;
            break;
    }
    return err;
}

size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const size_t total = size * nmemb;
    if (userdata == nullptr)
        return 0;
    static_cast<std::string*>(userdata)->append(ptr, total);
    return total;
}

std::string trimTrailingSlash(std::string url) {
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

} // namespace

std::string buildEmbeddingRequestBody(const std::vector<std::string>& texts,
                                      const std::string& model, std::optional<int> dimensions) {
    nlohmann::json req;
    req["model"] = model;
    req["input"] = texts;
    req["encoding_format"] = "float";
    // Only the text-embedding-3 family accepts a dimensions override
    if (dimensions && *dimensions > 0) {
        req["dimensions"] = *dimensions;
    }
    // Invalid UTF-8 in record text is replaced with U+FFFD rather than thrown on
    return req.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<std::vector<Vector>> parseEmbeddingResponse(std::string_view body) {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return Error{ErrorCode::InvalidData, "failed to parse embeddings response"};
    }

    auto dataIt = j.find("data");
    if (dataIt == j.end() || !dataIt->is_array()) {
        return Error{ErrorCode::InvalidData, "embeddings response has no data array"};
    }

    std::vector<std::pair<int64_t, Vector>> indexed;
    indexed.reserve(dataIt->size());
    for (size_t i = 0; i < dataIt->size(); ++i) {
        const auto& item = (*dataIt)[i];
        if (!item.is_object() || !item.contains("embedding") || !item["embedding"].is_array()) {
            return Error{ErrorCode::InvalidData,
                         "embeddings response item " + std::to_string(i) + " has no embedding"};
        }
        int64_t index = static_cast<int64_t>(i);
        if (auto idx = item.find("index"); idx != item.end() && idx->is_number_integer()) {
            index = idx->get<int64_t>();
        }
        Vector v;
        v.reserve(item["embedding"].size());
        for (const auto& x : item["embedding"]) {
            if (!x.is_number()) {
                return Error{ErrorCode::InvalidData, "non-numeric value in embedding"};
            }
            v.push_back(x.get<float>());
        }
        indexed.emplace_back(index, std::move(v));
    }

    std::stable_sort(indexed.begin(), indexed.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<Vector> out;
    out.reserve(indexed.size());
    for (auto& [index, v] : indexed) {
        out.push_back(std::move(v));
    }
    return out;
}

OpenAiEmbeddingClient::OpenAiEmbeddingClient(OpenAiClientConfig config)
    : config_(std::move(config)) {
    ensureCurlGlobalInit();
}

OpenAiEmbeddingClient::~OpenAiEmbeddingClient() = default;

Result<std::vector<Vector>> OpenAiEmbeddingClient::embed(const std::vector<std::string>& texts,
                                                         const std::string& model,
                                                         std::optional<int> dimensions,
                                                         std::chrono::milliseconds timeout) {
    if (config_.api_key.empty()) {
        return Error{ErrorCode::NotInitialized, "AI API key is not configured"};
    }
    if (texts.empty()) {
        return std::vector<Vector>{};
    }

    std::string payload;
    try {
        payload = buildEmbeddingRequestBody(texts, model, dimensions);
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData,
                     std::string("failed to encode embeddings request: ") + e.what()};
    }

    const auto url = trimTrailingSlash(config_.base_url) + "/embeddings";
    auto body = post(url, payload, timeout);
    if (!body) {
        return body.error();
    }

    auto parsed = parseEmbeddingResponse(body.value());
    if (!parsed) {
        return parsed.error();
    }
    if (parsed.value().size() != texts.size()) {
        spdlog::warn("[OpenAiEmbeddingClient] Requested {} embeddings, received {}", texts.size(),
                     parsed.value().size());
    }
    return parsed;
}

Result<void> OpenAiEmbeddingClient::testConnection(const std::string& model) {
    auto r = embed({"connection test"}, model, std::nullopt, std::chrono::seconds(10));
    if (!r) {
        return r.error();
    }
    if (r.value().empty()) {
        return Error{ErrorCode::InvalidData, "no embedding returned for probe text"};
    }
    return Result<void>();
}

Result<std::string> OpenAiEmbeddingClient::post(const std::string& url, const std::string& body,
                                                std::chrono::milliseconds timeout) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return Error{ErrorCode::InternalError, "curl_easy_init failed"};
    }

    std::string response;
    const std::string auth = "Authorization: Bearer " + config_.api_key;
    curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, auth.c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(std::min(timeout, config_.connect_timeout).count()));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, config_.verify_tls ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, config_.verify_tls ? 2L : 0L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode rc = curl_easy_perform(curl);
    long status = 0;
    if (rc == CURLE_OK) {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    }

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        return makeCurlError(rc, "embeddings request");
    }
    if (status < 200 || status >= 300) {
        spdlog::warn("[OpenAiEmbeddingClient] API returned status {}", status);
        return Error{ErrorCode::UpstreamError,
                     "OpenAI API error (status " + std::to_string(status) + "): " + response};
    }
    return response;
}

} // namespace simcache::genai
