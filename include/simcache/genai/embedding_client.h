#pragma once

#include <simcache/core/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace simcache::genai {

/**
 * @brief External text-embedding API
 *
 * Implementations must return one vector per input text, in input order.
 */
class IEmbeddingClient {
public:
    virtual ~IEmbeddingClient() = default;

    virtual Result<std::vector<Vector>> embed(const std::vector<std::string>& texts,
                                              const std::string& model,
                                              std::optional<int> dimensions,
                                              std::chrono::milliseconds timeout) = 0;

    virtual std::string getBackendName() const = 0;
};

struct OpenAiClientConfig {
    std::string api_key;
    std::string base_url = "https://api.openai.com/v1";
    std::chrono::milliseconds connect_timeout{10000};
    bool verify_tls = true;
};

/**
 * @brief OpenAI-compatible /embeddings client over libcurl
 *
 * Synchronous; each call is bounded by the timeout passed to embed(). Non-2xx responses
 * surface as UpstreamError with the status and response body.
 */
class OpenAiEmbeddingClient final : public IEmbeddingClient {
public:
    explicit OpenAiEmbeddingClient(OpenAiClientConfig config);
    ~OpenAiEmbeddingClient() override;

    Result<std::vector<Vector>> embed(const std::vector<std::string>& texts,
                                      const std::string& model, std::optional<int> dimensions,
                                      std::chrono::milliseconds timeout) override;

    std::string getBackendName() const override { return "openai"; }

    // Embeds a short probe text with a 10s timeout
    Result<void> testConnection(const std::string& model);

private:
    Result<std::string> post(const std::string& url, const std::string& body,
                             std::chrono::milliseconds timeout);

    OpenAiClientConfig config_;
};

// Request payload: {"model","input","encoding_format":"float","dimensions"?}
std::string buildEmbeddingRequestBody(const std::vector<std::string>& texts,
                                      const std::string& model, std::optional<int> dimensions);

// Parses the provider response and orders the vectors by their "index" field
Result<std::vector<Vector>> parseEmbeddingResponse(std::string_view body);

} // namespace simcache::genai
