#include <simcache/vector/vector_math.h>

#include <algorithm>
#include <cmath>

namespace simcache::vector {

float computeMagnitude(std::span<const float> v) {
    float sum = 0.0f;
    for (float x : v) {
        sum += x * x;
    }
    return static_cast<float>(std::sqrt(static_cast<double>(sum)));
}

float dotProduct(std::span<const float> a, std::span<const float> b) {
    float dot = 0.0f;
    const size_t n = std::min(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        dot += a[i] * b[i];
    }
    return dot;
}

float cosineSimilarity(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size() || a.empty()) {
        return 0.0f;
    }

    float dot = 0.0f, normA = 0.0f, normB = 0.0f;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += a[i] * b[i];
        normA += a[i] * a[i];
        normB += b[i] * b[i];
    }

    if (normA == 0.0f || normB == 0.0f) {
        return 0.0f;
    }

    return dot / (static_cast<float>(std::sqrt(static_cast<double>(normA))) *
                  static_cast<float>(std::sqrt(static_cast<double>(normB))));
}

float cosineSimilarity(std::span<const float> a, float magnitudeA, std::span<const float> b,
                       float magnitudeB) {
    if (a.size() != b.size() || a.empty() || magnitudeA == 0.0f || magnitudeB == 0.0f) {
        return 0.0f;
    }
    return dotProduct(a, b) / (magnitudeA * magnitudeB);
}

} // namespace simcache::vector
