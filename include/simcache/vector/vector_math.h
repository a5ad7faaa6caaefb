#pragma once

#include <span>

namespace simcache::vector {

/**
 * @brief L2 norm of a vector. Returns 0 for an empty vector.
 */
float computeMagnitude(std::span<const float> v);

/**
 * @brief Cosine similarity of two raw vectors.
 *
 * Returns 0 when either vector is empty, the lengths differ, or either norm is zero.
 */
float cosineSimilarity(std::span<const float> a, std::span<const float> b);

/**
 * @brief Cosine similarity using precomputed magnitudes; only the dot product is computed.
 *
 * Same zero rules as cosineSimilarity(), plus a zero magnitude on either side yields 0.
 */
float cosineSimilarity(std::span<const float> a, float magnitudeA, std::span<const float> b,
                       float magnitudeB);

float dotProduct(std::span<const float> a, std::span<const float> b);

} // namespace simcache::vector
