#pragma once

#include <langid/detect/hybrid_detector.hpp>
#include <langid/types.hpp>

#include <nlohmann/json.hpp>

namespace langid {

// JSON forms used by the CLI. Found by nlohmann::json through ADL, so
// `nlohmann::json j = result;` works directly.

void to_json(nlohmann::json& j, const EntityHint& hint);
void to_json(nlohmann::json& j, const LanguageCandidate& candidate);
void to_json(nlohmann::json& j, const Diagnostics& diagnostics);

/**
 * {"language", "confidence", "method"} plus "diagnostics" when the result
 * carries them.
 */
void to_json(nlohmann::json& j, const DetectionResult& result);

void to_json(nlohmann::json& j, const CacheStats& stats);
void to_json(nlohmann::json& j, const DetectorStats& stats);

}  // namespace langid
