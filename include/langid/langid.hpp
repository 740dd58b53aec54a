#pragma once

/**
 * langid
 *
 * Language identification for short user-facing text. Deterministic entity
 * hints first, a statistical n-gram classifier second, a configured default
 * when neither is confident.
 */

#include <langid/result.hpp>
#include <langid/types.hpp>
#include <langid/config.hpp>
#include <langid/detect/hybrid_detector.hpp>
