#pragma once

/**
 * decomment
 *
 * Strips comments from source text using per-language delimiter tables.
 */

#include <decomment/types.hpp>
#include <decomment/result.hpp>
#include <decomment/pattern_registry.hpp>
#include <decomment/comment_stripper.hpp>
