#pragma once

/**
 * spiral - identifier splitting for source code analysis.
 *
 * Splits identifiers such as "getMAX" or "httpexceptions" into word tokens
 * using corpus frequencies, a dictionary and known affixes.
 */

#include <spiral/types.hpp>
#include <spiral/result.hpp>
#include <spiral/samurai_splitter.hpp>
