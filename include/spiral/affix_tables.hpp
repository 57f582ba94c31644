#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

namespace spiral {

/**
 * Known Latin/Greek prefixes and suffixes.
 *
 * The lists come from the Samurai identifier splitter (Enslen, Hill, Pollock
 * and Vijay-Shanker, MSR 2009). A cut that would strand one of these as a
 * separate token is never taken.
 *
 * Membership is a case-insensitive exact match.
 */
class AffixTables {
public:
    static bool is_prefix(std::string_view s);
    static bool is_suffix(std::string_view s);

    static const std::unordered_set<std::string>& prefixes();
    static const std::unordered_set<std::string>& suffixes();
};

}  // namespace spiral
