#pragma once

#include <spiral/types.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace spiral {

/**
 * First-pass splitter for unambiguous boundaries.
 *
 * Returns non-empty segments in identifier order.
 */
class SimpleSplitter {
public:
    virtual ~SimpleSplitter() = default;

    virtual std::vector<std::string> split(std::string_view identifier) const = 0;
};

/**
 * Splits on hard delimiters, digit runs and lower-to-upper case transitions.
 *
 *   usage_getdata  -> usage getdata
 *   getMAX         -> get MAX
 *   utf8string     -> utf 8 string
 *   GPSmodule      -> GPSmodule     (upper-to-lower is left for later)
 *
 * Any non-alphanumeric character is a delimiter and is dropped.
 */
class DelimiterSplitter : public SimpleSplitter {
public:
    explicit DelimiterSplitter(bool keep_digits = true)
        : keep_digits_(keep_digits) {}

    std::vector<std::string> split(std::string_view identifier) const override;

private:
    bool keep_digits_;
};

}  // namespace spiral
