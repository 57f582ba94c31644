#pragma once

#include <spiral/result.hpp>

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace spiral {

/**
 * Read-only corpus frequency lookup.
 *
 * Implementations are case-insensitive and never fail: unknown tokens,
 * including the empty string, have frequency 0.
 */
class FrequencyModel {
public:
    virtual ~FrequencyModel() = default;

    virtual double frequency(std::string_view token) const = 0;
};

/**
 * In-memory frequency table keyed by lower-cased token.
 *
 * File formats accepted by load():
 * - *.json: a single object mapping token to count
 * - anything else: one "token count" pair per line, '#' starts a comment
 */
class FrequencyTable : public FrequencyModel {
public:
    FrequencyTable() = default;
    FrequencyTable(std::initializer_list<std::pair<std::string, double>> entries);

    static Result<FrequencyTable> load(const std::filesystem::path& path);
    static Result<FrequencyTable> parse_json(const std::string& text,
                                             const std::string& source = "<json>");
    static Result<FrequencyTable> parse_tsv(const std::string& text,
                                            const std::string& source = "<tsv>");

    double frequency(std::string_view token) const override;

    // Adds to any existing count for the same (case-folded) token
    void add(std::string_view token, double count);

    bool contains(std::string_view token) const;
    size_t size() const { return counts_.size(); }
    double total() const { return total_; }

private:
    std::unordered_map<std::string, double> counts_;
    double total_ = 0.0;
};

}  // namespace spiral
