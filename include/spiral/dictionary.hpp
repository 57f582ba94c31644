#pragma once

#include <spiral/result.hpp>

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_set>

namespace spiral {

/**
 * Natural-language dictionary membership test. Case-insensitive.
 */
class DictionaryOracle {
public:
    virtual ~DictionaryOracle() = default;

    virtual bool is_word(std::string_view token) const = 0;
};

/**
 * Dictionary backed by a plain word list (one word per line), such as
 * /usr/share/dict/words.
 */
class WordListDictionary : public DictionaryOracle {
public:
    WordListDictionary() = default;
    WordListDictionary(std::initializer_list<std::string> words);

    static Result<WordListDictionary> load(const std::filesystem::path& path);

    bool is_word(std::string_view token) const override;

    void add(std::string_view word);
    size_t size() const { return words_.size(); }

private:
    std::unordered_set<std::string> words_;
};

}  // namespace spiral
