#include <spiral/dictionary.hpp>
#include <spiral/util/text.hpp>

#include <fstream>

namespace spiral {

WordListDictionary::WordListDictionary(std::initializer_list<std::string> words) {
    for (const auto& word : words) {
        add(word);
    }
}

void WordListDictionary::add(std::string_view word) {
    auto trimmed = trim(word);
    if (!trimmed.empty()) {
        words_.insert(to_lower(trimmed));
    }
}

bool WordListDictionary::is_word(std::string_view token) const {
    if (token.empty()) return false;
    return words_.count(to_lower(token)) > 0;
}

Result<WordListDictionary> WordListDictionary::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open word list: " + path.string());
    }

    WordListDictionary dictionary;
    std::string line;
    while (std::getline(file, line)) {
        auto word = trim(line);
        if (word.empty() || word.front() == '#') {
            continue;
        }
        dictionary.add(word);
    }

    if (file.bad()) {
        return Error(ErrorCode::IO_ERROR, "Cannot read word list: " + path.string());
    }

    return dictionary;
}

}  // namespace spiral
