#include <spiral/simple_splitter.hpp>
#include <spiral/util/text.hpp>

namespace spiral {

std::vector<std::string> DelimiterSplitter::split(std::string_view identifier) const {
    std::vector<std::string> segments;
    std::string current;

    auto flush = [&segments, &current]() {
        if (!current.empty()) {
            segments.push_back(std::move(current));
            current.clear();
        }
    };

    for (char c : identifier) {
        if (!is_alnum(c)) {
            flush();
            continue;
        }

        if (is_digit(c)) {
            if (!keep_digits_) {
                flush();
                continue;
            }
            if (!current.empty() && !is_digit(current.back())) {
                flush();
            }
            current += c;
            continue;
        }

        if (!current.empty()) {
            char prev = current.back();
            if (is_digit(prev) || (is_lower(prev) && is_upper(c))) {
                flush();
            }
        }
        current += c;
    }

    flush();
    return segments;
}

}  // namespace spiral
