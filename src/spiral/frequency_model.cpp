#include <spiral/frequency_model.hpp>
#include <spiral/util/text.hpp>

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace spiral {

FrequencyTable::FrequencyTable(
    std::initializer_list<std::pair<std::string, double>> entries) {
    for (const auto& [token, count] : entries) {
        add(token, count);
    }
}

void FrequencyTable::add(std::string_view token, double count) {
    counts_[to_lower(token)] += count;
    total_ += count;
}

double FrequencyTable::frequency(std::string_view token) const {
    if (token.empty()) return 0.0;

    auto it = counts_.find(to_lower(token));
    if (it == counts_.end()) {
        return 0.0;
    }
    return it->second;
}

bool FrequencyTable::contains(std::string_view token) const {
    return counts_.count(to_lower(token)) > 0;
}

Result<FrequencyTable> FrequencyTable::load(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error(ErrorCode::IO_ERROR, "Cannot open frequency file: " + path.string());
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.fail() && !file.eof()) {
        return Error(ErrorCode::IO_ERROR, "Cannot read frequency file: " + path.string());
    }

    if (path.extension() == ".json") {
        return parse_json(ss.str(), path.string());
    }
    return parse_tsv(ss.str(), path.string());
}

Result<FrequencyTable> FrequencyTable::parse_json(const std::string& text,
                                                  const std::string& source) {
    FrequencyTable table;

    try {
        auto json = nlohmann::json::parse(text);
        if (!json.is_object()) {
            return Error(ErrorCode::CORRUPTION, source + ": expected a JSON object");
        }

        for (auto it = json.begin(); it != json.end(); ++it) {
            const std::string& token = it.key();
            const auto& value = it.value();
            if (!value.is_number()) {
                return Error(ErrorCode::CORRUPTION,
                             source + ": count for \"" + token + "\" is not a number");
            }
            double count = value.get<double>();
            if (count < 0) {
                return Error(ErrorCode::CORRUPTION,
                             source + ": negative count for \"" + token + "\"");
            }
            table.add(token, count);
        }
    } catch (const nlohmann::json::exception& e) {
        return Error(ErrorCode::CORRUPTION, source + ": " + e.what());
    }

    return table;
}

Result<FrequencyTable> FrequencyTable::parse_tsv(const std::string& text,
                                                 const std::string& source) {
    FrequencyTable table;
    std::istringstream in(text);
    std::string line;
    size_t line_number = 0;

    while (std::getline(in, line)) {
        ++line_number;

        auto content = trim(line);
        if (content.empty() || content.front() == '#') {
            continue;
        }

        // Token and count are separated by the last run of whitespace
        size_t sep = content.find_last_of(" \t");
        if (sep == std::string_view::npos) {
            return Error(ErrorCode::CORRUPTION,
                         source + ":" + std::to_string(line_number) + ": missing count");
        }

        auto token = trim(content.substr(0, sep));
        std::string count_text(content.substr(sep + 1));
        if (token.empty()) {
            return Error(ErrorCode::CORRUPTION,
                         source + ":" + std::to_string(line_number) + ": missing token");
        }

        char* end = nullptr;
        errno = 0;
        double count = std::strtod(count_text.c_str(), &end);
        if (end == count_text.c_str() || *end != '\0' || errno == ERANGE) {
            return Error(ErrorCode::CORRUPTION,
                         source + ":" + std::to_string(line_number) +
                         ": invalid count \"" + count_text + "\"");
        }
        if (count < 0) {
            return Error(ErrorCode::CORRUPTION,
                         source + ":" + std::to_string(line_number) + ": negative count");
        }

        table.add(token, count);
    }

    return table;
}

}  // namespace spiral
