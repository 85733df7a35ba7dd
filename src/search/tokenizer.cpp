#include <ragcore/search/tokenizer.h>

#include <cctype>

namespace ragcore::search {

namespace {
bool isWordByte(unsigned char c) {
    return c >= 0x80 || std::isalnum(c);
}
} // namespace

std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    std::string current;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (isWordByte(c)) {
            current.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : ch);
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

std::unordered_set<std::string> tokenSet(std::string_view text) {
    auto tokens = tokenize(text);
    return std::unordered_set<std::string>(std::make_move_iterator(tokens.begin()),
                                           std::make_move_iterator(tokens.end()));
}

double jaccardSimilarity(const std::unordered_set<std::string>& a,
                         const std::unordered_set<std::string>& b) {
    if (a.empty() && b.empty()) {
        return 0.0;
    }
    const auto& smaller = a.size() <= b.size() ? a : b;
    const auto& larger = a.size() <= b.size() ? b : a;
    size_t intersection = 0;
    for (const auto& token : smaller) {
        if (larger.count(token)) {
            ++intersection;
        }
    }
    size_t unionSize = a.size() + b.size() - intersection;
    return static_cast<double>(intersection) / static_cast<double>(unionSize);
}

} // namespace ragcore::search
