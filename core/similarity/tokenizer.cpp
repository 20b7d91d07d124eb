#include "similarity/tokenizer.hpp"

#include <cctype>
#include <cstring>

namespace weave {

namespace {

const std::unordered_set<std::string>& stopWords() {
    static const std::unordered_set<std::string> words = {
        "a", "an", "the", "is", "are", "was", "were", "be", "been", "being",
        "have", "has", "had", "do", "does", "did", "will", "would", "could",
        "should", "may", "might", "shall", "can", "need", "dare", "ought",
        "for", "and", "nor", "but", "or", "yet", "so", "in", "on", "at",
        "to", "of", "by", "up", "as", "if", "it", "its", "with", "this",
        "that", "from", "not", "no", "vs", "via", "than", "then", "use",
        "using", "used",
    };
    return words;
}

bool isSeparator(unsigned char c) {
    if (std::isspace(c)) return true;
    static const char* punctuation = "-_/\\.,;:()[]{}'\"!?@#$%^&*+=<>|~`";
    return c != '\0' && std::strchr(punctuation, c) != nullptr;
}

bool isLower(unsigned char c) { return c >= 'a' && c <= 'z'; }
bool isUpper(unsigned char c) { return c >= 'A' && c <= 'Z'; }

// "useContext" → "use Context", "XMLParser" → "XML Parser".
std::string splitCamelCase(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 8);
    for (size_t i = 0; i < text.size(); i++) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        if (i > 0 && isUpper(c)) {
            unsigned char prev = static_cast<unsigned char>(text[i - 1]);
            bool lower_to_upper = isLower(prev);
            bool acronym_end = isUpper(prev) && i + 1 < text.size() &&
                               isLower(static_cast<unsigned char>(text[i + 1]));
            if (lower_to_upper || acronym_end) out.push_back(' ');
        }
        out.push_back(text[i]);
    }
    return out;
}

} // namespace

bool isStopWord(const std::string& token) {
    return stopWords().count(token) > 0;
}

TokenSet tokenize(const std::string& text) {
    TokenSet tokens;
    std::string expanded = splitCamelCase(text);

    std::string current;
    auto flush = [&]() {
        if (current.size() >= 2 && !isStopWord(current)) {
            tokens.insert(current);
        }
        current.clear();
    };

    for (char ch : expanded) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (isSeparator(c)) {
            flush();
        } else {
            current.push_back(static_cast<char>(std::tolower(c)));
        }
    }
    flush();
    return tokens;
}

} // namespace weave
