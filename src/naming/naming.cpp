#include "naming.hpp"

namespace naming {

static bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static bool is_separator(char c) {
    return c == '_' || c == '-' || is_space(c);
}

static char ascii_upper(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

static char ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

static std::string lower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = ascii_lower(c);
    return out;
}

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    size_t i = 0;
    while (i < text.size()) {
        if (is_separator(text[i])) {
            words.push_back(current);
            current.clear();
            while (i < text.size() && is_separator(text[i])) i++;
        } else {
            current += text[i++];
        }
    }
    words.push_back(current);
    return words;
}

std::string capitalize(const std::string& word) {
    if (word.empty()) return word;
    std::string out = lower(word);
    out[0] = ascii_upper(word[0]);
    return out;
}

std::string to_camel(const std::string& text) {
    if (text.empty()) return text;
    auto words = split_words(text);
    std::string out = lower(words[0]);
    for (size_t i = 1; i < words.size(); i++) {
        out += capitalize(words[i]);
    }
    return out;
}

std::string to_pascal(const std::string& text) {
    if (text.empty()) return text;
    std::string out;
    for (const auto& word : split_words(text)) {
        out += capitalize(word);
    }
    return out;
}

std::string to_snake(const std::string& text) {
    std::string out;
    out.reserve(text.size() + text.size() / 2);
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];
        if (c == '-' || is_space(c)) {
            out += '_';
            while (i < text.size() && (text[i] == '-' || is_space(text[i]))) i++;
            continue;
        }
        if (c >= 'A' && c <= 'Z') {
            out += '_';
        }
        out += ascii_lower(c);
        i++;
    }
    if (!out.empty() && out[0] == '_') out.erase(0, 1);
    return out;
}

NameForms derive(const std::string& text) {
    return {to_snake(text), to_pascal(text), to_camel(text)};
}

} // namespace naming
