#pragma once

#include <string>
#include <vector>

// Identifier casing used by every template and output path.
//
// All functions are ASCII-only and ignore the locale: bytes outside A-Z/a-z
// pass through unchanged. Empty input gives empty output.
namespace naming {

// Split on runs of '_', '-' or whitespace. Leading/trailing separators yield
// an empty first/last word ("_user" -> {"", "user"}).
std::vector<std::string> split_words(const std::string& text);

// First character uppercased, remainder lowercased ("XML" -> "Xml").
std::string capitalize(const std::string& word);

// "user_profile" -> "userProfile"
std::string to_camel(const std::string& text);

// "user_profile" -> "UserProfile"
std::string to_pascal(const std::string& text);

// "UserProfile" -> "user_profile". Works on the raw text, not on the words:
// '_' is inserted before every capital, '-'/whitespace runs become one '_',
// and a single leading '_' is dropped. Existing '_' runs are kept, so
// "User Profile" -> "user__profile".
std::string to_snake(const std::string& text);

struct NameForms {
    std::string snake;
    std::string pascal;
    std::string camel;
};

NameForms derive(const std::string& text);

} // namespace naming
