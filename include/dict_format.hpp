#pragma once

#include <string>

#include "dict_types.hpp"

namespace dictlsp {

// Markdown templates; placeholders are {word}, {part}, {num}, {definition}, {example}.
struct FormattingConfig {
    std::string word_format = "**{word}**";
    std::string part_of_speech_format = "_{part}_";
    std::string definition_format = "{num}. {definition}";
    std::string example_format = "   > Example: _{example}_";
    bool add_spacing = false; // blank line before each part of speech
};

// Replace every occurrence of from with to (non-recursive)
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Render an entry; word is shown as typed by the user.
std::string format_definition_markdown(const std::string& word, const DictionaryEntry& entry,
                                       const FormattingConfig& cfg);

std::string format_missing_hover(const std::string& word);
std::string format_missing_signature(const std::string& word);

} // namespace dictlsp
