#include "dict_format.hpp"

namespace dictlsp {

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string format_definition_markdown(const std::string& word, const DictionaryEntry& entry,
                                       const FormattingConfig& cfg) {
    std::string md = replace_all(cfg.word_format, "{word}", word);
    md += '\n';

    for (const auto& part : entry.senses) {
        if (cfg.add_spacing) md += '\n';
        md += replace_all(cfg.part_of_speech_format, "{part}", part.first);
        md += '\n';

        size_t num = 1;
        for (const auto& sense : part.second) {
            // {definition} last so a definition containing "{num}" is left alone
            std::string line = replace_all(cfg.definition_format, "{num}", std::to_string(num++));
            md += replace_all(line, "{definition}", sense.definition);
            md += '\n';

            if (!sense.example.empty()) {
                md += replace_all(cfg.example_format, "{example}", sense.example);
                md += '\n';
            }
        }
    }
    return md;
}

std::string format_missing_hover(const std::string& word) {
    return "No definition found for **" + word + "**";
}

std::string format_missing_signature(const std::string& word) {
    return "No definition found for '" + word + "'";
}

} // namespace dictlsp
