#include "dict_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace dictlsp {

static std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

// Expand a leading "~/" using $HOME
static std::string expand_home(const std::string& p) {
    if (p.size() >= 2 && p[0] == '~' && p[1] == '/') {
        std::string home = env_or_empty("HOME");
        if (!home.empty()) return home + p.substr(1);
    }
    return p;
}

fs::path default_config_path() {
    std::string over = env_or_empty("DICTIONARY_LSP_CONFIG");
    if (!over.empty()) return fs::path(expand_home(over));

    std::string xdg = env_or_empty("XDG_CONFIG_HOME");
    if (!xdg.empty()) return fs::path(xdg) / "dictionary-lsp" / "config.json";

    std::string home = env_or_empty("HOME");
    if (home.empty()) return fs::path("config.json");
    return fs::path(home) / ".config" / "dictionary-lsp" / "config.json";
}

bool load_config_file(const fs::path& path, Config& cfg) {
    if (!fs::exists(path)) {
        std::cerr << "[config] no config file at " << path.string() << ", using defaults\n";
        return true;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        std::cerr << "[config] cannot open " << path.string() << "\n";
        return false;
    }

    try {
        json j;
        in >> j;
        if (!j.is_object()) {
            std::cerr << "[config] " << path.string() << " is not a JSON object\n";
            return false;
        }

        // Parse into a copy so a type error half way leaves cfg untouched
        Config next = cfg;
        next.dictionary_path = expand_home(j.value("dictionary_path", next.dictionary_path));
        next.freq_path = expand_home(j.value("freq_path", next.freq_path));

        if (j.contains("formatting") && j["formatting"].is_object()) {
            const json& f = j["formatting"];
            FormattingConfig& fc = next.formatting;
            fc.word_format = f.value("word_format", fc.word_format);
            fc.part_of_speech_format = f.value("part_of_speech_format", fc.part_of_speech_format);
            fc.definition_format = f.value("definition_format", fc.definition_format);
            fc.example_format = f.value("example_format", fc.example_format);
            fc.add_spacing = f.value("add_spacing", fc.add_spacing);
        }

        if (j.contains("completion") && j["completion"].is_object()) {
            const json& c = j["completion"];
            CompletionConfig& cc = next.completion;
            cc.enabled = c.value("enabled", cc.enabled);
            cc.max_distance = c.value("max_distance", cc.max_distance);
            cc.max_items = c.value("max_items", cc.max_items);
            if (cc.max_distance < 0) cc.max_distance = 0;
        }

        cfg = std::move(next);
    } catch (const std::exception& e) {
        std::cerr << "[config] malformed " << path.string() << ": " << e.what() << "\n";
        return false;
    }

    std::cerr << "[config] loaded " << path.string() << "\n";
    return true;
}

Config load_config() {
    Config cfg;
    fs::path path = default_config_path();
    if (!load_config_file(path, cfg)) {
        std::cerr << "[config] falling back to defaults\n";
        cfg = Config();
    }

    std::string dict = env_or_empty("DICTIONARY_PATH");
    if (!dict.empty()) cfg.dictionary_path = expand_home(dict);
    std::string freq = env_or_empty("FREQ_PATH");
    if (!freq.empty()) cfg.freq_path = expand_home(freq);
    return cfg;
}

json config_to_json(const Config& cfg) {
    json j;
    j["dictionary_path"] = cfg.dictionary_path;
    j["freq_path"] = cfg.freq_path;
    j["formatting"] = {
        {"word_format", cfg.formatting.word_format},
        {"part_of_speech_format", cfg.formatting.part_of_speech_format},
        {"definition_format", cfg.formatting.definition_format},
        {"example_format", cfg.formatting.example_format},
        {"add_spacing", cfg.formatting.add_spacing},
    };
    j["completion"] = {
        {"enabled", cfg.completion.enabled},
        {"max_distance", cfg.completion.max_distance},
        {"max_items", cfg.completion.max_items},
    };
    return j;
}

} // namespace dictlsp
