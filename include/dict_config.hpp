#pragma once

#include <string>

#include "dict_format.hpp"
#include "dict_types.hpp"

namespace dictlsp {

struct CompletionConfig {
    bool enabled = true;
    int max_distance = 3;
    size_t max_items = 20;
};

struct Config {
    FormattingConfig formatting;
    std::string dictionary_path;
    std::string freq_path; // empty: no frequency table
    CompletionConfig completion;
};

// $DICTIONARY_LSP_CONFIG, else ~/.config/dictionary-lsp/config.json
fs::path default_config_path();

// Overlay values from a JSON file onto cfg. Missing keys keep their value.
// Returns false if the file exists but cannot be used.
bool load_config_file(const fs::path& path, Config& cfg);

// Defaults, then the config file, then DICTIONARY_PATH / FREQ_PATH.
Config load_config();

json config_to_json(const Config& cfg);

} // namespace dictlsp
