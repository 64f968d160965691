#include <iostream>
#include <string>
#include <thread>

#include "dict_config.hpp"
#include "dict_engine.hpp"
#include "dict_lsp.hpp"
#include "dict_session.hpp"

using dictlsp::Engine;

int main(int argc, char** argv) {
    // stdout carries protocol frames only
    std::ios::sync_with_stdio(false);

    Engine engine;
    engine.config = dictlsp::load_config();

    if (argc >= 2) engine.config.dictionary_path = argv[1];
    if (argc >= 3) engine.config.freq_path = argv[2];

    if (engine.config.dictionary_path.empty()) {
        std::cerr << "Usage: dictionary_lsp [DICTIONARY_PATH] [FREQ_PATH]\n"
                  << "Set dictionary_path in " << dictlsp::default_config_path().string()
                  << " or DICTIONARY_PATH to skip the arguments.\n";
        return 1;
    }

    if (!engine.load()) {
        std::cerr << "Failed to load dictionary from: " << engine.config.dictionary_path << "\n";
        return 1;
    }

    size_t workers = std::thread::hardware_concurrency();
    if (workers == 0) workers = 2;
    if (workers > 8) workers = 8;

    dictlsp::Session session(engine);
    dictlsp::LspServer server(session, std::cin, std::cout, workers);

    std::cerr << "[lsp] " << dictlsp::kServerName << " " << dictlsp::kServerVersion
              << " ready (" << engine.store.backend_name() << ", " << workers << " workers)\n";
    return server.run();
}
