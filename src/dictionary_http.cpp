#include <iostream>
#include <string>

#include <httplib.h>

#include "dict_config.hpp"
#include "dict_engine.hpp"
#include "dict_http.hpp"

using dictlsp::Engine;

int main(int argc, char** argv) {
    Engine engine;
    engine.config = dictlsp::load_config();

    if (argc >= 2) engine.config.dictionary_path = argv[1];

    int port = 8080;
    if (argc >= 3) port = std::stoi(argv[2]);
    if (argc >= 4) engine.config.freq_path = argv[3];

    if (engine.config.dictionary_path.empty()) {
        std::cerr << "Usage: dictionary_http <DICTIONARY_PATH> [port] [FREQ_PATH]\n"
                  << "Example: dictionary_http ./words.json 8080 ./freq.txt\n";
        return 1;
    }

    if (!engine.load()) {
        std::cerr << "Failed to load dictionary from: " << engine.config.dictionary_path << "\n";
        return 1;
    }

    httplib::Server svr;

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        std::cerr << "[http] " << req.method << " " << req.path << " -> " << res.status << "\n";
    });

    svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            std::cerr << "[exception] " << req.method << " " << req.path << " : " << e.what() << "\n";
        }
        res.status = 500;
        res.set_content(R"({"error":"internal server error"})", "application/json");
    });

    // CORS preflight handler (OPTIONS) for all routes
    svr.Options(R"(.*)", [](const httplib::Request& req, httplib::Response& res) {
        dictlsp::enable_cors(res);
        if (req.has_header("Access-Control-Request-Headers")) {
            res.set_header("Access-Control-Allow-Headers",
                           req.get_header_value("Access-Control-Request-Headers"));
        }
        res.status = 204;
    });

    dictlsp::register_routes(svr, engine);

    std::cout << "API running on http://127.0.0.1:" << port << "\n";
    std::cout << "Try: /api/define?w=passion\n";
    std::cout << "Try: /api/complete?q=pass&k=10\n";
    if (!svr.listen("0.0.0.0", port)) {
        std::cerr << "[http] cannot listen on port " << port << "\n";
        return 1;
    }
    return 0;
}
