#include "dict_http.hpp"

#include <httplib.h>

#include <chrono>
#include <iostream>

#include "dict_config.hpp"
#include "dict_format.hpp"
#include "dict_text.hpp"

namespace dictlsp {

void enable_cors(httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type");
}

json entry_to_json(const DictionaryEntry& entry) {
    json senses = json::object();
    for (const auto& part : entry.senses) {
        json list = json::array();
        for (const auto& s : part.second) {
            json item;
            item["definition"] = s.definition;
            if (!s.example.empty()) item["example"] = s.example;
            list.push_back(std::move(item));
        }
        senses[part.first] = std::move(list);
    }

    json j;
    j["word"] = entry.word;
    j["senses"] = std::move(senses);
    return j;
}

json completions_to_json(const std::string& query, const std::vector<CompletionItem>& items) {
    json arr = json::array();
    for (const auto& c : items) {
        json item;
        item["word"] = c.word;
        item["source"] = (c.source == MatchSource::Prefix) ? "prefix" : "fuzzy";
        item["distance"] = c.distance;
        if (c.score == kUnrankedScore) item["score"] = nullptr;
        else item["score"] = c.score;
        arr.push_back(std::move(item));
    }

    json j;
    j["query"] = query;
    j["count"] = items.size();
    j["items"] = std::move(arr);
    return j;
}

static void send_json(httplib::Response& res, int status, const json& j) {
    res.status = status;
    res.set_content(j.dump(2, ' ', false, json::error_handler_t::replace), "application/json");
}

static bool read_int_param(const httplib::Request& req, const char* name, int& value) {
    if (!req.has_param(name)) return true;
    try {
        value = std::stoi(req.get_param_value(name));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

void register_routes(httplib::Server& svr, Engine& engine) {
    svr.Get("/api/health", [&](const httplib::Request&, httplib::Response& res) {
        enable_cors(res);
        json j;
        j["ok"] = true;
        j["backend"] = engine.store.backend_name();
        j["words"] = engine.store.size();
        j["trie_words"] = engine.trie.size();
        j["frequency_words"] = engine.freq.size();
        send_json(res, 200, j);
    });

    svr.Get("/api/define", [&](const httplib::Request& req, httplib::Response& res) {
        enable_cors(res);

        if (!req.has_param("w")) {
            res.status = 400;
            res.set_content(R"({"error":"missing w param"})", "application/json");
            return;
        }
        std::string w = req.get_param_value("w");

        std::optional<DictionaryEntry> entry;
        try {
            entry = engine.define(w);
        } catch (const BackendError& e) {
            engine.stats.increment_backend_errors();
            std::cerr << "[http] define backend failure: " << e.what() << "\n";
            send_json(res, 503, json{{"error", e.what()}});
            return;
        }

        if (!entry) {
            json j;
            j["found"] = false;
            j["markdown"] = format_missing_hover(w);
            send_json(res, 404, j);
            return;
        }

        json j = entry_to_json(*entry);
        j["found"] = true;
        j["fallback"] = (entry->word != normalize_word(w));
        j["markdown"] = format_definition_markdown(entry->word, *entry, engine.config.formatting);
        send_json(res, 200, j);
    });

    svr.Get("/api/complete", [&](const httplib::Request& req, httplib::Response& res) {
        enable_cors(res);

        using clock = std::chrono::steady_clock;
        auto t0 = clock::now();

        if (!req.has_param("q")) {
            res.status = 400;
            res.set_content(R"({"error":"missing q param"})", "application/json");
            return;
        }

        std::string q = req.get_param_value("q");
        int k = (int)engine.config.completion.max_items;
        int d = engine.config.completion.max_distance;
        if (!read_int_param(req, "k", k) || !read_int_param(req, "d", d) || k < 0 || d < 0) {
            res.status = 400;
            res.set_content(R"({"error":"k and d must be non-negative integers"})", "application/json");
            return;
        }

        std::vector<CompletionItem> items;
        try {
            engine.complete(q, (size_t)k, d, items);
        } catch (const BackendError& e) {
            engine.stats.increment_backend_errors();
            std::cerr << "[http] complete backend failure: " << e.what() << "\n";
            send_json(res, 503, json{{"error", e.what()}});
            return;
        }

        double ms = std::chrono::duration<double, std::milli>(clock::now() - t0).count();
        json j = completions_to_json(q, items);
        j["time_ms"] = ms;

        std::cerr << "[complete] q=\"" << q << "\" k=" << k << " d=" << d
                  << " items=" << items.size() << " " << ms << "ms\n";
        send_json(res, 200, j);
    });

    svr.Get("/api/stats", [&](const httplib::Request&, httplib::Response& res) {
        enable_cors(res);
        json stats = engine.stats.get_stats_json();
        stats["config"] = config_to_json(engine.config);
        send_json(res, 200, stats);
    });
}

} // namespace dictlsp
