#include "dict_session.hpp"

#include <cstdio>
#include <iostream>
#include <limits>

#include "dict_format.hpp"
#include "dict_text.hpp"

namespace dictlsp {

json make_response(const json& id, json result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json make_error(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"},
                {"id", id},
                {"error", {{"code", code}, {"message", message}}}};
}

// ---------------------------------------------------------------- state table

using S = SessionState;
using A = Admission;

static constexpr size_t kStates = 4;
static constexpr size_t kKinds = 8;

// Columns: Initialize, Initialized, Shutdown, Exit, DocumentSync, Query, Command, Other
static constexpr Transition kTable[kStates][kKinds] = {
    // Uninitialized
    {{A::Accept, S::Ready},
     {A::Drop, S::Uninitialized},
     {A::NotInitialized, S::Uninitialized},
     {A::Accept, S::Terminated},
     {A::NotInitialized, S::Uninitialized},
     {A::NotInitialized, S::Uninitialized},
     {A::NotInitialized, S::Uninitialized},
     {A::NotInitialized, S::Uninitialized}},
    // Ready
    {{A::Invalid, S::Ready},
     {A::Accept, S::Ready},
     {A::Accept, S::ShuttingDown},
     {A::Accept, S::Terminated},
     {A::Accept, S::Ready},
     {A::Accept, S::Ready},
     {A::Accept, S::Ready},
     {A::Accept, S::Ready}},
    // ShuttingDown: read-only queries are still answered
    {{A::Invalid, S::ShuttingDown},
     {A::Drop, S::ShuttingDown},
     {A::Invalid, S::ShuttingDown},
     {A::Accept, S::Terminated},
     {A::Invalid, S::ShuttingDown},
     {A::Accept, S::ShuttingDown},
     {A::Invalid, S::ShuttingDown},
     {A::Invalid, S::ShuttingDown}},
    // Terminated
    {{A::Invalid, S::Terminated},
     {A::Drop, S::Terminated},
     {A::Invalid, S::Terminated},
     {A::Drop, S::Terminated},
     {A::Invalid, S::Terminated},
     {A::Invalid, S::Terminated},
     {A::Invalid, S::Terminated},
     {A::Invalid, S::Terminated}},
};

MessageKind classify_method(const std::string& method) {
    if (method == "initialize") return MessageKind::Initialize;
    if (method == "initialized") return MessageKind::Initialized;
    if (method == "shutdown") return MessageKind::Shutdown;
    if (method == "exit") return MessageKind::Exit;
    if (method == "textDocument/didOpen" || method == "textDocument/didChange" ||
        method == "textDocument/didClose" || method == "textDocument/didSave")
        return MessageKind::DocumentSync;
    if (method == "textDocument/hover" || method == "textDocument/signatureHelp" ||
        method == "textDocument/completion")
        return MessageKind::Query;
    if (method == "workspace/executeCommand") return MessageKind::Command;
    return MessageKind::Other;
}

Transition transition_for(SessionState state, MessageKind kind) {
    return kTable[(size_t)state][(size_t)kind];
}

const char* state_name(SessionState state) {
    switch (state) {
        case S::Uninitialized: return "uninitialized";
        case S::Ready: return "ready";
        case S::ShuttingDown: return "shutting down";
        case S::Terminated: return "terminated";
    }
    return "unknown";
}

// ---------------------------------------------------------------- params

static const json& require(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) {
        throw InvalidParams(std::string("missing '") + key + "'");
    }
    return obj[key];
}

static std::string require_string(const json& obj, const char* key) {
    const json& v = require(obj, key);
    if (!v.is_string()) throw InvalidParams(std::string("'") + key + "' must be a string");
    return v.get<std::string>();
}

static std::string document_uri(const json& params) {
    return require_string(require(params, "textDocument"), "uri");
}

// Non-negative integer that fits a uint32_t
static uint32_t position_field(const json& v, const char* name) {
    bool ok = v.is_number_unsigned() || (v.is_number_integer() && v.get<int64_t>() >= 0);
    if (!ok || v.get<uint64_t>() > std::numeric_limits<uint32_t>::max())
        throw InvalidParams(std::string("'") + name + "' must be an integer in [0, 2^32)");
    return (uint32_t)v.get<uint64_t>();
}

static Position document_position(const json& params) {
    const json& p = require(params, "position");
    uint32_t line = position_field(require(p, "line"), "line");
    uint32_t ch = position_field(require(p, "character"), "character");
    return Position{line, ch};
}

static json position_json(const Position& p) {
    return json{{"line", p.line}, {"character", p.character}};
}

static json range_json(const Range& r) {
    return json{{"start", position_json(r.start)}, {"end", position_json(r.end)}};
}

// ---------------------------------------------------------------- session

Session::Session(Engine& engine)
    : engine_(engine), completion_enabled_(engine.config.completion.enabled) {}

bool Session::runs_inline(const std::string& method) {
    MessageKind kind = classify_method(method);
    return kind != MessageKind::Query;
}

void Session::begin_request() {
    std::lock_guard<std::mutex> lock(inflight_mtx_);
    inflight_++;
}

void Session::end_request() {
    {
        std::lock_guard<std::mutex> lock(inflight_mtx_);
        inflight_--;
    }
    inflight_cv_.notify_all();
}

void Session::wait_idle() {
    std::unique_lock<std::mutex> lock(inflight_mtx_);
    inflight_cv_.wait(lock, [this] { return inflight_ <= 0; });
}

std::optional<json> Session::handle(const json& msg, const CancelFlag* cancel) {
    if (!msg.is_object()) {
        return make_error(nullptr, rpc::kInvalidRequest, "message must be a JSON object");
    }

    const bool has_id = msg.contains("id");
    const json id = has_id ? msg["id"] : json();

    if (!msg.contains("method") || !msg["method"].is_string()) {
        // Replies to server->client requests carry no method
        if (msg.contains("result") || msg.contains("error")) return std::nullopt;
        if (has_id) return make_error(id, rpc::kInvalidRequest, "missing method");
        return std::nullopt;
    }

    const std::string method = msg["method"].get<std::string>();
    json params = msg.contains("params") ? msg["params"] : json::object();
    if (params.is_null()) params = json::object();

    const MessageKind kind = classify_method(method);
    const SessionState current = state();
    const Transition t = transition_for(current, kind);

    if (!has_id) {
        if (t.admit != Admission::Accept) {
            if (method.rfind("$/", 0) != 0) {
                std::cerr << "[lsp] dropping " << method << " while " << state_name(current) << "\n";
            }
            return std::nullopt;
        }
        if (t.next != current) state_.store(t.next);
        try {
            notify(method, params);
        } catch (const std::exception& e) {
            std::cerr << "[lsp] bad " << method << " notification: " << e.what() << "\n";
        }
        return std::nullopt;
    }

    switch (t.admit) {
        case Admission::Accept:
            break;
        case Admission::NotInitialized:
            return make_error(id, rpc::kServerNotInitialized, "server not initialized");
        case Admission::Invalid:
        case Admission::Drop:
            return make_error(id, rpc::kInvalidRequest,
                              method + " is not allowed while " + state_name(current));
    }

    if (kind == MessageKind::Other) {
        return make_error(id, rpc::kMethodNotFound, "unknown method: " + method);
    }

    // Lifecycle changes take effect before the handler runs so shutdown
    // already rejects new work while it waits
    if (t.next != current) state_.store(t.next);

    try {
        json result = dispatch(method, params, cancel);
        if (is_cancelled(cancel)) throw RequestCancelled();
        return make_response(id, std::move(result));
    } catch (const RequestCancelled&) {
        engine_.stats.increment_cancelled();
        return make_error(id, rpc::kRequestCancelled, "request cancelled");
    } catch (const InvalidParams& e) {
        return make_error(id, rpc::kInvalidParams, e.what());
    } catch (const json::exception& e) {
        return make_error(id, rpc::kInvalidParams, e.what());
    } catch (const BackendError& e) {
        engine_.stats.increment_backend_errors();
        std::cerr << "[lsp] " << method << " backend failure: " << e.what() << "\n";
        return make_error(id, rpc::kRequestFailed, e.what());
    } catch (const std::exception& e) {
        std::cerr << "[lsp] " << method << " failed: " << e.what() << "\n";
        return make_error(id, rpc::kInternalError, e.what());
    }
}

json Session::dispatch(const std::string& method, const json& params, const CancelFlag* cancel) {
    if (method == "initialize") return on_initialize(params);
    if (method == "shutdown") return on_shutdown();
    if (method == "textDocument/hover") return on_hover(params, cancel);
    if (method == "textDocument/signatureHelp") return on_signature_help(params, cancel);
    if (method == "textDocument/completion") return on_completion(params, cancel);
    if (method == "workspace/executeCommand") return on_execute_command(params);

    // Notifications sent with an id still get a reply
    notify(method, params);
    return nullptr;
}

void Session::notify(const std::string& method, const json& params) {
    if (method == "textDocument/didOpen") on_did_open(params);
    else if (method == "textDocument/didChange") on_did_change(params);
    else if (method == "textDocument/didClose") on_did_close(params);
    else if (method == "exit") std::cerr << "[lsp] exit (code " << exit_code() << ")\n";
    // initialized, didSave and $/ notifications need no action
}

json Session::on_initialize(const json& params) {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        std::cerr << "[lsp] client: " << params["clientInfo"].value("name", std::string("?")) << "\n";
    }

    json capabilities = {
        {"textDocumentSync", {{"openClose", true}, {"change", 1}}},
        {"hoverProvider", true},
        {"signatureHelpProvider", {{"triggerCharacters", json::array({" "})}}},
        {"completionProvider",
         {{"triggerCharacters", json::array({" "})}, {"resolveProvider", false}}},
        {"executeCommandProvider", {{"commands", json::array({kEnableCompletionCommand})}}},
    };

    return json{{"capabilities", capabilities},
                {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}};
}

json Session::on_shutdown() {
    saw_shutdown_.store(true);
    wait_idle();
    std::cerr << "[lsp] shutdown\n";
    return nullptr;
}

void Session::on_did_open(const json& params) {
    const json& doc = require(params, "textDocument");
    std::string uri = require_string(doc, "uri");
    std::string text = require_string(doc, "text");
    int64_t version = doc.value("version", (int64_t)0);
    docs_.open(uri, std::move(text), version);
}

// Full sync: the last change carries the whole document
void Session::on_did_change(const json& params) {
    const json& doc = require(params, "textDocument");
    std::string uri = require_string(doc, "uri");
    int64_t version = doc.value("version", (int64_t)0);

    const json& changes = require(params, "contentChanges");
    if (!changes.is_array() || changes.empty()) throw InvalidParams("'contentChanges' must be a non-empty array");
    std::string text = require_string(changes.back(), "text");

    if (!docs_.change(uri, std::move(text), version)) {
        std::cerr << "[lsp] ignoring change v" << version << " for " << uri << "\n";
    }
}

void Session::on_did_close(const json& params) {
    docs_.close(document_uri(params));
}

json Session::on_hover(const json& params, const CancelFlag* cancel) {
    std::string uri = document_uri(params);
    Position pos = document_position(params);
    engine_.stats.increment_hovers();

    auto w = docs_.word_at(uri, pos);
    if (!w) return nullptr;

    auto entry = engine_.define(w->word, cancel);
    if (is_cancelled(cancel)) throw RequestCancelled();

    std::string value;
    if (entry) {
        // Exact hits keep the spelling from the document
        const std::string& shown = (normalize_word(w->word) == entry->word) ? w->word : entry->word;
        value = format_definition_markdown(shown, *entry, engine_.config.formatting);
    } else {
        value = format_missing_hover(w->word);
    }

    return json{{"contents", {{"kind", "markdown"}, {"value", value}}},
                {"range", range_json(w->span)}};
}

json Session::on_signature_help(const json& params, const CancelFlag* cancel) {
    std::string uri = document_uri(params);
    Position pos = document_position(params);
    engine_.stats.increment_signature_helps();

    auto w = docs_.word_at(uri, pos);
    if (!w) return nullptr;

    auto entry = engine_.define(w->word, cancel);
    if (is_cancelled(cancel)) throw RequestCancelled();

    json signature;
    if (entry) {
        signature["label"] = format_definition_markdown(entry->word, *entry, engine_.config.formatting);
        signature["documentation"] = {{"kind", "plaintext"}, {"value", ""}};
    } else {
        signature["label"] = format_missing_signature(w->word);
    }

    return json{{"signatures", json::array({signature})}, {"activeSignature", 0}};
}

json Session::on_completion(const json& params, const CancelFlag* cancel) {
    std::string uri = document_uri(params);
    Position pos = document_position(params);
    engine_.stats.increment_completions();

    if (!completion_enabled()) {
        engine_.stats.increment_completions_disabled();
        return json{{"isIncomplete", false}, {"items", json::array()}};
    }

    auto tok = docs_.word_before(uri, pos);
    if (!tok) return json{{"isIncomplete", true}, {"items", json::array()}};

    const CompletionConfig& cc = engine_.config.completion;
    std::vector<CompletionItem> ranked;
    if (!engine_.complete(tok->word, cc.max_items, cc.max_distance, ranked, cancel)) {
        throw RequestCancelled();
    }

    std::u32string typed = utf8_decode(tok->word);
    const bool capitalize = !typed.empty() && is_upper(typed[0]);

    json items = json::array();
    for (size_t i = 0; i < ranked.size(); i++) {
        if (is_cancelled(cancel)) throw RequestCancelled();
        const CompletionItem& c = ranked[i];
        std::string label = capitalize ? capitalize_first(c.word) : c.word;

        char sort_key[16];
        std::snprintf(sort_key, sizeof(sort_key), "%04zu", i);

        json item;
        item["label"] = label;
        item["kind"] = 1;
        item["insertText"] = label;
        item["sortText"] = sort_key;
        item["textEdit"] = {{"range", range_json(tok->span)}, {"newText", label}};
        if (c.source == MatchSource::Prefix) {
            item["detail"] = "prefix match";
        } else {
            item["detail"] = "fuzzy match (distance " + std::to_string(c.distance) + ")";
            // Clients filter on the typed text; keep corrections visible
            item["filterText"] = tok->word;
        }

        if (auto entry = engine_.lookup(c.word)) {
            item["documentation"] = {
                {"kind", "markdown"},
                {"value", format_definition_markdown(label, *entry, engine_.config.formatting)}};
        }
        items.push_back(std::move(item));
    }

    return json{{"isIncomplete", true}, {"items", items}};
}

json Session::on_execute_command(const json& params) {
    std::string command = require_string(params, "command");
    if (command != kEnableCompletionCommand) {
        throw InvalidParams("unknown command: " + command);
    }

    bool enabled;
    if (!params.contains("arguments") || params["arguments"].is_null() ||
        (params["arguments"].is_array() && params["arguments"].empty())) {
        enabled = !completion_enabled_.load();
    } else {
        const json& args = params["arguments"];
        if (!args.is_array() || !args[0].is_boolean()) {
            throw InvalidParams(std::string(kEnableCompletionCommand) + " takes one boolean argument");
        }
        enabled = args[0].get<bool>();
    }

    completion_enabled_.store(enabled);
    std::cerr << "[lsp] completion " << (enabled ? "enabled" : "disabled") << "\n";
    return json{{"enabled", enabled}};
}

} // namespace dictlsp
