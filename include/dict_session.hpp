#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include "dict_documents.hpp"
#include "dict_engine.hpp"
#include "dict_types.hpp"

namespace dictlsp {

constexpr const char* kServerName = "dictionary-lsp";
constexpr const char* kServerVersion = "0.3.0";
constexpr const char* kEnableCompletionCommand = "dictionary.enable_cmp";

// JSON-RPC / LSP error codes
namespace rpc {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kServerNotInitialized = -32002;
constexpr int kRequestCancelled = -32800;
constexpr int kRequestFailed = -32803;
} // namespace rpc

json make_response(const json& id, json result);
json make_error(const json& id, int code, const std::string& message);

// Malformed or missing request parameters
class InvalidParams : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raised when a handler notices its cancel flag
class RequestCancelled : public std::runtime_error {
public:
    RequestCancelled() : std::runtime_error("request cancelled") {}
};

enum class SessionState { Uninitialized, Ready, ShuttingDown, Terminated };

enum class MessageKind {
    Initialize,
    Initialized,
    Shutdown,
    Exit,
    DocumentSync, // didOpen / didChange / didClose
    Query,        // hover, signatureHelp, completion
    Command,      // workspace/executeCommand
    Other,
};

enum class Admission {
    Accept,
    NotInitialized, // requests: -32002
    Invalid,        // requests: -32600
    Drop,           // notifications are logged and ignored
};

struct Transition {
    Admission admit;
    SessionState next;
};

MessageKind classify_method(const std::string& method);

// Row = current state, column = message kind
Transition transition_for(SessionState state, MessageKind kind);

const char* state_name(SessionState state);

// Protocol state machine plus the LSP method handlers.
//
// handle() may be called from several worker threads for queries; state
// changing messages (lifecycle, document sync, commands) are expected on a
// single thread in arrival order.
class Session {
public:
    explicit Session(Engine& engine);

    // Response for requests, nothing for notifications.
    std::optional<json> handle(const json& msg, const CancelFlag* cancel = nullptr);

    SessionState state() const { return state_.load(); }
    bool completion_enabled() const { return completion_enabled_.load(); }
    bool terminated() const { return state() == SessionState::Terminated; }

    // 0 when exit followed shutdown, 1 otherwise
    int exit_code() const { return saw_shutdown_.load() ? 0 : 1; }

    // Methods that must run on the reader thread, in order
    static bool runs_inline(const std::string& method);

    // In-flight tracking; shutdown waits until the count drops to zero
    void begin_request();
    void end_request();

    DocumentStore& documents() { return docs_; }
    Engine& engine() { return engine_; }

private:
    Engine& engine_;
    DocumentStore docs_;

    std::atomic<SessionState> state_{SessionState::Uninitialized};
    std::atomic<bool> completion_enabled_;
    std::atomic<bool> saw_shutdown_{false};

    std::mutex inflight_mtx_;
    std::condition_variable inflight_cv_;
    int inflight_ = 0;

    json dispatch(const std::string& method, const json& params, const CancelFlag* cancel);
    void notify(const std::string& method, const json& params);
    void wait_idle();

    json on_initialize(const json& params);
    json on_shutdown();
    void on_did_open(const json& params);
    void on_did_change(const json& params);
    void on_did_close(const json& params);
    json on_hover(const json& params, const CancelFlag* cancel);
    json on_signature_help(const json& params, const CancelFlag* cancel);
    json on_completion(const json& params, const CancelFlag* cancel);
    json on_execute_command(const json& params);
};

} // namespace dictlsp
