#include "dict_session.hpp"

#include <gtest/gtest.h>

#include "test_util.hpp"

using namespace dictlsp;
using dictlsp::fixtures::TempDir;

static const std::string kUri = "file:///tmp/essay.txt";

static json request(int id, const std::string& method, json params = json::object()) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
}

static json notification(const std::string& method, json params = json::object()) {
    return json{{"jsonrpc", "2.0"}, {"method", method}, {"params", std::move(params)}};
}

static json at(int line, int character) {
    return json{{"textDocument", {{"uri", kUri}}},
                {"position", {{"line", line}, {"character", character}}}};
}

class SessionTest : public ::testing::Test {
protected:
    TempDir dir;
    Engine engine;
    std::unique_ptr<Session> session;

    void SetUp() override {
        engine.config.dictionary_path = dir.write("words.json", dictlsp::fixtures::kSampleJson).string();
        engine.config.freq_path = dir.write("freq.txt", dictlsp::fixtures::kSampleFreq).string();
        ASSERT_TRUE(engine.load());
        session = std::make_unique<Session>(engine);
    }

    json call(int id, const std::string& method, json params = json::object(),
              const CancelFlag* cancel = nullptr) {
        auto resp = session->handle(request(id, method, std::move(params)), cancel);
        EXPECT_TRUE(resp.has_value()) << method;
        return resp ? *resp : json();
    }

    void send(const std::string& method, json params = json::object()) {
        EXPECT_FALSE(session->handle(notification(method, std::move(params))).has_value());
    }

    void initialize_and_open(const std::string& text) {
        json r = call(1, "initialize", {{"capabilities", json::object()}});
        ASSERT_TRUE(r.contains("result"));
        send("initialized");
        send("textDocument/didOpen",
             {{"textDocument", {{"uri", kUri}, {"languageId", "plaintext"}, {"version", 1}, {"text", text}}}});
    }
};

TEST_F(SessionTest, RequestsBeforeInitializeFail) {
    json r = call(7, "textDocument/hover", at(0, 0));
    ASSERT_TRUE(r.contains("error"));
    EXPECT_EQ(r["error"]["code"], rpc::kServerNotInitialized);
    EXPECT_EQ(r["id"], 7);
    EXPECT_EQ(session->state(), SessionState::Uninitialized);

    // Dropped, not applied
    send("textDocument/didOpen", {{"textDocument", {{"uri", kUri}, {"version", 1}, {"text", "x"}}}});
    EXPECT_EQ(session->documents().size(), 0u);
}

TEST_F(SessionTest, ExitWithoutShutdown) {
    send("exit");
    EXPECT_TRUE(session->terminated());
    EXPECT_EQ(session->exit_code(), 1);
}

TEST_F(SessionTest, InitializeAdvertisesCapabilities) {
    json r = call(1, "initialize", {{"capabilities", json::object()}});
    const json& caps = r["result"]["capabilities"];
    EXPECT_EQ(caps["textDocumentSync"]["change"], 1);
    EXPECT_EQ(caps["hoverProvider"], true);
    EXPECT_EQ(caps["signatureHelpProvider"]["triggerCharacters"], json::array({" "}));
    EXPECT_EQ(caps["completionProvider"]["triggerCharacters"], json::array({" "}));
    EXPECT_EQ(caps["executeCommandProvider"]["commands"][0], kEnableCompletionCommand);
    EXPECT_EQ(r["result"]["serverInfo"]["name"], kServerName);
    EXPECT_EQ(session->state(), SessionState::Ready);

    json again = call(2, "initialize", json::object());
    EXPECT_EQ(again["error"]["code"], rpc::kInvalidRequest);
}

TEST_F(SessionTest, HoverShowsDefinition) {
    initialize_and_open("I have a Passion for words");
    json r = call(2, "textDocument/hover", at(0, 10));
    const json& result = r["result"];
    EXPECT_EQ(result["contents"]["kind"], "markdown");
    std::string value = result["contents"]["value"];
    EXPECT_EQ(value.rfind("**Passion**\n_noun_\n1. strong and barely controllable emotion\n", 0), 0u);
    EXPECT_NE(value.find("   > Example: _a passion for football_"), std::string::npos);
    EXPECT_EQ(result["range"]["start"]["character"], 9);
    EXPECT_EQ(result["range"]["end"]["character"], 16);
}

TEST_F(SessionTest, HoverOnWhitespaceIsNull) {
    initialize_and_open("I have a passion");
    json r = call(2, "textDocument/hover", at(0, 1));
    ASSERT_TRUE(r.contains("result"));
    EXPECT_TRUE(r["result"].is_null());

    json s = call(3, "textDocument/signatureHelp", at(0, 6));
    ASSERT_TRUE(s.contains("result"));
    EXPECT_TRUE(s["result"].is_null());
}

TEST_F(SessionTest, MissingWordPlaceholders) {
    initialize_and_open("zzyzx");
    json h = call(2, "textDocument/hover", at(0, 2));
    EXPECT_EQ(h["result"]["contents"]["value"], "No definition found for **zzyzx**");

    json s = call(3, "textDocument/signatureHelp", at(0, 2));
    EXPECT_EQ(s["result"]["signatures"][0]["label"], "No definition found for 'zzyzx'");
    EXPECT_EQ(s["result"]["activeSignature"], 0);
}

TEST_F(SessionTest, SignatureHelpCarriesMarkdownLabel) {
    initialize_and_open("passive voice");
    json s = call(2, "textDocument/signatureHelp", at(0, 3));
    const json& sig = s["result"]["signatures"][0];
    EXPECT_EQ(sig["label"], "**passive**\n_adjective_\n1. accepting what happens without resistance\n");
    EXPECT_EQ(sig["documentation"]["kind"], "plaintext");
    EXPECT_EQ(sig["documentation"]["value"], "");
}

TEST_F(SessionTest, HoverFallsBackToClosestWord) {
    initialize_and_open("pasion");
    json h = call(2, "textDocument/hover", at(0, 1));
    std::string value = h["result"]["contents"]["value"];
    EXPECT_EQ(value.rfind("**passion**", 0), 0u);
}

TEST_F(SessionTest, CompletionRespectsCase) {
    initialize_and_open("Pass");
    json r = call(2, "textDocument/completion", at(0, 4));
    const json& items = r["result"]["items"];
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0]["label"], "Passing");
    EXPECT_EQ(items[1]["label"], "Passion");
    EXPECT_EQ(items[2]["label"], "Passive");
    EXPECT_EQ(items[0]["insertText"], "Passing");
    EXPECT_EQ(items[0]["textEdit"]["newText"], "Passing");
    EXPECT_EQ(items[0]["textEdit"]["range"]["start"]["character"], 0);
    EXPECT_EQ(items[0]["textEdit"]["range"]["end"]["character"], 4);
    EXPECT_EQ(items[0]["detail"], "prefix match");
    EXPECT_EQ(items[0]["documentation"]["kind"], "markdown");
    EXPECT_LT(items[0]["sortText"].get<std::string>(), items[1]["sortText"].get<std::string>());
}

TEST_F(SessionTest, FuzzyCompletionKeepsTypedFilter) {
    initialize_and_open("possion");
    json r = call(2, "textDocument/completion", at(0, 7));
    const json& items = r["result"]["items"];
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0]["label"], "passion");
    EXPECT_EQ(items[0]["filterText"], "possion");
    EXPECT_EQ(items[0]["detail"], "fuzzy match (distance 1)");
}

TEST_F(SessionTest, ToggleCompletion) {
    initialize_and_open("pass");
    int64_t runs_before = engine.stats.matcher_runs();

    json off = call(2, "workspace/executeCommand",
                    {{"command", kEnableCompletionCommand}, {"arguments", json::array({false})}});
    EXPECT_EQ(off["result"]["enabled"], false);
    EXPECT_FALSE(session->completion_enabled());

    json r = call(3, "textDocument/completion", at(0, 4));
    EXPECT_TRUE(r["result"]["items"].empty());
    EXPECT_EQ(engine.stats.matcher_runs(), runs_before);

    json toggled = call(4, "workspace/executeCommand", {{"command", kEnableCompletionCommand}});
    EXPECT_EQ(toggled["result"]["enabled"], true);

    json again = call(5, "textDocument/completion", at(0, 4));
    EXPECT_EQ(again["result"]["items"].size(), 3u);
    EXPECT_EQ(engine.stats.matcher_runs(), runs_before + 1);

    json bad = call(6, "workspace/executeCommand",
                    {{"command", kEnableCompletionCommand}, {"arguments", json::array({"yes"})}});
    EXPECT_EQ(bad["error"]["code"], rpc::kInvalidParams);
}

TEST_F(SessionTest, DidChangeReplacesText) {
    initialize_and_open("hello");
    send("textDocument/didChange", {{"textDocument", {{"uri", kUri}, {"version", 2}}},
                                    {"contentChanges", json::array({{{"text", "passive"}}})}});
    json h = call(2, "textDocument/hover", at(0, 1));
    EXPECT_EQ(h["result"]["contents"]["value"].get<std::string>().rfind("**passive**", 0), 0u);

    // Stale version is ignored
    send("textDocument/didChange", {{"textDocument", {{"uri", kUri}, {"version", 2}}},
                                    {"contentChanges", json::array({{{"text", "hello"}}})}});
    EXPECT_EQ(session->documents().snapshot(kUri)->text, "passive");

    send("textDocument/didClose", {{"textDocument", {{"uri", kUri}}}});
    EXPECT_EQ(session->documents().size(), 0u);
}

TEST_F(SessionTest, ShutdownThenExit) {
    initialize_and_open("passion");

    json r = call(2, "shutdown");
    ASSERT_TRUE(r.contains("result"));
    EXPECT_TRUE(r["result"].is_null());
    EXPECT_EQ(session->state(), SessionState::ShuttingDown);

    // Read-only queries still work
    json h = call(3, "textDocument/hover", at(0, 1));
    EXPECT_TRUE(h.contains("result"));

    // Mutations are refused
    send("textDocument/didChange", {{"textDocument", {{"uri", kUri}, {"version", 9}}},
                                    {"contentChanges", json::array({{{"text", "other"}}})}});
    EXPECT_EQ(session->documents().snapshot(kUri)->text, "passion");
    json cmd = call(4, "workspace/executeCommand", {{"command", kEnableCompletionCommand}});
    EXPECT_EQ(cmd["error"]["code"], rpc::kInvalidRequest);
    json again = call(5, "shutdown");
    EXPECT_EQ(again["error"]["code"], rpc::kInvalidRequest);

    send("exit");
    EXPECT_TRUE(session->terminated());
    EXPECT_EQ(session->exit_code(), 0);
}

TEST_F(SessionTest, ProtocolErrors) {
    initialize_and_open("passion");

    json unknown = call(2, "textDocument/definition", at(0, 0));
    EXPECT_EQ(unknown["error"]["code"], rpc::kMethodNotFound);

    json no_position = call(3, "textDocument/hover", {{"textDocument", {{"uri", kUri}}}});
    EXPECT_EQ(no_position["error"]["code"], rpc::kInvalidParams);

    json bad_type = call(4, "textDocument/hover",
                         {{"textDocument", {{"uri", kUri}}},
                          {"position", {{"line", "zero"}, {"character", 0}}}});
    EXPECT_EQ(bad_type["error"]["code"], rpc::kInvalidParams);

    json negative = call(6, "textDocument/hover",
                         {{"textDocument", {{"uri", kUri}}},
                          {"position", {{"line", -1}, {"character", 0}}}});
    EXPECT_EQ(negative["error"]["code"], rpc::kInvalidParams);

    // 2^32 would wrap to line 0 if narrowed
    json too_large = call(7, "textDocument/hover",
                          {{"textDocument", {{"uri", kUri}}},
                           {"position", {{"line", 4294967296LL}, {"character", 0}}}});
    EXPECT_EQ(too_large["error"]["code"], rpc::kInvalidParams);
    json wide_char = call(8, "textDocument/hover",
                          {{"textDocument", {{"uri", kUri}}},
                           {"position", {{"line", 0}, {"character", 4294967296LL}}}});
    EXPECT_EQ(wide_char["error"]["code"], rpc::kInvalidParams);

    auto no_method = session->handle(json{{"jsonrpc", "2.0"}, {"id", 5}});
    ASSERT_TRUE(no_method.has_value());
    EXPECT_EQ((*no_method)["error"]["code"], rpc::kInvalidRequest);

    // Unknown notifications are ignored quietly
    send("$/setTrace", {{"value", "off"}});
}

TEST_F(SessionTest, CancelledRequest) {
    initialize_and_open("possion");
    CancelFlag cancel{true};
    json r = call(2, "textDocument/completion", at(0, 7), &cancel);
    EXPECT_EQ(r["error"]["code"], rpc::kRequestCancelled);

    json h = call(3, "textDocument/hover", at(0, 2), &cancel);
    EXPECT_EQ(h["error"]["code"], rpc::kRequestCancelled);
}

TEST(SessionTransitionTest, Table) {
    EXPECT_EQ(transition_for(SessionState::Uninitialized, MessageKind::Initialize).next, SessionState::Ready);
    EXPECT_EQ(transition_for(SessionState::Uninitialized, MessageKind::Query).admit, Admission::NotInitialized);
    EXPECT_EQ(transition_for(SessionState::Ready, MessageKind::Shutdown).next, SessionState::ShuttingDown);
    EXPECT_EQ(transition_for(SessionState::ShuttingDown, MessageKind::Query).admit, Admission::Accept);
    EXPECT_EQ(transition_for(SessionState::ShuttingDown, MessageKind::DocumentSync).admit, Admission::Invalid);
    EXPECT_EQ(transition_for(SessionState::ShuttingDown, MessageKind::Exit).next, SessionState::Terminated);
    EXPECT_EQ(classify_method("textDocument/completion"), MessageKind::Query);
    EXPECT_EQ(classify_method("workspace/executeCommand"), MessageKind::Command);
    EXPECT_EQ(classify_method("textDocument/references"), MessageKind::Other);
}

class SqliteSessionTest : public ::testing::Test {
protected:
    TempDir dir;
    Engine engine;

    void SetUp() override {
        std::string sql = std::string(dictlsp::fixtures::kDictionarySchema) +
            "INSERT INTO parts_of_speech VALUES (1, 'noun');"
            "INSERT INTO words VALUES (1, 'passion');"
            "INSERT INTO definitions VALUES (1, 1, 'strong emotion');";
        engine.config.dictionary_path = dictlsp::fixtures::make_sqlite_db(dir, "dict.db", sql).string();
        ASSERT_TRUE(engine.load());
    }
};

TEST_F(SqliteSessionTest, BackendFailureIsRequestFailed) {
    Session session(engine);
    session.handle(request(1, "initialize"));
    session.handle(notification("textDocument/didOpen",
                                {{"textDocument", {{"uri", kUri}, {"version", 1}, {"text", "passion"}}}}));

    auto ok = session.handle(request(2, "textDocument/hover", at(0, 1)));
    ASSERT_TRUE(ok.has_value());
    EXPECT_EQ((*ok)["result"]["contents"]["value"].get<std::string>().rfind("**passion**", 0), 0u);

    // Lose the connection under the session
    const_cast<SqliteDictionary*>(engine.store.sqlite())->close();

    auto failed = session.handle(request(3, "textDocument/hover", at(0, 1)));
    ASSERT_TRUE(failed.has_value());
    EXPECT_EQ((*failed)["error"]["code"], rpc::kRequestFailed);

    // The session keeps serving
    auto next = session.handle(request(4, "textDocument/hover", at(0, 1)));
    ASSERT_TRUE(next.has_value());
    EXPECT_EQ(session.state(), SessionState::Ready);
}
