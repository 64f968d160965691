#include "dict_lsp.hpp"

#include <httplib.h>

#include <cctype>
#include <iostream>

namespace dictlsp {

static std::string trim_copy(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

static bool starts_with_ci(const std::string& s, const std::string& prefix) {
    if (s.size() < prefix.size()) return false;
    for (size_t i = 0; i < prefix.size(); i++) {
        if (std::tolower((unsigned char)s[i]) != std::tolower((unsigned char)prefix[i])) return false;
    }
    return true;
}

FrameStatus read_message(std::istream& in, std::string& body) {
    static const std::string kLength = "Content-Length:";

    std::string line;
    long long content_length = -1;
    bool saw_any_header = false;
    for (;;) {
        if (!std::getline(in, line)) return FrameStatus::Eof;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) {
            if (!saw_any_header) continue; // stray blank line between frames
            break;
        }
        saw_any_header = true;
        if (starts_with_ci(line, kLength)) {
            try {
                content_length = std::stoll(trim_copy(line.substr(kLength.size())));
            } catch (const std::exception&) {
                content_length = -1;
            }
        }
    }

    if (content_length < 0) return FrameStatus::BadHeader;
    if (content_length > kMaxFrameBytes) {
        // Drop the declared body without buffering it
        std::cerr << "[lsp] frame of " << content_length << " bytes exceeds limit\n";
        in.ignore((std::streamsize)content_length);
        return FrameStatus::BadHeader;
    }

    body.assign((size_t)content_length, '\0');
    if (content_length > 0) in.read(&body[0], content_length);
    if (in.gcount() != content_length) return FrameStatus::Eof;
    return FrameStatus::Ok;
}

void write_message(std::ostream& out, const std::string& payload) {
    out << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
    out.flush();
}

LspServer::LspServer(Session& session, std::istream& in, std::ostream& out, size_t workers)
    : session_(session), in_(in), out_(out),
      pool_(std::make_unique<httplib::ThreadPool>(workers > 0 ? workers : 1)) {}

LspServer::~LspServer() {
    stop_pool();
}

// Drains queued requests before the threads stop
void LspServer::stop_pool() {
    if (pool_stopped_) return;
    pool_stopped_ = true;
    pool_->shutdown();
}

void LspServer::send(const json& msg) {
    // Dictionary text is not guaranteed to be valid UTF-8
    std::string payload = msg.dump(-1, ' ', false, json::error_handler_t::replace);
    std::lock_guard<std::mutex> lock(out_mtx_);
    write_message(out_, payload);
}

void LspServer::cancel(const json& params) {
    if (!params.is_object() || !params.contains("id")) return;
    std::string key = params["id"].dump();

    std::lock_guard<std::mutex> lock(pending_mtx_);
    auto it = pending_.find(key);
    if (it != pending_.end()) it->second->store(true);
}

void LspServer::schedule(json msg) {
    auto flag = std::make_shared<CancelFlag>(false);
    std::string key = msg["id"].dump();
    {
        std::lock_guard<std::mutex> lock(pending_mtx_);
        pending_[key] = flag;
    }

    session_.begin_request();
    pool_->enqueue([this, msg = std::move(msg), flag, key]() {
        std::optional<json> resp;
        try {
            resp = session_.handle(msg, flag.get());
        } catch (const std::exception& e) {
            std::cerr << "[lsp] worker failure: " << e.what() << "\n";
            resp = make_error(msg["id"], rpc::kInternalError, e.what());
        }
        {
            std::lock_guard<std::mutex> lock(pending_mtx_);
            pending_.erase(key);
        }
        if (resp) send(*resp);
        session_.end_request();
    });
}

int LspServer::run() {
    for (;;) {
        std::string body;
        FrameStatus st = read_message(in_, body);
        if (st == FrameStatus::Eof) {
            std::cerr << "[lsp] input closed\n";
            break;
        }
        if (st == FrameStatus::BadHeader) {
            std::cerr << "[lsp] bad frame header, skipping\n";
            continue;
        }

        json msg = json::parse(body, nullptr, false);
        if (msg.is_discarded()) {
            std::cerr << "[lsp] unparsable frame (" << body.size() << " bytes)\n";
            send(make_error(nullptr, rpc::kParseError, "parse error"));
            continue;
        }

        std::string method;
        if (msg.is_object() && msg.contains("method") && msg["method"].is_string()) {
            method = msg["method"].get<std::string>();
        }

        if (method == "$/cancelRequest") {
            cancel(msg.contains("params") ? msg["params"] : json());
            continue;
        }

        const bool is_request = msg.is_object() && msg.contains("id");
        if (!is_request || method.empty() || Session::runs_inline(method)) {
            auto resp = session_.handle(msg);
            if (resp) send(*resp);
            if (session_.terminated()) break;
            continue;
        }

        schedule(std::move(msg));
    }

    stop_pool();
    return session_.exit_code();
}

} // namespace dictlsp
