#pragma once

#include <istream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <unordered_map>

#include "dict_session.hpp"
#include "dict_types.hpp"

namespace httplib {
class ThreadPool;
}

namespace dictlsp {

enum class FrameStatus { Ok, Eof, BadHeader };

// Frames declaring a larger body are skipped as BadHeader
constexpr long long kMaxFrameBytes = 64LL * 1024 * 1024;

// Read one "Content-Length: N\r\n\r\n<body>" frame. Header names are
// case-insensitive; unknown headers are skipped.
FrameStatus read_message(std::istream& in, std::string& body);

void write_message(std::ostream& out, const std::string& payload);

// stdio transport: frames in, frames out.
//
// Notifications and lifecycle requests run on the reader thread in arrival
// order. Queries go to a worker pool, each with its own cancel flag that
// $/cancelRequest raises.
class LspServer {
public:
    LspServer(Session& session, std::istream& in, std::ostream& out, size_t workers);
    ~LspServer();

    // Serve until exit or end of input; returns the process exit code.
    int run();

private:
    Session& session_;
    std::istream& in_;
    std::ostream& out_;
    std::unique_ptr<httplib::ThreadPool> pool_;
    bool pool_stopped_ = false;

    std::mutex out_mtx_;
    std::mutex pending_mtx_;
    std::unordered_map<std::string, std::shared_ptr<CancelFlag>> pending_;

    void send(const json& msg);
    void cancel(const json& params);
    void schedule(json msg);
    void stop_pool();
};

} // namespace dictlsp
