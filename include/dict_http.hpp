#pragma once

#include <string>
#include <vector>

#include "dict_engine.hpp"
#include "dict_types.hpp"

namespace httplib {
class Server;
struct Response;
}

namespace dictlsp {

void enable_cors(httplib::Response& res);

json entry_to_json(const DictionaryEntry& entry);
json completions_to_json(const std::string& query, const std::vector<CompletionItem>& items);

// /api/health, /api/define, /api/complete, /api/stats
void register_routes(httplib::Server& svr, Engine& engine);

} // namespace dictlsp
