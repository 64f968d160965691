#pragma once

#include <atomic>
#include <cstdint>

#include "dict_types.hpp"

namespace dictlsp {

// Usage counters shared by the language server and the HTTP front end
class StatsTracker {
public:
    void increment_hovers() { hovers_++; }
    void increment_signature_helps() { signature_helps_++; }
    void increment_completions() { completions_++; }
    void increment_completions_disabled() { completions_disabled_++; }
    void increment_matcher_runs() { matcher_runs_++; }
    void increment_completion_cache_hits() { completion_cache_hits_++; }
    void increment_definition_fallbacks() { definition_fallbacks_++; }
    void increment_cancelled() { cancelled_requests_++; }
    void increment_backend_errors() { backend_errors_++; }

    int64_t matcher_runs() const { return matcher_runs_.load(); }
    int64_t completion_cache_hits() const { return completion_cache_hits_.load(); }

    json get_stats_json() const {
        json stats;
        stats["hovers"] = hovers_.load();
        stats["signature_helps"] = signature_helps_.load();
        stats["completions"] = completions_.load();
        stats["completions_disabled"] = completions_disabled_.load();
        stats["matcher_runs"] = matcher_runs_.load();
        stats["completion_cache_hits"] = completion_cache_hits_.load();

        // Hit rate over lookups that reached the engine
        int64_t lookups = matcher_runs_.load() + completion_cache_hits_.load();
        int64_t hits = completion_cache_hits_.load();
        stats["completion_cache_hit_rate"] = (lookups > 0) ? (static_cast<double>(hits) / lookups) : 0.0;

        stats["definition_fallbacks"] = definition_fallbacks_.load();
        stats["cancelled_requests"] = cancelled_requests_.load();
        stats["backend_errors"] = backend_errors_.load();
        return stats;
    }

private:
    std::atomic<int64_t> hovers_{0};
    std::atomic<int64_t> signature_helps_{0};
    std::atomic<int64_t> completions_{0};
    std::atomic<int64_t> completions_disabled_{0};
    std::atomic<int64_t> matcher_runs_{0};
    std::atomic<int64_t> completion_cache_hits_{0};
    std::atomic<int64_t> definition_fallbacks_{0};
    std::atomic<int64_t> cancelled_requests_{0};
    std::atomic<int64_t> backend_errors_{0};
};

} // namespace dictlsp
