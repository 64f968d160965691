#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "dict_types.hpp"

namespace dictlsp {

struct DocumentSnapshot {
    std::string uri;
    int64_t version = 0;
    std::string text;
};

// Word touching the cursor: the character at position must be part of it.
std::optional<WordAt> word_at_in_text(const std::string& text, Position pos);

// Partial word ending exactly at the cursor (what the user is typing).
std::optional<WordAt> word_before_in_text(const std::string& text, Position pos);

// Open documents, full-text sync.
//
// Writers replace the whole snapshot under an exclusive lock; readers copy
// the shared_ptr under a shared lock and then work without any lock, so a
// reader never sees half of an update.
class DocumentStore {
public:
    void open(const std::string& uri, std::string text, int64_t version);

    // Ignored (returns false) for unopened documents and stale versions.
    bool change(const std::string& uri, std::string text, int64_t version);

    void close(const std::string& uri);

    std::shared_ptr<const DocumentSnapshot> snapshot(const std::string& uri) const;
    size_t size() const;

    std::optional<WordAt> word_at(const std::string& uri, Position pos) const;
    std::optional<WordAt> word_before(const std::string& uri, Position pos) const;

private:
    mutable std::shared_mutex mtx_;
    std::unordered_map<std::string, std::shared_ptr<const DocumentSnapshot>> docs_;
};

} // namespace dictlsp
