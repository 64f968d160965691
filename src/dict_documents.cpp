#include "dict_documents.hpp"

#include <mutex>

#include "dict_text.hpp"

namespace dictlsp {

// Code points of one line; a trailing '\r' is dropped
static bool line_code_points(const std::string& text, uint32_t line, std::u32string& out) {
    size_t begin = 0;
    for (uint32_t i = 0; i < line; i++) {
        size_t nl = text.find('\n', begin);
        if (nl == std::string::npos) return false;
        begin = nl + 1;
    }
    size_t end = text.find('\n', begin);
    if (end == std::string::npos) end = text.size();
    if (end > begin && text[end - 1] == '\r') end--;

    out = utf8_decode(text.substr(begin, end - begin));
    return true;
}

// Joiners count only between two word characters ("well-known", "don't")
static bool in_word(const std::u32string& cps, size_t i) {
    if (is_word_char(cps[i])) return true;
    if (!is_word_joiner(cps[i])) return false;
    return i > 0 && i + 1 < cps.size() && is_word_char(cps[i - 1]) && is_word_char(cps[i + 1]);
}

static WordAt make_word(const std::u32string& cps, uint32_t line, size_t start, size_t end) {
    WordAt w;
    w.word = utf8_encode(cps.substr(start, end - start));
    w.span.start = {line, (uint32_t)start};
    w.span.end = {line, (uint32_t)end};
    return w;
}

std::optional<WordAt> word_at_in_text(const std::string& text, Position pos) {
    std::u32string cps;
    if (!line_code_points(text, pos.line, cps)) return std::nullopt;

    size_t c = pos.character;
    if (c >= cps.size() || !in_word(cps, c)) return std::nullopt;

    size_t start = c;
    size_t end = c;
    while (start > 0 && in_word(cps, start - 1)) start--;
    while (end < cps.size() && in_word(cps, end)) end++;
    return make_word(cps, pos.line, start, end);
}

std::optional<WordAt> word_before_in_text(const std::string& text, Position pos) {
    std::u32string cps;
    if (!line_code_points(text, pos.line, cps)) return std::nullopt;

    size_t c = pos.character;
    if (c > cps.size()) return std::nullopt;

    // Only the typed part left of the cursor; a trailing joiner is not part of it
    std::u32string left = cps.substr(0, c);
    size_t start = c;
    while (start > 0 && in_word(left, start - 1)) start--;
    if (start == c) return std::nullopt;
    return make_word(cps, pos.line, start, c);
}

void DocumentStore::open(const std::string& uri, std::string text, int64_t version) {
    auto snap = std::make_shared<DocumentSnapshot>();
    snap->uri = uri;
    snap->version = version;
    snap->text = std::move(text);

    std::unique_lock<std::shared_mutex> lock(mtx_);
    docs_[uri] = std::move(snap);
}

bool DocumentStore::change(const std::string& uri, std::string text, int64_t version) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    auto it = docs_.find(uri);
    if (it == docs_.end()) return false;
    if (version <= it->second->version) return false;

    auto snap = std::make_shared<DocumentSnapshot>();
    snap->uri = uri;
    snap->version = version;
    snap->text = std::move(text);
    it->second = std::move(snap);
    return true;
}

void DocumentStore::close(const std::string& uri) {
    std::unique_lock<std::shared_mutex> lock(mtx_);
    docs_.erase(uri);
}

std::shared_ptr<const DocumentSnapshot> DocumentStore::snapshot(const std::string& uri) const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    auto it = docs_.find(uri);
    if (it == docs_.end()) return nullptr;
    return it->second;
}

size_t DocumentStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mtx_);
    return docs_.size();
}

std::optional<WordAt> DocumentStore::word_at(const std::string& uri, Position pos) const {
    auto snap = snapshot(uri);
    if (!snap) return std::nullopt;
    return word_at_in_text(snap->text, pos);
}

std::optional<WordAt> DocumentStore::word_before(const std::string& uri, Position pos) const {
    auto snap = snapshot(uri);
    if (!snap) return std::nullopt;
    return word_before_in_text(snap->text, pos);
}

} // namespace dictlsp
