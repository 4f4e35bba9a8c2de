/*
 * ============================================================================
 * S3 BMS ACQUISITION - PATTERN EXTRACTOR
 * ============================================================================
 *
 * The controller's status pages are meant for a browser. The telemetry
 * lives in a single script assignment per key:
 *
 *     Parametersatz = "0,48500,0,0,1500,...";
 *
 * PatternExtractor locates that assignment and yields the quoted payload.
 * The payload never contains escaped quotes.
 *
 * The scan is iterative with constant stack use, so payload length is
 * bounded only by memory. Extractors are immutable and shared through
 * cached_extractor(); a leg holds its own reference for as long as it runs.
 *
 * LICENSE: MIT
 *
 * ============================================================================
 */

#ifndef S3BMS_PATTERN_EXTRACTOR_HPP
#define S3BMS_PATTERN_EXTRACTOR_HPP

#include "s3bms_errors.hpp"

#include <cctype>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace s3bms {

class PatternExtractor {
    std::string key_;

public:
    explicit PatternExtractor(const std::string& key) : key_(key) {
        if (key.empty()) {
            throw std::invalid_argument("PatternExtractor key must not be empty");
        }
    }

    const std::string& key() const { return key_; }

    // Returns the quoted payload assigned to key().
    // Throws MalformedDocument if the key is absent or assigned twice.
    std::string extract(const std::string& document) const {
        std::optional<std::string> payload;
        std::size_t from = 0;

        while (true) {
            const std::size_t at = document.find(key_, from);
            if (at == std::string::npos) break;
            from = at + 1;

            // Whole-word match only: "PSet" must not match inside "PSet0"
            const std::size_t after = at + key_.size();
            if (at > 0 && is_word_char(document[at - 1])) continue;
            if (after < document.size() && is_word_char(document[after])) continue;

            std::size_t pos = skip_space(document, after);
            if (pos >= document.size() || document[pos] != '=') continue;
            pos = skip_space(document, pos + 1);
            if (pos >= document.size() || document[pos] != '"') continue;

            const std::size_t close = document.find('"', pos + 1);
            if (close == std::string::npos) continue;

            if (payload) {
                throw MalformedDocument(key_, "key '" + key_ + "' assigned more than once");
            }
            payload = document.substr(pos + 1, close - pos - 1);
            from = close + 1;
        }

        if (!payload) {
            throw MalformedDocument(key_, "key '" + key_ + "' not found in document");
        }
        return *payload;
    }

private:
    static bool is_word_char(char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    }

    static std::size_t skip_space(const std::string& text, std::size_t pos) {
        while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        return pos;
    }
};

using ExtractorPtr = std::shared_ptr<const PatternExtractor>;

// ============================================================================
// PROCESS-WIDE EXTRACTOR CACHE
// ============================================================================

// Returns the shared extractor for `key`, building it on first use.
// Callers keep the returned pointer, so an extractor stays alive for a
// leg still running on a detached thread while the process exits.
inline ExtractorPtr cached_extractor(const std::string& key) {
    static std::mutex mutex;
    static std::map<std::string, ExtractorPtr> cache;

    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(key);
    if (it == cache.end()) {
        it = cache.emplace(key, std::make_shared<PatternExtractor>(key)).first;
    }
    return it->second;
}

} // namespace s3bms

#endif // S3BMS_PATTERN_EXTRACTOR_HPP
