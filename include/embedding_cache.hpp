#pragma once

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace receipt_assistant {

// Embedding vectors keyed by their exact query text. Entries expire after
// `ttl` and the least recently used text goes first when the cache is full.
// A capacity of 0 disables caching.
class EmbeddingCache {
public:
    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        size_t entries = 0;
    };

    explicit EmbeddingCache(size_t capacity = 1000,
                            std::chrono::seconds ttl = std::chrono::seconds(3600))
        : capacity_(capacity), ttl_(ttl) {}

    std::optional<std::vector<float>> lookup(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = entries_.find(text);
        if (it == entries_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        if (std::chrono::steady_clock::now() > it->second.expires_at) {
            recency_.erase(it->second.position);
            entries_.erase(it);
            ++stats_.misses;
            return std::nullopt;
        }

        recency_.splice(recency_.begin(), recency_, it->second.position);
        ++stats_.hits;
        return it->second.vector;
    }

    void remember(const std::string& text, std::vector<float> vector) {
        if (capacity_ == 0 || vector.empty()) return;
        std::lock_guard<std::mutex> lock(mutex_);

        auto expires_at = std::chrono::steady_clock::now() + ttl_;
        auto it = entries_.find(text);
        if (it != entries_.end()) {
            it->second.vector = std::move(vector);
            it->second.expires_at = expires_at;
            recency_.splice(recency_.begin(), recency_, it->second.position);
            return;
        }

        if (entries_.size() >= capacity_) {
            entries_.erase(recency_.back());
            recency_.pop_back();
            ++stats_.evictions;
        }
        recency_.push_front(text);
        entries_.emplace(text, Entry{std::move(vector), recency_.begin(), expires_at});
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    Stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Stats out = stats_;
        out.entries = entries_.size();
        return out;
    }

    nlohmann::json stats_json() const {
        Stats s = stats();
        return {{"entries", s.entries}, {"capacity", capacity_}, {"hits", s.hits},
                {"misses", s.misses}, {"evictions", s.evictions}};
    }

private:
    struct Entry {
        std::vector<float> vector;
        std::list<std::string>::iterator position;
        std::chrono::steady_clock::time_point expires_at;
    };

    const size_t capacity_;
    const std::chrono::seconds ttl_;
    std::list<std::string> recency_;   // front = most recently used
    std::unordered_map<std::string, Entry> entries_;
    Stats stats_;
    mutable std::mutex mutex_;
};

} // namespace receipt_assistant
