#pragma once
#include "stream_session.hpp"
#include <array>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace chatrelay {

// Process-wide table of active streams, at most one per chat session.
// Keys are spread over fixed shards so unrelated sessions never contend
// on the same lock.
class StreamRegistry {
public:
    static constexpr size_t kShardCount = 16;

    // Register a fresh stream for key. Throws AlreadyStreamingError if one
    // is already registered; exactly one concurrent caller wins.
    std::shared_ptr<StreamSession> try_begin(const std::string& key,
                                             const std::string& model);

    // nullptr when nothing is registered for key
    std::shared_ptr<StreamSession> get(const std::string& key) const;

    // nullptr when no registered stream has this id
    std::shared_ptr<StreamSession> find_stream(const std::string& stream_id) const;

    // Remove key's entry only if it is still stream_id. Returns whether it
    // removed anything.
    bool end(const std::string& key, const std::string& stream_id);

    std::vector<std::shared_ptr<StreamSession>> active() const;
    size_t size() const;

private:
    struct Shard {
        mutable std::mutex mutex;
        std::unordered_map<std::string, std::shared_ptr<StreamSession>> streams;
    };

    Shard& shard_for(const std::string& key);
    const Shard& shard_for(const std::string& key) const;

    std::array<Shard, kShardCount> shards_;
};

} // namespace chatrelay
