#include "stream_registry.hpp"
#include "errors.hpp"
#include <functional>

namespace chatrelay {

StreamRegistry::Shard& StreamRegistry::shard_for(const std::string& key) {
    return shards_[std::hash<std::string>{}(key) % kShardCount];
}

const StreamRegistry::Shard& StreamRegistry::shard_for(const std::string& key) const {
    return shards_[std::hash<std::string>{}(key) % kShardCount];
}

std::shared_ptr<StreamSession> StreamRegistry::try_begin(const std::string& key,
                                                          const std::string& model) {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.streams.find(key);
    if (it != shard.streams.end()) {
        throw AlreadyStreamingError(key);
    }
    auto session = std::make_shared<StreamSession>(key, model);
    shard.streams.emplace(key, session);
    return session;
}

std::shared_ptr<StreamSession> StreamRegistry::get(const std::string& key) const {
    const auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.streams.find(key);
    return it == shard.streams.end() ? nullptr : it->second;
}

std::shared_ptr<StreamSession> StreamRegistry::find_stream(const std::string& stream_id) const {
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& entry : shard.streams) {
            if (entry.second->stream_id() == stream_id) return entry.second;
        }
    }
    return nullptr;
}

bool StreamRegistry::end(const std::string& key, const std::string& stream_id) {
    auto& shard = shard_for(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.streams.find(key);
    if (it == shard.streams.end() || it->second->stream_id() != stream_id) {
        return false;
    }
    shard.streams.erase(it);
    return true;
}

std::vector<std::shared_ptr<StreamSession>> StreamRegistry::active() const {
    std::vector<std::shared_ptr<StreamSession>> result;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (const auto& entry : shard.streams) {
            result.push_back(entry.second);
        }
    }
    return result;
}

size_t StreamRegistry::size() const {
    size_t total = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard.mutex);
        total += shard.streams.size();
    }
    return total;
}

} // namespace chatrelay
