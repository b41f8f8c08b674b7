#include "storage/post_store.hpp"
#include <algorithm>

namespace murmur::storage {

void to_json(nlohmann::json& j, const Post& post) {
    j = nlohmann::json{
        {"id", post.id},
        {"content", post.content},
        {"pseudonym", post.pseudonym},
        {"timestamp", post.timestamp}
    };
    if (post.node_id) {
        j["nodeId"] = *post.node_id;
    }
}

bool PostStore::insert(const Post& post) {
    std::lock_guard<std::mutex> lock(mutex_);
    return posts_.emplace(post.id, post).second;
}

bool PostStore::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return posts_.find(id) != posts_.end();
}

std::optional<Post> PostStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = posts_.find(id);
    if (it == posts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Post> PostStore::newest_first() const {
    std::vector<Post> result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        result.reserve(posts_.size());
        for (const auto& [id, post] : posts_) {
            result.push_back(post);
        }
    }
    
    std::sort(result.begin(), result.end(),
        [](const Post& a, const Post& b) {
            if (a.timestamp != b.timestamp) {
                return a.timestamp > b.timestamp;
            }
            return a.id < b.id;
        });
    
    return result;
}

size_t PostStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return posts_.size();
}

void PostStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    posts_.clear();
}

} // namespace murmur::storage
