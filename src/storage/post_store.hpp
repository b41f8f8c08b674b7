#pragma once

#include "murmur/common.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace murmur::storage {

/**
 * Post - A feed entry, created locally or replicated from a peer
 */
struct Post {
    std::string id;
    std::string content;
    std::string pseudonym;
    Timestamp timestamp = 0;
    std::optional<std::string> node_id;  // Originating peer, if known
};

void to_json(nlohmann::json& j, const Post& post);

/**
 * PostStore - In-memory table of known posts keyed by id
 * 
 * Insertion is idempotent: a post whose id is already stored is ignored,
 * the first copy wins.
 */
class PostStore {
public:
    PostStore() = default;
    ~PostStore() = default;
    
    /**
     * @return true if the post was stored, false if its id was already known
     */
    bool insert(const Post& post);
    
    bool contains(const std::string& id) const;
    std::optional<Post> get(const std::string& id) const;
    
    // Newest first by timestamp, ties broken by id
    std::vector<Post> newest_first() const;
    
    size_t size() const;
    void clear();
    
private:
    mutable std::mutex mutex_;
    std::map<std::string, Post> posts_;
};

} // namespace murmur::storage
