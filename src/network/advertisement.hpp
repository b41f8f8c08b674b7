#pragma once

#include "murmur/common.hpp"
#include "murmur/error.hpp"
#include "network/peer.hpp"
#include <nlohmann/json.hpp>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace murmur::network {

/**
 * PeerAdvertisement - Out-of-band description of a peer (e.g. a scanned code)
 */
struct PeerAdvertisement {
    std::string node_id;
    std::string address;
    uint16_t port = 0;
    std::string public_key;
    std::vector<std::string> capabilities;
    Timestamp timestamp = 0;
    
    PeerDescriptor to_descriptor() const;
    
    bool operator==(const PeerAdvertisement& other) const;
};

void to_json(nlohmann::json& j, const PeerAdvertisement& adv);

/**
 * Text encodings understood by parse_advertisement
 * 
 * Json:      {"node_id":..,"address":..,"port":..,"public_key":..,"capabilities":[..],"timestamp":..}
 *            camelCase keys nodeId/publicKey are accepted as well
 * Uri:       scheme://host[:port]?key=<publicKey>&capabilities=<a,b>&ts=<epoch>
 *            host is both node id and address, port defaults to 8888
 * Delimited: nodeId|address|port|publicKey[|capabilities[|timestamp]]
 */
enum class AdvertisementFormat {
    Json,
    Uri,
    Delimited
};

const char* advertisement_format_to_string(AdvertisementFormat format);

// Decimal port in 1..65535 with no trailing characters
std::optional<uint16_t> parse_port(const std::string& text);

// Comma-separated capability tags, trimmed, empty tags dropped
std::vector<std::string> split_capabilities(const std::string& list);

/**
 * Decode an advertisement. Grammars are tried in the order Json, Uri, Delimited.
 * 
 * Fails with ErrorCode::MalformedAdvertisement when no grammar matches or a
 * required field is missing or invalid, and with ErrorCode::StaleAdvertisement
 * when the advertisement is more than one hour older than now_ms.
 * 
 * Timestamps are epoch milliseconds; values below 1e11 are taken as epoch
 * seconds. A missing or zero timestamp means now_ms.
 */
Result<PeerAdvertisement> parse_advertisement(const std::string& text, Timestamp now_ms);
Result<PeerAdvertisement> parse_advertisement(const std::string& text);

/**
 * Render an advertisement in the given grammar. The Uri form carries only the
 * address, so node_id is lost unless it equals the address.
 * @throws ProtocolException if a field cannot be represented (Delimited form
 *         with a '|' inside a field)
 */
std::string encode_advertisement(const PeerAdvertisement& adv, AdvertisementFormat format);

/**
 * ScanHistory - Most-recent-first record of accepted advertisements
 */
class ScanHistory {
public:
    explicit ScanHistory(size_t capacity = constants::SCAN_HISTORY_CAPACITY);
    
    void record(const PeerAdvertisement& adv);
    
    std::vector<PeerAdvertisement> entries() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }
    void clear();
    
private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<PeerAdvertisement> entries_;
};

} // namespace murmur::network
