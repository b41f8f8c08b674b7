#include "network/advertisement.hpp"
#include "murmur/time_utils.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cmath>
#include <optional>
#include <regex>
#include <sstream>

namespace murmur::network {

namespace {

using json = nlohmann::json;

// Timestamps smaller than this are epoch seconds (1e11 ms is March 1973)
constexpr uint64_t SECONDS_CUTOFF = 100000000000ULL;

constexpr size_t DELIMITED_MIN_FIELDS = 4;
constexpr size_t DELIMITED_MAX_FIELDS = 6;

// 2^64; a float timestamp at or above this has no uint64_t value
constexpr double TIMESTAMP_LIMIT = 18446744073709551616.0;

Result<PeerAdvertisement> malformed(const std::string& message) {
    return Result<PeerAdvertisement>::Err(ErrorCode::MalformedAdvertisement, message);
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::optional<uint64_t> parse_unsigned(const std::string& s) {
    if (s.empty()) {
        return std::nullopt;
    }

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<uint16_t> parse_port(const std::string& s) {
    auto value = parse_unsigned(s);
    if (!value || *value == 0 || *value > 65535) {
        return std::nullopt;
    }
    return static_cast<uint16_t>(*value);
}

std::vector<std::string> split_capabilities(const std::string& list) {
    std::vector<std::string> result;
    for (const auto& part : split(list, ',')) {
        auto tag = trim(part);
        if (!tag.empty()) {
            result.push_back(tag);
        }
    }
    return result;
}

namespace {

Timestamp normalize_timestamp(uint64_t raw, Timestamp now_ms) {
    if (raw == 0) {
        return now_ms;
    }
    if (raw < SECONDS_CUTOFF) {
        return raw * 1000;
    }
    return raw;
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Query-string decoding: %XX escapes and '+' for space
std::optional<std::string> percent_decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%') {
            if (i + 2 >= s.size()) {
                return std::nullopt;
            }
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) {
                return std::nullopt;
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else if (s[i] == '+') {
            out.push_back(' ');
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

std::string percent_encode(const std::string& s, const std::string& keep = "") {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
            keep.find(static_cast<char>(c)) != std::string::npos) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(HEX[c >> 4]);
            out.push_back(HEX[c & 0x0F]);
        }
    }
    return out;
}

// Grammar parsers. Each returns nullopt when the text is not in its grammar,
// otherwise the structural parse result (freshness is checked afterwards).
using GrammarParser = std::optional<Result<PeerAdvertisement>> (*)(const std::string&, Timestamp);

std::optional<std::string> json_string_field(const json& obj, const char* snake, const char* camel) {
    for (const char* key : {snake, camel}) {
        auto it = obj.find(key);
        if (it != obj.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

std::optional<Result<PeerAdvertisement>> parse_json(const std::string& text, Timestamp now_ms) {
    if (text.front() != '{') {
        return std::nullopt;
    }

    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        return malformed(std::string("invalid JSON: ") + e.what());
    }

    if (!doc.is_object()) {
        return malformed("JSON advertisement must be an object");
    }

    PeerAdvertisement adv;

    auto node_id = json_string_field(doc, "node_id", "nodeId");
    if (!node_id || node_id->empty()) {
        return malformed("missing node_id");
    }
    adv.node_id = *node_id;

    auto address = json_string_field(doc, "address", "address");
    if (!address || address->empty()) {
        return malformed("missing address");
    }
    adv.address = *address;

    auto port_it = doc.find("port");
    if (port_it == doc.end()) {
        return malformed("missing port");
    }
    std::optional<uint16_t> port;
    if (port_it->is_number_unsigned() || port_it->is_number_integer()) {
        auto value = port_it->get<int64_t>();
        if (value > 0 && value <= 65535) {
            port = static_cast<uint16_t>(value);
        }
    } else if (port_it->is_string()) {
        port = parse_port(port_it->get<std::string>());
    }
    if (!port) {
        return malformed("invalid port");
    }
    adv.port = *port;

    if (doc.contains("public_key") || doc.contains("publicKey")) {
        auto key = json_string_field(doc, "public_key", "publicKey");
        if (!key) {
            return malformed("public_key must be a string");
        }
        adv.public_key = *key;
    }

    auto caps_it = doc.find("capabilities");
    if (caps_it != doc.end() && !caps_it->is_null()) {
        if (!caps_it->is_array()) {
            return malformed("capabilities must be a list");
        }
        for (const auto& cap : *caps_it) {
            if (!cap.is_string()) {
                return malformed("capabilities must be strings");
            }
            adv.capabilities.push_back(cap.get<std::string>());
        }
    }

    uint64_t raw_ts = 0;
    auto ts_it = doc.find("timestamp");
    if (ts_it != doc.end() && !ts_it->is_null()) {
        if (ts_it->is_number_unsigned()) {
            raw_ts = ts_it->get<uint64_t>();
        } else if (ts_it->is_number_integer() || ts_it->is_number_float()) {
            auto value = ts_it->get<double>();
            if (value < 0) {
                return malformed("negative timestamp");
            }
            if (!std::isfinite(value) || value >= TIMESTAMP_LIMIT) {
                return malformed("timestamp out of range");
            }
            raw_ts = static_cast<uint64_t>(value);
        } else if (ts_it->is_string()) {
            auto value = parse_unsigned(ts_it->get<std::string>());
            if (!value) {
                return malformed("invalid timestamp");
            }
            raw_ts = *value;
        } else {
            return malformed("invalid timestamp");
        }
    }
    adv.timestamp = normalize_timestamp(raw_ts, now_ms);

    return Result<PeerAdvertisement>::Ok(std::move(adv));
}

std::optional<Result<PeerAdvertisement>> parse_uri(const std::string& text, Timestamp now_ms) {
    static const std::regex scheme_re(R"(^[A-Za-z][A-Za-z0-9+.\-]*://)");
    if (!std::regex_search(text, scheme_re)) {
        return std::nullopt;
    }

    static const std::regex uri_re(R"(^[A-Za-z][A-Za-z0-9+.\-]*://([^/?#:]+)(?::([^/?#]*))?/?(?:\?([^#]*))?(?:#.*)?$)");
    std::smatch match;
    if (!std::regex_match(text, match, uri_re)) {
        return malformed("invalid advertisement URI");
    }

    PeerAdvertisement adv;
    adv.node_id = match[1].str();
    adv.address = match[1].str();

    if (match[2].matched && !match[2].str().empty()) {
        auto port = parse_port(match[2].str());
        if (!port) {
            return malformed("invalid port");
        }
        adv.port = *port;
    } else {
        adv.port = constants::DEFAULT_PORT;
    }

    uint64_t raw_ts = 0;
    if (match[3].matched) {
        for (const auto& pair : split(match[3].str(), '&')) {
            if (pair.empty()) {
                continue;
            }
            auto eq = pair.find('=');
            auto key = pair.substr(0, eq);
            auto value = percent_decode(eq == std::string::npos ? std::string() : pair.substr(eq + 1));
            if (!value) {
                return malformed("invalid escape in query parameter " + key);
            }

            if (key == "key") {
                adv.public_key = *value;
            } else if (key == "capabilities") {
                adv.capabilities = split_capabilities(*value);
            } else if (key == "ts") {
                if (!value->empty()) {
                    auto ts = parse_unsigned(*value);
                    if (!ts) {
                        return malformed("invalid ts parameter");
                    }
                    raw_ts = *ts;
                }
            }
        }
    }
    adv.timestamp = normalize_timestamp(raw_ts, now_ms);

    return Result<PeerAdvertisement>::Ok(std::move(adv));
}

std::optional<Result<PeerAdvertisement>> parse_delimited(const std::string& text, Timestamp now_ms) {
    if (text.find('|') == std::string::npos) {
        return std::nullopt;
    }

    auto fields = split(text, '|');
    if (fields.size() < DELIMITED_MIN_FIELDS) {
        return malformed("expected at least 4 fields, got " + std::to_string(fields.size()));
    }
    if (fields.size() > DELIMITED_MAX_FIELDS) {
        return malformed("expected at most 6 fields, got " + std::to_string(fields.size()));
    }

    PeerAdvertisement adv;
    adv.node_id = trim(fields[0]);
    adv.address = trim(fields[1]);
    if (adv.node_id.empty() || adv.address.empty()) {
        return malformed("node id and address are required");
    }

    auto port = parse_port(trim(fields[2]));
    if (!port) {
        return malformed("invalid port");
    }
    adv.port = *port;
    adv.public_key = trim(fields[3]);

    if (fields.size() > 4) {
        adv.capabilities = split_capabilities(fields[4]);
    }

    uint64_t raw_ts = 0;
    if (fields.size() > 5 && !trim(fields[5]).empty()) {
        auto ts = parse_unsigned(trim(fields[5]));
        if (!ts) {
            return malformed("invalid timestamp");
        }
        raw_ts = *ts;
    }
    adv.timestamp = normalize_timestamp(raw_ts, now_ms);

    return Result<PeerAdvertisement>::Ok(std::move(adv));
}

constexpr std::array<GrammarParser, 3> GRAMMARS = {parse_json, parse_uri, parse_delimited};

} // namespace

// PeerAdvertisement methods

PeerDescriptor PeerAdvertisement::to_descriptor() const {
    PeerDescriptor descriptor;
    descriptor.node_id = node_id;
    descriptor.address = address;
    descriptor.port = port;
    descriptor.public_key = public_key;
    descriptor.capabilities = capabilities;
    return descriptor;
}

bool PeerAdvertisement::operator==(const PeerAdvertisement& other) const {
    return node_id == other.node_id && address == other.address && port == other.port &&
           public_key == other.public_key && capabilities == other.capabilities &&
           timestamp == other.timestamp;
}

void to_json(nlohmann::json& j, const PeerAdvertisement& adv) {
    j = nlohmann::json{
        {"nodeId", adv.node_id},
        {"address", adv.address},
        {"port", adv.port},
        {"publicKey", adv.public_key},
        {"capabilities", adv.capabilities},
        {"timestamp", adv.timestamp}
    };
}

const char* advertisement_format_to_string(AdvertisementFormat format) {
    switch (format) {
        case AdvertisementFormat::Json: return "json";
        case AdvertisementFormat::Uri: return "uri";
        case AdvertisementFormat::Delimited: return "delimited";
    }
    return "unknown";
}

Result<PeerAdvertisement> parse_advertisement(const std::string& text, Timestamp now_ms) {
    auto payload = trim(text);
    if (payload.empty()) {
        return malformed("empty advertisement");
    }

    for (auto grammar : GRAMMARS) {
        auto parsed = grammar(payload, now_ms);
        if (!parsed) {
            continue;
        }

        if (parsed->is_err()) {
            MURMUR_LOG_DEBUG("Rejected advertisement: {}", parsed->error().to_string());
            return *parsed;
        }

        const auto& adv = parsed->value();
        uint64_t age = time::age_ms(adv.timestamp, now_ms);
        if (age > constants::ADVERTISEMENT_MAX_AGE_MS) {
            MURMUR_LOG_DEBUG("Rejected stale advertisement from {} ({} s old)", adv.node_id, age / 1000);
            return Result<PeerAdvertisement>::Err(Error(
                ErrorCode::StaleAdvertisement,
                "advertisement is older than one hour",
                std::to_string(age / 1000) + " s old"));
        }

        return *parsed;
    }

    return malformed("unrecognized advertisement format");
}

Result<PeerAdvertisement> parse_advertisement(const std::string& text) {
    return parse_advertisement(text, time::timestamp_milliseconds());
}

std::string encode_advertisement(const PeerAdvertisement& adv, AdvertisementFormat format) {
    switch (format) {
        case AdvertisementFormat::Json: {
            json doc = {
                {"node_id", adv.node_id},
                {"address", adv.address},
                {"port", adv.port},
                {"public_key", adv.public_key},
                {"capabilities", adv.capabilities},
                {"timestamp", adv.timestamp}
            };
            return doc.dump();
        }

        case AdvertisementFormat::Uri: {
            std::ostringstream oss;
            oss << constants::ADVERTISEMENT_URI_SCHEME << "://" << adv.address << ":" << adv.port
                << "?key=" << percent_encode(adv.public_key);
            if (!adv.capabilities.empty()) {
                oss << "&capabilities=";
                for (size_t i = 0; i < adv.capabilities.size(); ++i) {
                    if (i > 0) oss << ",";
                    oss << percent_encode(adv.capabilities[i]);
                }
            }
            oss << "&ts=" << adv.timestamp;
            return oss.str();
        }

        case AdvertisementFormat::Delimited: {
            std::vector<std::string> fields = {adv.node_id, adv.address, adv.public_key};
            fields.insert(fields.end(), adv.capabilities.begin(), adv.capabilities.end());
            for (const auto& field : fields) {
                if (field.find('|') != std::string::npos) {
                    throw ProtocolException(ErrorCode::InvalidFormat,
                                            "field contains '|' and cannot be pipe-delimited: " + field);
                }
            }

            std::ostringstream oss;
            oss << adv.node_id << "|" << adv.address << "|" << adv.port << "|" << adv.public_key << "|";
            for (size_t i = 0; i < adv.capabilities.size(); ++i) {
                if (i > 0) oss << ",";
                oss << adv.capabilities[i];
            }
            oss << "|" << adv.timestamp;
            return oss.str();
        }
    }

    throw ProtocolException(ErrorCode::InvalidFormat, "unknown advertisement format");
}

// ScanHistory methods

ScanHistory::ScanHistory(size_t capacity)
    : capacity_(capacity)
{
}

void ScanHistory::record(const PeerAdvertisement& adv) {
    std::lock_guard<std::mutex> lock(mutex_);

    entries_.push_front(adv);
    while (entries_.size() > capacity_) {
        entries_.pop_back();
    }
}

std::vector<PeerAdvertisement> ScanHistory::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<PeerAdvertisement>(entries_.begin(), entries_.end());
}

size_t ScanHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ScanHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

} // namespace murmur::network
