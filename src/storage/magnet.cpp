#include "magnet.hpp"
#include "blocks/block_size.hpp"
#include <map>
#include <sstream>

namespace brightchain::storage {

namespace {

constexpr const char* MAGNET_SCHEME = "magnet:?";
constexpr const char* CBL_TOPIC = "urn:brightchain:cbl";

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// application/x-www-form-urlencoded decoding
Result<std::string> percent_decode(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out.push_back(' ');
        } else if (in[i] == '%') {
            if (i + 2 >= in.size()) {
                return Result<std::string>::Err(ErrorCode::InvalidMagnetURL, "Truncated percent escape");
            }
            int hi = hex_digit(in[i + 1]);
            int lo = hex_digit(in[i + 2]);
            if (hi < 0 || lo < 0) {
                return Result<std::string>::Err(ErrorCode::InvalidMagnetURL, "Malformed percent escape");
            }
            out.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(in[i]);
        }
    }
    return Result<std::string>::Ok(std::move(out));
}

Result<std::vector<Checksum>> parse_checksum_list(const std::string& value) {
    std::vector<Checksum> out;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        if (item.empty()) {
            continue;
        }
        auto checksum = Checksum::from_hex(item);
        if (checksum.is_err()) {
            return Result<std::vector<Checksum>>::Err(ErrorCode::InvalidMagnetURL,
                "Parity id is not a checksum: " + checksum.error().message());
        }
        out.push_back(checksum.value());
    }
    return Result<std::vector<Checksum>>::Ok(std::move(out));
}

std::string join_checksums(const std::vector<Checksum>& checksums) {
    std::string out;
    for (size_t i = 0; i < checksums.size(); ++i) {
        if (i > 0) {
            out.push_back(',');
        }
        out += checksums[i].to_hex();
    }
    return out;
}

} // namespace

std::string CblMagnet::to_uri() const {
    std::string uri = MAGNET_SCHEME;
    uri += "xt=";
    uri += CBL_TOPIC;
    uri += "&bs=" + std::to_string(block_size);
    uri += "&b1=" + block1.to_hex();
    uri += "&b2=" + block2.to_hex();
    if (!block1_parity.empty()) {
        uri += "&p1=" + join_checksums(block1_parity);
    }
    if (!block2_parity.empty()) {
        uri += "&p2=" + join_checksums(block2_parity);
    }
    if (encrypted) {
        uri += "&enc=1";
    }
    return uri;
}

Result<CblMagnet> CblMagnet::parse(const std::string& uri) {
    using R = Result<CblMagnet>;
    const std::string scheme = MAGNET_SCHEME;
    if (uri.compare(0, scheme.size(), scheme) != 0) {
        return R::Err(ErrorCode::InvalidMagnetURL, "Magnet URL must start with \"magnet:?\"");
    }

    // First occurrence of a key wins
    std::map<std::string, std::string> params;
    std::istringstream query(uri.substr(scheme.size()));
    std::string pair;
    while (std::getline(query, pair, '&')) {
        if (pair.empty()) {
            continue;
        }
        const auto eq = pair.find('=');
        BRIGHTCHAIN_TRY_UNWRAP(key, percent_decode(pair.substr(0, eq)));
        BRIGHTCHAIN_TRY_UNWRAP(value, percent_decode(eq == std::string::npos ? std::string() : pair.substr(eq + 1)));
        params.emplace(std::move(key), std::move(value));
    }

    auto xt = params.find("xt");
    if (xt == params.end() || xt->second != CBL_TOPIC) {
        return R::Err(ErrorCode::InvalidMagnetURLXT, "xt parameter must be \"urn:brightchain:cbl\"");
    }
    for (const char* required : {"b1", "b2", "bs"}) {
        auto it = params.find(required);
        if (it == params.end() || it->second.empty()) {
            return R::Err(ErrorCode::InvalidMagnetURLMissing, std::string("Missing ") + required + " parameter");
        }
    }

    const std::string& bs = params["bs"];
    if (bs.size() > 10 || bs.find_first_not_of("0123456789") != std::string::npos) {
        return R::Err(ErrorCode::InvalidMagnetURLInvalidBlockSize, "Block size \"" + bs + "\" is not a number");
    }
    const unsigned long long block_size = std::stoull(bs);
    if (block_size > UINT32_MAX || !blocks::is_valid_block_size(static_cast<uint32_t>(block_size))) {
        return R::Err(ErrorCode::InvalidMagnetURLInvalidBlockSize, "Block size " + bs + " is not a known size");
    }

    CblMagnet magnet;
    magnet.block_size = static_cast<uint32_t>(block_size);
    auto b1 = Checksum::from_hex(params["b1"]);
    if (b1.is_err()) {
        return R::Err(ErrorCode::InvalidMagnetURL, "b1 is not a checksum: " + b1.error().message());
    }
    auto b2 = Checksum::from_hex(params["b2"]);
    if (b2.is_err()) {
        return R::Err(ErrorCode::InvalidMagnetURL, "b2 is not a checksum: " + b2.error().message());
    }
    magnet.block1 = b1.value();
    magnet.block2 = b2.value();

    if (auto p1 = params.find("p1"); p1 != params.end()) {
        BRIGHTCHAIN_TRY_UNWRAP(parity, parse_checksum_list(p1->second));
        magnet.block1_parity = std::move(parity);
    }
    if (auto p2 = params.find("p2"); p2 != params.end()) {
        BRIGHTCHAIN_TRY_UNWRAP(parity, parse_checksum_list(p2->second));
        magnet.block2_parity = std::move(parity);
    }
    auto enc = params.find("enc");
    magnet.encrypted = enc != params.end() && enc->second == "1";
    return R::Ok(std::move(magnet));
}

bool CblMagnet::operator==(const CblMagnet& other) const {
    return block_size == other.block_size && block1 == other.block1 && block2 == other.block2 &&
           block1_parity == other.block1_parity && block2_parity == other.block2_parity &&
           encrypted == other.encrypted;
}

} // namespace brightchain::storage
