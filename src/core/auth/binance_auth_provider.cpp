/**
 * @file binance_auth_provider.cpp
 */

#include "core/auth/auth_provider.h"
#include <openssl/hmac.h>
#include <openssl/evp.h>
#include <sstream>
#include <iomanip>

namespace tradebot::auth {

std::string hmac_sha256_hex(const std::string& key, const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    HMAC(EVP_sha256(), key.c_str(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash, &hash_len);
    std::ostringstream oss;
    for (unsigned i = 0; i < hash_len; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return oss.str();
}

std::string BinanceAuthProvider::sign_query(const std::string& query,
                                            const std::string& api_secret,
                                            uint64_t timestamp_ms,
                                            long recv_window_ms) const {
    std::string full_query = query;
    if (!full_query.empty()) full_query += "&";
    full_query += "timestamp=" + std::to_string(timestamp_ms);
    full_query += "&recvWindow=" + std::to_string(recv_window_ms);
    const std::string signature = hmac_sha256_hex(api_secret, full_query);
    full_query += "&signature=" + signature;
    return full_query;
}

std::vector<nethttp::Header> BinanceAuthProvider::build_headers(const std::string& api_key) const {
    std::vector<nethttp::Header> hdrs;
    hdrs.push_back({"X-MBX-APIKEY", api_key});
    return hdrs;
}

} // namespace tradebot::auth
