// ============================================================================
// AEGIS TRADE CORE - Binance Authentication
// ============================================================================
// HMAC-SHA256 signing for Binance API requests
// ============================================================================

#include "aegis/exchange/binance/client.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <iomanip>
#include <sstream>

namespace aegis::exchange::binance {

std::string hmac_sha256(std::string_view key, std::string_view message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    const unsigned char* result = HMAC(EVP_sha256(),
                                       key.data(), static_cast<int>(key.size()),
                                       reinterpret_cast<const unsigned char*>(message.data()),
                                       message.size(),
                                       digest, &digest_len);
    if (result == nullptr) {
        throw GatewayError("HMAC-SHA256 signing failed");
    }

    std::ostringstream ss;
    for (unsigned int i = 0; i < digest_len; ++i) {
        ss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(digest[i]);
    }
    return ss.str();
}

std::string generate_signature(std::string_view secret_key, std::string_view query_string) {
    return hmac_sha256(secret_key, query_string);
}

}  // namespace aegis::exchange::binance
