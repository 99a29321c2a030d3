#ifndef CRYPTO_UTILS_HPP
#define CRYPTO_UTILS_HPP

#include <string>
#include <vector>
#include <cstddef>

namespace CryptoUtils {

std::string base64_encode(const std::string& input_data);
std::string sha1_digest(const std::string& input_data);
std::string hmac_sha256(const std::string& key, const std::string& message);
std::vector<unsigned char> generate_random_bytes(size_t byte_count);

} // namespace CryptoUtils

#endif // CRYPTO_UTILS_HPP
