#include "crypto_utils.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <stdexcept>

namespace CryptoUtils {

std::string base64_encode(const std::string& input_data) {
    if (input_data.empty()) {
        return "";
    }
    std::vector<unsigned char> encoded_buffer(4 * ((input_data.size() + 2) / 3) + 1);
    int encoded_length = EVP_EncodeBlock(encoded_buffer.data(),
                                         reinterpret_cast<const unsigned char*>(input_data.data()),
                                         static_cast<int>(input_data.size()));
    if (encoded_length < 0) {
        throw std::runtime_error("Base64 encoding failed");
    }
    return std::string(reinterpret_cast<const char*>(encoded_buffer.data()), static_cast<size_t>(encoded_length));
}

std::string sha1_digest(const std::string& input_data) {
    unsigned char digest_bytes[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(input_data.data()), input_data.size(), digest_bytes);
    return std::string(reinterpret_cast<const char*>(digest_bytes), SHA_DIGEST_LENGTH);
}

std::string hmac_sha256(const std::string& key, const std::string& message) {
    unsigned char digest_bytes[EVP_MAX_MD_SIZE];
    unsigned int digest_length = 0;
    unsigned char* hmac_result = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                                      reinterpret_cast<const unsigned char*>(message.data()), message.size(),
                                      digest_bytes, &digest_length);
    if (!hmac_result) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest_bytes), digest_length);
}

std::vector<unsigned char> generate_random_bytes(size_t byte_count) {
    std::vector<unsigned char> random_bytes(byte_count);
    if (byte_count > 0 && RAND_bytes(random_bytes.data(), static_cast<int>(byte_count)) != 1) {
        throw std::runtime_error("RAND_bytes failed to generate " + std::to_string(byte_count) + " bytes");
    }
    return random_bytes;
}

} // namespace CryptoUtils
