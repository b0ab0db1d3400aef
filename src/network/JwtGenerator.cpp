#include "network/JwtGenerator.h"
#include <nlohmann/json.hpp>
#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/buffer.h>
#include <algorithm>
#include <sstream>
#include <iomanip>
#include <random>
#include <chrono>
#include <stdexcept>

namespace autocoin {
namespace network {

std::string JwtGenerator::base64UrlEncode(const std::string& data) {
    BIO* b64 = BIO_new(BIO_f_base64());
    BIO* bio = BIO_new(BIO_s_mem());
    bio = BIO_push(b64, bio);

    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);
    BIO_write(bio, data.data(), static_cast<int>(data.length()));
    (void)BIO_flush(bio);

    BUF_MEM* buffer_ptr = nullptr;
    BIO_get_mem_ptr(bio, &buffer_ptr);

    std::string result(buffer_ptr->data, buffer_ptr->length);
    BIO_free_all(bio);

    // URL safe
    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    return result;
}

std::string JwtGenerator::base64UrlDecode(const std::string& data) {
    std::string b64 = data;
    std::replace(b64.begin(), b64.end(), '-', '+');
    std::replace(b64.begin(), b64.end(), '_', '/');
    while (b64.size() % 4 != 0) {
        b64.push_back('=');
    }

    BIO* bio = BIO_new_mem_buf(b64.data(), static_cast<int>(b64.size()));
    BIO* b64_filter = BIO_new(BIO_f_base64());
    bio = BIO_push(b64_filter, bio);
    BIO_set_flags(bio, BIO_FLAGS_BASE64_NO_NL);

    std::string result(b64.size(), '\0');
    int len = BIO_read(bio, &result[0], static_cast<int>(result.size()));
    BIO_free_all(bio);

    if (len < 0) {
        throw std::runtime_error("base64 decode failed");
    }
    result.resize(static_cast<size_t>(len));
    return result;
}

std::string JwtGenerator::generate(
    const std::string& access_key,
    const std::string& secret_key,
    const std::map<std::string, std::string>& query_params
) {
    nlohmann::json header;
    header["alg"] = "HS256";
    header["typ"] = "JWT";

    std::string header_b64 = base64UrlEncode(header.dump());

    auto timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();

    nlohmann::json payload;
    payload["access_key"] = access_key;
    payload["nonce"] = generateUUID();
    payload["timestamp"] = timestamp;

    if (!query_params.empty()) {
        payload["query_hash"] = createQueryHash(query_params);
        payload["query_hash_alg"] = "SHA512";
    }

    std::string payload_b64 = base64UrlEncode(payload.dump());

    // HMAC-SHA256
    std::string message = header_b64 + "." + payload_b64;

    unsigned char signature[EVP_MAX_MD_SIZE];
    unsigned int signature_len = 0;

    HMAC(EVP_sha256(),
         secret_key.data(), static_cast<int>(secret_key.length()),
         reinterpret_cast<const unsigned char*>(message.data()), message.length(),
         signature, &signature_len);

    std::string signature_str(reinterpret_cast<char*>(signature), signature_len);
    return message + "." + base64UrlEncode(signature_str);
}

std::string JwtGenerator::generateUUID() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t part1 = dis(gen);
    uint64_t part2 = dis(gen);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0')
        << std::setw(8) << (part1 >> 32)
        << "-" << std::setw(4) << ((part1 >> 16) & 0xFFFF)
        << "-4" << std::setw(3) << (part1 & 0xFFF)
        << "-" << std::setw(4) << (((part2 >> 48) & 0x3FFF) | 0x8000)
        << "-" << std::setw(12) << (part2 & 0xFFFFFFFFFFFFULL);

    return oss.str();
}

std::string JwtGenerator::buildQueryString(const std::map<std::string, std::string>& params) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

std::string JwtGenerator::createQueryHash(const std::map<std::string, std::string>& params) {
    const std::string query_string = buildQueryString(params);

    unsigned char hash[SHA512_DIGEST_LENGTH];
    SHA512(reinterpret_cast<const unsigned char*>(query_string.data()),
           query_string.length(), hash);

    std::ostringstream hex_stream;
    hex_stream << std::hex << std::setfill('0');
    for (int i = 0; i < SHA512_DIGEST_LENGTH; ++i) {
        hex_stream << std::setw(2) << static_cast<int>(hash[i]);
    }
    return hex_stream.str();
}

} // namespace network
} // namespace autocoin
