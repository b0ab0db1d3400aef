#pragma once

#include <string>
#include <map>

namespace autocoin {
namespace network {

// 업비트 인증용 HS256 JWT
class JwtGenerator {
public:
    // payload: access_key, nonce, timestamp (+ query_hash, query_hash_alg=SHA512)
    static std::string generate(
        const std::string& access_key,
        const std::string& secret_key,
        const std::map<std::string, std::string>& query_params = {}
    );

    // RFC 4122 v4
    static std::string generateUUID();

    // key=value&... 의 SHA512 hex
    static std::string createQueryHash(const std::map<std::string, std::string>& params);

    static std::string buildQueryString(const std::map<std::string, std::string>& params);

    static std::string base64UrlEncode(const std::string& data);
    static std::string base64UrlDecode(const std::string& data);
};

} // namespace network
} // namespace autocoin
