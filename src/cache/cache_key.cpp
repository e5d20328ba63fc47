/**
 * LINGUACACHE - Translation Memory Cache
 * Cache Key Implementation - SHA-256 text hashing via OpenSSL EVP
 */

#include "cache/cache_key.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>

namespace linguacache::cache {

namespace {

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

char to_lower_ascii(char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

} // namespace

std::string normalize_text(std::string_view text) {
    if (text.empty()) {
        return {};
    }

    auto first = std::find_if_not(text.begin(), text.end(), is_space);
    if (first == text.end()) {
        return {};
    }
    auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();

    std::string normalized(first, last);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), to_lower_ascii);
    return normalized;
}

std::string normalize_language(std::string_view target_lang) {
    std::string lower(target_lang);
    std::transform(lower.begin(), lower.end(), lower.begin(), to_lower_ascii);
    return lower;
}

std::string derive_key(std::string_view text, std::string_view target_lang) {
    std::string key;
    key.reserve(kKeyNamespace.size() + target_lang.size() + 66);
    key.append(kKeyNamespace);
    key.push_back(':');
    key.append(normalize_language(target_lang));
    key.push_back(':');
    key.append(sha256_hex(normalize_text(text)));
    return key;
}

std::string sha256_hex(std::string_view data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("Failed to allocate digest context");
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("SHA-256 digest failed");
    }

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        hex.push_back(hex_chars[(digest[i] >> 4) & 0xF]);
        hex.push_back(hex_chars[digest[i] & 0xF]);
    }
    return hex;
}

} // namespace linguacache::cache
