/**
 * LINGUACACHE - Translation Memory Cache
 * Cache Key - SHA-256 based keys for translation memory entries
 *
 * Creates deterministic cache keys from:
 * - Source text (normalized: trimmed and lowercased)
 * - Target language code (lowercased)
 *
 * Key format: tm:{target_lang}:{sha256 hex of normalized text}
 */

#ifndef LINGUACACHE_CACHE_CACHE_KEY_HPP
#define LINGUACACHE_CACHE_CACHE_KEY_HPP

#include <string>
#include <string_view>

namespace linguacache::cache {

/**
 * Namespace tag prefixed to every key
 */
constexpr std::string_view kKeyNamespace = "tm";

/**
 * Normalize source text for key derivation
 *
 * Strips leading/trailing ASCII whitespace and folds ASCII letters to
 * lowercase. Many subtitle lines differ only in case, so this trades
 * precision for hit rate. Idempotent; empty input yields empty output.
 *
 * @param text Raw source text (UTF-8)
 * @return Normalized text
 */
std::string normalize_text(std::string_view text);

/**
 * Lowercase a language tag ("TR" -> "tr")
 */
std::string normalize_language(std::string_view target_lang);

/**
 * Derive the cache key for a (text, target language) pair
 *
 * @param text Raw source text
 * @param target_lang Target language code
 * @return Key of the form "tm:<lang>:<64 hex chars>"
 */
std::string derive_key(std::string_view text, std::string_view target_lang);

/**
 * SHA-256 digest of data, lowercase hex encoded
 *
 * @throws std::runtime_error if the digest cannot be computed
 */
std::string sha256_hex(std::string_view data);

} // namespace linguacache::cache

#endif // LINGUACACHE_CACHE_CACHE_KEY_HPP
