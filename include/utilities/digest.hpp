#ifndef CSVHASH_DIGEST_HPP
#define CSVHASH_DIGEST_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace csvhash {

/// Supported hashing algorithms.
enum class HashAlgorithm { MD5, SHA1, SHA256, SHA512, BLAKE2B, BLAKE2S };

/// Algorithm used when none is requested.
inline constexpr HashAlgorithm DEFAULT_ALGORITHM = HashAlgorithm::SHA256;

/**
 * @brief Resolve a case-insensitive algorithm name.
 * @param name One of md5, sha1, sha256, sha512, blake2b, blake2s.
 * @return The matching algorithm.
 * @throws UnsupportedAlgorithmError if the name is not in the closed set.
 */
HashAlgorithm parseHashAlgorithm(const std::string &name);

/// Canonical lowercase name, e.g. "sha256".
std::string algorithmName(HashAlgorithm algo);

/// Canonical names of all supported algorithms in table order.
const std::vector<std::string> &supportedAlgorithms();

/// Digest length in bytes (BLAKE2b is 64, BLAKE2s is 32).
size_t digestSize(HashAlgorithm algo);

/**
 * @brief Hash a byte sequence and return the lowercase hex digest.
 *
 * Uses the OpenSSL EVP interface. The returned string is always
 * 2 * digestSize(algo) characters long.
 *
 * @throws IOFailureError if the crypto library reports a failure.
 */
std::string hexDigest(HashAlgorithm algo, const void *data, size_t size);

inline std::string hexDigest(HashAlgorithm algo, const std::string &data) {
  return hexDigest(algo, data.data(), data.size());
}

/**
 * @brief Known-answer self test of every supported algorithm.
 *
 * Each algorithm hashes the string "abc" and the result is compared with
 * the published test vector.
 *
 * @return true if every digest matches, otherwise false.
 */
bool digestSelfTest();

} // namespace csvhash

#endif // CSVHASH_DIGEST_HPP
