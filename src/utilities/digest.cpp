#include "utilities/digest.hpp"
#include "utilities/errors.h"
#include "utilities/logger.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <memory>
#include <openssl/evp.h>

namespace csvhash {

namespace {

struct AlgorithmEntry {
  HashAlgorithm algo;
  const char *name;
  const EVP_MD *(*md)();
  size_t size;
  const char *abcVector; // digest of "abc"
};

const std::array<AlgorithmEntry, 6> &algorithmTable() {
  static const std::array<AlgorithmEntry, 6> table = {{
      {HashAlgorithm::MD5, "md5", EVP_md5, 16,
       "900150983cd24fb0d6963f7d28e17f72"},
      {HashAlgorithm::SHA1, "sha1", EVP_sha1, 20,
       "a9993e364706816aba3e25717850c26c9cd0d89d"},
      {HashAlgorithm::SHA256, "sha256", EVP_sha256, 32,
       "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad"},
      {HashAlgorithm::SHA512, "sha512", EVP_sha512, 64,
       "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
       "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f"},
      {HashAlgorithm::BLAKE2B, "blake2b", EVP_blake2b512, 64,
       "ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
       "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923"},
      {HashAlgorithm::BLAKE2S, "blake2s", EVP_blake2s256, 32,
       "508c5e8c327c14e2e1a72ba34eeb452f37458b209ed63a294d999b4c86675982"},
  }};
  return table;
}

const AlgorithmEntry &entryFor(HashAlgorithm algo) {
  for (const auto &entry : algorithmTable()) {
    if (entry.algo == algo)
      return entry;
  }
  throw UnsupportedAlgorithmError(
      std::to_string(static_cast<int>(algo)));
}

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};

std::string toHex(const unsigned char *bytes, size_t len) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (size_t i = 0; i < len; ++i) {
    out.push_back(digits[bytes[i] >> 4]);
    out.push_back(digits[bytes[i] & 0x0f]);
  }
  return out;
}

} // namespace

HashAlgorithm parseHashAlgorithm(const std::string &name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  for (const auto &entry : algorithmTable()) {
    if (lowered == entry.name)
      return entry.algo;
  }
  throw UnsupportedAlgorithmError(name);
}

std::string algorithmName(HashAlgorithm algo) { return entryFor(algo).name; }

const std::vector<std::string> &supportedAlgorithms() {
  static const std::vector<std::string> names = [] {
    std::vector<std::string> v;
    for (const auto &entry : algorithmTable())
      v.emplace_back(entry.name);
    return v;
  }();
  return names;
}

size_t digestSize(HashAlgorithm algo) { return entryFor(algo).size; }

std::string hexDigest(HashAlgorithm algo, const void *data, size_t size) {
  const AlgorithmEntry &entry = entryFor(algo);

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw IOFailureError("Failed to allocate digest context");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digestLen = 0;
  if (EVP_DigestInit_ex(ctx.get(), entry.md(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digestLen) != 1) {
    throw IOFailureError(std::string("OpenSSL digest failed for ") +
                         entry.name);
  }
  return toHex(digest, digestLen);
}

bool digestSelfTest() {
  const std::string msg = "abc";
  for (const auto &entry : algorithmTable()) {
    try {
      if (hexDigest(entry.algo, msg) != entry.abcVector) {
        Logger::getInstance().log(LogLevel::ERROR,
                                  std::string("Self test mismatch for ") +
                                      entry.name);
        return false;
      }
    } catch (const CsvHashError &e) {
      Logger::getInstance().log(LogLevel::ERROR,
                                std::string("Self test failed for ") +
                                    entry.name + ": " + e.what());
      return false;
    }
  }
  Logger::getInstance().log(LogLevel::DEBUG, "Digest self test passed");
  return true;
}

} // namespace csvhash
