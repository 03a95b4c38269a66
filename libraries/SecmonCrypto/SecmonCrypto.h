#ifndef SECMON_CRYPTO_H
#define SECMON_CRYPTO_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace secmon_crypto {

struct Sha256Ctx {
  uint32_t state[8];
  uint64_t bitlen;
  uint8_t buffer[64];
  size_t buffer_len;
};

void sha256_init(Sha256Ctx &ctx);
void sha256_update(Sha256Ctx &ctx, const uint8_t *data, size_t len);
void sha256_final(Sha256Ctx &ctx, uint8_t out[32]);

void hmac_sha256(const uint8_t *key, size_t key_len, const uint8_t *data, size_t len, uint8_t out[32]);

// zlib / IEEE 802.3 CRC-32 (reflected 0xEDB88320, init and final xor 0xFFFFFFFF).
uint32_t crc32(const uint8_t *data, size_t len);

// Standard alphabet, '=' padding stripped.
std::string base64_encode_unpadded(const uint8_t *data, size_t len);
// Appends '=' until the length is a multiple of 4.
std::string base64_pad(const std::string &text);
// Strict decode of padded input; false on any invalid character or length.
bool base64_decode(const std::string &text, std::vector<uint8_t> &out);

bool constant_time_eq(const std::string &a, const std::string &b);

} // namespace secmon_crypto

#endif
