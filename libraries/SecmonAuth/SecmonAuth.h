#ifndef SECMON_AUTH_H
#define SECMON_AUTH_H

#include <cstdint>
#include <string>
#include <vector>

namespace secmon {

using Secret = std::vector<uint8_t>;
using SecretSet = std::vector<Secret>;

// magld_<unpadded b64 secret><6 chars unpadded b64 of little-endian crc32(secret)>
static const char *const kTokenPrefix = "magld_";
static const size_t kTokenMinBodyLen = 2;
static const size_t kTokenCrcLen = 6;

// Returns false (InvalidToken) on short input, prefix mismatch, bad base64 or checksum mismatch.
bool decodeToken(const std::string &text, Secret &out);
std::string encodeToken(const Secret &secret);

// Decodes every token, logging and skipping the ones that fail.
SecretSet decodeTokens(const std::vector<std::string> &tokens);

std::string sign(const std::string &message, const Secret &secret);

// True if any secret in the set produced `signature` for `message`.
bool verify(const std::string &message, const std::string &signature, const SecretSet &secrets);

} // namespace secmon

#endif
