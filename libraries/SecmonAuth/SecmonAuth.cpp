#include "SecmonAuth.h"

#include <cctype>
#include <cstring>

#include <SecmonCrypto.h>
#include <SecmonLog.h>

namespace secmon {

static std::string crc_suffix(const Secret &secret) {
  uint32_t crc = secmon_crypto::crc32(secret.data(), secret.size());
  // little endian, to stay compatible with tokens issued by other tools
  uint8_t le[4] = {uint8_t(crc), uint8_t(crc >> 8), uint8_t(crc >> 16), uint8_t(crc >> 24)};
  return secmon_crypto::base64_encode_unpadded(le, sizeof(le));
}

static std::string rtrim(const std::string &s) {
  size_t end = s.size();
  while (end > 0 && isspace((unsigned char)s[end - 1])) end--;
  return s.substr(0, end);
}

bool decodeToken(const std::string &text, Secret &out) {
  const std::string token = rtrim(text);
  const size_t prefix_len = strlen(kTokenPrefix);

  if (token.size() < prefix_len + kTokenMinBodyLen + kTokenCrcLen) {
    LOGD("AUTH", "token too short (%zu chars)", token.size());
    return false;
  }
  for (size_t i = 0; i < prefix_len; i++) {
    if (tolower((unsigned char)token[i]) != kTokenPrefix[i]) {
      LOGD("AUTH", "token prefix mismatch");
      return false;
    }
  }

  const std::string body = token.substr(prefix_len, token.size() - prefix_len - kTokenCrcLen);
  const std::string checksum = token.substr(token.size() - kTokenCrcLen);

  Secret secret;
  if (!secmon_crypto::base64_decode(secmon_crypto::base64_pad(body), secret)) {
    LOGD("AUTH", "token body is not valid base64");
    return false;
  }
  if (crc_suffix(secret) != checksum) {
    LOGD("AUTH", "token checksum mismatch");
    return false;
  }

  out.swap(secret);
  return true;
}

std::string encodeToken(const Secret &secret) {
  std::string token = kTokenPrefix;
  token += secmon_crypto::base64_encode_unpadded(secret.data(), secret.size());
  token += crc_suffix(secret);
  return token;
}

SecretSet decodeTokens(const std::vector<std::string> &tokens) {
  SecretSet secrets;
  for (size_t i = 0; i < tokens.size(); i++) {
    Secret s;
    if (!decodeToken(tokens[i], s)) {
      LOGE("AUTH", "token %zu not accepted", i);
      continue;
    }
    secrets.push_back(s);
  }
  return secrets;
}

std::string sign(const std::string &message, const Secret &secret) {
  uint8_t mac[32];
  secmon_crypto::hmac_sha256(secret.data(), secret.size(), (const uint8_t *)message.data(), message.size(), mac);
  return secmon_crypto::base64_encode_unpadded(mac, sizeof(mac));
}

bool verify(const std::string &message, const std::string &signature, const SecretSet &secrets) {
  bool match = false;
  for (const Secret &s : secrets) {
    if (secmon_crypto::constant_time_eq(sign(message, s), signature)) match = true;
  }
  return match;
}

} // namespace secmon
