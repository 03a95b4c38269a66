#include "SecmonCrypto.h"

#include <cstring>

namespace secmon_crypto {

static inline uint32_t rotr(uint32_t x, uint32_t n) { return (x >> n) | (x << (32 - n)); }

static const uint32_t K[64] = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u,
};

static const uint32_t H0[8] = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au, 0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

static void sha256_block(Sha256Ctx &ctx, const uint8_t block[64]) {
  uint32_t w[64];
  for (size_t i = 0; i < 16; i++) {
    const uint8_t *p = block + i * 4;
    w[i] = (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
  }
  for (size_t i = 16; i < 64; i++) {
    uint32_t s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
    uint32_t s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
    w[i] = s1 + w[i - 7] + s0 + w[i - 16];
  }

  // v[0..7] = a..h
  uint32_t v[8];
  memcpy(v, ctx.state, sizeof(v));
  for (size_t i = 0; i < 64; i++) {
    uint32_t S1 = rotr(v[4], 6) ^ rotr(v[4], 11) ^ rotr(v[4], 25);
    uint32_t ch = (v[4] & v[5]) ^ (~v[4] & v[6]);
    uint32_t t1 = v[7] + S1 + ch + K[i] + w[i];
    uint32_t S0 = rotr(v[0], 2) ^ rotr(v[0], 13) ^ rotr(v[0], 22);
    uint32_t maj = (v[0] & v[1]) ^ (v[0] & v[2]) ^ (v[1] & v[2]);
    uint32_t t2 = S0 + maj;
    memmove(v + 1, v, 7 * sizeof(uint32_t));
    v[4] += t1;
    v[0] = t1 + t2;
  }
  for (size_t i = 0; i < 8; i++) ctx.state[i] += v[i];
}

void sha256_init(Sha256Ctx &ctx) {
  memcpy(ctx.state, H0, sizeof(H0));
  ctx.bitlen = 0;
  ctx.buffer_len = 0;
}

void sha256_update(Sha256Ctx &ctx, const uint8_t *data, size_t len) {
  ctx.bitlen += uint64_t(len) * 8u;
  while (len > 0) {
    size_t n = 64 - ctx.buffer_len;
    if (n > len) n = len;
    memcpy(ctx.buffer + ctx.buffer_len, data, n);
    ctx.buffer_len += n;
    data += n;
    len -= n;
    if (ctx.buffer_len == 64) {
      sha256_block(ctx, ctx.buffer);
      ctx.buffer_len = 0;
    }
  }
}

void sha256_final(Sha256Ctx &ctx, uint8_t out[32]) {
  const uint64_t bits = ctx.bitlen;

  uint8_t pad[72] = {0};
  pad[0] = 0x80;
  size_t pad_len = (ctx.buffer_len < 56) ? (56 - ctx.buffer_len) : (120 - ctx.buffer_len);
  for (int i = 0; i < 8; i++) pad[pad_len + i] = uint8_t(bits >> (56 - i * 8));
  sha256_update(ctx, pad, pad_len + 8);

  for (size_t i = 0; i < 8; i++) {
    out[i * 4] = uint8_t(ctx.state[i] >> 24);
    out[i * 4 + 1] = uint8_t(ctx.state[i] >> 16);
    out[i * 4 + 2] = uint8_t(ctx.state[i] >> 8);
    out[i * 4 + 3] = uint8_t(ctx.state[i]);
  }
}

void hmac_sha256(const uint8_t *key, size_t key_len, const uint8_t *data, size_t len, uint8_t out[32]) {
  uint8_t k0[64];
  memset(k0, 0, sizeof(k0));
  if (key_len > 64) {
    Sha256Ctx h;
    sha256_init(h);
    sha256_update(h, key, key_len);
    sha256_final(h, k0);
  } else if (key_len > 0) {
    memcpy(k0, key, key_len);
  }

  uint8_t pad[64];
  for (size_t i = 0; i < 64; i++) pad[i] = k0[i] ^ 0x36;

  uint8_t inner_digest[32];
  Sha256Ctx ctx;
  sha256_init(ctx);
  sha256_update(ctx, pad, 64);
  sha256_update(ctx, data, len);
  sha256_final(ctx, inner_digest);

  for (size_t i = 0; i < 64; i++) pad[i] = k0[i] ^ 0x5c;
  sha256_init(ctx);
  sha256_update(ctx, pad, 64);
  sha256_update(ctx, inner_digest, 32);
  sha256_final(ctx, out);

  memset(k0, 0, sizeof(k0));
  memset(pad, 0, sizeof(pad));
  memset(inner_digest, 0, sizeof(inner_digest));
}

namespace {
struct Crc32Table {
  uint32_t v[256];
  Crc32Table() {
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i;
      for (int k = 0; k < 8; k++) c = (c & 1u) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      v[i] = c;
    }
  }
};
} // namespace

uint32_t crc32(const uint8_t *data, size_t len) {
  static const Crc32Table table;
  uint32_t crc = 0xFFFFFFFFu;
  for (size_t i = 0; i < len; i++) crc = table.v[(crc ^ data[i]) & 0xffu] ^ (crc >> 8);
  return crc ^ 0xFFFFFFFFu;
}

static const char *b64_alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

std::string base64_encode_unpadded(const uint8_t *data, size_t len) {
  std::string out;
  out.reserve((len * 4 + 2) / 3);
  size_t i = 0;
  for (; i + 3 <= len; i += 3) {
    uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8) | uint32_t(data[i + 2]);
    out += b64_alphabet[(n >> 18) & 0x3f];
    out += b64_alphabet[(n >> 12) & 0x3f];
    out += b64_alphabet[(n >> 6) & 0x3f];
    out += b64_alphabet[n & 0x3f];
  }
  size_t rest = len - i;
  if (rest == 1) {
    uint32_t n = uint32_t(data[i]) << 16;
    out += b64_alphabet[(n >> 18) & 0x3f];
    out += b64_alphabet[(n >> 12) & 0x3f];
  } else if (rest == 2) {
    uint32_t n = (uint32_t(data[i]) << 16) | (uint32_t(data[i + 1]) << 8);
    out += b64_alphabet[(n >> 18) & 0x3f];
    out += b64_alphabet[(n >> 12) & 0x3f];
    out += b64_alphabet[(n >> 6) & 0x3f];
  }
  return out;
}

std::string base64_pad(const std::string &text) {
  std::string out = text;
  size_t num = (4 - text.size() % 4) % 4;
  out.append(num, '=');
  return out;
}

static int b64_value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+') return 62;
  if (c == '/') return 63;
  return -1;
}

bool base64_decode(const std::string &text, std::vector<uint8_t> &out) {
  out.clear();
  if (text.size() % 4 != 0) return false;

  for (size_t i = 0; i < text.size(); i += 4) {
    const bool last = (i + 4 == text.size());
    int v[4];
    int pads = 0;
    for (int k = 0; k < 4; k++) {
      char c = text[i + k];
      if (c == '=') {
        // padding only allowed in the last two positions of the final quantum
        if (!last || k < 2) return false;
        v[k] = 0;
        pads++;
        continue;
      }
      if (pads) return false;
      v[k] = b64_value(c);
      if (v[k] < 0) return false;
    }

    uint32_t n = (uint32_t(v[0]) << 18) | (uint32_t(v[1]) << 12) | (uint32_t(v[2]) << 6) | uint32_t(v[3]);
    out.push_back(uint8_t(n >> 16));
    if (pads < 2) out.push_back(uint8_t(n >> 8));
    if (pads < 1) out.push_back(uint8_t(n));
  }
  return true;
}

bool constant_time_eq(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) return false;
  uint8_t diff = 0;
  for (size_t i = 0; i < a.size(); i++) diff |= uint8_t(a[i] ^ b[i]);
  return diff == 0;
}

} // namespace secmon_crypto
