#include "scenecast/common/crypto.hpp"

#include <array>
#include <iomanip>
#include <random>
#include <sstream>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace scenecast::common {

namespace {

constexpr const char kBase64Table[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int base64_value(char c) {
  if (c >= 'A' && c <= 'Z') return c - 'A';
  if (c >= 'a' && c <= 'z') return c - 'a' + 26;
  if (c >= '0' && c <= '9') return c - '0' + 52;
  if (c == '+' || c == '-') return 62;
  if (c == '/' || c == '_') return 63;
  return -1;
}

std::string digest(const EVP_MD *md, const std::string &data) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
  unsigned int hash_len = 0;
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  EVP_DigestInit_ex(ctx, md, nullptr);
  EVP_DigestUpdate(ctx, data.data(), data.size());
  EVP_DigestFinal_ex(ctx, hash.data(), &hash_len);
  EVP_MD_CTX_free(ctx);
  return std::string(reinterpret_cast<const char *>(hash.data()), hash_len);
}

} // namespace

std::string sha256_hex(const std::string &data) {
  const std::string raw = digest(EVP_sha256(), data);
  std::ostringstream out;
  for (const char c : raw) {
    out << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(static_cast<unsigned char>(c));
  }
  return out.str();
}

std::string sha1_digest(const std::string &data) { return digest(EVP_sha1(), data); }

std::string base64_encode(const std::string &data) {
  const auto *bytes = reinterpret_cast<const unsigned char *>(data.data());
  const std::size_t len = data.size();
  std::string result;
  result.reserve(((len + 2) / 3) * 4);

  for (std::size_t i = 0; i < len; i += 3) {
    const unsigned int n = (static_cast<unsigned int>(bytes[i]) << 16) |
                           (i + 1 < len ? static_cast<unsigned int>(bytes[i + 1]) << 8 : 0) |
                           (i + 2 < len ? static_cast<unsigned int>(bytes[i + 2]) : 0);
    result.push_back(kBase64Table[(n >> 18) & 0x3F]);
    result.push_back(kBase64Table[(n >> 12) & 0x3F]);
    result.push_back(i + 1 < len ? kBase64Table[(n >> 6) & 0x3F] : '=');
    result.push_back(i + 2 < len ? kBase64Table[n & 0x3F] : '=');
  }
  return result;
}

Result<std::string> base64_decode(const std::string &encoded) {
  std::string out;
  out.reserve(encoded.size() * 3 / 4);
  unsigned int buffer = 0;
  int bits = 0;
  for (const char c : encoded) {
    if (c == '=' || c == '\n' || c == '\r') {
      continue;
    }
    const int value = base64_value(c);
    if (value < 0) {
      return Result<std::string>::failure("invalid base64 character");
    }
    buffer = (buffer << 6) | static_cast<unsigned int>(value);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      out.push_back(static_cast<char>((buffer >> bits) & 0xFF));
    }
  }
  return Result<std::string>::success(std::move(out));
}

std::string random_bytes(std::size_t count) {
  std::string out(count, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char *>(out.data()), static_cast<int>(count)) != 1) {
    std::random_device rd;
    for (auto &c : out) {
      c = static_cast<char>(rd() & 0xFF);
    }
  }
  return out;
}

} // namespace scenecast::common
