#include "gitpeek/hash.hpp"

#include "gitpeek/error.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API

namespace gitpeek {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

const EVP_MD *evp_for(HashKind kind) { return kind == HashKind::sha256 ? EVP_sha256() : EVP_sha1(); }

MdCtx begin_digest(HashKind kind) {
  MdCtx ctx{EVP_MD_CTX_new()};
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx.get(), evp_for(kind), nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  return ctx;
}

void update_digest(EVP_MD_CTX *ctx, const void *data, std::size_t len) {
  if (len != 0 && EVP_DigestUpdate(ctx, data, len) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
}

oid finish_digest(EVP_MD_CTX *ctx, HashKind kind) {
  std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, out.data(), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  if (len != raw_len(kind)) {
    throw std::runtime_error("digest produced unexpected length");
  }
  return oid{kind, std::span<const std::uint8_t>(out.data(), len)};
}

int nibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

} // namespace

std::string_view hash_kind_name(HashKind kind) {
  return kind == HashKind::sha256 ? "sha256" : "sha1";
}

oid::oid(HashKind kind, std::span<const std::uint8_t> raw) : kind_(kind) {
  if (raw.size() != raw_len(kind)) {
    throw Error(Errc::out_of_bounds, "oid: expected " + std::to_string(raw_len(kind)) +
                                         " raw bytes, got " + std::to_string(raw.size()));
  }
  std::memcpy(bytes_.data(), raw.data(), raw.size());
}

oid digest(HashKind kind, std::span<const std::uint8_t> data) {
  auto ctx = begin_digest(kind);
  update_digest(ctx.get(), data.data(), data.size());
  return finish_digest(ctx.get(), kind);
}

oid object_id(HashKind kind, std::string_view type, std::span<const std::uint8_t> payload) {
  const std::string hdr = object_header(type, payload.size());
  auto ctx = begin_digest(kind);
  update_digest(ctx.get(), hdr.data(), hdr.size());
  update_digest(ctx.get(), payload.data(), payload.size());
  return finish_digest(ctx.get(), kind);
}

std::string to_hex(const oid &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(2 * id.size());
  for (std::size_t i = 0; i < id.size(); ++i) {
    unsigned b = id[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

bool from_hex(std::string_view hex, oid &out) {
  HashKind kind{};
  if (hex.size() == hex_len(HashKind::sha1)) {
    kind = HashKind::sha1;
  } else if (hex.size() == hex_len(HashKind::sha256)) {
    kind = HashKind::sha256;
  } else {
    return false;
  }
  std::array<std::uint8_t, consts::kMaxRawLen> raw{};
  for (std::size_t i = 0; i < raw_len(kind); ++i) {
    int hi = nibble(hex[2 * i]);
    int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    raw[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  out = oid{kind, std::span<const std::uint8_t>(raw.data(), raw_len(kind))};
  return true;
}

bool looks_hex_prefix(std::string_view str) {
  if (str.empty() || str.size() > hex_len(HashKind::sha256)) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

} // namespace gitpeek
