#include "fingerprint.hpp"

#include <openssl/evp.h>

#include <cctype>
#include <memory>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace recon::fingerprint {

namespace {

constexpr std::string_view kKeyVersion = "v1";

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

void RequireComplete(const FingerprintInput& input, const std::string& normalized) {
  if (!input.posted_on) {
    throw util::MissingFieldError("date", "missing or unparseable transaction date");
  }
  if (!input.amount_cents) {
    throw util::MissingFieldError("amount", "missing or unparseable amount");
  }
  if (normalized.empty()) {
    throw util::MissingFieldError("description", "missing description");
  }
  if (input.account_id.empty()) {
    throw util::MissingFieldError("account", "missing source account");
  }
}

// Fields joined with '|'; the description is last among the free-text
// fields so a '|' inside it cannot shift the others.
std::string CanonicalText(const FingerprintInput& input, const std::string& normalized) {
  std::string text;
  text.reserve(normalized.size() + input.account_id.size() + 48);
  text.append(kKeyVersion);
  text.push_back('|');
  text.append(util::FormatDate(*input.posted_on));
  text.push_back('|');
  text.append(std::to_string(*input.amount_cents));
  text.push_back('|');
  text.append(input.account_id);
  text.push_back('|');
  text.append(std::to_string(input.occurrence));
  text.push_back('|');
  text.append(normalized);
  return text;
}

std::string Sha256Hex(const std::string& text) {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  digest_len = 0;

  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), text.data(), text.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("sha256 digest failed");
  }

  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[digest[i] >> 4]);
    out.push_back(kHex[digest[i] & 0x0f]);
  }
  return out;
}

uint8_t HexNibble(char c) {
  if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
  if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
  throw std::invalid_argument("fingerprint key is not lowercase hex");
}

} // namespace

std::string NormalizeDescription(std::string_view description) {
  std::string out;
  out.reserve(description.size());

  bool pending_space = false;
  for (char c : description) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isspace(uc)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(static_cast<char>(std::toupper(uc)));
  }
  return out;
}

FingerprintKey Fingerprint(const FingerprintInput& input) {
  const auto normalized = NormalizeDescription(input.description);
  RequireComplete(input, normalized);
  return Sha256Hex(CanonicalText(input, normalized));
}

std::string TransactionId(const FingerprintKey& key) {
  util::UUID id{};
  if (key.size() < id.size() * 2) {
    throw std::invalid_argument("fingerprint key too short: " + key);
  }

  for (size_t i = 0; i < id.size(); ++i) {
    id[i] = static_cast<uint8_t>((HexNibble(key[i * 2]) << 4) | HexNibble(key[i * 2 + 1]));
  }

  // RFC9562 variant + version 8
  id[6] = (id[6] & 0x0F) | 0x80;
  id[8] = (id[8] & 0x3F) | 0x80;

  return util::ToString(id);
}

uint32_t OccurrenceCounter::Next(const FingerprintInput& input) {
  auto first       = input;
  first.occurrence = 0;

  const auto normalized = NormalizeDescription(first.description);
  RequireComplete(first, normalized);

  return seen_[CanonicalText(first, normalized)]++;
}

} // namespace recon::fingerprint
