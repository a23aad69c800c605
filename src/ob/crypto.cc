#include "ob/crypto.hh"

#include <openssl/evp.h>

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <sstream>
#include <iomanip>
#include <optional>

namespace OB::Crypto
{

std::optional<std::string> sha256(std::string_view const str)
{
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx {
    EVP_MD_CTX_new(), EVP_MD_CTX_free};

  if (! ctx) return {};
  if (! EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr)) return {};
  if (! EVP_DigestUpdate(ctx.get(), str.data(), str.size())) return {};

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest;
  unsigned int size {0};

  if (! EVP_DigestFinal_ex(ctx.get(), digest.data(), &size)) return {};

  std::ostringstream res;
  res << std::hex << std::setfill('0');

  for (unsigned int i = 0; i < size; ++i)
  {
    res << std::setw(2) << static_cast<int>(digest.at(i));
  }

  return res.str();
}

} // namespace OB::Crypto
