#include <auditchain/core/hash.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace auditchain::core {
  auto to_hex(std::span<const uint8_t> data) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto b : data) oss << std::setw(2) << static_cast<int>(b);
    return oss.str();
  }

  static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  auto from_hex(std::string_view hex) -> std::optional<std::vector<uint8_t>> {
    if (hex.size() % 2 != 0) return std::nullopt;
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
      int high = hex_value(hex[i]);
      int low = hex_value(hex[i + 1]);
      if (high < 0 || low < 0) return std::nullopt;
      out.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return out;
  }

  auto sha256(std::span<const uint8_t> data) -> Hash256 {
    using EVP_MD_CTX_Ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
    EVP_MD_CTX_Ptr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) throw std::runtime_error("sha256: EVP_MD_CTX_new failed");

    Hash256 out{};
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
      throw std::runtime_error("sha256: EVP_DigestInit_ex failed");
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
      throw std::runtime_error("sha256: EVP_DigestUpdate failed");
    unsigned int len = static_cast<unsigned int>(out.size());
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1)
      throw std::runtime_error("sha256: EVP_DigestFinal_ex failed");
    return out;
  }

  void random_bytes(std::span<uint8_t> out) {
    if (out.empty()) return;
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
      char err_buf[256]{0};
      ERR_error_string_n(ERR_get_error(), err_buf, sizeof(err_buf));
      throw std::runtime_error(std::string("RAND_bytes: ") + err_buf);
    }
  }
}
