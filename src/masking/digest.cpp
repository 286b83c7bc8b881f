// ---------------------------------------------------------------------------
// digest.cpp
// ---------------------------------------------------------------------------

#include "masking/digest.hpp"

#include <array>
#include <memory>

#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace {

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

constexpr char kHexDigits[] = "0123456789abcdef";

}  // namespace

std::string sha256_hex(std::string_view data, std::string_view salt) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        spdlog::error("digest: EVP_MD_CTX_new failed");
        return {};
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
    unsigned int                               md_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        (!salt.empty() && EVP_DigestUpdate(ctx.get(), salt.data(), salt.size()) != 1) ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), md.data(), &md_len) != 1) {
        spdlog::error("digest: SHA-256 computation failed");
        return {};
    }

    std::string hex;
    hex.reserve(static_cast<std::size_t>(md_len) * 2);
    for (unsigned int i = 0; i < md_len; ++i) {
        hex.push_back(kHexDigits[md[i] >> 4U]);
        hex.push_back(kHexDigits[md[i] & 0x0FU]);
    }
    return hex;
}

std::string short_digest(std::string_view data, std::string_view salt) {
    auto full = sha256_hex(data, salt);
    if (full.size() > 16) {
        full.resize(16);
    }
    return full;
}
