#include "catalog/Fingerprint.hpp"
#include <openssl/evp.h>
#include <memory>
#include <stdexcept>
#include <string>

namespace catalog {

Fingerprint fingerprint(const std::string &bytes) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (not ctx) throw std::runtime_error("EVP_MD_CTX_new failed");

    Fingerprint fp;
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        throw std::runtime_error("EVP_DigestInit_ex failed");
    if (EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1)
        throw std::runtime_error("EVP_DigestUpdate failed");
    if (EVP_DigestFinal_ex(ctx.get(), fp.data(), &len) != 1)
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    if (len != fp.size())
        throw std::runtime_error("SHA-256 digest has unexpected length " + std::to_string(len));
    return fp;
}

std::string to_hex(const Fingerprint &fp) {
    static const char *hex = "0123456789abcdef";
    std::string out;
    out.reserve(2 * fp.size());
    for (uint8_t b : fp) {
        out.push_back(hex[(b >> 4) & 0xF]);
        out.push_back(hex[b & 0xF]);
    }
    return out;
}

}
