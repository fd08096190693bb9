#include "Fingerprint.hpp"
#include "../core/Logger.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <memory>
#include <sstream>

namespace usb_audio {

namespace {

struct DigestContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

}

std::string shortDigest(const std::string& data, size_t length) {
    std::unique_ptr<EVP_MD_CTX, DigestContextDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        LOG_ERROR("Failed to allocate digest context");
        return {};
    }

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digestLength) != 1) {
        LOG_ERROR("MD5 digest failed");
        return {};
    }

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < digestLength; ++i) {
        ss << std::setw(2) << static_cast<int>(digest[i]);
    }

    std::string hex = ss.str();
    return hex.substr(0, std::min(length, hex.size()));
}

std::string highResolutionStamp() {
    auto now = std::chrono::high_resolution_clock::now().time_since_epoch();
    return std::to_string(
        std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}

}
