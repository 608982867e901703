#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <memory>

// Custom deleter for EVP_MD_CTX
struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

std::string apk_repo_hash(const std::string& url, size_t length) {
    EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
    if (!md_ctx) {
        throw ApkmetaException(get_string("error.openssl_ctx_failed"));
    }

    if (EVP_DigestInit_ex(md_ctx.get(), EVP_sha1(), NULL) != 1) {
        throw ApkmetaException(get_string("error.openssl_init_failed"));
    }

    if (EVP_DigestUpdate(md_ctx.get(), url.data(), url.size()) != 1) {
        throw ApkmetaException(get_string("error.openssl_update_failed"));
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len;
    if (EVP_DigestFinal_ex(md_ctx.get(), hash, &hash_len) != 1) {
        throw ApkmetaException(get_string("error.openssl_final_failed"));
    }

    // apk's hexdump alphabet (blob.c), two characters per byte
    static constexpr char xd[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    const size_t csum_bytes = std::min<size_t>(length / 2, hash_len);

    std::string ret;
    ret.reserve(csum_bytes * 2);
    for (size_t i = 0; i < csum_bytes; ++i) {
        ret += xd[(hash[i] >> 4) & 0xf];
        ret += xd[hash[i] & 0xf];
    }
    return ret;
}
