#include "hash.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <memory>

namespace {
    // Custom deleter for EVP_MD_CTX
    struct EvpMdCtxDeleter {
        void operator()(EVP_MD_CTX* ctx) const {
            if (ctx) {
                EVP_MD_CTX_free(ctx);
            }
        }
    };

    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter>;

    EvpMdCtxPtr new_sha256_ctx() {
        EvpMdCtxPtr md_ctx(EVP_MD_CTX_new());
        if (!md_ctx) {
            throw PofillException(get_string("error.openssl_ctx_failed"));
        }
        if (EVP_DigestInit_ex(md_ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw PofillException(get_string("error.openssl_init_failed"));
        }
        return md_ctx;
    }

    void update(EVP_MD_CTX* ctx, const void* data, size_t len) {
        if (EVP_DigestUpdate(ctx, data, len) != 1) {
            throw PofillException(get_string("error.openssl_update_failed"));
        }
    }

    std::string finish_hex(EVP_MD_CTX* ctx) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hash_len;
        if (EVP_DigestFinal_ex(ctx, hash, &hash_len) != 1) {
            throw PofillException(get_string("error.openssl_final_failed"));
        }

        std::stringstream ss;
        for (unsigned int i = 0; i < hash_len; ++i) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return ss.str();
    }
}

std::string calculate_sha256(const fs::path& file_path) {
    std::ifstream file(file_path, std::ios::binary);
    if (!file) {
        throw PofillException(string_format("error.open_file_failed", file_path.string()));
    }

    EvpMdCtxPtr md_ctx = new_sha256_ctx();

    char buffer[8192];
    while (file.read(buffer, sizeof(buffer))) {
        update(md_ctx.get(), buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.gcount() > 0) { // Handle the last chunk
        update(md_ctx.get(), buffer, static_cast<size_t>(file.gcount()));
    }
    if (file.bad()) {
        throw PofillException(string_format("error.read_file_failed", file_path.string()));
    }

    return finish_hex(md_ctx.get());
}

std::string calculate_sha256_of(std::string_view data) {
    EvpMdCtxPtr md_ctx = new_sha256_ctx();
    update(md_ctx.get(), data.data(), data.size());
    return finish_hex(md_ctx.get());
}
