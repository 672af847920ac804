#include <stdexcept>
#include <openssl/evp.h>
#include "../include/sha1_hasher.hpp"


namespace btsalvage::verify {

    void Sha1Hasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const noexcept {
        EVP_MD_CTX_free(ctx);
    }

    Sha1Hasher::Sha1Hasher() : ctx_(EVP_MD_CTX_new()) {
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
        reset();
    }

    void Sha1Hasher::reset() {
        if (EVP_DigestInit_ex(ctx_.get(), EVP_sha1(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha1) failed");
        }
    }

    void Sha1Hasher::update(std::span<const std::uint8_t> data) {
        if (data.empty()) return;
        if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    void Sha1Hasher::update(std::string_view data) {
        update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(data.data()), data.size()));
    }

    PieceHash Sha1Hasher::finish() {
        PieceHash out{};
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1 || len != out.size()) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return out;
    }

    PieceHash Sha1Hasher::digest(std::string_view data) {
        Sha1Hasher h;
        h.update(data);
        return h.finish();
    }

} // namespace btsalvage::verify
