#pragma once
#include <cstddef>
#include <memory>
#include <span>
#include <string_view>
#include "types.hpp"

struct evp_md_ctx_st;


namespace btsalvage::verify {

    // Streaming SHA-1 over OpenSSL's EVP interface.
    class Sha1Hasher
    {
    public:
        Sha1Hasher();

        Sha1Hasher(const Sha1Hasher&) = delete;
        Sha1Hasher& operator=(const Sha1Hasher&) = delete;
        Sha1Hasher(Sha1Hasher&&) noexcept = default;
        Sha1Hasher& operator=(Sha1Hasher&&) noexcept = default;

        void update(std::span<const std::uint8_t> data);
        void update(std::string_view data);

        // Finalizes; the hasher must be reset() before reuse.
        PieceHash finish();
        void reset();

        static PieceHash digest(std::string_view data);

    private:
        struct CtxDeleter { void operator()(evp_md_ctx_st* ctx) const noexcept; };
        std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    };

} // namespace btsalvage::verify
