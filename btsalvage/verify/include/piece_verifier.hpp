#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "../../common/expected.hpp"
#include "../../logger/logger.hpp"
#include "../../metainfo/metadata_provider.hpp"
#include "file_reader.hpp"
#include "sha1_hasher.hpp"
#include "types.hpp"


namespace btsalvage::verify {

    inline constexpr std::size_t kMaxReadChunk = std::size_t(1) << 20;

    struct VerifyConfig
    {
        std::filesystem::path dataDir{"."};         // content root the file paths are relative to
        std::size_t chunkSize{kMaxReadChunk};       // clamped to (0, kMaxReadChunk]
    };


    /**
     * Decides, once per piece and per session, whether the bytes on disk hash to the
     * expected value. Results are memoized: a piece is read and hashed at most once,
     * and every terminal outcome (valid, mismatch, missing, truncated, unsupported
     * layout) is cached as the piece's final state.
     *
     * One instance per metadata file; instances must not be shared across torrents.
     */
    class PieceVerifier
    {
    public:
        using ProgressCallback = std::function<void(PieceIndex piece, int totalPieces)>;

        PieceVerifier(const metainfo::IMetadataProvider& meta, std::shared_ptr<IFileReader> reader,
                      VerifyConfig cfg = {}, std::shared_ptr<logger::Logger> log = nullptr);

        // Throws std::out_of_range for indices outside [0, numPieces()).
        bool verify(PieceIndex piece);

        // Overrides whatever is cached, computed or not.
        void assume(PieceIndex piece, bool valid);

        PieceState state(PieceIndex piece) const;

        int numPieces() const noexcept { return static_cast<int>(cache_.size()); }

        // Pieces actually read and hashed (cache misses) this session.
        std::size_t verificationCount() const noexcept { return verifications_; }

        std::filesystem::path sourcePath(int fileIndex) const;
        Expected<std::int64_t> sourceSize(int fileIndex);

        void setProgressCallback(ProgressCallback cb);

    private:
        void checkPiece(PieceIndex piece) const;
        bool record(PieceIndex piece, bool valid);
        Expected<void> feedSlice(PieceIndex piece, const metainfo::FileSlice& slice);
        Expected<IFileHandle*> handleFor(int fileIndex, PieceIndex piece);
        void note(logger::LogLevel lvl, PieceIndex piece, int fileIndex, std::string msg, std::string error = {});

        const metainfo::IMetadataProvider& meta_;
        std::shared_ptr<IFileReader> reader_;
        VerifyConfig cfg_;
        std::shared_ptr<logger::Logger> log_;
        ProgressCallback progress_{};

        std::vector<PieceState> cache_;
        std::vector<std::uint8_t> buffer_;
        Sha1Hasher hasher_;

        std::map<int, std::unique_ptr<IFileHandle>> handles_;
        std::map<int, std::string> unreadable_;     // open failures, remembered for the session
        std::size_t verifications_{0};
    };

} // namespace btsalvage::verify
