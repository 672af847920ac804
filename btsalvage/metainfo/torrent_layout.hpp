#pragma once
#include <cstdint>
#include <vector>
#include "metadata_provider.hpp"
#include "metainfo.hpp"


namespace btsalvage::metainfo {

    // IMetadataProvider over a parsed .torrent. Every file sits at base offset 0.
    class TorrentLayout : public IMetadataProvider
    {
    public:
        explicit TorrentLayout(const Metainfo& mi);

        int numPieces() const override { return static_cast<int>(hashes_.size()); }
        int pieceSize(PieceIndex piece) const override;
        PieceHash expectedHash(PieceIndex piece) const override;

        int numFiles() const override { return static_cast<int>(files_.size()); }
        FileInfo fileInfo(int fileIndex) const override;

        std::vector<FileSlice> mapPieceToSpans(PieceIndex piece, std::int64_t blockOffset,
                                               std::int64_t blockSize) const override;
        PieceIndex mapFileOffsetToPiece(int fileIndex, std::int64_t byteOffset) const override;

        std::int64_t totalSize() const noexcept { return totalSize_; }
        std::int64_t pieceLength() const noexcept { return pieceLength_; }

    private:
        struct Entry
        {
            FileInfo info;
            std::int64_t streamOffset{0};
        };

        void checkPiece(PieceIndex piece) const;
        void checkFile(int fileIndex) const;

        std::vector<Entry> files_;
        std::vector<PieceHash> hashes_;
        std::int64_t pieceLength_{0};
        std::int64_t totalSize_{0};
    };

} // namespace btsalvage::metainfo
