#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <vector>


namespace btsalvage::metainfo {

    using PieceIndex = int;
    using PieceHash = std::array<std::uint8_t,20>;

    struct FileInfo
    {
        std::filesystem::path path;     // relative to the content root
        std::int64_t size{0};
        std::int64_t baseOffset{0};     // non-zero: data starts inside a region shared with another file
        bool pad{false};                // BEP 47 padding, never present on disk
    };

    // A contiguous byte range of one file that belongs to a piece.
    struct FileSlice
    {
        int fileIndex{0};
        std::int64_t offset{0};
        std::int64_t length{0};
    };


    // Read-only description of how pieces map to files and back.
    struct IMetadataProvider
    {
        virtual ~IMetadataProvider() = default;

        virtual int numPieces() const = 0;
        virtual int pieceSize(PieceIndex piece) const = 0;
        virtual PieceHash expectedHash(PieceIndex piece) const = 0;

        virtual int numFiles() const = 0;
        virtual FileInfo fileInfo(int fileIndex) const = 0;

        // Slices covering [blockOffset, blockOffset + blockSize) of `piece`, in stream order.
        virtual std::vector<FileSlice> mapPieceToSpans(PieceIndex piece, std::int64_t blockOffset,
                                                       std::int64_t blockSize) const = 0;

        virtual PieceIndex mapFileOffsetToPiece(int fileIndex, std::int64_t byteOffset) const = 0;
    };

} // namespace btsalvage::metainfo
