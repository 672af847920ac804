#include "torrent_layout.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>


namespace btsalvage::metainfo {

    TorrentLayout::TorrentLayout(const Metainfo& mi)
        : hashes_(mi.pieces()), pieceLength_(mi.pieceLength())
    {
        files_.reserve(mi.info.files.size());
        for (const auto& fe : mi.info.files) {
            Entry e;
            e.info.path = fe.path;
            e.info.size = static_cast<std::int64_t>(fe.length);
            e.info.pad = fe.pad;
            e.streamOffset = static_cast<std::int64_t>(fe.offset);
            totalSize_ += e.info.size;
            files_.push_back(std::move(e));
        }
    }

    void TorrentLayout::checkPiece(PieceIndex piece) const {
        if (piece < 0 || piece >= numPieces()) {
            throw std::out_of_range("piece index " + std::to_string(piece) + " out of range");
        }
    }

    void TorrentLayout::checkFile(int fileIndex) const {
        if (fileIndex < 0 || fileIndex >= numFiles()) {
            throw std::out_of_range("file index " + std::to_string(fileIndex) + " out of range");
        }
    }

    int TorrentLayout::pieceSize(PieceIndex piece) const {
        checkPiece(piece);
        const std::int64_t start = std::int64_t(piece) * pieceLength_;
        return static_cast<int>(std::min(pieceLength_, totalSize_ - start));
    }

    PieceHash TorrentLayout::expectedHash(PieceIndex piece) const {
        checkPiece(piece);
        return hashes_[static_cast<std::size_t>(piece)];
    }

    FileInfo TorrentLayout::fileInfo(int fileIndex) const {
        checkFile(fileIndex);
        return files_[static_cast<std::size_t>(fileIndex)].info;
    }

    std::vector<FileSlice> TorrentLayout::mapPieceToSpans(PieceIndex piece, std::int64_t blockOffset,
                                                          std::int64_t blockSize) const
    {
        checkPiece(piece);
        if (blockOffset < 0 || blockSize < 0) throw std::invalid_argument("negative block range");

        std::vector<FileSlice> out;
        const std::int64_t start = std::int64_t(piece) * pieceLength_ + blockOffset;
        if (files_.empty() || start >= totalSize_) return out;

        // the last piece is usually short; never map past the end of the stream
        std::int64_t remaining = std::min(blockSize, totalSize_ - start);

        auto it = std::upper_bound(files_.begin(), files_.end(), start,
            [](std::int64_t off, const Entry& e) { return off < e.streamOffset; });
        --it;

        std::int64_t fileOffset = start - it->streamOffset;
        for (; remaining > 0 && it != files_.end(); fileOffset -= it->info.size, ++it) {
            if (fileOffset < it->info.size) {
                FileSlice s;
                s.fileIndex = static_cast<int>(it - files_.begin());
                s.offset = fileOffset;
                s.length = std::min(it->info.size - fileOffset, remaining);
                remaining -= s.length;
                fileOffset += s.length;
                out.push_back(s);
            }
        }
        return out;
    }

    PieceIndex TorrentLayout::mapFileOffsetToPiece(int fileIndex, std::int64_t byteOffset) const {
        checkFile(fileIndex);
        if (byteOffset < 0) throw std::invalid_argument("negative file offset");
        const auto& e = files_[static_cast<std::size_t>(fileIndex)];
        return static_cast<PieceIndex>((e.streamOffset + byteOffset) / pieceLength_);
    }

} // namespace btsalvage::metainfo
