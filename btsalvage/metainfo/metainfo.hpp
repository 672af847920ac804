#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "metadata_provider.hpp"


namespace btsalvage::metainfo {

    struct FileEntry
    {
        std::filesystem::path path;     // relative to the content root, includes the torrent name
        uint64_t length{0};
        uint64_t offset{0};             // position in the concatenated piece stream
        bool pad{false};
    };

    struct InfoDictionary
    {
        std::string name;
        std::vector<FileEntry> files;                       // single-file => size==1
        uint32_t pieceLength{0};
        std::vector<PieceHash> pieces;
        bool multiFile{false};
    };

    class Metainfo
    {
    public:
        // Throws std::runtime_error (or bencode::DecodeError) on malformed metadata.
        static Metainfo fromTorrent(std::string_view data);
        static Metainfo fromFile(const std::filesystem::path& torrentPath);

        const std::vector<PieceHash>& pieces() const noexcept { return info.pieces; }
        uint32_t pieceLength() const noexcept { return info.pieceLength; }
        bool isSingleFile() const noexcept { return !info.multiFile; }

        uint64_t totalLength() const noexcept {
            uint64_t total = 0;
            for (const auto& f : info.files) total += f.length;
            return total;
        }

        const PieceHash& infoHash() const noexcept { return infoHash_; }
        std::string infoHashHex() const;

        InfoDictionary info;

    private:
        PieceHash infoHash_{};
    };

}
