#include <catch2/catch_all.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include "../torrent_layout.hpp"

using namespace btsalvage::metainfo;

// Layout without real hashes; only the geometry matters here.
static Metainfo make_metainfo(uint32_t pieceLength, const std::vector<uint64_t>& sizes) {
    Metainfo mi;
    mi.info.name = "root";
    mi.info.pieceLength = pieceLength;
    mi.info.multiFile = sizes.size() > 1;

    uint64_t off = 0;
    for (size_t i = 0; i < sizes.size(); ++i) {
        FileEntry fe;
        fe.path = "root/f" + std::to_string(i);
        fe.length = sizes[i];
        fe.offset = off;
        off += sizes[i];
        mi.info.files.push_back(fe);
    }
    mi.info.pieces.resize((off + pieceLength - 1) / pieceLength);
    for (size_t p = 0; p < mi.info.pieces.size(); ++p) mi.info.pieces[p].fill(static_cast<uint8_t>(p));
    return mi;
}

TEST_CASE("TorrentLayout: piece sizes, last piece short") {
    TorrentLayout layout(make_metainfo(16, {40}));
    REQUIRE(layout.numPieces() == 3);
    CHECK(layout.pieceSize(0) == 16);
    CHECK(layout.pieceSize(1) == 16);
    CHECK(layout.pieceSize(2) == 8);
    CHECK(layout.expectedHash(2)[0] == 2);
    CHECK_THROWS_AS(layout.pieceSize(3), std::out_of_range);
    CHECK_THROWS_AS(layout.expectedHash(-1), std::out_of_range);
}

TEST_CASE("TorrentLayout: piece inside one file maps to one slice") {
    TorrentLayout layout(make_metainfo(16, {40}));
    auto slices = layout.mapPieceToSpans(1, 0, layout.pieceSize(1));
    REQUIRE(slices.size() == 1);
    CHECK(slices[0].fileIndex == 0);
    CHECK(slices[0].offset == 16);
    CHECK(slices[0].length == 16);
}

TEST_CASE("TorrentLayout: piece spanning several files, empty files skipped") {
    // f0: [0,10)  f1: empty  f2: [10,13)  f3: [13,30)
    TorrentLayout layout(make_metainfo(8, {10, 0, 3, 17}));
    auto slices = layout.mapPieceToSpans(1, 0, layout.pieceSize(1));   // bytes [8,16)

    REQUIRE(slices.size() == 3);
    CHECK(slices[0].fileIndex == 0);
    CHECK(slices[0].offset == 8);
    CHECK(slices[0].length == 2);
    CHECK(slices[1].fileIndex == 2);
    CHECK(slices[1].offset == 0);
    CHECK(slices[1].length == 3);
    CHECK(slices[2].fileIndex == 3);
    CHECK(slices[2].offset == 0);
    CHECK(slices[2].length == 3);
}

TEST_CASE("TorrentLayout: block ranges are clamped to the stream end") {
    TorrentLayout layout(make_metainfo(16, {20}));
    auto slices = layout.mapPieceToSpans(1, 0, 16);
    REQUIRE(slices.size() == 1);
    CHECK(slices[0].length == 4);

    auto sub = layout.mapPieceToSpans(0, 4, 8);
    REQUIRE(sub.size() == 1);
    CHECK(sub[0].offset == 4);
    CHECK(sub[0].length == 8);
}

TEST_CASE("TorrentLayout: file offsets map to covering pieces") {
    TorrentLayout layout(make_metainfo(8, {10, 0, 3, 17}));
    CHECK(layout.mapFileOffsetToPiece(0, 0) == 0);
    CHECK(layout.mapFileOffsetToPiece(0, 9) == 1);
    CHECK(layout.mapFileOffsetToPiece(2, 0) == 1);
    CHECK(layout.mapFileOffsetToPiece(2, 2) == 1);
    CHECK(layout.mapFileOffsetToPiece(3, 16) == 3);
    CHECK_THROWS_AS(layout.mapFileOffsetToPiece(4, 0), std::out_of_range);
}

TEST_CASE("TorrentLayout: file info carries path and size with zero base offset") {
    TorrentLayout layout(make_metainfo(8, {10, 6}));
    auto fi = layout.fileInfo(1);
    CHECK(fi.path.string() == "root/f1");
    CHECK(fi.size == 6);
    CHECK(fi.baseOffset == 0);
    CHECK_FALSE(fi.pad);
    CHECK(layout.totalSize() == 16);
}
