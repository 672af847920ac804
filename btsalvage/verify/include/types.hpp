#pragma once
#include <cstdint>
#include <string>
#include "../../metainfo/metadata_provider.hpp"


namespace btsalvage::verify {

    using metainfo::PieceIndex;
    using metainfo::PieceHash;

    enum class PieceState : std::uint8_t { unknown, valid, invalid };

    const char* toString(PieceState s);

    // Inclusive piece range covering a file; first > last means nothing to verify.
    struct FileSpan
    {
        PieceIndex first{0};
        PieceIndex last{-1};

        bool empty() const noexcept { return first > last; }
        int count() const noexcept { return empty() ? 0 : last - first + 1; }
    };

    enum class FileOutcome { skipped, trustedComplete, complete, incomplete };

    const char* toString(FileOutcome o);

    struct CompletionDecision
    {
        int fileIndex{0};
        FileOutcome outcome{FileOutcome::skipped};
        FileSpan span;
        bool reported{false};       // false when skipped or filtered by only-new

        bool complete() const noexcept {
            return outcome == FileOutcome::complete || outcome == FileOutcome::trustedComplete;
        }
        bool trusted() const noexcept { return outcome == FileOutcome::trustedComplete; }
    };

    std::string toHex(const PieceHash& h);

} // namespace btsalvage::verify
