#pragma once
#include <filesystem>
#include "types.hpp"


namespace btsalvage::verify {


    // Where completeness decisions go: printing, linking, selection lists.
    struct ICompletionSink
    {
        virtual ~ICompletionSink() = default;

        // Existence at the output location; drives the trust override and the only-new filter.
        virtual bool isAlreadyMaterialized(const std::filesystem::path& relativePath) const = 0;

        virtual void reportComplete(int fileIndex, const std::filesystem::path& relativePath) = 0;
        virtual void reportIncomplete(int fileIndex, const std::filesystem::path& relativePath) = 0;
        virtual void reportProgress(PieceIndex piece, int totalPieces) = 0;
    };


} // namespace btsalvage::verify
