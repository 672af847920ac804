#pragma once
#include <cstddef>
#include <memory>
#include "../../logger/logger.hpp"
#include "../../metainfo/metadata_provider.hpp"
#include "completion_sink.hpp"
#include "piece_verifier.hpp"
#include "types.hpp"


namespace btsalvage::verify {

    struct CheckConfig
    {
        bool trustMaterialized{false};  // "cheat": files already at the output location are taken as valid
        bool onlyNew{false};            // do not report complete files that are already materialized
        bool strictSize{false};         // also require the on-disk size to equal the declared size
    };

    struct CheckSummary
    {
        int complete{0};
        int incomplete{0};
        int skipped{0};
        int suppressed{0};      // complete, but filtered by onlyNew
        int trusted{0};
        std::size_t piecesVerified{0};
    };


    class FileCompletionChecker
    {
    public:
        FileCompletionChecker(const metainfo::IMetadataProvider& meta, PieceVerifier& verifier,
                              ICompletionSink& sink, CheckConfig cfg = {},
                              std::shared_ptr<logger::Logger> log = nullptr);

        FileSpan spanOf(int fileIndex) const;

        CompletionDecision checkFile(int fileIndex);

        // Every file in index order.
        CheckSummary run();

    private:
        bool allPiecesValid(int fileIndex, const FileSpan& span);
        bool sizeMatches(int fileIndex, const metainfo::FileInfo& fi);

        const metainfo::IMetadataProvider& meta_;
        PieceVerifier& verifier_;
        ICompletionSink& sink_;
        CheckConfig cfg_;
        std::shared_ptr<logger::Logger> log_;
    };

} // namespace btsalvage::verify
