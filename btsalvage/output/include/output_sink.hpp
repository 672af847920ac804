#pragma once
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "../../logger/logger.hpp"
#include "../../verify/include/completion_sink.hpp"


namespace btsalvage::output {

    enum class ListMode
    {
        names,              // print each complete file's relative path
        selectMissing,      // one line of 1-based indices of files that are not complete
        selectComplete      // same, for complete files
    };

    struct OutputConfig
    {
        std::filesystem::path dataDir{"."};
        std::optional<std::filesystem::path> linkDir;   // hard-link complete files here
        ListMode mode{ListMode::names};
        bool showProgress{false};
    };


    /**
     * Results go to `out` (stdout in the CLI), the progress line to `progress`
     * (stderr). Link failures are warnings; the run carries on.
     */
    class OutputSink : public verify::ICompletionSink
    {
    public:
        OutputSink(OutputConfig cfg, std::ostream& out, std::ostream& progress,
                   std::shared_ptr<logger::Logger> log = nullptr);

        bool isAlreadyMaterialized(const std::filesystem::path& relativePath) const override;

        void reportComplete(int fileIndex, const std::filesystem::path& relativePath) override;
        void reportIncomplete(int fileIndex, const std::filesystem::path& relativePath) override;
        void reportProgress(verify::PieceIndex piece, int totalPieces) override;

        // Ends the progress line and prints the selection list, if any.
        void finish();

        int linkedCount() const noexcept { return linked_; }
        const std::vector<int>& selection() const noexcept { return selection_; }

    private:
        void materialize(const std::filesystem::path& relativePath);
        void endProgressLine();

        OutputConfig cfg_;
        std::ostream& out_;
        std::ostream& progress_;
        std::shared_ptr<logger::Logger> log_;

        std::vector<int> selection_;
        int linked_{0};
        int lastPercent_{-1};
        bool progressOpen_{false};
    };

} // namespace btsalvage::output
