#include "../include/file_checker.hpp"


namespace btsalvage::verify {

    using logger::LogLevel;

    FileCompletionChecker::FileCompletionChecker(const metainfo::IMetadataProvider& meta, PieceVerifier& verifier,
                                                 ICompletionSink& sink, CheckConfig cfg,
                                                 std::shared_ptr<logger::Logger> log)
        : meta_(meta), verifier_(verifier), sink_(sink), cfg_(cfg), log_(std::move(log)) {}

    FileSpan FileCompletionChecker::spanOf(int fileIndex) const {
        const auto fi = meta_.fileInfo(fileIndex);
        if (fi.size <= 0) return FileSpan{};
        return FileSpan{ meta_.mapFileOffsetToPiece(fileIndex, 0),
                         meta_.mapFileOffsetToPiece(fileIndex, fi.size - 1) };
    }

    bool FileCompletionChecker::allPiecesValid(int fileIndex, const FileSpan& span) {
        for (PieceIndex p = span.first; p <= span.last; ++p) {
            if (!verifier_.verify(p)) {
                BTS_LOG(log_, LogLevel::debug, "checker") << "file " << fileIndex << " incomplete at piece " << p;
                return false;
            }
        }
        return true;
    }

    bool FileCompletionChecker::sizeMatches(int fileIndex, const metainfo::FileInfo& fi) {
        auto actual = verifier_.sourceSize(fileIndex);
        if (!actual) return false;
        if (actual.get() != fi.size) {
            if (log_ && log_->enabled(LogLevel::info)) {
                logger::LogRecord rec;
                rec.level = LogLevel::info;
                rec.logger = "checker";
                rec.msg = "on-disk size " + std::to_string(actual.get()) + " differs from declared "
                        + std::to_string(fi.size);
                rec.file = fi.path.string();
                log_->log(std::move(rec));
            }
            return false;
        }
        return true;
    }

    CompletionDecision FileCompletionChecker::checkFile(int fileIndex) {
        CompletionDecision d;
        d.fileIndex = fileIndex;

        const auto fi = meta_.fileInfo(fileIndex);
        d.span = spanOf(fileIndex);
        if (fi.pad || d.span.empty()) {
            BTS_LOG(log_, LogLevel::debug, "checker") << "skipping " << fi.path.string()
                << (fi.pad ? " (padding)" : " (empty)");
            return d;
        }

        bool trusted = false;
        if (cfg_.trustMaterialized && sink_.isAlreadyMaterialized(fi.path)) {
            for (PieceIndex p = d.span.first; p <= d.span.last; ++p) verifier_.assume(p, true);
            trusted = true;
            BTS_LOG(log_, LogLevel::debug, "checker") << "trusting materialized " << fi.path.string();
        }

        if (!allPiecesValid(fileIndex, d.span) || (!trusted && cfg_.strictSize && !sizeMatches(fileIndex, fi))) {
            d.outcome = FileOutcome::incomplete;
            sink_.reportIncomplete(fileIndex, fi.path);
            d.reported = true;
            return d;
        }

        d.outcome = trusted ? FileOutcome::trustedComplete : FileOutcome::complete;

        if (cfg_.onlyNew && sink_.isAlreadyMaterialized(fi.path)) {
            BTS_LOG(log_, LogLevel::debug, "checker") << "already materialized, not reported: " << fi.path.string();
            return d;
        }

        sink_.reportComplete(fileIndex, fi.path);
        d.reported = true;
        return d;
    }

    CheckSummary FileCompletionChecker::run() {
        CheckSummary s;

        for (int f = 0; f < meta_.numFiles(); ++f) {
            const auto d = checkFile(f);
            switch (d.outcome) {
                case FileOutcome::skipped:    ++s.skipped; break;
                case FileOutcome::incomplete: ++s.incomplete; break;
                case FileOutcome::trustedComplete:
                    ++s.trusted;
                    [[fallthrough]];
                case FileOutcome::complete:
                    ++s.complete;
                    if (!d.reported) ++s.suppressed;
                    break;
            }
        }

        s.piecesVerified = verifier_.verificationCount();
        return s;
    }

} // namespace btsalvage::verify
