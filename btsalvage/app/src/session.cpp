#include <exception>
#include <optional>
#include "../include/session.hpp"
#include "../../metainfo/metainfo.hpp"
#include "../../metainfo/torrent_layout.hpp"
#include "../../output/include/output_sink.hpp"
#include "../../verify/include/piece_verifier.hpp"


namespace btsalvage::app {

    using logger::LogLevel;
    using Result = Expected<verify::CheckSummary>;

    Result runSession(const std::filesystem::path& torrentPath, const Options& opts,
                      std::shared_ptr<logger::Logger> log, std::ostream& out, std::ostream& diag,
                      std::shared_ptr<verify::IFileReader> reader)
    {
        std::optional<metainfo::Metainfo> meta;
        try {
            meta = metainfo::Metainfo::fromFile(torrentPath);
        } catch (const std::exception& e) {
            if (log && log->enabled(LogLevel::error)) {
                logger::LogRecord rec;
                rec.level = LogLevel::error;
                rec.logger = "session";
                rec.msg = "cannot load metadata";
                rec.torrent = torrentPath.string();
                rec.error = e.what();
                log->log(std::move(rec));
            }
            return Result::failure(e.what());
        }

        BTS_LOG(log, LogLevel::info, "session") << torrentPath.string() << ": " << meta->info.files.size()
            << " files, " << meta->pieces().size() << " pieces, info-hash " << meta->infoHashHex();

        const metainfo::TorrentLayout layout(*meta);
        verify::PieceVerifier verifier(layout, std::move(reader), verifyConfigFrom(opts), log);
        output::OutputSink sink(outputConfigFrom(opts), out, diag, log);
        verifier.setProgressCallback([&sink](verify::PieceIndex p, int total) { sink.reportProgress(p, total); });

        verify::FileCompletionChecker checker(layout, verifier, sink, checkConfigFrom(opts), log);
        const auto summary = checker.run();
        sink.finish();

        BTS_LOG(log, LogLevel::info, "session") << torrentPath.string() << ": " << summary.complete << " complete ("
            << summary.trusted << " trusted, " << summary.suppressed << " not reported), "
            << summary.incomplete << " incomplete, " << summary.skipped << " skipped; "
            << summary.piecesVerified << " pieces hashed, " << sink.linkedCount() << " linked";

        return Result::success(summary);
    }

} // namespace btsalvage::app
