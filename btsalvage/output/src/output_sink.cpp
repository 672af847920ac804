#include <system_error>
#include "../include/output_sink.hpp"
#include "../include/selection.hpp"


namespace btsalvage::output {

    namespace fs = std::filesystem;
    using logger::LogLevel;

    OutputSink::OutputSink(OutputConfig cfg, std::ostream& out, std::ostream& progress,
                           std::shared_ptr<logger::Logger> log)
        : cfg_(std::move(cfg)), out_(out), progress_(progress), log_(std::move(log)) {}

    bool OutputSink::isAlreadyMaterialized(const fs::path& relativePath) const {
        if (!cfg_.linkDir) return false;
        std::error_code ec;
        return fs::exists(*cfg_.linkDir / relativePath, ec);
    }

    void OutputSink::reportComplete(int fileIndex, const fs::path& relativePath) {
        if (cfg_.mode == ListMode::names) {
            out_ << relativePath.string() << '\n';
        } else if (cfg_.mode == ListMode::selectComplete) {
            selection_.push_back(fileIndex + 1);
        }

        if (cfg_.linkDir) materialize(relativePath);
    }

    void OutputSink::reportIncomplete(int fileIndex, const fs::path& relativePath) {
        BTS_LOG(log_, LogLevel::info, "output") << "incomplete: " << relativePath.string();
        if (cfg_.mode == ListMode::selectMissing) selection_.push_back(fileIndex + 1);
    }

    void OutputSink::reportProgress(verify::PieceIndex piece, int totalPieces) {
        if (!cfg_.showProgress || totalPieces <= 0) return;

        const int percent = static_cast<int>((static_cast<long long>(piece) + 1) * 100 / totalPieces);
        if (percent == lastPercent_) return;
        lastPercent_ = percent;

        progress_ << "\rverifying: " << percent << "% (piece " << piece + 1 << '/' << totalPieces << ')';
        progress_.flush();
        progressOpen_ = true;
    }

    void OutputSink::endProgressLine() {
        if (!progressOpen_) return;
        progress_ << '\n';
        progressOpen_ = false;
        lastPercent_ = -1;
    }

    void OutputSink::finish() {
        endProgressLine();
        if (cfg_.mode != ListMode::names) {
            out_ << formatSelection(selection_) << '\n';
        }
        out_.flush();
    }

    void OutputSink::materialize(const fs::path& relativePath) {
        const fs::path source = cfg_.dataDir / relativePath;
        const fs::path target = *cfg_.linkDir / relativePath;

        std::error_code ec;
        if (fs::exists(target, ec)) {
            BTS_LOG(log_, LogLevel::debug, "output") << "already linked: " << target.string();
            return;
        }

        if (target.has_parent_path()) fs::create_directories(target.parent_path(), ec);
        if (!ec) fs::create_hard_link(source, target, ec);

        if (ec) {
            if (log_ && log_->enabled(LogLevel::warn)) {
                logger::LogRecord rec;
                rec.level = LogLevel::warn;
                rec.logger = "output";
                rec.msg = "cannot link " + target.string();
                rec.file = relativePath.string();
                rec.error = ec.message();
                log_->log(std::move(rec));
            }
            return;
        }

        ++linked_;
        BTS_LOG(log_, LogLevel::debug, "output") << "linked " << source.string() << " -> " << target.string();
    }

} // namespace btsalvage::output
