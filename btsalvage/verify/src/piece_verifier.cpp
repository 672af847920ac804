#include <algorithm>
#include <stdexcept>
#include "../include/piece_verifier.hpp"


namespace btsalvage::verify {

    using logger::LogLevel;

    // Handles kept open at once; consecutive pieces rarely touch more than two files.
    static constexpr std::size_t kMaxOpenHandles = 8;

    static std::size_t clampChunk(std::size_t n) {
        if (n == 0 || n > kMaxReadChunk) return kMaxReadChunk;
        return n;
    }

    PieceVerifier::PieceVerifier(const metainfo::IMetadataProvider& meta, std::shared_ptr<IFileReader> reader,
                                 VerifyConfig cfg, std::shared_ptr<logger::Logger> log)
        : meta_(meta), reader_(std::move(reader)), cfg_(std::move(cfg)), log_(std::move(log)),
          cache_(static_cast<std::size_t>(std::max(meta.numPieces(), 0)), PieceState::unknown)
    {
        if (!reader_) reader_ = makePosixFileReader();
        cfg_.chunkSize = clampChunk(cfg_.chunkSize);
    }

    void PieceVerifier::setProgressCallback(ProgressCallback cb) { progress_ = std::move(cb); }

    void PieceVerifier::checkPiece(PieceIndex piece) const {
        if (piece < 0 || piece >= numPieces()) {
            throw std::out_of_range("piece index " + std::to_string(piece) + " out of range");
        }
    }

    PieceState PieceVerifier::state(PieceIndex piece) const {
        checkPiece(piece);
        return cache_[static_cast<std::size_t>(piece)];
    }

    void PieceVerifier::assume(PieceIndex piece, bool valid) {
        checkPiece(piece);
        cache_[static_cast<std::size_t>(piece)] = valid ? PieceState::valid : PieceState::invalid;
        BTS_LOG(log_, LogLevel::trace, "verify") << "piece " << piece << " assumed " << (valid ? "valid" : "invalid");
    }

    bool PieceVerifier::record(PieceIndex piece, bool valid) {
        cache_[static_cast<std::size_t>(piece)] = valid ? PieceState::valid : PieceState::invalid;
        return valid;
    }

    std::filesystem::path PieceVerifier::sourcePath(int fileIndex) const {
        return cfg_.dataDir / meta_.fileInfo(fileIndex).path;
    }

    void PieceVerifier::note(LogLevel lvl, PieceIndex piece, int fileIndex, std::string msg, std::string error) {
        if (!log_ || !log_->enabled(lvl)) return;
        logger::LogRecord rec;
        rec.level = lvl;
        rec.logger = "verify";
        rec.msg = std::move(msg);
        rec.piece = piece;
        if (fileIndex >= 0) rec.file = meta_.fileInfo(fileIndex).path.string();
        rec.error = std::move(error);
        log_->log(std::move(rec));
    }

    bool PieceVerifier::verify(PieceIndex piece) {
        const PieceState known = state(piece);
        if (known != PieceState::unknown) return known == PieceState::valid;

        ++verifications_;
        if (progress_) progress_(piece, numPieces());

        const PieceHash expected = meta_.expectedHash(piece);
        const auto slices = meta_.mapPieceToSpans(piece, 0, meta_.pieceSize(piece));

        hasher_.reset();
        for (const auto& slice : slices) {
            if (!feedSlice(piece, slice)) return record(piece, false);
        }

        const PieceHash actual = hasher_.finish();
        if (actual != expected) {
            if (log_ && log_->enabled(LogLevel::info)) {
                logger::LogRecord rec;
                rec.level = LogLevel::info;
                rec.logger = "verify";
                rec.msg = "checksum mismatch";
                rec.piece = piece;
                rec.expected = toHex(expected);
                rec.actual = toHex(actual);
                log_->log(std::move(rec));
            }
            return record(piece, false);
        }

        BTS_LOG(log_, LogLevel::trace, "verify") << "piece " << piece << " ok";
        return record(piece, true);
    }

    Expected<void> PieceVerifier::feedSlice(PieceIndex piece, const metainfo::FileSlice& slice) {
        const auto fi = meta_.fileInfo(slice.fileIndex);

        if (fi.baseOffset != 0) {
            note(LogLevel::error, piece, slice.fileIndex,
                 "unsupported layout: file data begins at base offset " + std::to_string(fi.baseOffset));
            return Expected<void>::failure("non-zero base offset");
        }

        if (buffer_.empty()) buffer_.resize(cfg_.chunkSize);

        // BEP 47 padding is all zeros by definition and never exists on disk
        if (fi.pad) {
            std::fill(buffer_.begin(), buffer_.end(), std::uint8_t{0});
            for (std::int64_t left = slice.length; left > 0;) {
                const auto n = static_cast<std::size_t>(std::min<std::int64_t>(left, buffer_.size()));
                hasher_.update(std::span<const std::uint8_t>(buffer_.data(), n));
                left -= static_cast<std::int64_t>(n);
            }
            return Expected<void>::success();
        }

        auto handle = handleFor(slice.fileIndex, piece);
        if (!handle) return Expected<void>::failure(handle.message());

        std::int64_t pos = slice.offset;
        std::int64_t left = slice.length;
        while (left > 0) {
            const auto want = static_cast<std::size_t>(std::min<std::int64_t>(left, buffer_.size()));
            auto got = handle.get()->read(pos, std::span<std::uint8_t>(buffer_.data(), want));

            if (!got) {
                note(LogLevel::warn, piece, slice.fileIndex, "read failed", got.message());
                return Expected<void>::failure(got.message());
            }
            if (got.get() == 0) {
                note(LogLevel::info, piece, slice.fileIndex,
                     "source truncated: " + std::to_string(left) + " bytes missing at offset " + std::to_string(pos));
                return Expected<void>::failure("truncated");
            }

            const std::size_t n = std::min(got.get(), want);
            hasher_.update(std::span<const std::uint8_t>(buffer_.data(), n));
            pos += static_cast<std::int64_t>(n);
            left -= static_cast<std::int64_t>(n);
        }
        return Expected<void>::success();
    }

    Expected<IFileHandle*> PieceVerifier::handleFor(int fileIndex, PieceIndex piece) {
        if (auto it = unreadable_.find(fileIndex); it != unreadable_.end()) {
            BTS_LOG(log_, LogLevel::debug, "verify") << "piece " << piece << ": source already known unreadable";
            return Expected<IFileHandle*>::failure(it->second);
        }
        if (auto it = handles_.find(fileIndex); it != handles_.end()) {
            return Expected<IFileHandle*>::success(it->second.get());
        }

        auto opened = reader_->open(sourcePath(fileIndex));
        if (!opened) {
            note(LogLevel::warn, piece, fileIndex, "cannot open source file", opened.message());
            unreadable_.emplace(fileIndex, opened.message());
            return Expected<IFileHandle*>::failure(opened.message());
        }

        if (handles_.size() >= kMaxOpenHandles) handles_.clear();
        IFileHandle* raw = opened.get().get();
        handles_.emplace(fileIndex, std::move(opened.get()));
        return Expected<IFileHandle*>::success(raw);
    }

    Expected<std::int64_t> PieceVerifier::sourceSize(int fileIndex) {
        auto handle = handleFor(fileIndex, -1);
        if (!handle) return Expected<std::int64_t>::failure(handle.message());
        return handle.get()->size();
    }

} // namespace btsalvage::verify
