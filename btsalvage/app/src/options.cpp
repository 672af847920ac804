#include <charconv>
#include <sstream>
#include "../include/options.hpp"


namespace btsalvage::app {

    namespace {

    using Result = Expected<Options>;

    bool isVerboseBundle(std::string_view arg) {
        if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') return false;
        return arg.find_first_not_of('v', 1) == std::string_view::npos;
    }

    std::optional<std::size_t> parseSize(std::string_view text) {
        std::size_t value = 0;
        const auto* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(text.data(), end, value);
        if (ec != std::errc{} || ptr != end || text.empty()) return std::nullopt;
        return value;
    }

    } // namespace

    Expected<Options> parseOptions(int argc, const char* const argv[]) {
        Options opts;

        for (int i = 1; i < argc; ++i) {
            std::string_view arg = argv[i];
            std::string_view inlineValue;
            bool hasInline = false;

            if (arg.rfind("--", 0) == 0) {
                if (auto eq = arg.find('='); eq != std::string_view::npos) {
                    inlineValue = arg.substr(eq + 1);
                    arg = arg.substr(0, eq);
                    hasInline = true;
                }
            }

            auto value = [&](std::string_view& out) -> bool {
                if (hasInline) { out = inlineValue; return true; }
                if (i + 1 >= argc) return false;
                out = argv[++i];
                return true;
            };
            auto missing = [&]() { return Result::failure("option " + std::string(arg) + " requires a value"); };

            if (arg == "-h" || arg == "--help") {
                opts.help = true;
            } else if (arg == "-d" || arg == "--data-dir") {
                std::string_view v;
                if (!value(v)) return missing();
                opts.dataDir = std::string(v);
            } else if (arg == "-l" || arg == "--link-dir") {
                std::string_view v;
                if (!value(v)) return missing();
                opts.linkDir = std::filesystem::path(std::string(v));
            } else if (arg == "-c" || arg == "--cheat") {
                opts.cheat = true;
            } else if (arg == "-n" || arg == "--only-new") {
                opts.onlyNew = true;
            } else if (arg == "-s" || arg == "--select") {
                std::string_view v;
                if (!value(v)) return missing();
                if (v == "missing") opts.mode = output::ListMode::selectMissing;
                else if (v == "complete") opts.mode = output::ListMode::selectComplete;
                else return Result::failure("--select expects 'missing' or 'complete', got '" + std::string(v) + "'");
            } else if (arg == "--strict-size") {
                opts.strictSize = true;
            } else if (arg == "--chunk-size") {
                std::string_view v;
                if (!value(v)) return missing();
                auto n = parseSize(v);
                if (!n) return Result::failure("--chunk-size expects a byte count, got '" + std::string(v) + "'");
                opts.chunkSize = *n;
            } else if (arg == "--log-file") {
                std::string_view v;
                if (!value(v)) return missing();
                opts.logFile = std::string(v);
            } else if (arg == "-q" || arg == "--quiet") {
                opts.quiet = true;
            } else if (arg == "--verbose" || isVerboseBundle(arg)) {
                opts.verbosity += arg == "--verbose" ? 1 : static_cast<int>(arg.size() - 1);
            } else if (arg.size() > 1 && arg[0] == '-') {
                return Result::failure("unknown option: " + std::string(arg));
            } else {
                opts.torrents.emplace_back(std::string(arg));
            }
        }

        if (!opts.help && opts.torrents.empty()) {
            return Result::failure("no .torrent file given");
        }
        return Result::success(std::move(opts));
    }

    std::string usage(std::string_view program) {
        std::ostringstream os;
        os << "Usage: " << program << " [options] <file.torrent>...\n"
           << "\n"
           << "Lists the files of a torrent whose pieces all hash correctly.\n"
           << "\n"
           << "  -d, --data-dir DIR       directory holding the downloaded content (default .)\n"
           << "  -l, --link-dir DIR       hard-link complete files into DIR\n"
           << "  -c, --cheat              trust files already present in the link dir\n"
           << "  -n, --only-new           skip files already present in the link dir\n"
           << "  -s, --select WHICH       print a selection list of 'missing' or 'complete' files\n"
           << "      --strict-size        also require the on-disk size to match\n"
           << "      --chunk-size BYTES   read size, at most 1048576\n"
           << "      --log-file PATH      write diagnostics to PATH instead of stderr\n"
           << "  -q, --quiet              errors only, no progress\n"
           << "  -v, --verbose            more diagnostics (twice for debug)\n"
           << "  -h, --help               show this help\n";
        return os.str();
    }

    logger::LogLevel logLevelFor(const Options& opts) {
        using logger::LogLevel;
        if (opts.quiet) return LogLevel::error;
        if (opts.verbosity >= 2) return LogLevel::debug;
        if (opts.verbosity == 1) return LogLevel::info;
        return LogLevel::warn;
    }

    verify::VerifyConfig verifyConfigFrom(const Options& opts) {
        verify::VerifyConfig cfg;
        cfg.dataDir = opts.dataDir;
        cfg.chunkSize = opts.chunkSize;
        return cfg;
    }

    verify::CheckConfig checkConfigFrom(const Options& opts) {
        verify::CheckConfig cfg;
        cfg.trustMaterialized = opts.cheat;
        cfg.onlyNew = opts.onlyNew;
        cfg.strictSize = opts.strictSize;
        return cfg;
    }

    output::OutputConfig outputConfigFrom(const Options& opts) {
        output::OutputConfig cfg;
        cfg.dataDir = opts.dataDir;
        cfg.linkDir = opts.linkDir;
        cfg.mode = opts.mode;
        cfg.showProgress = !opts.quiet;
        return cfg;
    }

} // namespace btsalvage::app
