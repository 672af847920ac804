#pragma once
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "../../common/expected.hpp"
#include "../../logger/logger.hpp"
#include "../../output/include/output_sink.hpp"
#include "../../verify/include/file_checker.hpp"
#include "../../verify/include/piece_verifier.hpp"


namespace btsalvage::app {

    struct Options
    {
        std::vector<std::filesystem::path> torrents;

        std::filesystem::path dataDir{"."};
        std::optional<std::filesystem::path> linkDir;
        bool cheat{false};
        bool onlyNew{false};
        bool strictSize{false};
        output::ListMode mode{output::ListMode::names};
        std::size_t chunkSize{verify::kMaxReadChunk};

        std::optional<std::string> logFile;
        bool quiet{false};
        int verbosity{0};       // -v count
        bool help{false};
    };

    // Usage errors come back as failures; nothing is printed here.
    Expected<Options> parseOptions(int argc, const char* const argv[]);

    std::string usage(std::string_view program);

    logger::LogLevel logLevelFor(const Options& opts);

    verify::VerifyConfig verifyConfigFrom(const Options& opts);
    verify::CheckConfig checkConfigFrom(const Options& opts);
    output::OutputConfig outputConfigFrom(const Options& opts);

} // namespace btsalvage::app
