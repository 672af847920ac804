#pragma once
#include <filesystem>
#include <memory>
#include <ostream>
#include "../../common/expected.hpp"
#include "../../logger/logger.hpp"
#include "../../verify/include/file_checker.hpp"
#include "../../verify/include/file_reader.hpp"
#include "options.hpp"


namespace btsalvage::app {

    /**
     * One verification session for one .torrent: parse, verify, report, finish.
     * A metadata failure comes back as an Expected failure after being logged;
     * per-piece problems never do.
     *
     * `reader` defaults to the POSIX reader.
     */
    Expected<verify::CheckSummary> runSession(const std::filesystem::path& torrentPath, const Options& opts,
                                              std::shared_ptr<logger::Logger> log,
                                              std::ostream& out, std::ostream& diag,
                                              std::shared_ptr<verify::IFileReader> reader = nullptr);

} // namespace btsalvage::app
