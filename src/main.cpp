#include <exception>
#include <iostream>
#include <memory>
#include "../btsalvage/app/include/options.hpp"
#include "../btsalvage/app/include/session.hpp"
#include "../btsalvage/logger/logger.hpp"

using namespace btsalvage;


int main(int argc, char* argv[]) try
{
    auto parsed = app::parseOptions(argc, argv);
    if (!parsed) {
        std::cerr << "btsalvage: " << parsed.message() << "\n\n" << app::usage(argv[0]);
        return 2;
    }
    const app::Options& opts = parsed.get();

    if (opts.help) {
        std::cout << app::usage(argv[0]);
        return 0;
    }

    std::shared_ptr<logger::ILoggerSink> logSink;
    if (opts.logFile) {
        auto file = std::make_shared<logger::FileSink>(*opts.logFile);
        if (!file->good()) {
            std::cerr << "btsalvage: cannot open log file " << *opts.logFile << "\n";
            return 2;
        }
        logSink = file;
    } else {
        logSink = std::make_shared<logger::StderrSink>();
    }

    auto log = std::make_shared<logger::Logger>(logSink);
    log->setLevel(app::logLevelFor(opts));

    if (!opts.linkDir && (opts.cheat || opts.onlyNew)) {
        log->warn("--cheat and --only-new have no effect without --link-dir", "app");
    }

    int status = 0;
    for (const auto& torrent : opts.torrents) {
        auto result = app::runSession(torrent, opts, log, std::cout, std::cerr);
        if (!result) status = 1;
    }
    return status;
}
catch (const std::exception& e)
{
    std::cerr << "btsalvage: " << e.what() << "\n";
    return 1;
}
