#include <catch2/catch_all.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <openssl/sha.h>

#include "../include/session.hpp"
#include "../../bencode/bencode.hpp"

namespace fs = std::filesystem;
using namespace btsalvage;
using btsalvage::bencode::Value;

namespace {

struct TempDir
{
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("bts-session-" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

class CaptureSink : public logger::ILoggerSink
{
public:
    void write(const logger::LogRecord& rec) override { records.push_back(rec); }
    std::vector<logger::LogRecord> records;
};

void write_file(const fs::path& p, const std::string& content) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p, std::ios::binary);
    out << content;
}

std::string sha1_raw(const std::string& s) {
    unsigned char d[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(s.data()), s.size(), d);
    return std::string(reinterpret_cast<const char*>(d), SHA_DIGEST_LENGTH);
}

std::string filled(std::size_t n, char seed) {
    std::string s(n, '\0');
    for (std::size_t i = 0; i < n; ++i) s[i] = static_cast<char>(seed + i * 3);
    return s;
}

// "show/" with a.bin (10), b.bin (7), empty (0), c.bin (9); 4-byte pieces
struct Fixture
{
    TempDir tmp;
    fs::path torrent = tmp.path / "show.torrent";
    fs::path data = tmp.path / "data";
    fs::path links = tmp.path / "links";
    std::vector<std::pair<std::string, std::string>> files{
        {"a.bin", filled(10, 'a')}, {"b.bin", filled(7, 'b')}, {"empty", ""}, {"c.bin", filled(9, 'c')}};

    std::ostringstream out, diag;
    std::shared_ptr<CaptureSink> logSink = std::make_shared<CaptureSink>();
    std::shared_ptr<logger::Logger> log = std::make_shared<logger::Logger>(logSink);

    Fixture() {
        std::string stream;
        Value::List list;
        for (const auto& [name, content] : files) {
            stream += content;
            Value::Dict f;
            f["length"] = Value(static_cast<std::int64_t>(content.size()));
            f["path"] = Value(Value::List{Value(name)});
            list.emplace_back(std::move(f));
            write_file(data / "show" / name, content);
        }

        std::string pieces;
        for (std::size_t off = 0; off < stream.size(); off += 4) pieces += sha1_raw(stream.substr(off, 4));

        Value::Dict info;
        info["name"] = Value(std::string("show"));
        info["piece length"] = Value(std::int64_t{4});
        info["pieces"] = Value(pieces);
        info["files"] = Value(std::move(list));
        Value::Dict root;
        root["info"] = Value(std::move(info));
        write_file(torrent, bencode::encode(Value(std::move(root))));

        // byte 3 of b.bin is stream byte 13: piece 3 belongs to b alone
        std::string b = files[1].second;
        b[3] ^= 0x55;
        write_file(data / "show/b.bin", b);

        log->setLevel(logger::LogLevel::trace);
    }

    app::Options options() const {
        app::Options o;
        o.torrents = {torrent};
        o.dataDir = data;
        o.quiet = true;
        return o;
    }
};

} // namespace

TEST_CASE("runSession: lists complete files") {
    Fixture fx;
    auto r = app::runSession(fx.torrent, fx.options(), fx.log, fx.out, fx.diag);

    REQUIRE(r.has_value());
    CHECK(fx.out.str() == "show/a.bin\nshow/c.bin\n");
    CHECK(r.get().complete == 2);
    CHECK(r.get().incomplete == 1);
    CHECK(r.get().skipped == 1);
    CHECK(fx.diag.str().empty());
}

TEST_CASE("runSession: selection lists") {
    Fixture fx;
    auto opts = fx.options();

    SECTION("missing") {
        opts.mode = output::ListMode::selectMissing;
        REQUIRE(app::runSession(fx.torrent, opts, fx.log, fx.out, fx.diag).has_value());
        CHECK(fx.out.str() == "2\n");
    }
    SECTION("complete") {
        opts.mode = output::ListMode::selectComplete;
        REQUIRE(app::runSession(fx.torrent, opts, fx.log, fx.out, fx.diag).has_value());
        CHECK(fx.out.str() == "1,4\n");
    }
}

TEST_CASE("runSession: links, then trusts what was linked") {
    Fixture fx;
    auto opts = fx.options();
    opts.linkDir = fx.links;

    REQUIRE(app::runSession(fx.torrent, opts, fx.log, fx.out, fx.diag).has_value());
    CHECK(fs::exists(fx.links / "show/a.bin"));
    CHECK(fs::exists(fx.links / "show/c.bin"));
    CHECK_FALSE(fs::exists(fx.links / "show/b.bin"));

    // the source copy disappears; the linked one stands in for it
    fs::remove(fx.data / "show/a.bin");
    opts.cheat = true;

    SECTION("reported again") {
        std::ostringstream out;
        auto r = app::runSession(fx.torrent, opts, fx.log, out, fx.diag);
        REQUIRE(r.has_value());
        CHECK(out.str() == "show/a.bin\nshow/c.bin\n");
        CHECK(r.get().trusted == 2);
    }
    SECTION("only new") {
        opts.onlyNew = true;
        std::ostringstream out;
        auto r = app::runSession(fx.torrent, opts, fx.log, out, fx.diag);
        REQUIRE(r.has_value());
        CHECK(out.str().empty());
        CHECK(r.get().suppressed == 2);
        CHECK(r.get().incomplete == 1);
    }
}

TEST_CASE("runSession: progress goes to the diagnostic stream") {
    Fixture fx;
    auto opts = fx.options();
    opts.quiet = false;

    REQUIRE(app::runSession(fx.torrent, opts, fx.log, fx.out, fx.diag).has_value());
    CHECK(fx.diag.str().find("verifying:") != std::string::npos);
    CHECK(fx.out.str().find("verifying") == std::string::npos);
}

TEST_CASE("runSession: malformed metadata fails the torrent") {
    Fixture fx;
    write_file(fx.torrent, "d4:infoi3ee");

    auto r = app::runSession(fx.torrent, fx.options(), fx.log, fx.out, fx.diag);
    REQUIRE_FALSE(r.has_value());
    CHECK(fx.out.str().empty());

    bool logged = false;
    for (const auto& rec : fx.logSink->records) {
        if (rec.level == logger::LogLevel::error && rec.torrent == fx.torrent.string()) logged = true;
    }
    CHECK(logged);
}

TEST_CASE("runSession: oversized piece length is a metadata failure, not a crash") {
    Fixture fx;
    Value::Dict info;
    info["name"] = Value(std::string("huge.iso"));
    info["length"] = Value(std::int64_t{3000000000});
    info["piece length"] = Value(std::int64_t{3000000000});
    info["pieces"] = Value(std::string(20, '\x22'));
    Value::Dict root;
    root["info"] = Value(std::move(info));
    const fs::path huge = fx.tmp.path / "huge.torrent";
    write_file(huge, bencode::encode(Value(std::move(root))));

    std::optional<Expected<verify::CheckSummary>> bad;
    REQUIRE_NOTHROW(bad = app::runSession(huge, fx.options(), fx.log, fx.out, fx.diag));
    REQUIRE_FALSE(bad->has_value());
    CHECK(bad->message().find("piece length") != std::string::npos);

    // the next torrent in the same run is unaffected
    auto good = app::runSession(fx.torrent, fx.options(), fx.log, fx.out, fx.diag);
    REQUIRE(good.has_value());
    CHECK(fx.out.str() == "show/a.bin\nshow/c.bin\n");
}

TEST_CASE("runSession: missing metadata file") {
    Fixture fx;
    auto r = app::runSession(fx.tmp.path / "nope.torrent", fx.options(), nullptr, fx.out, fx.diag);
    REQUIRE_FALSE(r.has_value());
    CHECK(r.message().find("cannot open") != std::string::npos);
}
