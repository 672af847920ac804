#include <catch2/catch_all.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "../include/file_reader.hpp"

namespace fs = std::filesystem;
using namespace btsalvage::verify;

namespace {

struct TempDir
{
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("bts-reader-" + std::to_string(reinterpret_cast<std::uintptr_t>(this)));
        fs::remove_all(path);
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

void write_file(const fs::path& p, const std::string& content) {
    std::ofstream out(p, std::ios::binary);
    out << content;
}

} // namespace

TEST_CASE("PosixFileReader: positioned reads and size") {
    TempDir dir;
    write_file(dir.path / "data.bin", "0123456789");

    auto reader = makePosixFileReader();
    auto opened = reader->open(dir.path / "data.bin");
    REQUIRE(opened.has_value());
    auto& handle = opened.get();

    auto size = handle->size();
    REQUIRE(size.has_value());
    CHECK(size.get() == 10);

    std::array<std::uint8_t, 4> buf{};
    auto n = handle->read(3, buf);
    REQUIRE(n.has_value());
    CHECK(n.get() == 4);
    CHECK(std::string(buf.begin(), buf.end()) == "3456");

    n = handle->read(8, buf);
    REQUIRE(n.has_value());
    CHECK(n.get() == 2);

    n = handle->read(10, buf);
    REQUIRE(n.has_value());
    CHECK(n.get() == 0);
}

TEST_CASE("PosixFileReader: missing files and directories fail to open") {
    TempDir dir;
    auto reader = makePosixFileReader();

    auto missing = reader->open(dir.path / "nope");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.message().find("open:") == 0);

    fs::create_directories(dir.path / "sub");
    auto directory = reader->open(dir.path / "sub");
    REQUIRE_FALSE(directory.has_value());
    CHECK(directory.message() == "open: not a regular file");
}
