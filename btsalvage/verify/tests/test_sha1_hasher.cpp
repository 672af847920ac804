#include <catch2/catch_all.hpp>

#include <string>

#include "../include/sha1_hasher.hpp"
#include "../include/types.hpp"

using namespace btsalvage::verify;

TEST_CASE("Sha1Hasher: known digests") {
    CHECK(toHex(Sha1Hasher::digest("abc")) == "a9993e364706816aba3e25717850c26c9cd0d89d");
    CHECK(toHex(Sha1Hasher::digest("")) == "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST_CASE("Sha1Hasher: streaming matches one-shot") {
    const std::string text = "The quick brown fox jumps over the lazy dog";

    Sha1Hasher h;
    h.update(std::string_view(text).substr(0, 10));
    h.update(std::string_view(text).substr(10));
    const auto streamed = h.finish();

    CHECK(streamed == Sha1Hasher::digest(text));
    CHECK(toHex(streamed) == "2fd4e1c67a2d28fced849ee1bb76e7391b93eb12");
}

TEST_CASE("Sha1Hasher: reset starts a fresh digest") {
    Sha1Hasher h;
    h.update("garbage");
    h.reset();
    h.update("abc");
    CHECK(h.finish() == Sha1Hasher::digest("abc"));
}

TEST_CASE("Sha1Hasher: NUL bytes are hashed, not terminated on") {
    const std::string withNul("a\0b", 3);
    CHECK(Sha1Hasher::digest(withNul) != Sha1Hasher::digest("a"));
}

TEST_CASE("types: state and outcome names") {
    CHECK(std::string(toString(PieceState::unknown)) == "unknown");
    CHECK(std::string(toString(PieceState::invalid)) == "invalid");
    CHECK(std::string(toString(FileOutcome::trustedComplete)) == "trusted-complete");

    FileSpan none;
    CHECK(none.empty());
    CHECK(none.count() == 0);
    CHECK(FileSpan{3, 6}.count() == 4);
}
