#include "metainfo.hpp"
#include <cstring>
#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <openssl/sha.h>
#include "../bencode/bencode.hpp"


using namespace btsalvage::metainfo;
using btsalvage::bencode::Value;


static PieceHash sha1_bytes(const void* data, size_t len) {
    PieceHash out;
    SHA1(static_cast<const unsigned char*>(data), len, out.data());
    return out;
}

static const Value& require_dict(const Value* v, const char* where) {
    if (!v) throw std::runtime_error(std::string(where) + " missing");
    if (!v->isDict()) throw std::runtime_error(std::string(where) + ": expected dict");
    return *v;
}

static const std::string& require_bytes(const Value* v, const char* where) {
    if (!v) throw std::runtime_error(std::string(where) + " missing");
    if (!v->isBytes()) throw std::runtime_error(std::string(where) + ": expected string");
    return v->bytes();
}

static int64_t require_int(const Value* v, const char* where) {
    if (!v) throw std::runtime_error(std::string(where) + " missing");
    if (!v->isInteger()) throw std::runtime_error(std::string(where) + ": expected integer");
    return v->integer();
}

// One path component from the metadata; anything that could leave the content root is refused.
static const std::string& checked_segment(const std::string& s, const char* where) {
    if (s.empty() || s == "." || s == ".." || s.find('/') != std::string::npos
        || s.find('\0') != std::string::npos) {
        throw std::runtime_error(std::string(where) + ": unsafe path component '" + s + "'");
    }
    return s;
}

static bool is_pad_file(const Value& fileDict) {
    const auto* attr = fileDict.find("attr");
    return attr && attr->isBytes() && attr->bytes().find('p') != std::string::npos;
}

static std::vector<PieceHash> split_pieces_blob(const std::string& blob) {
    if (blob.size() % 20 != 0) throw std::runtime_error("info.pieces: length not a multiple of 20");

    std::vector<PieceHash> out(blob.size() / 20);
    for (size_t i = 0; i < out.size(); ++i) {
        std::memcpy(out[i].data(), blob.data() + i * 20, 20);
    }
    return out;
}

static std::vector<FileEntry> single_file_entries(const Value& infod, const std::string& name) {
    const int64_t len = require_int(infod.find("length"), "info.length");
    if (len < 0) throw std::runtime_error("info.length negative");

    FileEntry fe;
    fe.path = name;
    fe.length = static_cast<uint64_t>(len);
    fe.offset = 0;
    return {fe};
}

static std::vector<FileEntry> multi_file_entries(const Value& filesv, const std::string& name) {
    if (!filesv.isList()) throw std::runtime_error("info.files: expected list");

    std::vector<FileEntry> out;
    out.reserve(filesv.list().size());
    uint64_t running = 0;

    for (const auto& fv : filesv.list()) {
        const auto& fd = require_dict(&fv, "file entry");

        const int64_t len = require_int(fd.find("length"), "file.length");
        if (len < 0) throw std::runtime_error("file.length negative");

        const auto* pathv = fd.find("path");
        if (!pathv || !pathv->isList() || pathv->list().empty()) {
            throw std::runtime_error("file.path missing or empty");
        }

        std::filesystem::path p(name);
        for (const auto& segv : pathv->list()) {
            p /= checked_segment(require_bytes(&segv, "file.path segment"), "file.path");
        }

        FileEntry fe;
        fe.path = std::move(p);
        fe.length = static_cast<uint64_t>(len);
        fe.offset = running;
        fe.pad = is_pad_file(fd);
        running += fe.length;
        out.push_back(std::move(fe));
    }

    return out;
}

static InfoDictionary decode_info_dict(const Value& infod) {
    InfoDictionary out;

    out.name = checked_segment(require_bytes(infod.find("name"), "info.name"), "info.name");

    const int64_t pl = require_int(infod.find("piece length"), "info.piece length");
    // piece sizes travel as int through the provider interface
    if (pl <= 0 || pl > int64_t(std::numeric_limits<int32_t>::max())) {
        throw std::runtime_error("info.piece length out of range");
    }
    out.pieceLength = static_cast<uint32_t>(pl);

    out.pieces = split_pieces_blob(require_bytes(infod.find("pieces"), "info.pieces"));

    if (const auto* filesv = infod.find("files")) {
        out.multiFile = true;
        out.files = multi_file_entries(*filesv, out.name);
    } else {
        out.files = single_file_entries(infod, out.name);
    }

    uint64_t total = 0;
    for (const auto& f : out.files) total += f.length;
    const uint64_t expected = (total + out.pieceLength - 1) / out.pieceLength;
    if (expected != out.pieces.size()) {
        std::ostringstream oss;
        oss << "info.pieces: " << out.pieces.size() << " hashes for " << total
            << " bytes at piece length " << out.pieceLength << " (expected " << expected << ")";
        throw std::runtime_error(oss.str());
    }

    return out;
}

// -------------------------- Public API ---------------------------

Metainfo Metainfo::fromTorrent(std::string_view data) {

    auto doc = btsalvage::bencode::decodeDocument(data);
    if (!doc.root.isDict()) throw std::runtime_error("root: expected dict");

    const auto& infod = require_dict(doc.root.find("info"), "root.info");
    if (!doc.infoSlice) throw std::runtime_error("missing 'info' dictionary");

    Metainfo mi;
    mi.info = decode_info_dict(infod);

    // infohash from exact raw bytes of "info"
    mi.infoHash_ = sha1_bytes(doc.infoSlice->data(), doc.infoSlice->size());

    return mi;
}

Metainfo Metainfo::fromFile(const std::filesystem::path& torrentPath) {
    std::ifstream in(torrentPath, std::ios::binary);
    if (!in) throw std::runtime_error("cannot open " + torrentPath.string());

    std::ostringstream oss;
    oss << in.rdbuf();
    if (in.bad()) throw std::runtime_error("cannot read " + torrentPath.string());

    const std::string data = oss.str();
    return fromTorrent(data);
}

std::string Metainfo::infoHashHex() const {
    std::ostringstream oss;
    for (auto b : infoHash_) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
    }
    return oss.str();
}
