#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include "../../common/expected.hpp"


namespace btsalvage::verify {


    struct IFileHandle
    {
        virtual ~IFileHandle() = default;

        // Up to buf.size() bytes at `offset`; 0 means end of file.
        virtual Expected<std::size_t> read(std::int64_t offset, std::span<std::uint8_t> buf) = 0;
        virtual Expected<std::int64_t> size() = 0;
    };


    struct IFileReader
    {
        virtual ~IFileReader() = default;
        virtual Expected<std::unique_ptr<IFileHandle>> open(const std::filesystem::path& path) = 0;
    };


    // Factory for the production reader (open(2)/pread(2)).
    std::shared_ptr<IFileReader> makePosixFileReader();


} // namespace btsalvage::verify
