#include <cerrno>
#include <cstring>
#include <string>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "../include/file_reader.hpp"


namespace btsalvage::verify {

    namespace {

    std::string os_error(const char* what, int err) {
        return std::string(what) + ": " + std::strerror(err);
    }

    class PosixFileHandle : public IFileHandle
    {
    public:
        explicit PosixFileHandle(int fd) : fd_(fd) {}
        ~PosixFileHandle() override { if (fd_ >= 0) ::close(fd_); }

        PosixFileHandle(const PosixFileHandle&) = delete;
        PosixFileHandle& operator=(const PosixFileHandle&) = delete;

        Expected<std::size_t> read(std::int64_t offset, std::span<std::uint8_t> buf) override {
            for (;;) {
                ssize_t n = ::pread(fd_, buf.data(), buf.size(), static_cast<off_t>(offset));
                if (n >= 0) return Expected<std::size_t>::success(static_cast<std::size_t>(n));
                if (errno == EINTR) continue;
                return Expected<std::size_t>::failure(os_error("pread", errno));
            }
        }

        Expected<std::int64_t> size() override {
            struct stat st{};
            if (::fstat(fd_, &st) != 0) return Expected<std::int64_t>::failure(os_error("fstat", errno));
            return Expected<std::int64_t>::success(static_cast<std::int64_t>(st.st_size));
        }

    private:
        int fd_{-1};
    };

    class PosixFileReader : public IFileReader
    {
    public:
        Expected<std::unique_ptr<IFileHandle>> open(const std::filesystem::path& path) override {
            using Result = Expected<std::unique_ptr<IFileHandle>>;

            int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
            if (fd < 0) return Result::failure(os_error("open", errno));

            struct stat st{};
            if (::fstat(fd, &st) != 0) {
                const int err = errno;
                ::close(fd);
                return Result::failure(os_error("fstat", err));
            }
            if (!S_ISREG(st.st_mode)) {
                ::close(fd);
                return Result::failure("open: not a regular file");
            }
            return Result::success(std::make_unique<PosixFileHandle>(fd));
        }
    };

    } // namespace

    std::shared_ptr<IFileReader> makePosixFileReader() {
        return std::make_shared<PosixFileReader>();
    }

} // namespace btsalvage::verify
