#include "stream_capture.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace code_sandbox
{

    namespace {

        int OpenCaptureFile(const std::string& path)
        {
            // O_CLOEXEC: 只有显式 dup2 过去的副本才会进入子进程的 exec
            return ::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
        }

    } // anonymous namespace

    CapturedStreams::CapturedStreams(const std::string& dir)
    {
        input_fd_ = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        output_fd_ = OpenCaptureFile(dir + "/stdout.txt");
        error_fd_ = OpenCaptureFile(dir + "/stderr.txt");
        report_fd_ = OpenCaptureFile(dir + "/report.txt");

        if (input_fd_ < 0 || output_fd_ < 0 || error_fd_ < 0 || report_fd_ < 0) {
            int err = errno;
            CloseAll();
            throw std::runtime_error("无法创建输出捕获文件于 '" + dir + "': " + std::strerror(err));
        }
    }

    CapturedStreams::~CapturedStreams()
    {
        CloseAll();
    }

    void CapturedStreams::CloseAll()
    {
        for (int* fd : {&input_fd_, &output_fd_, &error_fd_, &report_fd_}) {
            if (*fd >= 0) {
                ::close(*fd);
                *fd = -1;
            }
        }
    }

    std::string TruncateUtf8(const std::string& text, std::size_t max_len)
    {
        if (text.size() <= max_len) return text;

        // text[cut] 是续字节说明截断点落在字符中间，退回到它的首字节
        std::size_t cut = max_len;
        for (int back = 0; back < 3 && cut > 0; ++back) {
            if ((static_cast<unsigned char>(text[cut]) & 0xC0) != 0x80) break;
            --cut;
        }
        if ((static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) cut = max_len; // 本身就不是合法序列
        return text.substr(0, cut);
    }

    std::string CapturedStreams::ReadFd(int fd, std::uint64_t limit)
    {
        std::string content;
        if (fd < 0) return content;

        // 多读几个字节用于判断截断点是否落在字符中间
        const std::uint64_t want = limit + 4;
        char buffer[4096];
        off_t offset = 0;
        while (content.size() < want) {
            ssize_t n = ::pread(fd, buffer, sizeof(buffer), offset);
            if (n < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (n == 0) break;
            std::size_t take = static_cast<std::size_t>(n);
            if (content.size() + take > want) take = static_cast<std::size_t>(want - content.size());
            content.append(buffer, take);
            offset += n;
        }
        return TruncateUtf8(content, static_cast<std::size_t>(limit));
    }

    std::uint64_t CapturedStreams::SizeOf(int fd)
    {
        struct stat st{};
        if (fd < 0 || ::fstat(fd, &st) != 0) return 0;
        return static_cast<std::uint64_t>(st.st_size);
    }

    std::string CapturedStreams::ReadOutput(std::uint64_t limit) const
    {
        return ReadFd(output_fd_, limit);
    }

    std::string CapturedStreams::ReadError(std::uint64_t limit) const
    {
        return ReadFd(error_fd_, limit);
    }

    std::string CapturedStreams::ReadReport() const
    {
        return ReadFd(report_fd_, 64 * 1024);
    }

    std::uint64_t CapturedStreams::OutputSize() const
    {
        return SizeOf(output_fd_);
    }

} // namespace code_sandbox
