#ifndef CODE_SANDBOX_STREAM_CAPTURE_H
#define CODE_SANDBOX_STREAM_CAPTURE_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace code_sandbox
{
    /**
     * @brief 截取不超过 max_len 字节的前缀，不会切断多字节 UTF-8 字符
     */
    std::string TruncateUtf8(const std::string& text, std::size_t max_len);

    /**
     * @brief 单次执行的输出捕获 (RAII)
     *
     * 在请求工作目录下创建 stdout/stderr/report 三个捕获文件，
     * 文件描述符交给子进程 dup2 到 1/2/REPORT_FD。
     * 调用方进程自身的 1/2 从不被修改；析构时关闭全部描述符，
     * 任何退出路径 (成功、故障、超时) 都保证释放。
     */
    class CapturedStreams
    {
    public:
        /**
         * @param dir 请求工作目录 (必须已存在)
         * @throw std::runtime_error 如果无法打开捕获文件
         */
        explicit CapturedStreams(const std::string& dir);
        ~CapturedStreams();

        CapturedStreams(const CapturedStreams&) = delete;
        CapturedStreams& operator=(const CapturedStreams&) = delete;

        int input_fd() const { return input_fd_; }
        int output_fd() const { return output_fd_; }
        int error_fd() const { return error_fd_; }
        int report_fd() const { return report_fd_; }

        /**
         * @brief 读取捕获内容，最多 limit 字节 (截断时退回到 UTF-8 字符边界)
         */
        std::string ReadOutput(std::uint64_t limit) const;
        std::string ReadError(std::uint64_t limit) const;
        std::string ReadReport() const;

        std::uint64_t OutputSize() const;

    private:
        static std::string ReadFd(int fd, std::uint64_t limit);
        static std::uint64_t SizeOf(int fd);
        void CloseAll();

        int input_fd_ = -1;
        int output_fd_ = -1;
        int error_fd_ = -1;
        int report_fd_ = -1;
    };
}

#endif // CODE_SANDBOX_STREAM_CAPTURE_H
