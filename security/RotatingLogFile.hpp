#pragma once

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

namespace security {

    // Append-only log file that rolls over by size:
    //   log.txt -> log.txt.1 -> log.txt.2 ... up to backup_count files.
    // A backup_count of 0 disables rotation and the file grows without bound.
    //
    // Not thread-safe; SecurityAwareLogger serializes access.
    class RotatingLogFile {
        public:
            RotatingLogFile(std::filesystem::path dir,
                            std::string file_name_format,
                            std::uintmax_t max_bytes,
                            std::size_t backup_count)
                : dir_(std::move(dir)),
                  file_name_format_(std::move(file_name_format)),
                  max_bytes_(max_bytes),
                  backup_count_(backup_count) {}

            // Creates the log directory if needed and opens a file named after the
            // current local time, e.g. logs/log_20250101_120000.log.
            void open() {
                std::error_code ec;
                std::filesystem::create_directories(dir_, ec);
                if (ec)
                    throw std::runtime_error("Failed to create log directory " + dir_.string() + ": " + ec.message());

                path_ = dir_ / timestamped_name(file_name_format_, std::time(nullptr));
                stream_.close();
                stream_.clear();
                stream_.open(path_, std::ios::out | std::ios::app);
                if (!stream_.is_open())
                    throw std::runtime_error("Failed to open log file: " + path_.string());

                auto existing = std::filesystem::file_size(path_, ec);
                size_ = ec ? 0 : existing;
            }

            void write_line(const std::string& line) {
                if (!stream_.is_open())
                    throw std::runtime_error("Log file is not open");

                std::uintmax_t incoming = line.size() + 1;
                if (should_rotate(incoming)) rotate();

                stream_ << line << '\n';
                if (!stream_)
                    throw std::runtime_error("Failed to write log file: " + path_.string());
                size_ += incoming;
            }

            void flush() {
                if (stream_.is_open()) stream_.flush();
            }

            void close() noexcept {
                if (stream_.is_open()) {
                    stream_.flush();
                    stream_.close();
                }
            }

            bool is_open() const { return stream_.is_open(); }
            const std::filesystem::path& path() const { return path_; }
            std::uintmax_t size() const { return size_; }

            std::filesystem::path backup_path(std::size_t index) const {
                return std::filesystem::path(path_.string() + "." + std::to_string(index));
            }

            static std::string timestamped_name(const std::string& format, std::time_t when) {
                std::tm local{};
                localtime_r(&when, &local);
                char buf[256];
                std::size_t n = std::strftime(buf, sizeof(buf), format.c_str(), &local);
                if (n == 0)
                    throw std::runtime_error("Log file name format produced an empty name: " + format);
                return std::string(buf, n);
            }

        private:
            bool should_rotate(std::uintmax_t incoming) const {
                return backup_count_ > 0 && size_ > 0 && size_ + incoming > max_bytes_;
            }

            // On failure the current file is reopened for append before the error
            // propagates, so a transient rename error costs one line, not the stream.
            void rotate() {
                stream_.close();

                std::error_code ec;
                for (std::size_t i = backup_count_; i > 1; --i) {
                    auto src = backup_path(i - 1);
                    if (std::filesystem::exists(src, ec)) {
                        std::filesystem::rename(src, backup_path(i), ec);
                        if (ec) fail_rotation(src, ec);
                    }
                }
                std::filesystem::rename(path_, backup_path(1), ec);
                if (ec) fail_rotation(path_, ec);

                stream_.clear();
                stream_.open(path_, std::ios::out | std::ios::trunc);
                if (!stream_.is_open())
                    throw std::runtime_error("Failed to reopen log file: " + path_.string());
                size_ = 0;
            }

            [[noreturn]] void fail_rotation(const std::filesystem::path& src, const std::error_code& cause) {
                stream_.clear();
                stream_.open(path_, std::ios::out | std::ios::app);
                throw std::runtime_error("Failed to rotate " + src.string() + ": " + cause.message());
            }

            std::filesystem::path dir_;
            std::string file_name_format_;
            std::uintmax_t max_bytes_;
            std::size_t backup_count_;
            std::filesystem::path path_;
            std::ofstream stream_;
            std::uintmax_t size_ = 0;
        };

} // namespace security
