#pragma once

#include "DiagnosticSink.hpp"
#include "CryptoHasher.hpp"
#include "RotatingLogFile.hpp"
#include "../core/GuardConfig.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <utility>

namespace security {

    // Diagnostic sink writing to a rotating file and, optionally, a console stream.
    //
    // Each line looks like
    //   2025-01-01 12:00:00,123 | ERROR    | [Request Rejected] ... seq=7 hash=<sha256>
    // where hash = sha256(previous_hash|seq|LEVEL|message). Altering or dropping a line
    // breaks every hash after it.
    //
    // record() is safe to call from several threads and never throws; failures are
    // counted in failures().
    class SecurityAwareLogger : public IDiagnosticSink {
        public:
            static inline const std::string kGenesisHash = std::string(64, '0');

            explicit SecurityAwareLogger(const guard::LoggingConfig& config, std::ostream* console = &std::cerr)
                : file_(config.dir, config.file_name_format, config.max_file_bytes, config.backup_count),
                  min_level_(config.level),
                  console_(config.console ? console : nullptr) {}

            SecurityAwareLogger(const SecurityAwareLogger&) = delete;
            SecurityAwareLogger& operator=(const SecurityAwareLogger&) = delete;

            ~SecurityAwareLogger() override {
                close();
            }

            // Throws std::runtime_error when the log directory or file cannot be created.
            void open() {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    file_.open();
                }
                log(Level::Info, "[Logger Started] file=", file_.path().string());
            }

            void close() noexcept {
                std::lock_guard<std::mutex> lock(mutex_);
                file_.close();
            }

            void record(Level level, const std::string& message) noexcept override {
                if (level < min_level_) return;
                try {
                    std::string safe = escape_control(message);
                    auto now = std::chrono::system_clock::now();

                    std::lock_guard<std::mutex> lock(mutex_);
                    std::uint64_t seq = sequence_;
                    std::string hash = CryptoHasher::sha256(chain_input(last_hash_, seq, level, safe));

                    std::ostringstream line;
                    line << format_timestamp(now) << " | " << std::left << std::setw(8) << level_to_string(level)
                         << " | " << safe << " seq=" << seq << " hash=" << hash;

                    // The chain only advances over lines that reached the file.
                    file_.write_line(line.str());
                    sequence_ = seq + 1;
                    last_hash_ = std::move(hash);
                    if (console_) *console_ << line.str() << '\n';
                } catch (const std::exception&) {
                    failures_.fetch_add(1, std::memory_order_relaxed);
                }
            }

            void flush() noexcept override {
                try {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (console_) console_->flush();
                    file_.flush();
                } catch (const std::exception&) {
                    failures_.fetch_add(1, std::memory_order_relaxed);
                }
            }

            template <typename... Args>
            void log(Level level, Args&&... args) {
                std::ostringstream oss;
                (oss << ... << std::forward<Args>(args));
                record(level, oss.str());
            }

            std::uint64_t failures() const { return failures_.load(std::memory_order_relaxed); }

            std::uint64_t sequence() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return sequence_;
            }

            std::string last_hash() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return last_hash_;
            }

            std::filesystem::path file_path() const {
                std::lock_guard<std::mutex> lock(mutex_);
                return file_.path();
            }

            static std::string chain_input(const std::string& previous_hash, std::uint64_t seq,
                                           Level level, const std::string& message) {
                std::ostringstream meta;
                meta << previous_hash << '|' << seq << '|' << level_to_string(level) << '|' << message;
                return meta.str();
            }

            // One record per line: CR, LF and other control bytes are escaped so input
            // echoed into a message cannot forge extra records.
            static std::string escape_control(const std::string& message) {
                std::string out;
                out.reserve(message.size());
                for (unsigned char c : message) {
                    if (c == '\n') {
                        out += "\\n";
                    } else if (c == '\r') {
                        out += "\\r";
                    } else if (c == '\t') {
                        out += "\\t";
                    } else if (c < 0x20 || c == 0x7F) {
                        static const char* hex = "0123456789abcdef";
                        out += "\\x";
                        out += hex[c >> 4];
                        out += hex[c & 0x0F];
                    } else {
                        out += static_cast<char>(c);
                    }
                }
                return out;
            }

        private:
            static std::string format_timestamp(std::chrono::system_clock::time_point tp) {
                std::time_t secs = std::chrono::system_clock::to_time_t(tp);
                auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
                std::tm local{};
                localtime_r(&secs, &local);
                std::ostringstream oss;
                oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << ',' << std::setw(3) << std::setfill('0') << ms;
                return oss.str();
            }

            mutable std::mutex mutex_;
            RotatingLogFile file_;
            Level min_level_;
            std::ostream* console_;
            std::uint64_t sequence_ = 0;
            std::string last_hash_ = kGenesisHash;
            std::atomic<std::uint64_t> failures_{0};
        };

} // namespace security
