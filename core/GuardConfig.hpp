#pragma once

#include "../security/DiagnosticSink.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <regex>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

namespace guard {

    struct LoggingConfig {
        std::string dir = "logs";
        std::string file_name_format = "log_%Y%m%d_%H%M%S.log";
        std::uintmax_t max_file_bytes = 5 * 1024 * 1024;  // 5 MiB
        std::size_t backup_count = 5;
        security::Level level = security::Level::Info;
        bool console = true;
    };

    struct GuardConfig {
        static constexpr std::size_t kDefaultMaxInputLength = 25;
        // std::regex_match recurses per character; keep inputs well inside the stack.
        static constexpr std::size_t kMaxInputLengthCeiling = 4096;
        // Matched with std::regex_match, so it is anchored at both ends.
        static constexpr const char* kDefaultAllowedPattern = R"([A-Za-z0-9\s\-_]*)";

        std::size_t max_input_length = kDefaultMaxInputLength;
        std::string allowed_pattern = kDefaultAllowedPattern;
        LoggingConfig logging;

        void validate() const {
            if (max_input_length == 0)
                throw std::invalid_argument("GuardConfig::max_input_length must be positive");
            if (max_input_length > kMaxInputLengthCeiling)
                throw std::invalid_argument("GuardConfig::max_input_length exceeds " +
                                            std::to_string(kMaxInputLengthCeiling));
            if (allowed_pattern.empty())
                throw std::invalid_argument("GuardConfig::allowed_pattern must not be empty");
            try {
                std::regex compiled(allowed_pattern);
                (void)compiled;
            } catch (const std::regex_error& e) {
                throw std::invalid_argument("GuardConfig::allowed_pattern does not compile: " +
                                            std::string(e.what()));
            }
            if (logging.dir.empty())
                throw std::invalid_argument("LoggingConfig::dir must not be empty");
            if (logging.file_name_format.empty())
                throw std::invalid_argument("LoggingConfig::file_name_format must not be empty");
            if (logging.max_file_bytes == 0)
                throw std::invalid_argument("LoggingConfig::max_file_bytes must be positive");
        }

        // Missing keys keep their defaults. Type mismatches surface as std::runtime_error,
        // out-of-range values as std::invalid_argument.
        static GuardConfig from_json(const nlohmann::json& j) {
            GuardConfig cfg;
            try {
                if (!j.is_object())
                    throw std::runtime_error("configuration root must be a JSON object");

                if (j.contains("max_input_length"))
                    cfg.max_input_length = positive_integer(j.at("max_input_length"), "max_input_length");
                if (j.contains("allowed_pattern"))
                    cfg.allowed_pattern = j.at("allowed_pattern").get<std::string>();

                if (j.contains("logging")) {
                    const auto& lj = j.at("logging");
                    if (!lj.is_object())
                        throw std::runtime_error("\"logging\" must be a JSON object");
                    cfg.logging.dir = lj.value("dir", cfg.logging.dir);
                    cfg.logging.file_name_format = lj.value("file_name_format", cfg.logging.file_name_format);
                    if (lj.contains("max_file_bytes"))
                        cfg.logging.max_file_bytes = positive_integer(lj.at("max_file_bytes"), "logging.max_file_bytes");
                    if (lj.contains("backup_count"))
                        cfg.logging.backup_count = non_negative_integer(lj.at("backup_count"), "logging.backup_count");
                    if (lj.contains("level")) {
                        auto name = lj.at("level").get<std::string>();
                        auto level = security::level_from_string(name);
                        if (!level)
                            throw std::invalid_argument("LoggingConfig::level is not one of DEBUG, INFO, WARN, ERROR: " + name);
                        cfg.logging.level = *level;
                    }
                    cfg.logging.console = lj.value("console", cfg.logging.console);
                }
            } catch (const nlohmann::json::exception& e) {
                throw std::runtime_error(std::string("Invalid configuration: ") + e.what());
            }

            cfg.validate();
            return cfg;
        }

        static GuardConfig load(const std::string& path) {
            std::ifstream in(path);
            if (!in.is_open())
                throw std::runtime_error("Failed to open config file: " + path);

            nlohmann::json j;
            try {
                in >> j;
            } catch (const nlohmann::json::parse_error& e) {
                throw std::runtime_error("Malformed config file " + path + ": " + e.what());
            }

            try {
                return from_json(j);
            } catch (const std::invalid_argument& e) {
                throw std::invalid_argument(path + ": " + e.what());
            } catch (const std::runtime_error& e) {
                throw std::runtime_error(path + ": " + e.what());
            }
        }

    private:
        static std::size_t non_negative_integer(const nlohmann::json& v, const char* key) {
            if (!v.is_number_integer())
                throw std::runtime_error(std::string("\"") + key + "\" must be an integer");
            if (v.get<std::int64_t>() < 0)
                throw std::invalid_argument(std::string(key) + " must not be negative");
            return v.get<std::size_t>();
        }

        static std::size_t positive_integer(const nlohmann::json& v, const char* key) {
            auto value = non_negative_integer(v, key);
            if (value == 0)
                throw std::invalid_argument(std::string(key) + " must be positive");
            return value;
        }
    };

} // namespace guard
