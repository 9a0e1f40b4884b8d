#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <format>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>

#include "catch2/catch_all.hpp"
#include "spdlog/sinks/ostream_sink.h"
#include "spdlog/spdlog.h"

#include "stagefmt/utils/files.hpp"

namespace stagefmt::tests
{
    struct temp_directory
    {
        std::filesystem::path path;

        temp_directory()
        {
            static std::atomic<std::size_t> counter = 0;
            const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
            path = std::filesystem::temp_directory_path() / std::format("stagefmt-{}-{}", ticks, counter++);
            std::filesystem::create_directories(path);
            path = std::filesystem::canonical(path);
        }

        ~temp_directory()
        {
            std::error_code error;
            std::filesystem::remove_all(path, error);
        }

        temp_directory(const temp_directory&) = delete;
        temp_directory& operator=(const temp_directory&) = delete;

        [[nodiscard]] std::string file(const std::string_view name) const
        {
            return (path / name).string();
        }

        void write(const std::string_view name, const std::string& content) const
        {
            REQUIRE(files::write_file(file(name), content));
        }

        [[nodiscard]] std::string read(const std::string_view name) const
        {
            std::string content;
            REQUIRE(files::read_file(file(name), content));
            return content;
        }

        void write_script(const std::string_view name, const std::string& content) const
        {
            write(name, "#!/bin/sh\n" + content);
            std::filesystem::permissions(path / name, std::filesystem::perms::owner_all, std::filesystem::perm_options::add);
        }
    };

    /**
     * Redirects the default logger to a string stream for the lifetime of the scope.
     */
    struct log_capture
    {
        std::ostringstream stream;
        std::shared_ptr<spdlog::logger> old_logger;

        log_capture()
        {
            old_logger = spdlog::default_logger();

            auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
            auto logger = std::make_shared<spdlog::logger>("capture", std::move(sink));
            logger->set_pattern("%l: %v");
            logger->set_level(spdlog::level::info);
            spdlog::set_default_logger(std::move(logger));
        }

        ~log_capture()
        {
            spdlog::set_default_logger(old_logger);
        }

        log_capture(const log_capture&) = delete;
        log_capture& operator=(const log_capture&) = delete;

        [[nodiscard]] std::string str() const
        {
            return stream.str();
        }
    };
}
