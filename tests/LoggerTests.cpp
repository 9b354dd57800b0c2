#include "vpg/core/Logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace {

struct LoggerFileGuard {
    std::filesystem::path path;
    explicit LoggerFileGuard(std::filesystem::path p) : path(std::move(p)) {}
    ~LoggerFileGuard() {
        vpg::core::Logger::SetLogFile({});
        vpg::core::Logger::SetMinimumLevel(vpg::core::LogLevel::Debug);
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

} // namespace

TEST_CASE("Logger writes formatted messages to file", "[logger]") {
    LoggerFileGuard guard(std::filesystem::temp_directory_path() / "vspatchgen_logger_test.log");
    std::filesystem::remove(guard.path);

    vpg::core::Logger::SetLogFile(guard.path);
    vpg::core::Logger::Info("Wrote {} patch op(s)", 42);

    std::ifstream file(guard.path);
    REQUIRE(file.is_open());

    std::string line;
    std::getline(file, line);
    REQUIRE(line.find("[Info] Wrote 42 patch op(s)") != std::string::npos);
}

TEST_CASE("Logger listeners receive log lines", "[logger]") {
    std::vector<std::string> captured;
    const auto token = vpg::core::Logger::RegisterListener(
        [&captured](vpg::core::LogLevel level, const std::string& line) {
            if (level == vpg::core::LogLevel::Warning) {
                captured.push_back(line);
            }
        });

    vpg::core::Logger::Warning("Captured warning {}", 7);
    vpg::core::Logger::UnregisterListener(token);
    vpg::core::Logger::Warning("Not captured");

    REQUIRE(captured.size() == 1);
    REQUIRE(captured.front().find("[Warning] Captured warning 7") != std::string::npos);
}

TEST_CASE("Logger drops lines below the minimum level", "[logger]") {
    LoggerFileGuard guard(std::filesystem::temp_directory_path() / "vspatchgen_logger_level.log");

    std::vector<std::string> captured;
    const auto token = vpg::core::Logger::RegisterListener(
        [&captured](vpg::core::LogLevel, const std::string& line) { captured.push_back(line); });

    vpg::core::Logger::SetMinimumLevel(vpg::core::LogLevel::Warning);
    vpg::core::Logger::Info("hidden");
    vpg::core::Logger::Error("shown");
    vpg::core::Logger::UnregisterListener(token);

    REQUIRE(captured.size() == 1);
    REQUIRE(captured.front().find("[Error] shown") != std::string::npos);
}
