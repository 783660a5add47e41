// ==============================================================================
// test_output_gtest.cpp - Тесты модуля вывода (GoogleTest)
// ==============================================================================
//
// Вывод перехватывается через CaptureStdout/CaptureStderr: потоки в тестах не
// являются TTY, поэтому ANSI-коды не ожидаются.
//
// ==============================================================================

#include "portclean/output.hpp"

#include <gtest/gtest.h>
#include <rapidjson/document.h>
#include <string>

namespace portclean::output::test {

// ==============================================================================
// Форматирование префиксов
// ==============================================================================

TEST(OutputTest, FormatError_Prefix) {
    EXPECT_EQ(format_error("msg"), "[x] msg\n");
}

TEST(OutputTest, AnsiCodes) {
    EXPECT_EQ(ansi_color_code(Color::Red), "\x1b[31m");
    EXPECT_EQ(ansi_color_code(Color::Green), "\x1b[32m");
    EXPECT_EQ(ansi_color_code(Color::Default), "");
}

// ==============================================================================
// Уровни сообщений
// ==============================================================================

TEST(OutputTest, Info_GoesToStderr) {
    // Arrange
    Writer writer(OutputConfig{});

    // Act
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    writer.info("Checking 2 port(s)");
    std::string err = testing::internal::GetCapturedStderr();
    std::string out = testing::internal::GetCapturedStdout();

    // Assert
    EXPECT_EQ(err, "[+] Checking 2 port(s)\n");
    EXPECT_TRUE(out.empty());
}

TEST(OutputTest, Quiet_SuppressesInfoAndWarnButNotErrors) {
    OutputConfig cfg;
    cfg.quiet = true;
    Writer writer(cfg);

    testing::internal::CaptureStderr();
    writer.info("info");
    writer.warn("warn");
    writer.error("boom");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[x] boom\n");
}

TEST(OutputTest, Debug_RequiresVerbose) {
    OutputConfig quiet_cfg;
    Writer silent(quiet_cfg);
    OutputConfig verbose_cfg;
    verbose_cfg.verbose = 1;
    Writer verbose(verbose_cfg);

    testing::internal::CaptureStderr();
    silent.debug("hidden");
    verbose.debug("shown");
    verbose.trace("still hidden");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[*] shown\n");
}

TEST(OutputTest, Trace_RequiresVerboseTwo) {
    OutputConfig cfg;
    cfg.verbose = 2;
    Writer writer(cfg);

    testing::internal::CaptureStderr();
    writer.trace("exec: lsof");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "[~] exec: lsof\n");
}

// ==============================================================================
// Поток отчёта
// ==============================================================================

TEST(OutputTest, ReportLines_GoToStdoutByDefault) {
    Writer writer(OutputConfig{});

    testing::internal::CaptureStdout();
    writer.green_line("killed");
    writer.yellow_line("none");
    writer.cyan_line("header");
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "killed\nnone\nheader\n");
}

TEST(OutputTest, RedLine_AlwaysStderr) {
    Writer writer(OutputConfig{});

    testing::internal::CaptureStderr();
    writer.red_line("Error: Invalid port abc");
    std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(err, "Error: Invalid port abc\n");
}

TEST(OutputTest, JsonMode_MovesReportToStderr) {
    // Arrange
    OutputConfig cfg;
    cfg.json = true;
    Writer writer(cfg);

    // Act
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    writer.green_line("killed");
    std::string err = testing::internal::GetCapturedStderr();
    std::string out = testing::internal::GetCapturedStdout();

    // Assert
    EXPECT_EQ(writer.report_stream(), Stream::Stderr);
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(err, "killed\n");
}

// ==============================================================================
// JSON вывод
// ==============================================================================

TEST(OutputTest, WriteJsonPretty_TwoSpaceIndent) {
    rapidjson::Document doc;
    doc.SetObject();
    doc.AddMember("port", 3000, doc.GetAllocator());
    Writer writer(OutputConfig{});

    testing::internal::CaptureStdout();
    writer.write_json_pretty(doc);
    std::string out = testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "{\n  \"port\": 3000\n}\n");
}

}  // namespace portclean::output::test
