//
// Created by Giuseppe Francione on 19/10/26.
//

#include <gtest/gtest.h>
#include "../test_images.hpp"
#include "../../imgscrub_cli/src/commands/commands.hpp"
#include "../../libimgscrub/include/data_url.hpp"
#include "../../libimgscrub/include/errors.hpp"
#include <sstream>
#include <stdexcept>
#include <string>

using namespace imgscrub;
using namespace test_images;
namespace fs = std::filesystem;

namespace {

    struct SanitizeRun {
        int code = -1;
        std::string out;
        std::string err;
    };

    SanitizeRun sanitize_stdin(const std::string& input, const SanitizeOptions& options = {}) {
        std::istringstream in(input);
        std::ostringstream out;
        std::ostringstream err;
        SanitizeRun run;
        run.code = run_sanitize(in, out, err, options);
        run.out = out.str();
        run.err = err.str();
        return run;
    }

    std::string png_data_url() {
        PngFixture fx;
        fx.text = {{"Author", "Jane Doe"}};
        fx.exif = make_exif();
        return DataUrl::format(make_png(fx), "image/png");
    }

    fs::path sanitized_path_of(const nlohmann::json& report) {
        const nlohmann::json& file = report.at("sanitized").at("file");
        return fs::path(file.at("dir").get<std::string>()) / file.at("basename").get<std::string>();
    }

} // namespace

// --- sanitize (stdin mode) ---

TEST(SanitizeCommand, EmptyInputProducesNothing) {
    for (const char* input : {"", "  \n\t\r\n"}) {
        const SanitizeRun run = sanitize_stdin(input);
        EXPECT_EQ(run.code, 0);
        EXPECT_TRUE(run.out.empty());
        EXPECT_TRUE(run.err.empty());
    }
}

TEST(SanitizeCommand, WritesDataUrlWithoutNewline) {
    const SanitizeRun run = sanitize_stdin(png_data_url() + "\n");
    ASSERT_EQ(run.code, 0) << run.err;
    EXPECT_TRUE(run.err.empty());
    ASSERT_EQ(run.out.rfind("data:image/png;base64,", 0), 0u);
    EXPECT_NE(run.out.back(), '\n');

    const auto bytes = DataUrl::parse(run.out).bytes;
    EXPECT_EQ(png_chunk_types(bytes), (std::vector<std::string>{"IHDR", "IDAT", "IEND"}));
}

TEST(SanitizeCommand, HonorsOutputFormat) {
    SanitizeOptions options;
    options.format = OutputFormat::webp();
    const SanitizeRun run = sanitize_stdin(png_data_url(), options);
    ASSERT_EQ(run.code, 0) << run.err;
    EXPECT_EQ(run.out.rfind("data:image/webp;base64,", 0), 0u);
}

TEST(SanitizeCommand, ErrorsGoToStderrWithExitCodeOne) {
    const SanitizeRun malformed = sanitize_stdin("definitely not a data url");
    EXPECT_EQ(malformed.code, 1);
    EXPECT_TRUE(malformed.out.empty());
    EXPECT_FALSE(malformed.err.empty());

    const SanitizeRun undecodable = sanitize_stdin("data:image/png;base64,Zm9v");
    EXPECT_EQ(undecodable.code, 1);
    EXPECT_TRUE(undecodable.out.empty());
    EXPECT_NE(undecodable.err.find("decode"), std::string::npos);
}

TEST(SanitizeCommand, MapsSettingsToOptions) {
    Settings settings;
    settings.output_format = "jpg";
    settings.max_dim = 640;
    const SanitizeOptions options = options_from(settings);
    EXPECT_EQ(options.format, OutputFormat::jpeg());
    EXPECT_EQ(options.max_dim, 640);
}

// --- inspect ---

TEST(InspectCommand, ReportsSourceFileOnly) {
    const TempDir dir;
    const auto input = dir.path() / "holiday.png";
    PngFixture fx;
    fx.exif = make_exif();
    write_file(input, make_png(fx));

    Settings settings;
    settings.input = input.string();
    const nlohmann::json report = build_inspect_report(settings);
    EXPECT_EQ(report.at("source"), "holiday.png");
    EXPECT_EQ(report.at("source_file").at("basename"), "holiday.png");
    EXPECT_TRUE(report.at("before").at("exif_present").get<bool>());
    EXPECT_FALSE(report.contains("sanitized"));
}

TEST(InspectCommand, SanitizesFileAndKeepsResultWithoutCleanup) {
    const TempDir dir;
    const auto input = dir.path() / "holiday.png";
    PngFixture fx;
    fx.exif = make_exif();
    write_file(input, make_png(fx));

    Settings settings;
    settings.input = input.string();
    settings.sanitize = true;
    const nlohmann::json report = build_inspect_report(settings);

    const fs::path sanitized = sanitized_path_of(report);
    ASSERT_TRUE(fs::exists(sanitized));
    const ScopedFile cleanup(sanitized);
    EXPECT_TRUE(fs::equivalent(sanitized.parent_path(), fs::temp_directory_path()));
    EXPECT_EQ(report.at("sanitized_mime"), "image/png");
    EXPECT_FALSE(report.at("sanitized").at("file").contains("deleted"));
    EXPECT_EQ(report.at("sanitized").at("file").at("mode"), "0o644");
    EXPECT_FALSE(report.at("sanitized").at("report").at("exif_present").get<bool>());
}

TEST(InspectCommand, CleanupDeletesSanitizedFile) {
    const TempDir dir;
    const auto input = dir.path() / "holiday.jpg";
    JpegFixture fx;
    fx.icc = make_icc(500);
    write_file(input, make_jpeg(fx));

    Settings settings;
    settings.input = input.string();
    settings.sanitize = true;
    settings.cleanup = true;
    settings.output_format = "JPEG";
    const nlohmann::json report = build_inspect_report(settings);

    EXPECT_TRUE(report.at("sanitized").at("file").at("deleted").get<bool>());
    EXPECT_FALSE(fs::exists(sanitized_path_of(report)));
    EXPECT_EQ(report.at("sanitized_mime"), "image/jpeg");
    EXPECT_TRUE(report.at("sanitized").at("report").at("icc_profile_sha256").is_null());
}

TEST(InspectCommand, SanitizesDataUrlFromMemory) {
    Settings settings;
    settings.input = png_data_url();
    settings.sanitize = true;
    settings.cleanup = true;
    const nlohmann::json report = build_inspect_report(settings);

    EXPECT_EQ(report.at("source"), "<data-url>");
    EXPECT_FALSE(report.contains("source_file"));
    EXPECT_TRUE(report.at("before").at("exif_present").get<bool>());

    const nlohmann::json& file = report.at("sanitized").at("file");
    EXPECT_TRUE(file.at("deleted").get<bool>());
    EXPECT_EQ(file.at("basename").get<std::string>().rfind("img_", 0), 0u);
    EXPECT_EQ(file.at("mode"), "0o644");
    EXPECT_FALSE(fs::exists(sanitized_path_of(report)));
    EXPECT_TRUE(report.at("sanitized").at("report").at("info_keys").empty());
}

TEST(InspectCommand, RejectsUnknownInput) {
    Settings settings;
    settings.input = "/definitely/not/here.png";
    EXPECT_THROW((void)build_inspect_report(settings), Error);
}

// --- ScopedFile ---

TEST(ScopedFile, RemovesFileWhenScopeUnwinds) {
    const TempDir dir;
    const auto path = dir.path() / "img_deadbeef.png";
    write_file(path, std::vector<std::uint8_t>{1, 2, 3});

    EXPECT_THROW({
        const ScopedFile guard(path);
        throw std::runtime_error("report failed");
    }, std::runtime_error);
    EXPECT_FALSE(fs::exists(path));
}

TEST(ScopedFile, EarlyRemoveReportsSuccessOnce) {
    const TempDir dir;
    const auto path = dir.path() / "img_deadbeef.png";
    write_file(path, std::vector<std::uint8_t>{1, 2, 3});

    ScopedFile guard(path);
    EXPECT_FALSE(guard.remove());
    EXPECT_FALSE(fs::exists(path));
    EXPECT_TRUE(guard.path().empty());

    // recreated under the same name: no longer owned by the guard
    write_file(path, std::vector<std::uint8_t>{4});
    EXPECT_FALSE(guard.remove());
    EXPECT_TRUE(fs::exists(path));
}
