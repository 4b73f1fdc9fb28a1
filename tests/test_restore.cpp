#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <glib.h>

#include "kovak/Restore.hpp"

using namespace kovak;
namespace fs = std::filesystem;

namespace {

class RestoreTest : public ::testing::Test {
protected:
    fs::path dir;
    HistoryStore history;

    void SetUp() override {
        g_autofree gchar* tmp = g_dir_make_tmp("kovak-restore-XXXXXX", nullptr);
        ASSERT_NE(tmp, nullptr);
        dir = tmp;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string touch(const std::string& name) {
        fs::path path = dir / name;
        std::ofstream(path) << "data";
        return path.string();
    }

    static std::string fileUri(const std::string& path) {
        g_autofree gchar* uri = g_filename_to_uri(path.c_str(), nullptr, nullptr);
        return uri ? uri : "";
    }
};

} // namespace

TEST_F(RestoreTest, RecordedImageRestoresPixels) {
    history.append(ImageEntry{"Image which has no path (hash: abc)", {1, 2, 3}});

    RestorePayload payload = resolveRestore("Image which has no path (hash: abc)", history);
    auto* image = std::get_if<ImagePayload>(&payload);
    ASSERT_NE(image, nullptr);
    EXPECT_EQ(image->png, (std::vector<std::uint8_t>{1, 2, 3}));
}

TEST_F(RestoreTest, ImageWithoutPixelsFallsBackToText) {
    history.append(ImageEntry{"Image which has no path (hash: 0)", {}});

    RestorePayload payload = resolveRestore("Image which has no path (hash: 0)", history);
    auto* text = std::get_if<TextPayload>(&payload);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->text, "Image which has no path (hash: 0)");
}

TEST_F(RestoreTest, RecordedUrlListRestoresUris) {
    std::string local = touch("notes.txt");
    std::string display = "https://example.org/a, " + local;
    history.append(UrlListEntry{display});

    RestorePayload payload = resolveRestore(display, history);
    auto* uris = std::get_if<UriListPayload>(&payload);
    ASSERT_NE(uris, nullptr);
    ASSERT_EQ(uris->uris.size(), 2u);
    EXPECT_EQ(uris->uris[0], "https://example.org/a");
    EXPECT_EQ(uris->uris[1], fileUri(local));
}

TEST_F(RestoreTest, RecordedTextWinsOverExistingPath) {
    std::string path = touch("picture.png");
    history.append(TextEntry{path});

    RestorePayload payload = resolveRestore(path, history);
    auto* text = std::get_if<TextPayload>(&payload);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->text, path);
}

TEST_F(RestoreTest, UnrecordedImagePathRestoresAsImageFile) {
    std::string path = touch("Shot.JPEG");

    RestorePayload payload = resolveRestore(path, history);
    auto* file = std::get_if<ImageFilePayload>(&payload);
    ASSERT_NE(file, nullptr);
    EXPECT_EQ(file->path, path);
}

TEST_F(RestoreTest, UnrecordedFilePathRestoresAsFileReference) {
    std::string path = touch("report.pdf");

    RestorePayload payload = resolveRestore(path, history);
    auto* uris = std::get_if<UriListPayload>(&payload);
    ASSERT_NE(uris, nullptr);
    ASSERT_EQ(uris->uris.size(), 1u);
    EXPECT_EQ(uris->uris[0], fileUri(path));
}

TEST_F(RestoreTest, DirectoryIsNotAFile) {
    RestorePayload payload = resolveRestore(dir.string(), history);
    EXPECT_TRUE(std::holds_alternative<TextPayload>(payload));
}

TEST_F(RestoreTest, AnythingElseIsPlainText) {
    RestorePayload payload = resolveRestore("not a real path", history);
    auto* text = std::get_if<TextPayload>(&payload);
    ASSERT_NE(text, nullptr);
    EXPECT_EQ(text->text, "not a real path");

    payload = resolveRestore("", history);
    EXPECT_TRUE(std::holds_alternative<TextPayload>(payload));
}

TEST(UriListTest, KeepsUrisAndConvertsPaths) {
    auto uris = toUriList("file:///tmp/a.txt, /tmp/b c.txt");
    ASSERT_EQ(uris.size(), 2u);
    EXPECT_EQ(uris[0], "file:///tmp/a.txt");
    EXPECT_EQ(uris[1], "file:///tmp/b%20c.txt");
}

TEST(UriListTest, SkipsEmptyPieces) {
    EXPECT_TRUE(toUriList("").empty());
    EXPECT_EQ(toUriList("https://x.org, , ").size(), 1u);
}

TEST(UriListTest, RasterExtensions) {
    EXPECT_TRUE(hasRasterImageExtension("/a/b.png"));
    EXPECT_TRUE(hasRasterImageExtension("/a/b.GIF"));
    EXPECT_TRUE(hasRasterImageExtension("x.bmp"));
    EXPECT_FALSE(hasRasterImageExtension("/a/b.svg"));
    EXPECT_FALSE(hasRasterImageExtension("/a/png"));
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
