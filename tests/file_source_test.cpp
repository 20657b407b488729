#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include "utils/file_source.hpp"
#include "test_utils.hpp"

using namespace sft;
using namespace sft::utils;

class FileSourceTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_logging();
        std::random_device rd;
        base = std::filesystem::temp_directory_path() / ("sft_file_source_" + std::to_string(rd()));
        std::filesystem::create_directories(base);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(base, ec);
    }

    std::filesystem::path write_file(const std::string& name, const std::string& contents) {
        auto path = base / name;
        std::ofstream out(path, std::ios::binary);
        out << contents;
        return path;
    }

    std::string read_file(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    std::filesystem::path base;
};

TEST_F(FileSourceTest, LoadsNameMimeAndContents) {
    auto path = write_file("notes.txt", "hello world");

    transfer::PendingFile file = load_pending_file(path);

    EXPECT_EQ(file.name, "notes.txt");
    EXPECT_EQ(file.mime_type, "text/plain");
    EXPECT_EQ(file.contents, to_bytes("hello world"));
}

TEST_F(FileSourceTest, LoadsEmptyFile) {
    transfer::PendingFile file = load_pending_file(write_file("empty.bin", ""));
    EXPECT_TRUE(file.contents.empty());
    EXPECT_EQ(file.mime_type, "application/octet-stream");
}

TEST_F(FileSourceTest, MissingFileThrows) {
    EXPECT_THROW(load_pending_file(base / "missing.txt"), FileSourceError);
}

TEST_F(FileSourceTest, DirectoryThrows) {
    EXPECT_THROW(load_pending_file(base), FileSourceError);
}

TEST_F(FileSourceTest, FileAboveLimitThrows) {
    auto path = write_file("big.txt", "0123456789");
    EXPECT_THROW(load_pending_file(path, 9), FileSourceError);
    EXPECT_NO_THROW(load_pending_file(path, 10));
}

TEST_F(FileSourceTest, MimeTypeByExtension) {
    EXPECT_EQ(guess_mime_type("report.pdf"), "application/pdf");
    EXPECT_EQ(guess_mime_type("photo.JPG"), "image/jpeg");
    EXPECT_EQ(guess_mime_type("data.json"), "application/json");
    EXPECT_EQ(guess_mime_type("archive.tar.gz"), "application/gzip");
    EXPECT_EQ(guess_mime_type("README"), "application/octet-stream");
    EXPECT_EQ(guess_mime_type("blob.xyz"), "application/octet-stream");
}

TEST_F(FileSourceTest, SanitizeKeepsFinalComponent) {
    EXPECT_EQ(sanitize_file_name("a.txt"), "a.txt");
    EXPECT_EQ(sanitize_file_name("../../etc/passwd"), "passwd");
    EXPECT_EQ(sanitize_file_name("/abs/path/file.bin"), "file.bin");
    EXPECT_EQ(sanitize_file_name("dir\\sub\\win.txt"), "win.txt");
}

TEST_F(FileSourceTest, SanitizeRejectsEmptyAndDots) {
    EXPECT_THROW(sanitize_file_name(""), FileSourceError);
    EXPECT_THROW(sanitize_file_name("."), FileSourceError);
    EXPECT_THROW(sanitize_file_name(".."), FileSourceError);
    EXPECT_THROW(sanitize_file_name("dir/"), FileSourceError);
}

TEST_F(FileSourceTest, SavesIntoDirectory) {
    transfer::ReceivedFile file{"out.txt", "text/plain", 5, to_bytes("saved")};

    auto path = save_received_file(file, base / "inbox");

    EXPECT_EQ(path, base / "inbox" / "out.txt");
    EXPECT_EQ(read_file(path), "saved");
}

TEST_F(FileSourceTest, SaveCannotEscapeDirectory) {
    transfer::ReceivedFile file{"../escape.txt", "text/plain", 3, to_bytes("bad")};

    auto path = save_received_file(file, base / "inbox");

    EXPECT_EQ(path, base / "inbox" / "escape.txt");
    EXPECT_FALSE(std::filesystem::exists(base / "escape.txt"));
}

TEST_F(FileSourceTest, SaveOverwritesExisting) {
    write_file("same.txt", "old contents that are longer");
    transfer::ReceivedFile file{"same.txt", "text/plain", 3, to_bytes("new")};

    auto path = save_received_file(file, base);
    EXPECT_EQ(read_file(path), "new");
}

TEST_F(FileSourceTest, LoadThenSaveRoundTrip) {
    std::string payload(4096 * 3 + 17, '\0');
    for (size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(i % 251);
    }
    transfer::PendingFile pending = load_pending_file(write_file("blob.bin", payload));

    transfer::ReceivedFile received{pending.name, pending.mime_type, pending.contents.size(), pending.contents};
    auto path = save_received_file(received, base / "copy");

    EXPECT_EQ(read_file(path), payload);
}
