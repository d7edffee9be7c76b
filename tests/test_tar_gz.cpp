/**
 * @file test_tar_gz.cpp
 * @brief Streaming gzip + tar extraction, fed in arbitrary slices
 */

#include <gtest/gtest.h>
#include "fastembed/store/TarGz.hpp"
#include "test_helpers.hpp"

#include <iterator>

using namespace fastembed;
using testutil::TarEntry;
using testutil::TempDir;

namespace fs = std::filesystem;

static std::string read_file(const fs::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

static void extract_in_slices(const std::string& archive, const fs::path& root, size_t slice) {
    TarGzExtractor ex(root);
    for (size_t i = 0; i < archive.size(); i += slice) {
        ex.write(archive.data() + i, std::min(slice, archive.size() - i));
    }
    ex.finish();
}

// "<len> key=value\n" where len counts its own digits
static std::string pax_record(const std::string& key, const std::string& value) {
    const std::string rest = " " + key + "=" + value + "\n";
    size_t len = rest.size() + 1;
    while (std::to_string(len).size() + rest.size() != len) len = std::to_string(len).size() + rest.size();
    return std::to_string(len) + rest;
}

static std::string pax_entry(char type, const std::string& body) {
    std::string out = testutil::tar_header("PaxHeaders/0", type, body.size()) + body;
    testutil::pad_block(out);
    return out;
}

static std::string file_entry(const std::string& name, const std::string& content) {
    std::string out = testutil::tar_header(name, '0', content.size()) + content;
    testutil::pad_block(out);
    return out;
}

TEST(TarGzTest, ExtractsDirectoriesAndFiles) {
    TempDir dir;
    std::string big(5000, 'x');
    big[4999] = 'y';
    auto archive = testutil::gzip(testutil::make_tar({
        {"m/", '5', "", ""},
        {"m/sub/", '5', "", ""},
        {"m/a.txt", '0', "alpha", ""},
        {"m/sub/big.bin", '0', big, ""},
        {"m/empty", '0', "", ""},
    }));

    TarGzExtractor ex(dir.path());
    ex.write(archive.data(), archive.size());
    ex.finish();

    EXPECT_TRUE(fs::is_directory(dir.path() / "m" / "sub"));
    EXPECT_EQ(read_file(dir.path() / "m" / "a.txt"), "alpha");
    EXPECT_EQ(read_file(dir.path() / "m" / "sub" / "big.bin"), big);
    EXPECT_TRUE(fs::exists(dir.path() / "m" / "empty"));
    EXPECT_EQ(ex.files_written(), 3u);
}

TEST(TarGzTest, SliceBoundariesDoNotMatter) {
    auto archive = testutil::gzip(testutil::make_tar({
        {"x/one", '0', std::string(700, '1'), ""},
        {"x/two", '0', "2", ""},
    }));
    for (size_t slice : {1u, 7u, 511u, 512u, 4096u}) {
        TempDir dir;
        extract_in_slices(archive, dir.path(), slice);
        EXPECT_EQ(read_file(dir.path() / "x" / "one"), std::string(700, '1')) << "slice=" << slice;
        EXPECT_EQ(read_file(dir.path() / "x" / "two"), "2") << "slice=" << slice;
    }
}

TEST(TarGzTest, CreatesParentsForFilesWithoutDirectoryEntries) {
    TempDir dir;
    auto archive = testutil::gzip(testutil::make_tar({{"deep/er/file", '0', "z", ""}}));
    extract_in_slices(archive, dir.path(), 100);
    EXPECT_EQ(read_file(dir.path() / "deep" / "er" / "file"), "z");
}

TEST(TarGzTest, HonorsGnuLongNames) {
    TempDir dir;
    std::string name = "model/" + std::string(120, 'n') + ".json";
    auto archive = testutil::gzip(testutil::make_tar({{name, '0', "long", ""}}));
    extract_in_slices(archive, dir.path(), 64);
    EXPECT_EQ(read_file(dir.path() / name), "long");
}

TEST(TarGzTest, IgnoresLinksAndOtherEntryTypes) {
    TempDir dir;
    auto archive = testutil::gzip(testutil::make_tar({
        {"m/real", '0', "data", ""},
        {"m/link", '2', "", "real"},
        {"m/fifo", '6', "", ""},
    }));
    extract_in_slices(archive, dir.path(), 512);
    EXPECT_TRUE(fs::exists(dir.path() / "m" / "real"));
    EXPECT_FALSE(fs::exists(fs::symlink_status(dir.path() / "m" / "link")));
    EXPECT_FALSE(fs::exists(dir.path() / "m" / "fifo"));
}

TEST(TarGzTest, AcceptsArchiveWithoutEndBlocks) {
    TempDir dir;
    auto archive = testutil::gzip(testutil::make_tar({{"f", '0', "ok", ""}}, false));
    extract_in_slices(archive, dir.path(), 512);
    EXPECT_EQ(read_file(dir.path() / "f"), "ok");
}

TEST(TarGzTest, RejectsPathsEscapingTheRoot) {
    TempDir dir;
    auto archive = testutil::gzip(testutil::make_tar({{"../evil", '0', "x", ""}}));
    EXPECT_THROW(extract_in_slices(archive, dir.path() / "root", 512), ExtractError);
    EXPECT_FALSE(fs::exists(dir.path() / "evil"));
}

TEST(TarGzTest, RejectsAbsolutePaths) {
    TempDir dir;
    auto archive = testutil::gzip(testutil::make_tar({{"/tmp/evil", '0', "x", ""}}));
    EXPECT_THROW(extract_in_slices(archive, dir.path(), 512), ExtractError);
}

TEST(TarGzTest, TruncatedArchiveFails) {
    TempDir dir;
    auto tar = testutil::make_tar({{"f", '0', std::string(2000, 'q'), ""}});
    auto archive = testutil::gzip(tar.substr(0, 900));
    EXPECT_THROW(extract_in_slices(archive, dir.path(), 512), ExtractError);
}

TEST(TarGzTest, TruncatedGzipFails) {
    TempDir dir;
    auto archive = testutil::gzip(testutil::make_tar({{"f", '0', std::string(3000, 'q'), ""}}));
    archive.resize(archive.size() / 2);
    EXPECT_THROW(extract_in_slices(archive, dir.path(), 512), ExtractError);
}

TEST(TarGzTest, GarbageIsNotGzip) {
    TempDir dir;
    std::string garbage(1024, 'G');
    EXPECT_THROW(extract_in_slices(garbage, dir.path(), 512), ExtractError);
}

TEST(TarGzTest, BadHeaderChecksumFails) {
    TempDir dir;
    auto tar = testutil::make_tar({{"f", '0', "x", ""}});
    tar[10] = 'Z'; // inside the name field
    auto archive = testutil::gzip(tar);
    EXPECT_THROW(extract_in_slices(archive, dir.path(), 512), ExtractError);
}

TEST(TarGzTest, EmptyStreamFails) {
    TempDir dir;
    TarGzExtractor ex(dir.path());
    EXPECT_THROW(ex.finish(), ExtractError);
}

TEST(TarGzTest, PaxPathReplacesTruncatedName) {
    TempDir dir;
    const std::string full = "m/" + std::string(120, 'x') + "/tokenizer.json";
    const std::string truncated = "m/xxxxxxxx/tokenizer.json";

    std::string tar = pax_entry('x', pax_record("mtime", "1700000000.5") + pax_record("path", full));
    tar += file_entry(truncated, "{}");
    // the record covers one entry only
    tar += file_entry("m/next", "n");
    tar.append(1024, '\0');

    extract_in_slices(testutil::gzip(tar), dir.path(), 100);
    EXPECT_EQ(read_file(dir.path() / full), "{}");
    EXPECT_FALSE(fs::exists(dir.path() / truncated));
    EXPECT_EQ(read_file(dir.path() / "m" / "next"), "n");
}

TEST(TarGzTest, GlobalPaxHeaderDoesNotRename) {
    TempDir dir;
    std::string tar = pax_entry('g', pax_record("path", "elsewhere"));
    tar += file_entry("m/a", "a");
    tar.append(1024, '\0');

    extract_in_slices(testutil::gzip(tar), dir.path(), 512);
    EXPECT_EQ(read_file(dir.path() / "m" / "a"), "a");
    EXPECT_FALSE(fs::exists(dir.path() / "elsewhere"));
}

TEST(TarGzTest, PaxPathIsCheckedLikeAnyName) {
    TempDir dir;
    std::string tar = pax_entry('x', pax_record("path", "../evil"));
    tar += file_entry("m/fine", "x");
    tar.append(1024, '\0');

    EXPECT_THROW(extract_in_slices(testutil::gzip(tar), dir.path() / "root", 512), ExtractError);
    EXPECT_FALSE(fs::exists(dir.path() / "evil"));
}

TEST(TarGzTest, MalformedPaxRecordFails) {
    TempDir dir;
    std::string tar = pax_entry('x', "99 path=short\n");
    tar += file_entry("m/a", "a");
    tar.append(1024, '\0');
    EXPECT_THROW(extract_in_slices(testutil::gzip(tar), dir.path(), 512), ExtractError);
}
