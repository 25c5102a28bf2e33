#include <gtest/gtest.h>
#include "transfer/naming.hpp"

using namespace jsxfer::transfer;

TEST(NamingTest, ReplacesDotsAndSpaces) {
    EXPECT_EQ(canonical_name("report.final v2.pdf"), "report_final_v2_pdf");
    EXPECT_EQ(canonical_name("archive.tar.gz"), "archive_tar_gz");
    EXPECT_EQ(canonical_name("plain"), "plain");
}

TEST(NamingTest, UsesBaseNameOnly) {
    EXPECT_EQ(canonical_name("/var/data/photo.jpg"), "photo_jpg");
    EXPECT_EQ(canonical_name("relative/dir/notes.txt"), "notes_txt");
}

TEST(NamingTest, CleansPathFirst) {
    EXPECT_EQ(canonical_name("a/b/../c.txt"), "c_txt");
    EXPECT_EQ(canonical_name("a//b/./d.bin"), "d_bin");
    EXPECT_EQ(canonical_name("dir/sub/"), "sub");
}

TEST(NamingTest, IsIdempotent) {
    for (const std::string path : {"x.y z", "/tmp/a.b", "plain", "a b c.d.e"}) {
        const std::string once = canonical_name(path);
        EXPECT_EQ(canonical_name(once), once) << "Path: " << path;
    }
}

TEST(NamingTest, SameBaseNameCollides) {
    EXPECT_EQ(canonical_name("/one/data.csv"), canonical_name("/two/data.csv"));
}

TEST(NamingTest, EmptyPathIsTotal) {
    EXPECT_EQ(canonical_name(""), "_");
    EXPECT_FALSE(names_a_file(""));
}

TEST(NamingTest, DotComponentsNameNoFile) {
    EXPECT_FALSE(names_a_file("."));
    EXPECT_FALSE(names_a_file(".."));
    EXPECT_FALSE(names_a_file("a/.."));
    EXPECT_FALSE(names_a_file("dir/sub/../.."));
    EXPECT_TRUE(names_a_file("dir/sub"));
    EXPECT_TRUE(names_a_file(".hidden"));
}

TEST(NamingTest, UnderscoreFilesAreValid) {
    EXPECT_TRUE(names_a_file("_"));
    EXPECT_TRUE(names_a_file("dir/__"));
    EXPECT_EQ(canonical_name("dir/__"), "__");
    EXPECT_TRUE(is_valid_name(canonical_name("_")));
    EXPECT_TRUE(is_valid_name(canonical_name("dir/__")));
}

TEST(NamingTest, Validity) {
    EXPECT_TRUE(is_valid_name("photo_jpg"));
    EXPECT_FALSE(is_valid_name(""));
    EXPECT_FALSE(is_valid_name("a*b"));
    EXPECT_FALSE(is_valid_name("a>b"));
    EXPECT_FALSE(is_valid_name("a/b"));
}
