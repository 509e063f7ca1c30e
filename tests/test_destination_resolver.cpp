// test_destination_resolver.cpp: file naming and atomic placement

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include "transferkit/destination_resolver.hpp"
#include "transferkit/error.hpp"

using namespace transferkit;
namespace fs = std::filesystem;

class DestinationResolverTest : public ::testing::Test {
protected:
    fs::path root;
    fs::path target;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() / (std::string("transferkit_resolver_") + info->name());
        fs::remove_all(root);
        target = root / "downloads";
        fs::create_directories(root / "spool");
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    fs::path spoolFile(const std::string& name, const std::string& content) {
        const auto path = root / "spool" / name;
        std::ofstream(path, std::ios::binary) << content;
        return path;
    }

    static std::string readAll(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }
};

TEST_F(DestinationResolverTest, PlacesFileAndCreatesDirectory) {
    DestinationResolver resolver(target);
    const auto placed = resolver.place(spoolFile("a.part", "hello"), "greeting.txt");

    EXPECT_EQ(placed, target / "greeting.txt");
    EXPECT_EQ(readAll(placed), "hello");
    EXPECT_FALSE(fs::exists(root / "spool" / "a.part"));
}

TEST_F(DestinationResolverTest, LatestDownloadOverwrites) {
    DestinationResolver resolver(target);
    resolver.place(spoolFile("a.part", "first version, quite long"), "notes.txt");
    const auto placed = resolver.place(spoolFile("b.part", "second"), "notes.txt");

    EXPECT_EQ(readAll(placed), "second");
    EXPECT_EQ(std::distance(fs::directory_iterator(target), fs::directory_iterator()), 1);
}

TEST_F(DestinationResolverTest, NamesAreReducedToOneComponent) {
    DestinationResolver resolver(target);
    EXPECT_EQ(resolver.destinationFor("../../etc/passwd"), target / "passwd");
    EXPECT_EQ(resolver.destinationFor("dir\\evil.exe"), target / "evil.exe");
    EXPECT_EQ(resolver.destinationFor(""), target / "download");
    EXPECT_EQ(resolver.destinationFor(".."), target / "download");
    EXPECT_EQ(resolver.destinationFor("tab\there"), target / "tabhere");
}

TEST_F(DestinationResolverTest, DirectoryInTheWayFails) {
    DestinationResolver resolver(target);
    fs::create_directories(target / "report.pdf");
    const auto temp = spoolFile("a.part", "pdf bytes");

    try {
        resolver.place(temp, "report.pdf");
        FAIL() << "placing over a directory should fail";
    } catch (const TransferException& e) {
        EXPECT_EQ(e.kind(), ErrorKind::FileSystemFailure);
    }
    EXPECT_TRUE(fs::is_directory(target / "report.pdf"));
}

TEST_F(DestinationResolverTest, MissingSourceLeavesDestinationUntouched) {
    DestinationResolver resolver(target);
    resolver.place(spoolFile("a.part", "kept"), "data.bin");

    EXPECT_THROW((void)resolver.place(root / "spool" / "gone.part", "data.bin"), TransferException);
    EXPECT_EQ(readAll(target / "data.bin"), "kept");
}

TEST(SuggestedFilenameTest, PrefersContentDisposition) {
    const Headers headers{{"content-disposition", "attachment; filename=\"Quarterly Report.pdf\""}};
    EXPECT_EQ(DestinationResolver::suggestedFilename(headers, "https://example.com/download?id=7"),
              "Quarterly Report.pdf");
}

TEST(SuggestedFilenameTest, FallsBackToUrlThenDefault) {
    EXPECT_EQ(DestinationResolver::suggestedFilename({}, "https://example.com/files/photo.jpg?size=large"),
              "photo.jpg");
    EXPECT_EQ(DestinationResolver::suggestedFilename({{"content-disposition", "inline"}},
                                                     "https://example.com/files/"),
              "files");
    EXPECT_EQ(DestinationResolver::suggestedFilename({}, "https://example.com"), "download");
}

TEST(SuggestedFilenameTest, HeaderPathIsSanitized) {
    const Headers headers{{"content-disposition", "attachment; filename=\"../../.bashrc\""}};
    EXPECT_EQ(DestinationResolver::suggestedFilename(headers, "https://example.com/x"), ".bashrc");
}
