#include <execd/exec/file_service.hpp>
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <sys/stat.h>

using namespace execd;

class FileServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = tmp_.file("ws");
        workspace_.reset(new Workspace(root_));
        std::string error;
        ASSERT_TRUE(workspace_->init(error)) << error;
        files_.reset(new FileService(*workspace_));
    }

    FileWriteEntry entry(const std::string& path, const std::string& data,
                         const std::string& mode = "", const std::string& encoding = "") {
        FileWriteEntry e;
        e.path = path;
        e.data = data;
        e.mode = mode;
        e.encoding = encoding;
        return e;
    }

    test::TempDir tmp_;
    std::string root_;
    std::unique_ptr<Workspace> workspace_;
    std::unique_ptr<FileService> files_;
};

TEST_F(FileServiceTest, ParsesModes) {
    unsigned int mode = 0;
    EXPECT_TRUE(FileService::parse_mode("644", mode));
    EXPECT_EQ(0644u, mode);
    EXPECT_TRUE(FileService::parse_mode("0755", mode));
    EXPECT_EQ(0755u, mode);
    EXPECT_TRUE(FileService::parse_mode("4755", mode));
    EXPECT_EQ(04755u, mode);
    EXPECT_FALSE(FileService::parse_mode("rw-", mode));
    EXPECT_FALSE(FileService::parse_mode("999", mode));
    EXPECT_FALSE(FileService::parse_mode("", mode));

    EXPECT_EQ(644, FileService::mode_to_wire(0644));
    EXPECT_EQ(755, FileService::mode_to_wire(040755));
}

TEST_F(FileServiceTest, BatchWriteReportsEachEntry) {
    std::vector<FileWriteEntry> batch;
    batch.push_back(entry("/a/b/c.txt", "hello", "600"));
    batch.push_back(entry(std::string("/bad\0name", 9), "x"));
    batch.push_back(entry("/../escape.txt", "x"));
    batch.push_back(entry("/bin.dat", "AAEC", "", "base64"));
    batch.push_back(entry("/mode.txt", "x", "rwx"));

    std::vector<FileWriteResult> results = files_->write_files(batch);
    ASSERT_EQ(5u, results.size());
    EXPECT_TRUE(results[0].ok);
    EXPECT_EQ(ErrorCode::ValidationError, results[1].code);
    EXPECT_EQ(ErrorCode::PermissionDenied, results[2].code);
    EXPECT_TRUE(results[3].ok);
    EXPECT_EQ(ErrorCode::ValidationError, results[4].code);

    EXPECT_EQ("hello", test::read_text(root_ + "/a/b/c.txt"));
    EXPECT_EQ(std::string("\x00\x01\x02", 3), test::read_text(root_ + "/bin.dat"));

    struct stat st;
    ASSERT_EQ(0, ::stat((root_ + "/a/b/c.txt").c_str(), &st));
    EXPECT_EQ(0600u, st.st_mode & 07777);

    Json j = results[1].to_json();
    EXPECT_FALSE(j["ok"].get<bool>());
    EXPECT_EQ("ValidationError", j["error"]["code"]);
}

TEST_F(FileServiceTest, WriteReplacesAndRejectsDirectories) {
    std::vector<FileWriteEntry> batch;
    batch.push_back(entry("/f.txt", "one"));
    ASSERT_TRUE(files_->write_files(batch)[0].ok);
    batch[0].data = "two";
    ASSERT_TRUE(files_->write_files(batch)[0].ok);
    EXPECT_EQ("two", test::read_text(root_ + "/f.txt"));

    ASSERT_TRUE(files_->make_dirs("/dir").success);
    batch[0] = entry("/dir", "x");
    EXPECT_EQ(ErrorCode::ValidationError, files_->write_files(batch)[0].code);
    batch[0] = entry("/", "x");
    EXPECT_EQ(ErrorCode::ValidationError, files_->write_files(batch)[0].code);
    batch[0] = entry("/x", "***", "", "base64");
    EXPECT_EQ(ErrorCode::ValidationError, files_->write_files(batch)[0].code);
}

TEST_F(FileServiceTest, ReadsTextAndBase64) {
    ASSERT_TRUE(test::write_text(root_ + "/r.txt", "hello"));

    OpResult<FileContent> r = files_->read_file("/r.txt");
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ("hello", r.value.data);
    EXPECT_EQ("utf-8", r.value.encoding);
    EXPECT_EQ(5, r.value.size);

    r = files_->read_file("r.txt", "base64");
    ASSERT_TRUE(r.success);
    EXPECT_EQ("aGVsbG8=", r.value.data);
    EXPECT_EQ(5, r.value.size);

    EXPECT_EQ(ErrorCode::ValidationError, files_->read_file("/r.txt", "latin-1").code);
    EXPECT_EQ(ErrorCode::NotFound, files_->read_file("/missing.txt").code);
    EXPECT_EQ(ErrorCode::ValidationError, files_->read_file("/").code);
    EXPECT_EQ(ErrorCode::PermissionDenied, files_->read_file("/../../etc/passwd").code);
}

TEST_F(FileServiceTest, ListsSortedByName) {
    ASSERT_TRUE(test::write_text(root_ + "/b.txt", "bb"));
    ASSERT_TRUE(test::write_text(root_ + "/a.txt", "a"));
    ASSERT_TRUE(files_->make_dirs("/c").success);

    OpResult<std::vector<FileEntryInfo> > r = files_->list("/");
    ASSERT_TRUE(r.success) << r.error;
    ASSERT_EQ(3u, r.value.size());
    EXPECT_EQ("a.txt", r.value[0].name);
    EXPECT_EQ("/a.txt", r.value[0].path);
    EXPECT_EQ("file", r.value[0].type);
    EXPECT_EQ(2, r.value[1].size);
    EXPECT_EQ("directory", r.value[2].type);

    EXPECT_EQ(ErrorCode::ValidationError, files_->list("/a.txt").code);
    EXPECT_EQ(ErrorCode::NotFound, files_->list("/nope").code);
}

TEST_F(FileServiceTest, RemovesFilesAndTrees) {
    ASSERT_TRUE(test::write_text(root_ + "/t/x/y.txt", "y"));
    ASSERT_TRUE(test::write_text(root_ + "/single.txt", "s"));

    EXPECT_TRUE(files_->remove("/single.txt", false).success);
    EXPECT_FALSE(test::path_exists(root_ + "/single.txt"));

    EXPECT_EQ(ErrorCode::Conflict, files_->remove("/t", false).code);
    EXPECT_TRUE(files_->remove("/t", true).success);
    EXPECT_FALSE(test::path_exists(root_ + "/t"));

    EXPECT_EQ(ErrorCode::NotFound, files_->remove("/t", true).code);
    EXPECT_EQ(ErrorCode::PermissionDenied, files_->remove("/", true).code);
    EXPECT_TRUE(test::path_exists(root_));
}

TEST_F(FileServiceTest, MakesDirectoriesWithMode) {
    OpResult<FileEntryInfo> r = files_->make_dirs("/p/q/r", "700");
    ASSERT_TRUE(r.success) << r.error;
    EXPECT_EQ("directory", r.value.type);
    EXPECT_EQ("/p/q/r", r.value.path);
    EXPECT_EQ(0700u, r.value.mode);

    // Existing directories are fine
    EXPECT_TRUE(files_->make_dirs("/p/q").success);

    ASSERT_TRUE(test::write_text(root_ + "/file", "x"));
    EXPECT_FALSE(files_->make_dirs("/file/sub").success);
    EXPECT_EQ(ErrorCode::ValidationError, files_->make_dirs("/z", "abc").code);
}

TEST_F(FileServiceTest, MovesAndStats) {
    ASSERT_TRUE(test::write_text(root_ + "/from.txt", "data"));

    EXPECT_TRUE(files_->move("/from.txt", "/to/dir/moved.txt").success);
    EXPECT_FALSE(test::path_exists(root_ + "/from.txt"));
    EXPECT_EQ("data", test::read_text(root_ + "/to/dir/moved.txt"));

    OpResult<FileEntryInfo> st = files_->stat("/to/dir/moved.txt");
    ASSERT_TRUE(st.success);
    EXPECT_EQ("moved.txt", st.value.name);
    EXPECT_EQ(4, st.value.size);
    EXPECT_GT(st.value.mtime, 0);

    st = files_->stat("/");
    ASSERT_TRUE(st.success);
    EXPECT_EQ("/", st.value.path);
    EXPECT_EQ("directory", st.value.type);

    EXPECT_EQ(ErrorCode::NotFound, files_->move("/gone", "/x").code);
    EXPECT_EQ(ErrorCode::PermissionDenied, files_->move("/to", "/../out").code);
    EXPECT_EQ(ErrorCode::PermissionDenied, files_->move("/", "/x").code);
    EXPECT_EQ(ErrorCode::NotFound, files_->stat("/gone").code);
}
