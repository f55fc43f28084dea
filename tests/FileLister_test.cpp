#include <gtest/gtest.h>
#include "core/FileLister.hpp"
#include "test_utils.hpp"

#include <sys/stat.h>
#include <unistd.h>

using namespace ListFile;

class FileListerTest : public TmpDirTest {
    protected:
    FileListerTest() : gate(4), lister(make_options(), gate) {}

    static ListerOptions make_options() {
        ListerOptions options;
        options.default_line_count = 10;
        options.max_line_count = 1000;
        options.buffer_size = 8192;
        return options;
    }

    AdmissionGate gate;
    FileLister lister;
};

TEST_F(FileListerTest, valid_file) {
    fs::path fname = tmp_file("test.txt", "Line 1\nLine 2\nLine 3\nLine 4\nLine 5");
    EXPECT_THAT(lister.get_last_lines(fname, 3), ElementsAre("Line 3", "Line 4", "Line 5"));
}

TEST_F(FileListerTest, default_line_count) {
    fs::path fname = tmp_file("test.txt", numbered_lines(15));
    std::vector<std::string> lines = lister.get_last_lines(fname);
    ASSERT_EQ(10, lines.size());
    EXPECT_EQ("Line 6", lines[0]);
    EXPECT_EQ("Line 15", lines[9]);
}

TEST_F(FileListerTest, large_file) {
    fs::path fname = tmp_file("large.txt", numbered_lines(2000));
    EXPECT_THAT(lister.get_last_lines(fname, 5), ElementsAre("Line 1996", "Line 1997", "Line 1998", "Line 1999", "Line 2000"));
}

TEST_F(FileListerTest, huge_file_small_result) {
    // several Mb, far more than one buffer
    fs::path fname = tmp_file("huge.txt", numbered_lines(300000, "\r\n") + "\r\n");
    EXPECT_THAT(lister.get_last_lines(fname, 2), ElementsAre("Line 299999", "Line 300000"));
}

TEST_F(FileListerTest, empty_file) {
    fs::path fname = tmp_file("empty.txt", "");
    EXPECT_THAT(lister.get_last_lines(fname, 5), IsEmpty());
}

TEST_F(FileListerTest, blank_path) {
    for( const char* path : {"", "   ", "\t"} ){
        try {
            lister.get_last_lines(path, 10);
            FAIL() << "no exception for \"" << path << "\"";
        } catch( const InvalidArgument& e ){
            EXPECT_THAT(e.what(), HasSubstr("File path cannot be null or empty"));
        }
    }
}

TEST_F(FileListerTest, invalid_line_count) {
    fs::path fname = tmp_file("test.txt", "Test content");
    for( int n : {0, -1, -10} ){
        try {
            lister.get_last_lines(fname, n);
            FAIL() << "no exception for " << n;
        } catch( const InvalidArgument& e ){
            EXPECT_THAT(e.what(), HasSubstr("Line count must be greater than zero"));
        }
    }
}

TEST_F(FileListerTest, line_count_over_max) {
    fs::path fname = tmp_file("test.txt", "Test content");
    try {
        lister.get_last_lines(fname, 1001);
        FAIL() << "no exception";
    } catch( const InvalidArgument& e ){
        EXPECT_THAT(e.what(), HasSubstr("Line count cannot exceed 1000"));
        EXPECT_THAT(e.what(), HasSubstr("1001"));
    }
    EXPECT_NO_THROW(lister.get_last_lines(fname, 1000));
}

TEST_F(FileListerTest, not_found) {
    fs::path fname = m_dir / "nonexistent.txt";
    try {
        lister.get_last_lines(fname, 10);
        FAIL() << "no exception";
    } catch( const NotFound& e ){
        EXPECT_THAT(e.what(), HasSubstr(fname.string()));
    }
}

TEST_F(FileListerTest, access_denied) {
    if( geteuid() == 0 ){
        GTEST_SKIP() << "root ignores file permissions";
    }
    fs::path fname = tmp_file("secret.txt", "hidden");
    chmod(fname.c_str(), 0);
    EXPECT_THROW(lister.get_last_lines(fname, 10), AccessDenied);
}

TEST_F(FileListerTest, cancelled) {
    fs::path fname = tmp_file("test.txt", "Test content");
    CancelSource cancel;
    cancel.cancel();
    EXPECT_THROW(lister.get_last_lines(fname, 10, cancel.token()), Cancelled);
    EXPECT_EQ(gate.capacity(), gate.available());
}

TEST_F(FileListerTest, cancelled_large_file) {
    fs::path fname = tmp_file("large.txt", numbered_lines(100000));
    CancelSource cancel;
    cancel.cancel();
    EXPECT_THROW(lister.get_last_lines(fname, 1000, cancel.token()), Cancelled);
}

TEST_F(FileListerTest, slot_released_on_error) {
    EXPECT_THROW(lister.get_last_lines(m_dir / "missing", 10), NotFound);
    EXPECT_EQ(gate.capacity(), gate.available());
}

TEST_F(FileListerTest, concurrent_calls) {
    fs::path fname = tmp_file("test.txt", numbered_lines(100));

    std::vector<std::future<std::vector<std::string>>> futures;
    for( int i = 0; i < 10; i++ ){
        futures.push_back(lister.get_last_lines_async(fname, 5));
    }
    for( auto& f : futures ){
        EXPECT_THAT(f.get(), ElementsAre("Line 96", "Line 97", "Line 98", "Line 99", "Line 100"));
    }
    EXPECT_EQ(gate.capacity(), gate.available());
}

TEST_F(FileListerTest, async_propagates_errors) {
    auto f = lister.get_last_lines_async(m_dir / "missing", 5);
    EXPECT_THROW(f.get(), NotFound);
}

TEST_F(FileListerTest, async_outlives_lister) {
    fs::path fname = tmp_file("test.txt", numbered_lines(100));

    std::future<std::vector<std::string>> f;
    {
        ListerOptions options = make_options();
        options.buffer_size = 16;
        FileLister temp(options, gate);
        f = temp.get_last_lines_async(fname, 3);
    }
    EXPECT_THAT(f.get(), ElementsAre("Line 98", "Line 99", "Line 100"));
    EXPECT_EQ(gate.capacity(), gate.available());
}

TEST_F(FileListerTest, small_buffer_same_result) {
    ListerOptions options = make_options();
    options.buffer_size = 3;
    FileLister small(options, gate);

    fs::path fname = tmp_file("test.txt", "Line 1\nLine 2\r\nLine 3\rLine 4\n\n");
    EXPECT_EQ(lister.get_last_lines(fname, 4), small.get_last_lines(fname, 4));
    EXPECT_THAT(small.get_last_lines(fname, 4), ElementsAre("Line 2", "Line 3", "Line 4", ""));
}

TEST_F(FileListerTest, rejects_invalid_options) {
    ListerOptions options = make_options();
    options.buffer_size = 0;
    EXPECT_THROW(FileLister bad(options, gate), InvalidArgument);
}
