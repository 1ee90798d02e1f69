#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <glib.h>

#include "record_config.hpp"

namespace {

bool parse(std::vector<std::string> args, RecordConfig& config, std::string& error) {
    args.insert(args.begin(), "smart_record");
    std::vector<char*> argv;
    for (std::string& a : args) argv.push_back(&a[0]);
    argv.push_back(nullptr);
    return parseRecordConfig(static_cast<int>(args.size()), argv.data(), config, error);
}

TEST(RecordConfigTest, DefaultsAreValid) {
    RecordConfig config = defaultRecordConfig();
    EXPECT_EQ(config.validate(), "");
    EXPECT_EQ(config.preRollSec, 3);
    EXPECT_EQ(config.postRollSec, 5);
    EXPECT_EQ(config.cacheSec, 30);
    EXPECT_EQ(config.watchdogSec, 6);
    EXPECT_NE(config.recordDir.find("SmartRecTest"), std::string::npos);
}

TEST(RecordConfigTest, StopDelayIsStartPlusPostRollPlusOne) {
    RecordConfig config = defaultRecordConfig();
    config.startDelaySec = 5;
    config.postRollSec = 5;
    EXPECT_EQ(config.stopDelaySec(), 11);
}

TEST(RecordConfigTest, ParsesOverrides) {
    RecordConfig config = defaultRecordConfig();
    std::string error;
    ASSERT_TRUE(parse({"--uri", "file:///tmp/clip.mp4", "--pre-roll=10", "--post-roll", "7",
                       "--record-dir=/tmp/sr", "--prefix", "cam_", "--live-source", "--no-file-loop",
                       "--session-id", "42", "--session-name", "lobby"},
                      config, error))
        << error;

    EXPECT_EQ(config.uri, "file:///tmp/clip.mp4");
    EXPECT_EQ(config.preRollSec, 10);
    EXPECT_EQ(config.postRollSec, 7);
    EXPECT_EQ(config.recordDir, "/tmp/sr");
    EXPECT_EQ(config.filePrefix, "cam_");
    EXPECT_TRUE(config.liveSource);
    EXPECT_FALSE(config.fileLoop);
    EXPECT_EQ(config.sessionId, 42);
    EXPECT_EQ(config.sessionName, "lobby");
}

TEST(RecordConfigTest, UnknownOptionFails) {
    RecordConfig config = defaultRecordConfig();
    std::string error;
    EXPECT_FALSE(parse({"--bogus"}, config, error));
    EXPECT_FALSE(error.empty());
}

TEST(RecordConfigTest, MalformedNumberFails) {
    RecordConfig config = defaultRecordConfig();
    std::string error;
    EXPECT_FALSE(parse({"--cache=lots"}, config, error));
    EXPECT_FALSE(error.empty());
}

TEST(RecordConfigTest, PositionalArgumentFails) {
    RecordConfig config = defaultRecordConfig();
    std::string error;
    EXPECT_FALSE(parse({"rtsp://cam"}, config, error));
    EXPECT_NE(error.find("rtsp://cam"), std::string::npos);
}

TEST(RecordConfigTest, PostRollAboveLimitIsRejected) {
    RecordConfig config = defaultRecordConfig();
    config.postRollLimitSec = 60;
    config.postRollSec = 60;
    EXPECT_EQ(config.validate(), "");
    config.postRollSec = 61;
    EXPECT_NE(config.validate().find("exceeds limit"), std::string::npos);
}

TEST(RecordConfigTest, SessionNameMustFitNativeField) {
    RecordConfig config = defaultRecordConfig();
    config.sessionName = std::string(31, 'n');
    EXPECT_EQ(config.validate(), "");
    config.sessionName = std::string(32, 'n');
    EXPECT_FALSE(config.validate().empty());
}

TEST(RecordConfigTest, RejectsNonsenseValues) {
    RecordConfig config = defaultRecordConfig();
    config.cacheSec = 0;
    EXPECT_FALSE(config.validate().empty());

    config = defaultRecordConfig();
    config.preRollSec = -1;
    EXPECT_FALSE(config.validate().empty());

    config = defaultRecordConfig();
    config.uri.clear();
    EXPECT_FALSE(config.validate().empty());

    config = defaultRecordConfig();
    config.height = 0;
    EXPECT_FALSE(config.validate().empty());
}

TEST(RecordConfigTest, EnsureRecordDirCreatesParents) {
    GError* err = nullptr;
    gchar* root = g_dir_make_tmp("smartrec_cfg_XXXXXX", &err);
    ASSERT_NE(root, nullptr) << (err ? err->message : "");

    RecordConfig config = defaultRecordConfig();
    gchar* nested = g_build_filename(root, "a", "b", "c", nullptr);
    config.recordDir = nested;

    std::string error;
    EXPECT_TRUE(ensureRecordDir(config, error)) << error;
    EXPECT_TRUE(g_file_test(nested, G_FILE_TEST_IS_DIR));
    // already there is fine
    EXPECT_TRUE(ensureRecordDir(config, error)) << error;

    g_free(nested);
    g_free(root);
}

}  // namespace
