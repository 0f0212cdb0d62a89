#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "pose_loader.hpp"

class PoseLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "strokecoach_loader_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::filesystem::path test_dir;
};

TEST_F(PoseLoaderTest, ParsesFramesAndJoints) {
    const std::string doc = R"([
      {"frameId": 12, "timestamp": 0.4,
       "primitives": {"people": [
         {"pose": {"rightWrist": {"x": 310.5, "y": 280.0},
                   "rightHip":   {"x": 300.0, "y": 350.0}}},
         {"pose": {"rightWrist": {"x": 1.0, "y": 1.0}}}
       ]}}
    ])";

    auto frames = parse_frames_text(doc);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].frame_id, 12);
    EXPECT_DOUBLE_EQ(frames[0].timestamp, 0.4);

    // Only the first person is kept
    ASSERT_EQ(frames[0].people.size(), 1u);
    auto wrist = frames[0].first_person()->joint(kRightWrist);
    ASSERT_TRUE(wrist.has_value());
    EXPECT_DOUBLE_EQ(wrist->x, 310.5);
    EXPECT_DOUBLE_EQ(wrist->y, 280.0);
}

TEST_F(PoseLoaderTest, MissingFieldsDefault) {
    const std::string doc = R"([
      {"primitives": {"people": [{"pose": {"rightHip": {"x": 300.0}}}]}},
      {"frameId": 7}
    ])";

    auto frames = parse_frames_text(doc);
    ASSERT_EQ(frames.size(), 2u);

    // frameId falls back to the position in the document
    EXPECT_EQ(frames[0].frame_id, 0);
    EXPECT_DOUBLE_EQ(frames[0].timestamp, 0.0);

    // Missing coordinate reads as undetected
    auto hip = frames[0].first_person()->joint(kRightHip);
    ASSERT_TRUE(hip.has_value());
    EXPECT_DOUBLE_EQ(hip->y, 0.0);

    EXPECT_EQ(frames[1].frame_id, 7);
    EXPECT_TRUE(frames[1].people.empty());
}

TEST_F(PoseLoaderTest, FramesWithoutDetections) {
    const std::string doc = R"([
      {"frameId": 1, "primitives": {"people": []}},
      {"frameId": 2, "primitives": {}},
      {"frameId": 3, "primitives": {"people": [{"bbox": [1, 2, 3, 4]}]}},
      42,
      null
    ])";

    auto frames = parse_frames_text(doc);
    ASSERT_EQ(frames.size(), 5u);
    for (const auto& f : frames) {
        EXPECT_EQ(f.first_person(), nullptr);
    }
    EXPECT_EQ(frames[2].frame_id, 3);
    // Non-object elements keep their position as the identifier
    EXPECT_EQ(frames[4].frame_id, 4);
}

TEST_F(PoseLoaderTest, NonJointEntriesSkipped) {
    const std::string doc = R"([
      {"primitives": {"people": [{"pose": {"score": 0.9, "rightWrist": {"x": 5, "y": 6}}}]}}
    ])";

    auto frames = parse_frames_text(doc);
    ASSERT_EQ(frames.size(), 1u);
    const Pose* p = frames[0].first_person();
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->joints.size(), 1u);
    EXPECT_FALSE(p->joint("score").has_value());
}

TEST_F(PoseLoaderTest, EmptyArray) {
    EXPECT_TRUE(parse_frames_text("[]").empty());
}

TEST_F(PoseLoaderTest, MalformedJsonThrows) {
    EXPECT_THROW(parse_frames_text("[{\"frameId\": 1,"), PoseParseError);
    EXPECT_THROW(parse_frames_text("not json at all"), PoseParseError);
    EXPECT_THROW(parse_frames_text(""), PoseParseError);
}

TEST_F(PoseLoaderTest, NumberOverflowThrows) {
    // A literal past the double range is rejected by the parser itself
    EXPECT_THROW(parse_frames_text(R"([{"frameId": 1, "timestamp": 1e400}])"), PoseParseError);
    EXPECT_THROW(parse_frames_text(R"([{"primitives": {"people": [{"pose":
                   {"rightWrist": {"x": -1e999, "y": 2}}}]}}])"),
                 PoseParseError);

    const auto path = test_dir / "overflow.json";
    std::ofstream file(path);
    file << R"([{"timestamp": 1e400}])";
    file.close();
    EXPECT_THROW(load_frames_file(path), PoseParseError);
}

TEST_F(PoseLoaderTest, UnrepresentableFrameIdKeepsPosition) {
    const std::string doc = R"([
      {"frameId": 1e300},
      {"frameId": -1e300},
      {"frameId": 2.5},
      {"frameId": 18446744073709551615},
      {"frameId": 40.0},
      {"frameId": -3}
    ])";

    auto frames = parse_frames_text(doc);
    ASSERT_EQ(frames.size(), 6u);
    EXPECT_EQ(frames[0].frame_id, 0);
    EXPECT_EQ(frames[1].frame_id, 1);
    EXPECT_EQ(frames[2].frame_id, 2);
    EXPECT_EQ(frames[3].frame_id, 3);
    // Whole numbers written as doubles still count
    EXPECT_EQ(frames[4].frame_id, 40);
    EXPECT_EQ(frames[5].frame_id, -3);
}

TEST_F(PoseLoaderTest, NonArrayDocumentThrows) {
    EXPECT_THROW(parse_frames_text("{\"frames\": []}"), PoseParseError);
    EXPECT_THROW(parse_frames_text("12"), PoseParseError);
}

TEST_F(PoseLoaderTest, LoadFromFile) {
    const auto path = test_dir / "recording.json";
    std::ofstream file(path);
    file << R"([{"frameId": 5, "primitives": {"people": [{"pose": {"leftAnkle": {"x": 3, "y": 4}}}]}}])";
    file.close();

    auto frames = load_frames_file(path);
    ASSERT_EQ(frames.size(), 1u);
    EXPECT_EQ(frames[0].frame_id, 5);
}

TEST_F(PoseLoaderTest, MissingFileThrows) {
    EXPECT_THROW(load_frames_file(test_dir / "does_not_exist.json"), PoseParseError);
}
