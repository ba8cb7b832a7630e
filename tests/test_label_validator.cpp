#include <string>

#include <gtest/gtest.h>

#include "posecheck/LabelValidator.hpp"
#include "TempDataset.hpp"

namespace posecheck {
namespace {

const LabelLocation kWhere{"train", "test.txt", 1};

const std::string kPoseLine = "0 0.5 0.5 0.3 0.2 0.4 0.4 1 0.6 0.4 1 0.6 0.6 1 0.4 0.6 1";

IssueSet issuesOf(const std::string& line, int num_classes = 1) {
    return validateLabelLine(line, num_classes, kWhere).issues;
}

} // namespace

TEST(LabelLineTest, ValidBoxOnlyLine) {
    const auto result = validateLabelLine("0 0.5 0.5 0.3 0.2", 1, kWhere);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_TRUE(result.diagnostics.empty());
    ASSERT_TRUE(result.box.has_value());
    EXPECT_DOUBLE_EQ(result.box->size.x(), 0.3);
    EXPECT_FALSE(result.isPose());
}

TEST(LabelLineTest, ValidPoseLine) {
    const auto result = validateLabelLine(kPoseLine, 1, kWhere);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_TRUE(result.isPose());
    ASSERT_TRUE(result.keypoints.has_value());
    EXPECT_DOUBLE_EQ((*result.keypoints)(1, 0), 0.6);
    EXPECT_DOUBLE_EQ((*result.keypoints)(3, 1), 0.6);
}

TEST(LabelLineTest, WrongFieldCountIsOnlyAFormatError) {
    for (const std::string line : {"0 0.5 0.5 0.3", "0 0.5 0.5 0.3 0.2 0.1", "x", "7 7 7 7 7 7 7 7 7 7 7 7 7 7 7 7 7 7"}) {
        const auto result = validateLabelLine(line, 1, kWhere);
        EXPECT_EQ(result.issues, IssueSet{IssueKind::Format}) << line;
        EXPECT_EQ(result.diagnostics.errors.size(), 1u) << line;
        EXPECT_TRUE(result.diagnostics.warnings.empty()) << line;
    }
}

TEST(LabelLineTest, FormatErrorMessageCarriesLocation) {
    const auto result = validateLabelLine("0 0.5 0.5 0.3", 1, LabelLocation{"val", "img7.txt", 3});
    ASSERT_EQ(result.diagnostics.errors.size(), 1u);
    const auto& error = result.diagnostics.errors.front();
    EXPECT_EQ(error.message, "val/img7.txt:3 - Invalid format: expected 5 (bbox) or 17 (bbox+pose) values, got 4");
    EXPECT_EQ(error.split, "val");
    EXPECT_EQ(error.file, "img7.txt");
    EXPECT_EQ(error.line, 3u);
}

TEST(LabelLineTest, ClassIdOutOfRange) {
    EXPECT_EQ(issuesOf("5 0.5 0.5 0.3 0.2"), IssueSet{IssueKind::Class});
    EXPECT_EQ(issuesOf("1 0.5 0.5 0.3 0.2"), IssueSet{IssueKind::Class});
    EXPECT_EQ(issuesOf("-1 0.5 0.5 0.3 0.2"), IssueSet{IssueKind::Class});
    EXPECT_TRUE(issuesOf("2 0.5 0.5 0.3 0.2", 3).empty());
    EXPECT_EQ(issuesOf("3 0.5 0.5 0.3 0.2", 3), IssueSet{IssueKind::Class});
}

TEST(LabelLineTest, ClassIdMustBeInteger) {
    const auto result = validateLabelLine("0.0 0.5 0.5 0.3 0.2", 1, kWhere);
    EXPECT_EQ(result.issues, IssueSet{IssueKind::Class});
    ASSERT_EQ(result.diagnostics.errors.size(), 1u);
    EXPECT_NE(result.diagnostics.errors[0].message.find("Class ID must be integer, got: 0.0"), std::string::npos);
}

TEST(LabelLineTest, BboxCenterOutOfRange) {
    EXPECT_EQ(issuesOf("0 1.5 0.5 0.3 0.2"), IssueSet{IssueKind::BboxCenter});
    EXPECT_EQ(issuesOf("0 0.5 -0.01 0.3 0.2"), IssueSet{IssueKind::BboxCenter});
    EXPECT_TRUE(issuesOf("0 0 1 0.3 0.2").empty());
}

TEST(LabelLineTest, BboxSizeInvalid) {
    EXPECT_EQ(issuesOf("0 0.5 0.5 0 0.2"), IssueSet{IssueKind::BboxSize});
    EXPECT_EQ(issuesOf("0 0.5 0.5 0.3 1.2"), IssueSet{IssueKind::BboxSize});
    EXPECT_EQ(issuesOf("0 0.5 0.5 -0.3 0.2"), IssueSet{IssueKind::BboxSize});
    EXPECT_TRUE(issuesOf("0 0.5 0.5 1 1").empty());
}

TEST(LabelLineTest, BboxParseFailureStillChecksKeypoints) {
    const auto box_only = validateLabelLine("0 0.5 abc 0.3 0.2", 1, kWhere);
    EXPECT_EQ(box_only.issues, IssueSet{IssueKind::BboxParse});
    EXPECT_FALSE(box_only.box.has_value());

    const auto pose = validateLabelLine("0 0.5 0.5a 0.3 0.2 0.4 1.5 1 0.6 0.4 1 0.6 0.6 1 0.4 0.6 1", 1, kWhere);
    EXPECT_EQ(pose.issues, (IssueSet{IssueKind::BboxParse, IssueKind::KptCoords}));
}

TEST(LabelLineTest, HexFieldsAreNotDecimal) {
    EXPECT_EQ(issuesOf("0 0x1p-1 0.5 0.3 0.2"), IssueSet{IssueKind::BboxParse});
    EXPECT_EQ(issuesOf("0 0.5 0.5 0.3 0.2 0X0.8p0 0.4 1 0.6 0.4 1 0.6 0.6 1 0.4 0.6 1"),
              IssueSet{IssueKind::KptParse});
    EXPECT_EQ(issuesOf("0x0 0.5 0.5 0.3 0.2"), IssueSet{IssueKind::Class});
}

TEST(LabelLineTest, NonFiniteValuesFailRangeChecks) {
    const auto center = validateLabelLine("0 nan 0.5 0.3 0.2", 1, kWhere);
    EXPECT_EQ(center.issues, IssueSet{IssueKind::BboxCenter});
    EXPECT_TRUE(center.box.has_value());

    EXPECT_EQ(issuesOf("0 0.5 0.5 inf 0.2"), IssueSet{IssueKind::BboxSize});
    EXPECT_EQ(issuesOf("0 0.5 0.5 0.3 NaN"), IssueSet{IssueKind::BboxSize});
    EXPECT_EQ(issuesOf("0 0.5 0.5 0.3 0.2 0.4 nan 1 0.6 0.4 1 0.6 0.6 1 0.4 0.6 1"),
              IssueSet{IssueKind::KptCoords});
    EXPECT_EQ(issuesOf("0 0.5 0.5 0.3 0.2 0.4 0.4 nan 0.6 0.4 1 0.6 0.6 1 0.4 0.6 1"),
              IssueSet{IssueKind::KptVisibility});
}

TEST(LabelLineTest, EveryIssueOnALineIsRecorded) {
    const auto result = validateLabelLine("9 1.5 0.5 0 0.2", 1, kWhere);
    EXPECT_EQ(result.issues, (IssueSet{IssueKind::Class, IssueKind::BboxCenter, IssueKind::BboxSize}));
    EXPECT_EQ(result.diagnostics.errors.size(), 3u);
}

TEST(LabelLineTest, KeypointOutOfRange) {
    const auto result = validateLabelLine("0 0.5 0.5 0.3 0.2 0.4 1.5 1 0.6 0.4 1 0.6 0.6 1 0.4 0.6 1", 1, kWhere);
    EXPECT_EQ(result.issues, IssueSet{IssueKind::KptCoords});
    ASSERT_EQ(result.diagnostics.errors.size(), 1u);
    EXPECT_NE(result.diagnostics.errors[0].message.find("Keypoint 0 out of range: (0.400, 1.500)"),
              std::string::npos);
}

TEST(LabelLineTest, VisibilityMustBeZeroOrOne) {
    EXPECT_EQ(issuesOf("0 0.5 0.5 0.3 0.2 0.4 0.4 0.5 0.6 0.4 1 0.6 0.6 1 0.4 0.6 1"),
              IssueSet{IssueKind::KptVisibility});
    EXPECT_EQ(issuesOf("0 0.5 0.5 0.3 0.2 0.4 0.4 2 0.6 0.4 1 0.6 0.6 1 0.4 0.6 1"),
              IssueSet{IssueKind::KptVisibility});
    EXPECT_TRUE(issuesOf("0 0.5 0.5 0.3 0.2 0.4 0.4 0.0 0.6 0.4 1.0 0.6 0.6 0 0.4 0.6 1").empty());
}

TEST(LabelLineTest, KeypointParseFailure) {
    const auto result = validateLabelLine("0 0.5 0.5 0.3 0.2 0.4 0.4 1 0.6 oops 1 0.6 0.6 1 0.4 0.6 1", 1, kWhere);
    EXPECT_EQ(result.issues, IssueSet{IssueKind::KptParse});
    EXPECT_FALSE(result.keypoints.has_value());
}

TEST(LabelLineTest, SwappedTopCornersWarnOnly) {
    const auto result = validateLabelLine("0 0.5 0.5 0.3 0.2 0.6 0.4 1 0.4 0.4 1 0.6 0.6 1 0.4 0.6 1", 1, kWhere);
    EXPECT_EQ(result.issues, IssueSet{IssueKind::KptOrder});
    EXPECT_TRUE(result.diagnostics.errors.empty());
    ASSERT_EQ(result.diagnostics.warnings.size(), 1u);
    EXPECT_EQ(result.diagnostics.warnings[0].kind, IssueKind::KptOrder);
}

TEST(LabelFileTest, EmptyFileIsValid) {
    TempDataset dataset;
    const auto path = dataset.write("labels/train/empty.txt", "");

    const auto result = validateLabelFile(path, 1, "train");
    EXPECT_TRUE(result.valid());
    EXPECT_EQ(result.instance_count, 0u);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST(LabelFileTest, BlankLinesAreSkippedAndLinesNumberedPhysically) {
    TempDataset dataset;
    const auto path = dataset.write("labels/train/a.txt", "\n0 0.2 0.2 0.1 0.1\n   \n0 0.5 0.5 0.3\n");

    const auto result = validateLabelFile(path, 1, "train");
    EXPECT_EQ(result.issues, IssueSet{IssueKind::Format});
    EXPECT_EQ(result.instance_count, 2u);
    ASSERT_EQ(result.diagnostics.errors.size(), 1u);
    EXPECT_EQ(result.diagnostics.errors[0].line, 4u);
}

TEST(LabelFileTest, CountsPoseInstances) {
    TempDataset dataset;
    const auto path = dataset.write("labels/train/a.txt", "0 0.2 0.2 0.1 0.1\n" + kPoseLine + "\n");

    const auto result = validateLabelFile(path, 1, "train");
    EXPECT_TRUE(result.valid());
    EXPECT_EQ(result.instance_count, 2u);
    EXPECT_EQ(result.pose_count, 1u);
}

TEST(LabelFileTest, UnreadableFileIsReadError) {
    TempDataset dataset;
    const auto result = validateLabelFile(dataset.root() / "labels/train/absent.txt", 1, "train");
    EXPECT_EQ(result.issues, IssueSet{IssueKind::ReadError});
    ASSERT_EQ(result.diagnostics.errors.size(), 1u);
    EXPECT_NE(result.diagnostics.errors[0].message.find("train/absent.txt: Failed to read file"), std::string::npos);
}

TEST(LabelFileTest, HighOverlapIsWarning) {
    TempDataset dataset;
    const auto path = dataset.write("labels/train/stack.txt", "0 0.5 0.5 0.2 0.2\n0 0.52 0.52 0.2 0.2\n");

    const auto result = validateLabelFile(path, 1, "train");
    EXPECT_EQ(result.issues, IssueSet{IssueKind::Overlap});
    EXPECT_TRUE(result.diagnostics.errors.empty());
    ASSERT_EQ(result.diagnostics.warnings.size(), 1u);
    EXPECT_EQ(result.diagnostics.warnings[0].message,
              "train/stack.txt - High overlap (68%) between instances 1 and 2 - verify not duplicate");
}

TEST(LabelFileTest, UnparsableBoxesAreLeftOutOfOverlapScan) {
    TempDataset dataset;
    const auto path = dataset.write("labels/train/a.txt",
                                    "0 0.5 0.5 0.2 0.2\n0 bad 0.5 0.2 0.2\n0 0.52 0.52 0.2 0.2\n");

    const auto result = validateLabelFile(path, 1, "train");
    EXPECT_EQ(result.issues, (IssueSet{IssueKind::BboxParse, IssueKind::Overlap}));
    ASSERT_EQ(result.diagnostics.warnings.size(), 1u);
    EXPECT_NE(result.diagnostics.warnings[0].message.find("instances 1 and 2"), std::string::npos);
}

TEST(LabelFileTest, OverlapThresholdIsConfigurable) {
    TempDataset dataset;
    const auto path = dataset.write("labels/train/a.txt", "0 0.5 0.5 0.2 0.2\n0 0.52 0.52 0.2 0.2\n");

    EXPECT_TRUE(validateLabelFile(path, 1, "train", 0.9).valid());
}

} // namespace posecheck
