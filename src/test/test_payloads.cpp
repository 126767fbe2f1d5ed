#include <gtest/gtest.h>

#include <cmath>

#include "../attendance/submission_result.hpp"
#include "../postgres/utils.hpp"
#include "../utils/base64.hpp"
#include "../utils/date_utils.hpp"

TEST(Base64, DecodesPaddedAndUnpadded) {
    std::vector<uint8_t> hello = {'h', 'e', 'l', 'l', 'o'};
    EXPECT_EQ(Base64::decode("aGVsbG8="), hello);
    EXPECT_EQ(Base64::decode("aGVsbG8"), hello);
    EXPECT_EQ(Base64::decode("aGVs\nbG8="), hello);
}

TEST(Base64, StripsDataUrlPrefix) {
    EXPECT_EQ(Base64::decode("data:image/jpeg;base64,AAEC"), (std::vector<uint8_t>{0, 1, 2}));
}

TEST(Base64, RejectsMalformedInput) {
    EXPECT_TRUE(Base64::decode("").empty());
    EXPECT_TRUE(Base64::decode("aGV*bG8=").empty());
    EXPECT_TRUE(Base64::decode("aGVsb").empty());
    EXPECT_TRUE(Base64::decode("aGVsbG8==").empty());
}

TEST(PgVector, FormatsAndParses) {
    EXPECT_EQ(vec2pgvector({1.0f, -0.5f, 0.25f}), "[1,-0.5,0.25]");
    EXPECT_EQ(pgvector2vec("[1,-0.5,0.25]"), (std::vector<float>{1.0f, -0.5f, 0.25f}));
    EXPECT_TRUE(pgvector2vec("[]").empty());
}

TEST(PgVector, RejectsMalformedText) {
    EXPECT_THROW(pgvector2vec("1,2"), std::invalid_argument);
    EXPECT_THROW(pgvector2vec("[1,,2]"), std::invalid_argument);
    EXPECT_THROW(pgvector2vec("[1,2,]"), std::invalid_argument);
    EXPECT_THROW(pgvector2vec("[1,abc]"), std::invalid_argument);
    EXPECT_THROW(vec2pgvector({1.0f, std::nanf("")}), std::invalid_argument);
}

TEST(DateUtils, ValidatesIsoDates) {
    EXPECT_TRUE(isValidDate("2024-03-04"));
    EXPECT_TRUE(isValidDate(currentDate()));
    EXPECT_FALSE(isValidDate("2024-13-01"));
    EXPECT_FALSE(isValidDate("2024-3-4"));
    EXPECT_FALSE(isValidDate("04/03/2024"));
}

TEST(DateUtils, RejectsDaysPastMonthEnd) {
    EXPECT_TRUE(isValidDate("2024-02-29"));
    EXPECT_TRUE(isValidDate("2000-02-29"));
    EXPECT_TRUE(isValidDate("2023-12-31"));
    EXPECT_FALSE(isValidDate("2023-02-29"));
    EXPECT_FALSE(isValidDate("1900-02-29"));
    EXPECT_FALSE(isValidDate("2024-02-31"));
    EXPECT_FALSE(isValidDate("2023-04-31"));
    EXPECT_FALSE(isValidDate("2024-06-00"));
    EXPECT_FALSE(isValidDate("0000-01-01"));
}

TEST(SubmissionJson, FailureCarriesErrorAndRetryHint) {
    SubmissionResult result;
    result.class_id = "CS101";
    result.date = "2024-03-04";
    result.error = SubmissionError::RegistryUnavailable;
    result.retryable = true;

    nlohmann::json j = result;
    EXPECT_FALSE(j["success"].get<bool>());
    EXPECT_EQ(j["error"], "registry_unavailable");
    EXPECT_TRUE(j["retryable"].get<bool>());
    EXPECT_TRUE(j["recognized_students"].empty());
}

TEST(SubmissionJson, SuccessListsStudentsFacesAndRows) {
    SubmissionResult result;
    result.success = true;
    result.faces_detected = 2;
    result.faces_recognized = 1;
    result.faces_unrecognized = 1;
    result.recognized_students.push_back({"A", 0, 0.82f, true});
    result.unrecognized_faces.push_back(1);
    result.faces.push_back({0, BoundingBox{1, 2, 3, 4}, Recognized{"A", 0.82f}});
    result.faces.push_back({1, BoundingBox{5, 6, 7, 8}, Unrecognized{UnrecognizedReason::BelowThreshold}});
    AttendanceRecord row;
    row.identity_id = "A";
    row.status = AttendanceStatus::Present;
    row.method = AttendanceMethod::FaceMatch;
    row.confidence_score = 0.82f;
    result.attendance.push_back({row, WriteAction::Inserted});

    nlohmann::json j = result;
    EXPECT_FALSE(j.contains("error"));
    EXPECT_EQ(j["recognized_students"][0]["identity_id"], "A");
    EXPECT_EQ(j["unrecognized_faces"][0]["face_index"], 1);
    EXPECT_EQ(j["faces"][1]["reason"], "below_threshold");
    EXPECT_EQ(j["faces"][0]["bbox"]["width"], 3);
    EXPECT_EQ(j["attendance"][0]["method"], "face_match");
    EXPECT_EQ(j["attendance"][0]["action"], "inserted");
}
