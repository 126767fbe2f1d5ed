#include <gtest/gtest.h>

#include <cmath>
#include <set>

#include "test_helpers.hpp"
#include "../attendance/memory_store.hpp"
#include "../recognizer/attendance_engine.hpp"

namespace {

const int kFaceA = 10;
const int kFaceB = 50;
const int kFaceLow = 90;

SessionContext cs101() {
    SessionContext session;
    session.class_id = "CS101";
    session.date = "2024-03-04";
    session.threshold = 0.6f;
    session.marked_by = "kiosk-1";
    return session;
}

const AttendanceOutcome* outcomeFor(const SubmissionResult& result, const std::string& id) {
    for (const auto& a : result.attendance) {
        if (a.record.identity_id == id) {
            return &a;
        }
    }
    return nullptr;
}

}

class AttendanceEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        detector = std::make_shared<ScriptedDetector>();
        embedder = std::make_shared<ScriptedEmbedder>();
        registry = std::make_shared<ControlledRegistry>();
        store = std::make_shared<MemoryAttendanceStore>();

        registry->upsert("A", axisSignature(0));
        registry->upsert("B", axisSignature(1));
        registry->upsert("C", axisSignature(2));
        registry->upsert("D", axisSignature(3));
        for (const char* id : {"A", "B", "C", "D"}) {
            store->addToRoster("CS101", id);
        }

        // Three faces scoring 0.82 -> A, 0.65 -> B and 0.40 -> D.
        detector->setRegions({regionAt(kFaceLow), regionAt(kFaceA), regionAt(kFaceB)});
        embedder->set(kFaceA, towards(0, 0.82f, 7));
        embedder->set(kFaceB, towards(1, 0.65f, 6));
        embedder->set(kFaceLow, towards(3, 0.40f, 5));

        settings.match.threshold = 0.6f;
        settings.match.top_k = 5;
        settings.match.timeout = std::chrono::milliseconds(2000);
        settings.match.retries = 1;
        settings.match.backoff = std::chrono::milliseconds(1);
        settings.worker_threads = 2;
        settings.quality_check = false;
    }

    std::unique_ptr<AttendanceEngine> makeEngine() {
        return std::make_unique<AttendanceEngine>(detector, embedder, registry, store, settings);
    }

    std::shared_ptr<ScriptedDetector> detector;
    std::shared_ptr<ScriptedEmbedder> embedder;
    std::shared_ptr<ControlledRegistry> registry;
    std::shared_ptr<MemoryAttendanceStore> store;
    EngineSettings settings;
};

TEST_F(AttendanceEngineTest, RecognizesFacesAboveThreshold) {
    auto engine = makeEngine();
    SubmissionResult result = engine->submit(encodedImage(), cs101());

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.faces_detected, 3);
    EXPECT_EQ(result.faces_recognized, 2);
    EXPECT_EQ(result.faces_unrecognized, 1);

    ASSERT_EQ(result.recognized_students.size(), 2u);
    EXPECT_EQ(result.recognized_students[0].identity_id, "A");
    EXPECT_EQ(result.recognized_students[0].face_index, 0);
    EXPECT_NEAR(result.recognized_students[0].similarity_score, 0.82f, 1e-4);
    EXPECT_EQ(result.recognized_students[1].identity_id, "B");
    EXPECT_EQ(result.recognized_students[1].face_index, 1);
    EXPECT_NEAR(result.recognized_students[1].similarity_score, 0.65f, 1e-4);
    EXPECT_EQ(result.unrecognized_faces, (std::vector<int>{2}));

    ASSERT_EQ(result.faces.size(), 3u);
    EXPECT_EQ(result.faces[2].box.x, kFaceLow);
    EXPECT_EQ(std::get<Unrecognized>(result.faces[2].outcome).reason, UnrecognizedReason::BelowThreshold);

    ASSERT_EQ(result.attendance.size(), 4u);
    EXPECT_EQ(outcomeFor(result, "A")->record.status, AttendanceStatus::Present);
    EXPECT_EQ(outcomeFor(result, "A")->record.method, AttendanceMethod::FaceMatch);
    EXPECT_EQ(outcomeFor(result, "B")->record.status, AttendanceStatus::Present);
    EXPECT_EQ(outcomeFor(result, "C")->record.status, AttendanceStatus::Absent);
    EXPECT_EQ(outcomeFor(result, "D")->record.status, AttendanceStatus::Absent);
    EXPECT_EQ(outcomeFor(result, "D")->record.method, AttendanceMethod::Manual);
    for (const auto& a : result.attendance) {
        EXPECT_EQ(a.action, WriteAction::Inserted);
    }
    EXPECT_EQ(store->recordCount(), 4u);
}

TEST_F(AttendanceEngineTest, CountsAndScoresHoldInvariants) {
    auto engine = makeEngine();
    SessionContext session = cs101();
    session.threshold = 0.3f;
    SubmissionResult result = engine->submit(encodedImage(), session);

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.faces_recognized + result.faces_unrecognized, result.faces_detected);
    std::set<std::string> ids;
    std::set<int> indexes;
    for (const auto& s : result.recognized_students) {
        EXPECT_TRUE(ids.insert(s.identity_id).second);
        EXPECT_TRUE(indexes.insert(s.face_index).second);
        EXPECT_GE(s.similarity_score, session.threshold);
    }
    EXPECT_EQ(result.faces_recognized, 3);
}

TEST_F(AttendanceEngineTest, SecondSubmissionIsNoOp) {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->submit(encodedImage(), cs101()).success);
    SubmissionResult again = engine->submit(encodedImage(), cs101());

    ASSERT_TRUE(again.success);
    EXPECT_EQ(again.faces_recognized, 2);
    for (const auto& a : again.attendance) {
        EXPECT_EQ(a.action, WriteAction::Unchanged);
    }
    EXPECT_EQ(store->recordCount(), 4u);
    EXPECT_EQ(store->loadSession("CS101", "2024-03-04").size(), 4u);
}

TEST_F(AttendanceEngineTest, LaterRecognitionUpgradesAbsence) {
    auto engine = makeEngine();
    ASSERT_TRUE(engine->submit(encodedImage(), cs101()).success);

    // D walks in closer to the camera.
    embedder->set(kFaceLow, towards(3, 0.95f, 5));
    SubmissionResult result = engine->submit(encodedImage(), cs101());

    ASSERT_TRUE(result.success);
    const AttendanceOutcome* d = outcomeFor(result, "D");
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->action, WriteAction::Updated);
    EXPECT_EQ(d->record.status, AttendanceStatus::Present);
    ASSERT_TRUE(d->record.confidence_score.has_value());
    EXPECT_NEAR(*d->record.confidence_score, 0.95f, 1e-4);
    EXPECT_EQ(outcomeFor(result, "C")->action, WriteAction::Unchanged);
}

TEST_F(AttendanceEngineTest, ManualEntriesAreNotOverwritten) {
    AttendanceRecord late;
    late.class_id = "CS101";
    late.identity_id = "A";
    late.date = "2024-03-04";
    late.status = AttendanceStatus::Late;
    late.method = AttendanceMethod::Manual;
    late.marked_by = "teacher";
    store->putRecord(late);

    AttendanceRecord present = late;
    present.identity_id = "C";
    present.status = AttendanceStatus::Present;
    store->putRecord(present);

    auto engine = makeEngine();
    SubmissionResult result = engine->submit(encodedImage(), cs101());

    ASSERT_TRUE(result.success);
    EXPECT_EQ(outcomeFor(result, "A")->action, WriteAction::Unchanged);
    EXPECT_EQ(outcomeFor(result, "A")->record.status, AttendanceStatus::Late);
    EXPECT_EQ(outcomeFor(result, "C")->action, WriteAction::Unchanged);
    EXPECT_EQ(outcomeFor(result, "C")->record.status, AttendanceStatus::Present);
}

TEST_F(AttendanceEngineTest, SharedTopCandidateGoesToStrongerFace) {
    // Both faces look most like C; the weaker one also resembles B.
    Signature strong = towards(2, 0.90f, 7);
    Signature weak(kTestDim, 0.0f);
    weak[2] = 0.75f;
    weak[1] = 0.62f;
    weak[6] = std::sqrt(1.0f - 0.75f * 0.75f - 0.62f * 0.62f);
    detector->setRegions({regionAt(kFaceA), regionAt(kFaceB)});
    embedder->set(kFaceA, weak);
    embedder->set(kFaceB, strong);

    auto engine = makeEngine();
    SubmissionResult result = engine->submit(encodedImage(), cs101());

    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.recognized_students.size(), 2u);
    EXPECT_EQ(result.recognized_students[0].face_index, 0);
    EXPECT_EQ(result.recognized_students[0].identity_id, "B");
    EXPECT_EQ(result.recognized_students[1].face_index, 1);
    EXPECT_EQ(result.recognized_students[1].identity_id, "C");
}

TEST_F(AttendanceEngineTest, RegistryTimeoutFailsWholeSubmission) {
    registry->delay = std::chrono::milliseconds(200);
    settings.match.timeout = std::chrono::milliseconds(20);
    settings.match.retries = 1;

    auto engine = makeEngine();
    SubmissionResult result = engine->submit(encodedImage(), cs101());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, SubmissionError::RegistryUnavailable);
    EXPECT_TRUE(result.retryable);
    EXPECT_TRUE(result.recognized_students.empty());
    EXPECT_TRUE(result.attendance.empty());
    EXPECT_FALSE(result.message.empty());
    EXPECT_EQ(store->recordCount(), 0u);
}

TEST_F(AttendanceEngineTest, TransientRegistryFailureIsRetried) {
    registry->failures_left = 1;
    auto engine = makeEngine();
    SubmissionResult result = engine->submit(encodedImage(), cs101());

    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.faces_recognized, 2);
}

TEST_F(AttendanceEngineTest, StorageFailureWritesNothing) {
    store->failNextCommit();
    auto engine = makeEngine();
    SubmissionResult result = engine->submit(encodedImage(), cs101());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, SubmissionError::StorageFailure);
    EXPECT_TRUE(result.retryable);
    EXPECT_EQ(store->recordCount(), 0u);
}

TEST_F(AttendanceEngineTest, InvalidImageIsRejectedBeforeDetection) {
    detector->setFail(true);
    auto engine = makeEngine();

    SubmissionResult garbage = engine->submit({0x01, 0x02, 0x03}, cs101());
    EXPECT_FALSE(garbage.success);
    EXPECT_EQ(garbage.error, SubmissionError::InvalidImage);
    EXPECT_FALSE(garbage.retryable);

    SubmissionResult empty = engine->submit({}, cs101());
    EXPECT_EQ(empty.error, SubmissionError::InvalidImage);
    EXPECT_EQ(store->recordCount(), 0u);
}

TEST_F(AttendanceEngineTest, NoFacesIsNotAnError) {
    detector->setRegions({});
    auto engine = makeEngine();
    SubmissionResult result = engine->submit(encodedImage(), cs101());

    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.faces_detected, 0);
    EXPECT_EQ(result.faces_recognized, 0);
    EXPECT_TRUE(result.attendance.empty());
    EXPECT_EQ(store->recordCount(), 0u);
}

TEST_F(AttendanceEngineTest, EmbeddingFailureDegradesOneFace) {
    detector->setRegions({regionAt(kFaceA), regionAt(kFaceB), regionAt(120)});
    auto engine = makeEngine();
    SubmissionResult result = engine->submit(encodedImage(160, 64), cs101());

    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.faces_detected, 3);
    EXPECT_EQ(result.faces_recognized, 2);
    EXPECT_EQ(result.unrecognized_faces, (std::vector<int>{2}));
    EXPECT_EQ(std::get<Unrecognized>(result.faces[2].outcome).reason, UnrecognizedReason::ProcessingFailed);
}

TEST_F(AttendanceEngineTest, RecognizedOutsiderIsReportedButNotRecorded) {
    registry->upsert("VISITOR", axisSignature(4));
    embedder->set(kFaceLow, axisSignature(4));

    auto engine = makeEngine();
    SubmissionResult result = engine->submit(encodedImage(), cs101());

    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.recognized_students.size(), 3u);
    EXPECT_EQ(result.recognized_students[2].identity_id, "VISITOR");
    EXPECT_FALSE(result.recognized_students[2].on_roster);
    EXPECT_TRUE(result.recognized_students[0].on_roster);
    EXPECT_EQ(outcomeFor(result, "VISITOR"), nullptr);
    EXPECT_EQ(store->recordCount(), 4u);
}

TEST_F(AttendanceEngineTest, EnrollThenMatch) {
    detector->setRegions({regionAt(kFaceA)});
    Signature fresh = towards(5, 0.99f, 7);
    embedder->set(kFaceA, fresh);
    store->addToRoster("CS101", "E");

    auto engine = makeEngine();
    EnrollmentResult enrolled = engine->enroll("E", encodedImage());
    ASSERT_TRUE(enrolled.success) << enrolled.message;
    EXPECT_FALSE(enrolled.replaced);

    SubmissionResult result = engine->submit(encodedImage(), cs101());
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.recognized_students.size(), 1u);
    EXPECT_EQ(result.recognized_students[0].identity_id, "E");
    EXPECT_NEAR(result.recognized_students[0].similarity_score, 1.0f, 1e-4);
    EXPECT_EQ(outcomeFor(result, "E")->record.status, AttendanceStatus::Present);

    EnrollmentResult again = engine->enroll("E", encodedImage());
    EXPECT_TRUE(again.success);
    EXPECT_TRUE(again.replaced);
}

TEST_F(AttendanceEngineTest, EnrollmentFailures) {
    auto engine = makeEngine();

    detector->setRegions({});
    EXPECT_EQ(engine->enroll("E", encodedImage()).error, "no_face");

    detector->setRegions({regionAt(kFaceA), regionAt(kFaceB)});
    EXPECT_EQ(engine->enroll("E", encodedImage()).error, "multiple_faces");

    detector->setRegions({regionAt(30)});
    EXPECT_EQ(engine->enroll("E", encodedImage()).error, "embedding_failed");

    EXPECT_EQ(engine->enroll("E", {0x00}).error, "invalid_image");
    EXPECT_EQ(registry->size(), 4u);
}

TEST_F(AttendanceEngineTest, EnrollmentReportsDetectorErrors) {
    auto engine = makeEngine();
    detector->setFail(true);

    EnrollmentResult result;
    EXPECT_NO_THROW(result = engine->enroll("E", encodedImage()));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "invalid_image");
    EXPECT_NE(result.message.find("detector exploded"), std::string::npos);
    EXPECT_EQ(registry->size(), 4u);
}

TEST_F(AttendanceEngineTest, RejectsThresholdOutsideUnitInterval) {
    auto engine = makeEngine();
    SessionContext session = cs101();

    session.threshold = std::nanf("");
    EXPECT_THROW(engine->submit(encodedImage(), session), std::invalid_argument);
    session.threshold = 1.5f;
    EXPECT_THROW(engine->submit(encodedImage(), session), std::invalid_argument);
    EXPECT_EQ(store->recordCount(), 0u);
}

TEST_F(AttendanceEngineTest, EnrollmentRejectsPoorQualityCrop) {
    settings.quality_check = true;
    detector->setRegions({regionAt(kFaceA, 8, 30)});
    auto engine = makeEngine();

    EnrollmentResult result = engine->enroll("E", encodedImage());
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "poor_quality");
    EXPECT_NE(result.message.find("size"), std::string::npos);
}

TEST_F(AttendanceEngineTest, RemoveEnrollmentStopsMatching) {
    auto engine = makeEngine();
    EXPECT_TRUE(engine->removeEnrollment("A"));
    EXPECT_FALSE(engine->removeEnrollment("A"));

    SubmissionResult result = engine->submit(encodedImage(), cs101());
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.faces_recognized, 1);
    EXPECT_EQ(std::get<Unrecognized>(result.faces[0].outcome).reason, UnrecognizedReason::BelowThreshold);
}

TEST_F(AttendanceEngineTest, RejectsMismatchedDimensions) {
    embedder = std::make_shared<ScriptedEmbedder>(kTestDim + 1);
    EXPECT_THROW(makeEngine(), std::invalid_argument);
}
