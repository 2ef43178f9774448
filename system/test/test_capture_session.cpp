#include "database/attendance_database.hpp"
#include "recognition/descriptor_gallery.hpp"
#include "recognition/matcher.hpp"
#include "services/attendance_recorder.hpp"
#include "services/capture_session.hpp"
#include "services/enrollment_service.hpp"
#include "services/report_reader.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using test_support::FakeFaceAnalyzer;
using test_support::TempDir;
using test_support::make_descriptor;
using test_support::make_png_bytes;

namespace {

class CaptureTest : public ::testing::Test {
protected:
    TempDir dir;
    AttendanceDatabase db{dir.file("att.db")};
    DescriptorGallery gallery;
    FakeFaceAnalyzer analyzer;
    FaceMatcher matcher{0.6};
    ReportReader reports{db};

    Descriptor ana = make_descriptor(0.1);
    Descriptor luis = make_descriptor(0.1, 3.0);

    void SetUp() override {
        EnrollmentService enrollment(db, gallery, analyzer);

        analyzer.set_descriptors({ana});
        ASSERT_TRUE(enrollment.add_identity({"Ana", 30, "Nurse", "ana.png"}, make_png_bytes()).ok);
        analyzer.set_descriptors({luis});
        ASSERT_TRUE(enrollment.add_identity({"Luis", 41, "Driver", "luis.png"}, make_png_bytes()).ok);
        ASSERT_EQ(gallery.size(), 2u);
    }

    cv::Mat frame() const {
        return cv::Mat(120, 160, CV_8UC3, cv::Scalar(10, 10, 10));
    }
};

} // namespace

TEST_F(CaptureTest, RecognizedFacesAreRecordedUnknownIsNot) {
    AttendanceRecorder recorder(db);
    CaptureSession session(analyzer, gallery, matcher, recorder, reports);
    analyzer.set_descriptors({make_descriptor(0.1, 0.2), make_descriptor(5.0), luis});

    cv::Mat image = frame();
    CaptureReport report = session.process_frame(image);

    ASSERT_TRUE(report.ok);
    ASSERT_EQ(report.faces.size(), 3u);
    EXPECT_EQ(report.recognized_count(), 2u);

    EXPECT_EQ(report.faces[0].match.name, "Ana");
    EXPECT_TRUE(report.faces[0].attendance_recorded);
    ASSERT_TRUE(report.faces[0].staff.has_value());
    EXPECT_EQ(report.faces[0].staff->position, "Nurse");

    EXPECT_EQ(report.faces[1].match.name, Config::UNKNOWN_NAME);
    EXPECT_FALSE(report.faces[1].attendance_recorded);
    EXPECT_FALSE(report.faces[1].staff.has_value());

    EXPECT_EQ(report.faces[2].match.name, "Luis");
    EXPECT_EQ(db.count_attendance(), 2);
}

TEST_F(CaptureTest, SamePersonTwiceInOneFrameIsRecordedOnce) {
    AttendanceRecorder recorder(db);
    CaptureSession session(analyzer, gallery, matcher, recorder, reports);
    analyzer.set_descriptors({ana, make_descriptor(0.1, 0.1)});

    cv::Mat image = frame();
    CaptureReport report = session.process_frame(image, false);

    ASSERT_EQ(report.faces.size(), 2u);
    EXPECT_TRUE(report.faces[0].attendance_recorded);
    EXPECT_TRUE(report.faces[1].repeated_in_capture);
    EXPECT_FALSE(report.faces[1].attendance_recorded);
    EXPECT_EQ(db.count_attendance(), 1);
}

TEST_F(CaptureTest, OncePerDayAcrossCaptures) {
    AttendanceRecorder recorder(db, DuplicatePolicy::OncePerDay);
    CaptureSession session(analyzer, gallery, matcher, recorder, reports);
    analyzer.set_descriptors({ana});

    cv::Mat first = frame();
    cv::Mat second = frame();
    CaptureReport a = session.process_frame(first);
    CaptureReport b = session.process_frame(second);

    EXPECT_TRUE(a.faces[0].attendance_recorded);
    EXPECT_TRUE(b.faces[0].already_recorded);
    EXPECT_EQ(db.count_attendance(), 1);
}

TEST_F(CaptureTest, AnnotationDrawsOnFrame) {
    AttendanceRecorder recorder(db);
    CaptureSession session(analyzer, gallery, matcher, recorder, reports);
    analyzer.set_descriptors({ana});

    cv::Mat image = frame();
    cv::Mat original = image.clone();
    session.process_frame(image, true);

    EXPECT_GT(cv::norm(image, original, cv::NORM_L1), 0.0);
}

TEST_F(CaptureTest, ImageBytes) {
    AttendanceRecorder recorder(db);
    CaptureSession session(analyzer, gallery, matcher, recorder, reports);
    analyzer.set_descriptors({luis});

    cv::Mat annotated;
    CaptureReport ok = session.process_image_bytes(make_png_bytes(), annotated);
    EXPECT_TRUE(ok.ok);
    EXPECT_FALSE(annotated.empty());
    EXPECT_EQ(ok.recognized_count(), 1u);

    CaptureReport bad = session.process_image_bytes({1, 2, 3}, annotated);
    EXPECT_FALSE(bad.ok);
    EXPECT_EQ(bad.error, AttendanceError::InvalidImage);
}

TEST(FaceAnalyzerTest, RegionsAndDescriptorsFollowDetectionOrder) {
    FakeFaceAnalyzer analyzer;
    analyzer.set_descriptors({make_descriptor(0.1), make_descriptor(0.2)});
    cv::Mat image(40, 60, CV_8UC3, cv::Scalar(0, 0, 0));

    auto regions = analyzer.detect_face_regions(image);
    auto descriptors = analyzer.detect_descriptors(image);

    ASSERT_EQ(regions.size(), 2u);
    EXPECT_EQ(regions[0], cv::Rect(0, 0, 16, 16));
    EXPECT_EQ(regions[1], cv::Rect(20, 0, 16, 16));
    ASSERT_EQ(descriptors.size(), 2u);
    EXPECT_EQ(descriptors[1], make_descriptor(0.2));
}
