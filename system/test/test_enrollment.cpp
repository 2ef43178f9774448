#include "database/attendance_database.hpp"
#include "recognition/descriptor_gallery.hpp"
#include "recognition/matcher.hpp"
#include "services/enrollment_service.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <fstream>

using test_support::FakeFaceAnalyzer;
using test_support::TempDir;
using test_support::make_descriptor;
using test_support::make_png_bytes;

namespace {

StaffProfile profile(const std::string& name) {
    StaffProfile p;
    p.name = name;
    p.age = 34;
    p.position = "Technician";
    p.image_path = name + ".png";
    return p;
}

class EnrollmentTest : public ::testing::Test {
protected:
    TempDir dir;
    AttendanceDatabase db{dir.file("att.db")};
    DescriptorGallery gallery;
    FakeFaceAnalyzer analyzer;
};

} // namespace

TEST_F(EnrollmentTest, NoFaceLeavesEverythingUnchanged) {
    EnrollmentService service(db, gallery, analyzer);
    analyzer.set_descriptors({});

    EnrollResult r = service.add_identity(profile("Ana"), make_png_bytes());

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, AttendanceError::NoFaceDetected);
    EXPECT_EQ(db.count_staff(), 0);
    EXPECT_TRUE(gallery.empty());
}

TEST_F(EnrollmentTest, SingleFaceIsPersistedAndImmediatelyMatchable) {
    EnrollmentService service(db, gallery, analyzer);
    Descriptor d = make_descriptor(0.25);
    analyzer.set_descriptors({d});

    EnrollResult r = service.add_identity(profile("Ana"), make_png_bytes());

    ASSERT_TRUE(r.ok) << r.message;
    EXPECT_GT(r.staff_id, 0);
    EXPECT_EQ(db.count_staff(), 1);

    MatchResult m = FaceMatcher().identify(d, gallery);
    EXPECT_TRUE(m.recognized);
    EXPECT_EQ(m.name, "Ana");
    EXPECT_DOUBLE_EQ(m.distance, 0.0);
}

TEST_F(EnrollmentTest, TakeFirstUsesFirstDetectedFace) {
    EnrollmentService service(db, gallery, analyzer, MultiFacePolicy::TakeFirst);
    Descriptor first = make_descriptor(0.1);
    Descriptor second = make_descriptor(0.9);
    analyzer.set_descriptors({first, second});

    EnrollResult r = service.add_identity(profile("Ana"), make_png_bytes());

    ASSERT_TRUE(r.ok);
    EXPECT_EQ(r.faces_found, 2u);
    ASSERT_EQ(gallery.size(), 1u);
    EXPECT_EQ((*gallery.all())[0].descriptor, first);
}

TEST_F(EnrollmentTest, RejectPolicyRefusesSeveralFaces) {
    EnrollmentService service(db, gallery, analyzer, MultiFacePolicy::Reject);
    analyzer.set_descriptors({make_descriptor(0.1), make_descriptor(0.9)});

    EnrollResult r = service.add_identity(profile("Ana"), make_png_bytes());

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, AttendanceError::AmbiguousFace);
    EXPECT_EQ(db.count_staff(), 0);
}

TEST_F(EnrollmentTest, DuplicateNameIsRejectedBeforeDetection) {
    EnrollmentService service(db, gallery, analyzer);
    analyzer.set_descriptors({make_descriptor(0.1)});
    ASSERT_TRUE(service.add_identity(profile("Ana"), make_png_bytes()).ok);
    int calls = analyzer.calls;

    EnrollResult r = service.add_identity(profile("Ana"), make_png_bytes());

    EXPECT_EQ(r.error, AttendanceError::DuplicateName);
    EXPECT_EQ(analyzer.calls, calls);
    EXPECT_EQ(db.count_staff(), 1);
}

TEST_F(EnrollmentTest, InvalidProfileFields) {
    EnrollmentService service(db, gallery, analyzer);
    analyzer.set_descriptors({make_descriptor(0.1)});

    StaffProfile young = profile("Kid");
    young.age = 12;
    StaffProfile no_name = profile("");
    StaffProfile no_position = profile("Ana");
    no_position.position.clear();

    EXPECT_EQ(service.add_identity(young, make_png_bytes()).error, AttendanceError::InvalidProfile);
    EXPECT_EQ(service.add_identity(no_name, make_png_bytes()).error, AttendanceError::InvalidProfile);
    EXPECT_EQ(service.add_identity(no_position, make_png_bytes()).error, AttendanceError::InvalidProfile);
    EXPECT_EQ(db.count_staff(), 0);
}

TEST_F(EnrollmentTest, UndecodableImage) {
    EnrollmentService service(db, gallery, analyzer);
    analyzer.set_descriptors({make_descriptor(0.1)});

    std::vector<unsigned char> garbage{'n', 'o', 't', ' ', 'a', 'n', ' ', 'i', 'm', 'g'};
    EnrollResult r = service.add_identity(profile("Ana"), garbage);

    EXPECT_EQ(r.error, AttendanceError::InvalidImage);
    EXPECT_EQ(analyzer.calls, 0);
    EXPECT_EQ(db.count_staff(), 0);
}

TEST_F(EnrollmentTest, WrongDimensionIsMalformed) {
    EnrollmentService service(db, gallery, analyzer);
    analyzer.set_descriptors({make_descriptor(0.1, 0.0, 64)});

    EnrollResult r = service.add_identity(profile("Ana"), make_png_bytes());

    EXPECT_EQ(r.error, AttendanceError::MalformedDescriptor);
    EXPECT_EQ(db.count_staff(), 0);
    EXPECT_TRUE(gallery.empty());
}

TEST_F(EnrollmentTest, UnknownLabelCannotBeEnrolled) {
    EnrollmentService service(db, gallery, analyzer);
    analyzer.set_descriptors({make_descriptor(0.1)});

    EnrollResult r = service.add_identity(profile(Config::UNKNOWN_NAME), make_png_bytes());

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, AttendanceError::InvalidProfile);
    EXPECT_EQ(analyzer.calls, 0);
    EXPECT_EQ(db.count_staff(), 0);
    EXPECT_TRUE(gallery.empty());
}

TEST_F(EnrollmentTest, FailedInsertKeepsPreviousGallery) {
    EnrollmentService service(db, gallery, analyzer);
    analyzer.set_descriptors({make_descriptor(0.1)});
    ASSERT_TRUE(service.add_identity(profile("Ana"), make_png_bytes()).ok);
    GallerySnapshot before = gallery.all();

    ASSERT_TRUE(test_support::exec_sql(dir.file("att.db"),
        "CREATE TRIGGER staff_read_only BEFORE INSERT ON staff "
        "BEGIN SELECT RAISE(ABORT, 'read only'); END;"));
    analyzer.set_descriptors({make_descriptor(0.7)});

    EnrollResult r = service.add_identity(profile("Bea"), make_png_bytes());

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, AttendanceError::PersistenceWriteError);
    EXPECT_EQ(db.count_staff(), 1);
    EXPECT_EQ(gallery.all().get(), before.get());
    ASSERT_EQ(gallery.size(), 1u);
    EXPECT_EQ((*gallery.all())[0].name, "Ana");
}

TEST(EnrollmentConnectionTest, ClosedDatabaseReportsConnectionError) {
    TempDir dir;
    std::ofstream(dir.file("blocker")) << "x";
    AttendanceDatabase db(dir.file("blocker") + "/att.db");
    DescriptorGallery gallery;
    FakeFaceAnalyzer analyzer;
    analyzer.set_descriptors({make_descriptor(0.1)});
    EnrollmentService service(db, gallery, analyzer);

    EnrollResult r = service.add_identity(profile("Ana"), make_png_bytes());

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.error, AttendanceError::ConnectionError);
    EXPECT_TRUE(gallery.empty());
    EXPECT_EQ(db.count_staff(), -1);
}

TEST(MultiFacePolicyTest, Parse) {
    MultiFacePolicy p = MultiFacePolicy::TakeFirst;
    EXPECT_TRUE(parse_multi_face_policy("reject", p));
    EXPECT_EQ(p, MultiFacePolicy::Reject);
    EXPECT_TRUE(parse_multi_face_policy("take_first", p));
    EXPECT_EQ(p, MultiFacePolicy::TakeFirst);
    EXPECT_FALSE(parse_multi_face_policy("first", p));
}
