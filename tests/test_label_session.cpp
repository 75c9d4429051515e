#include "test_util.hpp"

#include <mvlabel/annotation/label_session.hpp>

#include <limits>
#include <vector>

namespace mvlabel::annotation {
namespace {

using mvlabel::testing::ChainSkeleton;
using mvlabel::testing::ExpectErrorCode;
using mvlabel::testing::MildDistortion;
using mvlabel::testing::QuietConfig;
using mvlabel::testing::RingCalibrations;

std::vector<int> Frames(int n) {
  std::vector<int> frames;
  for (int i = 0; i < n; ++i) frames.push_back(100 + 10 * i);
  return frames;
}

// Clicks the exact image of X in the given cameras.
void ClickProjections(LabelSession* s, MarkerId m, FrameId f, const Eigen::Vector3d& X,
                      const std::vector<CameraId>& cams) {
  for (const CameraId c : cams) {
    s->Click(m, c, f, s->cameras()[c].Project(X, !s->config().undistorted_images));
  }
}

// Cameras 0 and 1 have their principal points at the clicked pixels, so both
// clicks are rays through the world origin.
TEST(LabelSessionTest, TriangulateReprojectsAndKeepsRawClicks) {
  auto raws = RingCalibrations(3);
  raws[0].K(0, 2) = 100.0;
  raws[0].K(1, 2) = 50.0;
  raws[1].K(0, 2) = 102.0;
  raws[1].K(1, 2) = 48.0;
  LabelSession s(raws, ChainSkeleton(1), Frames(1), QuietConfig());

  s.Click(0, 0, 0, Eigen::Vector2d(100, 50));
  s.Click(0, 1, 0, Eigen::Vector2d(102, 48));
  EXPECT_EQ(s.store().observation(0, 0, 0).status, LabelStatus::kLabeled);
  EXPECT_TRUE(s.store().observation(0, 0, 0).hand_labeled);
  EXPECT_FALSE(s.store().observation(0, 2, 0).has_position());

  const TriangulationReport report = s.Triangulate(0);
  EXPECT_EQ(report.triangulated, 1);
  EXPECT_EQ(report.insufficient, 0);

  const Eigen::Vector3d& X = s.store().world_point(0, 0);
  ASSERT_TRUE(X.allFinite());
  EXPECT_LT(X.norm(), 1e-6);

  const Observation& cam3 = s.store().observation(0, 2, 0);
  ASSERT_TRUE(cam3.has_position());
  EXPECT_NEAR(cam3.uv_px.x(), 640.0, 1e-4);
  EXPECT_NEAR(cam3.uv_px.y(), 480.0, 1e-4);
  EXPECT_FALSE(cam3.hand_labeled);

  const Observation& cam1 = s.store().observation(0, 0, 0);
  const Observation& cam2 = s.store().observation(0, 1, 0);
  EXPECT_EQ(cam1.uv_px, Eigen::Vector2d(100, 50));
  EXPECT_EQ(cam2.uv_px, Eigen::Vector2d(102, 48));
  EXPECT_EQ(cam1.status, LabelStatus::kLabeled);
  EXPECT_TRUE(cam1.hand_labeled);
  EXPECT_TRUE(cam2.hand_labeled);
}

TEST(LabelSessionTest, DistortedClicksAreUndistortedBeforeSolving) {
  LabelSession s(RingCalibrations(4, MildDistortion()), ChainSkeleton(2), Frames(1), QuietConfig());
  const Eigen::Vector3d X(0.2, -0.15, 0.3);
  ClickProjections(&s, 0, 0, X, {0, 1, 3});

  const std::vector<Observation> clicks = {s.store().observation(0, 0, 0), s.store().observation(0, 1, 0),
                                           s.store().observation(0, 3, 0)};
  s.Triangulate(0);

  EXPECT_LT((s.store().world_point(0, 0) - X).norm(), 1e-4);
  EXPECT_TRUE(SameObservation(s.store().observation(0, 0, 0), clicks[0]));
  EXPECT_TRUE(SameObservation(s.store().observation(0, 1, 0), clicks[1]));
  EXPECT_TRUE(SameObservation(s.store().observation(0, 3, 0), clicks[2]));

  const Eigen::Vector2d expected = s.cameras()[2].Project(X, true);
  EXPECT_LT((s.store().observation(0, 2, 0).uv_px - expected).norm(), 0.05);
}

TEST(LabelSessionTest, FewerThanTwoViewsLeavesWorldPointUnchanged) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(2), Frames(1), QuietConfig());
  const Eigen::Vector3d stale(1.0, 2.0, 3.0);
  s.mutable_store()->SetWorldPoint(0, 0, stale);
  s.Click(0, 1, 0, Eigen::Vector2d(300, 200));

  const TriangulationReport report = s.Triangulate(0);
  EXPECT_EQ(report.triangulated, 0);
  EXPECT_EQ(report.insufficient, 1);
  EXPECT_EQ(s.store().world_point(0, 0), stale);
  EXPECT_FALSE(s.store().observation(0, 0, 0).has_position());
  EXPECT_EQ(s.store().observation(0, 1, 0).uv_px, Eigen::Vector2d(300, 200));
}

TEST(LabelSessionTest, ReprojectionSkipsInvisibleCameras) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(1), Frames(1), QuietConfig());
  s.mutable_store()->SetObservation(0, 2, 0, MissingPoint2d(), LabelStatus::kInvisible);
  ClickProjections(&s, 0, 0, Eigen::Vector3d(0.1, 0.1, 0.1), {0, 1});

  s.Triangulate(0);
  EXPECT_TRUE(s.store().HasWorldPoint(0, 0));
  EXPECT_EQ(s.store().observation(0, 2, 0).status, LabelStatus::kInvisible);
  EXPECT_FALSE(s.store().observation(0, 2, 0).has_position());
}

// Two cameras looking down +z from (0,0,0) and (1,0,0); clicks at both
// principal points give parallel rays.
std::vector<geometry::RawCalibration> ParallelCalibrations() {
  geometry::RawCalibration a;
  a.convention = geometry::PoseConvention::kColumnVector;
  a.K << 800.0, 0.0, 320.0,
         0.0, 800.0, 240.0,
         0.0, 0.0, 1.0;
  a.image_width_px = 640;
  a.image_height_px = 480;
  geometry::RawCalibration b = a;
  b.t = Eigen::Vector3d(-1.0, 0.0, 0.0);
  return {a, b};
}

TEST(LabelSessionTest, DegenerateGeometryKeepsPreviousPointAndClicks) {
  LabelSession s(ParallelCalibrations(), ChainSkeleton(1), Frames(1), QuietConfig());
  const Eigen::Vector3d stale(1.0, 2.0, 3.0);
  s.mutable_store()->SetWorldPoint(0, 0, stale);
  s.Click(0, 0, 0, Eigen::Vector2d(320, 240));
  s.Click(0, 1, 0, Eigen::Vector2d(320, 240));

  const TriangulationReport report = s.Triangulate(0);
  EXPECT_EQ(report.degenerate, 1);
  EXPECT_EQ(report.triangulated, 0);
  EXPECT_EQ(report.insufficient, 0);
  EXPECT_EQ(s.store().world_point(0, 0), stale);
  for (CameraId c = 0; c < 2; ++c) {
    const Observation& obs = s.store().observation(0, c, 0);
    EXPECT_EQ(obs.status, LabelStatus::kLabeled);
    EXPECT_EQ(obs.uv_px, Eigen::Vector2d(320, 240));
  }
}

TEST(LabelSessionTest, ToggleInvisible) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(1), Frames(1), QuietConfig());
  ClickProjections(&s, 0, 0, Eigen::Vector3d::Zero(), {0, 1, 2});
  s.Triangulate(0);
  ASSERT_TRUE(s.store().HasWorldPoint(0, 0));

  s.ToggleInvisible(0, 0);
  EXPECT_TRUE(s.store().IsInvisible(0, 0));
  EXPECT_FALSE(s.store().HasWorldPoint(0, 0));
  EXPECT_TRUE(s.store().EligibleCameras(0, 0).empty());

  s.ToggleInvisible(0, 0);
  for (CameraId c = 0; c < 3; ++c) {
    EXPECT_EQ(s.store().observation(0, c, 0).status, LabelStatus::kUnlabeled);
  }
}

TEST(LabelSessionTest, ForceTriangulateFollowsHeldPoint) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(1), Frames(1), QuietConfig());
  const Eigen::Vector3d X(0.05, 0.1, -0.1);
  ClickProjections(&s, 0, 0, X, {0, 1, 2});

  const Eigen::Vector2d held = s.cameras()[1].Project(X, false) + Eigen::Vector2d(5.0, 3.0);
  const geometry::TriangulationResult r = s.ForceTriangulate(1, 0, 0, held);
  ASSERT_TRUE(r.success);

  EXPECT_EQ(s.store().observation(0, 1, 0).uv_px, held);
  EXPECT_TRUE(s.store().observation(0, 1, 0).hand_labeled);
  EXPECT_EQ(s.store().world_point(0, 0), r.X);
  EXPECT_LT(geometry::ReprojectionErrorPx(s.cameras()[1], r.X, held), 0.5);
}

TEST(LabelSessionTest, ForceTriangulateWithOneViewKeepsTheClick) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(1), Frames(1), QuietConfig());
  const geometry::TriangulationResult r = s.ForceTriangulate(0, 0, 0, Eigen::Vector2d(640, 480));
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.error, ErrorCode::kInsufficientViews);
  EXPECT_EQ(s.store().observation(0, 0, 0).status, LabelStatus::kLabeled);
  EXPECT_FALSE(s.store().HasWorldPoint(0, 0));
}

TEST(LabelSessionTest, LoadFrom3DInitializesAllCamerasButKeepsLabeled) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(2), Frames(2), QuietConfig());
  s.Click(0, 0, 0, Eigen::Vector2d(11, 22));

  Eigen::MatrixXd pts = Eigen::MatrixXd::Constant(2, 6, std::numeric_limits<double>::quiet_NaN());
  pts.block<1, 3>(0, 0) << 0.1, 0.1, 0.1;  // marker 0, frame 0: already labeled
  pts.block<1, 3>(0, 3) << 0.0, 0.2, 0.0;  // marker 1, frame 0
  pts.block<1, 3>(1, 0) << -0.1, 0.0, 0.1;  // marker 0, frame 1
  s.LoadFrom3D(pts);

  EXPECT_FALSE(s.store().HasWorldPoint(0, 0));
  EXPECT_EQ(s.store().observation(0, 0, 0).uv_px, Eigen::Vector2d(11, 22));
  EXPECT_FALSE(s.store().observation(0, 1, 0).has_position());

  for (CameraId c = 0; c < 3; ++c) {
    const Observation& obs = s.store().observation(1, c, 0);
    EXPECT_EQ(obs.status, LabelStatus::kInitialized);
    EXPECT_EQ(obs.uv_px, s.store().initial_position(1, c, 0));
    EXPECT_LT((obs.uv_px - s.cameras()[c].Project(Eigen::Vector3d(0.0, 0.2, 0.0), true)).norm(), 1e-9);
  }
  EXPECT_EQ(s.store().observation(0, 2, 1).status, LabelStatus::kInitialized);
  EXPECT_EQ(s.store().observation(1, 2, 1).status, LabelStatus::kUnlabeled);

  // Clicking the loaded position keeps it Initialized; moving it labels it.
  const Eigen::Vector2d initial = s.store().initial_position(1, 0, 0);
  s.Click(1, 0, 0, initial);
  EXPECT_EQ(s.store().observation(1, 0, 0).status, LabelStatus::kInitialized);
  s.Click(1, 0, 0, initial + Eigen::Vector2d(2.0, 0.0));
  EXPECT_EQ(s.store().observation(1, 0, 0).status, LabelStatus::kLabeled);

  EXPECT_THROW(s.LoadFrom3D(Eigen::MatrixXd::Zero(3, 6)), Error);
}

TEST(LabelSessionTest, LoadFrom3DSkipsInvisibleMarkers) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(2), Frames(1), QuietConfig());
  s.ToggleInvisible(0, 0);

  Eigen::MatrixXd pts(1, 6);
  pts << 0.1, 0.1, 0.1, 0.0, 0.2, 0.0;
  s.LoadFrom3D(pts);

  EXPECT_FALSE(s.store().HasWorldPoint(0, 0));
  EXPECT_TRUE(s.store().IsInvisible(0, 0));
  EXPECT_TRUE(s.store().HasWorldPoint(1, 0));
  for (CameraId c = 0; c < 3; ++c) {
    EXPECT_EQ(s.store().observation(0, c, 0).status, LabelStatus::kInvisible);
  }
}

TEST(LabelSessionTest, SwapIdentitiesFixesCrossedLabels) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(4), Frames(1), QuietConfig(2));
  const std::vector<Eigen::Vector3d> truth = {
      {0.1, 0.0, 0.0}, {0.1, 0.1, 0.0}, {-0.2, 0.0, 0.1}, {-0.2, -0.1, 0.1}};

  for (MarkerId m = 0; m < 4; ++m) ClickProjections(&s, m, 0, truth[m], {0, 1});
  // Camera 2 has the two animals crossed.
  for (MarkerId m = 0; m < 4; ++m) ClickProjections(&s, m, 0, truth[(m + 2) % 4], {2});

  s.SwapIdentities(2, 0);

  for (MarkerId m = 0; m < 4; ++m) {
    EXPECT_LT((s.store().world_point(m, 0) - truth[m]).norm(), 1e-6) << "marker " << m;
    const Eigen::Vector2d expected = s.cameras()[2].Project(truth[m], true);
    EXPECT_LT((s.store().observation(m, 2, 0).uv_px - expected).norm(), 1e-9);
  }
}

TEST(LabelSessionTest, SwapIdentitiesNeedsTwoAnimals) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(4), Frames(1), QuietConfig(1));
  s.Click(0, 0, 0, Eigen::Vector2d(1, 2));
  ExpectErrorCode([&] { s.SwapIdentities(0, 0); }, ErrorCode::kUnsupportedAnimalCount);
  EXPECT_EQ(s.store().observation(0, 0, 0).uv_px, Eigen::Vector2d(1, 2));
}

TEST(LabelSessionTest, ResetMarkerAndFrame) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(2), Frames(1), QuietConfig());
  Eigen::MatrixXd pts(1, 6);
  pts << 0.0, 0.0, 0.0, 0.1, 0.1, 0.1;
  s.LoadFrom3D(pts);

  s.ResetMarker(0, 0);
  EXPECT_FALSE(s.store().HasWorldPoint(0, 0));
  EXPECT_EQ(s.store().observation(0, 1, 0).status, LabelStatus::kUnlabeled);
  EXPECT_TRUE(s.store().initial_position(0, 1, 0).allFinite());
  EXPECT_TRUE(s.store().HasWorldPoint(1, 0));

  s.ResetFrame(0);
  EXPECT_FALSE(s.store().HasWorldPoint(1, 0));
  EXPECT_FALSE(s.store().initial_position(0, 1, 0).allFinite());
}

TEST(LabelSessionTest, SetFrameLabeledAndCounts) {
  LabelSession s(RingCalibrations(2), ChainSkeleton(2), Frames(3), QuietConfig());
  EXPECT_EQ(s.LabeledFrameCount(), 0);

  Eigen::MatrixXd pts = Eigen::MatrixXd::Zero(3, 6);
  s.LoadFrom3D(pts);
  EXPECT_EQ(s.LabeledFrameCount(), 0);

  s.SetFrameLabeled(1);
  EXPECT_TRUE(s.IsFrameLabeled(1));
  EXPECT_EQ(s.LabeledFrameCount(), 1);
  EXPECT_EQ(s.store().observation(0, 0, 1).status, LabelStatus::kLabeled);
  EXPECT_EQ(s.store().observation(0, 0, 2).status, LabelStatus::kInitialized);
}

TEST(LabelSessionTest, CopyPasteFrame) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(1), Frames(2), QuietConfig());
  EXPECT_FALSE(s.HasClipboard());
  EXPECT_THROW(s.PasteFrame(1), Error);

  ClickProjections(&s, 0, 0, Eigen::Vector3d::Zero(), {0, 1});
  s.Triangulate(0);
  s.CopyFrame(0);
  s.PasteFrame(1);

  for (CameraId c = 0; c < 3; ++c) {
    EXPECT_TRUE(SameObservation(s.store().observation(0, c, 1), s.store().observation(0, c, 0)));
  }
  EXPECT_EQ(s.store().world_point(0, 1), s.store().world_point(0, 0));
}

TEST(LabelSessionTest, TriangulateAllCoversEveryFrame) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(2), Frames(5), QuietConfig());
  for (FrameId f = 0; f < 5; ++f) {
    ClickProjections(&s, 0, f, Eigen::Vector3d(0.05 * f, 0.0, 0.0), {0, 2});
  }
  ::testing::internal::CaptureStderr();
  const TriangulationReport total = s.TriangulateAll();
  EXPECT_EQ(::testing::internal::GetCapturedStderr(), "");
  EXPECT_EQ(total.triangulated, 5);
  for (FrameId f = 0; f < 5; ++f) {
    EXPECT_LT((s.store().world_point(0, f) - Eigen::Vector3d(0.05 * f, 0.0, 0.0)).norm(), 1e-8);
    EXPECT_FALSE(s.store().HasWorldPoint(1, f));
  }
}

TEST(LabelSessionTest, ApplyDispatchesEvents) {
  LabelSession s(RingCalibrations(3), ChainSkeleton(3), Frames(1), QuietConfig());
  const Eigen::Vector3d X(0.0, 0.1, 0.2);

  AnnotationEvent select;
  select.type = EventType::kSelectMarker;
  select.marker = 2;
  EXPECT_FALSE(s.Apply(select).has_value());
  EXPECT_EQ(s.selected_marker(), 2);

  for (CameraId c = 0; c < 2; ++c) {
    AnnotationEvent click;
    click.type = EventType::kClick;
    click.camera = c;
    click.uv_px = s.cameras()[c].Project(X, true);
    s.Apply(click);
  }
  EXPECT_EQ(s.store().EligibleCameras(2, 0).size(), 2u);

  AnnotationEvent tri;
  tri.type = EventType::kTriangulate;
  const auto report = s.Apply(tri);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->triangulated, 1);
  EXPECT_LT((s.store().world_point(2, 0) - X).norm(), 1e-8);

  AnnotationEvent del;
  del.type = EventType::kDelete;
  del.camera = 2;
  s.Apply(del);
  EXPECT_EQ(s.store().observation(2, 2, 0).status, LabelStatus::kUnlabeled);

  AnnotationEvent bad;
  bad.type = EventType::kClick;
  bad.camera = 7;
  bad.uv_px = Eigen::Vector2d(1, 1);
  EXPECT_THROW(s.Apply(bad), Error);
}

TEST(LabelSessionTest, ApplyDragCountsFailuresByCause) {
  LabelSession one(RingCalibrations(3), ChainSkeleton(1), Frames(1), QuietConfig());
  AnnotationEvent drag;
  drag.type = EventType::kDrag;
  drag.marker = 0;
  drag.camera = 0;
  drag.uv_px = Eigen::Vector2d(640, 480);
  auto report = one.Apply(drag);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->insufficient, 1);
  EXPECT_EQ(report->degenerate, 0);

  LabelSession parallel(ParallelCalibrations(), ChainSkeleton(1), Frames(1), QuietConfig());
  parallel.Click(0, 0, 0, Eigen::Vector2d(320, 240));
  drag.camera = 1;
  drag.uv_px = Eigen::Vector2d(320, 240);
  report = parallel.Apply(drag);
  ASSERT_TRUE(report.has_value());
  EXPECT_EQ(report->degenerate, 1);
  EXPECT_EQ(report->insufficient, 0);
  EXPECT_EQ(report->triangulated, 0);
}

TEST(LabelSessionTest, EventNamesRoundTrip) {
  for (const EventType t : {EventType::kClick, EventType::kDrag, EventType::kSwapIdentities,
                            EventType::kPasteFrame}) {
    EXPECT_EQ(ParseEventType(EventTypeName(t)), t);
  }
  EXPECT_THROW(ParseEventType("teleport"), Error);
}

TEST(LabelSessionTest, RejectsBadConstruction) {
  EXPECT_THROW(LabelSession({}, ChainSkeleton(2), Frames(1), QuietConfig()), Error);
  EXPECT_THROW(LabelSession(RingCalibrations(2), ChainSkeleton(3), Frames(1), QuietConfig(2)), Error);
  auto raws = RingCalibrations(2);
  raws[1].K(0, 1) = 3.0;
  ExpectErrorCode([&] { LabelSession(raws, ChainSkeleton(2), Frames(1), QuietConfig()); },
                  ErrorCode::kInvalidCalibration);
}

}  // namespace
}  // namespace mvlabel::annotation
