#include "test_util.hpp"

#include <mvlabel/annotation/correspondence_store.hpp>

namespace mvlabel::annotation {
namespace {

TEST(CorrespondenceStoreTest, StartsEmpty) {
  const CorrespondenceStore store(4, 3, 2);
  for (FrameId f = 0; f < 2; ++f) {
    for (MarkerId m = 0; m < 4; ++m) {
      EXPECT_FALSE(store.HasWorldPoint(m, f));
      for (CameraId c = 0; c < 3; ++c) {
        const Observation& obs = store.observation(m, c, f);
        EXPECT_EQ(obs.status, LabelStatus::kUnlabeled);
        EXPECT_FALSE(obs.has_position());
        EXPECT_FALSE(obs.hand_labeled);
        EXPECT_FALSE(store.initial_position(m, c, f).allFinite());
      }
    }
  }
}

TEST(CorrespondenceStoreTest, RejectsMarkerCountNotDivisibleByAnimals) {
  EXPECT_THROW(CorrespondenceStore(5, 2, 1, 2), Error);
  EXPECT_NO_THROW(CorrespondenceStore(6, 2, 1, 2));
}

TEST(CorrespondenceStoreTest, RejectsOutOfRangeIds) {
  const CorrespondenceStore store(2, 2, 2);
  EXPECT_THROW(store.observation(2, 0, 0), Error);
  EXPECT_THROW(store.observation(0, -1, 0), Error);
  EXPECT_THROW(store.observation(0, 0, 2), Error);
}

TEST(CorrespondenceStoreTest, PositionPresentOnlyForEligibleStatus) {
  CorrespondenceStore store(1, 2, 1);
  store.SetObservation(0, 0, 0, Eigen::Vector2d(5, 6), LabelStatus::kUnlabeled, true);
  EXPECT_FALSE(store.observation(0, 0, 0).has_position());
  EXPECT_FALSE(store.observation(0, 0, 0).hand_labeled);

  store.SetObservation(0, 1, 0, Eigen::Vector2d(5, 6), LabelStatus::kInitialized, true);
  EXPECT_TRUE(store.observation(0, 1, 0).has_position());
  EXPECT_FALSE(store.observation(0, 1, 0).hand_labeled);

  Observation bad;
  bad.status = LabelStatus::kLabeled;  // no position
  EXPECT_THROW(store.PutObservation(0, 0, 0, bad), Error);

  Observation hand_not_labeled;
  hand_not_labeled.status = LabelStatus::kInitialized;
  hand_not_labeled.uv_px = Eigen::Vector2d(1, 1);
  hand_not_labeled.hand_labeled = true;
  EXPECT_THROW(store.PutObservation(0, 0, 0, hand_not_labeled), Error);

  EXPECT_THROW(store.SetObservation(0, 0, 0, MissingPoint2d(), LabelStatus::kLabeled), Error);
}

TEST(CorrespondenceStoreTest, EligibleCamerasAndTriangulatable) {
  CorrespondenceStore store(2, 4, 1);
  store.SetObservation(0, 0, 0, Eigen::Vector2d(1, 1), LabelStatus::kLabeled);
  store.SetObservation(0, 2, 0, Eigen::Vector2d(2, 2), LabelStatus::kInitialized);
  store.SetObservation(0, 3, 0, MissingPoint2d(), LabelStatus::kInvisible);
  store.SetObservation(1, 1, 0, Eigen::Vector2d(3, 3), LabelStatus::kLabeled);

  EXPECT_EQ(store.EligibleCameras(0, 0), (std::vector<CameraId>{0, 2}));
  EXPECT_TRUE(store.IsTriangulatable(0, 0));
  EXPECT_FALSE(store.IsTriangulatable(1, 0));
  EXPECT_EQ(store.TriangulatableMarkers(0), (std::vector<MarkerId>{0}));
}

TEST(CorrespondenceStoreTest, InvisibleClearsAndUnmarksToUnlabeled) {
  CorrespondenceStore store(1, 3, 1);
  for (CameraId c = 0; c < 3; ++c) {
    store.SetObservation(0, c, 0, Eigen::Vector2d(c, c), LabelStatus::kLabeled, true);
  }
  store.SetWorldPoint(0, 0, Eigen::Vector3d(1, 2, 3));

  store.MarkInvisible(0, 0);
  EXPECT_TRUE(store.IsInvisible(0, 0));
  EXPECT_TRUE(store.EligibleCameras(0, 0).empty());
  EXPECT_FALSE(store.HasWorldPoint(0, 0));
  for (CameraId c = 0; c < 3; ++c) {
    EXPECT_EQ(store.observation(0, c, 0).status, LabelStatus::kInvisible);
    EXPECT_FALSE(store.observation(0, c, 0).has_position());
    EXPECT_FALSE(store.observation(0, c, 0).hand_labeled);
  }

  store.ClearInvisible(0, 0);
  EXPECT_FALSE(store.IsInvisible(0, 0));
  for (CameraId c = 0; c < 3; ++c) {
    EXPECT_EQ(store.observation(0, c, 0).status, LabelStatus::kUnlabeled);
  }
}

TEST(CorrespondenceStoreTest, DeriveStatusRoundsToConfiguredDecimals) {
  const CorrespondenceStore store(1, 1, 1);
  const Eigen::Vector2d initial(10.0001, 20.0);

  EXPECT_EQ(store.DeriveStatus(MissingPoint2d(), initial), LabelStatus::kUnlabeled);
  EXPECT_EQ(store.DeriveStatus(Eigen::Vector2d(10.0002, 20.0), initial), LabelStatus::kInitialized);
  EXPECT_EQ(store.DeriveStatus(Eigen::Vector2d(10.0006, 20.0), initial), LabelStatus::kLabeled);
  EXPECT_EQ(store.DeriveStatus(Eigen::Vector2d(10.0, 20.0), MissingPoint2d()), LabelStatus::kLabeled);

  const CorrespondenceStore coarse(1, 1, 1, 1, 0);
  EXPECT_EQ(coarse.DeriveStatus(Eigen::Vector2d(10.3, 20.2), Eigen::Vector2d(10.1, 19.9)),
            LabelStatus::kInitialized);
}

TEST(CorrespondenceStoreTest, RederiveLeavesInvisibleAlone) {
  CorrespondenceStore store(2, 2, 1);
  store.SetInitialPosition(0, 0, 0, Eigen::Vector2d(4, 4));
  store.SetObservation(0, 0, 0, Eigen::Vector2d(4, 4), LabelStatus::kLabeled, true);
  store.SetObservation(0, 1, 0, MissingPoint2d(), LabelStatus::kInvisible);
  store.SetObservation(1, 0, 0, Eigen::Vector2d(7, 7), LabelStatus::kInitialized);

  store.RederiveStatus(0);

  // Back at its initial position: Initialized and no longer hand-labeled.
  EXPECT_EQ(store.observation(0, 0, 0).status, LabelStatus::kInitialized);
  EXPECT_FALSE(store.observation(0, 0, 0).hand_labeled);
  EXPECT_EQ(store.observation(0, 1, 0).status, LabelStatus::kInvisible);
  // No initial position recorded: counts as placed.
  EXPECT_EQ(store.observation(1, 0, 0).status, LabelStatus::kLabeled);
  EXPECT_EQ(store.observation(1, 1, 0).status, LabelStatus::kUnlabeled);
}

TEST(CorrespondenceStoreTest, DerivedPositionSkipsInvisible) {
  CorrespondenceStore store(1, 2, 1);
  store.SetObservation(0, 1, 0, MissingPoint2d(), LabelStatus::kInvisible);
  store.SetInitialPosition(0, 0, 0, Eigen::Vector2d(1.5, 2.5));

  store.SetDerivedPosition(0, 0, 0, Eigen::Vector2d(1.5, 2.5));
  store.SetDerivedPosition(0, 1, 0, Eigen::Vector2d(9, 9));

  EXPECT_EQ(store.observation(0, 0, 0).status, LabelStatus::kInitialized);
  EXPECT_EQ(store.observation(0, 0, 0).uv_px, Eigen::Vector2d(1.5, 2.5));
  EXPECT_EQ(store.observation(0, 1, 0).status, LabelStatus::kInvisible);
  EXPECT_FALSE(store.observation(0, 1, 0).has_position());

  store.SetDerivedPosition(0, 0, 0, MissingPoint2d());
  EXPECT_EQ(store.observation(0, 0, 0).status, LabelStatus::kUnlabeled);
}

TEST(CorrespondenceStoreTest, CopyAndRestoreFrame) {
  CorrespondenceStore store(2, 2, 3);
  store.SetObservation(1, 0, 1, Eigen::Vector2d(3, 4), LabelStatus::kLabeled, true);
  store.SetInitialPosition(0, 1, 1, Eigen::Vector2d(8, 9));
  store.SetWorldPoint(1, 1, Eigen::Vector3d(1, 1, 1));

  const FrameState state = store.CopyFrame(1);
  store.RestoreFrame(2, state);

  EXPECT_TRUE(SameObservation(store.observation(1, 0, 2), store.observation(1, 0, 1)));
  EXPECT_EQ(store.initial_position(0, 1, 2), Eigen::Vector2d(8, 9));
  EXPECT_EQ(store.world_point(1, 2), Eigen::Vector3d(1, 1, 1));
  // Frame 0 untouched.
  EXPECT_EQ(store.observation(1, 0, 0).status, LabelStatus::kUnlabeled);

  FrameState wrong = state;
  wrong.num_markers = 3;
  EXPECT_THROW(store.RestoreFrame(0, wrong), Error);
}

TEST(CorrespondenceStoreTest, ClearInitialPositionsIsPerFrame) {
  CorrespondenceStore store(1, 1, 2);
  store.SetInitialPosition(0, 0, 0, Eigen::Vector2d(1, 1));
  store.SetInitialPosition(0, 0, 1, Eigen::Vector2d(2, 2));
  store.ClearInitialPositions(0);
  EXPECT_FALSE(store.initial_position(0, 0, 0).allFinite());
  EXPECT_TRUE(store.initial_position(0, 0, 1).allFinite());
}

}  // namespace
}  // namespace mvlabel::annotation
