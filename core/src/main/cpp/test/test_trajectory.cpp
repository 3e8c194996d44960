/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Trajectories of in-memory snapshots.
 */

#include <gtest/gtest.h>
#include "../src/trajectory.h"

using namespace pathstore;

namespace {

std::shared_ptr<Snapshot> frame(float x) {
    return Snapshot::toy(1, 2, {x, 0}, {x, 1});
}

} // namespace

TEST(TrajectoryTest, ReversedOrderAndDirection) {
    Trajectory traj;
    traj.push_back(frame(0));
    traj.push_back(frame(1));
    traj.push_back(frame(2));
    ASSERT_EQ(traj.size(), 3u);

    Trajectory back = traj.reversed();
    ASSERT_EQ(back.size(), 3u);
    EXPECT_FLOAT_EQ(back.front()->coordinates()[0], 2.0f);
    EXPECT_FLOAT_EQ(back.back()->coordinates()[0], 0.0f);
    for (const auto& f : back) {
        EXPECT_TRUE(f->is_reversed());
    }
    EXPECT_EQ(back[0]->velocities(), (std::vector<float>{-2, -1}));
    EXPECT_TRUE(back[0]->is_twin_of(*traj[2].get()));
}

TEST(TrajectoryTest, DoubleReversalRestoresFrames) {
    Trajectory traj;
    traj.push_back(frame(0));
    traj.push_back(frame(5));

    Trajectory again = traj.reversed().reversed();
    ASSERT_EQ(again.size(), 2u);
    for (size_t i = 0; i < traj.size(); ++i) {
        EXPECT_TRUE(again[i]->equals(*traj[i].get()));
    }
}

TEST(TrajectoryTest, InMemoryFramesHaveNoIndices) {
    Trajectory traj;
    EXPECT_TRUE(traj.empty());
    EXPECT_TRUE(traj.indices().empty());

    traj.push_back(frame(0));
    EXPECT_THROW(traj.indices(), persist::InconsistentStateError);
}
