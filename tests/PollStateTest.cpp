#include <gtest/gtest.h>

#include "mirrorsync/RemotePoller.hpp"

using namespace mirrorsync;
using std::chrono::milliseconds;
using std::chrono::seconds;

TEST(PollStateTest, BandsWidenWithQuietCycles) {
    EngineTuning t;
    const milliseconds base = seconds(300);
    PollState st;
    st.reset(t);
    EXPECT_EQ(st.interval, seconds(5));

    std::vector<milliseconds> seen;
    for (int i = 0; i < 8; ++i) {
        st.advance(false, t, base);
        seen.push_back(st.interval);
    }
    const std::vector<milliseconds> expected = {seconds(5),  seconds(5),  seconds(5),  seconds(15),
                                                seconds(15), seconds(15), seconds(300), seconds(300)};
    EXPECT_EQ(seen, expected);
    EXPECT_EQ(st.noChangeCount, 8);
}

TEST(PollStateTest, ChangeResetsToFastBand) {
    EngineTuning t;
    PollState st;
    st.reset(t);
    for (int i = 0; i < 10; ++i) st.advance(false, t, seconds(60));
    ASSERT_EQ(st.interval, seconds(60));
    st.advance(true, t, seconds(60));
    EXPECT_EQ(st.noChangeCount, 0);
    EXPECT_EQ(st.interval, seconds(5));
}

TEST(PollStateTest, IntervalForBoundaries) {
    EngineTuning t;
    EXPECT_EQ(pollIntervalFor(0, t, seconds(3600)), seconds(5));
    EXPECT_EQ(pollIntervalFor(3, t, seconds(3600)), seconds(5));
    EXPECT_EQ(pollIntervalFor(4, t, seconds(3600)), seconds(15));
    EXPECT_EQ(pollIntervalFor(6, t, seconds(3600)), seconds(15));
    EXPECT_EQ(pollIntervalFor(7, t, seconds(3600)), seconds(3600));
}
