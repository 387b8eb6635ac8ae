#include "common/Timecode.hpp"
#include "common/Exceptions.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

TEST(TimecodeTest, ParsesDialogueTimecodes) {
    EXPECT_DOUBLE_EQ(ParseTimecode("00:00:01:000"), 1.0);
    EXPECT_DOUBLE_EQ(ParseTimecode("01:02:03:456"), 3723.456);
    EXPECT_DOUBLE_EQ(ParseTimecode("00:00:00:000"), 0.0);
}

TEST(TimecodeTest, RejectsMalformedTimecodes) {
    const std::vector<std::string> malformed = {
        "", "00:00:01", "00:00:01:000:1", "aa:00:00:000", "00:60:00:000",
        "00:00:60:000", "00:00:00:1000", "-1:00:00:000", "00::01:000", "00:00:01.5:000"
    };
    for (const auto& timecode : malformed) {
        EXPECT_THROW(ParseTimecode(timecode), InvalidDurationException) << "'" << timecode << "'";
    }
}

TEST(TimecodeTest, FormatsSeconds) {
    EXPECT_EQ(FormatTimecode(3.0), "00:00:03:000");
    EXPECT_EQ(FormatTimecode(3723.456), "01:02:03:456");
    EXPECT_EQ(FormatTimecode(ParseTimecode("00:12:34:567")), "00:12:34:567");
    EXPECT_THROW(FormatTimecode(-0.5), InvalidDurationException);
    EXPECT_THROW(FormatTimecode(1e25), InvalidDurationException);
    EXPECT_EQ(FormatTimecode(ParseTimecode("99:59:59:999")), "99:59:59:999");
}

TEST(TimecodeTest, DialogueWindowDuration) {
    DialogueWindow window{"00:00:01:000", "00:00:04:000", std::nullopt};
    EXPECT_DOUBLE_EQ(window.MaxDurationSeconds(), 3.0);

    DialogueWindow fractional{"00:00:01:100", "00:00:03:350", std::nullopt};
    EXPECT_NEAR(fractional.MaxDurationSeconds(), 2.25, 1e-9);

    DialogueWindow reversed{"00:00:04:000", "00:00:01:000", std::nullopt};
    DialogueWindow empty{"00:00:04:000", "00:00:04:000", std::nullopt};
    EXPECT_THROW(reversed.MaxDurationSeconds(), InvalidDurationException);
    EXPECT_THROW(empty.MaxDurationSeconds(), InvalidDurationException);
}

TEST(TimecodeTest, DurationsMatchWithinTolerance) {
    EXPECT_TRUE(DurationsMatch(3.05, 3.0, 0.1));
    EXPECT_FALSE(DurationsMatch(3.2, 3.0, 0.1));
    EXPECT_TRUE(DurationsMatch(3.2, 3.0, 0.5));
}
