#include <gtest/gtest.h>

#include "core/availability_parser.hpp"
#include "core/slot_formatter.hpp"

namespace {

TEST(SlotFormatterTest, FixtureInPacificTime)
{
    EXPECT_EQ(core::format_slot(core::fixture_slot(), "America/Los_Angeles"), "Oct 22 11:00AM - 11:30AM");
}

TEST(SlotFormatterTest, UtcAndZeroPaddedHour)
{
    core::Slot slot = core::fixture_slot();
    EXPECT_EQ(core::format_slot(slot, "UTC"), "Oct 22 06:00PM - 06:30PM");
}

TEST(SlotFormatterTest, HalfHourOffsetZone)
{
    EXPECT_EQ(core::format_slot(core::fixture_slot(), "Asia/Kolkata"), "Oct 22 11:30PM - 12:00AM");
}

TEST(SlotFormatterTest, SameInputSameOutput)
{
    core::Slot slot = core::fixture_slot();
    std::string first = core::format_slot(slot, "America/New_York");
    EXPECT_EQ(first, "Oct 22 02:00PM - 02:30PM");
    EXPECT_EQ(core::format_slot(slot, "America/New_York"), first);
}

TEST(SlotFormatterTest, OneLinePerSlot)
{
    core::Slot a = core::fixture_slot();
    core::Slot b = a;
    b.start += 86400;
    b.end += 86400;
    EXPECT_EQ(core::format_slots({a, b}, "America/Los_Angeles"),
              "Oct 22 11:00AM - 11:30AM\nOct 23 11:00AM - 11:30AM");
    EXPECT_EQ(core::format_slots({}, "America/Los_Angeles"), "");
}

TEST(SlotFormatterTest, Message)
{
    EXPECT_EQ(core::build_message("Oct 22 11:00AM - 11:30AM", "https://example.com/book"),
              "Booking Slots Available!\n\nOct 22 11:00AM - 11:30AM\n\nGo to: https://example.com/book");
}

} // namespace
