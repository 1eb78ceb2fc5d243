#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>

#include "core/release/ImageTag.hpp"

namespace {

// 2024-03-05 07:08:09 UTC
std::chrono::system_clock::time_point fixed_time() {
  return std::chrono::system_clock::time_point(std::chrono::seconds(1709622489));
}

}

TEST(ImageTag, DateTimeAndCommit) {
  EXPECT_EQ(nb::make_image_tag(fixed_time(), "abc1234", false), "20240305.070809.abc1234");
}

TEST(ImageTag, DirtyTreeIsMarked) {
  EXPECT_EQ(nb::make_image_tag(fixed_time(), "abc1234", true), "20240305.070809.abc1234-dirty");
}

TEST(ImageTag, EmptyCommitIsRejected) {
  EXPECT_THROW(nb::make_image_tag(fixed_time(), "", false), std::invalid_argument);
}
