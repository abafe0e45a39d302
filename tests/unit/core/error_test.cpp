#include <memoria/core/error.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

namespace mc = memoria::core;

TEST(PipelineError, ToStringNamesEveryCode) {
  EXPECT_EQ(mc::to_string(mc::PipelineError::None), "none");
  EXPECT_EQ(mc::to_string(mc::PipelineError::NotFound), "not found");
  EXPECT_EQ(mc::to_string(mc::PipelineError::EncoderFailed), "encoder failed");
  EXPECT_EQ(mc::to_string(mc::PipelineError::InvalidArgument), "invalid argument");
}

TEST(PipelineFailure, CarriesCodeAndMessage) {
  try {
    throw mc::PipelineFailure(mc::PipelineError::NotFound, "input image not found: a.jpg");
  } catch (const std::runtime_error& e) {
    EXPECT_STREQ(e.what(), "input image not found: a.jpg");
    const auto* failure = dynamic_cast<const mc::PipelineFailure*>(&e);
    ASSERT_NE(failure, nullptr);
    EXPECT_EQ(failure->code(), mc::PipelineError::NotFound);
  }
}

TEST(Canceled, IsDistinctFromPipelineFailure) {
  bool caught_canceled = false;
  try {
    throw mc::Canceled();
  } catch (const mc::PipelineFailure&) {
    FAIL() << "Canceled must not be a PipelineFailure";
  } catch (const mc::Canceled& e) {
    caught_canceled = true;
    EXPECT_STREQ(e.what(), "pipeline run canceled");
  }
  EXPECT_TRUE(caught_canceled);
}
