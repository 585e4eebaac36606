#include <gtest/gtest.h>
#include "core/Error.hpp"

#include <cstring>

using namespace fmodpp;

TEST(ErrorTest, SuccessIsTheOnlySuccessKind) {
    EXPECT_EQ(classify(FMOD_OK), ErrorKind::Success);
    EXPECT_NE(classify(FMOD_ERR_INTERNAL), ErrorKind::Success);
}

TEST(ErrorTest, RepresentativeCodesClassify) {
    EXPECT_EQ(classify(FMOD_ERR_INVALID_PARAM), ErrorKind::Configuration);
    EXPECT_EQ(classify(FMOD_ERR_INVALID_HANDLE), ErrorKind::Configuration);
    EXPECT_EQ(classify(FMOD_ERR_DSP_FORMAT), ErrorKind::Configuration);
    EXPECT_EQ(classify(FMOD_ERR_MEMORY), ErrorKind::Resource);
    EXPECT_EQ(classify(FMOD_ERR_TRUNCATED), ErrorKind::Resource);
    EXPECT_EQ(classify(FMOD_ERR_UNSUPPORTED), ErrorKind::Unavailable);
    EXPECT_EQ(classify(FMOD_ERR_HEADER_MISMATCH), ErrorKind::Unavailable);
    EXPECT_EQ(classify(FMOD_ERR_NOTREADY), ErrorKind::NotReady);
    EXPECT_EQ(classify(FMOD_ERR_FILE_NOTFOUND), ErrorKind::IO);
    EXPECT_EQ(classify(FMOD_ERR_HTTP_TIMEOUT), ErrorKind::IO);
    EXPECT_EQ(classify(FMOD_ERR_INTERNAL), ErrorKind::Internal);
}

TEST(ErrorTest, UnknownCodesAreInternal) {
    EXPECT_EQ(classify(static_cast<FMOD_RESULT>(9999)), ErrorKind::Internal);
    EXPECT_EQ(classify(static_cast<FMOD_RESULT>(-1)), ErrorKind::Internal);
}

TEST(ErrorTest, NoNativeCodeIsAContractViolation) {
    for (int code = 0; code < 100; ++code) {
        EXPECT_NE(classify(static_cast<FMOD_RESULT>(code)), ErrorKind::ContractViolation) << "code " << code;
    }
}

TEST(ErrorTest, ErrorCarriesCodeKindAndDescription) {
    Error error(FMOD_ERR_MEMORY);
    EXPECT_EQ(error.code(), FMOD_ERR_MEMORY);
    EXPECT_EQ(error.kind(), ErrorKind::Resource);
    ASSERT_NE(error.what(), nullptr);
    EXPECT_GT(std::strlen(error.what()), 0u);
    EXPECT_EQ(error, Error(FMOD_ERR_MEMORY));
}

TEST(ErrorTest, CheckConvertsCodes) {
    EXPECT_TRUE(check(FMOD_OK).has_value());

    auto failed = check(FMOD_ERR_INVALID_PARAM);
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().kind(), ErrorKind::Configuration);

    auto value = check(FMOD_OK, 7);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 7);

    auto no_value = check(FMOD_ERR_NOTREADY, 7);
    ASSERT_FALSE(no_value.has_value());
    EXPECT_EQ(no_value.error().code(), FMOD_ERR_NOTREADY);
}

TEST(ErrorTest, KindNames) {
    EXPECT_STREQ(kind_name(ErrorKind::Configuration), "Configuration");
    EXPECT_STREQ(kind_name(ErrorKind::ContractViolation), "ContractViolation");
}
