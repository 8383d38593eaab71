/**
 * @file test_request_validator.cpp
 * @brief Unit tests for request shape and size checks.
 */

#include "engine/request_validator.hpp"

#include <gtest/gtest.h>

using namespace sandbox_exec;

class RequestValidatorTest : public ::testing::Test {
protected:
    LimitsConfig limits_;

    static ExecutionRequest request(std::string language = "python", std::string code = "print(1)") {
        return ExecutionRequest{.language = std::move(language), .code = std::move(code), .options = {}};
    }

    void expect_invalid(const ExecutionRequest& req) const {
        auto result = validate_request(req, limits_);
        ASSERT_FALSE(result.has_value());
        EXPECT_TRUE(result.error().is(ErrorKind::Validation)) << result.error().message;
    }
};

TEST_F(RequestValidatorTest, AcceptsMinimalRequestWithDefaultTimeout) {
    auto timeout = validate_request(request(), limits_);
    ASSERT_TRUE(timeout.has_value());
    EXPECT_EQ(*timeout, limits_.default_timeout_ms);
}

TEST_F(RequestValidatorTest, ExplicitTimeoutIsReturned) {
    auto req = request();
    req.options.timeout_ms = 2500;
    EXPECT_EQ(validate_request(req, limits_).value(), 2500u);
}

TEST_F(RequestValidatorTest, TimeoutBoundsAreInclusive) {
    auto req = request();
    req.options.timeout_ms = limits_.min_timeout_ms;
    EXPECT_TRUE(validate_request(req, limits_).has_value());
    req.options.timeout_ms = limits_.max_timeout_ms;
    EXPECT_TRUE(validate_request(req, limits_).has_value());

    req.options.timeout_ms = limits_.min_timeout_ms - 1;
    expect_invalid(req);
    req.options.timeout_ms = limits_.max_timeout_ms + 1;
    expect_invalid(req);
}

TEST_F(RequestValidatorTest, LanguageNameShape) {
    expect_invalid(request(""));
    expect_invalid(request(std::string(kMaxLanguageNameLength + 1, 'a')));
    expect_invalid(request("py thon"));
    expect_invalid(request("python\n"));
    EXPECT_TRUE(validate_request(request(std::string(kMaxLanguageNameLength, 'a')), limits_).has_value());
}

TEST_F(RequestValidatorTest, UnknownButWellFormedLanguagePasses) {
    // Existence is the language registry's call, not the validator's.
    EXPECT_TRUE(validate_request(request("cobol"), limits_).has_value());
}

TEST_F(RequestValidatorTest, CodeSize) {
    expect_invalid(request("python", ""));

    limits_.max_code_bytes = 16;
    EXPECT_TRUE(validate_request(request("python", std::string(16, 'x')), limits_).has_value());
    expect_invalid(request("python", std::string(17, 'x')));
}

TEST_F(RequestValidatorTest, ProjectIdLength) {
    auto req = request();
    req.options.project_id = "";
    expect_invalid(req);
    req.options.project_id = std::string(kMaxProjectIdLength + 1, 'p');
    expect_invalid(req);
    req.options.project_id = std::string(kMaxProjectIdLength, 'p');
    EXPECT_TRUE(validate_request(req, limits_).has_value());
}
