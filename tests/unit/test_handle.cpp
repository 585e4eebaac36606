#include <gtest/gtest.h>
#include "core/Handle.hpp"
#include "TestHelper.hpp"

#include <stdexcept>

using namespace fmodpp;

namespace {

struct FakeNative {
    int id;
};

/**
 * @brief Minimal view type with a counting release function.
 */
class FakeResource {
public:
    using Raw = FakeNative;
    static constexpr const char* TYPE_NAME = "FakeResource";

    static inline int release_calls = 0;
    static inline FMOD_RESULT release_result = FMOD_OK;
    static inline FakeNative* last_released = nullptr;

    static FakeResource from_raw(Raw* raw) noexcept { return FakeResource(raw); }
    Raw* as_raw() const noexcept { return raw_; }
    static FMOD_RESULT raw_release(Raw* raw) noexcept {
        ++release_calls;
        last_released = raw;
        return release_result;
    }

    int id() const { return raw_->id; }

private:
    explicit FakeResource(Raw* raw) noexcept : raw_(raw) {}
    Raw* raw_;
};

class HandleTest : public ::testing::Test {
protected:
    void SetUp() override {
        FakeResource::release_calls = 0;
        FakeResource::release_result = FMOD_OK;
        FakeResource::last_released = nullptr;
        Logger::instance().clear();
    }

    FakeNative native{42};
};

Result<int> use_and_bail_out_early(FakeNative* native) {
    auto handle = Handle<FakeResource>::acquire(native);
    if (handle->id() == 42) {
        return std::unexpected(Error(FMOD_ERR_INVALID_PARAM));
    }
    return handle->id();
}

} // namespace

TEST_F(HandleTest, ReleasesExactlyOnceAtScopeExit) {
    {
        auto handle = Handle<FakeResource>::acquire(&native);
        EXPECT_EQ(handle->id(), 42);
        EXPECT_EQ(FakeResource::release_calls, 0);
    }
    EXPECT_EQ(FakeResource::release_calls, 1);
    EXPECT_EQ(FakeResource::last_released, &native);
}

TEST_F(HandleTest, ReleasesOnEarlyReturn) {
    auto result = use_and_bail_out_early(&native);
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(FakeResource::release_calls, 1);
}

TEST_F(HandleTest, ReleasesWhenAnExceptionUnwinds) {
    try {
        auto handle = Handle<FakeResource>::acquire(&native);
        throw std::runtime_error("unwind");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(FakeResource::release_calls, 1);
}

TEST_F(HandleTest, LeakReturnsSamePointerWithoutRelease) {
    FakeNative* leaked = nullptr;
    {
        auto handle = Handle<FakeResource>::acquire(&native);
        leaked = std::move(handle).leak();
    }
    EXPECT_EQ(leaked, &native);
    EXPECT_EQ(FakeResource::release_calls, 0);
}

TEST_F(HandleTest, UnleakRestoresReleaseResponsibility) {
    FakeNative* leaked = std::move(Handle<FakeResource>::acquire(&native)).leak();
    {
        auto again = Handle<FakeResource>::unleak(FakeResource::from_raw(leaked));
        EXPECT_EQ(again.as_raw(), &native);
    }
    EXPECT_EQ(FakeResource::release_calls, 1);
}

TEST_F(HandleTest, AcquireNullIsAContractViolation) {
    EXPECT_THROW(Handle<FakeResource>::acquire(nullptr), ContractViolation);
    EXPECT_THROW(borrow<FakeResource>(nullptr), ContractViolation);
    EXPECT_EQ(FakeResource::release_calls, 0);
}

TEST_F(HandleTest, MoveTransfersResponsibility) {
    {
        auto first = Handle<FakeResource>::acquire(&native);
        auto second = std::move(first);
        EXPECT_EQ(first.as_raw(), nullptr);
        EXPECT_EQ(second.as_raw(), &native);
    }
    EXPECT_EQ(FakeResource::release_calls, 1);
}

TEST_F(HandleTest, MoveAssignmentReleasesPreviousObject) {
    FakeNative other{7};
    auto target = Handle<FakeResource>::acquire(&other);
    target = Handle<FakeResource>::acquire(&native);
    EXPECT_EQ(FakeResource::release_calls, 1);
    EXPECT_EQ(FakeResource::last_released, &other);
    EXPECT_EQ(target->id(), 42);
}

TEST_F(HandleTest, ExplicitReleaseReportsResultAndNeverRepeats) {
    FakeResource::release_result = FMOD_ERR_INVALID_HANDLE;
    auto handle = Handle<FakeResource>::acquire(&native);
    auto result = std::move(handle).try_release();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), FMOD_ERR_INVALID_HANDLE);
    EXPECT_EQ(FakeResource::release_calls, 1);
    EXPECT_EQ(handle.as_raw(), nullptr);
}

TEST_F(HandleTest, DestructorLogsAndSwallowsReleaseFailure) {
    FakeResource::release_result = FMOD_ERR_DSP_INUSE;
    {
        auto handle = Handle<FakeResource>::acquire(&native);
    }
    EXPECT_EQ(FakeResource::release_calls, 1);
    auto lines = test::drain_log();
    EXPECT_TRUE(test::log_contains(lines, "releasing FakeResource"));
    EXPECT_TRUE(test::log_contains(lines, "failed (Configuration)"));
}

TEST_F(HandleTest, FailedCreationNeverYieldsAHandle) {
    auto created = adopt<FakeResource>(FMOD_ERR_MEMORY, nullptr);
    ASSERT_FALSE(created.has_value());
    EXPECT_EQ(created.error().kind(), ErrorKind::Resource);
    EXPECT_EQ(FakeResource::release_calls, 0);

    auto succeeded = adopt<FakeResource>(FMOD_OK, &native);
    ASSERT_TRUE(succeeded.has_value());
    EXPECT_EQ(succeeded->get().id(), 42);
}

TEST_F(HandleTest, BorrowedViewsNeverRelease) {
    {
        FakeResource view = borrow<FakeResource>(&native);
        EXPECT_EQ(view.id(), 42);
    }
    EXPECT_EQ(FakeResource::release_calls, 0);
}
