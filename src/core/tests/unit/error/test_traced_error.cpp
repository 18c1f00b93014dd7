#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <core/error/traced_error.h>
#include <core/tests/test_utils.h>
#include <atomic>
#include <mutex>
#include <utility>
#include <vector>

using namespace tracerr::core::error;
using tracerr::core::config::CaptureConfig;
using tracerr::core::test::ScopedLogCapture;
using tracerr::core::test::run_parallel;
using testing::HasSubstr;
using testing::EndsWith;

namespace {

// Each helper records the line of its library call so tests can compare it
// with the first captured frame.

CORE_NOINLINE ErrorPtr create_error_here(int* line) {
    ErrorPtr err = new_error("boom"); *line = __LINE__;
    return err;
}

CORE_NOINLINE ErrorPtr create_formatted_error_here(int* line) {
    ErrorPtr err = errorf("code %d: %s", 42, "bad input"); *line = __LINE__;
    return err;
}

CORE_NOINLINE ErrorPtr wrap_here(const ErrorPtr& cause, int* line) {
    ErrorPtr err = wrap(cause); *line = __LINE__;
    return err;
}

CORE_NOINLINE ErrorPtr create_with_tracer(const Tracer& tracer) {
    ErrorPtr err = tracer.new_error("from tracer");
    return err;
}

// A library helper hiding the tracer one frame below its own caller
CORE_NOINLINE ErrorPtr library_helper(const Tracer& tracer) {
    ErrorPtr err = tracer.new_error("from library");
    return err;
}

CORE_NOINLINE ErrorPtr call_library_helper(const Tracer& tracer, int* line) {
    ErrorPtr err = library_helper(tracer); *line = __LINE__;
    return err;
}

CORE_NOINLINE std::pair<ErrorPtr, ErrorPtr> create_with_both(const Tracer& first,
                                                             const Tracer& second) {
    ErrorPtr a = first.new_error("first");
    ErrorPtr b = second.new_error("second");
    return {a, b};
}

CORE_NOINLINE ErrorPtr wrap_with_tracer(const Tracer& tracer, const ErrorPtr& cause) {
    ErrorPtr err = tracer.wrap(cause);
    return err;
}

// Error type that carries a trace without being a TracedError
class ForeignTracedError : public Error, public HasStackTrace {
public:
    ForeignTracedError(std::string message, StackTrace frames)
        : message_(std::move(message)), frames_(std::move(frames)) {}

    std::string message() const override { return message_; }
    const StackTrace& stack_trace() const override { return frames_; }

private:
    std::string message_;
    StackTrace frames_;
};

StackTrace fixed_frames() {
    return StackTrace({
        {"app::parse", "/src/app/parse.cpp", 12},
        {"app::main", "/src/app/main.cpp", 3},
    });
}

} // namespace

class TracedErrorTest : public ::testing::Test {
};

// ========== new_error / errorf ==========

TEST_F(TracedErrorTest, NewErrorKeepsMessage) {
    ErrorPtr err = new_error("something failed");

    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->message(), "something failed");
}

TEST_F(TracedErrorTest, NewErrorMessageIsLiteral) {
    ErrorPtr err = new_error("100% done %s");
    EXPECT_EQ(err->message(), "100% done %s");
}

TEST_F(TracedErrorTest, NewErrorFirstFrameIsCaller) {
    int line = 0;
    ErrorPtr err = create_error_here(&line);
    StackTrace frames = stack_trace(err);

    ASSERT_FALSE(frames.empty());
    EXPECT_THAT(frames[0].function, HasSubstr("create_error_here"));
    EXPECT_THAT(frames[0].path, EndsWith("test_traced_error.cpp"));
    EXPECT_EQ(frames[0].line, static_cast<line_type>(line));
}

TEST_F(TracedErrorTest, NewErrorSecondFrameIsCallersCaller) {
    int line = 0;
    StackTrace frames = stack_trace(create_error_here(&line));

    ASSERT_GE(frames.size(), 2u);
    EXPECT_THAT(frames[1].function, HasSubstr("NewErrorSecondFrameIsCallersCaller"));
}

TEST_F(TracedErrorTest, NoLibraryFramesRecorded) {
    int line = 0;
    StackTrace frames = stack_trace(create_error_here(&line));

    for (const auto& frame : frames) {
        EXPECT_THAT(frame.function, testing::Not(HasSubstr("trace_new")));
        EXPECT_THAT(frame.function, testing::Not(HasSubstr("StackCapturer")));
    }
}

TEST_F(TracedErrorTest, ErrorfFormatsMessage) {
    int line = 0;
    ErrorPtr err = create_formatted_error_here(&line);

    EXPECT_EQ(err->message(), "code 42: bad input");

    StackTrace frames = stack_trace(err);
    ASSERT_FALSE(frames.empty());
    EXPECT_THAT(frames[0].function, HasSubstr("create_formatted_error_here"));
    EXPECT_EQ(frames[0].line, static_cast<line_type>(line));
}

TEST_F(TracedErrorTest, UnwrapOfNewErrorIsPlain) {
    ErrorPtr err = new_error("plain inside");
    ErrorPtr inner = unwrap(err);

    ASSERT_NE(inner, nullptr);
    EXPECT_NE(inner, err);
    EXPECT_EQ(inner->message(), "plain inside");
    EXPECT_TRUE(stack_trace(inner).empty());
}

// ========== wrap ==========

TEST_F(TracedErrorTest, WrapNullIsNull) {
    EXPECT_EQ(wrap(nullptr), nullptr);
}

TEST_F(TracedErrorTest, WrapPlainErrorCaptures) {
    ErrorPtr plain = make_error("disk full");
    int line = 0;
    ErrorPtr err = wrap_here(plain, &line);

    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->message(), "disk full");
    EXPECT_EQ(unwrap(err), plain);

    StackTrace frames = stack_trace(err);
    ASSERT_FALSE(frames.empty());
    EXPECT_THAT(frames[0].function, HasSubstr("wrap_here"));
    EXPECT_EQ(frames[0].line, static_cast<line_type>(line));
}

TEST_F(TracedErrorTest, WrapTracedErrorIsIdentity) {
    ErrorPtr err = new_error("once");

    EXPECT_EQ(wrap(err), err);
    EXPECT_EQ(wrap(wrap(err)), err);
}

TEST_F(TracedErrorTest, WrapForeignTracedErrorIsIdentity) {
    ErrorPtr foreign = std::make_shared<ForeignTracedError>("foreign", fixed_frames());

    EXPECT_EQ(wrap(foreign), foreign);
    EXPECT_EQ(stack_trace(foreign), fixed_frames());
}

TEST_F(TracedErrorTest, WrapReusesInnerTrace) {
    int line = 0;
    ErrorPtr origin = create_error_here(&line);
    ErrorPtr context = make_wrapped("loading config", origin);

    int wrap_line = 0;
    ErrorPtr err = wrap_here(context, &wrap_line);

    ASSERT_NE(err, nullptr);
    EXPECT_NE(err, context);
    EXPECT_EQ(err->message(), "loading config: boom");
    EXPECT_EQ(stack_trace(err), stack_trace(origin));
    EXPECT_THAT(stack_trace(err)[0].function, HasSubstr("create_error_here"));
}

TEST_F(TracedErrorTest, WrapReusesTraceFromDeepChain) {
    ErrorPtr origin = new_error("root");
    ErrorPtr level1 = make_wrapped("level 1", origin);
    ErrorPtr level2 = make_wrapped("level 2", level1);

    ErrorPtr err = wrap(level2);

    EXPECT_EQ(err->message(), "level 2: level 1: root");
    EXPECT_EQ(stack_trace(err), stack_trace(origin));
}

TEST_F(TracedErrorTest, WrapPropagationKeepsChain) {
    ErrorPtr origin = new_error("root");
    ErrorPtr context = make_wrapped("ctx", origin);

    ErrorPtr err = wrap(context);

    ErrorPtr original = unwrap(err);
    ASSERT_NE(original, nullptr);
    EXPECT_EQ(original->message(), context->message());
    EXPECT_EQ(original->unwrap(), context);
    EXPECT_TRUE(is(err, context));
    EXPECT_TRUE(is(err, origin));
}

TEST_F(TracedErrorTest, WrapPropagatesForeignTrace) {
    ErrorPtr foreign = std::make_shared<ForeignTracedError>("foreign", fixed_frames());
    ErrorPtr context = make_wrapped("ctx", foreign);

    ErrorPtr err = wrap(context);

    EXPECT_EQ(err->message(), "ctx: foreign");
    EXPECT_EQ(stack_trace(err), fixed_frames());
}

// ========== unwrap / custom_error / stack_trace ==========

TEST_F(TracedErrorTest, UnwrapNullIsNull) {
    EXPECT_EQ(unwrap(nullptr), nullptr);
}

TEST_F(TracedErrorTest, UnwrapPlainErrorPassesThrough) {
    ErrorPtr plain = make_error("plain");
    EXPECT_EQ(unwrap(plain), plain);

    ErrorPtr wrapped = make_wrapped("ctx", plain);
    EXPECT_EQ(unwrap(wrapped), wrapped);
}

TEST_F(TracedErrorTest, CustomErrorUsesGivenFrames) {
    ErrorPtr plain = make_error("custom");
    ErrorPtr err = custom_error(plain, fixed_frames());

    ASSERT_NE(err, nullptr);
    EXPECT_EQ(err->message(), "custom");
    EXPECT_EQ(stack_trace(err), fixed_frames());
    EXPECT_EQ(unwrap(err), plain);
}

TEST_F(TracedErrorTest, CustomErrorWithEmptyFrames) {
    ErrorPtr err = custom_error(make_error("no frames"), StackTrace());

    ASSERT_NE(err, nullptr);
    EXPECT_TRUE(stack_trace(err).empty());
    EXPECT_EQ(wrap(err), err);
}

TEST_F(TracedErrorTest, CustomErrorNullIsNull) {
    EXPECT_EQ(custom_error(nullptr, fixed_frames()), nullptr);
}

TEST_F(TracedErrorTest, StackTraceOfUntracedIsEmpty) {
    EXPECT_TRUE(stack_trace(nullptr).empty());
    EXPECT_TRUE(stack_trace(make_error("plain")).empty());
    EXPECT_TRUE(stack_trace(make_wrapped("ctx", new_error("traced"))).empty());
}

TEST_F(TracedErrorTest, TracedErrorDirectConstruction) {
    ErrorPtr plain = make_error("direct");
    TracedError traced(plain, fixed_frames());

    EXPECT_EQ(traced.message(), "direct");
    EXPECT_EQ(traced.unwrap(), plain);
    EXPECT_EQ(traced.stack_trace(), fixed_frames());
}

// ========== Tracer ==========

TEST_F(TracedErrorTest, TracerDefaultConfig) {
    Tracer tracer;
    EXPECT_EQ(tracer.config(), CaptureConfig::defaults());
}

TEST_F(TracedErrorTest, TracerFirstFrameIsCaller) {
    Tracer tracer;
    StackTrace frames = stack_trace(create_with_tracer(tracer));

    ASSERT_FALSE(frames.empty());
    EXPECT_THAT(frames[0].function, HasSubstr("create_with_tracer"));
}

TEST_F(TracedErrorTest, TracerExtraSkipHidesLibraryFrame) {
    Tracer tracer(tracerr::config::DEFAULT_FRAME_CAPACITY,
                  tracerr::config::DEFAULT_FRAME_SKIP_COUNT + 1);
    int line = 0;
    StackTrace frames = stack_trace(call_library_helper(tracer, &line));

    ASSERT_FALSE(frames.empty());
    EXPECT_THAT(frames[0].function, HasSubstr("call_library_helper"));
    EXPECT_EQ(frames[0].line, static_cast<line_type>(line));
}

TEST_F(TracedErrorTest, ExtraSkipDropsHeadFrame) {
    Tracer shallow(CaptureConfig{}.with_skip_depth(2));
    Tracer deep(CaptureConfig{}.with_skip_depth(3));

    auto [a, b] = create_with_both(shallow, deep);
    StackTrace shallow_frames = stack_trace(a);
    StackTrace deep_frames = stack_trace(b);

    ASSERT_GE(shallow_frames.size(), 2u);
    std::vector<StackFrame> tail(shallow_frames.begin() + 1, shallow_frames.end());
    EXPECT_EQ(deep_frames, StackTrace(tail));
}

TEST_F(TracedErrorTest, TracerCapacityIsOnlyAHint) {
    Tracer tracer(1, tracerr::config::DEFAULT_FRAME_SKIP_COUNT);
    StackTrace frames = stack_trace(create_with_tracer(tracer));

    EXPECT_GT(frames.size(), 1u);
}

TEST_F(TracedErrorTest, TracerWrapBehavesLikeWrap) {
    Tracer tracer;
    ErrorPtr plain = make_error("plain");
    ErrorPtr err = wrap_with_tracer(tracer, plain);

    StackTrace frames = stack_trace(err);
    ASSERT_FALSE(frames.empty());
    EXPECT_THAT(frames[0].function, HasSubstr("wrap_with_tracer"));
    EXPECT_EQ(tracer.wrap(err), err);
    EXPECT_EQ(tracer.wrap(nullptr), nullptr);
    EXPECT_EQ(tracer.unwrap(err), plain);
}

TEST_F(TracedErrorTest, TracerErrorfAndCustomError) {
    Tracer tracer;

    ErrorPtr formatted = tracer.errorf("%s=%d", "retries", 3);
    EXPECT_EQ(formatted->message(), "retries=3");

    ErrorPtr custom = tracer.custom_error(make_error("c"), fixed_frames());
    EXPECT_EQ(stack_trace(custom), fixed_frames());
    EXPECT_EQ(tracer.custom_error(nullptr, fixed_frames()), nullptr);
}

TEST_F(TracedErrorTest, DefaultTracerIsShared) {
    EXPECT_EQ(&default_tracer(), &default_tracer());
}

// ========== Logging ==========

TEST_F(TracedErrorTest, CaptureIsLoggedAtTrace) {
    if (!CORE_ENABLE_LOGGING) {
        GTEST_SKIP() << "log statements compiled out";
    }
    ScopedLogCapture capture("tracerr.error");

    ErrorPtr err = new_error("logged failure");

    EXPECT_TRUE(capture.contains("logged failure"));
    EXPECT_TRUE(capture.contains("captured"));
}

TEST_F(TracedErrorTest, PropagationIsLoggedAtTrace) {
    if (!CORE_ENABLE_LOGGING) {
        GTEST_SKIP() << "log statements compiled out";
    }
    ErrorPtr origin = new_error("origin");
    ScopedLogCapture capture("tracerr.error");

    ErrorPtr err = wrap(make_wrapped("ctx", origin));

    EXPECT_TRUE(capture.contains("reusing"));
}

TEST_F(TracedErrorTest, SilentAtDefaultLevel) {
    ScopedLogCapture capture("tracerr.error", tracerr::core::logging::LogLevel::INFO);

    ErrorPtr err = new_error("quiet");

    EXPECT_EQ(capture.sink().size(), 0u);
}

// ========== Concurrency ==========

TEST_F(TracedErrorTest, ConcurrentCreationAndWrap) {
    ErrorPtr shared = new_error("shared origin");
    std::atomic<int> failures{0};

    run_parallel(8, [&](int id) {
        for (int i = 0; i < 50; ++i) {
            ErrorPtr own = errorf("thread %d iteration %d", id, i);
            if (stack_trace(own).empty()) {
                failures++;
            }
            ErrorPtr propagated = wrap(make_wrapped("ctx", shared));
            if (!(stack_trace(propagated) == stack_trace(shared))) {
                failures++;
            }
        }
    });

    EXPECT_EQ(failures.load(), 0);
}
