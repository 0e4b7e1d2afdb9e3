#include <gtest/gtest.h>

#include <string>

#include "s3_cpp/meta_request.hpp"

using namespace s3_cpp;

TEST(MetaRequestTest, StartsCreatedWithUniqueIds) {
    MetaRequest<int> a(MetaRequestKind::GetObject, WireRequest{});
    MetaRequest<int> b(MetaRequestKind::PutObject, WireRequest{});
    EXPECT_EQ(a.state(), MetaRequestState::Created);
    EXPECT_NE(a.id(), b.id());
    EXPECT_EQ(b.kind(), MetaRequestKind::PutObject);
    EXPECT_FALSE(a.is_finished());
}

TEST(MetaRequestTest, RetrievalWalksForward) {
    MetaRequest<int> m(MetaRequestKind::GetObject, WireRequest{});
    EXPECT_TRUE(m.advance(MetaRequestState::Sent));
    EXPECT_TRUE(m.advance(MetaRequestState::HeadersReceived));
    EXPECT_TRUE(m.advance(MetaRequestState::BodyStreaming));
    EXPECT_EQ(m.state(), MetaRequestState::BodyStreaming);
}

TEST(MetaRequestTest, NoBackwardOrRepeatedSteps) {
    MetaRequest<int> m(MetaRequestKind::GetObject, WireRequest{});
    ASSERT_TRUE(m.advance(MetaRequestState::HeadersReceived));
    EXPECT_FALSE(m.advance(MetaRequestState::Sent));
    EXPECT_FALSE(m.advance(MetaRequestState::HeadersReceived));
    EXPECT_EQ(m.state(), MetaRequestState::HeadersReceived);
}

TEST(MetaRequestTest, StreamingAndSendingAreExclusive) {
    MetaRequest<int> m(MetaRequestKind::PutObject, WireRequest{});
    ASSERT_TRUE(m.advance(MetaRequestState::BodySending));
    EXPECT_FALSE(m.advance(MetaRequestState::BodyStreaming));
    EXPECT_FALSE(m.advance(MetaRequestState::HeadersReceived));
    EXPECT_EQ(m.state(), MetaRequestState::BodySending);
}

TEST(MetaRequestTest, OnlyFinishEndsTheRequest) {
    MetaRequest<int> m(MetaRequestKind::GetObject, WireRequest{});
    EXPECT_FALSE(m.advance(MetaRequestState::Finished));
    EXPECT_FALSE(m.is_finished());
}

TEST(MetaRequestTest, FirstFinishWins) {
    MetaRequest<int> m(MetaRequestKind::GetObject, WireRequest{});
    EXPECT_TRUE(m.finish(Result<int>::ok(1)));
    EXPECT_FALSE(m.finish(Result<int>::err(Error::Code::Timeout, "late")));
    EXPECT_TRUE(m.is_finished());

    auto r = m.take_result();
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 1);
}

TEST(MetaRequestTest, FinishAfterTakeIsStillRejected) {
    MetaRequest<int> m(MetaRequestKind::GetObject, WireRequest{});
    ASSERT_TRUE(m.finish(Result<int>::err(Error::Code::SendFailed, "x")));
    auto first = m.take_result();
    ASSERT_TRUE(first.has_error());
    EXPECT_EQ(first.error().code, Error::Code::SendFailed);

    EXPECT_FALSE(m.finish(Result<int>::ok(2)));
    auto second = m.take_result();
    ASSERT_TRUE(second.has_error());
    EXPECT_EQ(second.error().code, Error::Code::Unknown);
}

TEST(MetaRequestTest, NoStateChangeAfterFinish) {
    MetaRequest<int> m(MetaRequestKind::GetObject, WireRequest{});
    ASSERT_TRUE(m.finish(Result<int>::ok(0)));
    EXPECT_FALSE(m.advance(MetaRequestState::BodyStreaming));
    EXPECT_EQ(m.state(), MetaRequestState::Finished);
}

TEST(MetaRequestTest, MappingErrorsAreKept) {
    MetaRequest<int> m(MetaRequestKind::GetObject, WireRequest{});
    m.record_mapping_error({Error::Code::HeaderMapping, "bad Content-Length"});
    auto errors = m.mapping_errors();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, Error::Code::HeaderMapping);
}

TEST(MetaRequestTest, StateNames) {
    EXPECT_STREQ(to_string(MetaRequestState::BodySending), "BodySending");
    EXPECT_STREQ(to_string(MetaRequestKind::GetObject), "GetObject");
}
