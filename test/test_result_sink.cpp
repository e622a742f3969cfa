// ===================== test/test_result_sink.cpp =====================
#include <gtest/gtest.h>

#include "result_sink.hpp"

using namespace netprobe;

TEST(ResultSink, SetOverwritesPerLabelSet)
{
    ResultSink sink;
    sink.set("probe_http_status_code", 301);
    sink.set("probe_http_status_code", 200);
    EXPECT_EQ(sink.value("probe_http_status_code"), 200);
    EXPECT_EQ(sink.family("probe_http_status_code").size(), 1u);
}

TEST(ResultSink, LabelsSeparateSamples)
{
    ResultSink sink;
    sink.set("probe_http_duration_seconds", 0.25, {{"phase", "connect"}});
    sink.set("probe_http_duration_seconds", 0.5, {{"phase", "tls"}});

    EXPECT_EQ(sink.value("probe_http_duration_seconds", {{"phase", "connect"}}), 0.25);
    EXPECT_EQ(sink.value("probe_http_duration_seconds", {{"phase", "tls"}}), 0.5);
    EXPECT_FALSE(sink.value("probe_http_duration_seconds").has_value());
    EXPECT_EQ(sink.family("probe_http_duration_seconds").size(), 2u);
}

TEST(ResultSink, AddAccumulates)
{
    ResultSink sink;
    sink.describe("probe_bytes_total", "Bytes seen", SampleKind::Counter);
    sink.add("probe_bytes_total", 10);
    sink.add("probe_bytes_total", 5);
    EXPECT_EQ(sink.value("probe_bytes_total"), 15);
    EXPECT_EQ(sink.kind("probe_bytes_total"), SampleKind::Counter);
}

TEST(ResultSink, DescribeWithoutValues)
{
    ResultSink sink;
    sink.describe("probe_ssl_earliest_cert_expiry", "Returns earliest SSL cert expiry in unixtime");
    EXPECT_EQ(sink.help("probe_ssl_earliest_cert_expiry"), "Returns earliest SSL cert expiry in unixtime");
    EXPECT_EQ(sink.kind("probe_ssl_earliest_cert_expiry"), SampleKind::Gauge);
    EXPECT_TRUE(sink.family("probe_ssl_earliest_cert_expiry").empty());
    EXPECT_TRUE(sink.samples().empty());
}

TEST(ResultSink, UnknownNames)
{
    ResultSink sink;
    EXPECT_FALSE(sink.value("nope").has_value());
    EXPECT_TRUE(sink.family("nope").empty());
    EXPECT_EQ(sink.help("nope"), "");
}

TEST(ResultSink, SamplesAreSortedByName)
{
    ResultSink sink;
    sink.set("b_metric", 2);
    sink.set("a_metric", 1);
    auto all = sink.samples();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].name, "a_metric");
    EXPECT_EQ(all[1].name, "b_metric");
    EXPECT_EQ(all[1].value, 2);
}
