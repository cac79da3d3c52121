#include <chunkingest/codec.hpp>
#include <chunkingest/identity.hpp>
#include <chunkingest/ingest_api.hpp>
#include <chunkingest/memory_store.hpp>
#include <gtest/gtest.h>

using namespace chunkingest;
using json = nlohmann::json;

namespace {

const std::string kKey = "11111111-1111-1111-1111-111111111111";

class IngestApiTest : public ::testing::Test {
protected:
  IngestApiTest()
      : tracker_(sessions_), service_(records_, tracker_, limits()),
        tokens_({{"tok-a", "site-a"}, {"tok-b", "site-b"}, {"root", "ops"}}, {"root"}),
        api_(service_, tokens_, options()) {}

  static IngestLimits limits() {
    IngestLimits l;
    l.max_chunk_records = 100;
    l.max_record_bytes = 1024;
    return l;
  }
  static ApiOptions options() {
    ApiOptions o;
    o.base_path = "/gd-cim-api/";
    o.max_decoded_bytes = 4096;
    return o;
  }

  static ApiRequest post(const std::string &path, const std::string &body,
                         const std::string &token = "tok-a") {
    ApiRequest r;
    r.method = "POST";
    r.target = "/gd-cim-api" + path;
    r.body = body;
    if (!token.empty())
      r.headers["authorization"] = "Bearer " + token;
    return r;
  }
  static ApiRequest get(const std::string &path, const std::string &token = "tok-a") {
    auto r = post(path, "", token);
    r.method = "GET";
    return r;
  }
  static ApiRequest batch(const std::string &body, std::int64_t seq,
                          const std::string &token = "tok-a") {
    auto r = post("/submit/batch", body, token);
    r.headers["idempotency-key"] = kKey;
    r.headers["x-batch-seq"] = std::to_string(seq);
    return r;
  }
  static ApiRequest ndjson(const std::string &body, std::int64_t seq, bool gzip = false) {
    auto r = post("/submit/ndjson", gzip ? gzip_compress(body) : body);
    r.headers["content-type"] = "application/x-ndjson";
    r.headers["idempotency-key"] = kKey;
    r.headers["x-batch-seq"] = std::to_string(seq);
    if (gzip)
      r.headers["content-encoding"] = "gzip";
    return r;
  }

  MemoryDedupStore records_;
  MemorySessionStore sessions_;
  SessionTracker tracker_;
  IngestService service_;
  TokenTable tokens_;
  IngestApi api_;
};

const std::string kExampleBody =
    R"([{"metric":"cpu","value":0.1},{"metric":"mem","value":2}])";

} // namespace

TEST(QueryString, Parse) {
  const auto q = parse_query("idempotency_key=a%3Ab&publisher=site+1&flag");
  EXPECT_EQ(q.at("idempotency_key"), "a:b");
  EXPECT_EQ(q.at("publisher"), "site 1");
  EXPECT_EQ(q.at("flag"), "");
}

TEST(BearerToken, Parse) {
  EXPECT_EQ(bearer_token("Bearer abc"), "abc");
  EXPECT_EQ(bearer_token("bearer  abc "), "abc");
  EXPECT_EQ(bearer_token("Basic abc"), "");
  EXPECT_EQ(bearer_token(""), "");
}

TEST_F(IngestApiTest, BatchExampleAndRetry) {
  auto first = api_.handle(batch(kExampleBody, 0));
  EXPECT_EQ(first.status, 200);
  EXPECT_EQ(first.body, R"({"ok":true,"inserted":2,"next_expected_seq":1})");

  auto retry = api_.handle(batch(kExampleBody, 0));
  EXPECT_EQ(retry.status, 200);
  EXPECT_EQ(retry.body,
            R"({"ok":true,"inserted":0,"duplicate":true,"next_expected_seq":1})");
  EXPECT_EQ(records_.size(), 2u);
}

TEST_F(IngestApiTest, BatchSeqHeaderAlias) {
  auto r = post("/submit/batch", kExampleBody);
  r.headers["idempotency-key"] = kKey;
  r.headers["batch-seq"] = "3";
  auto out = api_.handle(r);
  EXPECT_EQ(out.status, 200);
  EXPECT_EQ(json::parse(out.body)["next_expected_seq"], 4);
}

TEST_F(IngestApiTest, BatchRequiresHeaders) {
  auto r = post("/submit/batch", kExampleBody);
  EXPECT_EQ(api_.handle(r).status, 400);
  r.headers["idempotency-key"] = kKey;
  EXPECT_EQ(api_.handle(r).status, 400);
  r.headers["x-batch-seq"] = "-1";
  EXPECT_EQ(api_.handle(r).status, 400);
  r.headers["x-batch-seq"] = "12abc";
  EXPECT_EQ(api_.handle(r).status, 400);
  EXPECT_EQ(records_.size(), 0u);
}

TEST_F(IngestApiTest, BatchBodyShape) {
  EXPECT_EQ(api_.handle(batch("{\"metric\":\"cpu\"}", 0)).status, 422);
  EXPECT_EQ(api_.handle(batch("[{\"a\":1}, 7]", 0)).status, 422);
  EXPECT_EQ(api_.handle(batch("[{\"a\":1}", 0)).status, 400);
  EXPECT_EQ(records_.size(), 0u);
}

TEST_F(IngestApiTest, AuthErrors) {
  EXPECT_EQ(api_.handle(batch(kExampleBody, 0, "")).status, 401);
  auto bad = api_.handle(batch(kExampleBody, 0, "nope"));
  EXPECT_EQ(bad.status, 401);
  const auto j = json::parse(bad.body);
  EXPECT_EQ(j["error"], "unauthorized");
  EXPECT_TRUE(j.contains("msg"));
}

TEST_F(IngestApiTest, IdentitiesAreSeparate) {
  api_.handle(batch(kExampleBody, 0, "tok-a"));
  auto other = api_.handle(batch(kExampleBody, 0, "tok-b"));
  EXPECT_EQ(other.body, R"({"ok":true,"inserted":2,"next_expected_seq":1})");
  EXPECT_EQ(records_.size(), 4u);
}

TEST_F(IngestApiTest, SizeLimitIs413) {
  std::string big = "[";
  for (int i = 0; i < 101; ++i)
    big += std::string(i ? "," : "") + "{\"i\":" + std::to_string(i) + "}";
  big += "]";
  EXPECT_EQ(api_.handle(batch(big, 0)).status, 413);

  const std::string huge_record = "[{\"blob\":\"" + std::string(2000, 'x') + "\"}]";
  EXPECT_EQ(api_.handle(batch(huge_record, 0)).status, 413);
  EXPECT_EQ(records_.size(), 0u);
}

TEST_F(IngestApiTest, NdjsonPlainAndGzip) {
  const std::string body = "{\"m\":1}\n{\"m\":2}\n{\"m\":3}\n";
  auto plain = api_.handle(ndjson(body, 0));
  EXPECT_EQ(plain.status, 200);
  EXPECT_EQ(plain.body, R"({"ok":true,"inserted":3,"next_expected_seq":1})");

  auto gz = api_.handle(ndjson(body, 1, true));
  EXPECT_EQ(gz.status, 200);
  EXPECT_EQ(gz.body, R"({"ok":true,"inserted":3,"next_expected_seq":2})");

  // тот же чанк повторно, но уже сжатым
  auto dup = api_.handle(ndjson(body, 0, true));
  EXPECT_EQ(dup.body, R"({"ok":true,"inserted":0,"duplicate":true,"next_expected_seq":2})");
}

TEST_F(IngestApiTest, NdjsonBadLineWritesNothing) {
  auto r = api_.handle(ndjson("{\"m\":1}\n{\"m\":2}\nnot json\n{\"m\":4}\n", 0));
  EXPECT_EQ(r.status, 400);
  EXPECT_NE(r.body.find("line 3"), std::string::npos) << r.body;
  EXPECT_EQ(records_.size(), 0u);
  EXPECT_FALSE(tracker_.status({"site-a", kKey}));
}

TEST_F(IngestApiTest, NdjsonContentChecks) {
  auto r = ndjson("{\"m\":1}\n", 0);
  r.headers["content-type"] = "application/json";
  EXPECT_EQ(api_.handle(r).status, 400);

  r.headers["content-type"] = "application/x-ndjson; charset=utf-8";
  r.headers["content-encoding"] = "br";
  EXPECT_EQ(api_.handle(r).status, 400);

  r.headers["content-encoding"] = "gzip"; // тело не сжато
  EXPECT_EQ(api_.handle(r).status, 400);
  EXPECT_EQ(records_.size(), 0u);
}

TEST_F(IngestApiTest, NdjsonDecodedLimit) {
  std::string body;
  for (int i = 0; i < 600; ++i)
    body += "{\"i\":" + std::to_string(i) + "}\n";
  EXPECT_EQ(api_.handle(ndjson(body, 0, true)).status, 413);
}

TEST_F(IngestApiTest, NdjsonWithoutIdempotencyHeaders) {
  auto r = post("/submit/ndjson", "{\"m\":1}\n");
  r.headers["content-type"] = "application/x-ndjson";
  auto out = api_.handle(r);
  EXPECT_EQ(out.status, 200);
  EXPECT_EQ(out.body, R"({"ok":true,"inserted":1})");
  // второй такой же запрос — новый ключ, новая запись
  api_.handle(r);
  EXPECT_EQ(records_.size(), 2u);
}

TEST_F(IngestApiTest, SubmitSingle) {
  auto out = api_.handle(post("/submit", "{\"metric\":\"cpu\",\"value\":1}"));
  EXPECT_EQ(out.status, 200);
  const auto j = json::parse(out.body);
  EXPECT_EQ(j["ok"], true);
  EXPECT_EQ(j["inserted"], 1);
  EXPECT_EQ(j["idempotency_key"].get<std::string>().size(), 36u);
  EXPECT_FALSE(j.contains("next_expected_seq"));

  auto keyed = post("/submit", "{\"metric\":\"cpu\"}");
  keyed.headers["idempotency-key"] = kKey;
  keyed.headers["x-batch-seq"] = "0";
  api_.handle(keyed);
  const auto again = json::parse(api_.handle(keyed).body);
  EXPECT_EQ(again["duplicate"], true);
  EXPECT_EQ(again["next_expected_seq"], 1);
}

TEST_F(IngestApiTest, StatusReportsProgressAndGaps) {
  auto none = json::parse(api_.handle(get("/ingest/status?idempotency_key=" + kKey)).body);
  EXPECT_EQ(none["status"], "none");
  EXPECT_EQ(none["next_expected_seq"], 0);
  EXPECT_TRUE(none["processed"].empty());
  EXPECT_TRUE(none["missing"].empty());

  api_.handle(batch(kExampleBody, 0));
  api_.handle(batch(kExampleBody, 3));
  auto st = api_.handle(get("/ingest/status?idempotency_key=" + kKey));
  EXPECT_EQ(st.status, 200);
  const auto j = json::parse(st.body);
  EXPECT_EQ(j["status"], "in_progress");
  EXPECT_EQ(j["next_expected_seq"], 4);
  EXPECT_EQ(j["processed"], json::array({0, 3}));
  EXPECT_EQ(j["missing"], json::array({1, 2}));
  EXPECT_TRUE(j.contains("last_update"));

  // другая личность не видит чужую сессию
  auto other = json::parse(api_.handle(get("/ingest/status?idempotency_key=" + kKey, "tok-b")).body);
  EXPECT_EQ(other["status"], "none");

  EXPECT_EQ(api_.handle(get("/ingest/status")).status, 400);
}

TEST_F(IngestApiTest, MyRecordsOrderedBySeqAndOffset) {
  api_.handle(batch(R"([{"z":1,"a":2},{"z":3,"a":4}])", 1));
  api_.handle(batch(kExampleBody, 0));

  auto r = api_.handle(get("/metrics/me?idempotency_key=" + kKey));
  EXPECT_EQ(r.status, 200);
  const auto j = json::parse(r.body);
  ASSERT_EQ(j.size(), 4u);
  EXPECT_EQ(j[0]["seq"], 0);
  EXPECT_EQ(j[0]["offset"], 0);
  EXPECT_EQ(j[0]["publisher"], "site-a");
  EXPECT_EQ(j[0]["body"]["metric"], "cpu");
  EXPECT_EQ(j[2]["seq"], 1);
  EXPECT_EQ(j[3]["offset"], 1);
  EXPECT_EQ(j[3]["body"]["a"], 4);
  // тело хранится с исходным порядком ключей
  EXPECT_NE(r.body.find(R"("body":{"z":3,"a":4})"), std::string::npos) << r.body;

  EXPECT_EQ(api_.handle(get("/metrics/me?idempotency_key=" + kKey, "tok-b")).body, "[]");
  EXPECT_EQ(api_.handle(get("/metrics/me")).status, 400);
  EXPECT_EQ(api_.handle(get("/metrics/me?idempotency_key=" + kKey, "")).status, 401);
}

TEST_F(IngestApiTest, FinalizeFlow) {
  EXPECT_EQ(api_.handle(post("/ingest/finalize?idempotency_key=" + kKey, "")).status, 409);
  api_.handle(batch(kExampleBody, 0));
  auto fin = api_.handle(post("/ingest/finalize?idempotency_key=" + kKey, ""));
  EXPECT_EQ(fin.status, 200);
  EXPECT_EQ(json::parse(fin.body)["status"], "complete");

  auto st = json::parse(api_.handle(get("/ingest/status?idempotency_key=" + kKey)).body);
  EXPECT_EQ(st["status"], "complete");
}

TEST_F(IngestApiTest, AdminTransitions) {
  api_.handle(batch(kExampleBody, 0));
  const std::string q = "?publisher=site-a&idempotency_key=" + kKey;

  EXPECT_EQ(api_.handle(post("/admin/ingest/stale" + q, "", "tok-a")).status, 403);
  EXPECT_EQ(api_.handle(post("/admin/ingest/stale" + q, "", "")).status, 401);

  auto stale = api_.handle(post("/admin/ingest/stale" + q, "", "root"));
  EXPECT_EQ(stale.status, 200);
  EXPECT_EQ(json::parse(stale.body)["status"], "stale");

  // stale нельзя завершить, только возобновить новым чанком
  EXPECT_EQ(api_.handle(post("/admin/ingest/finalize" + q, "", "root")).status, 409);
  EXPECT_EQ(api_.handle(batch(kExampleBody, 0)).status, 200);
  auto fin = api_.handle(post("/admin/ingest/finalize" + q, "", "root"));
  EXPECT_EQ(fin.status, 200);
  EXPECT_EQ(api_.handle(post("/admin/ingest/stale" + q, "", "root")).status, 409);
}

TEST_F(IngestApiTest, RoutingAndHealth) {
  EXPECT_EQ(api_.handle(get("/healthz", "")).body, R"({"status":"ok"})");
  auto m = api_.handle(get("/metrics", ""));
  EXPECT_EQ(m.status, 200);
  EXPECT_EQ(m.content_type.rfind("text/plain", 0), 0u);
  EXPECT_NE(m.body.find("chunkingest_records_inserted_total"), std::string::npos);

  EXPECT_EQ(api_.handle(get("/nope")).status, 404);
  auto outside = get("/healthz");
  outside.target = "/healthz";
  EXPECT_EQ(api_.handle(outside).status, 404);
  EXPECT_EQ(api_.handle(get("/submit/batch")).status, 404);
}
