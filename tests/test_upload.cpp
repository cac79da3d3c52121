#include <chunkingest/chunk_planner.hpp>
#include <chunkingest/errors.hpp>
#include <chunkingest/file_utils.hpp>
#include <chunkingest/identity.hpp>
#include <chunkingest/ingest_api.hpp>
#include <chunkingest/memory_store.hpp>
#include <chunkingest/upload_orchestrator.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <deque>
#include <gtest/gtest.h>
#include <random>
#include <sstream>

using namespace chunkingest;
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const std::string kKey = "22222222-2222-2222-2222-222222222222";
const std::string kBase = "http://ingest.local/gd-cim-api";

// Сервер целиком в процессе, без сокетов
struct InProcessServer {
  InProcessServer()
      : tracker(sessions), service(records, tracker),
        tokens({{"tok", "site-a"}, {"root", "ops"}}, {"root"}),
        api(service, tokens, options()) {}

  static ApiOptions options() {
    ApiOptions o;
    o.base_path = "/gd-cim-api";
    return o;
  }

  std::vector<MetricRecord> stored() { return records.records("site-a", kKey); }

  MemoryDedupStore records;
  MemorySessionStore sessions;
  SessionTracker tracker;
  IngestService service;
  TokenTable tokens;
  IngestApi api;
};

// Транспорт поверх IngestApi с инъекцией сбоев.
// injected: 0 — NetworkError, иначе HTTP-статус без обращения к серверу.
class FakeTransport : public HttpTransport {
public:
  explicit FakeTransport(InProcessServer &srv) : srv_(srv) {}

  HttpResponse request(const std::string &method, const std::string &url,
                       const HeaderList &headers, const std::string &body,
                       std::chrono::milliseconds) override {
    ++calls;
    if (!injected.empty()) {
      const int code = injected.front();
      injected.pop_front();
      if (code == 0)
        throw NetworkError("injected connection reset");
      return {code, R"({"error":"injected"})"};
    }
    if (dead)
      throw NetworkError("server unreachable");

    const Url u = parse_url(url);
    if (!status_body.empty() && u.target.find("/ingest/status") != std::string::npos)
      return {200, status_body};
    ApiRequest req;
    req.method = method;
    req.target = u.target;
    req.body = body;
    for (const auto &h : headers)
      req.headers[boost::algorithm::to_lower_copy(h.first)] = h.second;

    const auto reply = srv_.api.handle(req);
    if (u.target.find("/submit/ndjson") != std::string::npos) {
      ++chunk_posts;
      if (on_chunk)
        on_chunk(chunk_posts);
      if (!chunk_body.empty())
        return {reply.status, chunk_body};
    }
    return {reply.status, reply.body};
  }

  int calls{0};
  int chunk_posts{0};
  bool dead{false};
  std::deque<int> injected;
  std::function<void(int)> on_chunk;
  // подмена тела ответа при сохранении статуса
  std::string status_body;
  std::string chunk_body;

private:
  InProcessServer &srv_;
};

class UploadTest : public ::testing::Test {
protected:
  void SetUp() override {
    std::random_device rd;
    root_ = fs::temp_directory_path() /
            ("chunkingest-upload-" + std::to_string(rd()) + std::to_string(rd()));
    fs::create_directories(root_);
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  // 23 записи по 5 — пять чанков, последний неполный
  Manifest plan(const std::string &name, int records = 23, bool gzip = false) {
    std::string src;
    for (int i = 0; i < records; ++i)
      src += "{\"i\":" + std::to_string(i) + ",\"metric\":\"cpu\"}\n";
    PlanOptions o;
    o.chunk_size = 5;
    o.gzip = gzip;
    o.idempotency_key = kKey;
    std::istringstream in(src);
    return ChunkPlanner(o).plan(in, root_ / name);
  }

  static UploadOptions options() {
    UploadOptions o;
    o.endpoint = kBase + "/submit/ndjson";
    o.status_endpoint = kBase + "/ingest/status";
    o.bearer = "tok";
    o.retry.max_attempts = 1;
    return o;
  }

  UploadOrchestrator make(const Manifest &m, const std::string &name,
                          HttpTransport &t, UploadOptions o) {
    UploadOrchestrator orch(m, root_ / name, t, std::move(o));
    orch.set_sleeper([this](std::chrono::milliseconds) { ++sleeps_; });
    return orch;
  }

  static void expect_complete(InProcessServer &srv, int total) {
    const auto stored = srv.stored();
    ASSERT_EQ(static_cast<int>(stored.size()), total);
    for (int i = 0; i < total; ++i) {
      EXPECT_EQ(stored[i].seq, i / 5);
      EXPECT_EQ(stored[i].offset, i % 5);
      EXPECT_EQ(json::parse(stored[i].body)["i"], i);
    }
  }

  fs::path root_;
  int sleeps_{0};
};

} // namespace

TEST(ResumePoint, Rules) {
  const std::optional<ServerProgress> none;
  EXPECT_EQ(resolve_resume_point(0, std::nullopt, none, std::nullopt), 0);
  EXPECT_EQ(resolve_resume_point(5, std::nullopt, none, std::nullopt), 5);
  EXPECT_EQ(resolve_resume_point(0, 3, none, std::nullopt), 3);
  EXPECT_EQ(resolve_resume_point(0, std::nullopt, none, 6), 7);
  EXPECT_EQ(resolve_resume_point(0, 2, none, 6), 7);
  EXPECT_EQ(resolve_resume_point(0, 9, none, 6), 9);

  // сервер важнее локального журнала
  EXPECT_EQ(resolve_resume_point(0, std::nullopt, ServerProgress{"in_progress", 4}, 9), 4);
  EXPECT_EQ(resolve_resume_point(0, 6, ServerProgress{"in_progress", 4}, std::nullopt), 6);
  EXPECT_EQ(resolve_resume_point(0, 2, ServerProgress{"in_progress", 4}, std::nullopt), 4);
  EXPECT_EQ(resolve_resume_point(0, std::nullopt, ServerProgress{"none", 0}, std::nullopt), 0);

  // stale: прежний прогресс не в счёт
  EXPECT_EQ(resolve_resume_point(0, std::nullopt, ServerProgress{"stale", 4}, 3), 0);
  EXPECT_EQ(resolve_resume_point(0, 2, ServerProgress{"stale", 4}, std::nullopt), 2);

  // никогда ниже start_seq
  EXPECT_EQ(resolve_resume_point(10, 3, none, std::nullopt), 10);
  EXPECT_EQ(resolve_resume_point(10, std::nullopt, ServerProgress{"none", 0}, std::nullopt), 10);
}

TEST_F(UploadTest, EmptyManifestMakesNoCalls) {
  InProcessServer srv;
  FakeTransport t(srv);
  const auto m = plan("empty", 0);
  ASSERT_EQ(m.chunk_count(), 0u);

  auto o = options();
  o.auto_resume = true;
  o.finalize_endpoint = kBase + "/ingest/finalize";
  auto orch = make(m, "empty", t, o);
  const auto rep = orch.run();
  EXPECT_EQ(t.calls, 0);
  EXPECT_EQ(rep.chunks_sent, 0u);
  EXPECT_FALSE(rep.finalized);
}

TEST_F(UploadTest, UploadsAllChunksInOrder) {
  InProcessServer srv;
  FakeTransport t(srv);
  const auto m = plan("all");
  std::vector<std::int64_t> seen;
  t.on_chunk = [&](int) { seen.push_back(srv.stored().back().seq); };

  auto orch = make(m, "all", t, options());
  const auto rep = orch.run();
  EXPECT_EQ(rep.chunks_sent, 5u);
  EXPECT_EQ(rep.records_inserted, 23u);
  EXPECT_EQ(seen, (std::vector<std::int64_t>{0, 1, 2, 3, 4}));
  expect_complete(srv, 23);

  const auto state = load_upload_state(root_ / "all" / kUploadStateFile);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->last_acked_seq, 4);
  EXPECT_EQ(state->chunks.size(), 5u);
  EXPECT_EQ(state->chunks.at(4).inserted, 3u);

  std::istringstream progress(read_file(root_ / "all" / kProgressLogFile));
  std::string line;
  int lines = 0;
  while (std::getline(progress, line)) {
    EXPECT_EQ(json::parse(line)["seq"], lines);
    ++lines;
  }
  EXPECT_EQ(lines, 5);
}

TEST_F(UploadTest, GzipChunksUpload) {
  InProcessServer srv;
  FakeTransport t(srv);
  const auto m = plan("gz", 23, true);
  auto orch = make(m, "gz", t, options());
  EXPECT_EQ(orch.run().records_inserted, 23u);
  expect_complete(srv, 23);
}

TEST_F(UploadTest, CrashResumeEquivalenceForEveryK) {
  for (bool auto_resume : {false, true}) {
    for (int k = 0; k <= 5; ++k) {
      SCOPED_TRACE("auto_resume=" + std::to_string(auto_resume) + " k=" + std::to_string(k));
      const std::string name = "crash-" + std::to_string(auto_resume) + "-" + std::to_string(k);
      InProcessServer srv;
      const auto m = plan(name);

      FakeTransport first(srv);
      first.dead = k == 0;
      first.on_chunk = [&](int n) {
        if (n == k)
          first.dead = true;
      };
      auto orch1 = make(m, name, first, options());
      if (k < 5) {
        try {
          orch1.run();
          FAIL() << "expected UploadAborted";
        } catch (const UploadAborted &e) {
          EXPECT_EQ(e.seq(), k);
        }
      } else {
        orch1.run();
      }
      EXPECT_EQ(srv.stored().size(), static_cast<std::size_t>(std::min(23, 5 * k)));

      FakeTransport second(srv);
      auto o = options();
      o.auto_resume = auto_resume;
      auto orch2 = make(m, name, second, o);
      const auto rep = orch2.run();
      EXPECT_EQ(rep.resume_point, k);
      EXPECT_EQ(rep.chunks_sent, static_cast<std::size_t>(5 - k));
      EXPECT_EQ(rep.chunks_duplicate, 0u);
      expect_complete(srv, 23);
    }
  }
}

TEST_F(UploadTest, LostAckResolvedByServerStatus) {
  InProcessServer srv;
  const auto m = plan("lost");

  // сервер принял seq=2, но ответ до клиента не дошёл
  FakeTransport first(srv);
  first.on_chunk = [&](int n) {
    if (n == 3) {
      first.dead = true;
      throw NetworkError("connection reset after commit");
    }
  };
  auto orch1 = make(m, "lost", first, options());
  EXPECT_THROW(orch1.run(), UploadAborted);
  EXPECT_EQ(orch1.state().last_acked_seq, 1);
  EXPECT_EQ(orch1.state().chunks.at(2).status, ChunkAck::error);

  FakeTransport second(srv);
  auto o = options();
  o.auto_resume = true;
  auto orch2 = make(m, "lost", second, o);
  const auto rep = orch2.run();
  EXPECT_EQ(rep.resume_point, 3);
  EXPECT_EQ(rep.chunks_sent, 2u);
  expect_complete(srv, 23);
}

TEST_F(UploadTest, ResendIsDuplicateAndSucceeds) {
  InProcessServer srv;
  const auto m = plan("dup");
  FakeTransport t(srv);
  make(m, "dup", t, options()).run();

  auto o = options();
  o.resume_local = false;
  FakeTransport again(srv);
  const auto rep = make(m, "dup", again, o).run();
  EXPECT_EQ(rep.chunks_sent, 5u);
  EXPECT_EQ(rep.chunks_duplicate, 5u);
  EXPECT_EQ(rep.records_inserted, 0u);
  expect_complete(srv, 23);
}

TEST_F(UploadTest, TransientFailuresRetried) {
  InProcessServer srv;
  const auto m = plan("retry");
  FakeTransport t(srv);
  t.injected = {503, 0, 429};
  auto o = options();
  o.retry.max_attempts = 4;
  const auto rep = make(m, "retry", t, o).run();
  EXPECT_EQ(rep.chunks_sent, 5u);
  EXPECT_EQ(t.calls, 8);
  EXPECT_LE(sleeps_, 3); // нулевая задержка не спит
  expect_complete(srv, 23);
}

TEST_F(UploadTest, RetryCeilingAborts) {
  InProcessServer srv;
  const auto m = plan("ceiling");
  FakeTransport t(srv);
  t.injected = {500, 502, 503, 504};
  auto o = options();
  o.retry.max_attempts = 3;
  auto orch = make(m, "ceiling", t, o);
  try {
    orch.run();
    FAIL() << "expected UploadAborted";
  } catch (const UploadAborted &e) {
    EXPECT_EQ(e.seq(), 0);
    EXPECT_NE(e.reason().find("3 attempt"), std::string::npos) << e.reason();
  }
  EXPECT_EQ(t.calls, 3);
  EXPECT_TRUE(srv.stored().empty());

  const auto state = load_upload_state(root_ / "ceiling" / kUploadStateFile);
  ASSERT_TRUE(state.has_value());
  EXPECT_FALSE(state->last_acked_seq.has_value());
  EXPECT_EQ(state->chunks.at(0).status, ChunkAck::error);
}

TEST_F(UploadTest, ClientErrorsAreNotRetried) {
  InProcessServer srv;
  const auto m = plan("auth");
  FakeTransport t(srv);
  auto o = options();
  o.bearer = "wrong";
  o.retry.max_attempts = 5;
  auto orch = make(m, "auth", t, o);
  try {
    orch.run();
    FAIL() << "expected UploadAborted";
  } catch (const UploadAborted &e) {
    EXPECT_EQ(e.seq(), 0);
    EXPECT_NE(e.reason().find("401"), std::string::npos) << e.reason();
  }
  EXPECT_EQ(t.calls, 1);
}

TEST_F(UploadTest, PayloadTooLargeIsFatal) {
  InProcessServer srv;
  const auto m = plan("big");
  FakeTransport t(srv);
  t.injected = {413};
  auto o = options();
  o.retry.max_attempts = 5;
  auto orch = make(m, "big", t, o);
  EXPECT_THROW(orch.run(), UploadAborted);
  EXPECT_EQ(t.calls, 1);
}

TEST_F(UploadTest, CancellationStopsAtChunkBoundary) {
  InProcessServer srv;
  const auto m = plan("cancel");
  FakeTransport t(srv);
  std::atomic<bool> cancel{false};
  t.on_chunk = [&](int n) {
    if (n == 2)
      cancel = true;
  };
  auto orch = make(m, "cancel", t, options());
  const auto rep = orch.run(&cancel);
  EXPECT_TRUE(rep.cancelled);
  EXPECT_EQ(rep.chunks_sent, 2u);
  EXPECT_EQ(srv.stored().size(), 10u);

  const auto state = load_upload_state(root_ / "cancel" / kUploadStateFile);
  ASSERT_TRUE(state.has_value());
  EXPECT_EQ(state->last_acked_seq, 1);

  FakeTransport rest(srv);
  EXPECT_EQ(make(m, "cancel", rest, options()).run().chunks_sent, 3u);
  expect_complete(srv, 23);
}

TEST_F(UploadTest, CorruptedChunkIsIntegrityFailure) {
  InProcessServer srv;
  const auto m = plan("corrupt");
  write_file(root_ / "corrupt" / m.chunks[1].path, "{\"i\":999}\n");
  FakeTransport t(srv);
  auto orch = make(m, "corrupt", t, options());
  try {
    orch.run();
    FAIL() << "expected UploadAborted";
  } catch (const UploadAborted &e) {
    EXPECT_EQ(e.seq(), 1);
    EXPECT_NE(e.reason().find("md5"), std::string::npos) << e.reason();
  }
  EXPECT_EQ(t.chunk_posts, 1);
}

TEST_F(UploadTest, FinalizeCompletesSession) {
  InProcessServer srv;
  const auto m = plan("fin");
  FakeTransport t(srv);
  auto o = options();
  o.finalize_endpoint = kBase + "/ingest/finalize";
  const auto rep = make(m, "fin", t, o).run();
  EXPECT_TRUE(rep.finalized);
  EXPECT_EQ(srv.tracker.status({"site-a", kKey})->status, SessionStatus::complete);
}

TEST_F(UploadTest, StaleSessionIsResentFromStart) {
  InProcessServer srv;
  const auto m = plan("stale");
  FakeTransport t(srv);
  make(m, "stale", t, options()).run();
  srv.tracker.mark_stale({"site-a", kKey});

  auto o = options();
  o.auto_resume = true;
  FakeTransport again(srv);
  const auto rep = make(m, "stale", again, o).run();
  EXPECT_EQ(rep.resume_point, 0);
  EXPECT_EQ(rep.chunks_sent, 5u);
  EXPECT_EQ(rep.chunks_duplicate, 5u);
  EXPECT_EQ(srv.tracker.status({"site-a", kKey})->status, SessionStatus::in_progress);
  expect_complete(srv, 23);
}

TEST_F(UploadTest, StatusQueryFailureAborts) {
  InProcessServer srv;
  const auto m = plan("status");
  FakeTransport t(srv);
  t.dead = true;
  auto o = options();
  o.auto_resume = true;
  o.retry.max_attempts = 2;
  auto orch = make(m, "status", t, o);
  EXPECT_THROW(orch.run(), UploadAborted);
  EXPECT_EQ(t.calls, 2);
}

TEST_F(UploadTest, StatusWithWrongTypesAborts) {
  InProcessServer srv;
  const auto m = plan("types");
  FakeTransport t(srv);
  t.status_body = R"({"status":"in_progress","next_expected_seq":"3"})";
  auto o = options();
  o.auto_resume = true;
  auto orch = make(m, "types", t, o);
  try {
    orch.run();
    FAIL() << "expected UploadAborted";
  } catch (const UploadAborted &e) {
    EXPECT_EQ(e.seq(), 0);
  }
  EXPECT_EQ(t.chunk_posts, 0);
}

TEST_F(UploadTest, AckWithWrongTypesStillCounts) {
  InProcessServer srv;
  const auto m = plan("ack-types");
  FakeTransport t(srv);
  t.chunk_body = R"({"ok":true,"inserted":"five","duplicate":"no"})";
  const auto rep = make(m, "ack-types", t, options()).run();
  EXPECT_EQ(rep.chunks_sent, 5u);
  EXPECT_EQ(rep.records_inserted, 0u);
  EXPECT_EQ(rep.chunks_duplicate, 0u);
  expect_complete(srv, 23);
}

TEST(UploadStateFile, SaveLoad) {
  const fs::path file = fs::temp_directory_path() /
                        ("chunkingest-state-" + std::to_string(std::random_device{}()) + ".json");
  UploadState s;
  s.idempotency_key = "k";
  s.mark_acked(0, 5, false);
  s.mark_acked(1, 0, true);
  s.mark_error(2, "HTTP 500");
  s.updated_at = "2025-01-01T00:00:00.000Z";
  save_upload_state(s, file);

  const auto text = read_file(file);
  const auto j = json::parse(text);
  EXPECT_EQ(j["last_acked_seq"], 1);
  EXPECT_EQ(j["chunks"]["1"]["status"], "duplicate");
  EXPECT_EQ(j["chunks"]["2"]["error"], "HTTP 500");

  const auto back = load_upload_state(file);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->chunks.at(2).status, ChunkAck::error);
  EXPECT_EQ(back->chunks.at(0).inserted, 5u);
  EXPECT_EQ(back->last_acked_seq, 1);
  fs::remove(file);

  EXPECT_FALSE(load_upload_state(file).has_value());
  write_file(file, "{\"idempotency_key\":");
  EXPECT_THROW(load_upload_state(file), ParseError);
  fs::remove(file);
}

TEST(UploadStateFile, FreshStateHasNullPointer) {
  UploadState s;
  s.idempotency_key = "k";
  EXPECT_TRUE(to_json(s)["last_acked_seq"].is_null());
}

TEST(CurlCommands, QuotedAndFiltered) {
  Manifest m;
  m.idempotency_key = kKey;
  m.chunks.push_back({0, "chunk_000000.ndjson", 5, 100, "x", false});
  m.chunks.push_back({1, "chunk_000001.ndjson.gz", 5, 80, "y", true});
  UploadOptions o;
  o.endpoint = "https://api.example/submit/ndjson";
  o.bearer = "abc";

  const auto cmds = curl_commands(m, "/data/out dir", o, 1);
  ASSERT_EQ(cmds.size(), 1u);
  const auto &c = cmds[0];
  EXPECT_EQ(c.rfind("curl --fail -sS -X POST", 0), 0u);
  EXPECT_NE(c.find("'Authorization: Bearer abc'"), std::string::npos);
  EXPECT_NE(c.find("'Content-Type: application/x-ndjson'"), std::string::npos);
  EXPECT_NE(c.find("'X-Batch-Seq: 1'"), std::string::npos);
  EXPECT_NE(c.find("'Content-Encoding: gzip'"), std::string::npos);
  EXPECT_NE(c.find("'@/data/out dir/chunk_000001.ndjson.gz'"), std::string::npos);
}

TEST(ShellQuote, Cases) {
  EXPECT_EQ(shell_quote("plain"), "plain");
  EXPECT_EQ(shell_quote(""), "''");
  EXPECT_EQ(shell_quote("a b"), "'a b'");
  EXPECT_EQ(shell_quote("it's"), "'it'\"'\"'s'");
}
