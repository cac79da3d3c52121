#include "chunkingest/clickhouse_archive.hpp"
#include "chunkingest/http_server.hpp"
#include "chunkingest/identity.hpp"
#include "chunkingest/ingest_api.hpp"
#include "chunkingest/ingest_service.hpp"
#include "chunkingest/log.hpp"
#include "chunkingest/memory_store.hpp"
#include "chunkingest/redis_store.hpp"
#include "chunkingest/threadsafe_queue.hpp"
#include "chunkingest/types.hpp"
#include "chunkingest/worker_pool.hpp"
#include <boost/thread.hpp>
#include <csignal>
#include <cstdio>
#include <exception>
#include <iostream>

static void term_handler() {
  try {
    throw; // поймать текущее исключение
  } catch (const std::exception &e) {
    std::fprintf(stderr, "[FATAL] std::terminate: %s\n", e.what());
  } catch (...) {
    std::fprintf(stderr, "[FATAL] std::terminate: unknown exception\n");
  }
  std::fflush(stderr);
  std::abort();
}

namespace ci = chunkingest;

int main(int argc, char **argv) {
  std::set_terminate(term_handler);

  std::string cfg_path = "server.json";
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc)
      cfg_path = argv[++i];
  }

  ci::Config cfg;
  try {
    cfg = ci::load_config(cfg_path);
    if (cfg.verbose)
      ci::log::set_level(ci::log::Level::debug);
    if (!cfg.log_file.empty())
      ci::log::set_file(cfg.log_file);
  } catch (const std::exception &e) {
    std::cerr << "[FATAL] " << e.what() << std::endl;
    return 2;
  }
  if (cfg.tokens.empty())
    ci::log::warn("MAIN", "no tokens configured, every request will be 401");

  // хранилища
  std::unique_ptr<ci::DedupStore> records;
  std::unique_ptr<ci::SessionStore> sessions;
  try {
    if (cfg.storage == "redis") {
      ci::RedisConfig rc;
      rc.redis_host = cfg.redis_host;
      rc.redis_port = cfg.redis_port;
      rc.redis_prefix = cfg.redis_prefix;
      rc.pool_size = cfg.worker_threads + 1;
      auto redis = ci::connect_redis(rc);
      records = std::make_unique<ci::RedisDedupStore>(redis, rc.redis_prefix);
      sessions =
          std::make_unique<ci::RedisSessionStore>(redis, rc.redis_prefix);
    } else {
      ci::log::warn("MAIN", "storage=memory: nothing survives a restart");
      records = std::make_unique<ci::MemoryDedupStore>();
      sessions = std::make_unique<ci::MemorySessionStore>();
    }
  } catch (const std::exception &e) {
    std::cerr << "[FATAL] storage: " << e.what() << std::endl;
    return 1;
  }

  ci::SessionTracker tracker(*sessions);
  ci::IngestLimits limits;
  limits.max_record_bytes = cfg.max_record_bytes;
  limits.max_chunk_records = cfg.max_chunk_records;
  ci::IngestService service(*records, tracker, limits);

  std::unique_ptr<ci::ClickHouseArchive> archive;
  if (cfg.clickhouse_enabled) {
    archive = std::make_unique<ci::ClickHouseArchive>(cfg);
    service.set_record_sink(
        [a = archive.get()](const ci::MetricRecord &r) { a->enqueue(r); });
  }

  ci::TokenTable identities(cfg.tokens, cfg.admin_tokens);
  ci::ApiOptions api_opts;
  api_opts.base_path = cfg.base_path;
  api_opts.max_decoded_bytes = cfg.max_decoded_bytes;
  ci::IngestApi api(service, identities, api_opts);

  ci::ThreadSafeQueue<ci::EnqueuedTask> queue(cfg.queue_capacity);
  boost::asio::io_context ioc;
  // Держим io_context живым всегда, пока сами не отпустим
  auto guard = boost::asio::make_work_guard(ioc.get_executor());

  ci::WorkerPool workers(cfg.worker_threads, queue);
  std::unique_ptr<ci::HttpServer> server;
  try {
    server = std::make_unique<ci::HttpServer>(ioc, cfg, queue, api);
    server->run();
    workers.start();
    if (archive)
      archive->start();
  } catch (const std::exception &e) {
    std::cerr << "[FATAL] startup error: " << e.what() << std::endl;
    return 1;
  }

  const std::size_t n_threads = std::max<std::size_t>(1, cfg.http_threads);
  std::vector<std::unique_ptr<boost::thread>> threads;
  threads.reserve(n_threads - 1);
  for (std::size_t i = 0; i + 1 < n_threads; ++i) {
    threads.emplace_back(std::make_unique<boost::thread>([&ioc] { ioc.run(); }));
  }

  ci::log::info("MAIN", "listening on " + cfg.host + ":" +
                            std::to_string(server->port()) + cfg.base_path +
                            " storage=" + cfg.storage);

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &, int) {
    ci::log::info("SIG", "stopping...");
    server->stop();
    guard.reset(); // отпускаем «несгораемую» работу
    ioc.stop();    // будим все потоки, чтобы они вышли из run()
  });

  // Главный поток тоже крутит ioc
  ioc.run();

  for (auto &t : threads)
    t->join();
  workers.stop();
  if (archive)
    archive->stop();
  return 0;
}
