#include "chunkingest/chunk_planner.hpp"
#include "chunkingest/errors.hpp"
#include "chunkingest/log.hpp"
#include "chunkingest/manifest.hpp"
#include "chunkingest/transport.hpp"
#include "chunkingest/upload_orchestrator.hpp"
#include "chunkingest/upload_state.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>
#include <boost/thread.hpp>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>

namespace ci = chunkingest;
namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;
constexpr int kExitCancelled = 130;

int usage_error(const std::string &msg) {
  std::cerr << "chunkingest-upload: " << msg << "\n"
            << "try --help" << std::endl;
  return kExitUsage;
}

} // namespace

int main(int argc, char **argv) {
  std::string input, out_dir, input_format, idem_key, prefix;
  std::size_t chunk_size = 0;
  std::int64_t start_seq = 0, resume_from = -1;
  ci::UploadOptions up;
  long long base_delay_ms = 0, max_delay_ms = 0, timeout_ms = 0;
  std::string log_file;

  po::options_description opts("chunkingest-upload [options] <input> <out_dir>");
  // clang-format off
  opts.add_options()
    ("help,h", "show this help")
    ("input", po::value(&input), "source file: JSON array or NDJSON")
    ("out-dir", po::value(&out_dir), "directory for chunks and manifest.json")
    ("input-format", po::value(&input_format)->default_value("auto"), "array | ndjson | auto")
    ("chunk-size", po::value(&chunk_size)->default_value(10000), "records per chunk")
    ("gzip", po::bool_switch(), "gzip-compress chunk files")
    ("idem-key", po::value(&idem_key), "fixed Idempotency-Key (default: random UUID)")
    ("prefix", po::value(&prefix)->default_value("chunk"), "chunk file name prefix")
    ("start-seq", po::value(&start_seq)->default_value(0), "first X-Batch-Seq")
    ("replan", po::bool_switch(), "ignore an existing manifest.json and plan again")
    ("emit-curl", po::bool_switch(), "print curl commands, do not upload")
    ("exec-curl", po::bool_switch(), "upload the chunks")
    ("endpoint", po::value(&up.endpoint), "upload URL, e.g. https://host/submit/ndjson")
    ("status-endpoint", po::value(&up.status_endpoint), "ingest status URL")
    ("finalize-endpoint", po::value(&up.finalize_endpoint), "ingest finalize URL, posted after the last chunk")
    ("bearer", po::value(&up.bearer), "bearer token")
    ("resume-from", po::value(&resume_from), "resume from this seq")
    ("auto-resume", po::bool_switch(), "ask the server for next_expected_seq")
    ("no-resume-local", po::bool_switch(), "do not resume from upload_state.json")
    ("max-attempts", po::value(&up.retry.max_attempts)->default_value(5), "attempts per request")
    ("base-delay-ms", po::value(&base_delay_ms)->default_value(500), "backoff base delay")
    ("max-delay-ms", po::value(&max_delay_ms)->default_value(30000), "backoff delay cap")
    ("timeout-ms", po::value(&timeout_ms)->default_value(30000), "per-request timeout")
    ("log-file", po::value(&log_file), "append log lines to this file")
    ("verbose,v", po::bool_switch(), "debug logging");
  // clang-format on
  po::positional_options_description pos;
  pos.add("input", 1).add("out-dir", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(opts).positional(pos).run(), vm);
    po::notify(vm);
  } catch (const po::error &e) {
    return usage_error(e.what());
  }
  if (vm.count("help")) {
    std::cout << opts << std::endl;
    return kExitOk;
  }

  if (vm["verbose"].as<bool>())
    ci::log::set_level(ci::log::Level::debug);
  try {
    if (!log_file.empty())
      ci::log::set_file(log_file);
  } catch (const std::exception &e) {
    return usage_error(e.what());
  }

  const bool emit_curl = vm["emit-curl"].as<bool>();
  const bool exec_curl = vm["exec-curl"].as<bool>();
  up.auto_resume = vm["auto-resume"].as<bool>();
  up.resume_local = !vm["no-resume-local"].as<bool>();
  up.retry.base_delay = std::chrono::milliseconds(base_delay_ms);
  up.retry.max_delay = std::chrono::milliseconds(max_delay_ms);
  up.timeout = std::chrono::milliseconds(timeout_ms);
  if (vm.count("resume-from")) {
    if (resume_from < 0)
      return usage_error("--resume-from must be >= 0");
    up.resume_from = resume_from;
  }

  if (out_dir.empty())
    return usage_error("output directory is required");
  if (up.retry.max_attempts < 1 || base_delay_ms < 0 || max_delay_ms < 0 ||
      timeout_ms <= 0)
    return usage_error("retry/timeout settings must be positive");
  if (up.auto_resume && (up.status_endpoint.empty() || up.bearer.empty()))
    return usage_error("--auto-resume requires --status-endpoint and --bearer");
  if ((emit_curl || exec_curl) && (up.endpoint.empty() || up.bearer.empty()))
    return usage_error("--emit-curl/--exec-curl require --endpoint and --bearer");
  try {
    for (const auto *u : {&up.endpoint, &up.status_endpoint, &up.finalize_endpoint}) {
      if (!u->empty())
        ci::parse_url(*u);
    }
  } catch (const std::invalid_argument &e) {
    return usage_error(e.what());
  }

  // план: переиспользуем существующий манифест, если не просили --replan
  const fs::path dir = out_dir;
  const fs::path manifest_path = dir / ci::kManifestFile;
  ci::Manifest manifest;
  try {
    if (fs::exists(manifest_path) && !vm["replan"].as<bool>()) {
      manifest = ci::load_manifest(manifest_path);
      ci::log::info("PLAN", "reusing " + manifest_path.string() + " with " +
                                std::to_string(manifest.chunk_count()) + " chunk(s)");
      if (!idem_key.empty() && idem_key != manifest.idempotency_key)
        ci::log::warn("PLAN", "--idem-key ignored, manifest key is " +
                                  manifest.idempotency_key);
    } else {
      if (input.empty())
        return usage_error("input file is required");
      ci::PlanOptions plan_opts;
      plan_opts.chunk_size = chunk_size;
      plan_opts.gzip = vm["gzip"].as<bool>();
      plan_opts.format = ci::input_format_from_string(input_format);
      plan_opts.idempotency_key = idem_key;
      plan_opts.prefix = prefix;
      plan_opts.start_seq = start_seq;
      manifest = ci::ChunkPlanner(plan_opts).plan(fs::path(input), dir);
    }
  } catch (const std::invalid_argument &e) {
    return usage_error(e.what());
  } catch (const ci::Error &e) {
    ci::log::error("PLAN", e.what());
    return kExitFatal;
  } catch (const fs::filesystem_error &e) {
    ci::log::error("PLAN", e.what());
    return kExitFatal;
  }

  std::cout << "Done. Wrote " << manifest.chunk_count() << " chunk(s) with "
            << manifest.total_records << " record(s).\n"
            << "Idempotency-Key: " << manifest.idempotency_key << "\n"
            << "Manifest: " << manifest_path.string() << std::endl;

  if (emit_curl) {
    // без сети: только --resume-from и локальный журнал
    std::optional<std::int64_t> local;
    if (up.resume_local) {
      try {
        if (auto st = ci::load_upload_state(dir / ci::kUploadStateFile);
            st && st->idempotency_key == manifest.idempotency_key)
          local = st->last_acked_seq;
      } catch (const ci::Error &e) {
        ci::log::warn("RESUME", std::string("local state ignored: ") + e.what());
      }
    }
    const auto from = ci::resolve_resume_point(manifest.start_seq, up.resume_from,
                                               std::nullopt, local);
    for (const auto &cmd : ci::curl_commands(manifest, dir, up, from))
      std::cout << "[emit] " << cmd << "\n";
    std::cout.flush();
  }

  if (!exec_curl)
    return kExitOk;

  std::atomic<bool> cancel{false};
  boost::asio::io_context sig_ioc;
  boost::asio::signal_set signals(sig_ioc, SIGINT, SIGTERM);
  signals.async_wait([&](const boost::system::error_code &ec, int sig) {
    if (ec)
      return;
    ci::log::warn("SIG", "signal " + std::to_string(sig) +
                             ", stopping after the current chunk");
    cancel = true;
  });
  boost::thread sig_thread([&sig_ioc] { sig_ioc.run(); });

  int rc = kExitOk;
  try {
    ci::BeastTransport transport;
    ci::UploadOrchestrator orch(manifest, dir, transport, up);
    const auto rep = orch.run(&cancel);
    ci::log::info("UPLOAD", "sent=" + std::to_string(rep.chunks_sent) +
                                " duplicate=" + std::to_string(rep.chunks_duplicate) +
                                " skipped=" + std::to_string(rep.chunks_skipped) +
                                " inserted=" + std::to_string(rep.records_inserted));
    if (rep.cancelled)
      rc = kExitCancelled;
  } catch (const ci::UploadAborted &e) {
    ci::log::error("UPLOAD", e.what());
    rc = kExitFatal;
  } catch (const ci::Error &e) {
    ci::log::error("UPLOAD", e.what());
    rc = kExitFatal;
  } catch (const fs::filesystem_error &e) {
    ci::log::error("UPLOAD", e.what());
    rc = kExitFatal;
  } catch (const std::exception &e) {
    // сигнальный поток обязан быть остановлен и на неожиданной ошибке
    ci::log::error("UPLOAD", std::string("unexpected: ") + e.what());
    rc = kExitFatal;
  }

  boost::system::error_code ignored;
  signals.cancel(ignored);
  sig_ioc.stop();
  sig_thread.join();
  return rc;
}
