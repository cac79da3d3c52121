#include "chunkingest/metrics_export.hpp"
#include <sstream>

namespace chunkingest {

std::atomic<unsigned long long> g_records_inserted{0};
std::atomic<unsigned long long> g_records_duplicate{0};
std::atomic<unsigned long long> g_chunks_rejected{0};
std::atomic<unsigned long long> g_queue_size{0};

std::string render_metrics() {
  std::ostringstream os;
  os << "# TYPE chunkingest_records_inserted_total counter\n"
     << "chunkingest_records_inserted_total "
     << g_records_inserted.load(std::memory_order_relaxed) << "\n"
     << "# TYPE chunkingest_records_duplicate_total counter\n"
     << "chunkingest_records_duplicate_total "
     << g_records_duplicate.load(std::memory_order_relaxed) << "\n"
     << "# TYPE chunkingest_chunks_rejected_total counter\n"
     << "chunkingest_chunks_rejected_total "
     << g_chunks_rejected.load(std::memory_order_relaxed) << "\n"
     << "# TYPE chunkingest_queue_size gauge\n"
     << "chunkingest_queue_size "
     << g_queue_size.load(std::memory_order_relaxed) << "\n";
  return os.str();
}

} // namespace chunkingest
