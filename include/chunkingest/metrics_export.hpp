#pragma once
#include <atomic>
#include <string>

namespace chunkingest {
// сколько записей впервые сохранено (counter)
extern std::atomic<unsigned long long> g_records_inserted;
// сколько записей пришло повторно (counter)
extern std::atomic<unsigned long long> g_records_duplicate;
// сколько чанков отклонено (counter)
extern std::atomic<unsigned long long> g_chunks_rejected;
// текущий размер очереди задач (gauge, приблизительный)
extern std::atomic<unsigned long long> g_queue_size;

// Prometheus text exposition
std::string render_metrics();
} // namespace chunkingest
