// benchmark.cpp
#include "document_coordinator.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

class CoordinatorBenchmark {
public:
  explicit CoordinatorBenchmark(CoordinatorConfig config) : registry_(config), history_limit_(config.history_limit) {}

  void runBenchmark() {
    std::cout << "Starting OT Benchmark..." << std::endl;

    sequentialSubmits(20000);
    laggingClients(20000);
    parallelDocuments(8, 5000);

    std::cout << "OT Benchmark completed." << std::endl;
  }

private:
  DocumentRegistry registry_;
  size_t history_limit_;
  std::default_random_engine rng_{std::random_device{}()};

  TextOperation randomEdit(uint64_t length, const std::string &author, uint64_t time) {
    std::uniform_int_distribution<int> kind(0, 2);
    if (length == 0 || kind(rng_) > 0) {
      std::uniform_int_distribution<uint64_t> pos(0, length);
      return TextOperation::make_insert(pos(rng_), "abc", author, time);
    }
    std::uniform_int_distribution<uint64_t> pos(0, length - 1);
    uint64_t start = pos(rng_);
    return TextOperation::make_delete(start, std::min<uint64_t>(2, length - start), author, time);
  }

  // Every client is up to date, so nothing needs rebasing
  void sequentialSubmits(size_t count) {
    std::cout << "Submitting " << count << " up-to-date edits..." << std::endl;
    registry_.open_document("sequential");
    auto start = std::chrono::high_resolution_clock::now();

    for (size_t i = 0; i < count; ++i) {
      auto stats = registry_.stats("sequential");
      registry_.submit("sequential", randomEdit(stats.length, "writer", i + 1), stats.version);
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Applied " << count << " edits in " << duration_ms << " ms." << std::endl;
  }

  // Clients submit against a version half a history window old
  void laggingClients(size_t count) {
    std::cout << "Submitting " << count << " edits lagging " << history_limit_ / 2 << " versions..." << std::endl;
    registry_.open_document("lagging", std::string(1000, 'x'));
    std::vector<DocumentStats> seen;
    auto start = std::chrono::high_resolution_clock::now();

    size_t rebased = 0;
    for (size_t i = 0; i < count; ++i) {
      seen.push_back(registry_.stats("lagging"));
      const DocumentStats &base = seen.size() > history_limit_ / 2 ? seen[seen.size() - 1 - history_limit_ / 2]
                                                                    : seen.front();
      auto result = registry_.submit("lagging", randomEdit(base.length, "client", i + 1), base.version);
      rebased += result.version - 1 - base.version;
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Applied " << count << " edits (" << rebased << " transforms) in " << duration_ms << " ms."
              << std::endl;
  }

  void parallelDocuments(size_t documents, size_t per_document) {
    std::cout << "Submitting " << per_document << " edits to each of " << documents << " documents in parallel..."
              << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    std::vector<std::thread> workers;
    for (size_t d = 0; d < documents; ++d) {
      workers.emplace_back([this, d, per_document]() {
        std::string id = "parallel-" + std::to_string(d);
        for (size_t i = 0; i < per_document; ++i) {
          registry_.submit(id, TextOperation::make_insert(i, "p", "worker", i + 1), i);
        }
      });
    }
    for (auto &w : workers) {
      w.join();
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    std::cout << "Applied " << documents * per_document << " edits in " << duration_ms << " ms." << std::endl;
  }
};

int main() {
  CoordinatorBenchmark benchmark(CoordinatorConfig::from_env());
  benchmark.runBenchmark();
  return 0;
}
