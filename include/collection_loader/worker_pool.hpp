// IA-CollectionLoader; C++ 20 Paged Collection Loading.
// Copyright (C) 2026 IAS (ias@iasoft.dev)
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
// http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <collection_loader/executor.hpp>

#include <atomic>
#include <deque>
#include <mutex>
#include <thread>
#include <functional>
#include <stop_token>
#include <condition_variable>

namespace ia::collection_loader
{
  // The fetch context: a pool of worker threads draining one task queue.
  //
  // The pool has no fixed ceiling. A task posted while no worker is idle gets a new worker, so fetches parked on
  // I/O never hold back the others. Workers added that way stay until terminate().
  class WorkerPool final : public Executor
  {
public:
    using WorkerId = u16;

public:
    WorkerPool() = default;
    ~WorkerPool() override;

    WorkerPool(Ref<WorkerPool>) = delete;
    auto operator=(Ref<WorkerPool>) -> WorkerPool & = delete;

    // @param `worker_count` resident workers; 0 picks a count from the hardware concurrency.
    auto initialize(Mut<u8> worker_count = 0) -> Result<void>;
    auto terminate() -> void;

    auto post(Mut<Task> task) -> void override;

    // Blocks until every posted task has run.
    auto wait_until_idle() -> void;

    [[nodiscard]] auto get_worker_count() const -> WorkerId;

private:
    // Requires m_queue_mutex.
    auto spawn_worker() -> void;

    auto worker_loop(Mut<std::stop_token> stop_token, const WorkerId worker_id) -> void;

    auto finish_task() -> void;

private:
    mutable Mut<std::mutex> m_queue_mutex;
    Mut<std::condition_variable> m_wake_condition;
    Mut<Vec<std::jthread>> m_workers;
    Mut<std::deque<Task>> m_queue;
    Mut<usize> m_idle_workers = 0;
    Mut<bool> m_running = false;
    Mut<std::atomic<i32>> m_outstanding{0};
  };
} // namespace ia::collection_loader
