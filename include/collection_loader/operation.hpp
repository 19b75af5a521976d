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
#include <memory>
#include <mutex>

namespace ia::collection_loader
{
  // Handed to cooperative work so it can abort at safe checkpoints.
  class CancellationCheck
  {
public:
    explicit CancellationCheck(Mut<std::shared_ptr<const std::atomic<bool>>> flag) : m_flag(std::move(flag))
    {
    }

    // Fails once cancellation was requested.
    auto operator()() const -> Result<void>;

    [[nodiscard]] auto is_cancelled() const -> bool
    {
      return m_flag->load();
    }

private:
    Mut<std::shared_ptr<const std::atomic<bool>>> m_flag;
  };

  // A unit of work in a dependency graph.
  //
  // An enqueued operation is posted to its executor once every dependency has finished. Cancelling an operation does
  // not release it early: it still waits for its dependencies, then finishes without running its body if the
  // cancellation arrived before it started. Dependents are released when it finishes, cancelled or not.
  //
  // Operations reference their executor weakly: an operation whose executor is gone is never posted, and is freed
  // along with the graph that holds it. The body (and everything it captured) is released once the operation ran.
  class Operation final : public std::enable_shared_from_this<Operation>
  {
    struct PassKey
    {
      explicit PassKey() = default;
    };

public:
    using Body = std::function<void(Ref<CancellationCheck>)>;

    enum class State : u8
    {
      Created,   // Dependencies can still be added
      Waiting,   // Enqueued, dependencies unfinished
      Scheduled, // Posted to the executor
      Executing,
      Finished
    };

public:
    [[nodiscard]] static auto create(Ref<String> name, Mut<Body> body) -> std::shared_ptr<Operation>;

    Operation(PassKey, Ref<String> name, Mut<Body> body);

    Operation(Ref<Operation>) = delete;
    auto operator=(Ref<Operation>) -> Operation & = delete;

    // Only valid before the operation is enqueued.
    auto add_dependency(Ref<std::shared_ptr<Operation>> dependency) -> void;
    auto add_dependencies(Ref<Vec<std::shared_ptr<Operation>>> dependencies) -> void;

    auto enqueue(Ref<std::shared_ptr<Executor>> executor) -> void;

    auto cancel() -> void;

    auto wait_until_finished() const -> void;

    [[nodiscard]] auto get_cancellation_check() const -> CancellationCheck;

    [[nodiscard]] auto get_state() const -> State;

    [[nodiscard]] auto is_cancelled() const -> bool
    {
      return m_cancelled->load();
    }

    [[nodiscard]] auto is_finished() const -> bool
    {
      return m_finished.load();
    }

    // False when the operation finished without running its body.
    [[nodiscard]] auto did_run_body() const -> bool
    {
      return m_ran_body.load();
    }

    [[nodiscard]] auto get_name() const -> Ref<String>
    {
      return m_name;
    }

private:
    auto dependency_finished() -> void;
    auto schedule_if_ready(MutRef<std::unique_lock<std::mutex>> lock) -> void;
    auto run() -> void;

private:
    const String m_name;
    Mut<Body> m_body;

    mutable Mut<std::mutex> m_mutex;
    Mut<State> m_state = State::Created;
    Mut<u32> m_unfinished_dependencies = 0;
    Mut<Vec<std::shared_ptr<Operation>>> m_dependents;
    Mut<std::weak_ptr<Executor>> m_executor;

    const std::shared_ptr<std::atomic<bool>> m_cancelled;
    Mut<std::atomic<bool>> m_ran_body{false};
    Mut<std::atomic<bool>> m_finished{false};
  };
} // namespace ia::collection_loader
