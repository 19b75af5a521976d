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

#include <collection_loader/operation.hpp>
#include <collection_loader/logger.hpp>

namespace ia::collection_loader
{
  auto CancellationCheck::operator()() const -> Result<void>
  {
    if (m_flag->load())
    {
      return fail("Operation was cancelled");
    }
    return {};
  }

  Operation::Operation(PassKey, Ref<String> name, Mut<Body> body)
      : m_name(name), m_body(std::move(body)), m_cancelled(std::make_shared<std::atomic<bool>>(false))
  {
  }

  auto Operation::create(Ref<String> name, Mut<Body> body) -> std::shared_ptr<Operation>
  {
    return std::make_shared<Operation>(PassKey{}, name, std::move(body));
  }

  auto Operation::add_dependency(Ref<std::shared_ptr<Operation>> dependency) -> void
  {
    ensure(dependency != nullptr, "Operation dependency must not be null");
    ensure(dependency.get() != this, "Operation cannot depend on itself");

    {
      const std::lock_guard<std::mutex> lock(m_mutex);
      ensure(m_state == State::Created, "Dependencies must be added before the operation is enqueued");
      ++m_unfinished_dependencies;
    }

    Mut<bool> already_finished = false;
    {
      const std::lock_guard<std::mutex> lock(dependency->m_mutex);
      if (dependency->m_state == State::Finished)
      {
        already_finished = true;
      }
      else
      {
        dependency->m_dependents.push_back(shared_from_this());
      }
    }

    if (already_finished)
    {
      const std::lock_guard<std::mutex> lock(m_mutex);
      --m_unfinished_dependencies;
    }
  }

  auto Operation::add_dependencies(Ref<Vec<std::shared_ptr<Operation>>> dependencies) -> void
  {
    for (Ref<std::shared_ptr<Operation>> dependency : dependencies)
    {
      add_dependency(dependency);
    }
  }

  auto Operation::enqueue(Ref<std::shared_ptr<Executor>> executor) -> void
  {
    ensure(executor != nullptr, "Operation executor must not be null");

    Mut<std::unique_lock<std::mutex>> lock(m_mutex);
    ensure(m_state == State::Created, "Operation can only be enqueued once");

    m_executor = executor;
    m_state = State::Waiting;
    schedule_if_ready(lock);
  }

  auto Operation::cancel() -> void
  {
    if (!m_cancelled->exchange(true))
    {
      Logger::trace("Operation '{}' cancelled", m_name);
    }
  }

  auto Operation::wait_until_finished() const -> void
  {
    while (!m_finished.load())
    {
      m_finished.wait(false);
    }
  }

  auto Operation::get_cancellation_check() const -> CancellationCheck
  {
    return CancellationCheck(m_cancelled);
  }

  auto Operation::get_state() const -> State
  {
    const std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
  }

  auto Operation::dependency_finished() -> void
  {
    Mut<std::unique_lock<std::mutex>> lock(m_mutex);
    ensure(m_unfinished_dependencies > 0, "Operation received more dependency completions than dependencies");

    --m_unfinished_dependencies;
    schedule_if_ready(lock);
  }

  auto Operation::schedule_if_ready(MutRef<std::unique_lock<std::mutex>> lock) -> void
  {
    if (m_state != State::Waiting || m_unfinished_dependencies != 0)
    {
      return;
    }

    const std::shared_ptr<Executor> executor = m_executor.lock();
    if (!executor)
    {
      Logger::debug("Operation '{}' dropped, its executor is gone", m_name);
      return;
    }

    m_state = State::Scheduled;
    lock.unlock();

    executor->post([self = shared_from_this()]() { self->run(); });
  }

  auto Operation::run() -> void
  {
    {
      const std::lock_guard<std::mutex> lock(m_mutex);
      m_state = State::Executing;
    }

    if (!m_cancelled->load())
    {
      m_ran_body = true;
      m_body(get_cancellation_check());
    }
    else
    {
      Logger::trace("Operation '{}' skipped, cancelled before start", m_name);
    }
    m_body = nullptr;

    Mut<Vec<std::shared_ptr<Operation>>> dependents;
    {
      const std::lock_guard<std::mutex> lock(m_mutex);
      m_state = State::Finished;
      dependents.swap(m_dependents);
      m_executor.reset();
    }

    m_finished = true;
    m_finished.notify_all();

    for (Ref<std::shared_ptr<Operation>> dependent : dependents)
    {
      dependent->dependency_finished();
    }
  }
} // namespace ia::collection_loader
