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

#include <collection_loader/config.hpp>
#include <collection_loader/load_policy.hpp>
#include <collection_loader/main_queue.hpp>
#include <collection_loader/worker_pool.hpp>
#include <collection_loader/page_load_fetch_delegate.hpp>

#include <deque>
#include <format>
#include <ranges>

namespace ia::collection_loader
{
  // Loads a paged collection through a helper, one page at a time.
  //
  // The loader does not fetch anything itself: the fetch tasks built by the helper do. It only makes sure a single
  // page load runs at a time, in submission order, and keeps the next/previous page tokens up to date.
  //
  // Every page load is three operations: a prestart and a completion on the main queue, and the helper's fetch task
  // on the worker pool in between. Each prestart waits for the completion of the load queued before it.
  //
  // All the public functions must be called on the main queue's owner thread. The helper and the delegate are
  // retained by every page load in flight; cancelling only cancels the fetch tasks, so the delegate gets exactly one
  // did_finish_loading per admitted load.
  //
  // Page loads hold the loader state weakly. Destroying the loader cancels its loads; those that still get to run
  // notify the delegate but no longer touch the cursors. Loads whose main queue is gone are freed unrun.
  template <CollectionLoaderHelper Helper> class CollectionLoader
  {
public:
    using PageToken = typename Helper::PageToken;
    using CompletionData = typename Helper::CompletionData;
    using PreCompletionData = typename Helper::PreCompletionData;
    using Item = typename Helper::Item;
    using FetchTask = typename Helper::FetchTask;

    using Description = PageLoadDescription<PageToken>;
    using LoadResult = PageLoadResult<CompletionData>;
    using Delegate = CollectionLoaderDelegate<Helper>;
    using CallbackDelegate = CallbackCollectionLoaderDelegate<Helper>;

public:
    CollectionLoader(Mut<std::shared_ptr<Helper>> helper, Mut<std::shared_ptr<MainQueue>> main_queue,
                     Mut<std::shared_ptr<WorkerPool>> fetch_queue, Ref<LoaderConfig> config = {})
        : m_helper(std::move(helper)), m_main_queue(std::move(main_queue)), m_fetch_queue(std::move(fetch_queue)),
          m_config(config), m_state(std::make_shared<State>())
    {
      ensure(m_helper != nullptr, "CollectionLoader requires a helper");
      ensure(m_main_queue != nullptr, "CollectionLoader requires a main queue");
      ensure(m_fetch_queue != nullptr, "CollectionLoader requires a fetch queue");
    }

    ~CollectionLoader()
    {
      cancel_all_loadings();
    }

    CollectionLoader(Ref<CollectionLoader>) = delete;
    auto operator=(Ref<CollectionLoader>) -> CollectionLoader & = delete;

    // The delegate is not retained; the loader only retains it while page loads are in flight.
    auto set_delegate(Mut<std::weak_ptr<Delegate>> delegate) -> void
    {
      m_delegate = std::move(delegate);
      m_callback_delegate.reset();
    }

    // Installs a delegate built from callbacks. Unlike set_delegate, the loader owns this one.
    auto set_delegate_with_callbacks(Mut<typename CallbackDelegate::WillStartLoading> will_start_loading = {},
                                     Mut<typename CallbackDelegate::DidFinishLoading> did_finish_loading = {},
                                     Mut<typename CallbackDelegate::CanDelete> can_delete = {},
                                     Mut<typename CallbackDelegate::WillFinishLoading> will_finish_loading = {})
        -> void
    {
      const std::shared_ptr<CallbackDelegate> delegate = std::make_shared<CallbackDelegate>(
          std::move(will_start_loading), std::move(did_finish_loading), std::move(can_delete),
          std::move(will_finish_loading));
      // set_delegate drops the owned callback delegate, so it must come first.
      set_delegate(std::weak_ptr<Delegate>(delegate));
      m_callback_delegate = delegate;
    }

    // Loads the page to show when nothing is known yet, or when a full reload is wanted. Not necessarily the first
    // page of the collection.
    auto load_initial_page() -> void
    {
      ensure(m_main_queue->is_owner_thread(), "CollectionLoader must be used from its main queue's owner thread");
      load(Description{m_helper->initial_page_token(), LoadReason::InitialPage}, m_config.initial_page_behavior);
    }

    auto load_next_page() -> void
    {
      ensure(m_main_queue->is_owner_thread(), "CollectionLoader must be used from its main queue's owner thread");
      if (!m_state->cursor.next)
      {
        return;
      }
      load(Description{*m_state->cursor.next, LoadReason::NextPage}, m_config.next_page_behavior);
    }

    auto load_previous_page() -> void
    {
      ensure(m_main_queue->is_owner_thread(), "CollectionLoader must be used from its main queue's owner thread");
      if (!m_state->cursor.previous)
      {
        return;
      }
      load(Description{*m_state->cursor.previous, LoadReason::PreviousPage}, m_config.previous_page_behavior);
    }

    auto cancel_all_loadings() -> void
    {
      Mut<usize> cancelled = 0;
      if (m_state->current)
      {
        m_state->current->cancel();
        ++cancelled;
      }
      for (Ref<LoadingOperations> operations : m_state->pending)
      {
        operations.cancel();
        ++cancelled;
      }

      if (cancelled > 0)
      {
        Logger::debug("Cancelled {} page loads", cancelled);
      }
    }

    // Queues a page load, unless `behavior` says to skip it. `extra_dependencies` must finish before the load
    // starts.
    auto load(Ref<Description> description, const ConcurrentLoadBehavior behavior = ConcurrentLoadBehavior::Queue,
              Ref<Vec<std::shared_ptr<Operation>>> extra_dependencies = {}) -> void
    {
      ensure(m_main_queue->is_owner_thread(), "CollectionLoader must be used from its main queue's owner thread");

      // Every callback of this load goes to the helper and delegate set now.
      const std::shared_ptr<Helper> helper = m_helper;
      const std::shared_ptr<Delegate> delegate = m_delegate.lock();
      const std::shared_ptr<State> state = m_state;

      const Description *current = state->current ? &state->current->description : nullptr;
      const LoadAction action = LoadRequestPolicy::decide(
          behavior, description, current,
          state->pending | std::views::transform([](Ref<LoadingOperations> operations) -> Ref<Description> {
            return operations.description;
          }));

      switch (action)
      {
      case LoadAction::Skip:
        Logger::debug("Skipped {} load ({})", to_string(description.reason), to_string(behavior));
        return;
      case LoadAction::CancelAllThenAdmit:
        if (state->current)
        {
          state->current->cancel();
        }
        [[fallthrough]];
      case LoadAction::CancelQueuedThenAdmit:
        for (Ref<LoadingOperations> operations : state->pending)
        {
          operations.cancel();
        }
        break;
      case LoadAction::Admit:
        break;
      }

      const std::shared_ptr<FetchTaskDelegate<PreCompletionData>> fetch_delegate =
          std::make_shared<PageLoadFetchDelegate<Helper>>(helper, delegate, description,
                                                          m_config.delete_stale_items_on_initial_page);

      Mut<Result<std::shared_ptr<FetchTask>>> fetch_task_result =
          helper->fetch_task_for(description.page_token, fetch_delegate);
      if (!fetch_task_result || *fetch_task_result == nullptr)
      {
        const String message = fetch_task_result ? String("Helper returned no fetch task") : fetch_task_result.error();
        Logger::warn("Could not create the fetch task of a {} load: {}", to_string(description.reason), message);
        notify_did_finish_loading(delegate, description, LoadResult::failure(LoadFailure::Construction, message));
        return;
      }
      const std::shared_ptr<FetchTask> fetch_task = std::move(*fetch_task_result);

      const u64 load_id = ++state->last_load_id;
      const std::weak_ptr<State> weak_state = state;

      const std::shared_ptr<Operation> prestart = Operation::create(
          std::format("prestart #{}", load_id), [weak_state, delegate, description, load_id](Ref<CancellationCheck>) {
            if (delegate)
            {
              delegate->will_start_loading(description);
            }

            const std::shared_ptr<State> state = weak_state.lock();
            if (!state)
            {
              Logger::trace("Page load #{} started after its loader was destroyed", load_id);
              return;
            }

            // Our operations are at the head of the pending queue by construction.
            ensure(!state->current.has_value(), "A page load started while another one is current");
            ensure(!state->pending.empty() && state->pending.front().id == load_id,
                   "A page load started out of submission order");
            state->current.emplace(std::move(state->pending.front()));
            state->pending.pop_front();

            Logger::trace("Page load #{} started", load_id);
          });

      // Stays false when the fetch was cancelled before it started.
      const std::shared_ptr<std::atomic<bool>> fetch_ran = std::make_shared<std::atomic<bool>>(false);
      const std::shared_ptr<Operation> fetch = Operation::create(
          std::format("fetch #{}", load_id), [fetch_task, fetch_ran](Ref<CancellationCheck> check) {
            fetch_ran->store(true);
            fetch_task->run(check);
          });
      const CancellationCheck fetch_check = fetch->get_cancellation_check();

      const std::shared_ptr<Operation> completion = Operation::create(
          std::format("completion #{}", load_id),
          [weak_state, helper, delegate, description, fetch_task, fetch_ran, fetch_check,
           load_id](Ref<CancellationCheck>) {
            const LoadResult result = resolve_result(*helper, *fetch_task, fetch_ran->load(), fetch_check);

            if (const std::shared_ptr<State> state = weak_state.lock())
            {
              if (result.has_value())
              {
                update_cursor(*state, *helper, description, result.value());
              }

              ensure(state->current.has_value() && state->current->id == load_id,
                     "A page load finished while not being the current one");
              state->current.reset();
            }

            Logger::debug("Page load #{} ({}) finished: {}", load_id, to_string(description.reason),
                          result.has_value() ? StringView("success") : to_string(result.get_failure()));

            notify_did_finish_loading(delegate, description, result);
          });

      Mut<LoadingOperations> operations{load_id, prestart, fetch, completion, description};
      const LoadingOperations *previous = nullptr;
      if (!state->pending.empty())
      {
        previous = &state->pending.back();
      }
      else if (state->current)
      {
        previous = &*state->current;
      }
      operations.setup_dependencies(previous);
      prestart->add_dependencies(extra_dependencies);
      state->pending.push_back(std::move(operations));

      Logger::debug("Queued page load #{} ({}, {}), {} pending", load_id, to_string(description.reason),
                    to_string(behavior), state->pending.size());

      fetch->enqueue(m_fetch_queue);
      prestart->enqueue(m_main_queue);
      completion->enqueue(m_main_queue);
    }

    [[nodiscard]] auto next_page_token() const -> Ref<std::optional<PageToken>>
    {
      return m_state->cursor.next;
    }

    [[nodiscard]] auto previous_page_token() const -> Ref<std::optional<PageToken>>
    {
      return m_state->cursor.previous;
    }

    [[nodiscard]] auto current_page_load() const -> std::optional<Description>
    {
      if (!m_state->current)
      {
        return std::nullopt;
      }
      return m_state->current->description;
    }

    [[nodiscard]] auto pending_load_count() const -> usize
    {
      return m_state->pending.size();
    }

    [[nodiscard]] auto helper() const -> Ref<std::shared_ptr<Helper>>
    {
      return m_helper;
    }

private:
    struct LoadingOperations
    {
      Mut<u64> id;
      Mut<std::shared_ptr<Operation>> prestart;
      Mut<std::shared_ptr<Operation>> fetch;
      Mut<std::shared_ptr<Operation>> completion;
      Mut<Description> description;

      auto setup_dependencies(const LoadingOperations *previous) const -> void
      {
        // Waiting on the previous completion is enough: it waits on everything queued before it.
        if (previous != nullptr)
        {
          prestart->add_dependency(previous->completion);
        }
        fetch->add_dependency(prestart);
        completion->add_dependency(fetch);
      }

      // Only the fetch is cancelled. Prestart and completion always run so the delegate never misses a
      // notification.
      auto cancel() const -> void
      {
        fetch->cancel();
      }
    };

    // Only touched on the main queue. Owned by the loader alone.
    struct State
    {
      Mut<PageCursorState<PageToken>> cursor;
      Mut<std::optional<LoadingOperations>> current;
      Mut<std::deque<LoadingOperations>> pending;
      Mut<u64> last_load_id = 0;
    };

private:
    static auto resolve_result(MutRef<Helper> helper, MutRef<FetchTask> fetch_task, const bool fetch_ran,
                               Ref<CancellationCheck> fetch_check) -> LoadResult
    {
      if (!fetch_ran)
      {
        return LoadResult::failure(LoadFailure::Cancelled, "Page load was cancelled before it started");
      }

      Mut<Result<CompletionData>> result = helper.result_of(fetch_task);
      if (result)
      {
        return LoadResult::success(std::move(*result));
      }
      return LoadResult::failure(fetch_check.is_cancelled() ? LoadFailure::Cancelled : LoadFailure::Fetch,
                                 result.error());
    }

    static auto update_cursor(MutRef<State> state, MutRef<Helper> helper, Ref<Description> description,
                              Ref<CompletionData> data) -> void
    {
      switch (description.reason)
      {
      case LoadReason::InitialPage:
        state.cursor.next = helper.next_page_token(data, description.page_token);
        state.cursor.previous = helper.previous_page_token(data, description.page_token);
        break;
      case LoadReason::NextPage:
        state.cursor.next = helper.next_page_token(data, description.page_token);
        break;
      case LoadReason::PreviousPage:
        state.cursor.previous = helper.previous_page_token(data, description.page_token);
        break;
      case LoadReason::Sync:
        break;
      }
    }

    static auto notify_did_finish_loading(Ref<std::shared_ptr<Delegate>> delegate, Ref<Description> description,
                                          Ref<LoadResult> result) -> void
    {
      if (delegate)
      {
        delegate->did_finish_loading(description, result);
      }
    }

private:
    const std::shared_ptr<Helper> m_helper;
    const std::shared_ptr<MainQueue> m_main_queue;
    const std::shared_ptr<WorkerPool> m_fetch_queue;
    const LoaderConfig m_config;

    Mut<std::weak_ptr<Delegate>> m_delegate;
    Mut<std::shared_ptr<CallbackDelegate>> m_callback_delegate;

    const std::shared_ptr<State> m_state;
  };
} // namespace ia::collection_loader
