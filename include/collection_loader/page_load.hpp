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

#include <crux/crux.hpp>

#include <optional>

namespace ia::collection_loader
{
  enum class LoadReason : u8
  {
    InitialPage,
    NextPage,
    PreviousPage,
    Sync // Reserved for bulk reconciliation; never moves the cursors
  };

  // How a new load interacts with the loads already queued or running.
  enum class ConcurrentLoadBehavior : u8
  {
    Queue,           // Append after every queued load
    ReplaceQueue,    // Cancel queued loads (not the current one), then append
    CancelAllOther,  // Cancel queued loads and the current one, then append
    Skip,            // Drop the new load if anything is queued or running
    SkipSame,        // Drop the new load if one with the same page token and reason exists
    SkipSameReason,  // Drop the new load if one with the same reason exists
    SkipSamePageInfo // Drop the new load if one with the same page token exists
  };

  enum class LoadFailure : u8
  {
    None,
    Construction, // The helper could not build a fetch task
    Fetch,
    Cancelled
  };

  [[nodiscard]] auto to_string(const LoadReason reason) -> StringView;
  [[nodiscard]] auto to_string(const ConcurrentLoadBehavior behavior) -> StringView;
  [[nodiscard]] auto to_string(const LoadFailure failure) -> StringView;

  template <typename PageToken> struct PageLoadDescription
  {
    Mut<PageToken> page_token;
    Mut<LoadReason> reason;

    [[nodiscard]] auto operator==(Ref<PageLoadDescription> other) const -> bool
    {
      return reason == other.reason && page_token == other.page_token;
    }
  };

  template <typename PageToken> struct PageCursorState
  {
    Mut<std::optional<PageToken>> next;
    Mut<std::optional<PageToken>> previous;
  };

  // Outcome of one admitted (or construction-failed) page load, as handed to the delegate.
  template <typename CompletionData> class PageLoadResult
  {
public:
    [[nodiscard]] static auto success(Mut<CompletionData> data) -> PageLoadResult
    {
      return PageLoadResult(Result<CompletionData>(std::move(data)), LoadFailure::None);
    }

    [[nodiscard]] static auto failure(const LoadFailure kind, Ref<String> message) -> PageLoadResult
    {
      return PageLoadResult(fail("{}", message), kind);
    }

    [[nodiscard]] auto has_value() const -> bool
    {
      return m_failure == LoadFailure::None;
    }

    [[nodiscard]] auto is_cancelled() const -> bool
    {
      return m_failure == LoadFailure::Cancelled;
    }

    [[nodiscard]] auto get_failure() const -> LoadFailure
    {
      return m_failure;
    }

    [[nodiscard]] auto get_result() const -> Ref<Result<CompletionData>>
    {
      return m_result;
    }

    [[nodiscard]] auto value() const -> Ref<CompletionData>
    {
      return *m_result;
    }

    [[nodiscard]] auto error() const -> Ref<String>
    {
      return m_result.error();
    }

private:
    PageLoadResult(Mut<Result<CompletionData>> result, const LoadFailure failure)
        : m_result(std::move(result)), m_failure(failure)
    {
    }

private:
    Mut<Result<CompletionData>> m_result;
    Mut<LoadFailure> m_failure;
  };
} // namespace ia::collection_loader
