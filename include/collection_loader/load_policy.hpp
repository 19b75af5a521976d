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

#include <collection_loader/page_load.hpp>

#include <type_traits>

namespace ia::collection_loader
{
  enum class LoadAction : u8
  {
    Admit,
    CancelQueuedThenAdmit,
    CancelAllThenAdmit,
    Skip
  };

  [[nodiscard]] auto to_string(const LoadAction action) -> StringView;

  // What the loads already queued or running have in common with a requested one.
  struct QueueMatches
  {
    Mut<bool> has_entries = false;
    Mut<bool> same_description = false;
    Mut<bool> same_reason = false;
    Mut<bool> same_page_token = false;

    template <typename PageToken>
    auto accumulate(Ref<PageLoadDescription<PageToken>> requested, Ref<PageLoadDescription<PageToken>> entry) -> void
    {
      has_entries = true;
      same_description = same_description || requested == entry;
      same_reason = same_reason || requested.reason == entry.reason;
      same_page_token = same_page_token || requested.page_token == entry.page_token;
    }
  };

  class LoadRequestPolicy
  {
public:
    [[nodiscard]] static auto decide(const ConcurrentLoadBehavior behavior, Ref<QueueMatches> matches) -> LoadAction;

    // @param `current` may be null; `pending` is any range of descriptions.
    template <typename PageToken, typename PendingRange>
    [[nodiscard]] static auto decide(const ConcurrentLoadBehavior behavior,
                                     Ref<PageLoadDescription<PageToken>> requested,
                                     std::type_identity_t<const PageLoadDescription<PageToken> *> current,
                                     Ref<PendingRange> pending)
        -> LoadAction
    {
      Mut<QueueMatches> matches;
      if (current != nullptr)
      {
        matches.accumulate(requested, *current);
      }
      for (Ref<PageLoadDescription<PageToken>> entry : pending)
      {
        matches.accumulate(requested, entry);
      }
      return decide(behavior, matches);
    }
  };
} // namespace ia::collection_loader
