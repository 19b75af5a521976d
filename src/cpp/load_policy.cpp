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

#include <collection_loader/load_policy.hpp>

namespace ia::collection_loader
{
  auto LoadRequestPolicy::decide(const ConcurrentLoadBehavior behavior, Ref<QueueMatches> matches) -> LoadAction
  {
    switch (behavior)
    {
    case ConcurrentLoadBehavior::Queue:
      return LoadAction::Admit;
    case ConcurrentLoadBehavior::ReplaceQueue:
      return LoadAction::CancelQueuedThenAdmit;
    case ConcurrentLoadBehavior::CancelAllOther:
      return LoadAction::CancelAllThenAdmit;
    case ConcurrentLoadBehavior::Skip:
      return matches.has_entries ? LoadAction::Skip : LoadAction::Admit;
    case ConcurrentLoadBehavior::SkipSame:
      return matches.same_description ? LoadAction::Skip : LoadAction::Admit;
    case ConcurrentLoadBehavior::SkipSameReason:
      return matches.same_reason ? LoadAction::Skip : LoadAction::Admit;
    case ConcurrentLoadBehavior::SkipSamePageInfo:
      return matches.same_page_token ? LoadAction::Skip : LoadAction::Admit;
    }
    return LoadAction::Admit;
  }

  auto to_string(const LoadAction action) -> StringView
  {
    switch (action)
    {
    case LoadAction::Admit:
      return "admit";
    case LoadAction::CancelQueuedThenAdmit:
      return "cancel-queued-then-admit";
    case LoadAction::CancelAllThenAdmit:
      return "cancel-all-then-admit";
    case LoadAction::Skip:
      return "skip";
    }
    return "unknown";
  }
} // namespace ia::collection_loader
