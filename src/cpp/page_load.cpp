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

#include <collection_loader/page_load.hpp>

namespace ia::collection_loader
{
  auto to_string(const LoadReason reason) -> StringView
  {
    switch (reason)
    {
    case LoadReason::InitialPage:
      return "initial-page";
    case LoadReason::NextPage:
      return "next-page";
    case LoadReason::PreviousPage:
      return "previous-page";
    case LoadReason::Sync:
      return "sync";
    }
    return "unknown";
  }

  auto to_string(const ConcurrentLoadBehavior behavior) -> StringView
  {
    switch (behavior)
    {
    case ConcurrentLoadBehavior::Queue:
      return "queue";
    case ConcurrentLoadBehavior::ReplaceQueue:
      return "replace-queue";
    case ConcurrentLoadBehavior::CancelAllOther:
      return "cancel-all-other";
    case ConcurrentLoadBehavior::Skip:
      return "skip";
    case ConcurrentLoadBehavior::SkipSame:
      return "skip-same";
    case ConcurrentLoadBehavior::SkipSameReason:
      return "skip-same-reason";
    case ConcurrentLoadBehavior::SkipSamePageInfo:
      return "skip-same-page-info";
    }
    return "unknown";
  }

  auto to_string(const LoadFailure failure) -> StringView
  {
    switch (failure)
    {
    case LoadFailure::None:
      return "none";
    case LoadFailure::Construction:
      return "construction";
    case LoadFailure::Fetch:
      return "fetch";
    case LoadFailure::Cancelled:
      return "cancelled";
    }
    return "unknown";
  }
} // namespace ia::collection_loader
