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

namespace ia::collection_loader
{
  struct LoaderConfig
  {
    // Behaviors used by load_initial_page, load_next_page and load_previous_page.
    Mut<ConcurrentLoadBehavior> initial_page_behavior = ConcurrentLoadBehavior::CancelAllOther;
    Mut<ConcurrentLoadBehavior> next_page_behavior = ConcurrentLoadBehavior::SkipSameReason;
    Mut<ConcurrentLoadBehavior> previous_page_behavior = ConcurrentLoadBehavior::SkipSameReason;

    // Delete the helper's items that are not part of a freshly imported initial page.
    Mut<bool> delete_stale_items_on_initial_page = true;
  };
} // namespace ia::collection_loader
