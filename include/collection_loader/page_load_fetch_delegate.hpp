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

#include <collection_loader/delegate.hpp>
#include <collection_loader/logger.hpp>

#include <algorithm>

namespace ia::collection_loader
{
  // The fetch task delegate a CollectionLoader hands to its helper for one page load.
  //
  // Once an initial page is imported, the helper's items that are not part of it are deleted (when the loader
  // delegate allows it), then the loader delegate gets its will_finish_loading checkpoint.
  template <CollectionLoaderHelper Helper>
  class PageLoadFetchDelegate final : public FetchTaskDelegate<typename Helper::PreCompletionData>
  {
public:
    using PageToken = typename Helper::PageToken;
    using PreCompletionData = typename Helper::PreCompletionData;
    using Item = typename Helper::Item;
    using Description = PageLoadDescription<PageToken>;
    using Delegate = CollectionLoaderDelegate<Helper>;

public:
    PageLoadFetchDelegate(Mut<std::shared_ptr<Helper>> helper, Mut<std::shared_ptr<Delegate>> delegate,
                          Ref<Description> description, const bool delete_stale_items)
        : m_helper(std::move(helper)), m_delegate(std::move(delegate)), m_description(description),
          m_delete_stale_items(delete_stale_items)
    {
    }

    auto remote_operation_will_start(Ref<CancellationCheck> check) -> Result<void> override
    {
      return check();
    }

    auto operation_will_import_results(Ref<CancellationCheck> check) -> Result<bool> override
    {
      const Result<void> not_cancelled = check();
      if (!not_cancelled)
      {
        return fail("{}", not_cancelled.error());
      }
      return true;
    }

    auto operation_did_finish_import(Ref<PreCompletionData> results, Ref<CancellationCheck> check)
        -> Result<void> override
    {
      if (m_description.reason == LoadReason::InitialPage && m_delete_stale_items)
      {
        const Result<usize> deleted = delete_items_missing_from(results, check);
        if (!deleted)
        {
          return fail("{}", deleted.error());
        }
        if (*deleted > 0)
        {
          Logger::debug("Deleted {} items missing from the initial page", *deleted);
        }
      }

      if (!m_delegate)
      {
        return {};
      }
      return m_delegate->will_finish_loading(m_description, results, check);
    }

private:
    auto delete_items_missing_from(Ref<PreCompletionData> results, Ref<CancellationCheck> check) -> Result<usize>
    {
      const usize page_count = m_helper->number_of_items(results);
      Mut<Vec<Item>> page_items;
      page_items.reserve(page_count);
      for (Mut<usize> i = 0; i < page_count; ++i)
      {
        page_items.push_back(m_helper->item_at(i, results));
      }

      const usize local_count = m_helper->number_of_items();
      Mut<Vec<Item>> stale_items;
      for (Mut<usize> i = 0; i < local_count; ++i)
      {
        const Result<void> not_cancelled = check();
        if (!not_cancelled)
        {
          return fail("{}", not_cancelled.error());
        }

        Mut<Item> item = m_helper->item_at(i);
        if (std::find(page_items.begin(), page_items.end(), item) != page_items.end())
        {
          continue;
        }
        if (m_delegate && !m_delegate->can_delete(item))
        {
          continue;
        }
        stale_items.push_back(std::move(item));
      }

      for (Ref<Item> item : stale_items)
      {
        const Result<void> not_cancelled = check();
        if (!not_cancelled)
        {
          return fail("{}", not_cancelled.error());
        }
        m_helper->delete_item(item);
      }
      return stale_items.size();
    }

private:
    const std::shared_ptr<Helper> m_helper;
    const std::shared_ptr<Delegate> m_delegate;
    const Description m_description;
    const bool m_delete_stale_items;
  };
} // namespace ia::collection_loader
