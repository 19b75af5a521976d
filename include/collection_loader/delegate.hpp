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

#include <collection_loader/fetch_task.hpp>
#include <collection_loader/page_load.hpp>

namespace ia::collection_loader
{
  // Receives the lifecycle notifications of a CollectionLoader.
  //
  // will_start_loading and did_finish_loading run on the coordination context and must not block.
  // can_delete and will_finish_loading run inside fetch tasks, on the fetch context.
  template <typename Helper> class CollectionLoaderDelegate
  {
public:
    using PageToken = typename Helper::PageToken;
    using CompletionData = typename Helper::CompletionData;
    using PreCompletionData = typename Helper::PreCompletionData;
    using Item = typename Helper::Item;
    using Description = PageLoadDescription<PageToken>;
    using LoadResult = PageLoadResult<CompletionData>;

public:
    virtual ~CollectionLoaderDelegate() = default;

    virtual auto will_start_loading(Ref<Description> description) -> void = 0;

    virtual auto did_finish_loading(Ref<Description> description, Ref<LoadResult> result) -> void = 0;

    // Whether an item missing from a freshly loaded initial page may be deleted.
    virtual auto can_delete(Ref<Item> item) -> bool
    {
      AU_UNUSED(item);
      return true;
    }

    // Last checkpoint before a fetch task finishes. A failure fails the whole load.
    virtual auto will_finish_loading(Ref<Description> description, Ref<PreCompletionData> results,
                                     Ref<CancellationCheck> check) -> Result<void>
    {
      AU_UNUSED(description);
      AU_UNUSED(results);
      AU_UNUSED(check);
      return {};
    }
  };

  template <typename Helper> class CallbackCollectionLoaderDelegate final : public CollectionLoaderDelegate<Helper>
  {
public:
    using Base = CollectionLoaderDelegate<Helper>;
    using Description = typename Base::Description;
    using LoadResult = typename Base::LoadResult;
    using PreCompletionData = typename Base::PreCompletionData;
    using Item = typename Base::Item;

    using WillStartLoading = std::function<void(Ref<Description>)>;
    using DidFinishLoading = std::function<void(Ref<Description>, Ref<LoadResult>)>;
    using CanDelete = std::function<bool(Ref<Item>)>;
    using WillFinishLoading =
        std::function<Result<void>(Ref<Description>, Ref<PreCompletionData>, Ref<CancellationCheck>)>;

public:
    CallbackCollectionLoaderDelegate(Mut<WillStartLoading> will_start_loading, Mut<DidFinishLoading> did_finish_loading,
                                     Mut<CanDelete> can_delete, Mut<WillFinishLoading> will_finish_loading)
        : m_will_start_loading(std::move(will_start_loading)), m_did_finish_loading(std::move(did_finish_loading)),
          m_can_delete(std::move(can_delete)), m_will_finish_loading(std::move(will_finish_loading))
    {
    }

    auto will_start_loading(Ref<Description> description) -> void override
    {
      if (m_will_start_loading)
      {
        m_will_start_loading(description);
      }
    }

    auto did_finish_loading(Ref<Description> description, Ref<LoadResult> result) -> void override
    {
      if (m_did_finish_loading)
      {
        m_did_finish_loading(description, result);
      }
    }

    auto can_delete(Ref<Item> item) -> bool override
    {
      return m_can_delete ? m_can_delete(item) : true;
    }

    auto will_finish_loading(Ref<Description> description, Ref<PreCompletionData> results,
                             Ref<CancellationCheck> check) -> Result<void> override
    {
      if (!m_will_finish_loading)
      {
        return {};
      }
      return m_will_finish_loading(description, results, check);
    }

private:
    const WillStartLoading m_will_start_loading;
    const DidFinishLoading m_did_finish_loading;
    const CanDelete m_can_delete;
    const WillFinishLoading m_will_finish_loading;
  };
} // namespace ia::collection_loader
