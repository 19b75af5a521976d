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

#include <collection_loader/operation.hpp>

#include <concepts>
#include <optional>

namespace ia::collection_loader
{
  // Hooks a fetch task calls during its import phase, on the fetch context.
  // A failing hook must make the fetch task fail.
  template <typename PreCompletionData> class FetchTaskDelegate
  {
public:
    virtual ~FetchTaskDelegate() = default;

    virtual auto remote_operation_will_start(Ref<CancellationCheck> check) -> Result<void> = 0;

    // false means: do not import the fetched results, but finish the fetch successfully.
    virtual auto operation_will_import_results(Ref<CancellationCheck> check) -> Result<bool> = 0;

    // Must be called right after the import, before the fetch task finishes.
    virtual auto operation_did_finish_import(Ref<PreCompletionData> results, Ref<CancellationCheck> check)
        -> Result<void> = 0;
  };

  // What a CollectionLoader needs from the adapter that actually fetches and stores pages.
  //
  // fetch_task_for, result_of, initial_page_token and the page token getters are called on the coordination
  // context; the item accessors and delete_item are called from fetch tasks on the fetch context.
  template <typename Helper>
  concept CollectionLoaderHelper = requires(
      MutRef<Helper> helper, Ref<typename Helper::PageToken> token, Ref<typename Helper::CompletionData> data,
      Ref<typename Helper::PreCompletionData> pre_completion, Ref<typename Helper::Item> item,
      MutRef<typename Helper::FetchTask> task, Ref<CancellationCheck> check,
      Ref<std::shared_ptr<FetchTaskDelegate<typename Helper::PreCompletionData>>> fetch_delegate, const usize index) {
    requires std::equality_comparable<typename Helper::PageToken>;
    requires std::equality_comparable<typename Helper::Item>;

    { helper.initial_page_token() } -> std::convertible_to<typename Helper::PageToken>;
    {
      helper.fetch_task_for(token, fetch_delegate)
    } -> std::same_as<Result<std::shared_ptr<typename Helper::FetchTask>>>;
    { task.run(check) };
    { helper.result_of(task) } -> std::same_as<Result<typename Helper::CompletionData>>;
    { helper.next_page_token(data, token) } -> std::same_as<std::optional<typename Helper::PageToken>>;
    { helper.previous_page_token(data, token) } -> std::same_as<std::optional<typename Helper::PageToken>>;

    { helper.number_of_items() } -> std::convertible_to<usize>;
    { helper.item_at(index) } -> std::convertible_to<typename Helper::Item>;
    { helper.number_of_items(pre_completion) } -> std::convertible_to<usize>;
    { helper.item_at(index, pre_completion) } -> std::convertible_to<typename Helper::Item>;
    { helper.delete_item(item) };
  };
} // namespace ia::collection_loader
