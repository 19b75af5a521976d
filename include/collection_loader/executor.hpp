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

#include <functional>

namespace ia::collection_loader
{
  // Something operations can be posted to. Implementations must accept posts from any thread.
  class Executor
  {
public:
    using Task = std::function<void()>;

    virtual ~Executor() = default;

    virtual auto post(Mut<Task> task) -> void = 0;
  };
} // namespace ia::collection_loader
