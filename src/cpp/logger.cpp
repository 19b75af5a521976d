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

#include <collection_loader/logger.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace ia::collection_loader
{
  Mut<std::atomic<std::shared_ptr<spdlog::logger>>> Logger::s_logger;

  auto Logger::initialize(Ref<String> pattern, const spdlog::level::level_enum level) -> void
  {
    if (s_logger.load())
    {
      return;
    }

    const std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink =
        std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    const std::shared_ptr<spdlog::logger> logger =
        std::make_shared<spdlog::logger>("collection_loader", console_sink);

    logger->set_pattern(pattern);
    logger->set_level(level);

    // Another thread may have won the race; its logger stays.
    Mut<std::shared_ptr<spdlog::logger>> expected;
    if (!s_logger.compare_exchange_strong(expected, logger))
    {
      return;
    }

    debug("Logger initialized");
  }

  auto Logger::terminate() -> void
  {
    const std::shared_ptr<spdlog::logger> logger = s_logger.exchange(nullptr);
    if (logger)
    {
      logger->flush();
    }
  }

  auto Logger::set_level(const spdlog::level::level_enum level) -> void
  {
    if (const std::shared_ptr<spdlog::logger> logger = s_logger.load())
    {
      logger->set_level(level);
    }
  }
} // namespace ia::collection_loader
