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

#include <atomic>
#include <memory>
#include <spdlog/spdlog.h>

namespace ia::collection_loader
{
  // Static logging facade. Every call is a no-op until initialize() ran. Safe to call from any thread, including
  // while another thread initializes or terminates it.
  class Logger
  {
public:
    Logger() = delete;
    ~Logger() = delete;
    Logger(Ref<Logger>) = delete;
    auto operator=(Ref<Logger>) -> Logger & = delete;

    static auto initialize(Ref<String> pattern = "[%H:%M:%S] [%n] [%l] %v",
                           const spdlog::level::level_enum level = spdlog::level::info) -> void;

    static auto terminate() -> void;

    static auto set_level(const spdlog::level::level_enum level) -> void;

    [[nodiscard]] static auto is_initialized() -> bool
    {
      return s_logger.load() != nullptr;
    }

    template <typename... Args> static auto trace(spdlog::format_string_t<Args...> fmt, Args &&...args) -> void
    {
      if (const std::shared_ptr<spdlog::logger> logger = s_logger.load())
      {
        logger->trace(fmt, std::forward<Args>(args)...);
      }
    }

    template <typename... Args> static auto debug(spdlog::format_string_t<Args...> fmt, Args &&...args) -> void
    {
      if (const std::shared_ptr<spdlog::logger> logger = s_logger.load())
      {
        logger->debug(fmt, std::forward<Args>(args)...);
      }
    }

    template <typename... Args> static auto info(spdlog::format_string_t<Args...> fmt, Args &&...args) -> void
    {
      if (const std::shared_ptr<spdlog::logger> logger = s_logger.load())
      {
        logger->info(fmt, std::forward<Args>(args)...);
      }
    }

    template <typename... Args> static auto warn(spdlog::format_string_t<Args...> fmt, Args &&...args) -> void
    {
      if (const std::shared_ptr<spdlog::logger> logger = s_logger.load())
      {
        logger->warn(fmt, std::forward<Args>(args)...);
      }
    }

    template <typename... Args> static auto error(spdlog::format_string_t<Args...> fmt, Args &&...args) -> void
    {
      if (const std::shared_ptr<spdlog::logger> logger = s_logger.load())
      {
        logger->error(fmt, std::forward<Args>(args)...);
      }
    }

    template <typename... Args> static auto critical(spdlog::format_string_t<Args...> fmt, Args &&...args) -> void
    {
      if (const std::shared_ptr<spdlog::logger> logger = s_logger.load())
      {
        logger->critical(fmt, std::forward<Args>(args)...);
      }
    }

private:
    static Mut<std::atomic<std::shared_ptr<spdlog::logger>>> s_logger;
  };
} // namespace ia::collection_loader
