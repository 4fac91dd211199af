// Copyright 2024 The Hyperslab Authors
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "hyperslab/internal/log/verbose_flag.h"

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/const_init.h"
#include "absl/base/thread_annotations.h"
#include "absl/container/flat_hash_map.h"
#include "absl/flags/flag.h"
#include "absl/log/absl_log.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_split.h"
#include "absl/synchronization/mutex.h"
#include "hyperslab/internal/env.h"

ABSL_FLAG(std::string, hyperslab_verbose_logging, {},
          "comma-separated list of hyperslab verbose logging flags")
    .OnUpdate([]() {
      if (!absl::GetFlag(FLAGS_hyperslab_verbose_logging).empty()) {
        hyperslab::internal_log::UpdateVerboseLogging(
            absl::GetFlag(FLAGS_hyperslab_verbose_logging), true);
      }
    });

namespace hyperslab {
namespace internal_log {
namespace {

ABSL_CONST_INIT absl::Mutex g_mutex(absl::kConstInit);

// Singly-linked list of every flag that has been queried at least once.
ABSL_CONST_INIT VerboseFlag* g_list_head ABSL_GUARDED_BY(g_mutex) = nullptr;

struct LevelConfig {
  int default_level = -1;
  absl::flat_hash_map<std::string, int> levels;
};

void ParseLevelConfig(std::string_view input, LevelConfig& config) {
  for (std::string_view entry : absl::StrSplit(input, ',', absl::SkipEmpty())) {
    const size_t eq = entry.rfind('=');
    if (eq == entry.npos) {
      config.levels.insert_or_assign(std::string(entry), 0);
      continue;
    }
    if (eq == 0) continue;
    int level;
    if (!absl::SimpleAtoi(entry.substr(eq + 1), &level)) continue;
    if (level < -1) {
      level = -1;
    } else if (level > 1000) {
      level = 1000;
    }
    config.levels.insert_or_assign(std::string(entry.substr(0, eq)), level);
  }
  config.default_level = -1;
  if (auto it = config.levels.find("all"); it != config.levels.end()) {
    config.default_level = it->second;
  }
}

// The environment variable is read on first use.
LevelConfig& GetLevelConfig() ABSL_EXCLUSIVE_LOCKS_REQUIRED(g_mutex) {
  static LevelConfig* config = [] {
    auto* config = new LevelConfig;
    if (auto env = internal::GetEnv("HYPERSLAB_VERBOSE_LOGGING")) {
      ParseLevelConfig(*env, *config);
    }
    return config;
  }();
  return *config;
}

int LookupLevel(const LevelConfig& config, std::string_view name) {
  auto it = config.levels.find(name);
  return it == config.levels.end() ? config.default_level : it->second;
}

}  // namespace

void UpdateVerboseLogging(std::string_view input, bool overwrite)
    ABSL_LOCKS_EXCLUDED(g_mutex) {
  ABSL_LOG(INFO) << "--hyperslab_verbose_logging=" << input;
  LevelConfig config;
  ParseLevelConfig(input, config);

  absl::MutexLock lock(&g_mutex);
  LevelConfig& global_config = GetLevelConfig();
  std::swap(global_config.levels, config.levels);
  std::swap(global_config.default_level, config.default_level);
  if (!overwrite) {
    if (!global_config.levels.count("all")) {
      global_config.default_level = config.default_level;
    }
    // Previous entries not named in `input` are kept.
    global_config.levels.merge(config.levels);
  }

  for (VerboseFlag* flag = g_list_head; flag != nullptr; flag = flag->next_) {
    flag->value_.store(LookupLevel(global_config, flag->name_),
                       std::memory_order_seq_cst);
  }
}

int VerboseFlag::Register(VerboseFlag* flag) {
  absl::MutexLock lock(&g_mutex);
  int v = flag->value_.load(std::memory_order_relaxed);
  if (v == kValueUninitialized) {
    v = LookupLevel(GetLevelConfig(), flag->name_);
    flag->value_.store(v, std::memory_order_relaxed);
    flag->next_ = std::exchange(g_list_head, flag);
  }
  return v;
}

bool VerboseFlag::SlowPath(VerboseFlag* flag, int old_v, int level) {
  if (ABSL_PREDICT_TRUE(old_v != kValueUninitialized)) {
    return level >= 0;
  }
  return Register(flag) >= level;
}

static_assert(std::is_trivially_destructible<VerboseFlag>::value,
              "VerboseFlag must be trivially destructible");

}  // namespace internal_log
}  // namespace hyperslab
