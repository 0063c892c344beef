/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file support.hpp
 * @brief Test doubles shared by several test translation units.
 */

#pragma once

#include "uuidmesh/infra/logger.hpp"

#include <cJSON.h>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace uuidmesh::test {

/**
 * @class RecordingSink
 * @brief EventSink that keeps every event in memory.
 */
class RecordingSink : public infra::EventSink {
  public:
    struct Record {
        infra::LogLevel level;
        std::string event;
        infra::EventFields fields;

        std::string field(const std::string& key) const
        {
            for (const auto& [k, v] : fields) {
                if (k == key) {
                    return v;
                }
            }
            return "";
        }
    };

    void emit(infra::LogLevel level, const std::string& event,
              const infra::EventFields& fields) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back({level, event, fields});
    }

    std::vector<Record> records() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return records_;
    }

  private:
    mutable std::mutex mutex_;
    std::vector<Record> records_;
};

/// @brief Reads a top-level string member of a JSON document.
inline std::optional<std::string> json_string(const std::string& body, const char* key)
{
    cJSON* root = cJSON_Parse(body.c_str());
    if (!root) {
        return std::nullopt;
    }
    std::optional<std::string> out;
    cJSON* item = cJSON_GetObjectItem(root, key);
    if (cJSON_IsString(item) && item->valuestring) {
        out = item->valuestring;
    }
    cJSON_Delete(root);
    return out;
}

} // namespace uuidmesh::test
