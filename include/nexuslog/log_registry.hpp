/**
 * @file log_registry.hpp
 * @brief Process-wide table of shared sinks
 * @author nexuslog contributors
 * @copyright Copyright (c) 2026 nexuslog contributors. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <utility>

#include "robin_hood.h"
#include "log_sink.hpp"

namespace nexuslog
{

/**
 * @brief Identity of a sink: standard output, or a resolved file path
 */
struct sink_key
{
    bool console{true};
    std::string path; ///< Absolute, lexically normalized; empty for the console

    static sink_key for_target(const std::optional<std::string> &target)
    {
        if (!target) return {};

        std::error_code ec;
        auto resolved = std::filesystem::absolute(*target, ec);
        if (ec) return {false, *target};
        return {false, resolved.lexically_normal().string()};
    }

    friend bool operator==(const sink_key &, const sink_key &) = default;
};

struct sink_key_hash
{
    size_t operator()(const sink_key &key) const noexcept
    {
        return robin_hood::hash<std::string>{}(key.path) ^ static_cast<size_t>(key.console);
    }
};

/**
 * @brief Registry sharing one sink between all loggers on the same target
 *
 * Holds only weak references. A sink lives as long as some logger owns it;
 * when the last owner goes away the sink stops its worker and the registry
 * entry simply expires. Expired entries are replaced on the next resolve()
 * for that target and are not swept otherwise.
 *
 * The registry is only touched when loggers are created, so one mutex
 * guards the whole table.
 *
 * Usage:
 * @code
 * auto a = sink_registry::instance().resolve({.path = "logs/app.log"});
 * auto b = sink_registry::instance().resolve({.path = "./logs/app.log"});
 * // a == b: one worker thread, one open file
 * @endcode
 */
class sink_registry
{
  public:
    static sink_registry &instance()
    {
        static sink_registry inst;
        return inst;
    }

    /**
     * @brief Owning reference to the sink for @p config.path, creating it if needed
     *
     * When the sink already exists, the remaining fields of @p config are
     * ignored and the existing sink's settings apply.
     */
    std::shared_ptr<shared_sink> resolve(const sink_config &config)
    {
        auto key = sink_key::for_target(config.path);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sinks_.find(key);
        if (it != sinks_.end())
        {
            if (auto sink = it->second.lock()) { return sink; }
        }

        auto sink = std::make_shared<shared_sink>(config);
        sinks_[key] = sink;
        return sink;
    }

    /**
     * @brief Live sink for @p target, or nullptr
     */
    std::shared_ptr<shared_sink> find(const std::optional<std::string> &target) const
    {
        auto key = sink_key::for_target(target);

        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sinks_.find(key);
        return it != sinks_.end() ? it->second.lock() : nullptr;
    }

  private:
    sink_registry() = default;

    robin_hood::unordered_map<sink_key, std::weak_ptr<shared_sink>, sink_key_hash> sinks_;
    mutable std::mutex mutex_;
};

} // namespace nexuslog
