// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio_config/oxr_source_config.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace trackio
{

namespace
{

int read_interval(const YAML::Node& node, const char* key, int fallback)
{
    if (!node[key])
    {
        return fallback;
    }

    const int value = node[key].as<int>();
    if (value <= 0)
    {
        throw std::invalid_argument(std::string(key) + " must be positive, got " + std::to_string(value));
    }
    return value;
}

} // namespace

Policy policy_from_string(std::string_view name)
{
    for (Policy policy : { Policy::BackgroundFrames, Policy::Images, Policy::OptimizeHmd })
    {
        if (to_string(policy) == name)
        {
            return policy;
        }
    }
    throw std::invalid_argument("Unknown policy: " + std::string(name));
}

OxrSourceConfig load_oxr_source_config(const std::string& path)
{
    OxrSourceConfig config;

    try
    {
        YAML::Node root = YAML::LoadFile(path);

        if (root["app_name"])
            config.app_name = root["app_name"].as<std::string>();

        if (root["extensions"])
        {
            for (const auto& ext : root["extensions"])
            {
                config.extensions.push_back(ext.as<std::string>());
            }
        }

        config.poll_interval_ms = read_interval(root, "poll_interval_ms", config.poll_interval_ms);
        config.retry_interval_ms = read_interval(root, "retry_interval_ms", config.retry_interval_ms);

        if (root["policies"])
        {
            for (const auto& policy : root["policies"])
            {
                config.policies.push_back(policy_from_string(policy.as<std::string>()));
            }
        }
    }
    catch (const YAML::Exception& e)
    {
        throw std::runtime_error("YAML parsing error in " + path + ": " + std::string(e.what()));
    }
    catch (const std::invalid_argument& e)
    {
        throw std::runtime_error("Invalid configuration in " + path + ": " + std::string(e.what()));
    }

    return config;
}

} // namespace trackio
