#include "config.h"

#include <cstdlib>
#include <functional>
#include <type_traits>
#include <utility>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>

#include "error.h"
#include "logging.h"

namespace driftwatch {

namespace {

nlohmann::json NodeToJson(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Map: {
            nlohmann::json object = nlohmann::json::object();
            for (const auto& kv : node) {
                object[kv.first.as<std::string>()] = NodeToJson(kv.second);
            }
            return object;
        }
        case YAML::NodeType::Sequence: {
            nlohmann::json array = nlohmann::json::array();
            for (const auto& item : node) {
                array.push_back(NodeToJson(item));
            }
            return array;
        }
        case YAML::NodeType::Scalar: {
            int64_t int_value = 0;
            if (YAML::convert<int64_t>::decode(node, int_value)) {
                return int_value;
            }
            double double_value = 0.0;
            if (YAML::convert<double>::decode(node, double_value)) {
                return double_value;
            }
            bool bool_value = false;
            if (YAML::convert<bool>::decode(node, bool_value)) {
                return bool_value;
            }
            return node.Scalar();
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
        default:
            return nullptr;
    }
}

}  // namespace

absl::StatusOr<Config> Config::LoadFromFile(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return absl::NotFoundError(
            absl::StrCat("Configuration file not found: ", path.string()));
    }

    try {
        Config config;
        config.root_ = YAML::LoadFile(path.string());
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML configuration: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromString(std::string_view yaml_content) {
    try {
        Config config;
        config.root_ = YAML::Load(std::string(yaml_content));
        return config;
    } catch (const YAML::Exception& e) {
        return absl::InvalidArgumentError(
            absl::StrCat("Failed to parse YAML content: ", e.what()));
    }
}

absl::StatusOr<Config> Config::LoadFromEnvironment(std::string_view prefix) {
    Config config;

    auto get_env = [&prefix](const char* suffix) -> std::optional<std::string> {
        std::string key = absl::StrCat(absl::string_view(prefix.data(), prefix.size()), suffix);
        const char* value = std::getenv(key.c_str());
        if (value != nullptr) {
            return std::string(value);
        }
        return std::nullopt;
    };

    if (auto val = get_env("ALPHA")) {
        double alpha = 0.0;
        if (!absl::SimpleAtod(*val, &alpha)) {
            return InvalidConfigurationError(
                absl::StrCat(absl::string_view(prefix.data(), prefix.size()), "ALPHA is not a number: '", *val, "'"));
        }
        config.Set("monitor.alpha", alpha);
    }
    if (auto val = get_env("NUM_WORKERS")) {
        int64_t workers = 0;
        if (!absl::SimpleAtoi(*val, &workers)) {
            return InvalidConfigurationError(
                absl::StrCat(absl::string_view(prefix.data(), prefix.size()), "NUM_WORKERS is not an integer: '", *val, "'"));
        }
        config.Set("monitor.num_workers", workers);
    }
    if (auto val = get_env("CATEGORICAL_TEST")) {
        config.Set("monitor.categorical_test", *val);
    }
    if (auto val = get_env("LOG_LEVEL")) {
        config.Set("logging.level", *val);
    }

    return config;
}

void Config::Merge(const Config& other) {
    if (!other.root_.IsMap()) {
        return;
    }
    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    // Deep merge YAML nodes
    std::function<void(YAML::Node, const YAML::Node&)> merge_nodes;
    merge_nodes = [&merge_nodes](YAML::Node base, const YAML::Node& overlay) {
        for (const auto& kv : overlay) {
            const std::string key = kv.first.as<std::string>();
            YAML::Node base_child = base[key];
            if (base_child.IsMap() && kv.second.IsMap()) {
                merge_nodes(base_child, kv.second);
            } else {
                base[key] = YAML::Clone(kv.second);
            }
        }
    };

    merge_nodes(root_, other.root_);
}

std::optional<YAML::Node> Config::GetNestedNode(std::string_view key) const {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');
    YAML::Node current;
    current.reset(root_);

    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return std::nullopt;
        }
        const YAML::Node child = std::as_const(current)[part];
        if (!child.IsDefined()) {
            return std::nullopt;
        }
        current.reset(child);
    }

    if (current.IsNull()) {
        return std::nullopt;
    }

    return current;
}

std::string Config::GetString(std::string_view key, std::string_view default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        return node->Scalar();
    }
    return std::string(default_value);
}

int64_t Config::GetInt(std::string_view key, int64_t default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<int64_t>();
        } catch (const YAML::Exception& e) {
            DRIFTWATCH_LOG_WARN("Config key '{}' is not an integer: {}", key, e.what());
        }
    }
    return default_value;
}

double Config::GetDouble(std::string_view key, double default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<double>();
        } catch (const YAML::Exception& e) {
            DRIFTWATCH_LOG_WARN("Config key '{}' is not a number: {}", key, e.what());
        }
    }
    return default_value;
}

bool Config::GetBool(std::string_view key, bool default_value) const {
    auto node = GetNestedNode(key);
    if (node && node->IsScalar()) {
        try {
            return node->as<bool>();
        } catch (const YAML::Exception& e) {
            DRIFTWATCH_LOG_WARN("Config key '{}' is not a boolean: {}", key, e.what());
        }
    }
    return default_value;
}

std::vector<std::string> Config::GetStringList(std::string_view key) const {
    std::vector<std::string> result;
    auto node = GetNestedNode(key);
    if (node && node->IsSequence()) {
        for (const auto& item : *node) {
            if (item.IsScalar()) {
                result.push_back(item.Scalar());
            }
        }
    }
    return result;
}

bool Config::HasKey(std::string_view key) const {
    return GetNestedNode(key).has_value();
}

void Config::Set(std::string_view key, ConfigValue value) {
    std::vector<std::string> parts = absl::StrSplit(absl::string_view(key.data(), key.size()), '.');

    if (!root_.IsMap()) {
        root_ = YAML::Node(YAML::NodeType::Map);
    }

    YAML::Node current;
    current.reset(root_);
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        YAML::Node child = current[parts[i]];
        if (!child.IsMap()) {
            child = YAML::Node(YAML::NodeType::Map);
        }
        current.reset(child);
    }

    std::visit([&](auto&& val) {
        using T = std::decay_t<decltype(val)>;
        if constexpr (std::is_same_v<T, std::vector<std::string>>) {
            YAML::Node seq(YAML::NodeType::Sequence);
            for (const auto& item : val) {
                seq.push_back(item);
            }
            current[parts.back()] = seq;
        } else {
            current[parts.back()] = val;
        }
    }, value);
}

nlohmann::json Config::ToJson() const {
    return NodeToJson(root_);
}

absl::StatusOr<Config> LoadConfig(
    const std::optional<std::filesystem::path>& config_path,
    std::string_view env_prefix
) {
    Config config;

    if (config_path.has_value()) {
        auto file_config = Config::LoadFromFile(*config_path);
        if (!file_config.ok()) {
            return file_config.status();
        }
        config.Merge(*file_config);
    }

    // Environment variables take precedence over the file
    auto env_config = Config::LoadFromEnvironment(env_prefix);
    if (!env_config.ok()) {
        return env_config.status();
    }
    config.Merge(*env_config);

    return config;
}

}  // namespace driftwatch
