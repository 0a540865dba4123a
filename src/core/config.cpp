#include "ctxpack/core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <fstream>
#include <regex>

namespace ctxpack::core {

namespace {

fs::path expand_path_fs(const fs::path& path) {
    return fs::path(expand_path(path.string()));
}

void apply_env_overrides(Config& config) {
    if (const char* value = std::getenv("CTXPACK_THREADS_PATH")) {
        config.store.threads_path = value;
    }
    if (const char* value = std::getenv("CTXPACK_ENCODING_PATH")) {
        config.tokenizer.encoding_path = value;
    }
    if (const char* value = std::getenv("CTXPACK_LOG_LEVEL")) {
        config.observability.log_level = value;
    }
}

}  // namespace

std::string expand_path(const std::string& path) {
    std::string result = path;

    if (!result.empty() && result[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            result = std::string(home) + result.substr(1);
        }
    }

    // ${VAR}
    std::regex env_regex(R"(\$\{([^}]+)\})");
    std::smatch match;
    while (std::regex_search(result, match, env_regex)) {
        const char* var_value = std::getenv(match[1].str().c_str());
        result = match.prefix().str() + (var_value ? var_value : "") + match.suffix().str();
    }

    // $VAR
    std::regex bare_regex(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
    while (std::regex_search(result, match, bare_regex)) {
        const char* var_value = std::getenv(match[1].str().c_str());
        result = match.prefix().str() + (var_value ? var_value : "") + match.suffix().str();
    }

    return result;
}

fs::path Config::default_path() {
    return fs::path(expand_path(std::string("~/.ctxpack/config.yaml")));
}

void Config::expand_paths() {
    tokenizer.encoding_path = expand_path_fs(tokenizer.encoding_path);
    store.threads_path = expand_path_fs(store.threads_path);
    if (!observability.log_path.empty()) {
        observability.log_path = expand_path_fs(observability.log_path);
    }
}

Result<void, Error> Config::validate() const {
    if (budget.safety_margin_percent < 0 || budget.safety_margin_percent >= 100) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "budget.safety_margin_percent must be in [0, 100)"
        );
    }

    if (budget.per_message_overhead < 0 || budget.batch_boundary_overhead < 0 ||
        budget.tool_use_overhead < 0 || budget.tool_result_overhead < 0 ||
        budget.image_tokens < 0 || budget.per_tool_overhead < 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "budget overheads must not be negative"
        );
    }

    if (store.backend != "disk" && store.backend != "memory") {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "store.backend must be 'disk' or 'memory'",
            store.backend
        );
    }

    if (store.lock_timeout_ms <= 0) {
        return Result<void, Error>::err(
            ErrorCode::ConfigValidationFailed,
            "store.lock_timeout_ms must be positive"
        );
    }

    for (const auto& model : models) {
        if (model.name.empty()) {
            return Result<void, Error>::err(
                ErrorCode::ConfigValidationFailed,
                "models entries require a name"
            );
        }
        if (model.max_context_tokens <= 0 || model.default_max_output_tokens < 0) {
            return Result<void, Error>::err(
                ErrorCode::ConfigValidationFailed,
                "model token limits must be positive",
                model.name
            );
        }
    }

    return Result<void, Error>::ok();
}

Result<Config, Error> Config::load(const fs::path& path) {
    fs::path expanded = expand_path_fs(path);

    if (!fs::exists(expanded)) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigNotFound,
            "Configuration file not found",
            expanded.string()
        );
    }

    try {
        YAML::Node root = YAML::LoadFile(expanded.string());
        Config config;

        if (auto budget_node = root["budget"]) {
            auto& b = config.budget;
            b.safety_margin_percent = budget_node["safety_margin_percent"].as<int>(b.safety_margin_percent);
            b.per_message_overhead = budget_node["per_message_overhead"].as<int>(b.per_message_overhead);
            b.batch_boundary_overhead = budget_node["batch_boundary_overhead"].as<int>(b.batch_boundary_overhead);
            b.tool_use_overhead = budget_node["tool_use_overhead"].as<int>(b.tool_use_overhead);
            b.tool_result_overhead = budget_node["tool_result_overhead"].as<int>(b.tool_result_overhead);
            b.image_tokens = budget_node["image_tokens"].as<int>(b.image_tokens);
            b.per_tool_overhead = budget_node["per_tool_overhead"].as<int>(b.per_tool_overhead);
        }

        if (auto tok_node = root["tokenizer"]) {
            config.tokenizer.encoding_path =
                tok_node["encoding_path"].as<std::string>(config.tokenizer.encoding_path.string());
        }

        if (auto store_node = root["store"]) {
            config.store.backend = store_node["backend"].as<std::string>(config.store.backend);
            config.store.threads_path =
                store_node["threads_path"].as<std::string>(config.store.threads_path.string());
            config.store.lock_timeout_ms = store_node["lock_timeout_ms"].as<int>(config.store.lock_timeout_ms);
        }

        if (auto models_node = root["models"]) {
            for (const auto& item : models_node) {
                ModelEntryConfig entry;
                entry.name = item["name"].as<std::string>("");
                entry.max_context_tokens = item["max_context_tokens"].as<int>(entry.max_context_tokens);
                entry.default_max_output_tokens =
                    item["default_max_output_tokens"].as<int>(entry.default_max_output_tokens);
                entry.tokenizer = item["tokenizer"].as<std::string>(entry.tokenizer);
                entry.provider = item["provider"].as<std::string>(entry.provider);
                entry.supports_tools = item["supports_tools"].as<bool>(entry.supports_tools);
                entry.supports_thinking = item["supports_thinking"].as<bool>(entry.supports_thinking);
                config.models.push_back(std::move(entry));
            }
        }

        if (auto obs_node = root["observability"]) {
            config.observability.log_level =
                obs_node["log_level"].as<std::string>(config.observability.log_level);
            config.observability.log_path =
                obs_node["log_path"].as<std::string>(config.observability.log_path.string());
        }

        apply_env_overrides(config);
        config.expand_paths();

        auto validation = config.validate();
        if (validation.is_err()) {
            return Result<Config, Error>::err(std::move(validation).error());
        }

        return Result<Config, Error>::ok(std::move(config));

    } catch (const YAML::Exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            std::string("YAML parse error: ") + e.what(),
            expanded.string()
        );
    } catch (const std::exception& e) {
        return Result<Config, Error>::err(
            ErrorCode::ConfigParseFailed,
            e.what(),
            expanded.string()
        );
    }
}

Config Config::load_or_default(const fs::path& path) {
    auto result = load(path);
    if (result.is_ok()) {
        return std::move(result).value();
    }

    Config config;
    apply_env_overrides(config);
    config.expand_paths();
    return config;
}

Result<void, Error> Config::save(const fs::path& path) const {
    try {
        fs::path expanded = expand_path_fs(path);

        if (expanded.has_parent_path()) {
            fs::create_directories(expanded.parent_path());
        }

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "budget" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "safety_margin_percent" << YAML::Value << budget.safety_margin_percent;
        out << YAML::Key << "per_message_overhead" << YAML::Value << budget.per_message_overhead;
        out << YAML::Key << "batch_boundary_overhead" << YAML::Value << budget.batch_boundary_overhead;
        out << YAML::Key << "tool_use_overhead" << YAML::Value << budget.tool_use_overhead;
        out << YAML::Key << "tool_result_overhead" << YAML::Value << budget.tool_result_overhead;
        out << YAML::Key << "image_tokens" << YAML::Value << budget.image_tokens;
        out << YAML::Key << "per_tool_overhead" << YAML::Value << budget.per_tool_overhead;
        out << YAML::EndMap;

        out << YAML::Key << "tokenizer" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "encoding_path" << YAML::Value << tokenizer.encoding_path.string();
        out << YAML::EndMap;

        out << YAML::Key << "store" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "backend" << YAML::Value << store.backend;
        out << YAML::Key << "threads_path" << YAML::Value << store.threads_path.string();
        out << YAML::Key << "lock_timeout_ms" << YAML::Value << store.lock_timeout_ms;
        out << YAML::EndMap;

        if (!models.empty()) {
            out << YAML::Key << "models" << YAML::Value << YAML::BeginSeq;
            for (const auto& m : models) {
                out << YAML::BeginMap;
                out << YAML::Key << "name" << YAML::Value << m.name;
                out << YAML::Key << "max_context_tokens" << YAML::Value << m.max_context_tokens;
                out << YAML::Key << "default_max_output_tokens" << YAML::Value << m.default_max_output_tokens;
                out << YAML::Key << "tokenizer" << YAML::Value << m.tokenizer;
                out << YAML::Key << "provider" << YAML::Value << m.provider;
                out << YAML::Key << "supports_tools" << YAML::Value << m.supports_tools;
                out << YAML::Key << "supports_thinking" << YAML::Value << m.supports_thinking;
                out << YAML::EndMap;
            }
            out << YAML::EndSeq;
        }

        out << YAML::Key << "observability" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "log_level" << YAML::Value << observability.log_level;
        out << YAML::Key << "log_path" << YAML::Value << observability.log_path.string();
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream file(expanded);
        if (!file) {
            return Result<void, Error>::err(
                ErrorCode::FileWriteFailed,
                "Failed to open config file for writing",
                expanded.string()
            );
        }

        file << out.c_str();
        return Result<void, Error>::ok();

    } catch (const std::exception& e) {
        return Result<void, Error>::err(
            ErrorCode::FileWriteFailed,
            e.what(),
            path.string()
        );
    }
}

}  // namespace ctxpack::core
