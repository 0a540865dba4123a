#include "ctxpack/context/context_manager.hpp"
#include "ctxpack/core/config.hpp"
#include "ctxpack/core/logging.hpp"
#include "ctxpack/llm/model_catalog.hpp"
#include "ctxpack/llm/tokenizer.hpp"
#include "ctxpack/memory/repair.hpp"
#include "ctxpack/memory/thread_store.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ctxpack {
namespace {

using namespace ctxpack::core;

constexpr const char* kUsage =
    "Usage: ctxpack [--config PATH] <command> [args]\n"
    "\n"
    "Commands:\n"
    "  list                          List stored threads, newest first\n"
    "  show <id>                     Print a thread as JSON\n"
    "  repair <id>                   Remove orphaned tool results and save\n"
    "  budget <id> [options]         Pack a thread and print diagnostics\n"
    "      --system FILE             Full system prompt\n"
    "      --short-system FILE       Fallback system prompt\n"
    "      --max-output N            Reserved output tokens\n"
    "      --model NAME              Override the thread model\n"
    "  models                        List known models by provider\n";

struct CliOptions {
    fs::path config_path = Config::default_path();
    std::string command;
    std::vector<std::string> args;
    std::optional<fs::path> system_file;
    std::optional<fs::path> short_system_file;
    std::optional<int> max_output;
    std::optional<std::string> model;
};

// Shared services built from configuration
struct Services {
    Config config;
    std::shared_ptr<llm::ModelCatalog> catalog;
    std::shared_ptr<const llm::TokenCounter> counter;
    std::unique_ptr<memory::ThreadStore> store;
};

Result<CliOptions, Error> parse_args(int argc, char** argv) {
    using R = Result<CliOptions, Error>;
    CliOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&]() -> std::optional<std::string> {
            if (i + 1 < argc) {
                return std::string(argv[++i]);
            }
            return std::nullopt;
        };

        if (arg == "--config" || arg == "--system" || arg == "--short-system" ||
            arg == "--max-output" || arg == "--model") {
            auto value = next();
            if (!value) {
                return R::err(ErrorCode::InvalidArgument, "Missing value for " + arg);
            }
            if (arg == "--config") {
                options.config_path = *value;
            } else if (arg == "--system") {
                options.system_file = *value;
            } else if (arg == "--short-system") {
                options.short_system_file = *value;
            } else if (arg == "--model") {
                options.model = *value;
            } else {
                try {
                    options.max_output = std::stoi(*value);
                } catch (const std::exception&) {
                    return R::err(ErrorCode::InvalidArgument, "Invalid --max-output value", *value);
                }
            }
        } else if (arg == "-h" || arg == "--help") {
            options.command = "help";
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.args.push_back(arg);
        }
    }

    return R::ok(std::move(options));
}

Result<std::string, Error> read_text_file(const fs::path& path) {
    std::ifstream file(expand_path(path.string()));
    if (!file) {
        return Result<std::string, Error>::err(ErrorCode::FileReadFailed, "Failed to read file", path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return Result<std::string, Error>::ok(buffer.str());
}

Result<Services, Error> make_services(const fs::path& config_path) {
    using R = Result<Services, Error>;
    Services services;

    const fs::path expanded = expand_path(config_path.string());
    if (fs::exists(expanded)) {
        auto loaded = Config::load(expanded);
        if (loaded.is_err()) {
            return std::move(loaded).error();
        }
        services.config = std::move(loaded).value();
    } else {
        services.config = Config::load_or_default(expanded);
    }

    auto logging = init_logging(services.config.observability);
    if (logging.is_err()) {
        std::cerr << "warning: " << logging.error().full_message() << "\n";
    }

    services.catalog = std::make_shared<llm::ModelCatalog>();
    services.catalog->register_models(services.config.models);

    std::shared_ptr<const llm::BpeEncoding> encoding;
    auto loaded_encoding = llm::BpeEncoding::load(services.config.tokenizer.encoding_path);
    if (loaded_encoding.is_ok()) {
        encoding = std::move(loaded_encoding).value();
    } else {
        spdlog::warn("Token counts use the character heuristic: {}", loaded_encoding.error().full_message());
    }

    services.counter = std::make_shared<llm::DefaultTokenCounter>(
        services.catalog, services.config.budget, std::move(encoding));

    auto store = memory::make_thread_store(services.config.store);
    if (store.is_err()) {
        return std::move(store).error();
    }
    services.store = std::move(store).value();

    return R::ok(std::move(services));
}

std::string format_time(TimePoint tp) {
    const std::time_t t = Clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%d %H:%M");
    return ss.str();
}

int report(const Error& error) {
    std::cerr << "error: " << error.full_message() << "\n";
    return 1;
}

int cmd_list(Services& services) {
    auto summaries = services.store->list_summary();
    if (summaries.is_err()) {
        return report(summaries.error());
    }

    for (const auto& s : summaries.value()) {
        std::cout << std::left << std::setw(40) << s.id << "  "
                  << format_time(s.updated_at) << "  "
                  << std::setw(4) << s.segment_count << "  "
                  << std::setw(28) << s.model << "  "
                  << s.title << "\n";
    }
    return 0;
}

int cmd_show(Services& services, const std::string& id) {
    auto thread = services.store->get(id);
    if (thread.is_err()) {
        return report(thread.error());
    }
    std::cout << thread.value().to_json().dump(2) << "\n";
    return 0;
}

int cmd_repair(Services& services, const std::string& id) {
    auto thread = services.store->get(id);
    if (thread.is_err()) {
        return report(thread.error());
    }

    const size_t removed = memory::repair_orphaned_tool_results(thread.value());
    if (removed > 0) {
        auto saved = services.store->save(thread.value());
        if (saved.is_err()) {
            return report(saved.error());
        }
    }

    std::cout << "Removed " << removed << " orphaned tool results from " << id << "\n";
    return 0;
}

int cmd_budget(Services& services, const CliOptions& options, const std::string& id) {
    auto thread = services.store->get(id);
    if (thread.is_err()) {
        return report(thread.error());
    }

    context::BuildContextParams params;
    params.model = options.model.value_or(thread.value().model());
    params.segments = thread.value().segments();
    params.max_output_tokens = options.max_output;

    if (options.system_file) {
        auto text = read_text_file(*options.system_file);
        if (text.is_err()) {
            return report(text.error());
        }
        params.system_prompt = std::move(text).value();
    }
    if (options.short_system_file) {
        auto text = read_text_file(*options.short_system_file);
        if (text.is_err()) {
            return report(text.error());
        }
        params.short_system_prompt = std::move(text).value();
    }

    // Stored counts were computed for the thread's own model
    if (options.model && *options.model != thread.value().model()) {
        for (auto& seg : params.segments) {
            seg.token_count.reset();
        }
    }

    context::ContextManager manager(services.catalog, services.counter,
                                    services.config.budget.safety_margin_percent);
    const auto built = manager.build_request(params);

    Json out = {
        {"thread", id},
        {"model", params.model},
        {"budget", built.budget},
        {"total_tokens", built.total_tokens},
        {"truncated", built.truncated},
        {"used_short_system_prompt", built.used_short_system_prompt},
        {"segments_included", built.segments_included},
        {"segments_dropped", built.segments_dropped},
        {"messages", built.request.messages.size()}
    };
    std::cout << out.dump(2) << "\n";
    return 0;
}

int cmd_models(const Services& services) {
    for (const auto& provider : services.catalog->providers()) {
        std::cout << provider << "\n";
        for (const auto& name : services.catalog->models_for_provider(provider)) {
            const auto info = services.catalog->info_for(name);
            std::cout << "  " << std::left << std::setw(36) << name
                      << std::right << std::setw(9) << info.max_context_tokens
                      << std::setw(8) << info.default_max_output_tokens << "  "
                      << llm::tokenizer_kind_to_string(info.tokenizer) << "\n";
        }
    }
    return 0;
}

int run(const CliOptions& options) {
    if (options.command.empty() || options.command == "help") {
        std::cout << kUsage;
        return options.command.empty() ? 1 : 0;
    }

    auto services = make_services(options.config_path);
    if (services.is_err()) {
        return report(services.error());
    }
    auto& s = services.value();

    const auto needs_id = [&]() { return options.args.empty(); };

    if (options.command == "list") {
        return cmd_list(s);
    }
    if (options.command == "models") {
        return cmd_models(s);
    }
    if (options.command == "show" || options.command == "repair" || options.command == "budget") {
        if (needs_id()) {
            std::cerr << "error: " << options.command << " requires a thread id\n";
            return 1;
        }
        const std::string& id = options.args.front();
        if (options.command == "show") return cmd_show(s, id);
        if (options.command == "repair") return cmd_repair(s, id);
        return cmd_budget(s, options, id);
    }

    std::cerr << "error: unknown command '" << options.command << "'\n" << kUsage;
    return 1;
}

}  // namespace
}  // namespace ctxpack

int main(int argc, char** argv) {
    auto options = ctxpack::parse_args(argc, argv);
    if (options.is_err()) {
        std::cerr << "error: " << options.error().full_message() << "\n";
        return 1;
    }

    try {
        return ctxpack::run(options.value());
    } catch (const std::exception& e) {
        std::cerr << "fatal: " << e.what() << "\n";
        return 1;
    }
}
