#include "msgtrace/core/config/configuration.hpp"
#include "msgtrace/core/errors.hpp"
#include "msgtrace/core/logging/logger.hpp"
#include "msgtrace/core/tracing/correlation.hpp"
#include "msgtrace/core/tracing_core.hpp"
#include "msgtrace/providers/correlation_id_provider.hpp"
#include "msgtrace/providers/metadata_provider.hpp"

#include <any>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

using msgtrace::core::tracing::ExecutionContext;
using msgtrace::core::tracing::HandlerResult;
using msgtrace::core::tracing::Message;
using msgtrace::core::tracing::MessageKind;

class OrderNotFound : public std::runtime_error {
public:
    explicit OrderNotFound(const std::string& id) : std::runtime_error("order \"" + id + "\" not found") {}
};

/**
 * @brief Synchronous in-process bus with one handler per message name.
 * Events fan out to every subscriber.
 */
class InProcessBus {
public:
    using HandlerFn = std::function<HandlerResult(const Message&, ExecutionContext&)>;

    InProcessBus(msgtrace::core::TracingCore& core, msgtrace::core::logging::LoggerPtr logger)
        : core_(core), logger_(std::move(logger)) {}

    void handle(const std::string& name, std::string handler_id, HandlerFn handler) {
        handlers_[name] = {std::move(handler_id), std::move(handler)};
    }

    void subscribe(const std::string& name, std::string handler_id, HandlerFn handler) {
        subscribers_[name].push_back({std::move(handler_id), std::move(handler)});
    }

    HandlerResult send(Message message, const ExecutionContext& execution) {
        auto& interceptor = core_.interceptor();
        return interceptor.dispatch(std::move(message), execution, [this](const Message& outgoing) {
            auto it = handlers_.find(outgoing.name);
            if (it == handlers_.end()) {
                throw std::runtime_error("no handler for " + outgoing.name);
            }
            // The receiving side starts from an empty flow; the parent arrives in the metadata.
            ExecutionContext remote;
            return core_.interceptor().wrap_handler(outgoing, remote, it->second.fn, it->second.id);
        });
    }

    void publish(std::vector<Message> events, const ExecutionContext& execution) {
        auto dispatched = core_.interceptor().wrap_dispatch(std::move(events), execution);
        for (auto& entry : dispatched) {
            for (auto& subscriber : subscribers_[entry.message.name]) {
                Message delivery = entry.message;
                delivery.processing = msgtrace::core::tracing::ProcessingInfo{
                    "order-events", "subscribing", std::nullopt, false, subscriber.id};
                ExecutionContext remote;
                try {
                    core_.interceptor().wrap_handler(delivery, remote, subscriber.fn, subscriber.id);
                } catch (const std::exception& e) {
                    logger_->warn("subscriber {} failed on {}: {}", subscriber.id, delivery.identifier, e.what());
                }
            }
        }
    }

private:
    struct Registration {
        std::string id;
        HandlerFn fn;
    };

    msgtrace::core::TracingCore& core_;
    msgtrace::core::logging::LoggerPtr logger_;
    std::map<std::string, Registration> handlers_;
    std::map<std::string, std::vector<Registration>> subscribers_;
};

Message make_message(MessageKind kind, std::string name, std::string id, std::string payload) {
    Message message;
    message.kind = kind;
    message.identifier = std::move(id);
    message.name = name;
    message.payload_type = "shop.orders." + name;
    message.payload = std::move(payload);
    return message;
}

std::filesystem::path parse_config_path(int argc, char** argv, std::filesystem::path default_path) {
    std::filesystem::path path = std::move(default_path);
    if (const char* env = std::getenv("MSGTRACE_CONFIG_PATH")) {
        path = env;
    }
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            path = argv[++i];
        }
    }
    return path;
}

void apply_log_level_flag(int argc, char** argv, msgtrace::core::logging::LogConfig& log_config) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        if ((arg == "--log-level" || arg == "-l") && i + 1 < argc) {
            log_config.level = msgtrace::core::logging::level_from_string(argv[++i]);
            for (auto& sink : log_config.sinks) {
                sink.level = log_config.level;
            }
        }
    }
}

void run_scenario(msgtrace::core::TracingCore& core, const msgtrace::core::logging::LoggerPtr& logger) {
    namespace tracing = msgtrace::core::tracing;

    InProcessBus bus{core, logger};
    tracing::RandomIdGenerator ids;

    bus.handle("CreateOrder", "OrderAggregate::handle", [&bus](const Message& command, ExecutionContext& execution) {
        Message created = make_message(MessageKind::Event, "OrderCreated", command.identifier + "-evt",
                                       "{\"order\":\"" + command.identifier + "\"}");
        created.aggregate = tracing::AggregateInfo{"Order", command.identifier, 0};
        created = tracing::with_correlation_context(created, tracing::extract_correlation_context(command, execution));
        bus.publish({created}, execution);
        return HandlerResult{command.identifier};
    });

    bus.subscribe("OrderCreated", "OrderProjection::on", [](const Message&, ExecutionContext&) {
        return HandlerResult{};
    });
    bus.subscribe("OrderCreated", "ShippingSaga::on", [](const Message&, ExecutionContext&) -> HandlerResult {
        throw std::runtime_error("carrier booking unavailable");
    });

    bus.handle("FindOrder", "OrderQueries::find", [](const Message& query, ExecutionContext&) -> HandlerResult {
        throw OrderNotFound(query.payload);
    });

    ExecutionContext client;
    auto correlation = tracing::generate_correlation_context(client, ids);

    auto create = make_message(MessageKind::Command, "CreateOrder", "order-1001", "{\"sku\":\"A-17\",\"qty\":2}");
    create = tracing::with_correlation_context(create, correlation);
    create.aggregate = tracing::AggregateInfo{"Order", create.identifier, 0};
    create.lifecycle = tracing::AggregateLifecycle{1, true};
    auto order_id = std::any_cast<std::string>(bus.send(create, client));
    logger->info("CreateOrder returned {}", order_id);

    auto find = make_message(MessageKind::Query, "FindOrder", "query-7", "order-404");
    find.response_type = "shop.orders.OrderView";
    try {
        bus.send(find, client);
    } catch (const OrderNotFound& e) {
        logger->info("FindOrder failed as expected: {}", e.what());
    }
}

}  // namespace

int main(int argc, char** argv) {
    namespace core = msgtrace::core;

    const auto config_path = parse_config_path(argc, argv, "config/msgtrace.toml");

    core::config::Configuration config;
    try {
        if (std::filesystem::exists(config_path)) {
            config = core::config::Configuration::load_from_file(config_path);
        }
    } catch (const std::exception& ex) {
        std::cerr << "Failed to load " << config_path << ": " << ex.what() << std::endl;
        return 1;
    }

    auto log_config = core::logging::LogConfig::from_config(config);
    apply_log_level_flag(argc, argv, log_config);

    try {
        core::logging::initialize_logging(log_config);
        auto logger = core::logging::create_logger("msgtrace.demo", log_config);
        if (config.source_path().empty()) {
            logger->warn("no configuration at {}, using defaults", config_path.string());
        }

        core::TracingCoreOptions options;
        options.config = core::config::TracingConfiguration::from_config(config);
        options.exporter = std::make_shared<core::exporting::LogSpanExporter>(
            core::logging::create_logger("msgtrace.spans", log_config));
        options.error_reporter = std::make_shared<core::error::LogErrorReporter>(
            core::logging::create_logger("msgtrace.errors", log_config));
        options.attribute_providers = {
            std::make_shared<msgtrace::providers::MetadataAttributeProvider>(),
            std::make_shared<msgtrace::providers::CorrelationIdAttributeProvider>(),
        };
        options.logger = logger;

        core::TracingCore tracing_core{std::move(options)};
        run_scenario(tracing_core, logger);

        auto exported = tracing_core.flush();
        logger->info("exported {} spans, dropped {}", exported, tracing_core.dropped_spans());
        tracing_core.shutdown();
    } catch (const core::ConfigurationError& ex) {
        std::cerr << "Invalid configuration: " << ex.what() << std::endl;
        core::logging::shutdown_logging();
        return 2;
    } catch (const std::exception& ex) {
        std::cerr << "Demo failed: " << ex.what() << std::endl;
        core::logging::shutdown_logging();
        return 1;
    }

    core::logging::shutdown_logging();
    return 0;
}
