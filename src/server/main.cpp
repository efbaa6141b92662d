/**
 * @file main.cpp
 * @brief tandem_server: the playback synchronization coordinator
 *
 * One io_context drives the HTTP control API, the WebSocket peer endpoint
 * and the session timers. SIGINT/SIGTERM stop it; the metrics collected
 * over the run are printed on the way out.
 *
 * Usage:
 *   tandem_server [-c config.json] [-p http_port] [-w ws_port] [-l level]
 */

#include "tandem/core/clock.hpp"
#include "tandem/core/config.hpp"
#include "tandem/events/components.hpp"
#include "tandem/events/event_bus.hpp"
#include "tandem/events/events.hpp"
#include "tandem/gateway/control_api.hpp"
#include "tandem/gateway/gateway.hpp"
#include "tandem/network/http_router.hpp"
#include "tandem/network/http_server_asio.hpp"
#include "tandem/network/websocket_server.hpp"
#include "tandem/sync/asio_scheduler.hpp"
#include "tandem/sync/session_manager.hpp"

#include <boost/asio.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <thread>
#include <vector>

using namespace tandem;

int main(int argc, char* argv[]) {
    auto loaded = apply_cli_overrides(Config{}, argc, argv);
    if (loaded.is_error()) {
        spdlog::error("{}", loaded.error().message);
        return 2;
    }
    const Config config = loaded.value();

    auto valid = validate(config);
    if (valid.is_error()) {
        spdlog::error("Invalid configuration: {}", valid.error().message);
        return 2;
    }
    configure_logging(config.logging);
    if (!config.source.empty()) {
        spdlog::info("Loaded configuration from {}", config.source.string());
    }

    // ════════════════════════════════════════════════════════════
    // Event-driven components
    // ════════════════════════════════════════════════════════════

    events::EventBus bus;
    events::LoggerComponent logger(bus);
    events::MetricsComponent metrics(bus);

    try {
        boost::asio::io_context io_context;
        SteadyClock clock;

        network::WebSocketServer ws_server(io_context, config.server.bind_address, config.server.ws_port);
        gateway::WebSocketSink sink(ws_server);
        gateway::Gateway peer_gateway(sink, clock, bus);

        sync::AsioScheduler scheduler(io_context);
        sync::SessionManager manager(config.session, config.sync, clock, scheduler, peer_gateway, bus);
        peer_gateway.attach(manager);

        ws_server.set_on_connect([&peer_gateway](const std::string& id) { peer_gateway.on_connect(id); });
        ws_server.set_on_disconnect([&peer_gateway](const std::string& id) { peer_gateway.on_disconnect(id); });
        ws_server.set_on_message([&peer_gateway](const std::string& id, const std::string& frame) {
            peer_gateway.on_message(id, frame);
        });

        // ════════════════════════════════════════════════════════════
        // Control API
        // ════════════════════════════════════════════════════════════

        network::HttpRouter router;
        router.use([](const network::HttpContext& ctx, network::HttpResponse&) {
            spdlog::debug("{} {}", network::HttpMethodUtils::to_string(ctx.request.method), ctx.request.url);
            return true;
        });

        gateway::ControlApi control(manager);
        control.install(router);

        spdlog::info("Registered routes:");
        for (const auto& route : router.list_routes()) {
            spdlog::info("  {}", route);
        }

        network::HttpServerAsio http_server(io_context, config.server.bind_address, config.server.http_port);
        http_server.set_handler([&router](const network::HttpRequest& request) {
            return router.handle_request(request);
        });
        ws_server.start();

        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([&](const boost::system::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            bus.emit(events::ServerShuttingDownEvent{signal_number == SIGINT ? "SIGINT" : "SIGTERM"});
            http_server.stop();
            ws_server.stop();
            manager.shutdown();
            scheduler.cancel_all();
            io_context.stop();
        });

        bus.emit(events::ServerStartedEvent{http_server.get_port(), ws_server.port()});

        std::vector<std::thread> workers;
        for (std::size_t i = 1; i < config.server.io_threads; ++i) {
            workers.emplace_back([&io_context] { io_context.run(); });
        }
        io_context.run();
        for (auto& worker : workers) {
            worker.join();
        }
    } catch (const std::exception& e) {
        spdlog::error("Coordinator failed: {}", e.what());
        return 1;
    }

    metrics.print_stats();
    spdlog::info("Coordinator shut down cleanly");
    return 0;
}
