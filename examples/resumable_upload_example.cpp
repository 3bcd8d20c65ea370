/**
 * @file resumable_upload_example.cpp
 * @brief Mirrors a local tree into a destination directory, resumably
 *
 * Every file under <root> that is new or changed since the last run is
 * copied into <destination>. Interrupt with Ctrl+C and run again: files
 * already published are skipped.
 *
 * Run with:
 *   ./build/resumable_upload_example ./data /mnt/backup/data
 *   ./build/resumable_upload_example ./data /mnt/backup/data config.json
 *
 * config.json (all keys optional):
 *   {"max_concurrent_uploads": 8, "log_level": "debug", "state_dir": "/tmp/bulkup"}
 */

#include "bulkup/core/config.hpp"
#include "bulkup/events/components.hpp"
#include "bulkup/events/event_bus.hpp"
#include "bulkup/transfer/service.hpp"
#include "bulkup/transport/directory_transport.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <filesystem>
#include <thread>

namespace asio = boost::asio;
namespace fs = std::filesystem;

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    if (argc < 3) {
        spdlog::error("Usage: {} <root> <destination> [config.json]", argv[0]);
        return 2;
    }

    const fs::path root = argv[1];
    const fs::path destination = argv[2];

    bulkup::TransferConfig config;
    if (argc > 3) {
        auto loaded = bulkup::load_config(argv[3]);
        if (loaded.is_error()) {
            spdlog::error("{}: {}", bulkup::to_string(loaded.error().code), loaded.error().message);
            return 2;
        }
        config = loaded.value();
    }
    spdlog::set_level(spdlog::level::from_str(config.log_level));

    bulkup::events::EventBus bus;
    bulkup::events::LoggerComponent logger(bus);
    bulkup::events::MetricsComponent metrics(bus);

    bulkup::transport::DirectoryTransport transport(destination,
                                                    config.resolved_state_dir() / "staging",
                                                    bulkup::transport::DirectoryTransport::kDefaultChunkSize,
                                                    config.digest);
    bulkup::transfer::ResumableUploadService service(config, transport, &bus);

    // Ctrl+C stops after in-flight uploads finish
    asio::io_context signals_context;
    asio::signal_set signals(signals_context, SIGINT, SIGTERM);
    signals.async_wait([&service](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        spdlog::info("Received signal {}, finishing in-flight uploads...", signal_number);
        service.request_stop();
    });
    std::thread signal_thread([&signals_context]() { signals_context.run(); });

    auto result = service.run(root);

    signals_context.stop();
    signal_thread.join();

    if (result.is_error()) {
        spdlog::error("{}: {}", bulkup::to_string(result.error().code), result.error().message);
        return 1;
    }

    metrics.print_stats();

    const auto& report = result.value();
    for (const auto& failure : report.failed) {
        spdlog::warn("Failed: {} ({})", failure.candidate->resolved_path(), failure.reason.value_or("unknown"));
    }
    return report.all_succeeded() ? 0 : 1;
}
