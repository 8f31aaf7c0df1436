#include <filesystem>
#include <memory>
#include <string>
#include <grpcpp/grpcpp.h>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/health_check_service_interface.h>

#include "floorstock/config.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/inventory.hpp"
#include "floorstock/journal.hpp"
#include "floorstock/logging.hpp"
#include "inventory_service.hpp"

int main(int argc, char** argv) {
    try {
        auto config = floorstock::Config::from_env();
        if (argc > 1) {
            config.port = floorstock::parse_port(argv[1]);
        }

        std::filesystem::create_directories(config.data_dir);
        auto journal = std::make_unique<floorstock::FileJournal>(config.journal_path());
        floorstock::Inventory inventory(std::move(journal));
        inventory.recover();
        if (config.seed_locations) {
            int created = inventory.seed_default_locations();
            floorstock::log_info("server", "locations_seeded", {{"created", created}});
        }

        grpc::EnableDefaultHealthCheckService(true);
        grpc::reflection::InitProtoReflectionServerBuilderPlugin();

        floorstock::server::InventoryServiceImpl service(inventory);

        grpc::ServerBuilder builder;
        builder.AddListeningPort(config.listen_address(), grpc::InsecureServerCredentials());
        builder.RegisterService(&service);

        std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
        if (!server) {
            floorstock::log_error("server", "listen_failed", {{"address", config.listen_address()}});
            return 1;
        }

        floorstock::log_info("server", "inventory_server_started", {
            {"address", config.listen_address()},
            {"journal", config.journal_path()}
        });

        server->Wait();
        return 0;
    } catch (const floorstock::InventoryError& e) {
        floorstock::log_error("server", "startup_failed",
                              {{"code", floorstock::error_code_name(e.code())}, {"error", e.what()}});
        return 1;
    } catch (const std::exception& e) {
        floorstock::log_error("server", "startup_failed", {{"error", e.what()}});
        return 1;
    }
}
