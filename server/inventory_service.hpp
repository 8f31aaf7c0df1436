#pragma once

#include <grpcpp/grpcpp.h>
#include "floorstock/api.grpc.pb.h"
#include "floorstock/inventory.hpp"

namespace floorstock {
namespace server {

/**
 * gRPC surface of the inventory core. Each RPC forwards to Inventory and
 * turns an InventoryError into the status its code maps to.
 */
class InventoryServiceImpl final : public api::InventoryService::Service {
public:
    explicit InventoryServiceImpl(Inventory& inventory) : inventory_(inventory) {}

    grpc::Status CreateItem(grpc::ServerContext* context, const api::CreateItemRequest* request,
                            events::Item* response) override;
    grpc::Status UpdateItem(grpc::ServerContext* context, const api::UpdateItemRequest* request,
                            events::Item* response) override;
    grpc::Status DeactivateItem(grpc::ServerContext* context, const api::DeactivateItemRequest* request,
                                google::protobuf::Empty* response) override;
    grpc::Status ListItems(grpc::ServerContext* context, const api::ListItemsRequest* request,
                           api::ListItemsResponse* response) override;
    grpc::Status RegisterLocation(grpc::ServerContext* context, const api::RegisterLocationRequest* request,
                                  events::Location* response) override;
    grpc::Status SeedLocations(grpc::ServerContext* context, const google::protobuf::Empty* request,
                               api::SeedLocationsResponse* response) override;
    grpc::Status ListLocations(grpc::ServerContext* context, const api::ListLocationsRequest* request,
                               api::ListLocationsResponse* response) override;
    grpc::Status RegisterSerial(grpc::ServerContext* context, const api::RegisterSerialRequest* request,
                                api::SerialUnit* response) override;

    grpc::Status Receive(grpc::ServerContext* context, const api::ReceiveRequest* request,
                         events::Transaction* response) override;
    grpc::Status Transfer(grpc::ServerContext* context, const api::TransferRequest* request,
                          events::Transaction* response) override;
    grpc::Status Adjust(grpc::ServerContext* context, const api::AdjustRequest* request,
                        events::Transaction* response) override;
    grpc::Status ReturnStock(grpc::ServerContext* context, const api::MovementRequest* request,
                             events::Transaction* response) override;
    grpc::Status Scrap(grpc::ServerContext* context, const api::MovementRequest* request,
                       events::Transaction* response) override;

    grpc::Status ImportItems(grpc::ServerContext* context, const api::ImportItemsRequest* request,
                             api::ImportResponse* response) override;
    grpc::Status ImportStock(grpc::ServerContext* context, const api::ImportStockRequest* request,
                             api::ImportResponse* response) override;

    grpc::Status CreateBom(grpc::ServerContext* context, const api::CreateBomRequest* request,
                           events::BillOfMaterials* response) override;
    grpc::Status ListBoms(grpc::ServerContext* context, const api::ListBomsRequest* request,
                          api::ListBomsResponse* response) override;
    grpc::Status UpsertOrder(grpc::ServerContext* context, const api::UpsertOrderRequest* request,
                             google::protobuf::Empty* response) override;

    grpc::Status GeneratePickList(grpc::ServerContext* context, const api::GeneratePickListRequest* request,
                                  events::PickList* response) override;
    grpc::Status ScanPick(grpc::ServerContext* context, const api::ScanPickRequest* request,
                          events::PickListItem* response) override;
    grpc::Status SkipPickItem(grpc::ServerContext* context, const api::SkipPickItemRequest* request,
                              events::PickListItem* response) override;
    grpc::Status CompletePickList(grpc::ServerContext* context, const api::PickListActionRequest* request,
                                  events::PickList* response) override;
    grpc::Status CancelPickList(grpc::ServerContext* context, const api::PickListActionRequest* request,
                                events::PickList* response) override;
    grpc::Status GetPickList(grpc::ServerContext* context, const api::GetPickListRequest* request,
                             events::PickList* response) override;

    grpc::Status CurrentStock(grpc::ServerContext* context, const api::CurrentStockRequest* request,
                              api::CurrentStockResponse* response) override;
    grpc::Status ListTransactions(grpc::ServerContext* context, const api::ListTransactionsRequest* request,
                                  api::ListTransactionsResponse* response) override;
    grpc::Status LookupBarcode(grpc::ServerContext* context, const api::LookupBarcodeRequest* request,
                               api::LookupBarcodeResponse* response) override;
    grpc::Status Valuation(grpc::ServerContext* context, const google::protobuf::Empty* request,
                           api::ValuationResponse* response) override;

    grpc::Status ListAlerts(grpc::ServerContext* context, const api::ListAlertsRequest* request,
                            api::ListAlertsResponse* response) override;
    grpc::Status AcknowledgeAlert(grpc::ServerContext* context, const api::AcknowledgeAlertRequest* request,
                                  events::Alert* response) override;

private:
    Inventory& inventory_;
};

} // namespace server
} // namespace floorstock
