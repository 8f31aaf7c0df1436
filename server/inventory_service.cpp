#include "inventory_service.hpp"
#include "floorstock/errors.hpp"
#include "floorstock/logging.hpp"

namespace floorstock {
namespace server {

namespace {

/// Run an RPC body, mapping rejections onto gRPC status codes.
template<typename Body>
grpc::Status guarded(const char* rpc, Body&& body) {
    try {
        body();
        return grpc::Status::OK;
    } catch (const InventoryError& e) {
        if (e.is_defect()) {
            log_error("server", "rpc_failed", {{"rpc", rpc}, {"code", error_code_name(e.code())}, {"error", e.what()}});
        }
        return grpc::Status(e.status_code(), e.what());
    } catch (const std::exception& e) {
        log_error("server", "rpc_failed", {{"rpc", rpc}, {"error", e.what()}});
        return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
    }
}

std::vector<std::string> serials_of(const google::protobuf::RepeatedPtrField<std::string>& serials) {
    return {serials.begin(), serials.end()};
}

void to_proto(const StockRecord& record, api::StockLevel* out) {
    out->set_sku(record.sku);
    out->set_location(record.location);
    out->set_quantity(record.quantity);
    out->set_reserved(record.reserved);
    out->set_available(record.available());
    out->set_version(record.version);
    out->set_last_count_at(record.last_count_at);
}

void to_proto(const SerialUnit& unit, api::SerialUnit* out) {
    out->set_serial_number(unit.serial_number);
    out->set_barcode(unit.barcode);
    out->set_sku(unit.sku);
    out->set_location(unit.location);
    out->set_status(unit.status);
    out->set_order_id(unit.order_id);
    out->set_cost(unit.cost);
    *out->mutable_received_at() = unit.received_at;
}

void to_proto(const ValuationTotals& totals, api::ValuationTotals* out) {
    out->set_quantity(totals.quantity);
    out->set_value(totals.value);
}

void to_proto(const ImportResult& result, api::ImportResponse* out) {
    out->set_success_count(static_cast<uint32_t>(result.success_count));
    out->set_error_count(static_cast<uint32_t>(result.error_count()));
    for (const auto& error : result.errors) {
        auto* row = out->add_errors();
        row->set_row(static_cast<uint32_t>(error.row));
        row->set_field(error.field);
        row->set_message(error.message);
    }
    for (const auto& id : result.created_ids) {
        out->add_created_ids(id);
    }
}

} // anonymous namespace

// ============================================================================
// Catalog and locations
// ============================================================================

grpc::Status InventoryServiceImpl::CreateItem(grpc::ServerContext*, const api::CreateItemRequest* request,
                                              events::Item* response) {
    return guarded("CreateItem", [&] { *response = inventory_.create_item(request->item()); });
}

grpc::Status InventoryServiceImpl::UpdateItem(grpc::ServerContext*, const api::UpdateItemRequest* request,
                                              events::Item* response) {
    return guarded("UpdateItem", [&] {
        ItemUpdate update;
        if (request->has_name()) update.name = request->name();
        if (request->has_description()) update.description = request->description();
        if (request->has_category()) update.category = request->category();
        if (request->has_unit_of_measure()) update.unit_of_measure = request->unit_of_measure();
        if (request->has_track_individually()) update.track_individually = request->track_individually();
        if (request->has_default_location()) update.default_location = request->default_location();
        if (request->has_reorder_point()) update.reorder_point = request->reorder_point();
        if (request->has_reorder_quantity()) update.reorder_quantity = request->reorder_quantity();
        if (request->has_barcode()) update.barcode = request->barcode();
        *response = inventory_.update_item(request->sku(), update);
    });
}

grpc::Status InventoryServiceImpl::DeactivateItem(grpc::ServerContext*, const api::DeactivateItemRequest* request,
                                                  google::protobuf::Empty*) {
    return guarded("DeactivateItem", [&] { inventory_.deactivate_item(request->sku()); });
}

grpc::Status InventoryServiceImpl::ListItems(grpc::ServerContext*, const api::ListItemsRequest* request,
                                             api::ListItemsResponse* response) {
    return guarded("ListItems", [&] {
        for (auto& item : inventory_.list_items(!request->include_inactive())) {
            *response->add_items() = std::move(item);
        }
    });
}

grpc::Status InventoryServiceImpl::RegisterLocation(grpc::ServerContext*, const api::RegisterLocationRequest* request,
                                                    events::Location* response) {
    return guarded("RegisterLocation", [&] { *response = inventory_.register_location(request->location()); });
}

grpc::Status InventoryServiceImpl::SeedLocations(grpc::ServerContext*, const google::protobuf::Empty*,
                                                 api::SeedLocationsResponse* response) {
    return guarded("SeedLocations", [&] { response->set_created(inventory_.seed_default_locations()); });
}

grpc::Status InventoryServiceImpl::ListLocations(grpc::ServerContext*, const api::ListLocationsRequest* request,
                                                 api::ListLocationsResponse* response) {
    return guarded("ListLocations", [&] {
        for (auto& location : inventory_.list_locations(!request->include_inactive())) {
            *response->add_locations() = std::move(location);
        }
    });
}

grpc::Status InventoryServiceImpl::RegisterSerial(grpc::ServerContext*, const api::RegisterSerialRequest* request,
                                                  api::SerialUnit* response) {
    return guarded("RegisterSerial", [&] {
        auto unit = inventory_.register_serial(request->sku(), request->serial_number(), request->location(),
                                               request->cost());
        to_proto(unit, response);
    });
}

// ============================================================================
// Stock movements
// ============================================================================

grpc::Status InventoryServiceImpl::Receive(grpc::ServerContext*, const api::ReceiveRequest* request,
                                           events::Transaction* response) {
    return guarded("Receive", [&] {
        *response = inventory_.receive(request->sku(), request->location(), request->quantity(),
                                       request->unit_cost(), request->reference(),
                                       serials_of(request->serial_numbers()), request->actor());
    });
}

grpc::Status InventoryServiceImpl::Transfer(grpc::ServerContext*, const api::TransferRequest* request,
                                            events::Transaction* response) {
    return guarded("Transfer", [&] {
        *response = inventory_.transfer(request->sku(), request->from_location(), request->to_location(),
                                        request->quantity(), serials_of(request->serial_numbers()),
                                        request->actor());
    });
}

grpc::Status InventoryServiceImpl::Adjust(grpc::ServerContext*, const api::AdjustRequest* request,
                                          events::Transaction* response) {
    return guarded("Adjust", [&] {
        *response = inventory_.adjust(request->sku(), request->location(), request->new_quantity(),
                                      request->reason(), request->actor());
    });
}

grpc::Status InventoryServiceImpl::ReturnStock(grpc::ServerContext*, const api::MovementRequest* request,
                                               events::Transaction* response) {
    return guarded("ReturnStock", [&] {
        *response = inventory_.return_stock(request->sku(), request->location(), request->quantity(),
                                            request->reason(), serials_of(request->serial_numbers()),
                                            request->actor());
    });
}

grpc::Status InventoryServiceImpl::Scrap(grpc::ServerContext*, const api::MovementRequest* request,
                                         events::Transaction* response) {
    return guarded("Scrap", [&] {
        *response = inventory_.scrap(request->sku(), request->location(), request->quantity(), request->reason(),
                                     serials_of(request->serial_numbers()), request->actor());
    });
}

// ============================================================================
// Bulk import
// ============================================================================

grpc::Status InventoryServiceImpl::ImportItems(grpc::ServerContext*, const api::ImportItemsRequest* request,
                                               api::ImportResponse* response) {
    return guarded("ImportItems", [&] {
        std::vector<events::Item> rows(request->items().begin(), request->items().end());
        to_proto(inventory_.import_items(rows), response);
    });
}

grpc::Status InventoryServiceImpl::ImportStock(grpc::ServerContext*, const api::ImportStockRequest* request,
                                               api::ImportResponse* response) {
    return guarded("ImportStock", [&] {
        std::vector<StockImportRow> rows;
        rows.reserve(request->rows_size());
        for (const auto& row : request->rows()) {
            rows.push_back({row.sku(), row.location(), row.quantity()});
        }
        to_proto(inventory_.import_stock(rows, request->actor()), response);
    });
}

// ============================================================================
// Bills of materials and orders
// ============================================================================

grpc::Status InventoryServiceImpl::CreateBom(grpc::ServerContext*, const api::CreateBomRequest* request,
                                             events::BillOfMaterials* response) {
    return guarded("CreateBom", [&] { *response = inventory_.create_bom(request->bom()); });
}

grpc::Status InventoryServiceImpl::ListBoms(grpc::ServerContext*, const api::ListBomsRequest* request,
                                            api::ListBomsResponse* response) {
    return guarded("ListBoms", [&] {
        std::optional<std::string> product_type;
        if (!request->product_type().empty()) product_type = request->product_type();
        for (auto& bom : inventory_.list_boms(product_type)) {
            *response->add_boms() = std::move(bom);
        }
    });
}

grpc::Status InventoryServiceImpl::UpsertOrder(grpc::ServerContext*, const api::UpsertOrderRequest* request,
                                               google::protobuf::Empty*) {
    return guarded("UpsertOrder", [&] { inventory_.upsert_order(request->order()); });
}

// ============================================================================
// Pick lists
// ============================================================================

grpc::Status InventoryServiceImpl::GeneratePickList(grpc::ServerContext*,
                                                    const api::GeneratePickListRequest* request,
                                                    events::PickList* response) {
    return guarded("GeneratePickList", [&] {
        GenerateOptions options;
        for (const auto& [sku, location] : request->location_overrides()) {
            options.location_overrides[sku] = location;
        }
        options.assigned_to = request->assigned_to();
        options.notes = request->notes();
        options.actor = request->actor();

        std::optional<std::string> bom_id;
        if (!request->bom_id().empty()) bom_id = request->bom_id();
        *response = inventory_.generate_pick_list(request->order_id(), bom_id, options);
    });
}

grpc::Status InventoryServiceImpl::ScanPick(grpc::ServerContext*, const api::ScanPickRequest* request,
                                            events::PickListItem* response) {
    return guarded("ScanPick", [&] {
        *response = inventory_.scan_pick(request->pick_list_id(), request->barcode(), request->quantity(),
                                         request->actor());
    });
}

grpc::Status InventoryServiceImpl::SkipPickItem(grpc::ServerContext*, const api::SkipPickItemRequest* request,
                                                events::PickListItem* response) {
    return guarded("SkipPickItem", [&] {
        *response = inventory_.skip_pick_item(request->pick_list_id(), request->item_id(), request->actor(),
                                              request->reason());
    });
}

grpc::Status InventoryServiceImpl::CompletePickList(grpc::ServerContext*, const api::PickListActionRequest* request,
                                                    events::PickList* response) {
    return guarded("CompletePickList", [&] {
        *response = inventory_.complete_pick_list(request->pick_list_id(), request->actor());
    });
}

grpc::Status InventoryServiceImpl::CancelPickList(grpc::ServerContext*, const api::PickListActionRequest* request,
                                                  events::PickList* response) {
    return guarded("CancelPickList", [&] {
        *response = inventory_.cancel_pick_list(request->pick_list_id(), request->actor());
    });
}

grpc::Status InventoryServiceImpl::GetPickList(grpc::ServerContext*, const api::GetPickListRequest* request,
                                               events::PickList* response) {
    return guarded("GetPickList", [&] { *response = inventory_.get_pick_list(request->pick_list_id()); });
}

// ============================================================================
// Queries
// ============================================================================

grpc::Status InventoryServiceImpl::CurrentStock(grpc::ServerContext*, const api::CurrentStockRequest* request,
                                                api::CurrentStockResponse* response) {
    return guarded("CurrentStock", [&] {
        if (!request->location().empty()) {
            to_proto(inventory_.current_stock(request->sku(), request->location()), response->add_records());
            return;
        }
        for (const auto& record : inventory_.current_stock(request->sku())) {
            to_proto(record, response->add_records());
        }
    });
}

grpc::Status InventoryServiceImpl::ListTransactions(grpc::ServerContext*,
                                                    const api::ListTransactionsRequest* request,
                                                    api::ListTransactionsResponse* response) {
    return guarded("ListTransactions", [&] {
        std::vector<events::Transaction> transactions;
        switch (request->filter_case()) {
            case api::ListTransactionsRequest::kSku:
                transactions = inventory_.transactions_for_item(request->sku());
                break;
            case api::ListTransactionsRequest::kPickListId:
                transactions = inventory_.transactions_for_pick_list(request->pick_list_id());
                break;
            case api::ListTransactionsRequest::kOrderId:
                transactions = inventory_.transactions_for_order(request->order_id());
                break;
            default:
                throw InventoryError::invalid_argument("Filter by sku, pick_list_id or order_id");
        }
        for (auto& tx : transactions) {
            *response->add_transactions() = std::move(tx);
        }
    });
}

grpc::Status InventoryServiceImpl::LookupBarcode(grpc::ServerContext*, const api::LookupBarcodeRequest* request,
                                                 api::LookupBarcodeResponse* response) {
    return guarded("LookupBarcode", [&] {
        auto found = inventory_.lookup_barcode(request->barcode());
        *response->mutable_item() = found.item;
        if (found.serial) to_proto(*found.serial, response->mutable_serial());
        for (const auto& record : found.stock) {
            to_proto(record, response->add_stock());
        }
    });
}

grpc::Status InventoryServiceImpl::Valuation(grpc::ServerContext*, const google::protobuf::Empty*,
                                             api::ValuationResponse* response) {
    return guarded("Valuation", [&] {
        auto report = inventory_.valuation_report();
        to_proto(report.total, response->mutable_total());
        for (const auto& [category, totals] : report.by_category) {
            to_proto(totals, &(*response->mutable_by_category())[category]);
        }
        for (const auto& [location, totals] : report.by_location) {
            to_proto(totals, &(*response->mutable_by_location())[location]);
        }
    });
}

// ============================================================================
// Alerts
// ============================================================================

grpc::Status InventoryServiceImpl::ListAlerts(grpc::ServerContext*, const api::ListAlertsRequest* request,
                                              api::ListAlertsResponse* response) {
    return guarded("ListAlerts", [&] {
        std::optional<bool> acknowledged;
        if (!request->include_acknowledged()) acknowledged = false;
        for (auto& alert : inventory_.alerts(acknowledged)) {
            *response->add_alerts() = std::move(alert);
        }
    });
}

grpc::Status InventoryServiceImpl::AcknowledgeAlert(grpc::ServerContext*, const api::AcknowledgeAlertRequest* request,
                                                    events::Alert* response) {
    return guarded("AcknowledgeAlert", [&] {
        *response = inventory_.acknowledge_alert(request->alert_id(), request->actor());
    });
}

} // namespace server
} // namespace floorstock
