#include "checkout_service.hpp"

#include "internal/core/checkout_orchestrator.hpp"
#include "internal/core/settlement.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_rpc.hpp"

namespace checkout::service {

using namespace checkout::manager::v1;

namespace {

void ToProto(const db::model::OrderRecord& record, Order* order) {
  order->set_id(record.id);
  order->set_user_id(record.user_id);
  order->set_shop_id(record.shop_id);
  order->set_payment_id(record.payment_id);
  order->set_status(static_cast<OrderStatus>(record.status));

  auto* receiver = order->mutable_receiver();
  receiver->set_name(record.receiver.name);
  receiver->set_phone(record.receiver.phone);
  receiver->set_address(record.receiver.address);

  for (const auto& item : record.items) {
    auto* out = order->add_items();
    out->set_id(item.id);
    out->set_order_id(item.order_id);
    if (item.sku_id) out->set_sku_id(*item.sku_id);
    if (item.product_id) out->set_product_id(*item.product_id);
    out->set_product_name(item.snapshot.product_name);
    out->set_sku_price(item.snapshot.sku_price);
    out->set_image(item.snapshot.image);
    out->set_sku_value(item.snapshot.sku_value);
    out->set_quantity(item.snapshot.quantity);
    for (const auto& t : item.snapshot.translations) {
      auto* translation = out->add_product_translations();
      translation->set_id(t.id);
      translation->set_language_id(t.language_id);
      translation->set_name(t.name);
      translation->set_description(t.description);
    }
    *out->mutable_created_at() = util::MillisToProto(item.created_at_ms);
  }

  *order->mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *order->mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
}

void RequireUser(int64_t user_id) {
  if (user_id <= 0) {
    throw util::InvalidArgument("user_id is required");
  }
}

} // namespace

CheckoutService::CheckoutService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CheckoutResponse CheckoutService::Checkout(const CheckoutRequest& req) {
  return ObserveRpc("CheckoutService.Checkout", [&] {
    RequireUser(req.user_id());

    std::vector<core::CheckoutGroup> groups;
    groups.reserve(req.groups_size());
    for (const auto& g : req.groups()) {
      core::CheckoutGroup group;
      group.shop_id          = g.shop_id();
      group.receiver.name    = g.receiver().name();
      group.receiver.phone   = g.receiver().phone();
      group.receiver.address = g.receiver().address();
      group.cart_item_ids.assign(g.cart_item_ids().begin(), g.cart_item_ids().end());
      groups.push_back(std::move(group));
    }

    const auto result = ctx_.orchestrator->Checkout(req.user_id(), groups);

    CheckoutResponse resp;
    resp.set_payment_id(result.payment_id);
    for (const auto& order : result.orders) {
      ToProto(order, resp.add_orders());
    }
    return resp;
  });
}

GetOrderResponse CheckoutService::GetOrder(const GetOrderRequest& req) {
  return ObserveRpc("CheckoutService.GetOrder", [&] {
    RequireUser(req.user_id());

    GetOrderResponse resp;
    ToProto(ctx_.orchestrator->GetOrder(req.user_id(), req.order_id()), resp.mutable_order());
    return resp;
  });
}

ListOrdersResponse CheckoutService::ListOrders(const ListOrdersRequest& req) {
  return ObserveRpc("CheckoutService.ListOrders", [&] {
    RequireUser(req.user_id());
    if (req.page() < 0 || req.limit() < 0) {
      throw util::InvalidArgument("page and limit must not be negative");
    }

    core::OrderQuery query;
    query.page  = static_cast<uint32_t>(req.page());
    query.limit = static_cast<uint32_t>(req.limit());
    if (req.status() != ORDER_STATUS_UNSPECIFIED) {
      query.status = static_cast<checkout::model::OrderStatus>(req.status());
    }

    const auto page = ctx_.orchestrator->ListOrders(req.user_id(), query);

    ListOrdersResponse resp;
    for (const auto& order : page.orders) {
      ToProto(order, resp.add_orders());
    }
    resp.set_page(static_cast<int32_t>(page.page));
    resp.set_limit(static_cast<int32_t>(page.limit));
    resp.set_total_items(static_cast<int64_t>(page.total_items));
    resp.set_total_pages(static_cast<int32_t>(page.total_pages));
    return resp;
  });
}

CancelOrderResponse CheckoutService::CancelOrder(const CancelOrderRequest& req) {
  return ObserveRpc("CheckoutService.CancelOrder", [&] {
    RequireUser(req.user_id());

    CancelOrderResponse resp;
    ToProto(ctx_.settlement->CancelOrder(req.user_id(), req.order_id()), resp.mutable_order());
    return resp;
  });
}

} // namespace checkout::service
