#include <spdlog/spdlog.h>
#include <trackchain/execution/transition_engine.hpp>
#include <trackchain/schema/transaction_error_code.hpp>

#include <string>
#include <utility>

using namespace trackchain::schema;

namespace {

constexpr auto kCodespace = std::string_view{"trackchain.execute"};

transaction_result_t make_error(const transaction_error_code code,
                                std::string log,
                                std::string info) {
  spdlog::debug("Transition rejected ({}): {} {}", static_cast<uint32_t>(code),
                log, info);
  return transaction_result_t{.code = static_cast<uint32_t>(code),
                              .log = std::move(log),
                              .info = std::move(info),
                              .codespace = std::string{kCodespace}};
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             bool index = true) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

transaction_event_t make_custody_event(const custody_event_record_t& record) {
  return transaction_event_t{
      .type = "custody." + std::string{to_string(record.type)},
      .attributes = {
          make_attribute("event_id", std::to_string(record.event_id)),
          make_attribute("product_id", to_string(record.product_id)),
          make_attribute("actor", to_string(record.actor)),
          make_attribute("counterparty", to_string(record.counterparty)),
          make_attribute("content_hash", record.content_hash, false)}};
}

transaction_event_t make_role_event(std::string_view type,
                                    const identity_t& subject,
                                    const role_id_t role,
                                    const identity_t& admin) {
  return transaction_event_t{
      .type = std::string{type},
      .attributes = {make_attribute("subject", to_string(subject)),
                     make_attribute("role", std::string{to_string(role)}),
                     make_attribute("admin", to_string(admin))}};
}

custody_event_record_t make_record(const trackchain::execution::call_context& context,
                                   const custody_event_type_t type,
                                   const product_id_t& product_id,
                                   const identity_t& counterparty,
                                   const std::string& content_hash) {
  return custody_event_record_t{.height = context.height,
                                .tx_index = context.tx_index,
                                .type = type,
                                .product_id = product_id,
                                .actor = context.caller,
                                .counterparty = counterparty,
                                .content_hash = content_hash,
                                .recorded_at = context.timestamp};
}

}  // namespace

namespace trackchain::execution {

transaction_result_t transition_engine::execute(
    custody_state& state,
    const call_context& context,
    const transaction_payload_t& payload) const {
  return std::visit(
      overloaded{[&](const grant_role_t& operation) {
                   return grant_role(state, context, operation);
                 },
                 [&](const revoke_role_t& operation) {
                   return revoke_role(state, context, operation);
                 },
                 [&](const create_product_t& operation) {
                   return create_product(state, context, operation);
                 },
                 [&](const transfer_ownership_t& operation) {
                   return transfer_ownership(state, context, operation);
                 },
                 [&](const verify_receive_t& operation) {
                   return verify_receive(state, context, operation);
                 }},
      payload);
}

transaction_result_t transition_engine::grant_role(
    custody_state& state,
    const call_context& context,
    const grant_role_t& operation) const {
  if (!state.identities().has_role(context.caller, role_id_t::admin)) {
    return make_error(transaction_error_code::authorization_denied,
                      "caller is not an administrator", "grant_role");
  }
  if (operation.role != role_id_t::manufacturer) {
    return make_error(transaction_error_code::role_not_grantable,
                      "role cannot be granted by transaction",
                      std::string{to_string(operation.role)});
  }
  state.identities().assign(operation.subject, operation.role, true,
                            context.caller, context.timestamp);
  spdlog::info("Granted {} to {}", to_string(operation.role),
               to_string(operation.subject));

  auto result = transaction_result_t{};
  result.info = "role granted";
  result.events.push_back(make_role_event("role.granted", operation.subject,
                                          operation.role, context.caller));
  return result;
}

transaction_result_t transition_engine::revoke_role(
    custody_state& state,
    const call_context& context,
    const revoke_role_t& operation) const {
  if (!state.identities().has_role(context.caller, role_id_t::admin)) {
    return make_error(transaction_error_code::authorization_denied,
                      "caller is not an administrator", "revoke_role");
  }
  if (operation.role != role_id_t::manufacturer) {
    return make_error(transaction_error_code::role_not_grantable,
                      "role cannot be revoked by transaction",
                      std::string{to_string(operation.role)});
  }
  state.identities().assign(operation.subject, operation.role, false,
                            context.caller, context.timestamp);
  spdlog::info("Revoked {} from {}", to_string(operation.role),
               to_string(operation.subject));

  auto result = transaction_result_t{};
  result.info = "role revoked";
  result.events.push_back(make_role_event("role.revoked", operation.subject,
                                          operation.role, context.caller));
  return result;
}

transaction_result_t transition_engine::create_product(
    custody_state& state,
    const call_context& context,
    const create_product_t& operation) const {
  if (!state.identities().has_role(context.caller,
                                   role_id_t::manufacturer)) {
    return make_error(transaction_error_code::authorization_denied,
                      "caller is not a manufacturer", "create_product");
  }
  if (operation.name.empty()) {
    return make_error(transaction_error_code::invalid_product_name,
                      "product name must not be empty",
                      to_string(operation.product_id));
  }
  if (state.products().exists(operation.product_id)) {
    return make_error(transaction_error_code::product_exists,
                      "product already exists",
                      to_string(operation.product_id));
  }

  state.products().create(
      product_state_t{.product_id = operation.product_id,
                      .name = operation.name,
                      .content_hash = operation.content_hash,
                      .manufacturer = context.caller,
                      .created_at = context.timestamp});
  state.ownership().mint(operation.product_id, context.caller);
  state.ledger().append(operation.product_id,
                        custody_entry_t{.actor = context.caller,
                                        .counterparty = context.caller,
                                        .timestamp = context.timestamp,
                                        .action = custody_action_t::created,
                                        .content_hash = operation.content_hash});
  state.stage_event(make_record(context, custody_event_type_t::product_created,
                                operation.product_id, context.caller,
                                operation.content_hash));
  spdlog::info("Created product {} '{}'", to_string(operation.product_id),
               operation.name);

  auto result = transaction_result_t{};
  result.info = "product created";
  result.product_id = operation.product_id;
  result.events.push_back(make_custody_event(state.staged_events().back()));
  return result;
}

transaction_result_t transition_engine::transfer_ownership(
    custody_state& state,
    const call_context& context,
    const transfer_ownership_t& operation) const {
  auto owner = state.ownership().owner_of(operation.product_id);
  if (!owner) {
    return make_error(transaction_error_code::product_missing,
                      "product does not exist",
                      to_string(operation.product_id));
  }
  if (owner.value() != context.caller) {
    return make_error(transaction_error_code::not_owner,
                      "caller is not the current owner",
                      to_string(operation.product_id));
  }
  if (is_null_identity(operation.new_owner) ||
      operation.new_owner == context.caller) {
    return make_error(transaction_error_code::invalid_recipient,
                      "recipient must be another non-null identity",
                      to_string(operation.new_owner));
  }
  // A shipment must be confirmed before the product moves on.
  auto last = state.ledger().last(operation.product_id);
  if (last && last->action == custody_action_t::in_transit) {
    return make_error(transaction_error_code::custody_in_transit,
                      "receipt of the previous transfer is not confirmed",
                      to_string(operation.product_id));
  }

  state.ownership().reassign(operation.product_id, operation.new_owner);
  state.ledger().append(operation.product_id,
                        custody_entry_t{.actor = context.caller,
                                        .counterparty = operation.new_owner,
                                        .timestamp = context.timestamp,
                                        .action = custody_action_t::in_transit,
                                        .content_hash = operation.content_hash});
  state.stage_event(make_record(
      context, custody_event_type_t::ownership_transferred,
      operation.product_id, operation.new_owner, operation.content_hash));
  spdlog::info("Transferred product {} to {}", to_string(operation.product_id),
               to_string(operation.new_owner));

  auto result = transaction_result_t{};
  result.info = "ownership transferred";
  result.product_id = operation.product_id;
  result.events.push_back(make_custody_event(state.staged_events().back()));
  return result;
}

transaction_result_t transition_engine::verify_receive(
    custody_state& state,
    const call_context& context,
    const verify_receive_t& operation) const {
  auto owner = state.ownership().owner_of(operation.product_id);
  if (!owner) {
    return make_error(transaction_error_code::product_missing,
                      "product does not exist",
                      to_string(operation.product_id));
  }
  auto last = state.ledger().last(operation.product_id);
  if (owner.value() != context.caller || !last ||
      last->counterparty != context.caller) {
    return make_error(transaction_error_code::not_owner,
                      "caller is not the designated recipient",
                      to_string(operation.product_id));
  }
  if (last->action == custody_action_t::received) {
    return make_error(transaction_error_code::already_received,
                      "custody already confirmed",
                      to_string(operation.product_id));
  }
  if (last->action != custody_action_t::in_transit) {
    return make_error(transaction_error_code::not_in_transit,
                      "no transfer awaits confirmation",
                      to_string(operation.product_id));
  }

  state.ledger().append(operation.product_id,
                        custody_entry_t{.actor = context.caller,
                                        .counterparty = context.caller,
                                        .timestamp = context.timestamp,
                                        .action = custody_action_t::received,
                                        .content_hash = operation.content_hash});
  state.stage_event(make_record(context,
                                custody_event_type_t::custody_received,
                                operation.product_id, context.caller,
                                operation.content_hash));
  spdlog::info("Product {} received by {}", to_string(operation.product_id),
               to_string(context.caller));

  auto result = transaction_result_t{};
  result.info = "custody received";
  result.product_id = operation.product_id;
  result.events.push_back(make_custody_event(state.staged_events().back()));
  return result;
}

}  // namespace trackchain::execution
