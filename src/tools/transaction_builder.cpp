#include <boost/program_options.hpp>
#include <trackchain/blake3/hash.hpp>
#include <trackchain/common/critical.hpp>
#include <trackchain/schema/encoding/scale/encoder.hpp>
#include <trackchain/schema/role_id.hpp>
#include <trackchain/schema/transaction.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = trackchain::schema::encoding::encoder<
    trackchain::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

const std::string& get_string(const po::variables_map& vm,
                              const std::string& name) {
  if (!vm.contains(name)) {
    trackchain::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

trackchain::schema::identity_t get_identity(const po::variables_map& vm,
                                            const std::string& name) {
  auto identity = trackchain::schema::try_parse_identity(get_string(vm, name));
  if (!identity) {
    trackchain::common::critical(
        "--{} must be ed25519:<hex>, secp256k1:<hex> or named:<hex>", name);
  }
  return identity.value();
}

trackchain::schema::product_id_t get_product_id(const po::variables_map& vm) {
  auto product_id =
      trackchain::schema::try_make_product_id(get_string(vm, "product-id"));
  if (!product_id) {
    trackchain::common::critical("--product-id must be decimal or 0x hex");
  }
  return product_id.value();
}

trackchain::schema::role_id_t get_role(const po::variables_map& vm) {
  auto role = trackchain::schema::try_from_string<trackchain::schema::role_id_t>(
      vm["role"].as<std::string>());
  if (!role) {
    trackchain::common::critical("--role must be admin|manufacturer");
  }
  return role.value();
}

trackchain::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (vm.contains("chain-id")) {
    return trackchain::schema::make_hash32(
        std::string_view{vm["chain-id"].as<std::string>()});
  }
  return trackchain::blake3::hash(
      std::string_view{vm["chain-name"].as<std::string>()});
}

template <typename Signature>
Signature copy_signature(const trackchain::schema::bytes_t& bytes) {
  auto signature = Signature{};
  if (bytes.empty()) {
    return signature;
  }
  if (bytes.size() != signature.size()) {
    trackchain::common::critical("signature must be {} bytes",
                                 signature.size());
  }
  std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
  return signature;
}

// The signature kind follows the signer kind; named signers carry an empty
// ed25519 slot.
trackchain::schema::signature_t make_signature(
    const po::variables_map& vm,
    const trackchain::schema::identity_t& signer) {
  auto hex = vm["signature-hex"].as<std::string>();
  auto bytes = hex.empty() ? trackchain::schema::bytes_t{}
                           : trackchain::schema::from_hex(hex);
  if (std::holds_alternative<trackchain::schema::secp256k1_identity>(signer)) {
    return copy_signature<trackchain::schema::secp256k1_signature_t>(bytes);
  }
  return copy_signature<trackchain::schema::ed25519_signature_t>(bytes);
}

trackchain::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = get_string(vm, "payload");
  if (payload == "grant_role") {
    return trackchain::schema::grant_role_t{
        .subject = get_identity(vm, "subject"), .role = get_role(vm)};
  }
  if (payload == "revoke_role") {
    return trackchain::schema::revoke_role_t{
        .subject = get_identity(vm, "subject"), .role = get_role(vm)};
  }
  if (payload == "create_product") {
    return trackchain::schema::create_product_t{
        .product_id = get_product_id(vm),
        .name = get_string(vm, "name"),
        .content_hash = vm["content-hash"].as<std::string>()};
  }
  if (payload == "transfer_ownership") {
    return trackchain::schema::transfer_ownership_t{
        .product_id = get_product_id(vm),
        .new_owner = get_identity(vm, "new-owner"),
        .content_hash = vm["content-hash"].as<std::string>()};
  }
  if (payload == "verify_receive") {
    return trackchain::schema::verify_receive_t{
        .product_id = get_product_id(vm),
        .content_hash = vm["content-hash"].as<std::string>()};
  }
  trackchain::common::critical("unsupported payload type '{}'", payload);
}

trackchain::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = get_string(vm, "path");
  if (path == "/engine/info" || path == "/engine/keyspaces") {
    return {};
  }
  if (path == "/state/product" || path == "/state/owner") {
    return encoder.encode(get_product_id(vm));
  }
  if (path == "/state/role") {
    return encoder.encode(std::tuple{get_identity(vm, "subject"), get_role(vm)});
  }
  if (path == "/custody/history") {
    return encoder.encode(std::tuple{get_product_id(vm),
                                     vm["offset"].as<uint64_t>(),
                                     vm["limit"].as<uint64_t>()});
  }
  if (path == "/history/range" || path == "/events/range") {
    return encoder.encode(
        std::tuple{vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>()});
  }
  trackchain::common::critical("unsupported query path '{}'", path);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction --payload <type> [options]\n"
            << "  transaction_builder query-key --path <route> [options]\n"
            << "  transaction_builder chain-id [--chain-name <name>]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|chain-id")(
      "payload", po::value<std::string>(),
      "grant_role|revoke_role|create_product|transfer_ownership|"
      "verify_receive")("path", po::value<std::string>(), "query route")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain-name", po::value<std::string>()->default_value("trackchain-local"),
      "chain name hashed into the chain id")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "signer identity")(
      "signature-hex", po::value<std::string>()->default_value(""),
      "signature bytes hex")("subject", po::value<std::string>(),
                             "role subject identity")(
      "role", po::value<std::string>()->default_value("manufacturer"),
      "admin|manufacturer")("product-id", po::value<std::string>(),
                            "product id, decimal or 0x hex")(
      "name", po::value<std::string>(), "product name")(
      "content-hash", po::value<std::string>()->default_value(""),
      "opaque content reference")("new-owner", po::value<std::string>(),
                                  "recipient identity")(
      "offset", po::value<uint64_t>()->default_value(0),
      "custody history offset")(
      "limit", po::value<uint64_t>()->default_value(100),
      "custody history page size")(
      "from", po::value<uint64_t>()->default_value(1), "range start")(
      "to", po::value<uint64_t>()->default_value(1), "range end");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto signer = get_identity(vm, "signer");
    auto transaction = trackchain::schema::transaction_t{
        .version = 1,
        .chain_id = get_chain_id(vm),
        .nonce = vm["nonce"].as<uint64_t>(),
        .signer = signer,
        .payload = build_payload(vm),
        .signature = make_signature(vm, signer)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << trackchain::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    auto key = build_query_key(vm);
    std::cout << trackchain::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << trackchain::schema::to_hex(get_chain_id(vm)) << '\n';
    return 0;
  }

  trackchain::common::critical("command must be transaction|query-key|chain-id");
}
