#include <trackchain/execution/custody_state.hpp>
#include <trackchain/schema/key/engine_keys.hpp>

#include <utility>

using namespace trackchain::schema;

namespace trackchain::execution {

custody_state::custody_state(encoder_t& encoder,
                             const storage_t& storage,
                             const write_set_t* parent)
    : overlay_{encoder, storage, parent},
      identities_{overlay_},
      products_{overlay_},
      ownership_{overlay_},
      ledger_{overlay_} {}

uint64_t custody_state::stage_event(custody_event_record_t record) {
  auto sequence_key = key::make_event_sequence_key(overlay_.encoder());
  auto event_id = overlay_.get<uint64_t>(sequence_key).value_or(1);
  record.event_id = event_id;
  overlay_.put(key::make_event_key(overlay_.encoder(), event_id), record);
  overlay_.put(sequence_key, event_id + 1);
  staged_events_.push_back(std::move(record));
  return event_id;
}

}  // namespace trackchain::execution
