#include <tollgate/schema/encoding/scale/idempotency_record.hpp>

namespace tollgate::schema {

void encode(const idempotency_record_t& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
  encode(o.status, encoder);
  encode(o.outcome, encoder);
  encode(o.recorded_at, encoder);
}

void decode(idempotency_record_t& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
  decode(o.status, decoder);
  decode(o.outcome, decoder);
  decode(o.recorded_at, decoder);
}

}  // namespace tollgate::schema
