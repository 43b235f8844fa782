#include <tollgate/schema/encoding/scale/audit_event.hpp>

namespace tollgate::schema {

void encode(const audit_event_t& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.event_id, encoder);
  encode(o.execution_id, encoder);
  encode(o.event_type, encoder);
  encode(o.timestamp, encoder);
  encode(o.summary, encoder);
  encode(o.payload_digest, encoder);
}

void decode(audit_event_t& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.event_id, decoder);
  decode(o.execution_id, decoder);
  decode(o.event_type, decoder);
  decode(o.timestamp, decoder);
  decode(o.summary, decoder);
  decode(o.payload_digest, decoder);
}

}  // namespace tollgate::schema
