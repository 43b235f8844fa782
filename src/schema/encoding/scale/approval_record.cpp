#include <tollgate/schema/encoding/scale/approval_record.hpp>

namespace tollgate::schema {

void encode(const approval_record_t& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.approval_id, encoder);
  encode(o.execution_id, encoder);
  encode(o.status, encoder);
  encode(o.created_at, encoder);
  encode(o.decided_at, encoder);
  encode(o.decided_by, encoder);
}

void decode(approval_record_t& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.approval_id, decoder);
  decode(o.execution_id, decoder);
  decode(o.status, decoder);
  decode(o.created_at, decoder);
  decode(o.decided_at, decoder);
  decode(o.decided_by, decoder);
}

}  // namespace tollgate::schema
