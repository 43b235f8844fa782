#include <tollgate/schema/encoding/scale/execution_record.hpp>

namespace tollgate::schema {

void encode(const execution_failure_t& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.code, encoder);
  encode(o.reason, encoder);
}

void decode(execution_failure_t& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.code, decoder);
  decode(o.reason, decoder);
}

void encode(const execution_record_t& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.execution_id, encoder);
  encode(o.command_id, encoder);
  encode(o.kind, encoder);
  encode(o.state, encoder);
  encode(o.verdict, encoder);
  encode(o.approval_id, encoder);
  encode(o.agent_id, encoder);
  encode(o.result, encoder);
  encode(o.failure, encoder);
  encode(o.attempt_count, encoder);
  encode(o.command_digest, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
}

void decode(execution_record_t& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.execution_id, decoder);
  decode(o.command_id, decoder);
  decode(o.kind, decoder);
  decode(o.state, decoder);
  decode(o.verdict, decoder);
  decode(o.approval_id, decoder);
  decode(o.agent_id, decoder);
  decode(o.result, decoder);
  decode(o.failure, decoder);
  decode(o.attempt_count, decoder);
  decode(o.command_digest, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
}

}  // namespace tollgate::schema
