#include <tollgate/schema/encoding/scale/command.hpp>

namespace tollgate::schema {

void encode(const command_t& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.command_id, encoder);
  encode(o.execution_id, encoder);
  encode(o.kind, encoder);
  encode(o.parameters, encoder);
  encode(o.initiator, encoder);
  encode(o.credential, encoder);
  encode(o.read_only, encoder);
  encode(o.requires_approval, encoder);
  encode(o.metadata, encoder);
}

void decode(command_t& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.command_id, decoder);
  decode(o.execution_id, decoder);
  decode(o.kind, decoder);
  decode(o.parameters, decoder);
  decode(o.initiator, decoder);
  decode(o.credential, decoder);
  decode(o.read_only, decoder);
  decode(o.requires_approval, decoder);
  decode(o.metadata, decoder);
}

}  // namespace tollgate::schema
