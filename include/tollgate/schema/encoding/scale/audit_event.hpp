#pragma once

#include <tollgate/schema/audit_event.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tollgate::schema {

void encode(const audit_event_t& o, ::scale::Encoder& encoder);
void decode(audit_event_t& o, ::scale::Decoder& decoder);

}  // namespace tollgate::schema
