#pragma once

#include <tollgate/schema/encoding/scale/execution_record.hpp>
#include <tollgate/schema/idempotency_record.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tollgate::schema {

void encode(const idempotency_record_t& o, ::scale::Encoder& encoder);
void decode(idempotency_record_t& o, ::scale::Decoder& decoder);

}  // namespace tollgate::schema
