#pragma once

#include <tollgate/schema/approval_record.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tollgate::schema {

void encode(const approval_record_t& o, ::scale::Encoder& encoder);
void decode(approval_record_t& o, ::scale::Decoder& decoder);

}  // namespace tollgate::schema
