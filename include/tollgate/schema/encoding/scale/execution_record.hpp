#pragma once

#include <tollgate/schema/execution_record.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace tollgate::schema {

void encode(const execution_failure_t& o, ::scale::Encoder& encoder);
void decode(execution_failure_t& o, ::scale::Decoder& decoder);

void encode(const execution_record_t& o, ::scale::Encoder& encoder);
void decode(execution_record_t& o, ::scale::Decoder& decoder);

}  // namespace tollgate::schema
